#include <dnotify/Logging.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>

namespace dnotify {

namespace logging = boost::log;

logging::trivial::severity_level severityFromString(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == "trace") return logging::trivial::trace;
    if (key == "debug") return logging::trivial::debug;
    if (key == "warning" || key == "warn") return logging::trivial::warning;
    if (key == "error") return logging::trivial::error;
    if (key == "fatal") return logging::trivial::fatal;
    return logging::trivial::info;
}

void initLogging(const QString& level, const QString& filePath)
{
    logging::register_simple_formatter_factory<logging::trivial::severity_level, char>("Severity");

    logging::add_console_log(
        std::clog,
        logging::keywords::format = "[%Severity%] %Message%");

    if (!filePath.isEmpty()) {
        logging::add_file_log(
            logging::keywords::file_name = filePath.toStdString(),
            logging::keywords::open_mode = std::ios_base::app,
            logging::keywords::auto_flush = true,
            logging::keywords::format = "[%TimeStamp%] [%Severity%]: %Message%");
    }

    logging::core::get()->set_filter(
        logging::trivial::severity >= severityFromString(level));
    logging::add_common_attributes();
}

} // namespace dnotify

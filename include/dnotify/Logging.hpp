#pragma once

#include <QString>
#include <boost/log/trivial.hpp>

namespace dnotify {

/// Maps "trace", "debug", "info", "warning", "error" or "fatal" to a Boost.Log
/// severity. Unknown names map to info.
boost::log::trivial::severity_level severityFromString(const QString& name);

/// Configure Boost.Log for the process: severity filter, console sink and,
/// when `filePath` is non-empty, a file sink with timestamps.
void initLogging(const QString& level, const QString& filePath = {});

} // namespace dnotify

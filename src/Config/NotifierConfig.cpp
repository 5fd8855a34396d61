#include <dnotify/Config/NotifierConfig.hpp>
#include <QStringList>
#include <boost/log/trivial.hpp>
#include <fstream>

namespace dnotify {

NotifierConfig::NotifierConfig()
{
    initDefaults();
}

void NotifierConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["app_name"] = "App";
    root_["notification_limit"] = -1;
    root_["backend"] = "auto";

    root_["dbus"]["timeout_ms"] = 25000;
    root_["dbus"]["desktop_entry"] = "";

    root_["logging"]["level"] = "info";
    root_["logging"]["file"] = "";
}

// Overlays `loaded` onto a copy of `defaults`. The defaults double as the
// schema: unknown keys and a map where a scalar belongs (or the reverse) are
// logged and skipped, null values keep the default.
static YAML::Node mergeOverDefaults(const YAML::Node& defaults, const YAML::Node& loaded,
                                    const std::string& path)
{
    if (!loaded.IsDefined() || loaded.IsNull())
        return YAML::Clone(defaults);

    if (defaults.IsMap() != loaded.IsMap()) {
        BOOST_LOG_TRIVIAL(warning) << "NotifierConfig: ignoring '" << path
                                   << "', expected " << (defaults.IsMap() ? "a mapping" : "a value");
        return YAML::Clone(defaults);
    }
    if (!defaults.IsMap())
        return YAML::Clone(loaded);

    YAML::Node result = YAML::Clone(defaults);
    for (auto it = loaded.begin(); it != loaded.end(); ++it) {
        const auto key = it->first.as<std::string>();
        const std::string keyPath = path.empty() ? key : path + "." + key;
        if (!defaults[key]) {
            BOOST_LOG_TRIVIAL(warning) << "NotifierConfig: ignoring unknown key '" << keyPath << "'";
            continue;
        }
        result[key] = mergeOverDefaults(defaults[key], it->second, keyPath);
    }
    return result;
}

void NotifierConfig::load(const QString& filePath)
{
    initDefaults();
    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = mergeOverDefaults(root_, loaded, {});

    int limit = 0;
    const YAML::Node limitNode = root_["notification_limit"];
    if (!limitNode.IsNull() && !YAML::convert<int>::decode(limitNode, limit)) {
        BOOST_LOG_TRIVIAL(warning) << "NotifierConfig: notification_limit '" << limitNode.Scalar()
                                   << "' is not an integer, using unbounded";
        root_["notification_limit"] = -1;
    }
}

void NotifierConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

QString NotifierConfig::appName() const
{
    return QString::fromStdString(root_["app_name"].as<std::string>("App"));
}

void NotifierConfig::setAppName(const QString& v)
{
    root_["app_name"] = v.toStdString();
}

int NotifierConfig::notificationLimit() const
{
    // "notification_limit: ~" is accepted as unbounded too
    if (!root_["notification_limit"] || root_["notification_limit"].IsNull())
        return -1;
    return root_["notification_limit"].as<int>(-1);
}

void NotifierConfig::setNotificationLimit(int v)
{
    root_["notification_limit"] = v;
}

QString NotifierConfig::backend() const
{
    return QString::fromStdString(root_["backend"].as<std::string>("auto"));
}

void NotifierConfig::setBackend(const QString& v)
{
    root_["backend"] = v.toStdString();
}

int NotifierConfig::dbusTimeoutMs() const
{
    return root_["dbus"]["timeout_ms"].as<int>(25000);
}

void NotifierConfig::setDbusTimeoutMs(int v)
{
    root_["dbus"]["timeout_ms"] = v;
}

QString NotifierConfig::desktopEntry() const
{
    return QString::fromStdString(root_["dbus"]["desktop_entry"].as<std::string>(""));
}

void NotifierConfig::setDesktopEntry(const QString& v)
{
    root_["dbus"]["desktop_entry"] = v.toStdString();
}

QString NotifierConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

void NotifierConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

QString NotifierConfig::logFile() const
{
    return QString::fromStdString(root_["logging"]["file"].as<std::string>(""));
}

void NotifierConfig::setLogFile(const QString& v)
{
    root_["logging"]["file"] = v.toStdString();
}

// Integers and booleans keep their type, anything else is text
static QVariant scalarValue(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    int number = 0;
    if (YAML::convert<int>::decode(node, number)) return number;
    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag)) return flag;
    return QString::fromStdString(node.Scalar());
}

static QVariant lookupPath(const YAML::Node& node, const QStringList& parts, int depth)
{
    if (depth == parts.size())
        return scalarValue(node);
    if (!node.IsMap()) return {};

    const YAML::Node child = node[parts.at(depth).toStdString()];
    if (!child) return {};
    return lookupPath(child, parts, depth + 1);
}

QVariant NotifierConfig::valueByPath(const QString& dottedKey) const
{
    const QStringList parts = dottedKey.split('.');
    if (dottedKey.isEmpty() || parts.contains(QString())) return {};
    return lookupPath(root_, parts, 0);
}

} // namespace dnotify

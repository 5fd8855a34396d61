#pragma once

#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace dnotify {

/// Notifier settings backed by a YAML tree.
///
///   app_name: App
///   notification_limit: -1     # -1 = unbounded
///   backend: auto              # auto | dbus | null
///   dbus: { timeout_ms: 25000, desktop_entry: "" }
///   logging: { level: info, file: "" }
///
/// Values missing from a loaded file keep their defaults.
class NotifierConfig {
public:
    NotifierConfig();

    /// Throws YAML::Exception if the file cannot be read or parsed.
    void load(const QString& filePath);
    void save(const QString& filePath) const;

    QString appName() const;
    void setAppName(const QString& v);

    int notificationLimit() const;
    void setNotificationLimit(int v);

    QString backend() const;
    void setBackend(const QString& v);

    int dbusTimeoutMs() const;
    void setDbusTimeoutMs(int v);
    QString desktopEntry() const;
    void setDesktopEntry(const QString& v);

    QString logLevel() const;
    void setLogLevel(const QString& v);
    QString logFile() const;
    void setLogFile(const QString& v);

    // Generic dot-path access (e.g. "dbus.timeout_ms")
    QVariant valueByPath(const QString& dottedKey) const;

private:
    YAML::Node root_;

    void initDefaults();
};

} // namespace dnotify

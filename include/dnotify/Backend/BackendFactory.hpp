#pragma once

#include <QString>
#include <memory>

namespace dnotify {

class NotificationBackend;
class NotifierConfig;

class BackendFactory {
public:
    /// Creates the backend named by config.backend():
    /// "dbus", "null", or "auto" for the host platform's native backend.
    /// Throws std::invalid_argument for unknown names or backends not
    /// available on this platform.
    static std::unique_ptr<NotificationBackend> create(const NotifierConfig& config);

    /// The name "auto" resolves to on this platform.
    static QString platformDefault();
};

} // namespace dnotify

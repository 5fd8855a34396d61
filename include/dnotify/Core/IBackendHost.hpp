#pragma once

#include <dnotify/Model/Notification.hpp>
#include <QList>
#include <QString>

namespace dnotify {

/// The side of the Notifier that backends see.
/// Backends use it to resolve platform events to notifications.
/// Must be called from the Notifier's thread.
class IBackendHost {
public:
    virtual ~IBackendHost() = default;

    virtual QString appName() const = 0;

    /// Returns nullptr if no live notification has this identifier.
    virtual NotificationPtr notificationForIdentifier(const QString& identifier) const = 0;

    /// Live notifications, oldest first.
    virtual QList<NotificationPtr> currentNotifications() const = 0;

    /// Report that the platform closed a notification (dismissed by the user,
    /// expired, or closed by a call). The notification stops being tracked.
    virtual void handlePlatformClosed(const NotificationPtr& notification) = 0;
};

} // namespace dnotify

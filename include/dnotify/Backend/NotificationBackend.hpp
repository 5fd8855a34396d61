#pragma once

#include <dnotify/Core/IBackendHost.hpp>
#include <dnotify/Model/Capability.hpp>
#include <dnotify/Model/Notification.hpp>
#include <QObject>
#include <QString>

namespace dnotify {

/// Contract every platform backend implements.
///
/// The Notifier owns the cache and the identifiers; a backend only translates
/// notifications into platform calls. Failures are reported by throwing
/// (BackendError, or AuthorisationError when permission is missing).
/// Backends invoke the notification's callbacks themselves when the platform
/// reports a click, button press, reply or dismissal, and then tell the host
/// through IBackendHost::handlePlatformClosed() once a notification is gone.
class NotificationBackend : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~NotificationBackend() override = default;

    /// Short name for logs, e.g. "dbus".
    virtual QString name() const = 0;

    /// Show `notification`. `replaced` is the entry evicted to make room
    /// (may be null); backends may reuse its platform slot.
    /// Returns the platform identifier of the new notification.
    virtual QString deliver(const NotificationPtr& notification,
                            const NotificationPtr& replaced) = 0;

    virtual void dismiss(const NotificationPtr& notification) = 0;
    virtual void dismissAll() = 0;

    virtual Capabilities queryCapabilities() = 0;
    virtual bool queryAuthorisation() = 0;
    virtual bool requestAuthorisation() = 0;

    /// Whether platform closures (dismissal, expiry, clicks) ever reach the
    /// host. Callers waiting for a notification to close must check this.
    virtual bool reportsClosures() const { return true; }

    void attach(IBackendHost* host) { host_ = host; }
    IBackendHost* host() const { return host_; }

    /// The host's application name; empty while detached.
    QString appName() const { return host_ ? host_->appName() : QString(); }

protected:
    /// Resolve an identifier through the host; nullptr if unknown or detached.
    NotificationPtr findNotification(const QString& identifier) const
    {
        return host_ ? host_->notificationForIdentifier(identifier) : nullptr;
    }

    void reportClosed(const NotificationPtr& notification)
    {
        if (host_ && notification)
            host_->handlePlatformClosed(notification);
    }

private:
    IBackendHost* host_ = nullptr;
};

} // namespace dnotify

#pragma once

#include <dnotify/Core/IBackendHost.hpp>
#include <dnotify/Core/NotificationCache.hpp>
#include <dnotify/Model/Capability.hpp>
#include <dnotify/Model/Notification.hpp>
#include <QObject>
#include <QString>

namespace dnotify {

class NotificationBackend;
class NotifierConfig;

/// Platform-independent front end for desktop notifications.
///
/// Keeps track of the notifications currently shown, enforces the optional
/// notification limit by replacing the oldest one, and hands the actual work
/// to a NotificationBackend. Delivery and clearing are best effort: failures
/// are logged and signalled but never thrown. AuthorisationError is the only
/// backend error that reaches the caller.
///
/// All methods must be called from the thread the Notifier lives in.
class Notifier : public QObject, public IBackendHost {
    Q_OBJECT
public:
    /// Takes ownership of `backend` once construction succeeds.
    /// Throws std::invalid_argument for a null backend or an invalid limit.
    explicit Notifier(NotificationBackend* backend,
                      const QString& appName = QStringLiteral("App"),
                      int notificationLimit = NotificationCache::Unbounded,
                      QObject* parent = nullptr);

    /// Builds the backend selected by `config` through the backend factory.
    explicit Notifier(const NotifierConfig& config, QObject* parent = nullptr);

    ~Notifier() override;

    QString appName() const override { return appName_; }
    int notificationLimit() const { return cache_.limit(); }
    NotificationBackend* backend() const { return backend_; }

    bool requestAuthorisation();
    bool hasAuthorisation();

    void send(const NotificationPtr& notification);
    void clear(const NotificationPtr& notification);
    void clearAll();

    Capabilities capabilities();

    QList<NotificationPtr> currentNotifications() const override;
    NotificationPtr notificationForIdentifier(const QString& identifier) const override;
    void handlePlatformClosed(const NotificationPtr& notification) override;

signals:
    void notificationDelivered(const dnotify::NotificationPtr& notification);
    void deliveryFailed(const dnotify::NotificationPtr& notification, const QString& reason);
    void notificationRemoved(const dnotify::NotificationPtr& notification);
    void clearFailed(const QString& reason);

private:
    void adoptBackend(NotificationBackend* backend);
    void markRemoved(const NotificationPtr& notification);

    QString appName_;
    NotificationCache cache_;
    NotificationBackend* backend_ = nullptr;
};

} // namespace dnotify

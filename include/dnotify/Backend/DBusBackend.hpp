#pragma once

#include <dnotify/Backend/NotificationBackend.hpp>
#include <QDBusConnection>
#include <QDBusMessage>
#include <QStringList>
#include <QVariantMap>

namespace dnotify {

/// Backend for the freedesktop.org notification service
/// (org.freedesktop.Notifications on the session bus).
///
/// Calls block for at most timeoutMs(); a timeout is reported as a
/// BackendError like any other failure.
class DBusBackend : public NotificationBackend {
    Q_OBJECT
public:
    static constexpr int DefaultTimeoutMs = 25000;

    explicit DBusBackend(QObject* parent = nullptr);
    explicit DBusBackend(const QDBusConnection& bus, QObject* parent = nullptr);
    ~DBusBackend() override;

    QString name() const override;
    QString deliver(const NotificationPtr& notification,
                    const NotificationPtr& replaced) override;
    void dismiss(const NotificationPtr& notification) override;
    void dismissAll() override;
    Capabilities queryCapabilities() override;
    bool queryAuthorisation() override;
    bool requestAuthorisation() override;

    int timeoutMs() const { return timeoutMs_; }
    void setTimeoutMs(int ms) { timeoutMs_ = ms; }
    QString desktopEntry() const { return desktopEntry_; }
    void setDesktopEntry(const QString& entry) { desktopEntry_ = entry; }

    // Message building, independent of a running bus
    static QStringList buildActions(const Notification& notification);
    static QVariantMap buildHints(const Notification& notification,
                                  const QString& desktopEntry = {});
    static int expireTimeout(const Notification& notification);
    static Capabilities capabilitiesFromServer(const QStringList& serverCapabilities);

private slots:
    void onActionInvoked(uint id, const QString& actionKey);
    void onNotificationClosed(uint id, uint reason);
    void onNotificationReplied(uint id, const QString& text);

private:
    void connectSignals();
    QDBusMessage callService(const QString& method, const QList<QVariant>& arguments);
    void closeNotification(const QString& identifier);

    QDBusConnection bus_;
    int timeoutMs_ = DefaultTimeoutMs;
    QString desktopEntry_;
};

} // namespace dnotify

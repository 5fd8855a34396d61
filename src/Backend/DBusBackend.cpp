#include <dnotify/Backend/DBusBackend.hpp>
#include <dnotify/Core/Errors.hpp>
#include <QDBusMessage>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <limits>
#include <string>

namespace dnotify {

static const QString SERVICE = QStringLiteral("org.freedesktop.Notifications");
static const QString OBJECT_PATH = QStringLiteral("/org/freedesktop/Notifications");
static const QString INTERFACE = QStringLiteral("org.freedesktop.Notifications");

static const QString ACTION_DEFAULT = QStringLiteral("default");
static const QString ACTION_BUTTON_PREFIX = QStringLiteral("button-");
static const QString ACTION_INLINE_REPLY = QStringLiteral("inline-reply");

// NotificationClosed reasons from the notification specification
static constexpr uint CLOSED_EXPIRED = 1;
static constexpr uint CLOSED_DISMISSED = 2;
static constexpr uint CLOSED_BY_CALL = 3;

DBusBackend::DBusBackend(QObject* parent)
    : DBusBackend(QDBusConnection::sessionBus(), parent)
{
}

DBusBackend::DBusBackend(const QDBusConnection& bus, QObject* parent)
    : NotificationBackend(parent), bus_(bus)
{
    connectSignals();
}

DBusBackend::~DBusBackend() = default;

QString DBusBackend::name() const
{
    return QStringLiteral("dbus");
}

void DBusBackend::connectSignals()
{
    if (!bus_.isConnected()) {
        BOOST_LOG_TRIVIAL(warning) << "DBusBackend: session bus not connected, "
                                      "notifications will fail";
        return;
    }

    bool ok = bus_.connect(SERVICE, OBJECT_PATH, INTERFACE, "ActionInvoked",
                           this, SLOT(onActionInvoked(uint,QString)));
    ok = bus_.connect(SERVICE, OBJECT_PATH, INTERFACE, "NotificationClosed",
                      this, SLOT(onNotificationClosed(uint,uint))) && ok;
    // KDE extension, absent on most other servers
    bus_.connect(SERVICE, OBJECT_PATH, INTERFACE, "NotificationReplied",
                 this, SLOT(onNotificationReplied(uint,QString)));

    if (!ok)
        BOOST_LOG_TRIVIAL(warning) << "DBusBackend: could not subscribe to notification signals";
}

QDBusMessage DBusBackend::callService(const QString& method, const QList<QVariant>& arguments)
{
    if (!bus_.isConnected())
        throw BackendError("D-Bus session bus is not available");

    QDBusMessage call = QDBusMessage::createMethodCall(SERVICE, OBJECT_PATH, INTERFACE, method);
    call.setArguments(arguments);

    QDBusMessage reply = bus_.call(call, QDBus::Block, timeoutMs_);
    if (reply.type() != QDBusMessage::ReplyMessage) {
        throw BackendError(QStringLiteral("%1 failed: %2 (%3)")
                               .arg(method, reply.errorMessage(), reply.errorName())
                               .toStdString());
    }
    return reply;
}

QString DBusBackend::deliver(const NotificationPtr& notification,
                             const NotificationPtr& replaced)
{
    uint replacesId = 0;
    if (replaced)
        replacesId = replaced->identifier().toUInt();

    QDBusMessage reply = callService(QStringLiteral("Notify"), {
        appName(),
        replacesId,
        notification->icon,
        notification->title,
        notification->message,
        buildActions(*notification),
        buildHints(*notification, desktopEntry_),
        expireTimeout(*notification)
    });

    if (reply.arguments().isEmpty())
        throw BackendError("Notify returned no identifier");

    const uint id = reply.arguments().first().toUInt();
    BOOST_LOG_TRIVIAL(debug) << "DBusBackend: Notify -> " << id
                             << (replacesId ? " (replacing " + std::to_string(replacesId) + ")" : std::string());
    return QString::number(id);
}

void DBusBackend::closeNotification(const QString& identifier)
{
    bool ok = false;
    const uint id = identifier.toUInt(&ok);
    if (!ok)
        throw BackendError("not a D-Bus notification id: " + identifier.toStdString());

    callService(QStringLiteral("CloseNotification"), {id});
}

void DBusBackend::dismiss(const NotificationPtr& notification)
{
    closeNotification(notification->identifier());
}

void DBusBackend::dismissAll()
{
    if (!host()) return;

    // Close each one even if an earlier close failed, then report
    int failures = 0;
    std::string lastError;
    for (const auto& n : host()->currentNotifications()) {
        try {
            closeNotification(n->identifier());
        } catch (const BackendError& e) {
            ++failures;
            lastError = e.what();
        }
    }

    if (failures > 0)
        throw BackendError(std::to_string(failures) + " notification(s) could not be closed: " + lastError);
}

Capabilities DBusBackend::queryCapabilities()
{
    try {
        QDBusMessage reply = callService(QStringLiteral("GetCapabilities"), {});
        if (reply.arguments().isEmpty())
            return {};
        return capabilitiesFromServer(reply.arguments().first().toStringList());
    } catch (const BackendError& e) {
        BOOST_LOG_TRIVIAL(warning) << "DBusBackend: " << e.what();
        return {};
    }
}

bool DBusBackend::queryAuthorisation()
{
    // The freedesktop protocol has no permission model
    return true;
}

bool DBusBackend::requestAuthorisation()
{
    return true;
}

QStringList DBusBackend::buildActions(const Notification& notification)
{
    // Flat list of (key, label) pairs
    QStringList actions;
    if (notification.onClicked)
        actions << ACTION_DEFAULT << QString();

    for (int i = 0; i < notification.buttons.size(); ++i)
        actions << ACTION_BUTTON_PREFIX + QString::number(i) << notification.buttons.at(i).title;

    if (notification.replyField)
        actions << ACTION_INLINE_REPLY << notification.replyField->title;

    return actions;
}

QVariantMap DBusBackend::buildHints(const Notification& notification, const QString& desktopEntry)
{
    QVariantMap hints;

    uchar urgency = 1;
    switch (notification.urgency) {
    case Urgency::Low:      urgency = 0; break;
    case Urgency::Normal:   urgency = 1; break;
    case Urgency::Critical: urgency = 2; break;
    }
    hints["urgency"] = QVariant::fromValue(urgency);

    if (notification.soundFile == DEFAULT_SOUND)
        hints["sound-name"] = QStringLiteral("message-new-instant");
    else if (!notification.soundFile.isEmpty())
        hints["sound-file"] = notification.soundFile;

    if (!notification.attachment.isEmpty())
        hints["image-path"] = notification.attachment;

    if (notification.replyField) {
        hints["x-kde-reply-placeholder-text"] = notification.replyField->title;
        hints["x-kde-reply-submit-button-text"] = notification.replyField->buttonTitle;
    }

    if (!desktopEntry.isEmpty())
        hints["desktop-entry"] = desktopEntry;

    return hints;
}

int DBusBackend::expireTimeout(const Notification& notification)
{
    if (notification.timeout < 0)
        return -1;
    // expire_timeout is a signed 32-bit D-Bus argument
    const qint64 ms = static_cast<qint64>(notification.timeout) * 1000;
    return static_cast<int>(std::min<qint64>(ms, std::numeric_limits<int>::max()));
}

Capabilities DBusBackend::capabilitiesFromServer(const QStringList& serverCapabilities)
{
    // Supported by every server implementing the protocol
    Capabilities caps = {
        Capability::AppName, Capability::Title, Capability::Icon,
        Capability::IconFile, Capability::IconName, Capability::Urgency,
        Capability::Timeout, Capability::OnDismissed
    };

    if (serverCapabilities.contains("body"))
        caps << Capability::Message;
    if (serverCapabilities.contains("actions"))
        caps << Capability::Buttons << Capability::OnClicked;
    if (serverCapabilities.contains("inline-reply"))
        caps << Capability::ReplyField;
    if (serverCapabilities.contains("sound"))
        caps << Capability::Sound << Capability::SoundName << Capability::SoundFile;
    if (serverCapabilities.contains("body-images"))
        caps << Capability::Attachment;

    return caps;
}

void DBusBackend::onActionInvoked(uint id, const QString& actionKey)
{
    auto n = findNotification(QString::number(id));
    if (!n) return;

    if (actionKey == ACTION_DEFAULT) {
        if (n->onClicked)
            n->onClicked();
    } else if (actionKey.startsWith(ACTION_BUTTON_PREFIX)) {
        bool ok = false;
        const int index = actionKey.mid(ACTION_BUTTON_PREFIX.size()).toInt(&ok);
        if (ok && index >= 0 && index < n->buttons.size() && n->buttons.at(index).onPressed)
            n->buttons.at(index).onPressed();
    } else if (actionKey != ACTION_INLINE_REPLY) {
        BOOST_LOG_TRIVIAL(debug) << "DBusBackend: unknown action '" << actionKey.toStdString()
                                 << "' on " << id;
    }
}

void DBusBackend::onNotificationClosed(uint id, uint reason)
{
    auto n = findNotification(QString::number(id));
    if (!n) return;

    BOOST_LOG_TRIVIAL(debug) << "DBusBackend: notification " << id << " closed, reason " << reason;
    if (reason == CLOSED_DISMISSED && n->onDismissed)
        n->onDismissed();
    else if (reason != CLOSED_EXPIRED && reason != CLOSED_BY_CALL && reason != CLOSED_DISMISSED)
        BOOST_LOG_TRIVIAL(debug) << "DBusBackend: undefined close reason " << reason;

    reportClosed(n);
}

void DBusBackend::onNotificationReplied(uint id, const QString& text)
{
    auto n = findNotification(QString::number(id));
    if (!n || !n->replyField) return;

    if (n->replyField->onReplied)
        n->replyField->onReplied(text);
}

} // namespace dnotify

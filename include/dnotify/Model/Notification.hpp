#pragma once

#include <dnotify/Model/Button.hpp>
#include <dnotify/Model/ReplyField.hpp>
#include <dnotify/Model/Urgency.hpp>
#include <QList>
#include <QMetaType>
#include <QString>
#include <functional>
#include <memory>
#include <optional>

class QDebug;

namespace dnotify {

/// Sound token meaning "play the platform's default notification sound".
inline const QString DEFAULT_SOUND = QStringLiteral("default");

enum class DeliveryState {
    Unsent,
    Pending,
    Delivered,
    Failed,
    Cleared
};

QString deliveryStateToString(DeliveryState state);

/// A desktop notification.
///
/// Display content is plain data owned by the caller. The platform identifier
/// and the delivery state are assigned by the Notifier only; the identifier
/// stays empty until a delivery succeeds.
class Notification {
public:
    /// `sound` is the deprecated boolean flag. When true it is translated into
    /// soundFile = DEFAULT_SOUND and a deprecation warning is logged.
    Notification(const QString& title, const QString& message,
                 Urgency urgency = Urgency::Normal, bool sound = false);

    QString title;
    QString message;
    Urgency urgency = Urgency::Normal;
    QString icon;          // file:// URI or themed icon name
    QList<Button> buttons;
    std::optional<ReplyField> replyField;
    std::function<void()> onClicked;
    std::function<void()> onDismissed;
    QString attachment;    // URI
    QString soundFile;     // sound name, file, or DEFAULT_SOUND
    QString thread;        // grouping key
    int timeout = -1;      // seconds, -1 = platform default

    QString identifier() const { return identifier_; }
    DeliveryState state() const { return state_; }
    bool isDelivered() const { return state_ == DeliveryState::Delivered; }

private:
    friend class Notifier;

    QString identifier_;
    DeliveryState state_ = DeliveryState::Unsent;
};

using NotificationPtr = std::shared_ptr<Notification>;

QDebug operator<<(QDebug debug, const Notification& notification);

} // namespace dnotify

Q_DECLARE_METATYPE(dnotify::NotificationPtr)

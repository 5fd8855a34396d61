#include <dnotify/Model/Notification.hpp>
#include <QDebug>
#include <boost/log/trivial.hpp>

namespace dnotify {

Notification::Notification(const QString& title, const QString& message,
                           Urgency urgency, bool sound)
    : title(title), message(message), urgency(urgency)
{
    if (sound) {
        BOOST_LOG_TRIVIAL(warning) << "Notification: sound=true is deprecated, "
                                      "use soundFile = DEFAULT_SOUND instead";
        soundFile = DEFAULT_SOUND;
    }
}

QString deliveryStateToString(DeliveryState state)
{
    switch (state) {
    case DeliveryState::Unsent:    return QStringLiteral("unsent");
    case DeliveryState::Pending:   return QStringLiteral("pending");
    case DeliveryState::Delivered: return QStringLiteral("delivered");
    case DeliveryState::Failed:    return QStringLiteral("failed");
    case DeliveryState::Cleared:   return QStringLiteral("cleared");
    }
    return {};
}

QDebug operator<<(QDebug debug, const Button& button)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "Button(title=" << button.title
                    << ", onPressed=" << static_cast<bool>(button.onPressed) << ')';
    return debug;
}

QDebug operator<<(QDebug debug, const ReplyField& field)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "ReplyField(title=" << field.title
                    << ", buttonTitle=" << field.buttonTitle
                    << ", onReplied=" << static_cast<bool>(field.onReplied) << ')';
    return debug;
}

QDebug operator<<(QDebug debug, const Notification& notification)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "Notification(title=" << notification.title
                    << ", message=" << notification.message
                    << ", state=" << deliveryStateToString(notification.state());
    if (!notification.identifier().isEmpty())
        debug << ", identifier=" << notification.identifier();
    debug << ')';
    return debug;
}

} // namespace dnotify

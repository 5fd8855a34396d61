#include <dnotify/Backend/NullBackend.hpp>
#include <QUuid>
#include <boost/log/trivial.hpp>

namespace dnotify {

NullBackend::NullBackend(QObject* parent) : NotificationBackend(parent) {}

QString NullBackend::name() const
{
    return QStringLiteral("null");
}

QString NullBackend::deliver(const NotificationPtr& notification, const NotificationPtr&)
{
    BOOST_LOG_TRIVIAL(debug) << "NullBackend: dropping '" << notification->title.toStdString() << "'";
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

void NullBackend::dismiss(const NotificationPtr&) {}

void NullBackend::dismissAll() {}

Capabilities NullBackend::queryCapabilities()
{
    return {};
}

bool NullBackend::queryAuthorisation()
{
    return true;
}

bool NullBackend::requestAuthorisation()
{
    return true;
}

} // namespace dnotify

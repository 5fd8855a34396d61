#include <dnotify/Backend/BackendFactory.hpp>
#include <dnotify/Backend/NullBackend.hpp>
#include <dnotify/Config/NotifierConfig.hpp>
#include <boost/log/trivial.hpp>
#include <stdexcept>

#ifdef DNOTIFY_HAS_DBUS
#include <dnotify/Backend/DBusBackend.hpp>
#endif

namespace dnotify {

QString BackendFactory::platformDefault()
{
#ifdef DNOTIFY_HAS_DBUS
    return QStringLiteral("dbus");
#else
    return QStringLiteral("null");
#endif
}

std::unique_ptr<NotificationBackend> BackendFactory::create(const NotifierConfig& config)
{
    QString kind = config.backend().trimmed().toLower();
    if (kind.isEmpty() || kind == "auto")
        kind = platformDefault();

    if (kind == "null") {
        BOOST_LOG_TRIVIAL(info) << "BackendFactory: using null backend, notifications will not be shown";
        return std::make_unique<NullBackend>();
    }

    if (kind == "dbus") {
#ifdef DNOTIFY_HAS_DBUS
        auto backend = std::make_unique<DBusBackend>();
        backend->setTimeoutMs(config.dbusTimeoutMs());
        backend->setDesktopEntry(config.desktopEntry());
        return backend;
#else
        throw std::invalid_argument("the dbus backend is not available on this platform");
#endif
    }

    throw std::invalid_argument("unknown notification backend: " + kind.toStdString());
}

} // namespace dnotify

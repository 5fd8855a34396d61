#include <dnotify/Core/Notifier.hpp>
#include <dnotify/Core/Errors.hpp>
#include <dnotify/Backend/BackendFactory.hpp>
#include <dnotify/Backend/NotificationBackend.hpp>
#include <dnotify/Config/NotifierConfig.hpp>
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace dnotify {

Notifier::Notifier(NotificationBackend* backend, const QString& appName,
                   int notificationLimit, QObject* parent)
    : QObject(parent), appName_(appName), cache_(notificationLimit)
{
    if (!backend)
        throw std::invalid_argument("Notifier requires a backend");
    adoptBackend(backend);
}

Notifier::Notifier(const NotifierConfig& config, QObject* parent)
    : QObject(parent), appName_(config.appName()), cache_(config.notificationLimit())
{
    adoptBackend(BackendFactory::create(config).release());
}

Notifier::~Notifier()
{
    // The backend is a child and outlives nothing; stop it calling back in
    if (backend_)
        backend_->attach(nullptr);
}

void Notifier::adoptBackend(NotificationBackend* backend)
{
    qRegisterMetaType<dnotify::NotificationPtr>();
    backend_ = backend;
    backend_->setParent(this);
    backend_->attach(this);
    BOOST_LOG_TRIVIAL(debug) << "Notifier: '" << appName_.toStdString()
                             << "' using backend " << backend_->name().toStdString()
                             << ", limit " << cache_.limit();
}

bool Notifier::requestAuthorisation()
{
    try {
        return backend_->requestAuthorisation();
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "Notifier: authorisation request failed: " << e.what();
        return false;
    }
}

bool Notifier::hasAuthorisation()
{
    try {
        return backend_->queryAuthorisation();
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "Notifier: authorisation query failed: " << e.what();
        return false;
    }
}

void Notifier::send(const NotificationPtr& notification)
{
    if (!notification)
        throw std::invalid_argument("cannot send a null notification");
    if (notification->state_ != DeliveryState::Unsent)
        throw std::logic_error("notification was already sent: state "
                               + deliveryStateToString(notification->state_).toStdString());

    NotificationPtr replaced = cache_.evictOldest();
    notification->state_ = DeliveryState::Pending;

    QString identifier;
    try {
        identifier = backend_->deliver(notification, replaced);
    } catch (const AuthorisationError& e) {
        cache_.restoreOldest(replaced);
        notification->state_ = DeliveryState::Failed;
        BOOST_LOG_TRIVIAL(warning) << "Notifier: not authorised to send '"
                                   << notification->title.toStdString() << "': " << e.what();
        emit deliveryFailed(notification, QString::fromUtf8(e.what()));
        throw;
    } catch (const std::exception& e) {
        // Notifications are not critical to the application: the notification
        // service may be missing, the session may be headless, etc.
        cache_.restoreOldest(replaced);
        notification->state_ = DeliveryState::Failed;
        BOOST_LOG_TRIVIAL(warning) << "Notifier: notification '"
                                   << notification->title.toStdString()
                                   << "' failed: " << e.what();
        emit deliveryFailed(notification, QString::fromUtf8(e.what()));
        return;
    }

    notification->identifier_ = identifier;
    notification->state_ = DeliveryState::Delivered;
    const NotificationPtr displaced = cache_.record(notification);

    BOOST_LOG_TRIVIAL(debug) << "Notifier: delivered '" << notification->title.toStdString()
                             << "' as " << identifier.toStdString();
    emit notificationDelivered(notification);

    if (replaced) {
        replaced->state_ = DeliveryState::Cleared;
        emit notificationRemoved(replaced);
    }
    if (displaced) {
        BOOST_LOG_TRIVIAL(warning) << "Notifier: backend " << backend_->name().toStdString()
                                   << " reused identifier " << identifier.toStdString()
                                   << " of live notification '" << displaced->title.toStdString()
                                   << "', dropping it";
        markRemoved(displaced);
    }
}

void Notifier::clear(const NotificationPtr& notification)
{
    if (!notification) return;

    const NotificationPtr owner = cache_.lookup(notification->identifier_);
    if (owner && owner != notification) {
        // Evicted entry whose platform slot now shows a newer notification
        BOOST_LOG_TRIVIAL(debug) << "Notifier: " << notification->identifier_.toStdString()
                                 << " was reused, not dismissing it";
    } else if (!notification->identifier_.isEmpty()) {
        try {
            backend_->dismiss(notification);
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "Notifier: clearing " << notification->identifier_.toStdString()
                                       << " failed: " << e.what();
            emit clearFailed(QString::fromUtf8(e.what()));
        }
    }

    const bool tracked = cache_.contains(notification);
    cache_.forget(notification);
    if (tracked)
        markRemoved(notification);
}

void Notifier::clearAll()
{
    try {
        backend_->dismissAll();
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "Notifier: clearing all notifications failed: " << e.what();
        emit clearFailed(QString::fromUtf8(e.what()));
    }

    const auto removed = cache_.snapshot();
    cache_.clear();
    for (const auto& n : removed)
        markRemoved(n);
}

Capabilities Notifier::capabilities()
{
    return backend_->queryCapabilities();
}

QList<NotificationPtr> Notifier::currentNotifications() const
{
    return cache_.snapshot();
}

NotificationPtr Notifier::notificationForIdentifier(const QString& identifier) const
{
    return cache_.lookup(identifier);
}

void Notifier::handlePlatformClosed(const NotificationPtr& notification)
{
    if (!notification || !cache_.contains(notification)) return;

    BOOST_LOG_TRIVIAL(debug) << "Notifier: platform closed " << notification->identifier_.toStdString();
    cache_.forget(notification);
    markRemoved(notification);
}

void Notifier::markRemoved(const NotificationPtr& notification)
{
    if (notification->state_ == DeliveryState::Delivered)
        notification->state_ = DeliveryState::Cleared;
    emit notificationRemoved(notification);
}

} // namespace dnotify

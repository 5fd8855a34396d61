#include <dnotify/Core/NotificationCache.hpp>
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace dnotify {

NotificationCache::NotificationCache(int limit)
    : limit_(limit)
{
    if (limit_ != Unbounded && limit_ <= 0)
        throw std::invalid_argument("notification limit must be positive or unbounded (-1)");
}

bool NotificationCache::isAtCapacity() const
{
    return limit_ != Unbounded && size() >= limit_;
}

bool NotificationCache::contains(const NotificationPtr& notification) const
{
    return notification && positions_.contains(notification.get());
}

NotificationPtr NotificationCache::record(const NotificationPtr& notification)
{
    if (!notification) return nullptr;
    if (contains(notification)) {
        BOOST_LOG_TRIVIAL(debug) << "NotificationCache: ignoring duplicate record of '"
                                 << notification->title.toStdString() << "'";
        return nullptr;
    }
    auto it = order_.insert(order_.end(), notification);
    positions_.insert(notification.get(), it);
    return index(notification);
}

NotificationPtr NotificationCache::evictOldest()
{
    if (!isAtCapacity() || order_.empty())
        return nullptr;

    NotificationPtr oldest = order_.front();
    order_.pop_front();
    positions_.remove(oldest.get());
    unindex(oldest);
    return oldest;
}

void NotificationCache::restoreOldest(const NotificationPtr& notification)
{
    if (!notification || contains(notification)) return;
    auto it = order_.insert(order_.begin(), notification);
    positions_.insert(notification.get(), it);
    // Its identifier was unindexed by evictOldest(), so nothing can clash
    index(notification);
}

void NotificationCache::forget(const NotificationPtr& notification)
{
    if (!notification) return;

    auto pos = positions_.find(notification.get());
    if (pos != positions_.end()) {
        order_.erase(pos.value());
        positions_.erase(pos);
    }
    unindex(notification);
}

NotificationPtr NotificationCache::lookup(const QString& identifier) const
{
    if (identifier.isEmpty()) return nullptr;
    return byIdentifier_.value(identifier);
}

QList<NotificationPtr> NotificationCache::snapshot() const
{
    QList<NotificationPtr> result;
    result.reserve(size());
    for (const auto& n : order_)
        result.append(n);
    return result;
}

void NotificationCache::clear()
{
    order_.clear();
    positions_.clear();
    byIdentifier_.clear();
}

NotificationPtr NotificationCache::index(const NotificationPtr& notification)
{
    const QString id = notification->identifier();
    if (id.isEmpty()) return nullptr;

    // The newer notification owns the identifier from now on
    NotificationPtr displaced;
    auto previous = byIdentifier_.value(id);
    if (previous && previous != notification) {
        auto pos = positions_.find(previous.get());
        if (pos != positions_.end()) {
            order_.erase(pos.value());
            positions_.erase(pos);
            displaced = previous;
        }
    }
    byIdentifier_.insert(id, notification);
    return displaced;
}

void NotificationCache::unindex(const NotificationPtr& notification)
{
    const QString id = notification->identifier();
    if (id.isEmpty()) return;

    auto it = byIdentifier_.find(id);
    if (it != byIdentifier_.end() && it.value() == notification)
        byIdentifier_.erase(it);
}

} // namespace dnotify

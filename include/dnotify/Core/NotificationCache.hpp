#pragma once

#include <dnotify/Model/Notification.hpp>
#include <QHash>
#include <QList>
#include <QString>
#include <list>

namespace dnotify {

/// Bounded, oldest-first collection of displayed notifications plus an index
/// by platform identifier. Every mutation goes through this class so the
/// ordered list and the index never disagree.
///
/// Not thread-safe; owned and used by a single Notifier.
class NotificationCache {
public:
    static constexpr int Unbounded = -1;

    /// Throws std::invalid_argument unless limit is Unbounded or positive.
    explicit NotificationCache(int limit = Unbounded);

    int limit() const { return limit_; }
    int size() const { return static_cast<int>(order_.size()); }
    bool isEmpty() const { return order_.empty(); }
    bool isAtCapacity() const;
    bool contains(const NotificationPtr& notification) const;

    /// Append at the tail and index by identifier (if non-empty).
    /// A live entry already holding that identifier is dropped and returned;
    /// nullptr when there was none.
    NotificationPtr record(const NotificationPtr& notification);

    /// Remove and return the head if the cache is full; nullptr otherwise.
    NotificationPtr evictOldest();

    /// Undo evictOldest(): put the entry back at the head.
    void restoreOldest(const NotificationPtr& notification);

    /// Remove from the list and the index. Absent entries are ignored.
    void forget(const NotificationPtr& notification);

    NotificationPtr lookup(const QString& identifier) const;

    /// Copy of the live notifications, oldest first.
    QList<NotificationPtr> snapshot() const;

    void clear();

private:
    using Order = std::list<NotificationPtr>;

    NotificationPtr index(const NotificationPtr& notification);
    void unindex(const NotificationPtr& notification);

    int limit_;
    Order order_;
    QHash<const Notification*, Order::iterator> positions_;
    QHash<QString, NotificationPtr> byIdentifier_;
};

} // namespace dnotify

#pragma once

#include <dnotify/Backend/NotificationBackend.hpp>

namespace dnotify {

/// Fallback for hosts without a supported notification service.
/// Accepts every notification and shows nothing.
class NullBackend : public NotificationBackend {
    Q_OBJECT
public:
    explicit NullBackend(QObject* parent = nullptr);

    QString name() const override;
    QString deliver(const NotificationPtr& notification,
                    const NotificationPtr& replaced) override;
    void dismiss(const NotificationPtr& notification) override;
    void dismissAll() override;
    Capabilities queryCapabilities() override;
    bool queryAuthorisation() override;
    bool requestAuthorisation() override;
    bool reportsClosures() const override { return false; }
};

} // namespace dnotify

#pragma once

#include <dnotify/Backend/NotificationBackend.hpp>
#include <QList>
#include <QStringList>

namespace dnotify {

/// In-process backend that shows nothing. Records every call and lets tests
/// script failures and simulate platform events.
class ReplayBackend : public NotificationBackend {
    Q_OBJECT
public:
    struct Delivery {
        NotificationPtr notification;
        NotificationPtr replaced;
        QString identifier;   // empty if the delivery failed
    };

    explicit ReplayBackend(QObject* parent = nullptr);
    ~ReplayBackend() override;

    // NotificationBackend interface
    QString name() const override;
    QString deliver(const NotificationPtr& notification,
                    const NotificationPtr& replaced) override;
    void dismiss(const NotificationPtr& notification) override;
    void dismissAll() override;
    Capabilities queryCapabilities() override;
    bool queryAuthorisation() override;
    bool requestAuthorisation() override;

    // Scripting
    void failNextDeliveries(int count, const QString& reason = QStringLiteral("delivery refused"));
    void setDismissFails(bool fails);
    void setDismissAllFails(bool fails);
    void setCapabilities(const Capabilities& capabilities);
    void setAuthorised(bool authorised);
    void setGrantOnRequest(bool grant);
    /// When enforced, deliver() throws AuthorisationError while unauthorised.
    void setAuthorisationEnforced(bool enforced);
    /// Reuse the replaced notification's identifier, like servers that
    /// update a notification in place.
    void setReuseReplacedIdentifier(bool reuse);
    /// Hand out `identifier` for the next successful delivery only.
    void setNextIdentifier(const QString& identifier);

    // Platform event simulation. Return false if the identifier is unknown.
    bool simulateDismissed(const QString& identifier);
    bool simulateExpired(const QString& identifier);
    bool simulateClicked(const QString& identifier);
    bool simulateButtonPressed(const QString& identifier, int buttonIndex);
    bool simulateReplied(const QString& identifier, const QString& text);

    // Inspection
    QList<Delivery> deliveries() const;
    QStringList dismissed() const;
    int dismissAllCount() const;
    int authorisationRequests() const;
    void clearRecorded();

private:
    int nextId_ = 1;
    int failuresRemaining_ = 0;
    QString failureReason_;
    bool dismissFails_ = false;
    bool dismissAllFails_ = false;
    bool authorised_ = true;
    bool grantOnRequest_ = true;
    bool enforceAuthorisation_ = false;
    bool reuseReplacedIdentifier_ = false;
    QString nextIdentifier_;
    Capabilities capabilities_;
    QList<Delivery> deliveries_;
    QStringList dismissed_;
    int dismissAllCount_ = 0;
    int authorisationRequests_ = 0;
};

} // namespace dnotify

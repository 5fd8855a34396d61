#include <dnotify/Backend/ReplayBackend.hpp>
#include <dnotify/Core/Errors.hpp>
#include <utility>

namespace dnotify {

ReplayBackend::ReplayBackend(QObject* parent)
    : NotificationBackend(parent)
{
    const auto all = allCapabilities();
    capabilities_ = Capabilities(all.begin(), all.end());
}

ReplayBackend::~ReplayBackend() = default;

QString ReplayBackend::name() const
{
    return QStringLiteral("replay");
}

QString ReplayBackend::deliver(const NotificationPtr& notification,
                               const NotificationPtr& replaced)
{
    Delivery record{notification, replaced, {}};

    if (enforceAuthorisation_ && !authorised_) {
        deliveries_.append(record);
        throw AuthorisationError("not authorised to send notifications");
    }
    if (failuresRemaining_ > 0) {
        --failuresRemaining_;
        deliveries_.append(record);
        throw BackendError(failureReason_.toStdString());
    }

    if (!nextIdentifier_.isEmpty())
        record.identifier = std::exchange(nextIdentifier_, QString());
    else if (reuseReplacedIdentifier_ && replaced && !replaced->identifier().isEmpty())
        record.identifier = replaced->identifier();
    else
        record.identifier = QString::number(nextId_++);

    deliveries_.append(record);
    return record.identifier;
}

void ReplayBackend::dismiss(const NotificationPtr& notification)
{
    if (dismissFails_)
        throw BackendError("dismiss refused");
    dismissed_.append(notification->identifier());
}

void ReplayBackend::dismissAll()
{
    ++dismissAllCount_;
    if (dismissAllFails_)
        throw BackendError("dismiss all refused");
}

Capabilities ReplayBackend::queryCapabilities()
{
    return capabilities_;
}

bool ReplayBackend::queryAuthorisation()
{
    return authorised_;
}

bool ReplayBackend::requestAuthorisation()
{
    ++authorisationRequests_;
    if (grantOnRequest_)
        authorised_ = true;
    return authorised_;
}

void ReplayBackend::failNextDeliveries(int count, const QString& reason)
{
    failuresRemaining_ = count;
    failureReason_ = reason;
}

void ReplayBackend::setDismissFails(bool fails) { dismissFails_ = fails; }
void ReplayBackend::setDismissAllFails(bool fails) { dismissAllFails_ = fails; }
void ReplayBackend::setCapabilities(const Capabilities& capabilities) { capabilities_ = capabilities; }
void ReplayBackend::setAuthorised(bool authorised) { authorised_ = authorised; }
void ReplayBackend::setGrantOnRequest(bool grant) { grantOnRequest_ = grant; }
void ReplayBackend::setAuthorisationEnforced(bool enforced) { enforceAuthorisation_ = enforced; }
void ReplayBackend::setReuseReplacedIdentifier(bool reuse) { reuseReplacedIdentifier_ = reuse; }
void ReplayBackend::setNextIdentifier(const QString& identifier) { nextIdentifier_ = identifier; }

bool ReplayBackend::simulateDismissed(const QString& identifier)
{
    auto n = findNotification(identifier);
    if (!n) return false;
    if (n->onDismissed)
        n->onDismissed();
    reportClosed(n);
    return true;
}

bool ReplayBackend::simulateExpired(const QString& identifier)
{
    auto n = findNotification(identifier);
    if (!n) return false;
    reportClosed(n);
    return true;
}

bool ReplayBackend::simulateClicked(const QString& identifier)
{
    auto n = findNotification(identifier);
    if (!n) return false;
    if (n->onClicked)
        n->onClicked();
    reportClosed(n);
    return true;
}

bool ReplayBackend::simulateButtonPressed(const QString& identifier, int buttonIndex)
{
    auto n = findNotification(identifier);
    if (!n || buttonIndex < 0 || buttonIndex >= n->buttons.size()) return false;
    const auto& button = n->buttons.at(buttonIndex);
    if (button.onPressed)
        button.onPressed();
    reportClosed(n);
    return true;
}

bool ReplayBackend::simulateReplied(const QString& identifier, const QString& text)
{
    auto n = findNotification(identifier);
    if (!n || !n->replyField) return false;
    if (n->replyField->onReplied)
        n->replyField->onReplied(text);
    reportClosed(n);
    return true;
}

QList<ReplayBackend::Delivery> ReplayBackend::deliveries() const { return deliveries_; }
QStringList ReplayBackend::dismissed() const { return dismissed_; }
int ReplayBackend::dismissAllCount() const { return dismissAllCount_; }
int ReplayBackend::authorisationRequests() const { return authorisationRequests_; }

void ReplayBackend::clearRecorded()
{
    deliveries_.clear();
    dismissed_.clear();
    dismissAllCount_ = 0;
    authorisationRequests_ = 0;
}

} // namespace dnotify

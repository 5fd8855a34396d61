#include <QtTest>
#include <QSignalSpy>
#include <dnotify/Backend/ReplayBackend.hpp>
#include <dnotify/Core/Errors.hpp>
#include <dnotify/Core/Notifier.hpp>
#include "LogCapture.hpp"
#include <stdexcept>

using dnotify::DeliveryState;
using dnotify::Notification;
using dnotify::NotificationPtr;
using dnotify::Notifier;
using dnotify::ReplayBackend;

namespace {

NotificationPtr make(const QString& title)
{
    return std::make_shared<Notification>(title, QString("body"));
}

QStringList titles(const QList<NotificationPtr>& list)
{
    QStringList result;
    for (const auto& n : list)
        result << n->title;
    return result;
}

} // namespace

class TestNotifier : public QObject {
    Q_OBJECT
private slots:
    void testSendRecordsAndIndexes()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend, "Mail");
        QSignalSpy deliveredSpy(&notifier, &Notifier::notificationDelivered);

        auto a = make("A");
        notifier.send(a);

        QCOMPARE(a->state(), DeliveryState::Delivered);
        QVERIFY(!a->identifier().isEmpty());
        QCOMPARE(notifier.currentNotifications().size(), 1);
        QVERIFY(notifier.notificationForIdentifier(a->identifier()) == a);
        QCOMPARE(deliveredSpy.count(), 1);
        QCOMPARE(backend->deliveries().size(), 1);
        QVERIFY(backend->deliveries().at(0).replaced == nullptr);
    }

    void testDefaults()
    {
        Notifier notifier(new ReplayBackend);
        QCOMPARE(notifier.appName(), QString("App"));
        QCOMPARE(notifier.notificationLimit(), -1);
        QCOMPARE(notifier.backend()->name(), QString("replay"));
    }

    void testLimitEvictsOldestFirst()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend, "App", 2);

        auto a = make("A");
        auto b = make("B");
        auto c = make("C");
        notifier.send(a);
        notifier.send(b);
        notifier.send(c);

        QCOMPARE(titles(notifier.currentNotifications()), QStringList({"B", "C"}));
        QVERIFY(notifier.notificationForIdentifier(a->identifier()) == nullptr);
        QCOMPARE(a->state(), DeliveryState::Cleared);

        // The evicted entry is handed to the backend so it can reuse its slot
        QVERIFY(backend->deliveries().at(2).replaced == a);
    }

    void testCacheNeverExceedsLimit()
    {
        Notifier notifier(new ReplayBackend, "App", 3);
        QList<NotificationPtr> sent;
        for (int i = 0; i < 10; ++i) {
            auto n = make(QString::number(i));
            notifier.send(n);
            sent << n;
            QVERIFY(notifier.currentNotifications().size() <= 3);
        }
        QCOMPARE(notifier.currentNotifications(), sent.mid(7));
    }

    void testFailedDeliveryRollsBackEviction()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend, "App", 1);
        QSignalSpy failedSpy(&notifier, &Notifier::deliveryFailed);
        QSignalSpy removedSpy(&notifier, &Notifier::notificationRemoved);

        auto a = make("A");
        notifier.send(a);
        const auto before = notifier.currentNotifications();

        backend->failNextDeliveries(1, "service unavailable");
        auto b = make("B");
        LogCapture log;
        notifier.send(b);  // must not throw

        QCOMPARE(notifier.currentNotifications(), before);
        QVERIFY(notifier.notificationForIdentifier(a->identifier()) == a);
        QCOMPARE(a->state(), DeliveryState::Delivered);
        QCOMPARE(b->state(), DeliveryState::Failed);
        QVERIFY(b->identifier().isEmpty());
        QCOMPARE(failedSpy.count(), 1);
        QVERIFY(failedSpy.at(0).at(1).toString().contains("service unavailable"));
        QCOMPARE(removedSpy.count(), 0);
        QVERIFY(log.contains("service unavailable"));
    }

    void testFailedDeliveryUnboundedLeavesSnapshot()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend);
        notifier.send(make("A"));
        notifier.send(make("B"));
        const auto before = notifier.currentNotifications();

        backend->failNextDeliveries(1);
        notifier.send(make("C"));

        QCOMPARE(notifier.currentNotifications(), before);
    }

    void testSendingTwiceIsRejected()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend);
        auto a = make("A");
        notifier.send(a);

        bool thrown = false;
        try {
            notifier.send(a);
        } catch (const std::logic_error&) {
            thrown = true;
        }
        QVERIFY(thrown);
        QCOMPARE(notifier.currentNotifications().size(), 1);
        QCOMPARE(backend->deliveries().size(), 1);
    }

    void testSendingNullIsRejected()
    {
        Notifier notifier(new ReplayBackend);
        bool thrown = false;
        try {
            notifier.send(nullptr);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        QVERIFY(thrown);
    }

    void testAuthorisationErrorReachesCaller()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend, "App", 1);
        auto a = make("A");
        notifier.send(a);

        backend->setAuthorisationEnforced(true);
        backend->setAuthorised(false);

        auto b = make("B");
        bool thrown = false;
        try {
            notifier.send(b);
        } catch (const dnotify::AuthorisationError&) {
            thrown = true;
        }
        QVERIFY(thrown);
        QCOMPARE(b->state(), DeliveryState::Failed);
        QCOMPARE(titles(notifier.currentNotifications()), QStringList({"A"}));
    }

    void testClearRemovesNotification()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend);
        QSignalSpy removedSpy(&notifier, &Notifier::notificationRemoved);

        auto a = make("A");
        auto b = make("B");
        notifier.send(a);
        notifier.send(b);
        const QString id = a->identifier();

        notifier.clear(a);

        QCOMPARE(titles(notifier.currentNotifications()), QStringList({"B"}));
        QVERIFY(notifier.notificationForIdentifier(id) == nullptr);
        QCOMPARE(backend->dismissed(), QStringList({id}));
        QCOMPARE(a->state(), DeliveryState::Cleared);
        QCOMPARE(removedSpy.count(), 1);
    }

    void testClearUndeliveredIsNoOp()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend);
        QSignalSpy removedSpy(&notifier, &Notifier::notificationRemoved);
        notifier.send(make("A"));

        auto never = make("never sent");
        notifier.clear(never);

        QVERIFY(backend->dismissed().isEmpty());
        QCOMPARE(notifier.currentNotifications().size(), 1);
        QCOMPARE(never->state(), DeliveryState::Unsent);
        QCOMPARE(removedSpy.count(), 0);
    }

    void testClearFailureStillForgets()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend);
        QSignalSpy clearFailedSpy(&notifier, &Notifier::clearFailed);

        auto a = make("A");
        notifier.send(a);
        backend->setDismissFails(true);

        notifier.clear(a);  // must not throw

        QVERIFY(notifier.currentNotifications().isEmpty());
        QVERIFY(notifier.notificationForIdentifier(a->identifier()) == nullptr);
        QCOMPARE(clearFailedSpy.count(), 1);
    }

    void testClearAll()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend);
        QSignalSpy removedSpy(&notifier, &Notifier::notificationRemoved);

        QList<NotificationPtr> sent{make("A"), make("B"), make("C")};
        for (const auto& n : sent)
            notifier.send(n);

        notifier.clearAll();

        QVERIFY(notifier.currentNotifications().isEmpty());
        for (const auto& n : sent) {
            QVERIFY(notifier.notificationForIdentifier(n->identifier()) == nullptr);
            QCOMPARE(n->state(), DeliveryState::Cleared);
        }
        QCOMPARE(backend->dismissAllCount(), 1);
        QCOMPARE(removedSpy.count(), 3);
    }

    void testClearAllIgnoresBackendFailure()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend);
        QSignalSpy clearFailedSpy(&notifier, &Notifier::clearFailed);

        auto a = make("A");
        auto b = make("B");
        notifier.send(a);
        notifier.send(b);
        backend->setDismissAllFails(true);

        notifier.clearAll();

        QVERIFY(notifier.currentNotifications().isEmpty());
        QVERIFY(notifier.notificationForIdentifier(a->identifier()) == nullptr);
        QVERIFY(notifier.notificationForIdentifier(b->identifier()) == nullptr);
        QCOMPARE(clearFailedSpy.count(), 1);
    }

    void testPlatformDismissalForgetsNotification()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend);
        QSignalSpy removedSpy(&notifier, &Notifier::notificationRemoved);

        int dismissed = 0;
        auto x = make("X");
        x->onDismissed = [&]() { ++dismissed; };
        auto y = make("Y");
        notifier.send(x);
        notifier.send(y);

        QVERIFY(backend->simulateDismissed(x->identifier()));

        QCOMPARE(titles(notifier.currentNotifications()), QStringList({"Y"}));
        QVERIFY(notifier.notificationForIdentifier(x->identifier()) == nullptr);
        QCOMPARE(dismissed, 1);
        QCOMPARE(x->state(), DeliveryState::Cleared);
        QCOMPARE(removedSpy.count(), 1);

        // Second report for the same identifier is unknown to the host
        QVERIFY(!backend->simulateDismissed(x->identifier()));
        QCOMPARE(dismissed, 1);
    }

    void testPlatformEventsRunCallbacks()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend);

        int clicks = 0;
        int yes = 0;
        QString reply;

        auto clicked = make("clicked");
        clicked->onClicked = [&]() { ++clicks; };
        auto buttons = make("buttons");
        buttons->buttons.append(dnotify::Button{"No", {}});
        buttons->buttons.append(dnotify::Button{"Yes", [&]() { ++yes; }});
        auto replied = make("replied");
        dnotify::ReplyField field;
        field.onReplied = [&](const QString& text) { reply = text; };
        replied->replyField = field;
        auto expired = make("expired");

        for (const auto& n : {clicked, buttons, replied, expired})
            notifier.send(n);

        QVERIFY(backend->simulateClicked(clicked->identifier()));
        QVERIFY(backend->simulateButtonPressed(buttons->identifier(), 1));
        QVERIFY(backend->simulateReplied(replied->identifier(), "see you at 8"));
        QVERIFY(backend->simulateExpired(expired->identifier()));

        QCOMPARE(clicks, 1);
        QCOMPARE(yes, 1);
        QCOMPARE(reply, QString("see you at 8"));
        QVERIFY(notifier.currentNotifications().isEmpty());
    }

    void testReplacedIdentifierIsReassigned()
    {
        auto* backend = new ReplayBackend;
        backend->setReuseReplacedIdentifier(true);
        Notifier notifier(backend, "App", 1);

        auto a = make("A");
        notifier.send(a);
        const QString id = a->identifier();

        auto b = make("B");
        notifier.send(b);

        QCOMPARE(b->identifier(), id);
        QVERIFY(notifier.notificationForIdentifier(id) == b);
        QCOMPARE(titles(notifier.currentNotifications()), QStringList({"B"}));
    }

    void testClearingReplacedEntryKeepsItsSuccessor()
    {
        auto* backend = new ReplayBackend;
        backend->setReuseReplacedIdentifier(true);
        Notifier notifier(backend, "App", 1);

        auto a = make("A");
        auto b = make("B");
        notifier.send(a);
        notifier.send(b);

        notifier.clear(a);

        QVERIFY(backend->dismissed().isEmpty());
        QVERIFY(notifier.notificationForIdentifier(b->identifier()) == b);
        QCOMPARE(titles(notifier.currentNotifications()), QStringList({"B"}));
    }

    void testClashingIdentifierDropsOlderEntry()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend);
        QSignalSpy removedSpy(&notifier, &Notifier::notificationRemoved);

        auto a = make("A");
        auto b = make("B");
        notifier.send(a);
        notifier.send(b);

        backend->setNextIdentifier(a->identifier());
        auto c = make("C");
        LogCapture log;
        notifier.send(c);

        QCOMPARE(titles(notifier.currentNotifications()), QStringList({"B", "C"}));
        QVERIFY(notifier.notificationForIdentifier(c->identifier()) == c);
        QCOMPARE(a->state(), DeliveryState::Cleared);
        QCOMPARE(removedSpy.count(), 1);
        QVERIFY(removedSpy.at(0).at(0).value<NotificationPtr>() == a);
        QVERIFY(log.contains("reused identifier"));
    }

    void testSentThenClearedRoundTrip()
    {
        Notifier notifier(new ReplayBackend, "App", 4);
        auto a = make("A");
        notifier.send(a);
        notifier.clear(a);

        QVERIFY(!notifier.currentNotifications().contains(a));
        QVERIFY(notifier.notificationForIdentifier(a->identifier()) == nullptr);
    }

    void testAuthorisationPassThrough()
    {
        auto* backend = new ReplayBackend;
        backend->setAuthorised(false);
        Notifier notifier(backend);

        QVERIFY(!notifier.hasAuthorisation());
        QVERIFY(notifier.requestAuthorisation());
        QVERIFY(notifier.hasAuthorisation());
        QCOMPARE(backend->authorisationRequests(), 1);

        backend->setAuthorised(false);
        backend->setGrantOnRequest(false);
        QVERIFY(!notifier.requestAuthorisation());
    }

    void testCapabilitiesPassThrough()
    {
        auto* backend = new ReplayBackend;
        Notifier notifier(backend);
        QVERIFY(notifier.capabilities().contains(dnotify::Capability::ReplyField));

        backend->setCapabilities({dnotify::Capability::Title, dnotify::Capability::Message});
        const auto caps = notifier.capabilities();
        QCOMPARE(caps.size(), 2);
        QVERIFY(!caps.contains(dnotify::Capability::ReplyField));
    }

    void testInvalidConstruction()
    {
        bool thrown = false;
        try {
            Notifier notifier(nullptr);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        QVERIFY(thrown);

        ReplayBackend backend;  // not adopted when construction fails
        thrown = false;
        try {
            Notifier notifier(&backend, "App", 0);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        QVERIFY(thrown);
        QVERIFY(backend.parent() == nullptr);
    }

    void testBackendDetachedOnDestruction()
    {
        QPointer<ReplayBackend> backend = new ReplayBackend;
        {
            Notifier notifier(backend);
            QVERIFY(backend->host() == &notifier);
        }
        QVERIFY(backend.isNull());  // owned and deleted with the notifier
    }
};

QTEST_MAIN(TestNotifier)
#include "test_notifier.moc"

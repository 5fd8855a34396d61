#include <QtTest>
#include <dnotify/Backend/BackendFactory.hpp>
#include <dnotify/Backend/NullBackend.hpp>
#include <dnotify/Backend/ReplayBackend.hpp>
#include <dnotify/Config/NotifierConfig.hpp>
#include <dnotify/Core/Notifier.hpp>
#include <stdexcept>

class TestBackendFactory : public QObject {
    Q_OBJECT
private slots:
    void testNullBackend()
    {
        dnotify::NotifierConfig config;
        config.setBackend("null");
        auto backend = dnotify::BackendFactory::create(config);
        QVERIFY(backend != nullptr);
        QCOMPARE(backend->name(), QString("null"));
    }

    void testNamesAreCaseInsensitive()
    {
        dnotify::NotifierConfig config;
        config.setBackend("  NULL ");
        auto backend = dnotify::BackendFactory::create(config);
        QCOMPARE(backend->name(), QString("null"));
    }

    void testUnknownBackendThrows()
    {
        dnotify::NotifierConfig config;
        config.setBackend("carrier-pigeon");
        bool thrown = false;
        try {
            dnotify::BackendFactory::create(config);
        } catch (const std::invalid_argument& e) {
            thrown = true;
            QVERIFY(QString(e.what()).contains("carrier-pigeon"));
        }
        QVERIFY(thrown);
    }

    void testAutoResolvesToPlatformDefault()
    {
        dnotify::NotifierConfig config;
        QCOMPARE(config.backend(), QString("auto"));
        auto backend = dnotify::BackendFactory::create(config);
        QCOMPARE(backend->name(), dnotify::BackendFactory::platformDefault());
    }

    void testNullBackendAcceptsEverything()
    {
        dnotify::NullBackend backend;
        auto n = std::make_shared<dnotify::Notification>("Title", "Body");
        const QString first = backend.deliver(n, nullptr);
        const QString second = backend.deliver(n, nullptr);
        QVERIFY(!first.isEmpty());
        QVERIFY(first != second);
        QVERIFY(!first.startsWith('{'));
        QVERIFY(backend.queryCapabilities().isEmpty());
        QVERIFY(backend.queryAuthorisation());
        backend.dismiss(n);
        backend.dismissAll();
    }

    void testOnlyInteractiveBackendsReportClosures()
    {
        dnotify::NullBackend headless;
        QVERIFY(!headless.reportsClosures());

        dnotify::ReplayBackend replay;
        QVERIFY(replay.reportsClosures());

        dnotify::NotifierConfig config;
        config.setBackend("null");
        QVERIFY(!dnotify::BackendFactory::create(config)->reportsClosures());
    }

    void testNotifierFromConfig()
    {
        dnotify::NotifierConfig config;
        config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");
        config.setBackend("null");

        dnotify::Notifier notifier(config);
        QCOMPARE(notifier.appName(), QString("Mail Watcher"));
        QCOMPARE(notifier.notificationLimit(), 3);
        QCOMPARE(notifier.backend()->name(), QString("null"));

        for (int i = 0; i < 5; ++i)
            notifier.send(std::make_shared<dnotify::Notification>(QString::number(i), "Body"));
        QCOMPARE(notifier.currentNotifications().size(), 3);
        QCOMPARE(notifier.currentNotifications().first()->title, QString("2"));
    }

    void testNotifierFromConfigRejectsBadLimit()
    {
        dnotify::NotifierConfig config;
        config.setBackend("null");
        config.setNotificationLimit(0);
        bool thrown = false;
        try {
            dnotify::Notifier notifier(config);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        QVERIFY(thrown);
    }
};

QTEST_MAIN(TestBackendFactory)
#include "test_backend_factory.moc"

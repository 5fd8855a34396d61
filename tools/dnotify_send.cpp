#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <memory>
#include <stdexcept>
#include <dnotify/Config/NotifierConfig.hpp>
#include <dnotify/Core/Errors.hpp>
#include <dnotify/Core/Notifier.hpp>
#include <dnotify/Logging.hpp>
#include <dnotify/Version.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("dnotify-send");
    app.setApplicationVersion(DNOTIFY_VERSION_STRING);

    QCommandLineParser parser;
    parser.setApplicationDescription("Send a desktop notification.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("title", "Notification title.");
    parser.addPositionalArgument("message", "Notification message.");

    QCommandLineOption configOpt({"c", "config"}, "YAML configuration file.", "path");
    QCommandLineOption backendOpt("backend", "Backend: auto, dbus or null.", "name");
    QCommandLineOption appNameOpt("app-name", "Application name shown by the server.", "name");
    QCommandLineOption urgencyOpt({"u", "urgency"}, "low, normal or critical.", "level", "normal");
    QCommandLineOption iconOpt({"i", "icon"}, "Icon URI or themed icon name.", "icon");
    QCommandLineOption timeoutOpt({"t", "timeout"}, "Timeout in seconds (-1 = server default).", "seconds", "-1");
    QCommandLineOption soundOpt("sound", "Play the default sound.");
    QCommandLineOption soundFileOpt("sound-file", "Sound name or file to play.", "sound");
    QCommandLineOption threadOpt("thread", "Grouping key.", "id");
    QCommandLineOption attachmentOpt("attachment", "Attachment URI.", "uri");
    QCommandLineOption buttonOpt({"b", "button"}, "Add a button (repeatable).", "title");
    QCommandLineOption replyOpt("reply", "Add a reply field.");
    QCommandLineOption capsOpt("capabilities", "Print the backend's capabilities and exit.");
    QCommandLineOption waitOpt({"w", "wait"}, "Wait until the notification is closed.");
    QCommandLineOption verboseOpt({"v", "verbose"}, "Log at debug level.");
    parser.addOptions({configOpt, backendOpt, appNameOpt, urgencyOpt, iconOpt, timeoutOpt,
                       soundOpt, soundFileOpt, threadOpt, attachmentOpt, buttonOpt,
                       replyOpt, capsOpt, waitOpt, verboseOpt});
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    dnotify::NotifierConfig config;
    if (parser.isSet(configOpt)) {
        try {
            config.load(parser.value(configOpt));
        } catch (const YAML::Exception& e) {
            err << "dnotify-send: cannot load " << parser.value(configOpt) << ": " << e.what() << Qt::endl;
            return 1;
        }
    }
    if (parser.isSet(backendOpt))
        config.setBackend(parser.value(backendOpt));
    if (parser.isSet(appNameOpt))
        config.setAppName(parser.value(appNameOpt));
    if (parser.isSet(verboseOpt))
        config.setLogLevel("debug");

    dnotify::initLogging(config.logLevel(), config.logFile());

    std::unique_ptr<dnotify::Notifier> notifier;
    try {
        notifier = std::make_unique<dnotify::Notifier>(config);
    } catch (const std::invalid_argument& e) {
        err << "dnotify-send: " << e.what() << Qt::endl;
        return 1;
    }

    if (parser.isSet(capsOpt)) {
        for (const auto& name : dnotify::capabilityNames(notifier->capabilities()))
            out << name << Qt::endl;
        return 0;
    }

    const QStringList args = parser.positionalArguments();
    if (args.size() != 2) {
        err << "dnotify-send: expected <title> <message>" << Qt::endl;
        parser.showHelp(1);
    }

    bool urgencyOk = false;
    const auto urgency = dnotify::urgencyFromString(parser.value(urgencyOpt), &urgencyOk);
    if (!urgencyOk) {
        err << "dnotify-send: unknown urgency '" << parser.value(urgencyOpt) << "'" << Qt::endl;
        return 1;
    }

    auto notification = std::make_shared<dnotify::Notification>(
        args.at(0), args.at(1), urgency, parser.isSet(soundOpt));
    notification->icon = parser.value(iconOpt);
    notification->timeout = parser.value(timeoutOpt).toInt();
    notification->thread = parser.value(threadOpt);
    notification->attachment = parser.value(attachmentOpt);
    if (parser.isSet(soundFileOpt))
        notification->soundFile = parser.value(soundFileOpt);

    bool wait = parser.isSet(waitOpt);
    if (wait && !notifier->backend()->reportsClosures()) {
        err << "dnotify-send: backend " << notifier->backend()->name()
            << " never reports closed notifications, not waiting" << Qt::endl;
        wait = false;
    }
    if (wait) {
        notification->onClicked = [&out]() { out << "clicked" << Qt::endl; };
        notification->onDismissed = [&out]() { out << "dismissed" << Qt::endl; };
    }
    for (const auto& title : parser.values(buttonOpt)) {
        dnotify::Button button{title, {}};
        if (wait)
            button.onPressed = [&out, title]() { out << "button " << title << Qt::endl; };
        notification->buttons.append(button);
    }
    if (parser.isSet(replyOpt)) {
        dnotify::ReplyField field;
        field.onReplied = [&out](const QString& text) { out << "reply " << text << Qt::endl; };
        notification->replyField = field;
    }

    try {
        notifier->send(notification);
    } catch (const dnotify::AuthorisationError& e) {
        err << "dnotify-send: " << e.what() << Qt::endl;
        return 2;
    }

    if (!notification->isDelivered()) {
        err << "dnotify-send: notification could not be delivered" << Qt::endl;
        return 1;
    }
    out << notification->identifier() << Qt::endl;

    if (!wait)
        return 0;

    QObject::connect(notifier.get(), &dnotify::Notifier::notificationRemoved,
                     &app, [&app, notification](const dnotify::NotificationPtr& n) {
        if (n == notification)
            app.quit();
    });
    return app.exec();
}

#include "AppConfig.hpp"
#include "EbookClient.hpp"
#include "MainWindow.hpp"
#include "QueueManager.hpp"
#include "QueueProcessor.hpp"
#include "UiAlerts.hpp"
#include "bookfetch/SocketIrcTransport.hpp"

#include <QApplication>
#include <QLoggingCategory>
Q_LOGGING_CATEGORY(bfApp, "bookfetch.app")

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("BookFetch"));
    QCoreApplication::setApplicationName(QStringLiteral("BookFetch"));

    const AppConfig config = AppConfig::load();

    qSetMessagePattern(QStringLiteral(
        "[%{time HH:mm:ss} %{category}] %{if-debug}DEBUG: %{endif}%{message}"));
    QLoggingCategory::setFilterRules(
        config.debug ? QStringLiteral("bookfetch.*.debug=true")
                     : QStringLiteral("bookfetch.*.debug=false"));

    qCInfo(bfApp) << "Starting with configuration:";
    qCInfo(bfApp) << "  Server:" << config.server << "port" << config.port;
    qCInfo(bfApp) << "  Channel:" << config.channel;
    qCInfo(bfApp) << "  Nickname:" << config.nick;
    qCInfo(bfApp) << "  Working directory:" << config.workingDirectory;
    qCInfo(bfApp) << "  Debug:" << config.debug;

    QString err;
    if (!config.ensureWorkingDirectory(err)) {
        UiAlerts::critical(nullptr, config.windowTitle, err);
        return 1;
    }

    QueueManager queue;
    bookfetch::SocketIrcTransport transport;
    EbookClient client(config, &transport, &queue);

    if (!client.connect(err)) {
        qCCritical(bfApp) << "Fatal error:" << err;
        UiAlerts::critical(nullptr, config.windowTitle,
                           QObject::tr("Could not connect to %1: %2")
                               .arg(config.server, err));
        return 1;
    }

    QueueProcessor processor(client, queue);
    processor.start();

    int rc = 0;
    {
        MainWindow w(config, client, queue);
        w.show();
        rc = app.exec();
    }

    qCInfo(bfApp) << "Shutting down";
    processor.stop();
    client.disconnect();
    return rc;
}

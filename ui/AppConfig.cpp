#include "AppConfig.hpp"
#include "bookfetch/RuntimeLogging.hpp"

#include <QDir>
#include <QLoggingCategory>
#include <QRandomGenerator>
#include <QSettings>
Q_LOGGING_CATEGORY(bfConfig, "bookfetch.config")

static QString envString(const char *name) {
    return QString::fromStdString(bookfetch::trimmedEnv(name));
}

// Port/second values from text; false leaves out untouched.
static bool parseBoundedInt(const QString &raw, int min, int max, int &out) {
    bool ok = false;
    const int v = raw.toInt(&ok);
    if (!ok || v < min || v > max)
        return false;
    out = v;
    return true;
}

AppConfig AppConfig::defaults() {
    AppConfig c;
    c.nick = QStringLiteral("fetcher%1")
                 .arg(QRandomGenerator::global()->bounded(1000, 10000));
    c.fileTypes = {QStringLiteral("epub"), QStringLiteral("mobi"),
                   QStringLiteral("pdf"),  QStringLiteral("azw3"),
                   QStringLiteral("azw"),  QStringLiteral("cbz"),
                   QStringLiteral("cbr")};
    return c;
}

AppConfig AppConfig::load(const QSettings &s) {
    AppConfig c = defaults();

    c.server = s.value("irc/server", c.server).toString();
    c.channel = s.value("irc/channel", c.channel).toString();
    c.handler = s.value("irc/handler", c.handler).toString();
    c.nick = s.value("irc/nick", c.nick).toString();
    c.workingDirectory =
        s.value("app/workingDirectory", c.workingDirectory).toString();
    c.debug = s.value("app/debug", c.debug).toBool();
    c.fileTypes = s.value("ui/fileTypes", c.fileTypes).toStringList();
    c.windowSize = s.value("ui/windowSize", c.windowSize).toSize();

    int port = c.port;
    if (s.contains("irc/port") &&
        !parseBoundedInt(s.value("irc/port").toString(), 1, 65535, port)) {
        qCWarning(bfConfig) << "Ignoring invalid irc/port setting";
    }
    int wait = c.connectionWaitSeconds;
    if (s.contains("app/connectionWaitSeconds") &&
        !parseBoundedInt(s.value("app/connectionWaitSeconds").toString(), 1,
                         600, wait)) {
        qCWarning(bfConfig) << "Ignoring invalid app/connectionWaitSeconds";
    }

    // Environment wins over stored settings
    const QString server = envString("BOOKFETCH_SERVER");
    if (!server.isEmpty())
        c.server = server;
    const QString channel = envString("BOOKFETCH_CHANNEL");
    if (!channel.isEmpty())
        c.channel = channel;
    const QString handler = envString("BOOKFETCH_HANDLER");
    if (!handler.isEmpty())
        c.handler = handler;
    const QString nick = envString("BOOKFETCH_NICK");
    if (!nick.isEmpty())
        c.nick = nick;
    const QString workdir = envString("BOOKFETCH_WORKDIR");
    if (!workdir.isEmpty())
        c.workingDirectory = workdir;
    if (!bookfetch::normalizedEnv("BOOKFETCH_DEBUG").empty())
        c.debug = bookfetch::debugLoggingEnabled();

    const QString envPort = envString("BOOKFETCH_PORT");
    if (!envPort.isEmpty() && !parseBoundedInt(envPort, 1, 65535, port))
        qCWarning(bfConfig) << "Ignoring invalid BOOKFETCH_PORT:" << envPort;
    const QString envWait = envString("BOOKFETCH_CONNECT_WAIT");
    if (!envWait.isEmpty() && !parseBoundedInt(envWait, 1, 600, wait))
        qCWarning(bfConfig) << "Ignoring invalid BOOKFETCH_CONNECT_WAIT:"
                            << envWait;

    c.port = static_cast<quint16>(port);
    c.connectionWaitSeconds = wait;
    return c;
}

AppConfig AppConfig::load() {
    QSettings s("BookFetch", "BookFetch");
    return load(s);
}

bool AppConfig::ensureWorkingDirectory(QString &err) const {
    QDir dir(workingDirectory);
    if (dir.exists())
        return true;
    qCInfo(bfConfig) << "Creating directory:" << workingDirectory;
    if (!QDir().mkpath(workingDirectory)) {
        err = QStringLiteral("Could not create working directory: %1")
                  .arg(workingDirectory);
        return false;
    }
    return true;
}

bookfetch::SessionOptions AppConfig::sessionOptions() const {
    bookfetch::SessionOptions opt;
    opt.server = server.toStdString();
    opt.port = port;
    opt.nick = nick.toStdString();
    opt.channel = channel.toStdString();
    return opt;
}

// Application settings: built-in defaults, then QSettings, then environment.
#pragma once
#include "bookfetch/IrcTypes.hpp"
#include <QSize>
#include <QString>
#include <QStringList>

class QSettings;

struct AppConfig {
    // IRC
    QString server = QStringLiteral("irc.irchighway.net");
    quint16 port = 6667;
    QString channel = QStringLiteral("#ebooks");
    QString handler = QStringLiteral("colblitz"); // nick allowed to send "quit"
    QString nick;                                 // fetcherNNNN when unset

    // Application
    QString workingDirectory = QStringLiteral("ebooks");
    bool debug = false;
    int connectionWaitSeconds = 10;

    // GUI
    QString windowTitle = QStringLiteral("IRC Ebook Fetcher");
    QSize windowSize{900, 600};
    QStringList fileTypes;

    static AppConfig defaults();
    // defaults <- settings <- BOOKFETCH_* environment variables
    static AppConfig load(const QSettings &settings);
    static AppConfig load();

    bool ensureWorkingDirectory(QString &err) const;
    bookfetch::SessionOptions sessionOptions() const;
};

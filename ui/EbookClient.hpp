// IRC client that searches for and downloads e-books from channel bots.
// It reacts to transport events, drives the text commands and runs the DCC
// SEND handshake. At most one search or book transfer is in flight.
#pragma once
#include "AppConfig.hpp"
#include "QueueManager.hpp"
#include "SearchSignal.hpp"
#include "bookfetch/IrcTransport.hpp"

#include <QSet>
#include <QString>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

class QFile;

enum class ClientMode { Idle, AwaitingSearch, AwaitingBook };

const char *clientModeName(ClientMode mode);

struct DownloadProgress {
    quint64 received = 0;
    quint64 total = 0;      // 0 when the sender did not announce a size
    double percentage = 0.0; // 0 when total is unknown
};

class EbookClient : public bookfetch::IrcEventHandler {
public:
    // transport and queue are not owned and must outlive the client.
    EbookClient(const AppConfig &config, bookfetch::IrcTransport *transport,
                QueueManager *queue);
    ~EbookClient() override;

    // Connects, joins the configured channel and waits for the join to be
    // confirmed (at most config.connectionWaitSeconds).
    bool connect(QString &err);
    void disconnect();
    bool isJoined() const;

    // Requires Idle; returns false without sending anything otherwise.
    bool doSearch(const QString &text);
    SearchSignal &searchSignal() { return searchSignal_; }

    // Sends ISON queries; usersOnline() fills in as the replies arrive.
    void checkUsersOnline(const QSet<QString> &nicks);
    // True once every reply to the last checkUsersOnline() came back.
    bool waitForUsersOnline(std::chrono::milliseconds timeout);
    QSet<QString> usersOnline() const;

    // Queues the request; starts it right away when the client is idle.
    void requestBook(const QString &user, const QString &filename);
    // Starts the queue head if idle and the queue is not empty.
    void processQueue();
    void cancelCurrentDownload();

    DownloadProgress downloadProgress() const;
    ClientMode mode() const;
    bool isIdle() const { return mode() == ClientMode::Idle; }
    QString modeName() const;
    QString latestFile() const;

    // IrcEventHandler
    void onWelcome() override;
    void onJoin(const std::string &nick, const std::string &channel) override;
    void onPrivateMessage(const std::string &from,
                          const std::string &text) override;
    void onPublicMessage(const std::string &from, const std::string &channel,
                         const std::string &text) override;
    void onPrivateNotice(const std::string &target, const std::string &from,
                         const std::string &text) override;
    void onCtcp(const std::string &target, const std::string &from,
                const std::string &payload) override;
    void onIsonReply(const std::vector<std::string> &online) override;
    void onDccData(const char *data, std::size_t len) override;
    void onDccDisconnect() override;
    void onDisconnect(const std::string &reason) override;

private:
    // Shared state read by the GUI and processor threads. Guarded by mtx_.
    struct State {
        ClientMode mode = ClientMode::Idle;
        quint64 generation = 0; // bumped by every new request and by cancel
        quint64 received = 0;
        quint64 total = 0;
        std::optional<QueueItem> currentItem;
        QString latestFile;
        bool joined = false;
        int isonPending = 0;
        QSet<QString> usersOnline;
    };

    // The open DCC transfer. Only touched on the transport dispatch thread.
    // A session whose generation is no longer current belongs to a cancelled
    // request.
    struct TransferSession {
        enum class Kind { Search, Book };
        Kind kind = Kind::Book;
        quint64 generation = 0;
        QString path;
        QString peer;
        quint64 total = 0;
        quint64 received = 0;
        bool writeFailed = false;
        std::unique_ptr<QFile> file;
    };

    void handleDccSend(const std::string &from, const std::string &payload);
    // Closes a transfer left over from a cancelled request so the current
    // request can take the DCC stream. Its data is kept but never credited.
    void dropStaleSession();
    // Gives up on the request started under generation: resets the mode and
    // reports the failure to whoever is waiting for it.
    void abortAttempt(quint64 generation, const QString &reason);
    // Records the outcome of the current book, then returns to Idle unless a
    // newer request took over.
    void finishBook(quint64 generation, const QueueItem &item, bool success);
    bool sendChannel(const QString &text, QString &err);
    bool isOwnNick(const std::string &nick) const;
    // Runs a handler body; exceptions are logged and never reach the
    // transport's dispatch loop.
    void guarded(const char *event, const std::function<void()> &body);

    AppConfig config_;
    bookfetch::IrcTransport *transport_ = nullptr;
    QueueManager *queue_ = nullptr;

    mutable std::mutex mtx_;
    std::condition_variable joinedCv_;
    std::condition_variable isonCv_;
    State state_;

    SearchSignal searchSignal_;
    std::unique_ptr<TransferSession> session_;
};

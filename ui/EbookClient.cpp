// Protocol state machine: search, ISON and queued book requests over IRC,
// with files received through DCC SEND.
#include "EbookClient.hpp"
#include "bookfetch/IrcProtocol.hpp"

#include <QDir>
#include <QFile>
#include <QLoggingCategory>
#include <QStringList>
#include <chrono>
#include <exception>
#include <vector>
Q_LOGGING_CATEGORY(bfIrc, "bookfetch.irc")
Q_LOGGING_CATEGORY(bfDcc, "bookfetch.dcc")

// Keep ISON lines well below the 512 byte IRC limit.
static constexpr int kMaxIsonLineChars = 400;

const char *clientModeName(ClientMode mode) {
    switch (mode) {
    case ClientMode::Idle:
        return "Idle";
    case ClientMode::AwaitingSearch:
        return "Search";
    case ClientMode::AwaitingBook:
        return "Book";
    }
    return "Unknown";
}

static QString qs(const std::string &s) { return QString::fromStdString(s); }

EbookClient::EbookClient(const AppConfig &config,
                         bookfetch::IrcTransport *transport,
                         QueueManager *queue)
    : config_(config), transport_(transport), queue_(queue) {}

EbookClient::~EbookClient() = default;

void EbookClient::guarded(const char *event,
                          const std::function<void()> &body) {
    try {
        body();
    } catch (const std::exception &e) {
        qCWarning(bfIrc) << "Error handling" << event << ":" << e.what();
    }
}

bool EbookClient::isOwnNick(const std::string &nick) const {
    return qs(nick).compare(config_.nick, Qt::CaseInsensitive) == 0;
}

bool EbookClient::connect(QString &err) {
    const std::string channel = config_.channel.toStdString();
    if (!bookfetch::isChannelName(channel)) {
        err = QStringLiteral("Invalid channel: %1").arg(config_.channel);
        return false;
    }
    qCInfo(bfIrc) << "Connecting to" << config_.server << ":" << config_.port;
    std::string terr;
    if (!transport_->connect(config_.sessionOptions(), this, terr)) {
        err = QStringLiteral("Connection error: %1").arg(qs(terr));
        return false;
    }

    bool joined = false;
    {
        std::unique_lock<std::mutex> lk(mtx_);
        joinedCv_.wait_for(lk, std::chrono::seconds(config_.connectionWaitSeconds),
                           [this] {
                               return state_.joined || !transport_->isConnected();
                           });
        joined = state_.joined;
    }
    if (!joined) {
        err = transport_->isConnected()
                  ? QStringLiteral("Timed out waiting to join %1").arg(config_.channel)
                  : QStringLiteral("Disconnected before joining %1").arg(config_.channel);
        transport_->disconnect();
        return false;
    }
    return true;
}

void EbookClient::disconnect() { transport_->disconnect(); }

bool EbookClient::isJoined() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_.joined;
}

bool EbookClient::sendChannel(const QString &text, QString &err) {
    qCInfo(bfIrc) << "To channel:" << text;
    std::string terr;
    if (!transport_->sendChannelMessage(text.toStdString(), terr)) {
        err = qs(terr);
        qCWarning(bfIrc) << "Could not send to channel:" << err;
        return false;
    }
    return true;
}

bool EbookClient::doSearch(const QString &text) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_.mode != ClientMode::Idle) {
            qCWarning(bfIrc) << "Search refused; client busy with"
                             << clientModeName(state_.mode);
            return false;
        }
        // Mode goes first so an immediate reply finds us waiting
        state_.mode = ClientMode::AwaitingSearch;
        ++state_.generation;
        state_.latestFile.clear();
    }
    searchSignal_.arm();
    qCInfo(bfIrc) << "Searching for:" << text;

    QString err;
    if (!sendChannel(QStringLiteral("@search %1").arg(text), err)) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            state_.mode = ClientMode::Idle;
        }
        SearchOutcome failed;
        failed.kind = SearchOutcome::Kind::Failed;
        failed.error = err;
        searchSignal_.set(failed);
        return false;
    }
    return true;
}

void EbookClient::checkUsersOnline(const QSet<QString> &nicks) {
    // Batches so every ISON line stays short; each gets its own 303 reply.
    std::vector<std::vector<std::string>> batches;
    std::vector<std::string> batch;
    int lineChars = 0;
    for (const QString &n : nicks) {
        const std::string nick = n.toStdString();
        if (nick.empty())
            continue;
        if (!batch.empty() &&
            lineChars + static_cast<int>(nick.size()) + 1 > kMaxIsonLineChars) {
            batches.push_back(batch);
            batch.clear();
            lineChars = 0;
        }
        batch.push_back(nick);
        lineChars += static_cast<int>(nick.size()) + 1;
    }
    if (!batch.empty())
        batches.push_back(batch);

    {
        std::lock_guard<std::mutex> lk(mtx_);
        state_.usersOnline.clear();
        state_.isonPending = static_cast<int>(batches.size());
    }
    for (const auto &b : batches) {
        std::string err;
        if (!transport_->ison(b, err)) {
            qCWarning(bfIrc) << "ISON query failed:" << qs(err);
            {
                std::lock_guard<std::mutex> lk(mtx_);
                state_.isonPending = 0;
            }
            isonCv_.notify_all();
            return;
        }
    }
}

bool EbookClient::waitForUsersOnline(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    return isonCv_.wait_for(lk, timeout,
                            [this] { return state_.isonPending <= 0; });
}

QSet<QString> EbookClient::usersOnline() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_.usersOnline;
}

void EbookClient::requestBook(const QString &user, const QString &filename) {
    queue_->add(user, filename);
    if (isIdle())
        processQueue();
}

void EbookClient::processQueue() {
    if (!transport_->isConnected()) {
        qCDebug(bfIrc) << "Not connected; queue left untouched";
        return;
    }
    quint64 generation = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_.mode != ClientMode::Idle)
            return;
        // Claim the slot before touching the queue so two callers cannot
        // both start a download.
        state_.mode = ClientMode::AwaitingBook;
        generation = ++state_.generation;
    }

    const std::optional<QueueItem> item = queue_->peekNext();
    if (!item) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_.generation == generation)
            state_.mode = ClientMode::Idle;
        return;
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        state_.currentItem = item;
    }
    queue_->setCurrent(item);

    QString err;
    if (!sendChannel(item->command, err))
        abortAttempt(generation, err);
}

void EbookClient::cancelCurrentDownload() {
    std::optional<QueueItem> item;
    ClientMode prev = ClientMode::Idle;
    quint64 generation = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        prev = state_.mode;
        item = state_.currentItem;
        state_.currentItem.reset();
        state_.received = 0;
        state_.total = 0;
        // A transfer that still shows up belongs to the cancelled request
        generation = ++state_.generation;
        if (!item)
            state_.mode = ClientMode::Idle;
    }
    if (item) {
        qCInfo(bfIrc) << "Cancelling download:" << item->displayName();
        finishBook(generation, *item, false);
    }
    if (prev == ClientMode::AwaitingSearch) {
        qCInfo(bfIrc) << "Cancelling search";
        searchSignal_.cancel();
    }
}

void EbookClient::finishBook(quint64 generation, const QueueItem &item,
                             bool success) {
    // The head leaves the queue before the client reports Idle, otherwise
    // processQueue() could pick the same item again.
    queue_->markCompleted(item, success);
    std::lock_guard<std::mutex> lk(mtx_);
    if (state_.generation == generation)
        state_.mode = ClientMode::Idle;
}

void EbookClient::abortAttempt(quint64 generation, const QString &reason) {
    std::optional<QueueItem> item;
    ClientMode prev = ClientMode::Idle;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_.generation != generation ||
            state_.mode == ClientMode::Idle)
            return;
        prev = state_.mode;
        item = state_.currentItem;
        state_.currentItem.reset();
        state_.received = 0;
        state_.total = 0;
        if (prev != ClientMode::AwaitingBook || !item)
            state_.mode = ClientMode::Idle;
    }
    qCWarning(bfIrc) << "Aborting" << clientModeName(prev) << "request:"
                     << reason;
    if (prev == ClientMode::AwaitingSearch) {
        SearchOutcome failed;
        failed.kind = SearchOutcome::Kind::Failed;
        failed.error = reason;
        searchSignal_.set(failed);
    } else if (prev == ClientMode::AwaitingBook && item) {
        finishBook(generation, *item, false);
    }
}

DownloadProgress EbookClient::downloadProgress() const {
    std::lock_guard<std::mutex> lk(mtx_);
    DownloadProgress p;
    p.received = state_.received;
    p.total = state_.total;
    if (p.total > 0)
        p.percentage = 100.0 * static_cast<double>(p.received) /
                       static_cast<double>(p.total);
    return p;
}

ClientMode EbookClient::mode() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_.mode;
}

QString EbookClient::modeName() const {
    return QString::fromLatin1(clientModeName(mode()));
}

QString EbookClient::latestFile() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_.latestFile;
}

void EbookClient::onWelcome() {
    guarded("welcome", [this] {
        qCInfo(bfIrc) << "Connected to" << config_.server;
        std::string err;
        if (!transport_->joinChannel(config_.channel.toStdString(), err))
            qCWarning(bfIrc) << "Could not join" << config_.channel << ":"
                             << qs(err);
    });
}

void EbookClient::onJoin(const std::string &nick, const std::string &channel) {
    guarded("join", [&] {
        if (!isOwnNick(nick))
            return;
        qCInfo(bfIrc) << "Joined channel:" << qs(channel);
        {
            std::lock_guard<std::mutex> lk(mtx_);
            state_.joined = true;
        }
        joinedCv_.notify_all();
    });
}

void EbookClient::onPrivateMessage(const std::string &from,
                                   const std::string &text) {
    guarded("private message", [&] {
        qCInfo(bfIrc) << "PM from" << qs(from) << ":" << qs(text);
        if (text == "quit" &&
            qs(from).compare(config_.handler, Qt::CaseInsensitive) == 0) {
            qCInfo(bfIrc) << "Received quit command";
            transport_->disconnect();
        }
    });
}

void EbookClient::onPublicMessage(const std::string &from,
                                  const std::string &channel,
                                  const std::string &text) {
    guarded("public message", [&] {
        qCDebug(bfIrc) << qs(channel) << qs(from) << ":" << qs(text);
    });
}

void EbookClient::onPrivateNotice(const std::string &target,
                                  const std::string &from,
                                  const std::string &text) {
    guarded("private notice", [&] {
        const QString message = qs(text);
        if (isOwnNick(target))
            qCInfo(bfIrc) << "Private notice from" << qs(from) << ":" << message;
        if (!message.contains(QLatin1String("returned no matches")) &&
            !message.contains(QLatin1String("Sorry")))
            return;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (state_.mode != ClientMode::AwaitingSearch) {
                qCDebug(bfIrc) << "No-results notice while"
                               << clientModeName(state_.mode) << "; ignored";
                return;
            }
            state_.mode = ClientMode::Idle;
        }
        qCInfo(bfIrc) << "No search results found";
        SearchOutcome none;
        none.kind = SearchOutcome::Kind::NoResults;
        searchSignal_.set(none);
    });
}

void EbookClient::onCtcp(const std::string &target, const std::string &from,
                         const std::string &payload) {
    guarded("CTCP", [&] {
        if (!isOwnNick(target))
            return;
        if (payload.find("SEND") == std::string::npos) {
            qCDebug(bfIrc) << "Ignoring CTCP from" << qs(from) << ":"
                           << qs(payload);
            return;
        }
        // On the wire the request reads "DCC SEND ..."
        const std::string request =
            payload.compare(0, 4, "DCC ") == 0 ? payload.substr(4) : payload;
        handleDccSend(from, request);
    });
}

void EbookClient::handleDccSend(const std::string &from,
                                const std::string &payload) {
    ClientMode mode = ClientMode::Idle;
    quint64 generation = 0;
    std::optional<QueueItem> item;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        mode = state_.mode;
        generation = state_.generation;
        item = state_.currentItem;
    }
    if (mode == ClientMode::Idle) {
        qCWarning(bfDcc) << "Refusing unsolicited DCC SEND from" << qs(from);
        return;
    }
    if (session_ && session_->generation == generation) {
        qCWarning(bfDcc) << "Refusing DCC SEND from" << qs(from)
                         << "; a transfer is already open";
        return;
    }

    bookfetch::DccSendOffer offer;
    std::string perr;
    if (!bookfetch::parseDccSend(payload, offer, perr)) {
        qCWarning(bfDcc) << qs(perr);
        abortAttempt(generation, QStringLiteral("Malformed DCC SEND"));
        return;
    }

    const QString name = qs(bookfetch::sanitizeFileName(offer.filename));
    if (mode == ClientMode::AwaitingBook) {
        const QString wanted =
            item ? qs(bookfetch::sanitizeFileName(item->filename.toStdString()))
                 : QString();
        // A late answer to a cancelled request must not be credited here
        if (wanted.isEmpty() || name.compare(wanted, Qt::CaseInsensitive) != 0) {
            qCWarning(bfDcc) << "Refusing DCC SEND of" << name << "from"
                             << qs(from) << "; waiting for" << wanted;
            return;
        }
    }
    if (session_)
        dropStaleSession();

    const TransferSession::Kind kind = mode == ClientMode::AwaitingSearch
                                           ? TransferSession::Kind::Search
                                           : TransferSession::Kind::Book;
    const QString path = QDir(config_.workingDirectory).filePath(name);
    qCInfo(bfDcc) << "Receiving file from" << qs(from) << ":"
                  << qs(offer.filename);
    qCInfo(bfDcc) << "File size:" << offer.size << "bytes ("
                  << QString::number(offer.size / 1024.0 / 1024.0, 'f', 2)
                  << "MB )";
    qCInfo(bfDcc) << "Saving to:" << path;

    auto session = std::make_unique<TransferSession>();
    session->kind = kind;
    session->generation = generation;
    session->path = path;
    session->peer = QStringLiteral("%1:%2").arg(qs(offer.address)).arg(offer.port);
    session->total = offer.size;
    session->file = std::make_unique<QFile>(path);
    if (!session->file->open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        abortAttempt(generation, QStringLiteral("Cannot open %1: %2")
                                     .arg(path, session->file->errorString()));
        return;
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_.generation == generation) {
            state_.latestFile = path;
            state_.total = offer.size;
            state_.received = 0;
        }
    }

    std::string cerr;
    if (!transport_->openDccStream(offer.address, offer.port, cerr)) {
        session->file->close();
        session->file->remove();
        abortAttempt(generation, QStringLiteral("DCC connect to %1 failed: %2")
                                     .arg(session->peer, qs(cerr)));
        return;
    }
    qCDebug(bfDcc) << "DCC stream open to" << session->peer;
    session_ = std::move(session);
}

void EbookClient::dropStaleSession() {
    std::unique_ptr<TransferSession> s = std::move(session_);
    s->file->close();
    transport_->closeDccStream();
    qCInfo(bfDcc) << "Closed superseded transfer" << s->path << "("
                  << s->received << "bytes )";
}

void EbookClient::onDccData(const char *data, std::size_t len) {
    guarded("DCC data", [&] {
        if (!session_) {
            qCDebug(bfDcc) << "DCC data without an open transfer;" << len
                           << "bytes dropped";
            return;
        }
        TransferSession &s = *session_;
        const qint64 written = s.file->write(data, static_cast<qint64>(len));
        if (written != static_cast<qint64>(len) && !s.writeFailed) {
            s.writeFailed = true;
            qCWarning(bfDcc) << "Write to" << s.path
                             << "failed:" << s.file->errorString();
        }
        s.received += len;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (state_.generation == s.generation)
                state_.received = s.received;
        }

        // The sender paces itself on this running total
        const auto ack = bookfetch::encodeDccAck(s.received);
        std::string err;
        if (!transport_->sendDccBytes(ack.data(), ack.size(), err))
            qCWarning(bfDcc) << "Could not acknowledge DCC data:" << qs(err);
    });
}

void EbookClient::onDccDisconnect() {
    guarded("DCC disconnect", [this] {
        if (!session_)
            return;
        std::unique_ptr<TransferSession> s = std::move(session_);
        s->file->close();

        bool isCurrent = false;
        ClientMode prev = ClientMode::Idle;
        std::optional<QueueItem> item;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            isCurrent = s->generation == state_.generation;
            if (isCurrent) {
                prev = state_.mode;
                item = state_.currentItem;
                state_.currentItem.reset();
                if (prev != ClientMode::AwaitingBook || !item)
                    state_.mode = ClientMode::Idle;
            }
            state_.received = 0;
            state_.total = 0;
        }

        const bool search = s->kind == TransferSession::Kind::Search;
        qCInfo(bfDcc) << "Received" << (search ? "Search" : "Book") << ":"
                      << s->path << "(" << s->received << "bytes )";
        if (!isCurrent) {
            qCInfo(bfDcc) << "Transfer no longer wanted; discarded" << s->path;
            return;
        }

        QString failure;
        if (s->writeFailed)
            failure = QStringLiteral("Could not write %1").arg(s->path);
        // Senders misreport sizes; a short stream still counts as delivered
        if (s->total > 0 && s->received != s->total)
            qCWarning(bfDcc) << "Size mismatch for" << s->path << ":"
                             << s->received << "of" << s->total << "bytes";

        if (prev == ClientMode::AwaitingSearch) {
            SearchOutcome outcome;
            if (failure.isEmpty()) {
                outcome.kind = SearchOutcome::Kind::ResultsFile;
                outcome.path = s->path;
            } else {
                qCWarning(bfDcc) << failure;
                outcome.kind = SearchOutcome::Kind::Failed;
                outcome.error = failure;
            }
            searchSignal_.set(outcome);
        } else if (prev == ClientMode::AwaitingBook && item) {
            if (!failure.isEmpty())
                qCWarning(bfDcc) << failure;
            qCInfo(bfDcc) << "Marking as completed:" << item->displayName();
            finishBook(s->generation, *item, failure.isEmpty());
        } else {
            qCInfo(bfDcc) << "NOT marking as completed; mode was"
                          << clientModeName(prev);
        }
    });
}

void EbookClient::onIsonReply(const std::vector<std::string> &online) {
    guarded("ISON reply", [&] {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (state_.isonPending <= 0) {
                qCWarning(bfIrc) << "ISON reply without a pending query; ignored";
                return;
            }
            --state_.isonPending;
            for (const auto &nick : online)
                state_.usersOnline.insert(qs(nick));
            qCDebug(bfIrc) << "Users online:" << state_.usersOnline.size();
        }
        isonCv_.notify_all();
    });
}

void EbookClient::onDisconnect(const std::string &reason) {
    guarded("disconnect", [&] {
        qCInfo(bfIrc) << "Disconnected from IRC server:" << qs(reason);
        quint64 generation = 0;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            state_.joined = false;
            state_.isonPending = 0;
            generation = state_.generation;
        }
        joinedCv_.notify_all();
        isonCv_.notify_all();
        // The transport closed any open transfer first; whatever is still
        // pending can no longer be answered.
        abortAttempt(generation, QStringLiteral("Disconnected: %1").arg(qs(reason)));
    });
}

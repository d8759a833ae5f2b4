// Client layer tests (queue, protocol state machine, queue processor, results
// parsing, configuration) against the in-memory transport. No external
// framework; run via CTest.
#include "AppConfig.hpp"
#include "EbookClient.hpp"
#include "FileProcessor.hpp"
#include "QueueManager.hpp"
#include "QueueProcessor.hpp"
#include "bookfetch/MockIrcTransport.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QTemporaryDir>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <zlib.h>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

const char *kNick = "fetcher1234";

bool waitUntil(const std::function<bool()> &pred,
               std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

AppConfig testConfig(const QString &workdir) {
    AppConfig c = AppConfig::defaults();
    c.server = QStringLiteral("irc.example.test");
    c.nick = QString::fromLatin1(kNick);
    c.channel = QStringLiteral("#ebooks");
    c.handler = QStringLiteral("owner");
    c.workingDirectory = workdir;
    c.connectionWaitSeconds = 1;
    return c;
}

// Wires a client to a mock transport and connects it.
struct Fixture {
    QTemporaryDir dir;
    bookfetch::MockIrcTransport transport;
    QueueManager queue;
    EbookClient client;
    bool connected = false;

    Fixture() : client(testConfig(dir.path()), &transport, &queue) {
        QString err;
        connected = client.connect(err);
    }

    explicit Fixture(const QString &workdir)
        : client(testConfig(workdir), &transport, &queue) {
        QString err;
        connected = client.connect(err);
    }

    std::string lastChannelMessage() const {
        const auto msgs = transport.channelMessages();
        return msgs.empty() ? std::string() : msgs.back();
    }

    void offer(const std::string &payload) {
        client.onCtcp(kNick, "bot", payload);
    }
};

std::uint32_t ackValue(const std::vector<unsigned char> &b) {
    if (b.size() != 4)
        return 0xFFFFFFFFu;
    return (static_cast<std::uint32_t>(b[0]) << 24) |
           (static_cast<std::uint32_t>(b[1]) << 16) |
           (static_cast<std::uint32_t>(b[2]) << 8) |
           static_cast<std::uint32_t>(b[3]);
}

void putLe16(QByteArray &b, quint16 v) {
    b.append(static_cast<char>(v & 0xFF));
    b.append(static_cast<char>((v >> 8) & 0xFF));
}

void putLe32(QByteArray &b, quint32 v) {
    for (int i = 0; i < 4; ++i)
        b.append(static_cast<char>((v >> (8 * i)) & 0xFF));
}

QByteArray rawDeflate(const QByteArray &in) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK)
        return {};
    QByteArray out(static_cast<int>(deflateBound(&zs, in.size())), '\0');
    zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(in.constData()));
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = reinterpret_cast<Bytef *>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    const int rc = deflate(&zs, Z_FINISH);
    out.resize(static_cast<int>(zs.total_out));
    deflateEnd(&zs);
    return rc == Z_STREAM_END ? out : QByteArray();
}

struct ZipEntry {
    QByteArray name;
    QByteArray data;
};

// Minimal archive writer for the tests.
QByteArray makeZip(const std::vector<ZipEntry> &entries, bool deflated) {
    QByteArray zip;
    QByteArray central;
    for (const ZipEntry &e : entries) {
        const QByteArray body = deflated ? rawDeflate(e.data) : e.data;
        const quint32 crc = static_cast<quint32>(
            crc32(crc32(0L, Z_NULL, 0),
                  reinterpret_cast<const Bytef *>(e.data.constData()),
                  static_cast<uInt>(e.data.size())));
        const quint16 method = deflated ? 8 : 0;
        const quint32 offset = static_cast<quint32>(zip.size());

        putLe32(zip, 0x04034b50);
        putLe16(zip, 20);
        putLe16(zip, 0);
        putLe16(zip, method);
        putLe16(zip, 0);
        putLe16(zip, 0);
        putLe32(zip, crc);
        putLe32(zip, static_cast<quint32>(body.size()));
        putLe32(zip, static_cast<quint32>(e.data.size()));
        putLe16(zip, static_cast<quint16>(e.name.size()));
        putLe16(zip, 0);
        zip.append(e.name);
        zip.append(body);

        putLe32(central, 0x02014b50);
        putLe16(central, 20);
        putLe16(central, 20);
        putLe16(central, 0);
        putLe16(central, method);
        putLe16(central, 0);
        putLe16(central, 0);
        putLe32(central, crc);
        putLe32(central, static_cast<quint32>(body.size()));
        putLe32(central, static_cast<quint32>(e.data.size()));
        putLe16(central, static_cast<quint16>(e.name.size()));
        putLe16(central, 0);
        putLe16(central, 0);
        putLe16(central, 0);
        putLe16(central, 0);
        putLe32(central, 0);
        putLe32(central, offset);
        central.append(e.name);
    }
    const quint32 cdOffset = static_cast<quint32>(zip.size());
    zip.append(central);
    putLe32(zip, 0x06054b50);
    putLe16(zip, 0);
    putLe16(zip, 0);
    putLe16(zip, static_cast<quint16>(entries.size()));
    putLe16(zip, static_cast<quint16>(entries.size()));
    putLe32(zip, static_cast<quint32>(central.size()));
    putLe32(zip, cdOffset);
    putLe16(zip, 0);
    return zip;
}

const char *kListing =
    "Search results from SearchOok v3.0\r\n"
    "Searched for: dune\r\n"
    "!alice Frank Herbert - Dune.epub ::INFO:: 1.2MB\r\n"
    "!bob Frank Herbert - Dune.epub ::INFO:: 1.2MB\r\n"
    "!carol Frank Herbert - Dune.mobi\r\n"
    "!dave Frank Herbert - Dune.txt ::INFO:: 800KB\r\n"
    "not a result line .epub\r\n";

// ---------------------------------------------------------------- queue

void test_queue_add_and_commands(TestContext &t) {
    QueueManager q;
    const QueueItem a = q.add("alice", "Dune.epub");
    const QueueItem b = q.add("bob", "Emma.mobi");
    t.check(a.id != b.id, "queue ids should be unique");
    t.check(a.command == "!alice Dune.epub", "command is !<user> <filename>");
    t.check(a.status == QueueItem::Status::Pending, "new items are Pending");
    t.check(q.size() == 2, "two items queued");
    t.check(a.displayName() == "Dune.epub (from alice)",
            "displayName shows file and user");
    t.check(q.status() == "0 done, 2 queued (Total: 2)",
            "status summarises the queue");

    const QueueItem longName = q.add("u", QString(80, QLatin1Char('x')));
    t.check(longName.displayName().startsWith(QString(50, QLatin1Char('x')) +
                                              " (from u)"),
            "displayName truncates the filename to 50 chars");
}

void test_queue_peek_and_complete(TestContext &t) {
    QueueManager q;
    t.check(!q.peekNext().has_value(), "empty queue yields nothing");
    const QueueItem a = q.add("alice", "Dune.epub");
    q.add("bob", "Emma.mobi");

    const auto head = q.peekNext();
    t.check(head && head->id == a.id, "peek returns the head");
    t.check(head && head->status == QueueItem::Status::Downloading,
            "peeked head is Downloading");
    t.check(q.size() == 2, "peek does not remove the head");

    q.setCurrent(head);
    t.check(q.current() && q.current()->id == a.id, "current is recorded");

    q.markCompleted(*head, true);
    t.check(q.size() == 1, "completion pops the head");
    t.check(!q.current().has_value(), "completion clears current");
    const auto done = q.completedItems();
    t.check(done.size() == 1 && done[0].status == QueueItem::Status::Completed,
            "history records the success");

    // A stale completion is recorded without touching the live queue
    q.markCompleted(a, false);
    t.check(q.size() == 1, "stale completion leaves the queue alone");
    t.check(q.completedItems().size() == 2, "stale completion is recorded");
    t.check(q.status() == "2 done, 1 queued (Total: 3)",
            "status counts history and queue");
}

void test_queue_edits_protect_head(TestContext &t) {
    QueueManager q;
    q.add("a", "1.epub");
    q.add("b", "2.epub");
    q.add("c", "3.epub");

    t.check(q.moveUp(2), "moveUp inside the queue works");
    t.check(q.items()[1].user == "c", "item moved up");
    t.check(q.moveDown(0), "moveDown of a pending head works");
    t.check(q.items()[0].user == "c" && q.items()[1].user == "a",
            "items swapped");
    t.check(!q.moveUp(0), "moveUp(0) is refused");
    t.check(!q.moveDown(2), "moveDown of the tail is refused");
    t.check(!q.remove(5), "out-of-range remove is refused");

    q.peekNext();
    t.check(!q.remove(0), "Downloading head cannot be removed");
    t.check(!q.moveUp(1), "nothing can move above a Downloading head");
    t.check(!q.moveDown(0), "Downloading head cannot move down");
    t.check(q.remove(2), "pending items can still be removed");

    q.clear();
    t.check(q.size() == 1, "clear keeps the Downloading head");
    t.check(q.items()[0].status == QueueItem::Status::Downloading,
            "kept item is the head");

    QueueManager idle;
    idle.add("a", "1.epub");
    idle.clear();
    t.check(idle.isEmpty(), "clear empties an idle queue");
}

void test_queue_callbacks(TestContext &t) {
    QueueManager q;
    int calls = 0;
    int signals = 0;
    QObject::connect(&q, &QueueManager::queueChanged, [&signals] { ++signals; });
    q.registerCallback([] { throw std::runtime_error("observer broke"); });
    q.registerCallback([&calls] { ++calls; });
    // Re-entrant use from a callback must not deadlock
    q.registerCallback([&q] { (void)q.size(); });

    q.add("a", "1.epub");
    t.check(calls == 1, "callbacks run after add");
    t.check(signals == 1, "queueChanged is emitted");
    q.remove(0);
    t.check(calls == 2, "callbacks run after remove");
    t.check(!q.remove(0), "remove on empty queue fails");
    t.check(calls == 2, "failed edits do not notify");
}

// --------------------------------------------------------------- client

void test_client_connect(TestContext &t) {
    Fixture f;
    t.check(f.connected, "connect should succeed with the mock");
    t.check(f.client.isJoined(), "client joined the channel");
    const auto lines = f.transport.sentLines();
    bool sawJoin = false;
    for (const auto &l : lines)
        sawJoin = sawJoin || l == "JOIN #ebooks";
    t.check(sawJoin, "JOIN is sent after the welcome");
    t.check(f.client.isIdle(), "client starts Idle");
    t.check(f.client.modeName() == "Idle", "mode name is Idle");
}

void test_client_connect_times_out_without_join(TestContext &t) {
    QTemporaryDir dir;
    bookfetch::MockIrcTransport transport;
    transport.setAutoJoin(false);
    QueueManager queue;
    EbookClient client(testConfig(dir.path()), &transport, &queue);
    QString err;
    t.check(!client.connect(err), "connect fails when the join never arrives");
    t.check(!err.isEmpty(), "join timeout is reported");
    t.check(!transport.isConnected(), "transport is closed after the timeout");
}

void test_client_rejects_bad_channel(TestContext &t) {
    QTemporaryDir dir;
    bookfetch::MockIrcTransport transport;
    QueueManager queue;
    AppConfig cfg = testConfig(dir.path());
    cfg.channel = QStringLiteral("ebooks");
    EbookClient client(cfg, &transport, &queue);
    QString err;
    t.check(!client.connect(err), "invalid channel name is refused");
    t.check(!transport.isConnected(), "nothing was connected");
}

void test_book_download(TestContext &t) {
    Fixture f;
    f.client.requestBook("bot", "book1.epub");
    t.check(f.lastChannelMessage() == "!bot book1.epub",
            "book command is sent to the channel");
    t.check(f.client.mode() == ClientMode::AwaitingBook, "client awaits book");
    t.check(f.queue.current().has_value(), "queue tracks the current item");

    f.offer("SEND \"book1.epub\" 2130706433 5000 12345");
    t.check(f.transport.dccOpen(), "DCC stream opened");
    t.check(f.transport.dccPeer() == "127.0.0.1:5000", "peer is decoded");
    t.check(f.client.downloadProgress().total == 12345, "total is announced");

    f.transport.deliverDccData(std::string(4096, 'a'));
    const DownloadProgress mid = f.client.downloadProgress();
    t.check(mid.received == 4096, "progress tracks received bytes");
    t.check(mid.percentage > 33.1 && mid.percentage < 33.2,
            "percentage is received/total");
    f.transport.deliverDccData(std::string(4096, 'b'));
    f.transport.deliverDccData(std::string(4153, 'c'));

    const auto acks = f.transport.dccWrites();
    t.check(acks.size() == 3, "one ack per chunk");
    t.check(acks.size() == 3 && ackValue(acks[0]) == 4096 &&
                ackValue(acks[1]) == 8192 && ackValue(acks[2]) == 12345,
            "acks carry the running total big-endian");

    f.transport.deliverDccDisconnect();
    t.check(f.client.isIdle(), "client is Idle after the transfer");
    t.check(f.queue.isEmpty(), "finished item left the queue");
    const auto done = f.queue.completedItems();
    t.check(done.size() == 1 && done[0].status == QueueItem::Status::Completed,
            "book is marked Completed");
    const QString path = QDir(f.dir.path()).filePath("book1.epub");
    t.check(QFileInfo(path).size() == 12345, "file is written completely");
    t.check(f.client.latestFile() == path, "latest file is recorded");
    t.check(f.client.downloadProgress().total == 0, "progress resets");
}

void test_short_transfer_still_completes(TestContext &t) {
    Fixture f;
    f.client.requestBook("bot", "short.epub");
    f.offer("DCC SEND short.epub 2130706433 5000 100");
    f.transport.deliverDccData(std::string(50, 'x'));
    f.transport.deliverDccDisconnect();
    const auto done = f.queue.completedItems();
    t.check(done.size() == 1 && done[0].status == QueueItem::Status::Completed,
            "short transfer is still marked Completed");
    t.check(QFileInfo(QDir(f.dir.path()).filePath("short.epub")).size() == 50,
            "received bytes are kept");
    t.check(f.client.isIdle(), "client is Idle after a short transfer");
}

void test_unknown_size_progress(TestContext &t) {
    Fixture f;
    f.client.requestBook("bot", "nosize.epub");
    f.offer("SEND nosize.epub 2130706433 5000 0");
    f.transport.deliverDccData(std::string(10, 'x'));
    const DownloadProgress p = f.client.downloadProgress();
    t.check(p.received == 10 && p.total == 0, "received counts without total");
    t.check(p.percentage == 0.0, "percentage is 0 when total is unknown");
    f.transport.deliverDccDisconnect();
    const auto done = f.queue.completedItems();
    t.check(done.size() == 1 && done[0].status == QueueItem::Status::Completed,
            "unknown size transfer succeeds when the stream closes");
}

void test_search_no_results(TestContext &t) {
    Fixture f;
    t.check(f.client.doSearch("dune"), "search is accepted when idle");
    t.check(f.lastChannelMessage() == "@search dune", "search command sent");
    t.check(f.client.mode() == ClientMode::AwaitingSearch, "awaiting search");
    t.check(!f.client.doSearch("emma"), "second search is refused while busy");

    f.client.onPrivateNotice(kNick, "Search",
                             "Sorry, your search for dune returned no matches.");
    const auto out = f.client.searchSignal().waitFor(std::chrono::seconds(1));
    t.check(out && out->kind == SearchOutcome::Kind::NoResults,
            "no-results notice resolves the search");
    t.check(f.client.isIdle(), "client is Idle after no results");

    f.client.onPrivateNotice(kNick, "Search", "Sorry, nothing");
    t.check(f.client.isIdle(), "stray notice while Idle changes nothing");
}

void test_search_results_file(TestContext &t) {
    Fixture f;
    t.check(f.client.doSearch("dune"), "search accepted");
    const QByteArray zip =
        makeZip({{"SearchOok_results_for_dune.txt", kListing}}, true);
    f.offer("SEND SearchOok_results_for_dune.txt.zip 2130706433 5000 " +
            std::to_string(zip.size()));
    f.transport.deliverDccData(zip.toStdString());
    f.transport.deliverDccDisconnect();

    const auto out = f.client.searchSignal().waitFor(std::chrono::seconds(1));
    t.check(out && out->kind == SearchOutcome::Kind::ResultsFile,
            "search resolves with the results file");
    t.check(f.client.isIdle(), "client is Idle after the results arrive");
    if (!out)
        return;

    FileProcessor proc;
    const SearchResults results = proc.processSearchResults(out->path);
    t.check(results.size() == 2, "epub and mobi titles are listed");
    t.check(results.value("Frank Herbert - Dune.epub") ==
                QSet<QString>({"alice", "bob"}),
            "users are grouped per file");
    t.check(results.value("Frank Herbert - Dune.mobi") ==
                QSet<QString>({"carol"}),
            "line without ::INFO is parsed");
    t.check(QFile::exists(QDir(f.dir.path())
                              .filePath("SearchOok_results_for_dune.txt")),
            "listing is extracted next to the archive");
}

void test_cancel_mid_transfer(TestContext &t) {
    Fixture f;
    f.client.requestBook("bot", "big.epub");
    f.offer("SEND big.epub 2130706433 5000 1000");
    f.transport.deliverDccData(std::string(100, 'x'));

    f.client.cancelCurrentDownload();
    t.check(f.client.isIdle(), "cancel returns to Idle");
    t.check(f.queue.isEmpty(), "cancelled item leaves the queue");
    auto done = f.queue.completedItems();
    t.check(done.size() == 1 && done[0].status == QueueItem::Status::Failed,
            "cancelled item is Failed");
    t.check(f.client.downloadProgress().received == 0,
            "progress is cleared by cancel");

    // The rest of the cancelled transfer is discarded
    f.transport.deliverDccData(std::string(900, 'y'));
    t.check(f.client.downloadProgress().received == 0,
            "orphaned data does not show as progress");
    f.transport.deliverDccDisconnect();
    t.check(f.queue.completedItems().size() == 1,
            "orphaned completion records nothing");
    t.check(f.client.isIdle(), "client stays Idle");

    f.client.requestBook("bot", "next.epub");
    t.check(f.client.mode() == ClientMode::AwaitingBook,
            "a new request starts after the orphan");
}

void test_cancel_search(TestContext &t) {
    Fixture f;
    t.check(f.client.doSearch("dune"), "search accepted");
    f.client.cancelCurrentDownload();
    const auto out = f.client.searchSignal().waitFor(std::chrono::seconds(1));
    t.check(out && out->kind == SearchOutcome::Kind::Cancelled,
            "cancel resolves the search waiter");
    t.check(f.client.isIdle(), "client is Idle after cancel");
}

void test_malformed_dcc_send(TestContext &t) {
    Fixture f;
    f.client.requestBook("bot", "book.epub");
    f.offer("SEND broken");
    t.check(!f.transport.dccOpen(), "no stream for a malformed offer");
    t.check(f.client.isIdle(), "malformed offer aborts the request");
    const auto done = f.queue.completedItems();
    t.check(done.size() == 1 && done[0].status == QueueItem::Status::Failed,
            "request is marked Failed");

    f.client.onCtcp(kNick, "bot", "VERSION");
    t.check(f.client.isIdle(), "non-SEND CTCP is ignored");
}

void test_file_open_failure(TestContext &t) {
    QTemporaryDir dir;
    Fixture f(QDir(dir.path()).filePath("missing/sub"));
    f.client.requestBook("bot", "book.epub");
    f.offer("SEND book.epub 2130706433 5000 10");
    t.check(!f.transport.dccOpen(), "no stream when the file cannot be opened");
    t.check(f.client.isIdle(), "file-open failure aborts the request");
    const auto done = f.queue.completedItems();
    t.check(done.size() == 1 && done[0].status == QueueItem::Status::Failed,
            "request is marked Failed");
}

void test_dcc_connect_failure(TestContext &t) {
    Fixture f;
    f.transport.setFailDccOpen(true);
    t.check(f.client.doSearch("dune"), "search accepted");
    f.offer("SEND results.zip 2130706433 5000 10");
    const auto out = f.client.searchSignal().waitFor(std::chrono::seconds(1));
    t.check(out && out->kind == SearchOutcome::Kind::Failed,
            "DCC connect failure fails the search");
    t.check(f.client.isIdle(), "client is Idle after the failure");
    t.check(!QFile::exists(QDir(f.dir.path()).filePath("results.zip")),
            "partial file is removed");
}

void test_second_offer_refused(TestContext &t) {
    Fixture f;
    f.client.requestBook("bot", "a.epub");
    f.offer("SEND a.epub 2130706433 5000 3");
    f.offer("SEND b.epub 2130706433 5001 3");
    t.check(f.transport.dccPeer() == "127.0.0.1:5000",
            "the open stream is kept");
    t.check(!QFile::exists(QDir(f.dir.path()).filePath("b.epub")),
            "second offer creates no file");
    f.transport.deliverDccData("abc");
    f.transport.deliverDccDisconnect();
    const auto done = f.queue.completedItems();
    t.check(done.size() == 1 && done[0].status == QueueItem::Status::Completed,
            "first transfer completes normally");
}

void test_offer_for_other_nick_ignored(TestContext &t) {
    Fixture f;
    f.client.requestBook("bot", "a.epub");
    f.client.onCtcp("someoneelse", "bot", "SEND a.epub 2130706433 5000 3");
    t.check(!f.transport.dccOpen(), "offers to other nicks are ignored");
    t.check(f.client.mode() == ClientMode::AwaitingBook,
            "request is still pending");
}

void test_unsolicited_offer_is_refused(TestContext &t) {
    Fixture f;
    QFile existing(QDir(f.dir.path()).filePath("spam.epub"));
    t.check(existing.open(QIODevice::WriteOnly), "existing file is created");
    existing.write("keep");
    existing.close();

    f.offer("SEND spam.epub 2130706433 5000 3");
    t.check(!f.transport.dccOpen(), "no stream is opened while Idle");
    t.check(QFileInfo(existing.fileName()).size() == 4,
            "existing file is left untouched");
    t.check(f.client.isIdle(), "client stays Idle");
    t.check(f.queue.completedItems().isEmpty(), "nothing is recorded");

    f.client.requestBook("bot", "wanted.epub");
    f.offer("SEND wanted.epub 2130706433 5001 3");
    t.check(f.transport.dccPeer() == "127.0.0.1:5001",
            "a later request still gets its transfer");
}

void test_new_offer_replaces_cancelled_transfer(TestContext &t) {
    Fixture f;
    f.client.requestBook("bot", "first.epub");
    f.offer("SEND first.epub 2130706433 5000 1000");
    f.transport.deliverDccData(std::string(100, 'x'));
    f.client.cancelCurrentDownload();

    f.client.requestBook("bot", "second.epub");
    t.check(f.client.mode() == ClientMode::AwaitingBook,
            "next request starts while the old stream is open");
    f.offer("SEND second.epub 2130706433 5001 3");
    t.check(f.transport.dccPeer() == "127.0.0.1:5001",
            "the cancelled stream gives way to the current request");
    t.check(QFileInfo(QDir(f.dir.path()).filePath("first.epub")).size() == 100,
            "cancelled file keeps what it received");

    f.transport.deliverDccData("abc");
    f.transport.deliverDccDisconnect();
    const auto done = f.queue.completedItems();
    t.check(done.size() == 2 && done[1].filename == "second.epub" &&
                done[1].status == QueueItem::Status::Completed,
            "second request completes");
    t.check(f.client.isIdle(), "client returns to Idle");
}

void test_late_offer_after_cancel_is_not_credited(TestContext &t) {
    Fixture f;
    f.client.requestBook("bot", "a.epub");
    f.client.cancelCurrentDownload();
    f.client.requestBook("bot", "b.epub");

    f.offer("SEND a.epub 2130706433 5000 3");
    t.check(!f.transport.dccOpen(), "offer for the cancelled book is refused");
    t.check(!QFile::exists(QDir(f.dir.path()).filePath("a.epub")),
            "no file is created for it");
    t.check(f.client.mode() == ClientMode::AwaitingBook,
            "current request keeps waiting");
    const auto current = f.queue.current();
    t.check(current && current->filename == "b.epub" &&
                current->status == QueueItem::Status::Downloading,
            "current item is untouched");

    f.offer("SEND \"B.epub\" 2130706433 5001 3");
    t.check(f.transport.dccPeer() == "127.0.0.1:5001",
            "matching offer is accepted regardless of case");
    f.transport.deliverDccData("xyz");
    f.transport.deliverDccDisconnect();
    const auto done = f.queue.completedItems();
    t.check(done.size() == 2 && done[1].filename == "b.epub" &&
                done[1].status == QueueItem::Status::Completed,
            "only the requested book is credited");
}

void test_disconnect_during_transfer(TestContext &t) {
    Fixture f;
    f.client.requestBook("bot", "book.epub");
    f.offer("SEND book.epub 2130706433 5000 10");
    f.transport.deliverDccData("12345");
    f.client.disconnect();
    t.check(!f.transport.dccOpen(), "stream is gone with the server");
    t.check(f.client.isIdle(), "client is Idle after losing the server");
    const auto done = f.queue.completedItems();
    t.check(done.size() == 1, "the transfer is resolved once");
    QFile file(QDir(f.dir.path()).filePath("book.epub"));
    t.check(file.open(QIODevice::ReadOnly) && file.readAll() == "12345",
            "received bytes are flushed to disk");
}

void test_process_queue_requires_connection(TestContext &t) {
    Fixture f;
    f.client.disconnect();
    f.queue.add("bot", "a.epub");
    f.client.processQueue();
    t.check(f.client.isIdle(), "disconnected client does not start work");
    t.check(f.queue.items()[0].status == QueueItem::Status::Pending,
            "queue head stays Pending");
}

void test_ison(TestContext &t) {
    Fixture f;
    f.client.checkUsersOnline({"alice", "bob"});
    const auto lines = f.transport.sentLines();
    const std::string last = lines.empty() ? std::string() : lines.back();
    t.check(last == "ISON alice bob" || last == "ISON bob alice",
            "one ISON line for a short list");
    t.check(!f.client.waitForUsersOnline(std::chrono::milliseconds(0)),
            "reply is pending");
    f.client.onIsonReply({"alice"});
    t.check(f.client.waitForUsersOnline(std::chrono::milliseconds(0)),
            "reply received");
    t.check(f.client.usersOnline() == QSet<QString>({"alice"}),
            "online users come from the reply");

    f.client.onIsonReply({"mallory"});
    t.check(f.client.usersOnline() == QSet<QString>({"alice"}),
            "reply without a query is ignored");

    QSet<QString> many;
    for (int i = 0; i < 100; ++i)
        many.insert(QStringLiteral("someverylongnickname%1").arg(i));
    const auto before = f.transport.sentLines().size();
    f.client.checkUsersOnline(many);
    const auto after = f.transport.sentLines();
    t.check(after.size() - before > 1, "long lists are split over several lines");
    bool shortLines = true;
    for (std::size_t i = before; i < after.size(); ++i)
        shortLines = shortLines && after[i].size() <= 410;
    t.check(shortLines, "every ISON line stays short");
}

void test_quit_command(TestContext &t) {
    Fixture f;
    f.client.onPrivateMessage("stranger", "quit");
    t.check(f.transport.isConnected(), "quit from others is ignored");
    f.client.onPrivateMessage("owner", "quit");
    t.check(!f.transport.isConnected(), "quit from the handler disconnects");
    t.check(!f.client.isJoined(), "client is no longer joined");
}

void test_disconnect_fails_pending_search(TestContext &t) {
    Fixture f;
    t.check(f.client.doSearch("dune"), "search accepted");
    f.client.disconnect();
    const auto out = f.client.searchSignal().waitFor(std::chrono::seconds(1));
    t.check(out && out->kind == SearchOutcome::Kind::Failed,
            "losing the server fails the search");
    t.check(f.client.isIdle(), "client is Idle after disconnect");
}

// ------------------------------------------------------ queue processor

void test_queue_processor_drains(TestContext &t) {
    Fixture f;
    QueueProcessor proc(f.client, f.queue, std::chrono::milliseconds(20));
    t.check(!proc.isRunning(), "processor starts stopped");
    proc.start();
    t.check(proc.isRunning(), "processor runs after start");
    proc.start();

    f.queue.add("bot", "one.epub");
    f.queue.add("bot", "two.epub");

    t.check(waitUntil([&] { return f.lastChannelMessage() == "!bot one.epub"; }),
            "processor starts the first item");
    f.offer("SEND one.epub 2130706433 5000 1");
    f.transport.deliverDccData("1");
    f.transport.deliverDccDisconnect();

    t.check(waitUntil([&] { return f.lastChannelMessage() == "!bot two.epub"; }),
            "processor starts the next item once idle");
    f.offer("SEND two.epub 2130706433 5000 1");
    f.transport.deliverDccData("2");
    f.transport.deliverDccDisconnect();

    t.check(waitUntil([&] { return f.queue.completedItems().size() == 2; }),
            "both items complete");
    proc.stop();
    t.check(!proc.isRunning(), "processor stops");
    proc.stop();
    t.check(f.transport.channelMessages().size() == 2,
            "each item is requested exactly once");
}

// ------------------------------------------------------- file processor

void test_parse_result_line(TestContext &t) {
    QString user, file;
    t.check(FileProcessor::parseResultLine(
                "!alice Some Author - Title.epub ::INFO:: 1MB", user, file),
            "line with info parses");
    t.check(user == "alice" && file == "Some Author - Title.epub",
            "user and filename are split");
    t.check(FileProcessor::parseResultLine("!bob Title.mobi\r", user, file),
            "line without info parses");
    t.check(user == "bob" && file == "Title.mobi", "CR is dropped");
    t.check(!FileProcessor::parseResultLine("!nobody", user, file),
            "line without a filename is rejected");
}

void test_parse_results_filters_types(TestContext &t) {
    FileProcessor epubOnly({QStringLiteral("EPUB")});
    const SearchResults r = epubOnly.parseResults(kListing);
    t.check(r.size() == 1 && r.contains("Frank Herbert - Dune.epub"),
            "only requested types are kept");
    t.check(r.value("Frank Herbert - Dune.epub").size() == 2,
            "duplicate offers merge by user");

    FileProcessor defaults;
    t.check(defaults.fileTypes() == FileProcessor::defaultFileTypes(),
            "empty type list means the defaults");
    t.check(defaults.parseResults("!x a.txt\n").isEmpty(),
            "txt is not an e-book type");
}

void test_zip_extraction(TestContext &t) {
    QTemporaryDir dir;
    const QString stored = QDir(dir.path()).filePath("stored.txt.zip");
    QFile f(stored);
    t.check(f.open(QIODevice::WriteOnly), "test archive can be written");
    f.write(makeZip({{"stored.txt", kListing}}, false));
    f.close();
    FileProcessor proc;
    t.check(proc.processSearchResults(stored).size() == 2,
            "stored entries are read");

    QByteArray out;
    QString err;
    t.check(!FileProcessor::extractSingleEntry(
                makeZip({{"a.txt", "a"}, {"b.txt", "b"}}, false), out, err),
            "archives with two entries are rejected");
    t.check(!FileProcessor::extractSingleEntry("garbage", out, err),
            "garbage is rejected");

    QByteArray corrupt = makeZip({{"a.txt", kListing}}, false);
    corrupt[40] = static_cast<char>(corrupt[40] ^ 0x55);
    t.check(!FileProcessor::extractSingleEntry(corrupt, out, err),
            "CRC mismatch is rejected");

    t.check(proc.processSearchResults(QDir(dir.path()).filePath("none.zip"))
                .isEmpty(),
            "missing archive yields no results");
}

// Rewrites the uncompressed size in both headers of a one-entry archive.
QByteArray withClaimedSize(QByteArray zip, quint32 size) {
    const auto le32At = [&zip](int at) {
        const auto *p = reinterpret_cast<const unsigned char *>(zip.constData());
        return static_cast<quint32>(p[at]) |
               (static_cast<quint32>(p[at + 1]) << 8) |
               (static_cast<quint32>(p[at + 2]) << 16) |
               (static_cast<quint32>(p[at + 3]) << 24);
    };
    const auto put = [&zip](int at, quint32 v) {
        for (int i = 0; i < 4; ++i)
            zip[at + i] = static_cast<char>((v >> (8 * i)) & 0xFF);
    };
    const int cd = static_cast<int>(le32At(static_cast<int>(zip.size()) - 6));
    put(22, size);
    put(cd + 24, size);
    return zip;
}

void test_zip_declared_size_is_bounded(TestContext &t) {
    const QByteArray good = makeZip({{"r.txt", kListing}}, true);
    QByteArray out;
    QString err;
    t.check(FileProcessor::extractSingleEntry(good, out, err) &&
                out == QByteArray(kListing),
            "deflated entry is extracted");

    t.check(!FileProcessor::extractSingleEntry(
                withClaimedSize(good, 0x80000000u), out, err),
            "entry claiming 2 GiB is rejected");
    t.check(!FileProcessor::extractSingleEntry(
                withClaimedSize(good, 0x7FFFFFF0u), out, err),
            "entry just under 2 GiB is rejected");
    const quint32 real = static_cast<quint32>(qstrlen(kListing));
    t.check(!FileProcessor::extractSingleEntry(
                withClaimedSize(good, real - 10), out, err),
            "entry inflating past its declared size is rejected");
    t.check(!FileProcessor::extractSingleEntry(
                withClaimedSize(good, real + 10), out, err),
            "entry inflating short of its declared size is rejected");

    QTemporaryDir dir;
    const QString path = QDir(dir.path()).filePath("huge.txt.zip");
    QFile f(path);
    t.check(f.open(QIODevice::WriteOnly), "test archive can be written");
    f.write(withClaimedSize(good, 0x80000000u));
    f.close();
    t.check(FileProcessor().processSearchResults(path).isEmpty(),
            "oversized archive yields no results");
}

// --------------------------------------------------------------- config

void test_config_layers(TestContext &t) {
    QTemporaryDir dir;
    const QString ini = QDir(dir.path()).filePath("bookfetch.ini");
    {
        QSettings s(ini, QSettings::IniFormat);
        s.setValue("irc/server", "irc.stored.test");
        s.setValue("irc/port", 6697);
        s.setValue("irc/channel", "#stored");
        s.setValue("app/connectionWaitSeconds", "nonsense");
        s.sync();
    }
    qunsetenv("BOOKFETCH_SERVER");
    qunsetenv("BOOKFETCH_PORT");
    qunsetenv("BOOKFETCH_CONNECT_WAIT");
    qunsetenv("BOOKFETCH_NICK");
    {
        QSettings s(ini, QSettings::IniFormat);
        const AppConfig c = AppConfig::load(s);
        t.check(c.server == "irc.stored.test", "settings override defaults");
        t.check(c.port == 6697, "stored port is used");
        t.check(c.channel == "#stored", "stored channel is used");
        t.check(c.connectionWaitSeconds == 10, "invalid stored value ignored");
        t.check(c.nick.startsWith("fetcher") && c.nick.size() == 11,
                "default nick is fetcherNNNN");
    }

    qputenv("BOOKFETCH_SERVER", " irc.env.test ");
    qputenv("BOOKFETCH_PORT", "7000");
    qputenv("BOOKFETCH_CONNECT_WAIT", "abc");
    {
        QSettings s(ini, QSettings::IniFormat);
        const AppConfig c = AppConfig::load(s);
        t.check(c.server == "irc.env.test", "environment wins and is trimmed");
        t.check(c.port == 7000, "environment port wins");
        t.check(c.connectionWaitSeconds == 10, "invalid env value ignored");
        const bookfetch::SessionOptions opt = c.sessionOptions();
        t.check(opt.server == "irc.env.test" && opt.port == 7000 &&
                    opt.channel == "#stored",
                "session options follow the config");
    }
    qputenv("BOOKFETCH_PORT", "99999");
    {
        QSettings s(ini, QSettings::IniFormat);
        t.check(AppConfig::load(s).port == 6697,
                "out-of-range env port is ignored");
    }
    qunsetenv("BOOKFETCH_SERVER");
    qunsetenv("BOOKFETCH_PORT");
    qunsetenv("BOOKFETCH_CONNECT_WAIT");

    AppConfig c = AppConfig::defaults();
    c.workingDirectory = QDir(dir.path()).filePath("books/nested");
    QString err;
    t.check(c.ensureWorkingDirectory(err), "working directory is created");
    t.check(QDir(c.workingDirectory).exists(), "directory exists afterwards");
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_queue_add_and_commands(t);
    test_queue_peek_and_complete(t);
    test_queue_edits_protect_head(t);
    test_queue_callbacks(t);
    test_client_connect(t);
    test_client_connect_times_out_without_join(t);
    test_client_rejects_bad_channel(t);
    test_book_download(t);
    test_short_transfer_still_completes(t);
    test_unknown_size_progress(t);
    test_search_no_results(t);
    test_search_results_file(t);
    test_cancel_mid_transfer(t);
    test_cancel_search(t);
    test_malformed_dcc_send(t);
    test_file_open_failure(t);
    test_dcc_connect_failure(t);
    test_second_offer_refused(t);
    test_offer_for_other_nick_ignored(t);
    test_unsolicited_offer_is_refused(t);
    test_new_offer_replaces_cancelled_transfer(t);
    test_late_offer_after_cancel_is_not_credited(t);
    test_disconnect_during_transfer(t);
    test_process_queue_requires_connection(t);
    test_ison(t);
    test_quit_command(t);
    test_disconnect_fails_pending_search(t);
    test_queue_processor_drains(t);
    test_parse_result_line(t);
    test_parse_results_filters_types(t);
    test_zip_extraction(t);
    test_zip_declared_size_is_bounded(t);
    test_config_layers(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] bookfetch_client_tests\n";
    return EXIT_SUCCESS;
}

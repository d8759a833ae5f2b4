// Socket backend: TCP connection to the IRC server, line parsing and event
// dispatch, plus the raw byte stream used by DCC SEND.
#include "bookfetch/SocketIrcTransport.hpp"
#include "bookfetch/IrcProtocol.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace bookfetch {

static constexpr int kPollIntervalMs = 200;
static constexpr int kConnectTimeoutMs = 15000;
static constexpr std::size_t kMaxLineBuffer = 64 * 1024;
static constexpr std::size_t kDccChunk = 64 * 1024;

// Write the whole buffer, retrying on EINTR and short writes.
static bool sendAll(int fd, const char* data, std::size_t len,
                    std::string& err) {
    std::size_t off = 0;
    while (off < len) {
        const ssize_t n = ::send(fd, data + off, len - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            err = std::string("send: ") + std::strerror(errno);
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

// CR/LF inside a parameter would start a new IRC command.
static std::string flattenLine(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        if (c == '\r' || c == '\n') c = ' ';
    }
    return out;
}

SocketIrcTransport::SocketIrcTransport() = default;

SocketIrcTransport::~SocketIrcTransport() {
    disconnect();
    if (worker_.joinable()) worker_.join();
}

bool SocketIrcTransport::tcpConnect(const std::string& host,
                                    std::uint16_t port, int& fd,
                                    std::string& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = ::getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    std::string lastErr = "Could not connect to " + host + ":" + portStr;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        // Non-blocking connect bounded by kConnectTimeoutMs, then back to
        // blocking mode for the poll loop.
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            pollfd pfd{s, POLLOUT, 0};
            rc = ::poll(&pfd, 1, kConnectTimeoutMs);
            if (rc == 1) {
                int soErr = 0;
                socklen_t len = sizeof(soErr);
                ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len);
                rc = soErr == 0 ? 0 : -1;
                if (soErr != 0) lastErr = std::string("connect: ") + std::strerror(soErr);
            } else {
                lastErr = "connect: timed out";
                rc = -1;
            }
        } else if (rc != 0) {
            lastErr = std::string("connect: ") + std::strerror(errno);
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, flags);
            fd = s;
            ::freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    ::freeaddrinfo(res);
    err = lastErr;
    return false;
}

bool SocketIrcTransport::connect(const SessionOptions& opt,
                                 IrcEventHandler* handler, std::string& err) {
    if (connected_.load() || worker_.joinable()) {
        err = "Already connected";
        return false;
    }
    if (opt.server.empty() || opt.nick.empty()) {
        err = "Server and nick are required";
        return false;
    }
    int fd = -1;
    if (!tcpConnect(opt.server, opt.port, fd, err)) return false;

    sock_ = fd;
    opt_ = opt;
    handler_ = handler;
    stop_ = false;
    welcomed_ = false;
    inbuf_.clear();
    {
        std::lock_guard<std::mutex> lk(reasonMutex_);
        closeReason_.clear();
    }

    const std::string user = opt.username.empty() ? opt.nick : opt.username;
    if ((opt.password && !sendLine("PASS " + *opt.password, err)) ||
        !sendLine("NICK " + opt.nick, err) ||
        !sendLine("USER " + user + " 0 * :" + opt.realname, err)) {
        ::close(sock_);
        sock_ = -1;
        return false;
    }

    connected_ = true;
    worker_ = std::thread([this] { run(); });
    return true;
}

void SocketIrcTransport::disconnect() {
    if (!worker_.joinable()) return;
    if (connected_.load() && !stop_.load()) {
        std::string err;
        if (sendLine("QUIT :Bye", err))
            setCloseReason("Client quit");
        else
            setCloseReason("Client quit (" + err + ")");
    }
    stop_ = true;
    {
        std::lock_guard<std::mutex> lk(sendMutex_);
        if (sock_ >= 0) ::shutdown(sock_, SHUT_RDWR);
    }
    // From inside a handler the loop exits after the callback returns; the
    // thread is joined by the destructor.
    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
}

bool SocketIrcTransport::sendLine(const std::string& line, std::string& err) {
    std::lock_guard<std::mutex> lk(sendMutex_);
    if (sock_ < 0) {
        err = "Not connected";
        return false;
    }
    const std::string wire = flattenLine(line) + "\r\n";
    return sendAll(sock_, wire.data(), wire.size(), err);
}

bool SocketIrcTransport::joinChannel(const std::string& channel,
                                     std::string& err) {
    if (!isChannelName(channel)) {
        err = "Invalid channel name: " + channel;
        return false;
    }
    return sendLine("JOIN " + channel, err);
}

bool SocketIrcTransport::sendPrivateMessage(const std::string& to,
                                            const std::string& text,
                                            std::string& err) {
    return sendLine("PRIVMSG " + to + " :" + text, err);
}

bool SocketIrcTransport::sendChannelMessage(const std::string& text,
                                            std::string& err) {
    if (opt_.channel.empty()) {
        err = "No channel configured";
        return false;
    }
    return sendPrivateMessage(opt_.channel, text, err);
}

bool SocketIrcTransport::ison(const std::vector<std::string>& nicks,
                              std::string& err) {
    if (nicks.empty()) return true;
    std::string line = "ISON";
    for (const auto& n : nicks) line += " " + n;
    return sendLine(line, err);
}

bool SocketIrcTransport::openDccStream(const std::string& address,
                                       std::uint16_t port, std::string& err) {
    {
        std::lock_guard<std::mutex> lk(dccMutex_);
        if (dccSock_ >= 0) {
            err = "A DCC stream is already open";
            return false;
        }
    }
    int fd = -1;
    if (!tcpConnect(address, port, fd, err)) return false;
    std::lock_guard<std::mutex> lk(dccMutex_);
    dccSock_ = fd;
    return true;
}

bool SocketIrcTransport::sendDccBytes(const void* data, std::size_t len,
                                      std::string& err) {
    std::lock_guard<std::mutex> lk(dccMutex_);
    if (dccSock_ < 0) {
        err = "No DCC stream";
        return false;
    }
    return sendAll(dccSock_, static_cast<const char*>(data), len, err);
}

void SocketIrcTransport::closeDccStream() {
    std::lock_guard<std::mutex> lk(dccMutex_);
    if (dccSock_ >= 0) {
        ::close(dccSock_);
        dccSock_ = -1;
    }
}

// First reason wins; later ones are consequences of it.
void SocketIrcTransport::setCloseReason(const std::string& reason) {
    std::lock_guard<std::mutex> lk(reasonMutex_);
    if (closeReason_.empty()) closeReason_ = reason;
}

std::string SocketIrcTransport::closeReason() {
    std::lock_guard<std::mutex> lk(reasonMutex_);
    return closeReason_;
}

void SocketIrcTransport::run() {
    while (!stop_.load()) {
        pollfd fds[2];
        nfds_t nfds = 1;
        fds[0] = pollfd{sock_, POLLIN, 0};
        int dfd = -1;
        {
            std::lock_guard<std::mutex> lk(dccMutex_);
            dfd = dccSock_;
        }
        if (dfd >= 0) {
            fds[1] = pollfd{dfd, POLLIN, 0};
            nfds = 2;
        }
        const int rc = ::poll(fds, nfds, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            setCloseReason(std::string("poll: ") + std::strerror(errno));
            break;
        }
        if (rc == 0) continue;
        if (nfds == 2 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)))
            readDcc(dfd);
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
            if (!readIrc()) break;
        }
    }

    connected_ = false;
    bool dccWasOpen = false;
    {
        std::lock_guard<std::mutex> lk(dccMutex_);
        if (dccSock_ >= 0) {
            ::close(dccSock_);
            dccSock_ = -1;
            dccWasOpen = true;
        }
    }
    {
        std::lock_guard<std::mutex> lk(sendMutex_);
        ::close(sock_);
        sock_ = -1;
    }
    if (handler_) {
        if (dccWasOpen) handler_->onDccDisconnect();
        const std::string reason = closeReason();
        handler_->onDisconnect(reason.empty() ? "Connection closed" : reason);
    }
}

bool SocketIrcTransport::readIrc() {
    char buf[4096];
    const ssize_t n = ::recv(sock_, buf, sizeof(buf), 0);
    if (n == 0) {
        setCloseReason("Server closed the connection");
        return false;
    }
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return true;
        setCloseReason(std::string("recv: ") + std::strerror(errno));
        return false;
    }
    inbuf_.append(buf, static_cast<std::size_t>(n));

    std::size_t start = 0;
    for (;;) {
        const std::size_t nl = inbuf_.find('\n', start);
        if (nl == std::string::npos) break;
        std::string line = inbuf_.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        start = nl + 1;
        if (!line.empty()) handleLine(line);
        if (stop_.load()) return false;
    }
    inbuf_.erase(0, start);
    if (inbuf_.size() > kMaxLineBuffer) inbuf_.clear();
    return true;
}

void SocketIrcTransport::handleLine(const std::string& line) {
    IrcMessage msg;
    if (!parseIrcLine(line, msg)) return;
    const std::string& cmd = msg.command;
    const auto& p = msg.params;
    const std::string from = nickFromPrefix(msg.prefix);

    if (cmd == "PING") {
        std::string err;
        if (!sendLine("PONG :" + (p.empty() ? opt_.server : p.back()), err)) {
            setCloseReason(err);
            stop_ = true;
        }
        return;
    }
    if (!handler_) return;

    if (cmd == "001") {
        welcomed_ = true;
        handler_->onWelcome();
    } else if (cmd == "JOIN" && !p.empty()) {
        handler_->onJoin(from, p[0]);
    } else if (cmd == "PRIVMSG" && p.size() >= 2) {
        const std::string& target = p[0];
        const std::string& text = p[1];
        std::string payload;
        if (extractCtcp(text, payload)) {
            handler_->onCtcp(target, from, payload);
        } else if (isChannelName(target)) {
            handler_->onPublicMessage(from, target, text);
        } else {
            handler_->onPrivateMessage(from, text);
        }
    } else if (cmd == "NOTICE" && p.size() >= 2) {
        std::string ctcpReply;
        if (!isChannelName(p[0]) && !extractCtcp(p[1], ctcpReply))
            handler_->onPrivateNotice(p[0], from, p[1]);
    } else if (cmd == "303") {
        std::vector<std::string> online;
        if (!p.empty()) {
            const std::string& list = p.back();
            std::size_t pos = 0;
            while (pos < list.size()) {
                const std::size_t sp = list.find(' ', pos);
                const std::string nick = list.substr(
                    pos, sp == std::string::npos ? std::string::npos : sp - pos);
                if (!nick.empty()) online.push_back(nick);
                if (sp == std::string::npos) break;
                pos = sp + 1;
            }
        }
        handler_->onIsonReply(online);
    } else if (cmd == "433" && !welcomed_) {
        setCloseReason("Nickname is already in use: " + opt_.nick);
        stop_ = true;
    } else if (cmd == "ERROR") {
        setCloseReason(p.empty() ? "Server error" : p.back());
        stop_ = true;
    }
}

void SocketIrcTransport::readDcc(int fd) {
    std::vector<char> buf(kDccChunk);
    const ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
    if (n > 0) {
        if (handler_) handler_->onDccData(buf.data(), static_cast<std::size_t>(n));
        return;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return;

    bool notify = false;
    {
        std::lock_guard<std::mutex> lk(dccMutex_);
        // The handler may already have closed or replaced the stream
        if (dccSock_ == fd) {
            ::close(dccSock_);
            dccSock_ = -1;
            notify = true;
        }
    }
    if (notify && handler_) handler_->onDccDisconnect();
}

} // namespace bookfetch

#include "bookfetch/MockIrcTransport.hpp"

namespace bookfetch {

bool MockIrcTransport::connect(const SessionOptions& opt,
                               IrcEventHandler* handler, std::string& err) {
  if (opt.server.empty() || opt.nick.empty()) {
    err = "Server and nick are required";
    return false;
  }
  {
    std::lock_guard<std::mutex> lk(mtx_);
    connected_ = true;
    opt_ = opt;
    handler_ = handler;
    lines_.push_back("NICK " + opt.nick);
  }
  if (handler) handler->onWelcome();
  return true;
}

void MockIrcTransport::disconnect() {
  IrcEventHandler* h = nullptr;
  bool dccWasOpen = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!connected_) return;
    connected_ = false;
    dccWasOpen = dccOpen_;
    dccOpen_ = false;
    lines_.push_back("QUIT");
    h = handler_;
  }
  // Same order as the socket transport: the stream goes before the session
  if (h) {
    if (dccWasOpen) h->onDccDisconnect();
    h->onDisconnect("Client quit");
  }
}

bool MockIrcTransport::isConnected() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return connected_;
}

bool MockIrcTransport::joinChannel(const std::string& channel,
                                   std::string& err) {
  IrcEventHandler* h = nullptr;
  std::string nick;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!connected_) {
      err = "Not connected";
      return false;
    }
    lines_.push_back("JOIN " + channel);
    if (autoJoin_) {
      h = handler_;
      nick = opt_.nick;
    }
  }
  if (h) h->onJoin(nick, channel);
  return true;
}

bool MockIrcTransport::sendPrivateMessage(const std::string& to,
                                          const std::string& text,
                                          std::string& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  lines_.push_back("PRIVMSG " + to + " :" + text);
  return true;
}

bool MockIrcTransport::sendChannelMessage(const std::string& text,
                                          std::string& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  lines_.push_back("PRIVMSG " + opt_.channel + " :" + text);
  channelMessages_.push_back(text);
  return true;
}

bool MockIrcTransport::ison(const std::vector<std::string>& nicks,
                            std::string& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  std::string line = "ISON";
  for (const auto& n : nicks) line += " " + n;
  lines_.push_back(line);
  return true;
}

bool MockIrcTransport::openDccStream(const std::string& address,
                                     std::uint16_t port, std::string& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (failDccOpen_) {
    err = "Connection refused by mock";
    return false;
  }
  if (dccOpen_) {
    err = "A DCC stream is already open";
    return false;
  }
  dccOpen_ = true;
  dccPeer_ = address + ":" + std::to_string(port);
  return true;
}

bool MockIrcTransport::sendDccBytes(const void* data, std::size_t len,
                                    std::string& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!dccOpen_) {
    err = "No DCC stream";
    return false;
  }
  const auto* p = static_cast<const unsigned char*>(data);
  dccWrites_.emplace_back(p, p + len);
  return true;
}

void MockIrcTransport::closeDccStream() {
  std::lock_guard<std::mutex> lk(mtx_);
  dccOpen_ = false;
}

void MockIrcTransport::setAutoJoin(bool on) {
  std::lock_guard<std::mutex> lk(mtx_);
  autoJoin_ = on;
}

void MockIrcTransport::setFailDccOpen(bool on) {
  std::lock_guard<std::mutex> lk(mtx_);
  failDccOpen_ = on;
}

IrcEventHandler* MockIrcTransport::handler() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return handler_;
}

std::vector<std::string> MockIrcTransport::sentLines() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return lines_;
}

std::vector<std::string> MockIrcTransport::channelMessages() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return channelMessages_;
}

std::vector<std::vector<unsigned char>> MockIrcTransport::dccWrites() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return dccWrites_;
}

bool MockIrcTransport::dccOpen() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return dccOpen_;
}

std::string MockIrcTransport::dccPeer() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return dccPeer_;
}

void MockIrcTransport::deliverDccData(const std::string& bytes) {
  IrcEventHandler* h = nullptr;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!dccOpen_) return;
    h = handler_;
  }
  if (h) h->onDccData(bytes.data(), bytes.size());
}

void MockIrcTransport::deliverDccDisconnect() {
  IrcEventHandler* h = nullptr;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!dccOpen_) return;
    dccOpen_ = false;
    h = handler_;
  }
  if (h) h->onDccDisconnect();
}

} // namespace bookfetch

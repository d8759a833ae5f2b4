#pragma once
#include "IrcTransport.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace bookfetch {

// IRC over a plain TCP socket. connect() registers with the server and starts
// a dispatch thread that polls the IRC socket and the DCC socket, parses lines
// and invokes the handler. Outbound calls are safe from any thread, including
// from inside handler callbacks.
class SocketIrcTransport : public IrcTransport {
public:
  SocketIrcTransport();
  ~SocketIrcTransport() override;

  bool connect(const SessionOptions& opt, IrcEventHandler* handler,
               std::string& err) override;
  void disconnect() override;
  bool isConnected() const override { return connected_.load(); }

  bool joinChannel(const std::string& channel, std::string& err) override;
  bool sendPrivateMessage(const std::string& to, const std::string& text,
                          std::string& err) override;
  bool sendChannelMessage(const std::string& text, std::string& err) override;
  bool ison(const std::vector<std::string>& nicks, std::string& err) override;

  bool openDccStream(const std::string& address, std::uint16_t port,
                     std::string& err) override;
  bool sendDccBytes(const void* data, std::size_t len,
                    std::string& err) override;
  void closeDccStream() override;

private:
  std::atomic<bool> connected_{false};
  std::atomic<bool> stop_{false};
  int sock_ = -1;
  int dccSock_ = -1; // guarded by dccMutex_
  SessionOptions opt_{};
  IrcEventHandler* handler_ = nullptr;
  std::thread worker_;
  std::mutex sendMutex_;  // serializes writes on sock_
  std::mutex dccMutex_;   // protects dccSock_ and writes on it
  std::mutex reasonMutex_;
  std::string closeReason_;

  // Dispatch thread state
  std::string inbuf_;
  bool welcomed_ = false;

  bool tcpConnect(const std::string& host, std::uint16_t port, int& fd,
                  std::string& err);
  bool sendLine(const std::string& line, std::string& err);
  void setCloseReason(const std::string& reason);
  std::string closeReason();
  void run();
  bool readIrc();
  void handleLine(const std::string& line);
  void readDcc(int fd);
};

} // namespace bookfetch

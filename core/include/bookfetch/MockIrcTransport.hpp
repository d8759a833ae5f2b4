#pragma once
#include "IrcTransport.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace bookfetch {

// In-memory transport: records every outbound command and lets callers inject
// events as if they came off the wire. Events are delivered synchronously on
// the calling thread.
class MockIrcTransport : public IrcTransport {
public:
  bool connect(const SessionOptions& opt, IrcEventHandler* handler,
               std::string& err) override;
  void disconnect() override;
  bool isConnected() const override;

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

  // Behaviour switches
  void setAutoJoin(bool on);      // answer JOIN with onJoin (default true)
  void setFailDccOpen(bool on);   // make openDccStream fail

  // Inspection
  IrcEventHandler* handler() const;
  std::vector<std::string> sentLines() const;       // raw IRC lines
  std::vector<std::string> channelMessages() const; // texts sent to channel
  std::vector<std::vector<unsigned char>> dccWrites() const;
  bool dccOpen() const;
  std::string dccPeer() const;                      // "address:port"

  // Injection
  void deliverDccData(const std::string& bytes);
  void deliverDccDisconnect();

private:
  mutable std::mutex mtx_;
  bool connected_ = false;
  bool autoJoin_ = true;
  bool failDccOpen_ = false;
  bool dccOpen_ = false;
  std::string dccPeer_;
  SessionOptions opt_{};
  IrcEventHandler* handler_ = nullptr;

  std::vector<std::string> lines_;
  std::vector<std::string> channelMessages_;
  std::vector<std::vector<unsigned char>> dccWrites_;
};

} // namespace bookfetch

// Abstract interface for the IRC connection. Concrete implementations (socket
// based, mock) must honour this API so the client stays decoupled from the
// wire.
#pragma once
#include "IrcTypes.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace bookfetch {

class IrcTransport {
public:
    virtual ~IrcTransport() = default;

    // Connect, register and start dispatching events to handler. The handler
    // is not owned and must outlive the connection.
    virtual bool connect(const SessionOptions& opt,
                         IrcEventHandler* handler,
                         std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    virtual bool joinChannel(const std::string& channel, std::string& err) = 0;
    virtual bool sendPrivateMessage(const std::string& to,
                                    const std::string& text,
                                    std::string& err) = 0;
    // PRIVMSG to the channel given in SessionOptions
    virtual bool sendChannelMessage(const std::string& text,
                                    std::string& err) = 0;
    virtual bool ison(const std::vector<std::string>& nicks,
                      std::string& err) = 0;

    // Raw byte stream for a DCC SEND. Only one stream can be open at a time.
    virtual bool openDccStream(const std::string& address,
                               std::uint16_t port,
                               std::string& err) = 0;
    virtual bool sendDccBytes(const void* data, std::size_t len,
                              std::string& err) = 0;
    virtual void closeDccStream() = 0;
};

} // namespace bookfetch

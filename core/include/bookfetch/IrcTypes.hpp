// Basic types shared between the Qt layer and the core for IRC sessions and
// DCC offers. Kept free of Qt so the transport can be tested on its own.
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bookfetch {

struct SessionOptions {
    std::string server;
    std::uint16_t port = 6667;
    std::string nick;
    std::string username; // empty: same as nick
    std::string realname = "BookFetch";
    std::optional<std::string> password; // server PASS, rarely needed

    // Channel used by sendChannelMessage().
    std::string channel;
};

// A parsed "DCC SEND" CTCP request.
struct DccSendOffer {
    std::string   filename;  // as announced by the peer, quotes stripped
    std::string   address;   // dotted quad
    std::uint16_t port = 0;
    std::uint64_t size = 0;  // 0 when the peer omits it or lies
};

// Receives already-parsed events from an IrcTransport. All calls arrive on the
// transport's dispatch thread, in wire order.
class IrcEventHandler {
public:
    virtual ~IrcEventHandler() = default;

    virtual void onWelcome() = 0;
    virtual void onJoin(const std::string& nick, const std::string& channel) = 0;
    virtual void onPrivateMessage(const std::string& from,
                                  const std::string& text) = 0;
    virtual void onPublicMessage(const std::string& from,
                                 const std::string& channel,
                                 const std::string& text) = 0;
    virtual void onPrivateNotice(const std::string& target,
                                 const std::string& from,
                                 const std::string& text) = 0;
    // payload is the CTCP body without the \x01 delimiters
    virtual void onCtcp(const std::string& target,
                        const std::string& from,
                        const std::string& payload) = 0;
    virtual void onIsonReply(const std::vector<std::string>& online) = 0;

    // DCC side channel
    virtual void onDccData(const char* data, std::size_t len) = 0;
    virtual void onDccDisconnect() = 0;

    virtual void onDisconnect(const std::string& reason) = 0;
};

} // namespace bookfetch

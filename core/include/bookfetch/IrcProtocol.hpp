// Stateless helpers for the IRC line format, CTCP and the DCC SEND handshake.
#pragma once
#include "IrcTypes.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace bookfetch {

// One IRC protocol line: ":prefix COMMAND param param :trailing".
// The trailing parameter, if any, is the last element of params.
struct IrcMessage {
    std::string prefix;
    std::string command;
    std::vector<std::string> params;
};

// Parses a line without its CR/LF terminator. Returns false on an empty line
// or a line that has a prefix but no command.
bool parseIrcLine(const std::string& line, IrcMessage& out);

// "nick!user@host" -> "nick"
std::string nickFromPrefix(const std::string& prefix);

// RFC 2812 channel name: starts with one of "#&+!", no spaces, commas or
// BEL, at most 200 characters.
bool isChannelName(const std::string& name);

// If text is a CTCP message (\x01...\x01) stores its body in payload.
bool extractCtcp(const std::string& text, std::string& payload);

// Whitespace split that keeps double-quoted segments together. Quotes are
// kept in the resulting tokens.
std::vector<std::string> splitCtcpArgs(const std::string& payload);

// Converts the 32-bit decimal address used by DCC into a dotted quad.
// Dotted IPv4 and IPv6 literals are passed through unchanged.
bool ipNumberToQuad(const std::string& packed, std::string& out);

// Reduces a peer supplied name to a plain base name safe to create in the
// working directory.
std::string sanitizeFileName(const std::string& name);

// Parses `SEND "<file>" <ip> <port> <size>`. An unquoted name containing
// spaces is rejoined from the tokens before the last three.
bool parseDccSend(const std::string& payload, DccSendOffer& out,
                  std::string& err);

// Acknowledgement for DCC SEND: total bytes received so far as a 32-bit
// big-endian unsigned integer (wraps for files over 4 GiB).
std::array<unsigned char, 4> encodeDccAck(std::uint64_t received);

} // namespace bookfetch

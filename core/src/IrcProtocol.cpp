#include "bookfetch/IrcProtocol.hpp"

#include <cctype>
#include <cstdio>

namespace bookfetch {

static bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Decimal string to integer, false on overflow past max.
static bool parseUnsigned(const std::string& s, std::uint64_t max,
                          std::uint64_t& out) {
    if (!allDigits(s) || s.size() > 20) return false;
    std::uint64_t v = 0;
    for (char c : s) {
        const std::uint64_t d = static_cast<std::uint64_t>(c - '0');
        if (v > (max - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

bool parseIrcLine(const std::string& line, IrcMessage& out) {
    out = IrcMessage{};
    std::size_t pos = 0;
    const std::size_t n = line.size();
    if (n == 0) return false;

    if (line[0] == ':') {
        const std::size_t sp = line.find(' ');
        if (sp == std::string::npos) return false;
        out.prefix = line.substr(1, sp - 1);
        pos = sp + 1;
    }
    while (pos < n && line[pos] == ' ') ++pos;

    const std::size_t cmdEnd = line.find(' ', pos);
    out.command = line.substr(pos, cmdEnd == std::string::npos ? std::string::npos
                                                               : cmdEnd - pos);
    if (out.command.empty()) return false;
    for (char& c : out.command)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (cmdEnd == std::string::npos) return true;
    pos = cmdEnd;

    while (pos < n) {
        while (pos < n && line[pos] == ' ') ++pos;
        if (pos >= n) break;
        if (line[pos] == ':') {
            out.params.push_back(line.substr(pos + 1));
            break;
        }
        const std::size_t end = line.find(' ', pos);
        if (end == std::string::npos) {
            out.params.push_back(line.substr(pos));
            break;
        }
        out.params.push_back(line.substr(pos, end - pos));
        pos = end;
    }
    return true;
}

std::string nickFromPrefix(const std::string& prefix) {
    const std::size_t bang = prefix.find('!');
    return bang == std::string::npos ? prefix : prefix.substr(0, bang);
}

bool isChannelName(const std::string& name) {
    if (name.empty() || name.size() > 200) return false;
    const char first = name[0];
    if (first != '#' && first != '&' && first != '+' && first != '!')
        return false;
    for (char c : name) {
        if (c == ' ' || c == ',' || c == '\x07' || c == '\r' || c == '\n')
            return false;
    }
    return true;
}

bool extractCtcp(const std::string& text, std::string& payload) {
    if (text.size() < 2 || text.front() != '\x01') return false;
    payload = text.substr(1);
    // Some clients drop the closing delimiter
    if (!payload.empty() && payload.back() == '\x01') payload.pop_back();
    return true;
}

std::vector<std::string> splitCtcpArgs(const std::string& payload) {
    std::vector<std::string> out;
    std::string cur;
    bool inQuote = false;
    bool haveToken = false;
    for (char c : payload) {
        if (c == '"') {
            inQuote = !inQuote;
            cur.push_back(c);
            haveToken = true;
            continue;
        }
        if (!inQuote && std::isspace(static_cast<unsigned char>(c))) {
            if (haveToken) {
                out.push_back(cur);
                cur.clear();
                haveToken = false;
            }
            continue;
        }
        cur.push_back(c);
        haveToken = true;
    }
    if (haveToken) out.push_back(cur);
    return out;
}

bool ipNumberToQuad(const std::string& packed, std::string& out) {
    if (packed.empty()) return false;
    if (packed.find('.') != std::string::npos ||
        packed.find(':') != std::string::npos) {
        out = packed;
        return true;
    }
    std::uint64_t v = 0;
    if (!parseUnsigned(packed, 0xFFFFFFFFull, v)) return false;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u",
                  static_cast<unsigned>((v >> 24) & 0xFF),
                  static_cast<unsigned>((v >> 16) & 0xFF),
                  static_cast<unsigned>((v >> 8) & 0xFF),
                  static_cast<unsigned>(v & 0xFF));
    out = buf;
    return true;
}

std::string sanitizeFileName(const std::string& name) {
    static const char* kFallback = "download.bin";
    const std::size_t sep = name.find_last_of("/\\");
    std::string base = (sep == std::string::npos) ? name : name.substr(sep + 1);

    std::size_t start = 0;
    while (start < base.size() &&
           std::isspace(static_cast<unsigned char>(base[start])))
        ++start;
    std::size_t end = base.size();
    while (end > start && std::isspace(static_cast<unsigned char>(base[end - 1])))
        --end;
    base = base.substr(start, end - start);

    for (char& c : base) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20u || u == 0x7Fu) c = '_';
    }
    if (base.empty() || base == "." || base == "..") return kFallback;
    return base;
}

bool parseDccSend(const std::string& payload, DccSendOffer& out,
                  std::string& err) {
    const std::vector<std::string> parts = splitCtcpArgs(payload);
    if (parts.size() < 5) {
        err = "Invalid DCC SEND format: " + payload;
        return false;
    }
    if (parts[0] != "SEND") {
        err = "Not a DCC SEND request: " + parts[0];
        return false;
    }

    const std::size_t n = parts.size();
    std::string filename = parts[1];
    for (std::size_t i = 2; i + 3 < n; ++i) filename += " " + parts[i];
    if (filename.size() >= 2 && filename.front() == '"' &&
        filename.back() == '"') {
        filename = filename.substr(1, filename.size() - 2);
    }
    if (filename.empty()) {
        err = "DCC SEND without a file name";
        return false;
    }

    std::string address;
    if (!ipNumberToQuad(parts[n - 3], address)) {
        err = "Invalid DCC peer address: " + parts[n - 3];
        return false;
    }
    std::uint64_t port = 0;
    if (!parseUnsigned(parts[n - 2], 65535, port) || port == 0) {
        // port 0 means passive DCC, which needs a listening socket on our side
        err = "Invalid or passive DCC port: " + parts[n - 2];
        return false;
    }
    std::uint64_t size = 0;
    if (!parseUnsigned(parts[n - 1], ~0ull, size)) size = 0;

    out.filename = filename;
    out.address = address;
    out.port = static_cast<std::uint16_t>(port);
    out.size = size;
    return true;
}

std::array<unsigned char, 4> encodeDccAck(std::uint64_t received) {
    const std::uint32_t v = static_cast<std::uint32_t>(received & 0xFFFFFFFFull);
    return {static_cast<unsigned char>((v >> 24) & 0xFF),
            static_cast<unsigned char>((v >> 16) & 0xFF),
            static_cast<unsigned char>((v >> 8) & 0xFF),
            static_cast<unsigned char>(v & 0xFF)};
}

} // namespace bookfetch

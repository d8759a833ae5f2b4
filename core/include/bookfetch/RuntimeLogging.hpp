// Runtime environment helpers for configuration overrides and diagnostics.
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace bookfetch {

// Value of an environment variable with surrounding whitespace removed.
inline std::string trimmedEnv(const char *name) {
    if (!name)
        return {};
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    std::string out(raw);
    std::size_t start = 0;
    while (start < out.size() &&
           std::isspace(static_cast<unsigned char>(out[start]))) {
        ++start;
    }
    std::size_t end = out.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(out[end - 1]))) {
        --end;
    }
    return out.substr(start, end - start);
}

inline std::string normalizedEnv(const char *name) {
    std::string out = trimmedEnv(name);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool debugLoggingEnabled() {
    return envFlagEnabled("BOOKFETCH_DEBUG");
}

} // namespace bookfetch

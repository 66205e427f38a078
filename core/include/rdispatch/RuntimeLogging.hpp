// Runtime policy helpers for diagnostics/sensitive logging, plus the log
// callback the core reports through.
#pragma once

#include <cctype>
#include <cstdlib>
#include <functional>
#include <string>

namespace rdispatch {

enum class LogLevel { Debug, Info, Warning, Error };

// Core code never writes to a logging backend directly; the front end
// installs one of these.
using LogCB = std::function<void(LogLevel, const std::string&)>;

inline void emitLog(const LogCB& log, LogLevel level, const std::string& msg) {
    if (log)
        log(level, msg);
}

inline std::string normalizedEnv(const char *name) {
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
    out = out.substr(start, end - start);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("RDISPATCH_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Command output and credentials only reach the log in a dev environment
// with RDISPATCH_LOG_SENSITIVE set.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("RDISPATCH_LOG_SENSITIVE");
}

} // namespace rdispatch

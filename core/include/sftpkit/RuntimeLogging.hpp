// Logging categories and runtime policy helpers for diagnostics/sensitive
// logging.
#pragma once

#include <QLoggingCategory>

#include <cctype>
#include <cstdlib>
#include <string>

Q_DECLARE_LOGGING_CATEGORY(sftpkitPool)
Q_DECLARE_LOGGING_CATEGORY(sftpkitTransfer)
Q_DECLARE_LOGGING_CATEGORY(sftpkitSsh)
// Used when a Context carries no category; every level is disabled.
Q_DECLARE_LOGGING_CATEGORY(sftpkitSilent)

namespace sftpkit {

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
    const std::string env = normalizedEnv("SFTPKIT_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Usernames, host key fingerprints and raw libssh2 auth diagnostics are only
// logged when this is true.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("SFTPKIT_LOG_SENSITIVE");
}

} // namespace sftpkit

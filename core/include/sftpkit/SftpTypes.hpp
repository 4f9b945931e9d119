// Basic types shared between the transfer client, the pool and the
// protocol backends.
#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sftpkit {

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,    // Requires an exact match in known_hosts.
    AcceptNew, // TOFU: accepts and stores new hosts; rejects key changes.
    Off        // No verification (not recommended).
};

struct FileInfo {
    std::string   name;     // base name (empty for stat results)
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes
    std::uint64_t mtime = 0;  // epoch seconds
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
    std::uint32_t uid   = 0;
    std::uint32_t gid   = 0;
};

// Fingerprint confirmation (TOFU) when known_hosts has no entry.
// Returns true to accept and store the key, false to reject.
using HostKeyConfirmCB = std::function<bool(const std::string &host,
                                            std::uint16_t port,
                                            const std::string &algorithm,
                                            const std::string &fingerprint)>;

// Decides whether an existing destination may be replaced.
enum class OverwritePolicy {
    Always,
    Never,
    IfNewer,                // source mtime strictly after destination mtime
    IfDifferentSize,
    IfNewerOrDifferentSize
};

const char *overwritePolicyName(OverwritePolicy policy);

struct ProgressInfo {
    std::uint64_t bytesTransferred = 0;
    std::uint64_t totalBytes = 0;
    double        percentage = 0.0; // 0..100
    std::uint64_t speed = 0;        // bytes per second
};

using ProgressCallback = std::function<void(const ProgressInfo &)>;

} // namespace sftpkit

// Client configuration: defaults, merging with user overrides, validation.
#pragma once
#include "Errors.hpp"
#include "Retrier.hpp"
#include "SftpTypes.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace sftpkit {

enum class AuthMethod { Password, PrivateKey };

struct AuthConfig {
    std::string host;
    int port = 0; // 0 = default (22)
    std::string username;

    AuthMethod method = AuthMethod::Password;
    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_data; // PEM/OpenSSH bytes
    std::optional<std::string> private_key_passphrase;

    // SSH host verification
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;
    HostKeyConfirmCB hostkey_confirm_cb;
};

struct ConnectionConfig {
    std::chrono::milliseconds timeout{0};      // dial + handshake
    int max_connections = 0;
    std::chrono::milliseconds idle_timeout{0};
    RetryConfig retry_policy;
};

struct TransferConfig {
    int buffer_size = 0; // bytes
    bool create_dirs = false;
    bool preserve_permissions = false;
    ProgressCallback progress;
};

struct Config {
    AuthConfig auth;
    ConnectionConfig connection;
    TransferConfig transfer;
};

constexpr int kDefaultPort = 22;
constexpr int kMaxBufferSize = 10 * 1024 * 1024;

// Built once; never modified.
const Config &defaultConfig();

// Each merge returns a new value: strings and optionals override when set,
// numbers only when positive, booleans always come from the user value.
Config mergeConfig(const Config &user);
AuthConfig mergeAuthConfig(const AuthConfig &base, const AuthConfig &user);
ConnectionConfig mergeConnectionConfig(const ConnectionConfig &base,
                                       const ConnectionConfig &user);
RetryConfig mergeRetryPolicy(const RetryConfig &base, const RetryConfig &user);
TransferConfig mergeTransferConfig(const TransferConfig &base,
                                   const TransferConfig &user);

// All fill a Configuration error on failure.
bool validateConfig(const Config &config, Error &err);
bool validateAuthConfig(const AuthConfig &config, Error &err);
bool validateConnectionConfig(const ConnectionConfig &config, Error &err);
bool validateTransferConfig(const TransferConfig &config, Error &err);

// Reads an INI file ([Auth], [Connection], [Retry], [Transfer]) into a user
// config (not merged). Missing keys stay unset.
bool loadConfigFile(const std::string &path, Config &out, Error &err);

} // namespace sftpkit

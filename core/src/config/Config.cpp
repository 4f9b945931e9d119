#include "sftpkit/Config.hpp"

namespace sftpkit {

namespace {

Config buildDefaultConfig() {
    Config c;
    c.auth.port = kDefaultPort;
    c.auth.method = AuthMethod::Password;
    c.auth.known_hosts_policy = KnownHostsPolicy::Strict;

    c.connection.timeout = std::chrono::seconds(30);
    c.connection.max_connections = 10;
    c.connection.idle_timeout = std::chrono::minutes(5);
    c.connection.retry_policy.maxAttempts = 3;
    c.connection.retry_policy.backoff = std::make_shared<ExponentialBackoff>(
        std::chrono::seconds(1), 2.0, std::chrono::seconds(30));

    c.transfer.buffer_size = 32 * 1024;
    c.transfer.create_dirs = false;
    c.transfer.preserve_permissions = false;
    return c;
}

} // namespace

const Config &defaultConfig() {
    static const Config kDefaults = buildDefaultConfig();
    return kDefaults;
}

AuthConfig mergeAuthConfig(const AuthConfig &base, const AuthConfig &user) {
    AuthConfig out = base;
    if (!user.host.empty())
        out.host = user.host;
    if (user.port > 0)
        out.port = user.port;
    if (!user.username.empty())
        out.username = user.username;
    out.method = user.method;
    if (user.password.has_value())
        out.password = user.password;
    if (user.private_key_path.has_value())
        out.private_key_path = user.private_key_path;
    if (user.private_key_data.has_value())
        out.private_key_data = user.private_key_data;
    if (user.private_key_passphrase.has_value())
        out.private_key_passphrase = user.private_key_passphrase;
    if (user.known_hosts_path.has_value())
        out.known_hosts_path = user.known_hosts_path;
    out.known_hosts_policy = user.known_hosts_policy;
    if (user.hostkey_confirm_cb)
        out.hostkey_confirm_cb = user.hostkey_confirm_cb;
    return out;
}

RetryConfig mergeRetryPolicy(const RetryConfig &base, const RetryConfig &user) {
    RetryConfig out = base;
    if (user.maxAttempts > 0)
        out.maxAttempts = user.maxAttempts;
    if (user.backoff)
        out.backoff = user.backoff;
    return out;
}

ConnectionConfig mergeConnectionConfig(const ConnectionConfig &base,
                                       const ConnectionConfig &user) {
    ConnectionConfig out = base;
    if (user.timeout.count() > 0)
        out.timeout = user.timeout;
    if (user.max_connections > 0)
        out.max_connections = user.max_connections;
    if (user.idle_timeout.count() > 0)
        out.idle_timeout = user.idle_timeout;
    out.retry_policy = mergeRetryPolicy(base.retry_policy, user.retry_policy);
    return out;
}

TransferConfig mergeTransferConfig(const TransferConfig &base,
                                   const TransferConfig &user) {
    TransferConfig out = base;
    if (user.buffer_size > 0)
        out.buffer_size = user.buffer_size;
    out.create_dirs = user.create_dirs;
    out.preserve_permissions = user.preserve_permissions;
    if (user.progress)
        out.progress = user.progress;
    return out;
}

Config mergeConfig(const Config &user) {
    const Config &d = defaultConfig();
    Config out;
    out.auth = mergeAuthConfig(d.auth, user.auth);
    out.connection = mergeConnectionConfig(d.connection, user.connection);
    out.transfer = mergeTransferConfig(d.transfer, user.transfer);
    return out;
}

bool validateAuthConfig(const AuthConfig &config, Error &err) {
    if (config.host.empty())
        return fail(err, ErrorKind::Configuration, "host cannot be empty");
    if (config.port <= 0 || config.port > 65535)
        return fail(err, ErrorKind::Configuration,
                    "port must be between 1 and 65535, got " +
                        std::to_string(config.port));
    if (config.username.empty())
        return fail(err, ErrorKind::Configuration, "username cannot be empty");
    return true;
}

bool validateConnectionConfig(const ConnectionConfig &config, Error &err) {
    if (config.timeout.count() < 0)
        return fail(err, ErrorKind::Configuration,
                    "timeout cannot be negative");
    if (config.max_connections <= 0)
        return fail(err, ErrorKind::Configuration,
                    "max connections must be positive, got " +
                        std::to_string(config.max_connections));
    if (config.idle_timeout.count() < 0)
        return fail(err, ErrorKind::Configuration,
                    "idle timeout cannot be negative");
    std::string rerr;
    if (!config.retry_policy.validate(rerr))
        return fail(err, ErrorKind::Configuration,
                    "invalid retry policy: " + rerr);
    return true;
}

bool validateTransferConfig(const TransferConfig &config, Error &err) {
    if (config.buffer_size <= 0)
        return fail(err, ErrorKind::Configuration,
                    "buffer size must be positive, got " +
                        std::to_string(config.buffer_size));
    if (config.buffer_size > kMaxBufferSize)
        return fail(err, ErrorKind::Configuration,
                    "buffer size too large, got " +
                        std::to_string(config.buffer_size));
    return true;
}

bool validateConfig(const Config &config, Error &err) {
    return validateAuthConfig(config.auth, err) &&
           validateConnectionConfig(config.connection, err) &&
           validateTransferConfig(config.transfer, err);
}

} // namespace sftpkit

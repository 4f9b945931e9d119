// INI configuration through QSettings.
#include "sftpkit/Config.hpp"

#include <QFileInfo>
#include <QSettings>
#include <QString>

#include <limits>
#include <string>

namespace sftpkit {

namespace {

std::optional<std::string> optString(const QSettings &s, const char *key) {
    if (!s.contains(key))
        return std::nullopt;
    const QString v = s.value(key).toString();
    if (v.isEmpty())
        return std::nullopt;
    return v.toStdString();
}

bool readInt(const QSettings &s, const char *key, long long &out,
             Error &err) {
    if (!s.contains(key))
        return true;
    bool ok = false;
    const long long v = s.value(key).toLongLong(&ok);
    if (!ok)
        return fail(err, ErrorKind::Configuration,
                    std::string(key) + " is not a number: " +
                        s.value(key).toString().toStdString());
    out = v;
    return true;
}

// Same, for int-typed fields; values outside int range are rejected.
bool readInt(const QSettings &s, const char *key, int &out, Error &err) {
    long long v = 0;
    if (!readInt(s, key, v, err))
        return false;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return fail(err, ErrorKind::Configuration,
                    std::string(key) + " is out of range: " + std::to_string(v));
    out = static_cast<int>(v);
    return true;
}

bool readBackoff(const QSettings &s, RetryConfig &retry, Error &err) {
    const QString kind =
        s.value("Retry/backoff").toString().trimmed().toLower();
    if (kind.isEmpty())
        return true;

    long long interval = 0, base = 0, jitter = 0, maxDelay = 0;
    if (!readInt(s, "Retry/intervalMs", interval, err) ||
        !readInt(s, "Retry/baseDelayMs", base, err) ||
        !readInt(s, "Retry/maxJitterMs", jitter, err) ||
        !readInt(s, "Retry/maxDelayMs", maxDelay, err))
        return false;

    std::string berr;
    if (kind == "fixed") {
        retry.backoff =
            makeFixedBackoff(std::chrono::milliseconds(interval), berr);
    } else if (kind == "jitter") {
        retry.backoff = makeJitterBackoff(std::chrono::milliseconds(base),
                                          std::chrono::milliseconds(jitter),
                                          berr);
    } else if (kind == "exponential") {
        bool ok = true;
        const double factor = s.value("Retry/factor", 2.0).toDouble(&ok);
        if (!ok)
            return fail(err, ErrorKind::Configuration,
                        "Retry/factor is not a number");
        retry.backoff = makeExponentialBackoff(
            std::chrono::milliseconds(base), factor,
            std::chrono::milliseconds(maxDelay), berr);
    } else {
        return fail(err, ErrorKind::Configuration,
                    "unknown Retry/backoff: " + kind.toStdString());
    }
    if (!retry.backoff)
        return fail(err, ErrorKind::Configuration,
                    "invalid " + kind.toStdString() + " backoff: " + berr);
    return true;
}

} // namespace

bool loadConfigFile(const std::string &path, Config &out, Error &err) {
    const QString qpath = QString::fromStdString(path);
    if (!QFileInfo::exists(qpath))
        return fail(err, ErrorKind::Configuration,
                    "config file not found: " + path);

    QSettings s(qpath, QSettings::IniFormat);
    if (s.status() != QSettings::NoError)
        return fail(err, ErrorKind::Configuration,
                    "config file is not valid INI: " + path);

    Config c;

    // [Auth]
    c.auth.host = s.value("Auth/host").toString().toStdString();
    c.auth.username = s.value("Auth/username").toString().toStdString();
    if (!readInt(s, "Auth/port", c.auth.port, err))
        return false;

    const QString method =
        s.value("Auth/method", "password").toString().trimmed().toLower();
    if (method == "password") {
        c.auth.method = AuthMethod::Password;
    } else if (method == "privatekey" || method == "private_key") {
        c.auth.method = AuthMethod::PrivateKey;
    } else {
        return fail(err, ErrorKind::Configuration,
                    "unknown Auth/method: " + method.toStdString());
    }
    c.auth.password = optString(s, "Auth/password");
    c.auth.private_key_path = optString(s, "Auth/privateKeyPath");
    c.auth.private_key_passphrase = optString(s, "Auth/passphrase");
    c.auth.known_hosts_path = optString(s, "Auth/knownHostsPath");

    const QString policy =
        s.value("Auth/knownHostsPolicy", "strict").toString().trimmed().toLower();
    if (policy == "strict") {
        c.auth.known_hosts_policy = KnownHostsPolicy::Strict;
    } else if (policy == "acceptnew" || policy == "accept_new") {
        c.auth.known_hosts_policy = KnownHostsPolicy::AcceptNew;
    } else if (policy == "off") {
        c.auth.known_hosts_policy = KnownHostsPolicy::Off;
    } else {
        return fail(err, ErrorKind::Configuration,
                    "unknown Auth/knownHostsPolicy: " + policy.toStdString());
    }

    // [Connection]
    long long timeoutMs = 0, idleMs = 0;
    if (!readInt(s, "Connection/timeoutMs", timeoutMs, err) ||
        !readInt(s, "Connection/maxConnections", c.connection.max_connections, err) ||
        !readInt(s, "Connection/idleTimeoutMs", idleMs, err))
        return false;
    c.connection.timeout = std::chrono::milliseconds(timeoutMs);
    c.connection.idle_timeout = std::chrono::milliseconds(idleMs);

    // [Retry]
    if (!readInt(s, "Retry/maxAttempts", c.connection.retry_policy.maxAttempts, err))
        return false;
    if (!readBackoff(s, c.connection.retry_policy, err))
        return false;

    // [Transfer]
    if (!readInt(s, "Transfer/bufferSize", c.transfer.buffer_size, err))
        return false;
    c.transfer.create_dirs = s.value("Transfer/createDirs", false).toBool();
    c.transfer.preserve_permissions =
        s.value("Transfer/preservePermissions", false).toBool();

    out = std::move(c);
    return true;
}

} // namespace sftpkit

#include "sftpkit/TransferClient.hpp"
#include "sftpkit/Libssh2Connector.hpp"
#include "sftpkit/RuntimeLogging.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <functional>
#include <utility>

namespace sftpkit {

const char *overwritePolicyName(OverwritePolicy policy) {
    switch (policy) {
    case OverwritePolicy::Always: return "always";
    case OverwritePolicy::Never: return "never";
    case OverwritePolicy::IfNewer: return "ifNewer";
    case OverwritePolicy::IfDifferentSize: return "ifDifferentSize";
    case OverwritePolicy::IfNewerOrDifferentSize: return "ifNewerOrDifferentSize";
    }
    return "unknown";
}

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kProgressInterval = std::chrono::seconds(30);

long long elapsedMs(Clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();
}

// Borrows one session for the lifetime of the object.
class SessionLease {
public:
    explicit SessionLease(ConnectionManager &pool) : pool_(pool) {}
    ~SessionLease() {
        if (!session_)
            return;
        Error err;
        if (!pool_.releaseConnection(session_, err))
            qCWarning(sftpkitPool) << "releasing session:" << QString::fromStdString(err.str());
    }
    SessionLease(const SessionLease &) = delete;
    SessionLease &operator=(const SessionLease &) = delete;

    bool acquire(const Context &ctx, Error &err) { return pool_.getConnection(ctx, session_, err); }
    SftpSession *operator->() const { return session_.get(); }
    SftpSession &operator*() const { return *session_; }

private:
    ConnectionManager &pool_;
    std::shared_ptr<SftpSession> session_;
};

// Closes the FILE on every exit path unless released first.
struct LocalFileCloser {
    FILE *f = nullptr;
    ~LocalFileCloser() {
        if (f)
            std::fclose(f);
    }
};

// Slash-separated lexical cleanup: duplicate slashes, "." and ".." removed.
std::string cleanRemotePath(const std::string &path) {
    const bool rooted = !path.empty() && path[0] == '/';
    std::vector<std::string> parts;
    std::string cur;
    auto flush = [&]() {
        if (cur.empty() || cur == ".") {
        } else if (cur == "..") {
            if (!parts.empty() && parts.back() != "..")
                parts.pop_back();
            else if (!rooted)
                parts.push_back(cur);
        } else {
            parts.push_back(cur);
        }
        cur.clear();
    };
    for (char c : path) {
        if (c == '/')
            flush();
        else
            cur += c;
    }
    flush();
    std::string out = rooted ? "/" : "";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += '/';
        out += parts[i];
    }
    if (out.empty()) return ".";
    return out;
}

std::string remoteDirName(const std::string &path) {
    const std::string c = cleanRemotePath(path);
    const auto pos = c.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return c.substr(0, pos);
}

std::string remoteBaseName(const std::string &path) {
    const std::string c = cleanRemotePath(path);
    const auto pos = c.find_last_of('/');
    if (c == "/") return c;
    return pos == std::string::npos ? c : c.substr(pos + 1);
}

bool localStat(const std::string &path, FileInfo &out) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0)
        return false;
    out.is_dir = S_ISDIR(st.st_mode);
    out.size = static_cast<std::uint64_t>(st.st_size);
    out.mtime = static_cast<std::uint64_t>(st.st_mtime);
    out.mode = static_cast<std::uint32_t>(st.st_mode);
    out.uid = static_cast<std::uint32_t>(st.st_uid);
    out.gid = static_cast<std::uint32_t>(st.st_gid);
    return true;
}

// Ensures dir and its parents exist, stopping at the first existing one.
bool createRemoteDir(SftpSession &s, const std::string &dir, Error &err) {
    const std::string path = cleanRemotePath(dir);
    if (path == "." || path == "/")
        return true;
    FileInfo info;
    std::string serr;
    if (s.stat(path, info, serr)) {
        if (!info.is_dir)
            return fail(err, ErrorKind::DataTransfer, "path exists and is not a directory: " + path);
        return true;
    }
    const std::string parent = remoteDirName(path);
    if (parent != "." && parent != "/" && parent != path) {
        if (!createRemoteDir(s, parent, err))
            return false;
    }
    if (!s.mkdir(path, serr))
        return fail(err, ErrorKind::DataTransfer, "failed to create directory " + path + ": " + serr);
    return true;
}

bool removeRemoteTree(SftpSession &s, const std::string &path, const FileInfo &info,
                      std::string &err) {
    if (!info.is_dir)
        return s.removeFile(path, err);
    std::vector<FileInfo> entries;
    if (!s.list(path, entries, err))
        return false;
    for (const FileInfo &e : entries) {
        const std::string child = (path == "/" ? "" : path) + "/" + e.name;
        if (!removeRemoteTree(s, child, e, err))
            return false;
    }
    return s.removeDir(path, err);
}

// Decides whether src may replace an existing dst. srcSide/dstSide name the
// two ends in the rejection message ("local", "remote").
bool checkOverwrite(OverwritePolicy policy, const FileInfo &src, const FileInfo &dst,
                    const std::string &dstPath, const char *srcSide, const char *dstSide,
                    Error &err) {
    const bool newer = src.mtime > dst.mtime;
    const bool differentSize = src.size != dst.size;
    switch (policy) {
    case OverwritePolicy::Always:
        return true;
    case OverwritePolicy::Never:
        return fail(err, ErrorKind::DataTransfer,
                    "file " + dstPath + " already exists and overwrite policy is never");
    case OverwritePolicy::IfNewer:
        if (!newer)
            return fail(err, ErrorKind::DataTransfer,
                        std::string(srcSide) + " file is not newer than " + dstSide + " file " + dstPath);
        return true;
    case OverwritePolicy::IfDifferentSize:
        if (!differentSize)
            return fail(err, ErrorKind::DataTransfer,
                        std::string(srcSide) + " and " + dstSide + " files have the same size for " + dstPath);
        return true;
    case OverwritePolicy::IfNewerOrDifferentSize:
        if (!newer && !differentSize)
            return fail(err, ErrorKind::DataTransfer,
                        std::string(srcSide) + " file is not newer and has the same size as " + dstSide +
                            " file " + dstPath);
        return true;
    }
    return true;
}

using ReadFn = std::function<long long(char *, std::size_t, std::string &)>;
using WriteFn = std::function<bool(const char *, std::size_t, std::string &)>;

void reportProgress(const ProgressCallback &cb, std::uint64_t done, std::uint64_t total,
                    Clock::time_point started, bool final) {
    ProgressInfo info;
    info.bytesTransferred = done;
    info.totalBytes = total;
    const double secs = std::chrono::duration<double>(Clock::now() - started).count();
    if (secs > 0)
        info.speed = static_cast<std::uint64_t>(static_cast<double>(done) / secs);
    if (final) {
        info.percentage = 100.0;
    } else if (total > 0) {
        info.percentage = static_cast<double>(done) / static_cast<double>(total) * 100.0;
        if (info.percentage > 100.0) info.percentage = 100.0;
    }
    cb(info);
}

// Streams read into write through a bufferSize buffer. Context errors are
// returned as-is; I/O errors as DataTransfer with the backend message.
bool copyWithProgress(const Context &ctx, std::size_t bufferSize, const ReadFn &read,
                      const WriteFn &write, std::uint64_t totalBytes,
                      const ProgressCallback &progress, std::uint64_t &transferred, Error &err) {
    std::vector<char> buf(bufferSize);
    transferred = 0;
    const auto started = Clock::now();
    auto lastReport = started;
    if (progress) {
        ProgressInfo first;
        first.totalBytes = totalBytes;
        progress(first);
    }
    for (;;) {
        if (ctx.err(err))
            return false;
        std::string ioErr;
        const long long n = read(buf.data(), buf.size(), ioErr);
        if (n < 0)
            return fail(err, ErrorKind::DataTransfer, ioErr);
        if (n == 0)
            break;
        if (!write(buf.data(), static_cast<std::size_t>(n), ioErr))
            return fail(err, ErrorKind::DataTransfer, ioErr);
        transferred += static_cast<std::uint64_t>(n);
        const auto now = Clock::now();
        if (progress && now - lastReport >= kProgressInterval) {
            reportProgress(progress, transferred, totalBytes, started, false);
            lastReport = now;
        }
    }
    if (progress)
        reportProgress(progress, transferred, totalBytes, started, true);
    return true;
}

} // namespace

std::unique_ptr<TransferClient> TransferClient::create(const Config &config, Error &err) {
    return createWithConnector(config, std::make_shared<Libssh2Connector>(), err);
}

std::unique_ptr<TransferClient>
TransferClient::createWithConnector(const Config &config, std::shared_ptr<Connector> connector,
                                    Error &err) {
    const Config merged = mergeConfig(config);
    if (!validateConfig(merged, err))
        return nullptr;
    std::shared_ptr<const AuthenticationHandler> auth = createAuthHandler(merged.auth, err);
    if (!auth)
        return nullptr;
    std::shared_ptr<ConnectionManager> pool =
        SessionPool::create(auth, merged.auth, merged.connection, std::move(connector), err);
    if (!pool)
        return nullptr;
    return createWithDependencies(std::move(auth), std::move(pool), merged.transfer, err);
}

std::unique_ptr<TransferClient>
TransferClient::createWithDependencies(std::shared_ptr<const AuthenticationHandler> authHandler,
                                       std::shared_ptr<ConnectionManager> connectionManager,
                                       const TransferConfig &transferConfig, Error &err) {
    if (!connectionManager) {
        fail(err, ErrorKind::Configuration, "connection manager cannot be null");
        return nullptr;
    }
    if (!authHandler) {
        fail(err, ErrorKind::Configuration, "authentication handler cannot be null");
        return nullptr;
    }
    TransferConfig merged = mergeTransferConfig(defaultConfig().transfer, transferConfig);
    if (!validateTransferConfig(merged, err))
        return nullptr;
    return std::unique_ptr<TransferClient>(
        new TransferClient(std::move(authHandler), std::move(connectionManager), std::move(merged)));
}

TransferClient::TransferClient(std::shared_ptr<const AuthenticationHandler> authHandler,
                               std::shared_ptr<ConnectionManager> connectionManager,
                               TransferConfig transferConfig)
    : authHandler_(std::move(authHandler)), pool_(std::move(connectionManager)),
      transferConfig_(std::move(transferConfig)) {}

TransferClient::~TransferClient() {
    Error err;
    if (!close(err))
        qCWarning(sftpkitPool) << "closing transfer client:" << QString::fromStdString(err.str());
}

bool TransferClient::connect(const Context &ctx, Error &err) {
    if (connected_)
        return true;
    std::shared_ptr<SftpSession> session;
    if (!pool_->getConnection(ctx, session, err))
        return false;
    if (!pool_->releaseConnection(session, err))
        return false;
    connected_ = true;
    if (sensitiveLoggingEnabled())
        qCInfo(ctx.log()) << "connected as" << QString::fromStdString(authHandler_->username());
    else
        qCInfo(ctx.log()) << "connected";
    return true;
}

bool TransferClient::close(Error &err) {
    if (!pool_->close(err))
        return false;
    connected_ = false;
    return true;
}

bool TransferClient::upload(const Context &ctx, const std::string &localPath,
                            const std::string &remotePath, Error &err,
                            const UploadOptions &opts) {
    const auto started = Clock::now();
    const bool createDirs = opts.createDirs.value_or(transferConfig_.create_dirs);
    const bool preserve = opts.preservePermissions.value_or(transferConfig_.preserve_permissions);
    const ProgressCallback &progress = opts.progress ? opts.progress : transferConfig_.progress;

    SessionLease s(*pool_);
    if (!s.acquire(ctx, err))
        return false;

    LocalFileCloser local;
    local.f = std::fopen(localPath.c_str(), "rb");
    if (!local.f)
        return fail(err, ErrorKind::FileNotFound,
                    "failed to open local file " + localPath + ": " + std::strerror(errno));
    FileInfo localInfo;
    if (!localStat(localPath, localInfo))
        return fail(err, ErrorKind::FileNotFound,
                    "failed to stat local file " + localPath + ": " + std::strerror(errno));
    if (localInfo.is_dir)
        return fail(err, ErrorKind::FileNotFound, "local path is a directory: " + localPath);

    if (createDirs) {
        const std::string remoteDir = remoteDirName(remotePath);
        if (remoteDir != "." && remoteDir != "/" && !createRemoteDir(*s, remoteDir, err))
            return false;
    }

    if (opts.overwrite != OverwritePolicy::Always) {
        FileInfo remoteInfo;
        std::string serr;
        if (s->stat(remotePath, remoteInfo, serr) &&
            !checkOverwrite(opts.overwrite, localInfo, remoteInfo, remotePath, "local", "remote", err)) {
            qCDebug(ctx.log()) << "upload skipped by policy" << overwritePolicyName(opts.overwrite)
                               << QString::fromStdString(remotePath);
            return false;
        }
    }

    std::unique_ptr<RemoteFile> remote;
    std::string ioErr;
    if (!s->openWrite(remotePath, 0644, remote, ioErr))
        return fail(err, ErrorKind::DataTransfer,
                    "failed to create remote file " + remotePath + ": " + ioErr);

    FILE *lf = local.f;
    std::uint64_t transferred = 0;
    Error copyErr;
    const bool copied = copyWithProgress(
        ctx, static_cast<std::size_t>(transferConfig_.buffer_size),
        [lf](char *buf, std::size_t len, std::string &e) -> long long {
            const std::size_t n = std::fread(buf, 1, len, lf);
            if (n == 0 && std::ferror(lf)) {
                e = std::string("local read failed: ") + std::strerror(errno);
                return -1;
            }
            return static_cast<long long>(n);
        },
        [&remote](const char *buf, std::size_t len, std::string &e) {
            std::size_t off = 0;
            while (off < len) {
                const long long w = remote->write(buf + off, len - off, e);
                if (w <= 0) {
                    if (e.empty()) e = "remote write made no progress";
                    return false;
                }
                off += static_cast<std::size_t>(w);
            }
            return true;
        },
        localInfo.size, progress, transferred, copyErr);
    std::string closeErr;
    const bool closed = remote->close(closeErr);
    if (!copied) {
        if (copyErr.isContextError()) {
            err = copyErr;
            return false;
        }
        return fail(err, ErrorKind::DataTransfer,
                    "failed to transfer file to " + remotePath + ": " + copyErr.message);
    }
    if (!closed)
        return fail(err, ErrorKind::DataTransfer,
                    "failed to transfer file to " + remotePath + ": " + closeErr);

    const QLoggingCategory &lc = ctx.log();
    if (preserve) {
        std::string cerr;
        if (!s->chmod(remotePath, localInfo.mode & 07777, cerr))
            qCWarning(lc) << "upload: failed to set file permissions on" << QString::fromStdString(remotePath)
                          << QString::number(localInfo.mode & 07777, 8) << QString::fromStdString(cerr);
    }

    qCDebug(lc) << "upload completed" << QString::fromStdString(localPath) << "->"
                << QString::fromStdString(remotePath) << transferred << "bytes in" << elapsedMs(started) << "ms";
    return true;
}

bool TransferClient::download(const Context &ctx, const std::string &remotePath,
                              const std::string &localPath, Error &err,
                              const DownloadOptions &opts) {
    const auto started = Clock::now();
    const bool createDirs = opts.createDirs.value_or(transferConfig_.create_dirs);
    const bool preserve = opts.preservePermissions.value_or(transferConfig_.preserve_permissions);
    const ProgressCallback &progress = opts.progress ? opts.progress : transferConfig_.progress;

    SessionLease s(*pool_);
    if (!s.acquire(ctx, err))
        return false;

    std::unique_ptr<RemoteFile> remote;
    std::string ioErr;
    if (!s->openRead(remotePath, remote, ioErr))
        return fail(err, ErrorKind::FileNotFound,
                    "failed to open remote file " + remotePath + ": " + ioErr);
    FileInfo remoteInfo;
    if (!s->stat(remotePath, remoteInfo, ioErr))
        return fail(err, ErrorKind::FileNotFound,
                    "failed to stat remote file " + remotePath + ": " + ioErr);

    if (createDirs) {
        const std::filesystem::path localDir = std::filesystem::path(localPath).parent_path();
        std::error_code ec;
        if (!localDir.empty() && !std::filesystem::create_directories(localDir, ec) && ec)
            return fail(err, ErrorKind::DataTransfer,
                        "failed to create local directory " + localDir.string() + ": " + ec.message());
    }

    if (opts.overwrite != OverwritePolicy::Always) {
        FileInfo localInfo;
        if (localStat(localPath, localInfo) &&
            !checkOverwrite(opts.overwrite, remoteInfo, localInfo, localPath, "remote", "local", err)) {
            qCDebug(ctx.log()) << "download skipped by policy" << overwritePolicyName(opts.overwrite)
                               << QString::fromStdString(localPath);
            return false;
        }
    }

    LocalFileCloser local;
    local.f = std::fopen(localPath.c_str(), "wb");
    if (!local.f)
        return fail(err, ErrorKind::DataTransfer,
                    "failed to create local file " + localPath + ": " + std::strerror(errno));

    FILE *lf = local.f;
    std::uint64_t transferred = 0;
    Error copyErr;
    const bool copied = copyWithProgress(
        ctx, static_cast<std::size_t>(transferConfig_.buffer_size),
        [&remote](char *buf, std::size_t len, std::string &e) { return remote->read(buf, len, e); },
        [lf](const char *buf, std::size_t len, std::string &e) {
            if (std::fwrite(buf, 1, len, lf) != len) {
                e = std::string("local write failed: ") + std::strerror(errno);
                return false;
            }
            return true;
        },
        remoteInfo.size, progress, transferred, copyErr);
    std::string closeErr;
    if (!remote->close(closeErr))
        qCDebug(ctx.log()) << "download: closing remote file" << QString::fromStdString(closeErr);
    const int rc = std::fclose(local.f);
    local.f = nullptr;
    if (!copied) {
        if (copyErr.isContextError()) {
            err = copyErr;
            return false;
        }
        return fail(err, ErrorKind::DataTransfer,
                    "failed to transfer file to " + localPath + ": " + copyErr.message);
    }
    if (rc != 0)
        return fail(err, ErrorKind::DataTransfer,
                    "failed to transfer file to " + localPath + ": " + std::strerror(errno));

    const QLoggingCategory &lc = ctx.log();
    if (preserve && ::chmod(localPath.c_str(), static_cast<mode_t>(remoteInfo.mode & 07777)) != 0)
        qCWarning(lc) << "download: failed to set file permissions on" << QString::fromStdString(localPath)
                      << QString::number(remoteInfo.mode & 07777, 8) << std::strerror(errno);

    qCDebug(lc) << "download completed" << QString::fromStdString(remotePath) << "->"
                << QString::fromStdString(localPath) << transferred << "bytes in" << elapsedMs(started) << "ms";
    return true;
}

bool TransferClient::list(const Context &ctx, const std::string &remotePath,
                          std::vector<FileInfo> &out, Error &err) {
    const auto started = Clock::now();
    SessionLease s(*pool_);
    if (!s.acquire(ctx, err))
        return false;
    std::string lerr;
    if (!s->list(remotePath, out, lerr))
        return fail(err, ErrorKind::DataTransfer, "failed to list directory " + remotePath + ": " + lerr);
    qCDebug(ctx.log()) << "list" << QString::fromStdString(remotePath) << out.size() << "entries in"
                       << elapsedMs(started) << "ms";
    return true;
}

bool TransferClient::mkdir(const Context &ctx, const std::string &remotePath, Error &err) {
    const auto started = Clock::now();
    SessionLease s(*pool_);
    if (!s.acquire(ctx, err))
        return false;
    Error derr;
    if (!createRemoteDir(*s, remotePath, derr))
        return fail(err, ErrorKind::DataTransfer,
                    "failed to create directory " + remotePath + ": " + derr.message);
    qCDebug(ctx.log()) << "mkdir" << QString::fromStdString(remotePath) << "in" << elapsedMs(started) << "ms";
    return true;
}

bool TransferClient::remove(const Context &ctx, const std::string &remotePath, Error &err) {
    const auto started = Clock::now();
    SessionLease s(*pool_);
    if (!s.acquire(ctx, err))
        return false;
    const std::string path = cleanRemotePath(remotePath);
    FileInfo info;
    std::string rerr;
    if (!s->stat(path, info, rerr)) {
        if (rerr.empty()) rerr = "no such file or directory";
        return fail(err, ErrorKind::DataTransfer, "failed to remove file " + remotePath + ": " + rerr);
    }
    if (!removeRemoteTree(*s, path, info, rerr))
        return fail(err, ErrorKind::DataTransfer, "failed to remove file " + remotePath + ": " + rerr);
    qCDebug(ctx.log()) << "remove" << QString::fromStdString(remotePath) << "in" << elapsedMs(started) << "ms";
    return true;
}

bool TransferClient::rename(const Context &ctx, const std::string &oldPath,
                            const std::string &newPath, Error &err) {
    const auto started = Clock::now();
    SessionLease s(*pool_);
    if (!s.acquire(ctx, err))
        return false;
    FileInfo source;
    std::string rerr;
    if (!s->stat(oldPath, source, rerr))
        return fail(err, ErrorKind::FileNotFound,
                    "source path does not exist " + oldPath + (rerr.empty() ? "" : ": " + rerr));
    const std::string newDir = remoteDirName(newPath);
    if (newDir != "." && newDir != "/") {
        Error derr;
        if (!createRemoteDir(*s, newDir, derr))
            return fail(err, ErrorKind::DataTransfer,
                        "failed to create destination directory: " + derr.message);
    }
    if (!s->rename(oldPath, newPath, rerr))
        return fail(err, ErrorKind::DataTransfer,
                    "failed to rename/move from " + oldPath + " to " + newPath + ": " + rerr);
    qCDebug(ctx.log()) << "rename" << (source.is_dir ? "directory" : "file") << QString::fromStdString(oldPath)
                       << "->" << QString::fromStdString(newPath) << "in" << elapsedMs(started) << "ms";
    return true;
}

bool TransferClient::stat(const Context &ctx, const std::string &remotePath, FileInfo &out,
                          Error &err) {
    const auto started = Clock::now();
    SessionLease s(*pool_);
    if (!s.acquire(ctx, err))
        return false;
    std::string serr;
    if (!s->stat(remotePath, out, serr))
        return fail(err, ErrorKind::FileNotFound,
                    "failed to stat path " + remotePath + (serr.empty() ? "" : ": " + serr));
    out.name = remoteBaseName(remotePath);
    qCDebug(ctx.log()) << "stat" << QString::fromStdString(remotePath) << (out.is_dir ? "directory" : "file")
                       << out.size << "bytes in" << elapsedMs(started) << "ms";
    return true;
}

} // namespace sftpkit

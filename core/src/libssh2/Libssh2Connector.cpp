// libssh2 backend: manages the TCP socket, the SSH session and the SFTP
// channel. Includes keepalive, known_hosts validation and password,
// keyboard-interactive and in-memory public key authentication.
#include "sftpkit/Libssh2Connector.hpp"
#include "sftpkit/RuntimeLogging.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace sftpkit {

namespace {

// Global libssh2 initialization (once per process)
std::once_flag g_libssh2_once;
int g_libssh2_init_rc = 0;

std::string lastSessionError(LIBSSH2_SESSION *session) {
    if (!session)
        return {};
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len <= 0)
        return {};
    return std::string(msg, static_cast<std::size_t>(len));
}

std::string sftpError(const char *what, LIBSSH2_SFTP *sftp) {
    std::string out(what);
    if (sftp)
        out += " (sftp status " +
               std::to_string(libssh2_sftp_last_error(sftp)) + ")";
    return out;
}

bool isMissing(LIBSSH2_SFTP *sftp) {
    const unsigned long e = libssh2_sftp_last_error(sftp);
    return e == LIBSSH2_FX_NO_SUCH_FILE || e == LIBSSH2_FX_NO_SUCH_PATH;
}

FileInfo fromAttrs(const LIBSSH2_SFTP_ATTRIBUTES &attrs) {
    FileInfo fi{};
    fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                    ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                    : false;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = static_cast<std::uint32_t>(attrs.permissions);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        fi.uid = static_cast<std::uint32_t>(attrs.uid);
        fi.gid = static_cast<std::uint32_t>(attrs.gid);
    }
    return fi;
}

class Libssh2Transport : public Transport {
public:
    ~Libssh2Transport() override {
        std::string ignored;
        if (!close(ignored))
            qCWarning(sftpkitSsh) << "transport close on destruction failed:"
                                  << QString::fromStdString(ignored);
    }

    bool isOpen() const override { return session_ != nullptr && sock_ != -1; }

    bool close(std::string &err) override {
        bool ok = true;
        if (session_) {
            if (libssh2_session_disconnect(session_, "bye") != 0) {
                err = "ssh disconnect failed: " + lastSessionError(session_);
                ok = false;
            }
            libssh2_session_free(session_);
            session_ = nullptr;
        }
        if (sock_ != -1) {
            if (::close(sock_) != 0 && ok) {
                err = std::string("socket close failed: ") + std::strerror(errno);
                ok = false;
            }
            sock_ = -1;
        }
        return ok;
    }

    int sock_ = -1;
    LIBSSH2_SESSION *session_ = nullptr;
};

class Libssh2File : public RemoteFile {
public:
    Libssh2File(LIBSSH2_SFTP *sftp, LIBSSH2_SFTP_HANDLE *h) : sftp_(sftp), h_(h) {}
    ~Libssh2File() override {
        std::string ignored;
        if (!close(ignored))
            qCWarning(sftpkitSsh) << "remote file close on destruction failed:"
                                  << QString::fromStdString(ignored);
    }

    long long read(char *buf, std::size_t len, std::string &err) override {
        if (!h_) {
            err = "file already closed";
            return -1;
        }
        const ssize_t n = libssh2_sftp_read(h_, buf, len);
        if (n < 0)
            err = sftpError("remote read failed", sftp_);
        return static_cast<long long>(n);
    }

    long long write(const char *buf, std::size_t len, std::string &err) override {
        if (!h_) {
            err = "file already closed";
            return -1;
        }
        const ssize_t n = libssh2_sftp_write(h_, buf, len);
        if (n < 0)
            err = sftpError("remote write failed", sftp_);
        return static_cast<long long>(n);
    }

    bool close(std::string &err) override {
        if (!h_)
            return true;
        const int rc = libssh2_sftp_close(h_);
        h_ = nullptr;
        if (rc != 0) {
            err = sftpError("remote close failed", sftp_);
            return false;
        }
        return true;
    }

private:
    LIBSSH2_SFTP *sftp_;
    LIBSSH2_SFTP_HANDLE *h_;
};

class Libssh2Session : public SftpSession {
public:
    explicit Libssh2Session(LIBSSH2_SFTP *sftp) : sftp_(sftp) {}
    ~Libssh2Session() override {
        std::string ignored;
        if (!close(ignored))
            qCWarning(sftpkitSsh) << "sftp close on destruction failed:"
                                  << QString::fromStdString(ignored);
    }

    bool isOpen() const override { return sftp_ != nullptr; }

    bool realpath(const std::string &path, std::string &out, std::string &err) override {
        if (!sftp_) {
            err = "not connected";
            return false;
        }
        char target[1024];
        const int rc = libssh2_sftp_realpath(sftp_, path.c_str(), target, sizeof(target));
        if (rc < 0) {
            err = sftpError("sftp realpath failed", sftp_);
            return false;
        }
        out.assign(target, static_cast<std::size_t>(rc));
        return true;
    }

    bool list(const std::string &remote_path, std::vector<FileInfo> &out,
              std::string &err) override {
        if (!sftp_) {
            err = "not connected";
            return false;
        }
        const std::string path = remote_path.empty() ? "/" : remote_path;
        LIBSSH2_SFTP_HANDLE *dir = libssh2_sftp_opendir(sftp_, path.c_str());
        if (!dir) {
            err = sftpError(("sftp opendir failed for: " + path).c_str(), sftp_);
            return false;
        }

        out.clear();
        char filename[512];
        char longentry[1024];
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        while (true) {
            std::memset(&attrs, 0, sizeof(attrs));
            const int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                                   longentry, sizeof(longentry), &attrs);
            if (rc > 0) {
                FileInfo fi = fromAttrs(attrs);
                fi.name = std::string(filename, static_cast<std::size_t>(rc));
                if (fi.name == "." || fi.name == "..") continue;
                out.push_back(std::move(fi));
            } else if (rc == 0) {
                break; // end of directory
            } else {
                err = sftpError("sftp readdir failed", sftp_);
                libssh2_sftp_closedir(dir);
                return false;
            }
        }
        libssh2_sftp_closedir(dir);
        return true;
    }

    bool stat(const std::string &remote_path, FileInfo &info, std::string &err) override {
        if (!sftp_) {
            err = "not connected";
            return false;
        }
        LIBSSH2_SFTP_ATTRIBUTES st{};
        const int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                                            static_cast<unsigned>(remote_path.size()),
                                            LIBSSH2_SFTP_STAT, &st);
        if (rc != 0) {
            if (isMissing(sftp_)) {
                err.clear();
                return false; // does not exist
            }
            err = sftpError("sftp stat failed", sftp_);
            return false;
        }
        info = fromAttrs(st);
        info.name.clear();
        return true;
    }

    bool openRead(const std::string &remote_path, std::unique_ptr<RemoteFile> &out,
                  std::string &err) override {
        if (!sftp_) {
            err = "not connected";
            return false;
        }
        LIBSSH2_SFTP_HANDLE *h = libssh2_sftp_open_ex(
            sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
            LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
        if (!h) {
            err = sftpError("could not open remote file for reading", sftp_);
            return false;
        }
        out = std::make_unique<Libssh2File>(sftp_, h);
        return true;
    }

    bool openWrite(const std::string &remote_path, std::uint32_t mode,
                   std::unique_ptr<RemoteFile> &out, std::string &err) override {
        if (!sftp_) {
            err = "not connected";
            return false;
        }
        LIBSSH2_SFTP_HANDLE *h = libssh2_sftp_open_ex(
            sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
            LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
            static_cast<long>(mode), LIBSSH2_SFTP_OPENFILE);
        if (!h) {
            err = sftpError("could not open remote file for writing", sftp_);
            return false;
        }
        out = std::make_unique<Libssh2File>(sftp_, h);
        return true;
    }

    bool mkdir(const std::string &remote_dir, std::string &err, unsigned int mode) override {
        if (!sftp_) {
            err = "not connected";
            return false;
        }
        if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), static_cast<long>(mode)) != 0) {
            err = sftpError("sftp mkdir failed", sftp_);
            return false;
        }
        return true;
    }

    bool removeFile(const std::string &remote_path, std::string &err) override {
        if (!sftp_) {
            err = "not connected";
            return false;
        }
        if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
            err = sftpError("sftp unlink failed", sftp_);
            return false;
        }
        return true;
    }

    bool removeDir(const std::string &remote_dir, std::string &err) override {
        if (!sftp_) {
            err = "not connected";
            return false;
        }
        if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
            err = sftpError("sftp rmdir failed (directory not empty?)", sftp_);
            return false;
        }
        return true;
    }

    bool rename(const std::string &from, const std::string &to, std::string &err,
                bool overwrite) override {
        if (!sftp_) {
            err = "not connected";
            return false;
        }
        long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
        if (overwrite) flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
        const int rc = libssh2_sftp_rename_ex(sftp_, from.c_str(),
                                              static_cast<unsigned>(from.size()),
                                              to.c_str(), static_cast<unsigned>(to.size()),
                                              flags);
        if (rc != 0) {
            err = sftpError("sftp rename failed", sftp_);
            return false;
        }
        return true;
    }

    bool chmod(const std::string &remote_path, std::uint32_t mode, std::string &err) override {
        if (!sftp_) {
            err = "not connected";
            return false;
        }
        LIBSSH2_SFTP_ATTRIBUTES a{};
        a.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
        a.permissions = mode;
        const int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                                            static_cast<unsigned>(remote_path.size()),
                                            LIBSSH2_SFTP_SETSTAT, &a);
        if (rc != 0) {
            err = sftpError("sftp chmod failed", sftp_);
            return false;
        }
        return true;
    }

    bool close(std::string &err) override {
        if (!sftp_)
            return true;
        const int rc = libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
        if (rc != 0) {
            err = "sftp shutdown failed";
            return false;
        }
        return true;
    }

private:
    LIBSSH2_SFTP *sftp_;
};

// Context for keyboard-interactive: answers username or password by prompt text.
struct KbdIntCtx {
    const char *user;
    const char *pass;
};

char *dupResponse(const char *s, std::size_t len) {
    char *buf = static_cast<char *>(std::malloc(len + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    return buf;
}

void kbint_password_callback(const char *name, int name_len,
                             const char *instruction, int instruction_len,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                             void **abstract) {
    (void)name; (void)name_len; (void)instruction; (void)instruction_len;
    if (!abstract || !*abstract) return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt;
        if (prompts && prompts[i].text)
            prompt.assign(reinterpret_cast<const char *>(prompts[i].text), prompts[i].length);
        std::transform(prompt.begin(), prompt.end(), prompt.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        // Simple heuristic: prompts mentioning "user" or "name" get the username.
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char *ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = alen ? dupResponse(ans, alen) : nullptr;
        responses[i].length = responses[i].text ? static_cast<unsigned int>(alen) : 0;
    }
}

bool isSocketFailure(int rc) {
    return rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
           rc == LIBSSH2_ERROR_SOCKET_SEND ||
           rc == LIBSSH2_ERROR_SOCKET_RECV ||
           rc == LIBSSH2_ERROR_TIMEOUT;
}

long long remainingMs(const Context &ctx, std::chrono::milliseconds timeout,
                      std::chrono::steady_clock::time_point started) {
    using namespace std::chrono;
    long long left = -1; // -1 = unbounded
    if (timeout.count() > 0)
        left = std::max<long long>(0, (timeout - duration_cast<milliseconds>(
                                                     steady_clock::now() - started)).count());
    if (const auto dl = ctx.deadline()) {
        const long long ctxLeft = std::max<long long>(
            0, duration_cast<milliseconds>(*dl - steady_clock::now()).count());
        left = (left < 0) ? ctxLeft : std::min(left, ctxLeft);
    }
    return left;
}

bool tcpConnect(const Context &ctx, const std::string &host, std::uint16_t port,
                std::chrono::milliseconds timeout, int &sockOut, Error &err) {
    const auto started = std::chrono::steady_clock::now();
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    const int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0)
        return fail(err, ErrorKind::Connection,
                    std::string("getaddrinfo ") + host + ": " + gai_strerror(gai));

    std::string lastErr = "no usable address";
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        if (ctx.err(err)) {
            freeaddrinfo(res);
            return false;
        }
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // TCP keepalive
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            const long long left = remainingMs(ctx, timeout, started);
            const int prc = ::poll(&pfd, 1, left < 0 ? -1 : static_cast<int>(left));
            if (prc == 1) {
                int soErr = 0;
                socklen_t len = sizeof(soErr);
                ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len);
                rc = soErr == 0 ? 0 : -1;
                if (soErr != 0) errno = soErr;
            } else if (prc == 0) {
                errno = ETIMEDOUT;
                rc = -1;
            } else {
                rc = -1;
            }
        }
        if (rc == 0) {
            // back to blocking mode; libssh2 runs blocking with its own timeout
            ::fcntl(s, F_SETFL, flags);
            sockOut = s;
            freeaddrinfo(res);
            return true;
        }
        lastErr = std::strerror(errno);
        ::close(s);
    }
    freeaddrinfo(res);
    return fail(err, ErrorKind::Connection,
                "could not connect to " + host + ":" + std::to_string(port) + ": " + lastErr);
}

std::string hostKeyAlgName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
    case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
    default: return "UNKNOWN";
    }
}

int knownHostKeyMask(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA: return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS: return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519: return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default: return 0;
    }
}

std::string sha256Fingerprint(LIBSSH2_SESSION *session) {
    const unsigned char *h = reinterpret_cast<const unsigned char *>(
        libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256));
    if (!h) return {};
    std::ostringstream oss;
    oss << "SHA256:";
    for (int i = 0; i < 32; ++i) {
        if (i) oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    return oss.str();
}

// Host key verification according to the known_hosts policy.
bool verifyHostKey(LIBSSH2_SESSION *session, const AuthConfig &target, Error &err) {
    if (target.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session);
    if (!nh)
        return fail(err, ErrorKind::Connection, "could not initialize known_hosts");

    std::string khPath;
    if (target.known_hosts_path.has_value()) {
        khPath = *target.known_hosts_path;
    } else if (const char *home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }
    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(),
                                              LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && target.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        return fail(err, ErrorKind::Authentication,
                    "known_hosts missing or unreadable (strict policy)");
    }

    std::size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        return fail(err, ErrorKind::Connection, "could not read server host key");
    }

    const int alg = knownHostKeyMask(keytype);
    const int port = target.port;
    struct libssh2_knownhost *host = nullptr;
    int check = libssh2_knownhost_checkp(nh, target.host.c_str(), port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                         &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH)
        check = libssh2_knownhost_checkp(nh, target.host.c_str(), port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                         &host);

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (target.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        const std::string algName = hostKeyAlgName(keytype);
        const std::string fp = sha256Fingerprint(session);
        if (sensitiveLoggingEnabled())
            qCInfo(sftpkitSsh) << "unknown host key" << QString::fromStdString(target.host)
                               << QString::fromStdString(algName) << QString::fromStdString(fp);
        const bool confirmed = target.hostkey_confirm_cb &&
                               target.hostkey_confirm_cb(target.host, static_cast<std::uint16_t>(port),
                                                         algName, fp);
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            return fail(err, ErrorKind::Authentication,
                        "unknown host: fingerprint not confirmed");
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            return fail(err, ErrorKind::Configuration, "known_hosts path not defined");
        }
        const int addrc = libssh2_knownhost_addc(nh, target.host.c_str(), nullptr, hostkey, keylen,
                                                 nullptr, 0,
                                                 LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                                 nullptr);
        const bool written = addrc == 0 &&
                             libssh2_knownhost_writefile(nh, khPath.c_str(),
                                                         LIBSSH2_KNOWNHOST_FILE_OPENSSH) == 0;
        libssh2_knownhost_free(nh);
        if (!written)
            return fail(err, ErrorKind::Connection, "could not write host to known_hosts");
        return true;
    }

    libssh2_knownhost_free(nh);
    if (target.known_hosts_policy == KnownHostsPolicy::Strict ||
        check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        return fail(err, ErrorKind::Authentication,
                    check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH
                        ? "host key does not match known_hosts"
                        : "host unknown in known_hosts");
    }
    return true;
}

// Retries a blocking libssh2 call that may still report EAGAIN.
template <typename Fn> int retryEagain(Fn fn) {
    int rc;
    for (;;) {
        rc = fn();
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return rc;
}

bool authenticate(LIBSSH2_SESSION *session, const std::vector<Credential> &credentials,
                  Error &err) {
    std::string lastErr;
    for (const Credential &c : credentials) {
        int rc = -1;
        if (c.type == Credential::Type::Password) {
            rc = retryEagain([&]() {
                return libssh2_userauth_password(session, c.username.c_str(), c.secret.c_str());
            });
            if (isSocketFailure(rc))
                return fail(err, ErrorKind::Connection,
                            "server closed the connection during password auth");
            if (rc != 0) {
                // Password failed but the session is alive: try keyboard-interactive.
                const char *methods = libssh2_userauth_list(
                    session, c.username.c_str(), static_cast<unsigned>(c.username.size()));
                if (methods && std::strstr(methods, "keyboard-interactive")) {
                    KbdIntCtx kctx{c.username.c_str(), c.secret.c_str()};
                    void **abs = libssh2_session_abstract(session);
                    if (abs) *abs = &kctx;
                    rc = retryEagain([&]() {
                        return libssh2_userauth_keyboard_interactive(session, c.username.c_str(),
                                                                     kbint_password_callback);
                    });
                    if (abs) *abs = nullptr;
                }
            }
        } else {
            const char *passphrase = c.passphrase ? c.passphrase->c_str() : nullptr;
            rc = retryEagain([&]() {
                return libssh2_userauth_publickey_frommemory(
                    session, c.username.c_str(), c.username.size(), nullptr, 0,
                    c.secret.data(), c.secret.size(), passphrase);
            });
            if (isSocketFailure(rc))
                return fail(err, ErrorKind::Connection,
                            "server closed the connection during key auth");
        }
        if (rc == 0)
            return true;
        lastErr = lastSessionError(session);
    }
    std::string msg = "all authentication methods were rejected";
    if (!lastErr.empty() && sensitiveLoggingEnabled())
        msg += " (" + lastErr + ")";
    return fail(err, ErrorKind::Authentication, msg);
}

} // namespace

Libssh2Connector::Libssh2Connector() {
    std::call_once(g_libssh2_once, []() { g_libssh2_init_rc = libssh2_init(0); });
}

bool Libssh2Connector::connect(const Context &ctx, const AuthConfig &target,
                               const std::vector<Credential> &credentials,
                               std::chrono::milliseconds timeout, Connection &out,
                               Error &err) {
    if (g_libssh2_init_rc != 0)
        return fail(err, ErrorKind::Connection, "libssh2_init failed");
    if (credentials.empty())
        return fail(err, ErrorKind::Authentication, "no credentials to authenticate with");
    if (ctx.err(err))
        return false;

    auto transport = std::make_unique<Libssh2Transport>();
    if (!tcpConnect(ctx, target.host, static_cast<std::uint16_t>(target.port), timeout,
                    transport->sock_, err))
        return false;

    transport->session_ = libssh2_session_init();
    if (!transport->session_)
        return fail(err, ErrorKind::Connection, "libssh2_session_init failed");

    // Blocking mode with a bounded timeout so auth never spins on EAGAIN.
    libssh2_session_set_blocking(transport->session_, 1);
    if (timeout.count() > 0)
        libssh2_session_set_timeout(transport->session_, static_cast<long>(timeout.count()));

    if (libssh2_session_handshake(transport->session_, transport->sock_) != 0)
        return fail(err, ErrorKind::Connection,
                    "SSH handshake failed: " + lastSessionError(transport->session_));

    // SSH keepalive every 30s if the peer allows it.
    libssh2_keepalive_config(transport->session_, 1, 30);

    if (!verifyHostKey(transport->session_, target, err))
        return false;
    if (ctx.err(err))
        return false;
    if (!authenticate(transport->session_, credentials, err))
        return false;

    LIBSSH2_SFTP *sftp = libssh2_sftp_init(transport->session_);
    if (!sftp)
        return fail(err, ErrorKind::Connection,
                    "could not initialize SFTP: " + lastSessionError(transport->session_));

    // No timeout once established; transfers can legitimately take long.
    libssh2_session_set_timeout(transport->session_, 0);

    out.sftp = std::make_unique<Libssh2Session>(sftp);
    out.transport = std::move(transport);
    if (sensitiveLoggingEnabled())
        qCDebug(sftpkitSsh) << "connected" << QString::fromStdString(credentials.front().username)
                            << "@" << QString::fromStdString(target.host) << target.port;
    return true;
}

} // namespace sftpkit

#include "sftpkit/MockSftpServer.hpp"

#include <algorithm>
#include <ctime>
#include <utility>

namespace sftpkit {

namespace {

std::uint64_t nowEpoch() { return static_cast<std::uint64_t>(std::time(nullptr)); }

// Absolute, no duplicate or trailing slashes, "." and ".." resolved.
std::string normalize(const std::string &path) {
    std::vector<std::string> parts;
    std::string cur;
    auto flush = [&]() {
        if (cur.empty() || cur == ".") {
        } else if (cur == "..") {
            if (!parts.empty()) parts.pop_back();
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
    std::string out;
    for (const auto &p : parts) out += "/" + p;
    return out.empty() ? "/" : out;
}

std::string parentOf(const std::string &norm) {
    const auto pos = norm.find_last_of('/');
    if (pos == 0 || pos == std::string::npos) return "/";
    return norm.substr(0, pos);
}

std::string baseOf(const std::string &norm) {
    const auto pos = norm.find_last_of('/');
    return pos == std::string::npos ? norm : norm.substr(pos + 1);
}

bool isChildOf(const std::string &path, const std::string &dir) {
    if (dir == "/") return path != "/";
    return path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 &&
           path[dir.size()] == '/';
}

using State = MockSftpServer::State;
using Node = MockSftpServer::Node;

void ensureParents(State &st, const std::string &norm) {
    std::string p = parentOf(norm);
    std::vector<std::string> missing;
    while (p != "/" && st.fs.find(p) == st.fs.end()) {
        missing.push_back(p);
        p = parentOf(p);
    }
    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        Node n;
        n.is_dir = true;
        n.mode = 040755;
        n.mtime = nowEpoch();
        st.fs[*it] = n;
    }
}

FileInfo toInfo(const std::string &name, const Node &n) {
    FileInfo fi;
    fi.name = name;
    fi.is_dir = n.is_dir;
    fi.size = n.is_dir ? 0 : n.data.size();
    fi.mtime = n.mtime;
    fi.mode = n.mode;
    return fi;
}

// Per-connection flags shared by the transport and the SFTP halves.
struct Link {
    std::shared_ptr<std::atomic<bool>> dropped = std::make_shared<std::atomic<bool>>(false);
    std::atomic<bool> sftpOpen{true};
    std::atomic<bool> transportOpen{true};
};

class MockFile : public RemoteFile {
public:
    MockFile(std::shared_ptr<State> st, std::shared_ptr<Link> link, std::string path, bool writing)
        : st_(std::move(st)), link_(std::move(link)), path_(std::move(path)), writing_(writing) {}

    long long read(char *buf, std::size_t len, std::string &err) override {
        if (!alive(err)) return -1;
        std::lock_guard<std::mutex> lk(st_->mtx);
        auto it = st_->fs.find(path_);
        if (it == st_->fs.end()) {
            err = "file vanished: " + path_;
            return -1;
        }
        const std::string &data = it->second.data;
        if (offset_ >= data.size()) return 0;
        const std::size_t n = std::min(len, data.size() - offset_);
        std::copy(data.begin() + static_cast<std::ptrdiff_t>(offset_),
                  data.begin() + static_cast<std::ptrdiff_t>(offset_ + n), buf);
        offset_ += n;
        return static_cast<long long>(n);
    }

    long long write(const char *buf, std::size_t len, std::string &err) override {
        if (!alive(err)) return -1;
        if (!writing_) {
            err = "file not opened for writing: " + path_;
            return -1;
        }
        std::lock_guard<std::mutex> lk(st_->mtx);
        auto it = st_->fs.find(path_);
        if (it == st_->fs.end()) {
            err = "file vanished: " + path_;
            return -1;
        }
        Node &n = it->second;
        if (n.data.size() < offset_ + len) n.data.resize(offset_ + len);
        std::copy(buf, buf + len, n.data.begin() + static_cast<std::ptrdiff_t>(offset_));
        n.mtime = nowEpoch();
        offset_ += len;
        return static_cast<long long>(len);
    }

    bool close(std::string &) override {
        closed_ = true;
        return true;
    }

private:
    bool alive(std::string &err) const {
        if (closed_) {
            err = "file already closed";
            return false;
        }
        if (*link_->dropped || !link_->sftpOpen) {
            err = "connection lost";
            return false;
        }
        return true;
    }

    std::shared_ptr<State> st_;
    std::shared_ptr<Link> link_;
    std::string path_;
    bool writing_;
    std::size_t offset_ = 0;
    bool closed_ = false;
};

class MockSession : public SftpSession {
public:
    MockSession(std::shared_ptr<State> st, std::shared_ptr<Link> link)
        : st_(std::move(st)), link_(std::move(link)) {}

    bool isOpen() const override { return link_->sftpOpen; }

    bool realpath(const std::string &path, std::string &out, std::string &err) override {
        if (!alive(err)) return false;
        out = normalize(path);
        return true;
    }

    bool list(const std::string &remote_path, std::vector<FileInfo> &out,
              std::string &err) override {
        if (!alive(err)) return false;
        const std::string dir = normalize(remote_path);
        std::lock_guard<std::mutex> lk(st_->mtx);
        auto it = st_->fs.find(dir);
        if (it == st_->fs.end() || !it->second.is_dir) {
            err = "not a directory: " + dir;
            return false;
        }
        out.clear();
        for (const auto &kv : st_->fs) {
            if (isChildOf(kv.first, dir) && parentOf(kv.first) == dir)
                out.push_back(toInfo(baseOf(kv.first), kv.second));
        }
        std::sort(out.begin(), out.end(), [](const FileInfo &a, const FileInfo &b) {
            if (a.is_dir != b.is_dir) return a.is_dir > b.is_dir; // directories first
            return a.name < b.name;
        });
        return true;
    }

    bool stat(const std::string &remote_path, FileInfo &info, std::string &err) override {
        if (!alive(err)) return false;
        const std::string p = normalize(remote_path);
        std::lock_guard<std::mutex> lk(st_->mtx);
        auto it = st_->fs.find(p);
        if (it == st_->fs.end()) {
            err.clear();
            return false;
        }
        info = toInfo(std::string(), it->second);
        return true;
    }

    bool openRead(const std::string &remote_path, std::unique_ptr<RemoteFile> &out,
                  std::string &err) override {
        if (!alive(err)) return false;
        const std::string p = normalize(remote_path);
        std::lock_guard<std::mutex> lk(st_->mtx);
        auto it = st_->fs.find(p);
        if (it == st_->fs.end() || it->second.is_dir) {
            err = "no such file: " + p;
            return false;
        }
        out = std::make_unique<MockFile>(st_, link_, p, false);
        return true;
    }

    bool openWrite(const std::string &remote_path, std::uint32_t mode,
                   std::unique_ptr<RemoteFile> &out, std::string &err) override {
        if (!alive(err)) return false;
        const std::string p = normalize(remote_path);
        std::lock_guard<std::mutex> lk(st_->mtx);
        auto parent = st_->fs.find(parentOf(p));
        if (parent == st_->fs.end() || !parent->second.is_dir) {
            err = "parent directory missing: " + parentOf(p);
            return false;
        }
        auto it = st_->fs.find(p);
        if (it != st_->fs.end() && it->second.is_dir) {
            err = "is a directory: " + p;
            return false;
        }
        Node &n = st_->fs[p];
        if (it == st_->fs.end()) n.mode = 0100000 | (mode & 07777);
        n.data.clear();
        n.mtime = nowEpoch();
        out = std::make_unique<MockFile>(st_, link_, p, true);
        return true;
    }

    bool mkdir(const std::string &remote_dir, std::string &err, unsigned int mode) override {
        if (!alive(err)) return false;
        const std::string p = normalize(remote_dir);
        std::lock_guard<std::mutex> lk(st_->mtx);
        if (st_->fs.count(p)) {
            err = "already exists: " + p;
            return false;
        }
        auto parent = st_->fs.find(parentOf(p));
        if (parent == st_->fs.end() || !parent->second.is_dir) {
            err = "parent directory missing: " + parentOf(p);
            return false;
        }
        Node n;
        n.is_dir = true;
        n.mode = 040000 | (mode & 07777);
        n.mtime = nowEpoch();
        st_->fs[p] = n;
        return true;
    }

    bool removeFile(const std::string &remote_path, std::string &err) override {
        if (!alive(err)) return false;
        const std::string p = normalize(remote_path);
        std::lock_guard<std::mutex> lk(st_->mtx);
        auto it = st_->fs.find(p);
        if (it == st_->fs.end() || it->second.is_dir) {
            err = "no such file: " + p;
            return false;
        }
        st_->fs.erase(it);
        return true;
    }

    bool removeDir(const std::string &remote_dir, std::string &err) override {
        if (!alive(err)) return false;
        const std::string p = normalize(remote_dir);
        std::lock_guard<std::mutex> lk(st_->mtx);
        auto it = st_->fs.find(p);
        if (p == "/" || it == st_->fs.end() || !it->second.is_dir) {
            err = "no such directory: " + p;
            return false;
        }
        for (const auto &kv : st_->fs) {
            if (isChildOf(kv.first, p)) {
                err = "directory not empty: " + p;
                return false;
            }
        }
        st_->fs.erase(it);
        return true;
    }

    bool rename(const std::string &from, const std::string &to, std::string &err,
                bool overwrite) override {
        if (!alive(err)) return false;
        const std::string src = normalize(from);
        const std::string dst = normalize(to);
        std::lock_guard<std::mutex> lk(st_->mtx);
        auto it = st_->fs.find(src);
        if (it == st_->fs.end()) {
            err = "no such file: " + src;
            return false;
        }
        if (src == dst) return true;
        if (isChildOf(dst, src)) {
            err = "cannot move a directory into itself: " + dst;
            return false;
        }
        auto parent = st_->fs.find(parentOf(dst));
        if (parent == st_->fs.end() || !parent->second.is_dir) {
            err = "parent directory missing: " + parentOf(dst);
            return false;
        }
        auto existing = st_->fs.find(dst);
        if (existing != st_->fs.end()) {
            if (!overwrite || existing->second.is_dir) {
                err = "destination exists: " + dst;
                return false;
            }
            st_->fs.erase(existing);
        }
        std::vector<std::pair<std::string, Node>> moved;
        for (auto i = st_->fs.begin(); i != st_->fs.end();) {
            if (i->first == src || isChildOf(i->first, src)) {
                moved.emplace_back(dst + i->first.substr(src.size()), i->second);
                i = st_->fs.erase(i);
            } else {
                ++i;
            }
        }
        for (auto &m : moved) st_->fs[m.first] = std::move(m.second);
        return true;
    }

    bool chmod(const std::string &remote_path, std::uint32_t mode, std::string &err) override {
        if (!alive(err)) return false;
        const std::string p = normalize(remote_path);
        std::lock_guard<std::mutex> lk(st_->mtx);
        if (st_->chmodFails) {
            err = "permission denied: " + p;
            return false;
        }
        auto it = st_->fs.find(p);
        if (it == st_->fs.end()) {
            err = "no such file: " + p;
            return false;
        }
        it->second.mode = (it->second.mode & ~07777u) | (mode & 07777);
        return true;
    }

    bool close(std::string &err) override {
        if (!link_->sftpOpen.exchange(false))
            return true;
        std::lock_guard<std::mutex> lk(st_->mtx);
        if (st_->closeFails) {
            err = "sftp shutdown failed";
            return false;
        }
        return true;
    }

private:
    bool alive(std::string &err) const {
        if (!link_->sftpOpen) {
            err = "sftp session closed";
            return false;
        }
        if (*link_->dropped || !link_->transportOpen) {
            err = "connection lost";
            return false;
        }
        return true;
    }

    std::shared_ptr<State> st_;
    std::shared_ptr<Link> link_;
};

class MockTransport : public Transport {
public:
    MockTransport(std::shared_ptr<State> st, std::shared_ptr<Link> link)
        : st_(std::move(st)), link_(std::move(link)) {}

    bool isOpen() const override { return link_->transportOpen; }

    bool close(std::string &err) override {
        if (!link_->transportOpen.exchange(false))
            return true;
        std::lock_guard<std::mutex> lk(st_->mtx);
        if (link_->sftpOpen) ++st_->outOfOrder;
        --st_->open;
        ++st_->closed;
        if (st_->closeFails) {
            err = "ssh disconnect failed";
            return false;
        }
        return true;
    }

private:
    std::shared_ptr<State> st_;
    std::shared_ptr<Link> link_;
};

} // namespace

MockSftpServer::MockSftpServer() : state_(std::make_shared<State>()) {
    Node root;
    root.is_dir = true;
    root.mode = 040755;
    root.mtime = nowEpoch();
    state_->fs["/"] = root;
}

MockSftpServer::~MockSftpServer() = default;

void MockSftpServer::addPasswordUser(const std::string &user, const std::string &password) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->passwords[user] = password;
}

void MockSftpServer::addKeyUser(const std::string &user, const std::string &keyData,
                                std::optional<std::string> passphrase) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->keys[user] = State::KeyEntry{keyData, std::move(passphrase)};
}

bool MockSftpServer::connect(const Context &ctx, const AuthConfig &target,
                             const std::vector<Credential> &credentials,
                             std::chrono::milliseconds timeout, Connection &out,
                             Error &err) {
    (void)timeout;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        ++state_->dials;
        delay = state_->dialDelay;
    }
    if (ctx.err(err))
        return false;
    if (delay.count() > 0 && !ctx.sleepFor(delay)) {
        if (!ctx.err(err))
            fail(err, ErrorKind::Canceled, "dial interrupted");
        return false;
    }

    std::lock_guard<std::mutex> lk(state_->mtx);
    if (state_->failDials > 0) {
        --state_->failDials;
        return fail(err, state_->failKind, "injected dial failure for " + target.host);
    }

    bool accepted = false;
    for (const Credential &c : credentials) {
        if (c.type == Credential::Type::Password) {
            auto it = state_->passwords.find(c.username);
            if (state_->passwords.empty() || (it != state_->passwords.end() && it->second == c.secret))
                accepted = true;
        } else {
            auto it = state_->keys.find(c.username);
            if (it != state_->keys.end() && it->second.data == c.secret &&
                it->second.passphrase == c.passphrase)
                accepted = true;
        }
        if (accepted) break;
    }
    if (!accepted)
        return fail(err, ErrorKind::Authentication,
                    "authentication rejected by " + target.host);

    auto link = std::make_shared<Link>();
    state_->links.push_back(link->dropped);
    ++state_->open;
    out.transport = std::make_unique<MockTransport>(state_, link);
    out.sftp = std::make_unique<MockSession>(state_, link);
    return true;
}

void MockSftpServer::putFile(const std::string &path, const std::string &data, std::uint32_t mode) {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(state_->mtx);
    ensureParents(*state_, p);
    Node &n = state_->fs[p];
    n.is_dir = false;
    n.data = data;
    n.mode = 0100000 | (mode & 07777);
    n.mtime = nowEpoch();
}

void MockSftpServer::makeDir(const std::string &path) {
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(state_->mtx);
    ensureParents(*state_, p);
    Node &n = state_->fs[p];
    n.is_dir = true;
    n.mode = 040755;
    n.mtime = nowEpoch();
}

bool MockSftpServer::readFile(const std::string &path, std::string &out) const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->fs.find(normalize(path));
    if (it == state_->fs.end() || it->second.is_dir) return false;
    out = it->second.data;
    return true;
}

bool MockSftpServer::exists(const std::string &path) const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->fs.count(normalize(path)) > 0;
}

bool MockSftpServer::isDir(const std::string &path) const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->fs.find(normalize(path));
    return it != state_->fs.end() && it->second.is_dir;
}

void MockSftpServer::setMtime(const std::string &path, std::uint64_t mtime) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->fs.find(normalize(path));
    if (it != state_->fs.end()) it->second.mtime = mtime;
}

std::uint32_t MockSftpServer::modeOf(const std::string &path) const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->fs.find(normalize(path));
    return it == state_->fs.end() ? 0 : it->second.mode;
}

void MockSftpServer::failNextDials(int count, ErrorKind kind) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->failDials = count;
    state_->failKind = kind;
}

void MockSftpServer::setDialDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->dialDelay = delay;
}

void MockSftpServer::dropOpenSessions() {
    std::lock_guard<std::mutex> lk(state_->mtx);
    for (auto &l : state_->links) *l = true;
    state_->links.clear();
}

void MockSftpServer::setChmodFails(bool fails) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->chmodFails = fails;
}

void MockSftpServer::setCloseFails(bool fails) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->closeFails = fails;
}

int MockSftpServer::dialCount() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->dials;
}

int MockSftpServer::openSessions() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->open;
}

int MockSftpServer::closedSessions() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->closed;
}

int MockSftpServer::outOfOrderCloses() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->outOfOrder;
}

} // namespace sftpkit

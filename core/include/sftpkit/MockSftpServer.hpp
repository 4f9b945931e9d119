// In-memory SFTP backend used by the unit tests.
// Every connection dialed through one MockSftpServer sees the same simulated
// filesystem. Faults (failed dials, dropped sessions) can be injected.
#pragma once
#include "SftpSession.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sftpkit {

class MockSftpServer : public Connector {
public:
    MockSftpServer();
    ~MockSftpServer() override;

    // Accepted credentials. With none registered, any password is accepted.
    void addPasswordUser(const std::string &user, const std::string &password);
    void addKeyUser(const std::string &user, const std::string &keyData,
                    std::optional<std::string> passphrase = std::nullopt);

    bool connect(const Context &ctx,
                 const AuthConfig &target,
                 const std::vector<Credential> &credentials,
                 std::chrono::milliseconds timeout,
                 Connection &out,
                 Error &err) override;

    // Filesystem helpers (parents are created as needed).
    void putFile(const std::string &path, const std::string &data,
                 std::uint32_t mode = 0644);
    void makeDir(const std::string &path);
    bool readFile(const std::string &path, std::string &out) const;
    bool exists(const std::string &path) const;
    bool isDir(const std::string &path) const;
    void setMtime(const std::string &path, std::uint64_t mtime);
    std::uint32_t modeOf(const std::string &path) const;

    // Fault injection.
    void failNextDials(int count, ErrorKind kind = ErrorKind::Connection);
    void setDialDelay(std::chrono::milliseconds delay);
    // Every session currently open stops answering (simulates a dropped link).
    void dropOpenSessions();
    void setChmodFails(bool fails);
    // Closing still tears the session down, but both layers report an error.
    void setCloseFails(bool fails);

    int dialCount() const;
    int openSessions() const;
    int closedSessions() const;
    // Connections whose transport was closed while the SFTP layer was still up.
    int outOfOrderCloses() const;

    struct Node {
        bool is_dir = false;
        std::string data;
        std::uint32_t mode = 0644;
        std::uint64_t mtime = 0;
    };

    struct State {
        mutable std::mutex mtx;
        std::map<std::string, Node> fs;
        std::map<std::string, std::string> passwords;
        struct KeyEntry {
            std::string data;
            std::optional<std::string> passphrase;
        };
        std::map<std::string, KeyEntry> keys;
        int failDials = 0;
        ErrorKind failKind = ErrorKind::Connection;
        std::chrono::milliseconds dialDelay{0};
        bool chmodFails = false;
        bool closeFails = false;
        int dials = 0;
        int open = 0;
        int closed = 0;
        int outOfOrder = 0;
        std::vector<std::shared_ptr<std::atomic<bool>>> links;
    };

private:
    std::shared_ptr<State> state_;
};

} // namespace sftpkit

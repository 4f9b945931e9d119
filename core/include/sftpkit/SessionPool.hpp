// Bounded pool of authenticated SFTP sessions shared by concurrent callers.
#pragma once
#include "Auth.hpp"
#include "Config.hpp"
#include "Context.hpp"
#include "Errors.hpp"
#include "Retrier.hpp"
#include "SftpSession.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace sftpkit {

// What the transfer client needs from a pool. A session handed out by
// getConnection stays valid until it is released, even if the pool is
// closed in the meantime.
class ConnectionManager {
public:
    virtual ~ConnectionManager() = default;

    virtual bool getConnection(const Context &ctx,
                               std::shared_ptr<SftpSession> &out,
                               Error &err) = 0;
    // ConnectionNotFound when the session is not currently borrowed from
    // this pool (double release or foreign session).
    virtual bool releaseConnection(const std::shared_ptr<SftpSession> &session,
                                   Error &err) = 0;
    // Idempotent.
    virtual bool close(Error &err) = 0;
};

struct PoolStats {
    int total = 0;
    int inUse = 0;
    int idle = 0;
};

class SessionPool : public ConnectionManager {
public:
    // Merges target and config with the defaults and validates them.
    static std::unique_ptr<SessionPool>
    create(std::shared_ptr<const AuthenticationHandler> authHandler,
           const AuthConfig &target,
           const ConnectionConfig &config,
           std::shared_ptr<Connector> connector,
           Error &err);

    ~SessionPool() override;

    SessionPool(const SessionPool &) = delete;
    SessionPool &operator=(const SessionPool &) = delete;

    bool getConnection(const Context &ctx,
                       std::shared_ptr<SftpSession> &out,
                       Error &err) override;
    bool releaseConnection(const std::shared_ptr<SftpSession> &session,
                           Error &err) override;
    bool close(Error &err) override;

    PoolStats stats() const;
    const ConnectionConfig &config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    struct PooledSession {
        Connection conn;
        Clock::time_point lastUsedAt;
        bool inUse = false;
    };

    SessionPool(std::shared_ptr<const AuthenticationHandler> authHandler,
                AuthConfig target, ConnectionConfig config,
                std::shared_ptr<Connector> connector,
                std::unique_ptr<Retrier> retrier);

    // One attempt of the acquire loop.
    bool tryAcquire(const Context &ctx, std::shared_ptr<SftpSession> &out,
                    Error &err);
    bool createSession(const Context &ctx,
                       std::shared_ptr<PooledSession> &out, Error &err);
    bool dial(const Context &ctx, std::shared_ptr<PooledSession> &out,
              Error &err);
    // Runs without the pool lock; the candidate must be claimed.
    bool isHealthy(PooledSession &ps) const;
    // Drops a claimed session from the tracked lists (lock held).
    void untrackLocked(const std::shared_ptr<PooledSession> &ps);
    static bool closeSession(PooledSession &ps, std::string &err);

    void startSweeper();
    void stopSweeper();
    void sweepLoop(std::chrono::milliseconds interval);
    void sweepIdle();

    std::shared_ptr<const AuthenticationHandler> authHandler_;
    AuthConfig target_;
    ConnectionConfig config_;
    std::shared_ptr<Connector> connector_;
    std::unique_ptr<Retrier> retrier_;

    mutable std::mutex mtx_;
    std::vector<std::shared_ptr<PooledSession>> sessions_;
    // Borrowed when the pool closed; closed on release or destruction.
    std::vector<std::shared_ptr<PooledSession>> retired_;
    int pending_ = 0; // slots reserved by dials in flight
    bool closed_ = false;

    std::thread sweeper_;
    std::mutex sweepMtx_;
    std::condition_variable sweepCv_;
    bool stopRequested_ = false;
    std::once_flag stopOnce_;
};

} // namespace sftpkit

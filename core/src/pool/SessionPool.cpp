#include "sftpkit/SessionPool.hpp"
#include "sftpkit/RuntimeLogging.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace sftpkit {

namespace {

bool retryableAcquireError(const Error &e) {
    return e.kind != ErrorKind::ConnectionClosed &&
           e.kind != ErrorKind::Authentication &&
           e.kind != ErrorKind::Configuration && !e.isContextError();
}

bool retryableDialError(const Error &e) {
    return e.kind != ErrorKind::Authentication &&
           e.kind != ErrorKind::Configuration && !e.isContextError();
}

void appendError(std::string &all, const std::string &one) {
    if (!all.empty())
        all += "; ";
    all += one;
}

} // namespace

std::unique_ptr<SessionPool>
SessionPool::create(std::shared_ptr<const AuthenticationHandler> authHandler,
                    const AuthConfig &target, const ConnectionConfig &config,
                    std::shared_ptr<Connector> connector, Error &err) {
    if (!authHandler) {
        fail(err, ErrorKind::Configuration, "authentication handler cannot be null");
        return nullptr;
    }
    if (!connector) {
        fail(err, ErrorKind::Configuration, "connector cannot be null");
        return nullptr;
    }
    const Config &defaults = defaultConfig();
    AuthConfig mergedTarget = mergeAuthConfig(defaults.auth, target);
    ConnectionConfig mergedConfig = mergeConnectionConfig(defaults.connection, config);
    if (!validateAuthConfig(mergedTarget, err) || !validateConnectionConfig(mergedConfig, err))
        return nullptr;
    std::unique_ptr<Retrier> retrier = Retrier::create(mergedConfig.retry_policy, err);
    if (!retrier)
        return nullptr;

    std::unique_ptr<SessionPool> pool(new SessionPool(std::move(authHandler), std::move(mergedTarget),
                                                      std::move(mergedConfig), std::move(connector),
                                                      std::move(retrier)));
    pool->startSweeper();
    return pool;
}

SessionPool::SessionPool(std::shared_ptr<const AuthenticationHandler> authHandler,
                         AuthConfig target, ConnectionConfig config,
                         std::shared_ptr<Connector> connector,
                         std::unique_ptr<Retrier> retrier)
    : authHandler_(std::move(authHandler)), target_(std::move(target)),
      config_(std::move(config)), connector_(std::move(connector)),
      retrier_(std::move(retrier)) {}

SessionPool::~SessionPool() {
    Error err;
    if (!close(err))
        qCWarning(sftpkitPool) << "pool close on destruction:" << QString::fromStdString(err.str());
    stopSweeper();

    std::vector<std::shared_ptr<PooledSession>> leftovers;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        leftovers.swap(retired_);
    }
    for (auto &ps : leftovers) {
        std::string cerr;
        if (!closeSession(*ps, cerr))
            qCWarning(sftpkitPool) << "closing borrowed session:" << QString::fromStdString(cerr);
    }
}

bool SessionPool::getConnection(const Context &ctx, std::shared_ptr<SftpSession> &out,
                                Error &err) {
    out.reset();
    return retrier_->executeWithRetry(
        ctx,
        [this, &out](const Context &c, Error &e) { return tryAcquire(c, out, e); },
        [](int, const Error &e) { return retryableAcquireError(e); }, err);
}

bool SessionPool::tryAcquire(const Context &ctx, std::shared_ptr<SftpSession> &out,
                             Error &err) {
    for (;;) {
        std::shared_ptr<PooledSession> candidate;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_)
                return fail(err, ErrorKind::ConnectionClosed, "connection pool is closed");
            for (auto &ps : sessions_) {
                if (!ps->inUse) {
                    ps->inUse = true; // claimed; other callers skip it
                    candidate = ps;
                    break;
                }
            }
            if (!candidate) {
                if (static_cast<int>(sessions_.size()) + pending_ >= config_.max_connections)
                    return fail(err, ErrorKind::ConnectionPoolFull,
                                "no available connections in the pool");
                ++pending_;
            }
        }

        if (!candidate) {
            std::shared_ptr<PooledSession> created;
            const bool ok = createSession(ctx, created, err);
            std::unique_lock<std::mutex> lk(mtx_);
            --pending_; // the slot becomes a tracked session or is freed
            if (!ok)
                return false;
            if (closed_) {
                lk.unlock();
                std::string cerr;
                if (!closeSession(*created, cerr))
                    qCWarning(sftpkitPool) << "closing session created after pool close:"
                                           << QString::fromStdString(cerr);
                return fail(err, ErrorKind::ConnectionClosed, "connection pool is closed");
            }
            created->inUse = true;
            created->lastUsedAt = Clock::now();
            sessions_.push_back(created);
            qCDebug(sftpkitPool) << "session created; pool size" << sessions_.size();
            out = std::shared_ptr<SftpSession>(created, created->conn.sftp.get());
            return true;
        }

        const bool healthy = isHealthy(*candidate);
        std::unique_lock<std::mutex> lk(mtx_);
        if (healthy && !closed_) {
            candidate->lastUsedAt = Clock::now();
            out = std::shared_ptr<SftpSession>(candidate, candidate->conn.sftp.get());
            return true;
        }
        untrackLocked(candidate);
        const bool poolClosed = closed_;
        lk.unlock();
        std::string cerr;
        if (!closeSession(*candidate, cerr))
            qCDebug(sftpkitPool) << "closing evicted session:" << QString::fromStdString(cerr);
        if (poolClosed)
            return fail(err, ErrorKind::ConnectionClosed, "connection pool is closed");
        qCDebug(sftpkitPool) << "evicted unhealthy session";
    }
}

bool SessionPool::createSession(const Context &ctx, std::shared_ptr<PooledSession> &out,
                                Error &err) {
    return retrier_->executeWithRetry(
        ctx, [this, &out](const Context &c, Error &e) { return dial(c, out, e); },
        [](int, const Error &e) { return retryableDialError(e); }, err);
}

bool SessionPool::dial(const Context &ctx, std::shared_ptr<PooledSession> &out, Error &err) {
    std::vector<Credential> credentials;
    if (!authHandler_->getAuthMethods(credentials, err))
        return false;
    auto ps = std::make_shared<PooledSession>();
    if (!connector_->connect(ctx, target_, credentials, config_.timeout, ps->conn, err)) {
        qCDebug(sftpkitPool) << "dial failed:" << QString::fromStdString(err.str());
        return false;
    }
    if (!ps->conn.transport || !ps->conn.sftp) {
        std::string cerr;
        if (!closeSession(*ps, cerr))
            qCDebug(sftpkitPool) << "closing incomplete session:" << QString::fromStdString(cerr);
        return fail(err, ErrorKind::Connection, "connector returned an incomplete session");
    }
    ps->lastUsedAt = Clock::now();
    out = std::move(ps);
    return true;
}

bool SessionPool::isHealthy(PooledSession &ps) const {
    if (!ps.conn.transport || !ps.conn.sftp)
        return false;
    if (!ps.conn.transport->isOpen() || !ps.conn.sftp->isOpen())
        return false;
    if (Clock::now() - ps.lastUsedAt > config_.idle_timeout)
        return false;
    std::string cwd;
    std::string err;
    return ps.conn.sftp->realpath(".", cwd, err);
}

void SessionPool::untrackLocked(const std::shared_ptr<PooledSession> &ps) {
    sessions_.erase(std::remove(sessions_.begin(), sessions_.end(), ps), sessions_.end());
    retired_.erase(std::remove(retired_.begin(), retired_.end(), ps), retired_.end());
}

bool SessionPool::releaseConnection(const std::shared_ptr<SftpSession> &session, Error &err) {
    if (!session)
        return fail(err, ErrorKind::ConnectionNotFound, "connection not found in pool");

    std::shared_ptr<PooledSession> retired;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto &ps : sessions_) {
            if (ps->conn.sftp.get() == session.get() && ps->inUse) {
                ps->inUse = false;
                ps->lastUsedAt = Clock::now();
                return true;
            }
        }
        auto it = std::find_if(retired_.begin(), retired_.end(), [&](const std::shared_ptr<PooledSession> &ps) {
            return ps->conn.sftp.get() == session.get();
        });
        if (it == retired_.end())
            return fail(err, ErrorKind::ConnectionNotFound, "connection not found in pool");
        retired = *it;
        retired_.erase(it);
    }
    // Pool closed while this session was borrowed.
    std::string cerr;
    if (!closeSession(*retired, cerr))
        qCWarning(sftpkitPool) << "closing released session:" << QString::fromStdString(cerr);
    return true;
}

bool SessionPool::close(Error &err) {
    std::vector<std::shared_ptr<PooledSession>> idle;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_)
            return true;
        closed_ = true;
        for (auto &ps : sessions_) {
            if (ps->inUse)
                retired_.push_back(ps);
            else
                idle.push_back(ps);
        }
        sessions_.clear();
    }
    stopSweeper();

    std::string errors;
    int failed = 0;
    for (auto &ps : idle) {
        std::string cerr;
        if (!closeSession(*ps, cerr)) {
            appendError(errors, cerr);
            ++failed;
        }
    }
    qCInfo(sftpkitPool) << "pool closed;" << idle.size() << "idle sessions closed";
    if (failed > 0)
        return fail(err, ErrorKind::Connection,
                    "failed to close " + std::to_string(failed) + " pooled session(s): " + errors);
    return true;
}

PoolStats SessionPool::stats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    PoolStats s;
    s.total = static_cast<int>(sessions_.size());
    for (const auto &ps : sessions_) {
        if (ps->inUse)
            ++s.inUse;
    }
    s.idle = s.total - s.inUse;
    return s;
}

bool SessionPool::closeSession(PooledSession &ps, std::string &err) {
    bool ok = true;
    std::string e;
    if (ps.conn.sftp && !ps.conn.sftp->close(e)) {
        appendError(err, "sftp: " + e);
        ok = false;
    }
    e.clear();
    if (ps.conn.transport && !ps.conn.transport->close(e)) {
        appendError(err, "transport: " + e);
        ok = false;
    }
    return ok;
}

void SessionPool::startSweeper() {
    if (config_.idle_timeout.count() <= 0)
        return;
    const auto interval = std::clamp<std::chrono::milliseconds>(
        config_.idle_timeout / 2, std::chrono::seconds(1), std::chrono::minutes(1));
    sweeper_ = std::thread([this, interval]() { sweepLoop(interval); });
}

void SessionPool::stopSweeper() {
    std::call_once(stopOnce_, [this]() {
        {
            std::lock_guard<std::mutex> lk(sweepMtx_);
            stopRequested_ = true;
        }
        sweepCv_.notify_all();
        if (sweeper_.joinable())
            sweeper_.join();
    });
}

void SessionPool::sweepLoop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lk(sweepMtx_);
    while (!stopRequested_) {
        if (sweepCv_.wait_for(lk, interval, [this]() { return stopRequested_; }))
            break;
        lk.unlock();
        sweepIdle();
        lk.lock();
    }
}

void SessionPool::sweepIdle() {
    std::vector<std::shared_ptr<PooledSession>> expired;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_)
            return;
        const auto now = Clock::now();
        auto keep = std::partition(sessions_.begin(), sessions_.end(), [&](const std::shared_ptr<PooledSession> &ps) {
            return ps->inUse || now - ps->lastUsedAt <= config_.idle_timeout;
        });
        expired.assign(keep, sessions_.end());
        sessions_.erase(keep, sessions_.end());
    }
    for (auto &ps : expired) {
        std::string cerr;
        if (!closeSession(*ps, cerr))
            qCDebug(sftpkitPool) << "closing idle session:" << QString::fromStdString(cerr);
    }
    if (!expired.empty())
        qCDebug(sftpkitPool) << "sweeper evicted" << expired.size() << "idle sessions";
}

} // namespace sftpkit

// Backoff strategies: delay to wait before the next retry attempt.
#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace sftpkit {

class BackoffStrategy {
public:
    enum class Kind { Fixed, Jitter, Exponential };

    virtual ~BackoffStrategy() = default;

    virtual Kind kind() const = 0;
    // Fills err and returns false when the parameters are unusable.
    virtual bool validate(std::string &err) const = 0;
    // attempt is zero-based: next(0) is the wait after the first failure.
    virtual std::chrono::milliseconds next(int attempt) const = 0;
};

class FixedBackoff : public BackoffStrategy {
public:
    explicit FixedBackoff(std::chrono::milliseconds interval)
        : interval_(interval) {}

    Kind kind() const override { return Kind::Fixed; }
    bool validate(std::string &err) const override;
    std::chrono::milliseconds next(int attempt) const override;

    std::chrono::milliseconds interval() const { return interval_; }

private:
    std::chrono::milliseconds interval_;
};

// base + uniform[0, maxJitter). Safe to call from several threads.
class JitterBackoff : public BackoffStrategy {
public:
    JitterBackoff(std::chrono::milliseconds baseDelay,
                  std::chrono::milliseconds maxJitter);

    Kind kind() const override { return Kind::Jitter; }
    bool validate(std::string &err) const override;
    std::chrono::milliseconds next(int attempt) const override;

    std::chrono::milliseconds baseDelay() const { return baseDelay_; }
    std::chrono::milliseconds maxJitter() const { return maxJitter_; }

private:
    std::chrono::milliseconds baseDelay_;
    std::chrono::milliseconds maxJitter_;
    mutable std::mutex randMu_;
    mutable std::mt19937_64 rng_;
};

// min(base * factor^attempt, maxDelay)
class ExponentialBackoff : public BackoffStrategy {
public:
    ExponentialBackoff(std::chrono::milliseconds baseDelay, double factor,
                       std::chrono::milliseconds maxDelay)
        : baseDelay_(baseDelay), factor_(factor), maxDelay_(maxDelay) {}

    Kind kind() const override { return Kind::Exponential; }
    bool validate(std::string &err) const override;
    std::chrono::milliseconds next(int attempt) const override;

    std::chrono::milliseconds baseDelay() const { return baseDelay_; }
    double factor() const { return factor_; }
    std::chrono::milliseconds maxDelay() const { return maxDelay_; }

private:
    std::chrono::milliseconds baseDelay_;
    double factor_;
    std::chrono::milliseconds maxDelay_;
};

// Validating factories: nullptr + err on invalid parameters.
std::shared_ptr<const BackoffStrategy>
makeFixedBackoff(std::chrono::milliseconds interval, std::string &err);
std::shared_ptr<const BackoffStrategy>
makeJitterBackoff(std::chrono::milliseconds baseDelay,
                  std::chrono::milliseconds maxJitter, std::string &err);
std::shared_ptr<const BackoffStrategy>
makeExponentialBackoff(std::chrono::milliseconds baseDelay, double factor,
                       std::chrono::milliseconds maxDelay, std::string &err);

} // namespace sftpkit

#include "sftpkit/Backoff.hpp"

#include <cmath>

namespace sftpkit {

bool FixedBackoff::validate(std::string &err) const {
    if (interval_.count() <= 0) {
        err = "interval must be greater than 0";
        return false;
    }
    return true;
}

std::chrono::milliseconds FixedBackoff::next(int attempt) const {
    (void)attempt;
    return interval_;
}

JitterBackoff::JitterBackoff(std::chrono::milliseconds baseDelay,
                             std::chrono::milliseconds maxJitter)
    : baseDelay_(baseDelay), maxJitter_(maxJitter),
      rng_(std::random_device{}()) {}

bool JitterBackoff::validate(std::string &err) const {
    if (baseDelay_.count() <= 0) {
        err = "baseDelay must be greater than 0";
        return false;
    }
    if (maxJitter_.count() < 0) {
        err = "maxJitter cannot be negative";
        return false;
    }
    return true;
}

std::chrono::milliseconds JitterBackoff::next(int attempt) const {
    (void)attempt;
    if (maxJitter_.count() <= 0)
        return baseDelay_;
    long long jitter = 0;
    {
        std::lock_guard<std::mutex> lk(randMu_);
        std::uniform_int_distribution<long long> dist(0,
                                                      maxJitter_.count() - 1);
        jitter = dist(rng_);
    }
    return baseDelay_ + std::chrono::milliseconds(jitter);
}

bool ExponentialBackoff::validate(std::string &err) const {
    if (baseDelay_.count() <= 0) {
        err = "baseDelay must be greater than 0";
        return false;
    }
    if (!(factor_ > 1.0)) {
        err = "factor must be greater than 1.0 for exponential growth";
        return false;
    }
    if (maxDelay_ < baseDelay_) {
        err = "maxDelay must be greater than or equal to baseDelay";
        return false;
    }
    return true;
}

std::chrono::milliseconds ExponentialBackoff::next(int attempt) const {
    if (attempt < 0)
        attempt = 0;
    const double delay = static_cast<double>(baseDelay_.count()) *
                         std::pow(factor_, static_cast<double>(attempt));
    // Also covers overflow to +inf for large attempts.
    if (!(delay < static_cast<double>(maxDelay_.count())))
        return maxDelay_;
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

std::shared_ptr<const BackoffStrategy>
makeFixedBackoff(std::chrono::milliseconds interval, std::string &err) {
    auto b = std::make_shared<FixedBackoff>(interval);
    if (!b->validate(err))
        return nullptr;
    return b;
}

std::shared_ptr<const BackoffStrategy>
makeJitterBackoff(std::chrono::milliseconds baseDelay,
                  std::chrono::milliseconds maxJitter, std::string &err) {
    auto b = std::make_shared<JitterBackoff>(baseDelay, maxJitter);
    if (!b->validate(err))
        return nullptr;
    return b;
}

std::shared_ptr<const BackoffStrategy>
makeExponentialBackoff(std::chrono::milliseconds baseDelay, double factor,
                       std::chrono::milliseconds maxDelay, std::string &err) {
    auto b = std::make_shared<ExponentialBackoff>(baseDelay, factor, maxDelay);
    if (!b->validate(err))
        return nullptr;
    return b;
}

} // namespace sftpkit

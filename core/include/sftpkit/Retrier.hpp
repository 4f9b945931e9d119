// Execute-with-retry loop. The caller decides which errors are worth another
// attempt through the shouldRetry predicate.
#pragma once
#include "Backoff.hpp"
#include "Context.hpp"
#include "Errors.hpp"

#include <functional>
#include <memory>

namespace sftpkit {

struct RetryConfig {
    int maxAttempts = 0;
    std::shared_ptr<const BackoffStrategy> backoff;

    bool validate(std::string &err) const;
};

class Retrier {
public:
    using Operation = std::function<bool(const Context &, Error &)>;
    // attempt is one-based (1 after the first failure).
    using ShouldRetry = std::function<bool(int attempt, const Error &)>;

    // nullptr + Configuration error when the config does not validate.
    static std::unique_ptr<Retrier> create(const RetryConfig &config,
                                           Error &err);

    // Runs op until it succeeds, shouldRetry rejects the error, the attempts
    // run out (last error is reported) or ctx ends (context error is
    // reported). A null shouldRetry retries every error.
    bool executeWithRetry(const Context &ctx, const Operation &op,
                          const ShouldRetry &shouldRetry, Error &err) const;

    const RetryConfig &config() const { return config_; }

private:
    explicit Retrier(RetryConfig config) : config_(std::move(config)) {}

    RetryConfig config_;
};

} // namespace sftpkit

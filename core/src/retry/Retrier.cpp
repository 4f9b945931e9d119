#include "sftpkit/Retrier.hpp"

namespace sftpkit {

bool RetryConfig::validate(std::string &err) const {
    if (maxAttempts < 1) {
        err = "maxAttempts must be at least 1";
        return false;
    }
    if (!backoff) {
        err = "backoff strategy must be provided";
        return false;
    }
    std::string berr;
    if (!backoff->validate(berr)) {
        err = "invalid backoff: " + berr;
        return false;
    }
    return true;
}

std::unique_ptr<Retrier> Retrier::create(const RetryConfig &config,
                                         Error &err) {
    std::string verr;
    if (!config.validate(verr)) {
        fail(err, ErrorKind::Configuration,
             "invalid retry configuration: " + verr);
        return nullptr;
    }
    return std::unique_ptr<Retrier>(new Retrier(config));
}

bool Retrier::executeWithRetry(const Context &ctx, const Operation &op,
                               const ShouldRetry &shouldRetry,
                               Error &err) const {
    Error last;
    for (int attempt = 0; attempt < config_.maxAttempts; ++attempt) {
        last.clear();
        if (op(ctx, last)) {
            err.clear();
            return true;
        }
        if (shouldRetry && !shouldRetry(attempt + 1, last)) {
            err = last;
            return false;
        }
        if (attempt + 1 >= config_.maxAttempts)
            break;
        if (!ctx.sleepFor(config_.backoff->next(attempt))) {
            if (!ctx.err(err))
                fail(err, ErrorKind::Canceled, "retry wait interrupted");
            return false;
        }
    }
    err = last;
    return false;
}

} // namespace sftpkit

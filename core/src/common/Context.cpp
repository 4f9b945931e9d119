#include "sftpkit/Context.hpp"
#include "sftpkit/RuntimeLogging.hpp"

#include <algorithm>

namespace sftpkit {

Context::Context() : state_(std::make_shared<State>()) {}

Context::Context(std::shared_ptr<State> state, LogCategoryFn log)
    : state_(std::move(state)), log_(log) {}

Context Context::derive(std::optional<Clock::time_point> deadline) const {
    auto child = std::make_shared<State>();
    bool parentCanceled = false;
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        parentCanceled = state_->canceled;
        child->deadline = state_->deadline;
        if (deadline.has_value() &&
            (!child->deadline.has_value() || *deadline < *child->deadline))
            child->deadline = deadline;
        // Drop registrations of children that no longer exist.
        auto &kids = state_->children;
        kids.erase(std::remove_if(kids.begin(), kids.end(),
                                  [](const std::weak_ptr<State> &w) {
                                      return w.expired();
                                  }),
                   kids.end());
        kids.push_back(child);
    }
    if (parentCanceled)
        child->canceled = true;
    return Context(std::move(child), log_);
}

Context Context::withCancel() const { return derive(std::nullopt); }

Context Context::withTimeout(std::chrono::milliseconds timeout) const {
    return derive(Clock::now() + timeout);
}

Context Context::withDeadline(Clock::time_point deadline) const {
    return derive(deadline);
}

Context Context::withLogging(LogCategoryFn category) const {
    return Context(state_, category);
}

void Context::cancelState(const std::shared_ptr<State> &state) {
    std::vector<std::weak_ptr<State>> children;
    {
        std::lock_guard<std::mutex> lk(state->mtx);
        if (state->canceled)
            return;
        state->canceled = true;
        children.swap(state->children);
    }
    state->cv.notify_all();
    for (auto &w : children) {
        if (auto c = w.lock())
            cancelState(c);
    }
}

void Context::cancel() const { cancelState(state_); }

bool Context::done() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (state_->canceled)
        return true;
    return state_->deadline.has_value() && Clock::now() >= *state_->deadline;
}

bool Context::err(Error &out) const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (state_->canceled) {
        out.kind = ErrorKind::Canceled;
        out.message = "operation canceled";
        return true;
    }
    if (state_->deadline.has_value() && Clock::now() >= *state_->deadline) {
        out.kind = ErrorKind::DeadlineExceeded;
        out.message = "deadline reached";
        return true;
    }
    return false;
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->deadline;
}

bool Context::sleepFor(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lk(state_->mtx);
    const auto until = Clock::now() + d;
    auto wake = until;
    if (state_->deadline.has_value() && *state_->deadline < wake)
        wake = *state_->deadline;
    state_->cv.wait_until(lk, wake, [this]() { return state_->canceled; });
    if (state_->canceled)
        return false;
    return !(state_->deadline.has_value() && Clock::now() >= *state_->deadline);
}

const QLoggingCategory &Context::log() const {
    return log_ ? log_() : sftpkitSilent();
}

} // namespace sftpkit

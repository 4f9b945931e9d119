// Cancellation, deadline and logging scope passed to every blocking call.
// Copies share the same cancellation state; derived contexts (withCancel,
// withTimeout) are cancelled together with their parent.
#pragma once
#include "Errors.hpp"

#include <QLoggingCategory>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace sftpkit {

class Context {
public:
    using Clock = std::chrono::steady_clock;
    using LogCategoryFn = const QLoggingCategory &(*)();

    // Never expires unless cancel() is called on it.
    Context();
    static Context background() { return Context(); }

    Context withCancel() const;
    Context withTimeout(std::chrono::milliseconds timeout) const;
    Context withDeadline(Clock::time_point deadline) const;
    // Same cancellation state, different log destination.
    Context withLogging(LogCategoryFn category) const;

    void cancel() const;
    bool done() const;
    // Returns true and fills out with Canceled/DeadlineExceeded once done.
    bool err(Error &out) const;
    std::optional<Clock::time_point> deadline() const;

    // Sleeps up to d. Returns false if the context ended first.
    bool sleepFor(std::chrono::milliseconds d) const;

    // Falls back to a disabled category when none was supplied.
    const QLoggingCategory &log() const;

private:
    struct State {
        std::mutex mtx;
        std::condition_variable cv;
        bool canceled = false;
        std::optional<Clock::time_point> deadline;
        std::vector<std::weak_ptr<State>> children;
    };

    Context(std::shared_ptr<State> state, LogCategoryFn log);
    Context derive(std::optional<Clock::time_point> deadline) const;
    static void cancelState(const std::shared_ptr<State> &state);

    std::shared_ptr<State> state_;
    LogCategoryFn log_ = nullptr;
};

} // namespace sftpkit

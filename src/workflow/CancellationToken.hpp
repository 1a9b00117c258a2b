#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace drflow {
namespace workflow {

enum class StopReason {
    None,
    Cancelled,   // external request
    TimedOut     // workflow deadline exceeded
};

/**
 * Cooperative cancellation handle shared between an execution and the
 * code waiting on its behalf.
 *
 * Copies share the same state. A child token is stopped whenever its
 * parent is (with the parent's reason), but stopping a child does not
 * affect the parent. Waits on a token wake up as soon as it is stopped.
 */
class CancellationToken {
public:
    CancellationToken();

    /**
     * New token linked to this one
     */
    CancellationToken child() const;

    /**
     * Stop this token and all its children; the first reason wins
     */
    void cancel(StopReason reason = StopReason::Cancelled) const;

    bool isCancelled() const;
    StopReason reason() const;

    /**
     * Sleep for `duration` unless stopped first.
     * Returns true if the token was stopped.
     */
    bool waitFor(std::chrono::milliseconds duration) const;

    /**
     * Sleep until `deadline` unless stopped first.
     * Returns true if the token was stopped.
     */
    bool waitUntil(std::chrono::steady_clock::time_point deadline) const;

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        StopReason reason = StopReason::None;
        std::vector<std::weak_ptr<State>> children;
    };

    explicit CancellationToken(std::shared_ptr<State> state);

    static void stop(const std::shared_ptr<State>& state, StopReason reason);

    std::shared_ptr<State> m_state;
};

} // namespace workflow
} // namespace drflow

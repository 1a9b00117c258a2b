#include "workflow/CancellationToken.hpp"
#include <algorithm>

namespace drflow {
namespace workflow {

CancellationToken::CancellationToken()
    : m_state(std::make_shared<State>())
{}

CancellationToken::CancellationToken(std::shared_ptr<State> state)
    : m_state(std::move(state))
{}

CancellationToken CancellationToken::child() const {
    auto childState = std::make_shared<State>();
    StopReason inherited = StopReason::None;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        inherited = m_state->reason;
        if (inherited == StopReason::None) {
            // Drop links to children that no longer exist
            auto& children = m_state->children;
            children.erase(
                std::remove_if(children.begin(), children.end(),
                    [](const std::weak_ptr<State>& w) { return w.expired(); }),
                children.end());
            children.push_back(childState);
        }
    }
    if (inherited != StopReason::None) {
        childState->reason = inherited;
    }
    return CancellationToken(std::move(childState));
}

void CancellationToken::cancel(StopReason reason) const {
    if (reason == StopReason::None) return;
    stop(m_state, reason);
}

void CancellationToken::stop(const std::shared_ptr<State>& state, StopReason reason) {
    std::vector<std::weak_ptr<State>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->reason != StopReason::None) return;
        state->reason = reason;
        children.swap(state->children);
    }
    state->cv.notify_all();

    for (const auto& weak : children) {
        if (auto child = weak.lock()) {
            stop(child, reason);
        }
    }
}

bool CancellationToken::isCancelled() const {
    return reason() != StopReason::None;
}

StopReason CancellationToken::reason() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->reason;
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    return waitUntil(std::chrono::steady_clock::now() + duration);
}

bool CancellationToken::waitUntil(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    return m_state->cv.wait_until(lock, deadline, [this] {
        return m_state->reason != StopReason::None;
    });
}

} // namespace workflow
} // namespace drflow

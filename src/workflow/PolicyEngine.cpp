#include "workflow/PolicyEngine.hpp"
#include "workflow/Errors.hpp"
#include <algorithm>
#include <cmath>

namespace drflow {
namespace workflow {

bool PolicyEngine::matches(const std::vector<std::string>& matchers, const std::string& error) {
    for (const auto& matcher : matchers) {
        if (matcher == errors::ALL || matcher == error) {
            return true;
        }
    }
    return false;
}

std::chrono::milliseconds PolicyEngine::retryDelay(const RetryPolicy& policy, int attempt) {
    double seconds = policy.intervalSeconds * std::pow(policy.backoffRate, std::max(attempt - 1, 0));
    if (policy.maxDelaySeconds) {
        seconds = std::min(seconds, *policy.maxDelaySeconds);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

PolicyDecision PolicyEngine::decide(const std::string& error,
                                    const std::vector<RetryPolicy>& retriers,
                                    const std::vector<CatchPolicy>& catchers,
                                    const std::vector<int>& retryCounts) {
    PolicyDecision decision;

    for (size_t i = 0; i < retriers.size(); ++i) {
        const auto& retrier = retriers[i];
        if (!matches(retrier.errorEquals, error)) continue;

        int used = i < retryCounts.size() ? retryCounts[i] : 0;
        if (used < retrier.maxAttempts) {
            decision.action = PolicyAction::Retry;
            decision.index = i;
            decision.attempt = used + 1;
            decision.delay = retryDelay(retrier, decision.attempt);
            return decision;
        }
        decision.retriesExhausted = true;
    }

    for (size_t i = 0; i < catchers.size(); ++i) {
        if (matches(catchers[i].errorEquals, error)) {
            decision.action = PolicyAction::Catch;
            decision.index = i;
            return decision;
        }
    }

    decision.action = PolicyAction::Propagate;
    return decision;
}

} // namespace workflow
} // namespace drflow

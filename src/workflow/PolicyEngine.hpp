#pragma once

#include "workflow/Definition.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace drflow {
namespace workflow {

enum class PolicyAction {
    Retry,      // wait `delay`, then run the state again
    Catch,      // merge the error into the payload, go to catchers[index].next
    Propagate   // fail the state with the error
};

struct PolicyDecision {
    PolicyAction action = PolicyAction::Propagate;
    size_t index = 0;                        // retrier or catcher index
    int attempt = 0;                         // retry number (1-based) when action == Retry
    std::chrono::milliseconds delay{0};      // backoff before the retry
    bool retriesExhausted = false;           // a retrier matched but had no attempts left
};

/**
 * Retry/Catch resolution for a failed Task or Parallel attempt
 *
 * Pure functions: the caller owns the per-state-entry retry counters
 * (one per retrier, all zero on entry) and increments the chosen
 * counter after a Retry decision.
 */
class PolicyEngine {
public:
    /**
     * True if error matches one of the matchers (States.ALL matches everything)
     */
    static bool matches(const std::vector<std::string>& matchers, const std::string& error);

    /**
     * Delay before retry number `attempt` (1-based):
     * IntervalSeconds * BackoffRate^(attempt - 1), capped by MaxDelaySeconds
     */
    static std::chrono::milliseconds retryDelay(const RetryPolicy& policy, int attempt);

    /**
     * Decide what to do about `error`:
     *  1. first retrier (declared order) that matches with retryCounts[i] < MaxAttempts
     *  2. otherwise first matching catcher
     *  3. otherwise propagate
     */
    static PolicyDecision decide(const std::string& error,
                                 const std::vector<RetryPolicy>& retriers,
                                 const std::vector<CatchPolicy>& catchers,
                                 const std::vector<int>& retryCounts);
};

} // namespace workflow
} // namespace drflow

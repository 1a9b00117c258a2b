#include "workflow/Interpreter.hpp"
#include "workflow/BranchCoordinator.hpp"
#include "workflow/JsonPath.hpp"
#include "workflow/PolicyEngine.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace drflow {
namespace workflow {

Interpreter::Interpreter(TaskInvoker& invoker, InterpreterOptions options)
    : m_invoker(invoker)
    , m_options(options)
{
    if (m_options.pollInterval.count() <= 0) {
        m_options.pollInterval = std::chrono::milliseconds(1);
    }
}

// =============================================================================
// Main loop
// =============================================================================

ExecutionStatus Interpreter::run(Execution& execution, const CancellationToken& token) {
    if (execution.isTerminal()) {
        return execution.getStatus();
    }

    const WorkflowDefinition& definition = execution.getDefinition();
    std::string current = execution.getCurrentState().empty()
        ? definition.getStartAt()
        : execution.getCurrentState();

    LOG_INFO("Execution " + execution.getId() + " of '" + definition.getName() +
             "' starting at '" + current + "'");

    try {
        while (true) {
            checkStop(execution, token);

            const StateSpec* state = definition.getState(current);
            if (!state) {
                throw TaskInvocationError(errors::RUNTIME, "State '" + current + "' does not exist");
            }

            execution.setCurrentState(current);
            record(execution, current, EventKind::Entered, {{"input", execution.getPayload()}});
            LOG_DEBUG("Execution " + execution.getId() + " entered '" + current + "' (" +
                      stateTypeToString(state->type()) + ")");

            std::optional<std::string> next;
            switch (state->type()) {
                case StateType::Succeed:
                    execution.finish(ExecutionStatus::Succeeded);
                    break;

                case StateType::Fail: {
                    const FailState* fail = state->asFail();
                    ErrorInfo info{
                        fail->error.empty() ? errors::FAIL : fail->error,
                        fail->cause.empty() ? "Execution reached Fail state '" + current + "'" : fail->cause
                    };
                    LOG_ERROR("Execution " + execution.getId() + " failed at '" + current + "': " +
                              info.error + ": " + info.cause);
                    execution.finish(ExecutionStatus::Failed, std::move(info));
                    break;
                }

                case StateType::Pass:
                    execution.setPayload(runPass(execution, *state->asPass()));
                    record(execution, current, EventKind::Exited, {{"output", execution.getPayload()}});
                    next = state->next;
                    break;

                case StateType::Task:
                case StateType::Parallel:
                    next = runWithPolicy(execution, *state, token);
                    break;
            }

            if (execution.isTerminal()) {
                break;
            }
            if (!next) {
                execution.finish(ExecutionStatus::Succeeded);
                break;
            }
            current = *next;
        }
    } catch (const TimeoutError& e) {
        token.cancel(StopReason::TimedOut);
        LOG_ERROR("Execution " + execution.getId() + " timed out in '" + current + "'");
        execution.finish(ExecutionStatus::TimedOut, e.info());
    } catch (const CancelledError& e) {
        LOG_WARN("Execution " + execution.getId() + " cancelled in '" + current + "'");
        execution.finish(ExecutionStatus::Cancelled, e.info());
    } catch (const WorkflowException& e) {
        LOG_ERROR("Execution " + execution.getId() + " failed in '" + current + "': " + e.what());
        execution.finish(ExecutionStatus::Failed, e.info());
    } catch (const std::exception& e) {
        LOG_ERROR("Execution " + execution.getId() + " failed in '" + current + "': " + e.what());
        execution.finish(ExecutionStatus::Failed, {errors::RUNTIME, e.what()});
    }

    if (execution.getStatus() == ExecutionStatus::Succeeded) {
        LOG_INFO("Execution " + execution.getId() + " succeeded");
    }
    return execution.getStatus();
}

// =============================================================================
// Task / Parallel with Retry and Catch
// =============================================================================

std::optional<std::string> Interpreter::runWithPolicy(Execution& execution,
                                                      const StateSpec& state,
                                                      const CancellationToken& token) {
    // Counters are local to this state entry; a loop back here starts fresh.
    std::vector<int> retryCounts(state.retriers.size(), 0);
    const json entryPayload = execution.getPayload();

    while (true) {
        ErrorInfo failure;
        std::optional<size_t> failedBranch;

        try {
            json output = state.type() == StateType::Task
                ? runTask(execution, state, *state.asTask(), token)
                : runParallel(execution, state, *state.asParallel(), token);

            execution.setPayload(std::move(output));
            record(execution, state.name, EventKind::Exited, {{"output", execution.getPayload()}});
            return state.next;
        } catch (const TimeoutError&) {
            throw;
        } catch (const CancelledError&) {
            throw;
        } catch (const BranchFailureError& e) {
            failure = e.info();
            failedBranch = e.branchIndex();
        } catch (const WorkflowException& e) {
            failure = e.info();
        } catch (const JsonPathError& e) {
            failure = ErrorInfo{errors::RUNTIME, e.what()};
        }

        PolicyDecision decision = PolicyEngine::decide(failure.error, state.retriers,
                                                       state.catchers, retryCounts);
        switch (decision.action) {
            case PolicyAction::Retry: {
                retryCounts[decision.index]++;
                record(execution, state.name, EventKind::Retried, {
                    {"error", failure.error},
                    {"cause", failure.cause},
                    {"attempt", decision.attempt},
                    {"delay_ms", decision.delay.count()},
                    {"retrier", decision.index}
                });
                LOG_WARN("Execution " + execution.getId() + ": '" + state.name + "' failed with " +
                         failure.error + ", retry " + std::to_string(decision.attempt) + " in " +
                         std::to_string(decision.delay.count()) + " ms");
                // Each retry starts from the payload the state was entered with
                execution.setPayload(entryPayload);
                backoff(decision.delay, execution, token);
                continue;
            }

            case PolicyAction::Catch: {
                const CatchPolicy& catcher = state.catchers[decision.index];
                execution.setPayload(JsonPath::merge(entryPayload, catcher.resultPath, failure.toJson()));
                record(execution, state.name, EventKind::Caught, {
                    {"error", failure.error},
                    {"cause", failure.cause},
                    {"next", catcher.next}
                });
                LOG_WARN("Execution " + execution.getId() + ": '" + state.name + "' caught " +
                         failure.error + ", continuing at '" + catcher.next + "'");
                return catcher.next;
            }

            case PolicyAction::Propagate:
                break;
        }

        if (decision.retriesExhausted) {
            int attempts = 1;
            for (int count : retryCounts) attempts += count;
            throw RetryExhaustedError(failure, attempts);
        }
        if (failedBranch) {
            throw BranchFailureError(failure, *failedBranch);
        }
        throw TaskInvocationError(failure);
    }
}

json Interpreter::runTask(Execution& execution, const StateSpec& state, const TaskState& task,
                          const CancellationToken& token) {
    json input = JsonPath::select(execution.getPayload(), task.inputPath);

    auto timeout = m_options.defaultTaskTimeout;
    if (task.timeoutSeconds) {
        timeout = std::chrono::milliseconds(static_cast<int64_t>(std::llround(*task.timeoutSeconds * 1000.0)));
    }

    LOG_DEBUG("Execution " + execution.getId() + ": invoking '" + task.resource + "' for '" +
              state.name + "'");
    auto future = m_invoker.invoke(task.resource, input, timeout);
    TaskOutcome outcome = await(future, execution, token);
    if (!outcome.success) {
        throw TaskInvocationError(outcome.error);
    }

    json merged = JsonPath::merge(execution.getPayload(), task.resultPath, outcome.output);
    return JsonPath::select(merged, task.outputPath);
}

json Interpreter::runParallel(Execution& execution, const StateSpec& state,
                              const ParallelState& parallel, const CancellationToken& token) {
    json input = JsonPath::select(execution.getPayload(), parallel.inputPath);

    record(execution, state.name, EventKind::Branched, {{"branch_count", parallel.branches.size()}});
    LOG_DEBUG("Execution " + execution.getId() + ": '" + state.name + "' forking " +
              std::to_string(parallel.branches.size()) + " branches");

    BranchCoordinator coordinator(m_invoker, m_options);
    JoinResult join = coordinator.run(execution, state.name, parallel.branches, input, token);

    json branchDetail = json::array();
    for (const auto& branch : join.branches) {
        branchDetail.push_back(branch.toJson());
    }
    record(execution, state.name, EventKind::Joined, {
        {"succeeded", join.allSucceeded()},
        {"branches", branchDetail}
    });
    LOG_DEBUG("Execution " + execution.getId() + ": '" + state.name + "' joined");

    // Branches stopped by our own token or deadline: report that, not a branch failure
    checkStop(execution, token);

    if (join.failedBranch) {
        const BranchResult& failed = join.branches[*join.failedBranch];
        ErrorInfo info{
            failed.error.error.empty() ? errors::BRANCH_FAILED : failed.error.error,
            "Branch " + std::to_string(failed.index) + " of '" + state.name + "' failed: " +
                failed.error.cause
        };
        throw BranchFailureError(std::move(info), failed.index);
    }
    if (!join.allSucceeded()) {
        throw TaskInvocationError(errors::BRANCH_FAILED,
                                  "Branches of '" + state.name + "' did not complete");
    }

    json merged = JsonPath::merge(execution.getPayload(), parallel.resultPath, join.outputs());
    return JsonPath::select(merged, parallel.outputPath);
}

json Interpreter::runPass(const Execution& execution, const PassState& pass) {
    if (!pass.result) {
        return execution.getPayload();
    }
    return JsonPath::merge(execution.getPayload(), pass.resultPath, *pass.result);
}

// =============================================================================
// Suspension points
// =============================================================================

TaskOutcome Interpreter::await(std::future<TaskOutcome>& future, Execution& execution,
                               const CancellationToken& token) {
    while (future.wait_for(m_options.pollInterval) != std::future_status::ready) {
        // An abandoned invocation may still complete; its result is dropped with the future
        checkStop(execution, token);
    }
    return future.get();
}

void Interpreter::backoff(std::chrono::milliseconds delay, Execution& execution,
                          const CancellationToken& token) {
    auto scaled = std::chrono::milliseconds(
        static_cast<int64_t>(std::llround(delay.count() * m_options.backoffScale)));
    auto wakeAt = std::min(std::chrono::steady_clock::now() + scaled, execution.getDeadline());

    token.waitUntil(wakeAt);
    checkStop(execution, token);
}

void Interpreter::checkStop(const Execution& execution, const CancellationToken& token) const {
    StopReason reason = token.reason();
    if (reason == StopReason::TimedOut || execution.deadlinePassed()) {
        throw TimeoutError("Execution " + execution.getId() + " exceeded its deadline of " +
                           std::to_string(execution.getTimeout().count()) + " ms");
    }
    if (reason == StopReason::Cancelled) {
        throw CancelledError("Execution " + execution.getId() + " was cancelled");
    }
}

void Interpreter::record(Execution& execution, const std::string& stateName, EventKind kind,
                         json detail) {
    const ExecutionEvent& evt = execution.appendEvent(stateName, kind, std::move(detail));
    if (m_callback) {
        m_callback(execution, evt);
    }
}

} // namespace workflow
} // namespace drflow

#pragma once

#include "workflow/CancellationToken.hpp"
#include "workflow/Definition.hpp"
#include "workflow/Execution.hpp"
#include "workflow/TaskInvoker.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace drflow {
namespace workflow {

struct InterpreterOptions {
    /// Invocation timeout for Task states without TimeoutSeconds
    std::chrono::milliseconds defaultTaskTimeout{60000};
    /// How often a suspended execution re-checks cancellation and deadline
    std::chrono::milliseconds pollInterval{10};
    /// Multiplier applied to real backoff waits (events keep the policy delay)
    double backoffScale = 1.0;
};

/**
 * Drives one Execution from its current state to a terminal status
 *
 * The graph is walked by an explicit loop over the current state name, so
 * cycles of any length run in constant stack space. Suspension points
 * (task invocation, retry backoff, branch join) observe the cancellation
 * token and the execution deadline.
 *
 * Usage:
 *   Interpreter interpreter(tasks);
 *   Execution execution(Execution::generateId(), definition, input, std::chrono::minutes(30));
 *   interpreter.run(execution, CancellationToken());
 */
class Interpreter {
public:
    explicit Interpreter(TaskInvoker& invoker, InterpreterOptions options = {});

    /**
     * Called for every event appended to the execution's history
     */
    void setCallback(ExecutionCallback callback) { m_callback = std::move(callback); }

    const InterpreterOptions& getOptions() const { return m_options; }

    /**
     * Run until the execution is terminal and return its final status.
     * Starts at StartAt, or at the execution's current state when resuming.
     * Workflow errors are recorded on the execution, never thrown.
     */
    ExecutionStatus run(Execution& execution, const CancellationToken& token);

private:
    // Returns the next state name, or nullopt when the state ends the workflow
    std::optional<std::string> runWithPolicy(Execution& execution,
                                             const StateSpec& state,
                                             const CancellationToken& token);
    json runTask(Execution& execution, const StateSpec& state, const TaskState& task,
                 const CancellationToken& token);
    json runParallel(Execution& execution, const StateSpec& state, const ParallelState& parallel,
                     const CancellationToken& token);
    json runPass(const Execution& execution, const PassState& pass);

    TaskOutcome await(std::future<TaskOutcome>& future, Execution& execution,
                      const CancellationToken& token);
    void backoff(std::chrono::milliseconds delay, Execution& execution,
                 const CancellationToken& token);

    /**
     * Throw TimeoutError / CancelledError if the execution must stop
     */
    void checkStop(const Execution& execution, const CancellationToken& token) const;

    void record(Execution& execution, const std::string& stateName, EventKind kind,
                json detail = json::object());

    TaskInvoker& m_invoker;
    InterpreterOptions m_options;
    ExecutionCallback m_callback;
};

} // namespace workflow
} // namespace drflow

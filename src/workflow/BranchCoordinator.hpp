#pragma once

#include "workflow/CancellationToken.hpp"
#include "workflow/Definition.hpp"
#include "workflow/Execution.hpp"
#include "workflow/Interpreter.hpp"
#include "workflow/TaskInvoker.hpp"
#include <optional>
#include <string>
#include <vector>

namespace drflow {
namespace workflow {

/**
 * Terminal state of one branch sub-execution
 */
struct BranchResult {
    size_t index = 0;
    std::string name;
    ExecutionStatus status = ExecutionStatus::Running;
    json output;
    ErrorInfo error;
    json history = json::array();

    json toJson() const;
};

struct JoinResult {
    std::vector<BranchResult> branches;     // declaration order
    std::optional<size_t> failedBranch;     // first FAILED branch in declaration order

    bool allSucceeded() const;

    /**
     * Branch outputs as an array index-aligned with the declared branches
     */
    json outputs() const;
};

/**
 * Fork/join for Parallel states
 *
 * Every branch runs on its own thread with a nested Interpreter, a deep copy
 * of the input payload and a child of the caller's cancellation token. The
 * first branch to fail cancels its siblings. run() returns only after every
 * branch has reached a terminal status.
 */
class BranchCoordinator {
public:
    BranchCoordinator(TaskInvoker& invoker, InterpreterOptions options);

    JoinResult run(const Execution& parent,
                   const std::string& stateName,
                   const std::vector<WorkflowDefinitionPtr>& branches,
                   const json& input,
                   const CancellationToken& token);

private:
    TaskInvoker& m_invoker;
    InterpreterOptions m_options;
};

} // namespace workflow
} // namespace drflow

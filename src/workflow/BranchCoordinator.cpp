#include "workflow/BranchCoordinator.hpp"
#include "core/Logger.hpp"
#include <system_error>
#include <thread>

namespace drflow {
namespace workflow {

json BranchResult::toJson() const {
    json j = {
        {"index", index},
        {"name", name},
        {"status", executionStatusToString(status)}
    };
    if (!error.empty()) {
        j["error"] = error.error;
        j["cause"] = error.cause;
    }
    j["history"] = history;
    return j;
}

bool JoinResult::allSucceeded() const {
    for (const auto& branch : branches) {
        if (branch.status != ExecutionStatus::Succeeded) return false;
    }
    return true;
}

json JoinResult::outputs() const {
    json result = json::array();
    for (const auto& branch : branches) {
        result.push_back(branch.output);
    }
    return result;
}

BranchCoordinator::BranchCoordinator(TaskInvoker& invoker, InterpreterOptions options)
    : m_invoker(invoker)
    , m_options(options)
{}

JoinResult BranchCoordinator::run(const Execution& parent,
                                  const std::string& stateName,
                                  const std::vector<WorkflowDefinitionPtr>& branches,
                                  const json& input,
                                  const CancellationToken& token) {
    JoinResult join;
    join.branches.resize(branches.size());

    std::vector<CancellationToken> tokens;
    tokens.reserve(branches.size());
    for (size_t i = 0; i < branches.size(); ++i) {
        tokens.push_back(token.child());
    }

    const std::string parentScope = Logger::currentScope();

    auto runBranch = [&](size_t index) {
        LogScope scope(parentScope.empty() ? parent.getId() : parentScope, false);
        LogScope branchScope(stateName + "[" + std::to_string(index) + "]");
        const auto& definition = branches[index];
        Execution child(parent.getId() + "." + stateName + "[" + std::to_string(index) + "]",
                        definition, input, parent.getTimeout(), parent.getStartedAt());
        child.setDeadline(parent.getDeadline());

        Interpreter nested(m_invoker, m_options);
        ExecutionStatus status = nested.run(child, tokens[index]);

        BranchResult& result = join.branches[index];
        result.index = index;
        result.name = definition->getName();
        result.status = status;
        result.error = child.getError();
        if (status == ExecutionStatus::Succeeded) {
            result.output = child.getPayload();
        }
        for (const auto& evt : child.getHistory()) {
            result.history.push_back(evt.toJson());
        }

        if (status == ExecutionStatus::Failed) {
            LOG_DEBUG("Branch " + std::to_string(index) + " of '" + stateName +
                      "' failed, cancelling siblings");
            for (size_t j = 0; j < tokens.size(); ++j) {
                if (j != index) tokens[j].cancel(StopReason::Cancelled);
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(branches.size());
    try {
        for (size_t i = 0; i < branches.size(); ++i) {
            threads.emplace_back(runBranch, i);
        }
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start branch thread for '" + stateName + "': " + e.what());
        for (auto& t : tokens) t.cancel(StopReason::Cancelled);
        for (auto& t : threads) t.join();
        throw TaskInvocationError(errors::RUNTIME,
                                  "Could not start branches of '" + stateName + "': " + e.what());
    }

    for (auto& t : threads) {
        t.join();
    }

    for (size_t i = 0; i < join.branches.size(); ++i) {
        if (join.branches[i].status == ExecutionStatus::Failed) {
            join.failedBranch = i;
            break;
        }
    }
    return join;
}

} // namespace workflow
} // namespace drflow

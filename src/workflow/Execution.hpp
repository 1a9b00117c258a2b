#pragma once

#include "workflow/Definition.hpp"
#include "workflow/Errors.hpp"
#include "workflow/ExecutionEvent.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace drflow {
namespace workflow {

using json = nlohmann::json;

enum class ExecutionStatus {
    Running,
    Succeeded,
    Failed,
    TimedOut,
    Cancelled
};

std::string executionStatusToString(ExecutionStatus status);
std::optional<ExecutionStatus> executionStatusFromString(const std::string& str);

/**
 * One run of a WorkflowDefinition
 *
 * Owns its payload and history exclusively; only the Interpreter driving
 * it mutates it. Every status other than Running is absorbing.
 */
class Execution {
public:
    /**
     * @param timeout  workflow-level budget, the deadline is startedAt + timeout
     * @param startedAt  defaults to now; set when rebuilding an interrupted execution
     */
    Execution(std::string id,
              WorkflowDefinitionPtr definition,
              json input,
              std::chrono::milliseconds timeout,
              std::optional<std::chrono::system_clock::time_point> startedAt = std::nullopt);

    Execution(const Execution&) = delete;
    Execution& operator=(const Execution&) = delete;

    /**
     * Random identifier: exec_<16 hex chars>
     */
    static std::string generateId();

    // === Getters ===

    const std::string& getId() const { return m_id; }
    const WorkflowDefinition& getDefinition() const { return *m_definition; }
    const WorkflowDefinitionPtr& getDefinitionPtr() const { return m_definition; }
    ExecutionStatus getStatus() const { return m_status; }
    bool isTerminal() const { return m_status != ExecutionStatus::Running; }
    const std::string& getCurrentState() const { return m_currentState; }
    const json& getInput() const { return m_input; }
    const json& getPayload() const { return m_payload; }
    const std::vector<ExecutionEvent>& getHistory() const { return m_history; }
    const ErrorInfo& getError() const { return m_error; }
    std::chrono::system_clock::time_point getStartedAt() const { return m_startedAt; }
    std::optional<std::chrono::system_clock::time_point> getFinishedAt() const { return m_finishedAt; }
    std::chrono::milliseconds getTimeout() const { return m_timeout; }

    // === Deadline ===

    std::chrono::steady_clock::time_point getDeadline() const { return m_deadline; }
    bool deadlinePassed() const { return std::chrono::steady_clock::now() >= m_deadline; }

    // === Mutation (Interpreter only) ===

    void setCurrentState(const std::string& stateName) { m_currentState = stateName; }
    void setPayload(json payload) { m_payload = std::move(payload); }

    /// Branch sub-executions share the deadline of their parent
    void setDeadline(std::chrono::steady_clock::time_point deadline) { m_deadline = deadline; }

    /**
     * Reload events recorded before an interruption (resumption only)
     */
    void restoreHistory(std::vector<ExecutionEvent> history) { m_history = std::move(history); }

    /**
     * Append an event stamped now, returns the stored event
     */
    const ExecutionEvent& appendEvent(const std::string& stateName, EventKind kind,
                                      json detail = json::object());

    /**
     * Move to a terminal status. Throws std::logic_error if already terminal.
     */
    void finish(ExecutionStatus status, ErrorInfo error = {});

    /**
     * Snapshot for status queries and reports
     */
    json toJson(bool includeHistory = true) const;

private:
    std::string m_id;
    WorkflowDefinitionPtr m_definition;
    ExecutionStatus m_status = ExecutionStatus::Running;
    std::string m_currentState;
    json m_input;
    json m_payload;
    std::vector<ExecutionEvent> m_history;
    ErrorInfo m_error;
    std::chrono::milliseconds m_timeout;
    std::chrono::system_clock::time_point m_startedAt;
    std::optional<std::chrono::system_clock::time_point> m_finishedAt;
    std::chrono::steady_clock::time_point m_deadline;
};

} // namespace workflow
} // namespace drflow

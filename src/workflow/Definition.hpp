#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace drflow {
namespace workflow {

using json = nlohmann::json;

/// Name of a unit of work resolved by the task invoker (e.g. "AssessEmergency")
using TaskRef = std::string;

class WorkflowDefinition;
using WorkflowDefinitionPtr = std::shared_ptr<const WorkflowDefinition>;

enum class StateType {
    Task,
    Parallel,
    Pass,
    Succeed,
    Fail
};

std::string stateTypeToString(StateType type);
std::optional<StateType> stateTypeFromString(const std::string& str);

/**
 * Retry rule of a Task or Parallel state
 */
struct RetryPolicy {
    std::vector<std::string> errorEquals;
    double intervalSeconds = 1.0;
    int maxAttempts = 3;
    double backoffRate = 2.0;
    std::optional<double> maxDelaySeconds;
};

/**
 * Fallback rule of a Task or Parallel state
 */
struct CatchPolicy {
    std::vector<std::string> errorEquals;
    std::string resultPath = "$";
    std::string next;
};

struct TaskState {
    TaskRef resource;
    std::optional<double> timeoutSeconds;
    std::string inputPath = "$";
    std::string resultPath = "$";
    std::string outputPath = "$";
};

struct ParallelState {
    std::vector<WorkflowDefinitionPtr> branches;  // declaration order is the join order
    std::string inputPath = "$";
    std::string resultPath = "$";
    std::string outputPath = "$";
};

struct PassState {
    std::optional<json> result;  // absent: payload passes through
    std::string resultPath = "$";
};

struct SucceedState {};

struct FailState {
    std::string error;
    std::string cause;
};

using StateBody = std::variant<TaskState, ParallelState, PassState, SucceedState, FailState>;

/**
 * One named node of a workflow graph
 */
struct StateSpec {
    std::string name;
    std::string comment;
    std::optional<std::string> next;
    bool end = false;
    std::vector<RetryPolicy> retriers;
    std::vector<CatchPolicy> catchers;
    StateBody body;

    StateType type() const;

    /// Succeed / Fail, or any state with End: true
    bool isTerminal() const;

    /// Task and Parallel states carry Retry/Catch
    bool supportsPolicies() const;

    const TaskState* asTask() const { return std::get_if<TaskState>(&body); }
    const ParallelState* asParallel() const { return std::get_if<ParallelState>(&body); }
    const PassState* asPass() const { return std::get_if<PassState>(&body); }
    const FailState* asFail() const { return std::get_if<FailState>(&body); }
};

/**
 * A complete workflow graph - immutable once loaded, shared read-only
 * by every execution (and by the branches of Parallel states).
 */
class WorkflowDefinition {
public:
    WorkflowDefinition(std::string name,
                       std::string startAt,
                       std::vector<StateSpec> states,
                       std::string comment = "",
                       std::optional<double> timeoutSeconds = std::nullopt);

    const std::string& getName() const { return m_name; }
    const std::string& getStartAt() const { return m_startAt; }
    const std::string& getComment() const { return m_comment; }
    const std::optional<double>& getTimeoutSeconds() const { return m_timeoutSeconds; }

    /**
     * Lookup a state by name, nullptr if absent
     */
    const StateSpec* getState(const std::string& name) const;
    bool hasState(const std::string& name) const { return getState(name) != nullptr; }

    /**
     * States in load order
     */
    const std::vector<StateSpec>& getStates() const { return m_states; }
    size_t stateCount() const { return m_states.size(); }

    /**
     * Names of every state this one can transition to (Next + Catch targets)
     */
    static std::vector<std::string> successors(const StateSpec& state);

private:
    std::string m_name;
    std::string m_startAt;
    std::string m_comment;
    std::optional<double> m_timeoutSeconds;
    std::vector<StateSpec> m_states;
    std::map<std::string, size_t> m_index;
};

} // namespace workflow
} // namespace drflow

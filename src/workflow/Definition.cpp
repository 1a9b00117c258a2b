#include "workflow/Definition.hpp"
#include <type_traits>

namespace drflow {
namespace workflow {

std::string stateTypeToString(StateType type) {
    switch (type) {
        case StateType::Task: return "Task";
        case StateType::Parallel: return "Parallel";
        case StateType::Pass: return "Pass";
        case StateType::Succeed: return "Succeed";
        case StateType::Fail: return "Fail";
    }
    return "Unknown";
}

std::optional<StateType> stateTypeFromString(const std::string& str) {
    if (str == "Task") return StateType::Task;
    if (str == "Parallel") return StateType::Parallel;
    if (str == "Pass") return StateType::Pass;
    if (str == "Succeed") return StateType::Succeed;
    if (str == "Fail") return StateType::Fail;
    return std::nullopt;
}

// =============================================================================
// StateSpec
// =============================================================================

StateType StateSpec::type() const {
    return std::visit([](const auto& b) -> StateType {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, TaskState>) return StateType::Task;
        else if constexpr (std::is_same_v<T, ParallelState>) return StateType::Parallel;
        else if constexpr (std::is_same_v<T, PassState>) return StateType::Pass;
        else if constexpr (std::is_same_v<T, SucceedState>) return StateType::Succeed;
        else return StateType::Fail;
    }, body);
}

bool StateSpec::isTerminal() const {
    auto t = type();
    return t == StateType::Succeed || t == StateType::Fail || end;
}

bool StateSpec::supportsPolicies() const {
    auto t = type();
    return t == StateType::Task || t == StateType::Parallel;
}

// =============================================================================
// WorkflowDefinition
// =============================================================================

WorkflowDefinition::WorkflowDefinition(std::string name,
                                       std::string startAt,
                                       std::vector<StateSpec> states,
                                       std::string comment,
                                       std::optional<double> timeoutSeconds)
    : m_name(std::move(name))
    , m_startAt(std::move(startAt))
    , m_comment(std::move(comment))
    , m_timeoutSeconds(timeoutSeconds)
    , m_states(std::move(states))
{
    for (size_t i = 0; i < m_states.size(); ++i) {
        m_index[m_states[i].name] = i;
    }
}

const StateSpec* WorkflowDefinition::getState(const std::string& name) const {
    auto it = m_index.find(name);
    return it != m_index.end() ? &m_states[it->second] : nullptr;
}

std::vector<std::string> WorkflowDefinition::successors(const StateSpec& state) {
    std::vector<std::string> result;
    if (state.next) {
        result.push_back(*state.next);
    }
    for (const auto& catcher : state.catchers) {
        result.push_back(catcher.next);
    }
    return result;
}

} // namespace workflow
} // namespace drflow

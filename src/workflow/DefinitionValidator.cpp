#include "workflow/DefinitionValidator.hpp"
#include "workflow/Errors.hpp"
#include "workflow/JsonPath.hpp"
#include <algorithm>
#include <queue>
#include <set>

namespace drflow {
namespace workflow {

namespace {

bool isRejected(const RejectedStates& rejected, const std::string& definitionName,
                const std::string& stateName) {
    auto it = rejected.find(definitionName);
    return it != rejected.end() && it->second.count(stateName) > 0;
}

bool declares(const WorkflowDefinition& definition, const RejectedStates& rejected,
              const std::string& stateName) {
    return definition.hasState(stateName) || isRejected(rejected, definition.getName(), stateName);
}

} // anonymous namespace

std::vector<std::string> DefinitionValidator::check(const WorkflowDefinition& definition,
                                                    const RejectedStates& rejected) {
    std::vector<std::string> violations;
    checkDefinition(definition, rejected, violations);
    return violations;
}

void DefinitionValidator::validate(const WorkflowDefinition& definition) {
    auto violations = check(definition);
    if (!violations.empty()) {
        throw ValidationError(std::move(violations));
    }
}

std::vector<std::string> DefinitionValidator::checkDocument(const json& document,
                                                            const std::string& name) {
    ParseResult parsed = DefinitionSerializer::parse(document, name);
    std::vector<std::string> violations = std::move(parsed.violations);
    if (parsed.definition) {
        checkDefinition(*parsed.definition, parsed.rejected, violations);
    }
    return violations;
}

WorkflowDefinitionPtr DefinitionValidator::load(const json& document, const std::string& name) {
    ParseResult parsed = DefinitionSerializer::parse(document, name);
    std::vector<std::string> violations = std::move(parsed.violations);
    if (parsed.definition) {
        checkDefinition(*parsed.definition, parsed.rejected, violations);
    }
    if (!violations.empty()) {
        throw ValidationError(std::move(violations));
    }
    return parsed.definition;
}

WorkflowDefinitionPtr DefinitionValidator::loadString(const std::string& text, const std::string& name) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ValidationError({name + ": invalid JSON: " + e.what()});
    }
    return load(document, name);
}

void DefinitionValidator::checkDefinition(const WorkflowDefinition& definition,
                                          const RejectedStates& rejected,
                                          std::vector<std::string>& violations) {
    const std::string& name = definition.getName();

    if (definition.getTimeoutSeconds() && *definition.getTimeoutSeconds() <= 0) {
        violations.push_back(name + ": TimeoutSeconds must be greater than 0");
    }

    if (definition.stateCount() == 0) {
        violations.push_back(name + ": no states defined");
    }

    if (definition.getStartAt().empty()) {
        violations.push_back(name + ": StartAt is empty");
    } else if (!declares(definition, rejected, definition.getStartAt())) {
        violations.push_back(name + ": StartAt '" + definition.getStartAt() +
                             "' does not name a state");
    }

    for (const auto& state : definition.getStates()) {
        checkState(definition, state, rejected, violations);
    }

    checkReachability(definition, rejected, violations);
}

void DefinitionValidator::checkState(const WorkflowDefinition& definition,
                                     const StateSpec& state,
                                     const RejectedStates& rejected,
                                     std::vector<std::string>& violations) {
    const std::string where = definition.getName() + ": state '" + state.name + "'";
    StateType type = state.type();

    if (type == StateType::Succeed || type == StateType::Fail) {
        if (state.next) {
            violations.push_back(where + ": terminal " + stateTypeToString(type) +
                                 " state must not declare Next");
        }
    } else {
        if (state.next && state.end) {
            violations.push_back(where + ": declares both Next and End");
        } else if (!state.next && !state.end) {
            violations.push_back(where + ": must declare either Next or End: true");
        }
    }

    if (state.next && !declares(definition, rejected, *state.next)) {
        violations.push_back(where + ": Next '" + *state.next + "' does not name a state");
    }

    if (const auto* task = state.asTask()) {
        if (task->resource.empty()) {
            violations.push_back(where + ": Resource is empty");
        }
        if (task->timeoutSeconds && *task->timeoutSeconds <= 0) {
            violations.push_back(where + ": TimeoutSeconds must be greater than 0");
        }
        checkPath(where, "InputPath", task->inputPath, violations);
        checkPath(where, "ResultPath", task->resultPath, violations);
        checkPath(where, "OutputPath", task->outputPath, violations);
    } else if (const auto* parallel = state.asParallel()) {
        if (parallel->branches.empty()) {
            violations.push_back(where + ": Parallel state must declare at least one branch");
        }
        for (const auto& branch : parallel->branches) {
            checkDefinition(*branch, rejected, violations);
        }
        checkPath(where, "InputPath", parallel->inputPath, violations);
        checkPath(where, "ResultPath", parallel->resultPath, violations);
        checkPath(where, "OutputPath", parallel->outputPath, violations);
    } else if (const auto* pass = state.asPass()) {
        checkPath(where, "ResultPath", pass->resultPath, violations);
    }

    checkRetriers(where, state.retriers, violations);
    checkCatchers(definition, rejected, where, state.catchers, violations);
}

void DefinitionValidator::checkRetriers(const std::string& where,
                                        const std::vector<RetryPolicy>& retriers,
                                        std::vector<std::string>& violations) {
    for (size_t i = 0; i < retriers.size(); ++i) {
        const auto& r = retriers[i];
        std::string itemWhere = where + " Retry[" + std::to_string(i) + "]";

        checkMatchers(itemWhere, r.errorEquals, i + 1 == retriers.size(), violations);

        if (r.intervalSeconds <= 0) {
            violations.push_back(itemWhere + ": IntervalSeconds must be greater than 0");
        }
        if (r.maxAttempts < 0) {
            violations.push_back(itemWhere + ": MaxAttempts must not be negative");
        }
        if (r.backoffRate < 1.0) {
            violations.push_back(itemWhere + ": BackoffRate must be at least 1.0");
        }
        if (r.maxDelaySeconds && *r.maxDelaySeconds <= 0) {
            violations.push_back(itemWhere + ": MaxDelaySeconds must be greater than 0");
        }
    }
}

void DefinitionValidator::checkCatchers(const WorkflowDefinition& definition,
                                        const RejectedStates& rejected,
                                        const std::string& where,
                                        const std::vector<CatchPolicy>& catchers,
                                        std::vector<std::string>& violations) {
    for (size_t i = 0; i < catchers.size(); ++i) {
        const auto& c = catchers[i];
        std::string itemWhere = where + " Catch[" + std::to_string(i) + "]";

        checkMatchers(itemWhere, c.errorEquals, i + 1 == catchers.size(), violations);

        if (c.next.empty()) {
            violations.push_back(itemWhere + ": Next is empty");
        } else if (!declares(definition, rejected, c.next)) {
            violations.push_back(itemWhere + ": Next '" + c.next + "' does not name a state");
        }
        checkPath(itemWhere, "ResultPath", c.resultPath, violations);
    }
}

void DefinitionValidator::checkMatchers(const std::string& where,
                                        const std::vector<std::string>& matchers,
                                        bool isLast,
                                        std::vector<std::string>& violations) {
    if (matchers.empty()) {
        violations.push_back(where + ": ErrorEquals must not be empty");
        return;
    }

    bool hasWildcard = std::find(matchers.begin(), matchers.end(), errors::ALL) != matchers.end();
    if (!hasWildcard) return;

    if (matchers.size() > 1) {
        violations.push_back(where + ": " + errors::ALL + " must appear alone in ErrorEquals");
    }
    if (!isLast) {
        violations.push_back(where + ": " + errors::ALL + " must only appear in the last entry");
    }
}

void DefinitionValidator::checkPath(const std::string& where, const char* field,
                                    const std::string& path,
                                    std::vector<std::string>& violations) {
    if (!JsonPath::isValid(path)) {
        violations.push_back(where + ": invalid " + field + " '" + path + "'");
    }
}

void DefinitionValidator::checkReachability(const WorkflowDefinition& definition,
                                            const RejectedStates& rejected,
                                            std::vector<std::string>& violations) {
    const StateSpec* start = definition.getState(definition.getStartAt());
    if (!start) return;

    // Successors of a rejected state are unknown
    bool undecided = false;

    std::set<std::string> visited;
    std::queue<const StateSpec*> pending;
    visited.insert(start->name);
    pending.push(start);

    bool canTerminate = false;
    while (!pending.empty()) {
        const StateSpec* state = pending.front();
        pending.pop();

        if (state->isTerminal()) {
            canTerminate = true;
        }

        for (const auto& successor : WorkflowDefinition::successors(*state)) {
            const StateSpec* next = definition.getState(successor);
            if (next && visited.insert(next->name).second) {
                pending.push(next);
            } else if (!next && isRejected(rejected, definition.getName(), successor)) {
                undecided = true;
            }
        }
    }

    if (undecided) return;

    for (const auto& state : definition.getStates()) {
        if (visited.find(state.name) == visited.end()) {
            violations.push_back(definition.getName() + ": state '" + state.name +
                                 "' is unreachable from StartAt");
        }
    }

    if (!canTerminate) {
        violations.push_back(definition.getName() + ": no terminal state is reachable from StartAt");
    }
}

} // namespace workflow
} // namespace drflow

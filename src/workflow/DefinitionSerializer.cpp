#include "workflow/DefinitionSerializer.hpp"
#include "workflow/Errors.hpp"
#include <cstdint>
#include <limits>

namespace drflow {
namespace workflow {

namespace {

void readString(const json& j, const char* key, const std::string& where,
                std::vector<std::string>& violations, std::string& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_string()) {
        violations.push_back(where + ": '" + key + "' must be a string");
        return;
    }
    out = j[key].get<std::string>();
}

void readNumber(const json& j, const char* key, const std::string& where,
                std::vector<std::string>& violations, std::optional<double>& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_number()) {
        violations.push_back(where + ": '" + key + "' must be a number");
        return;
    }
    out = j[key].get<double>();
}

std::vector<std::string> readStringList(const json& j, const char* key, const std::string& where,
                                        std::vector<std::string>& violations) {
    std::vector<std::string> result;
    if (!j.contains(key)) {
        violations.push_back(where + ": missing '" + key + "'");
        return result;
    }
    if (!j[key].is_array()) {
        violations.push_back(where + ": '" + key + "' must be an array of strings");
        return result;
    }
    for (const auto& item : j[key]) {
        if (!item.is_string()) {
            violations.push_back(where + ": '" + key + "' must only contain strings");
            continue;
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

} // anonymous namespace

// =============================================================================
// Deserialization
// =============================================================================

ParseResult DefinitionSerializer::parse(const json& j, const std::string& name) {
    ParseResult result;
    result.definition = parseDefinition(j, name, name, result.violations, result.rejected);
    return result;
}

WorkflowDefinitionPtr DefinitionSerializer::fromJson(const json& j, const std::string& name) {
    ParseResult result = parse(j, name);
    if (!result.violations.empty()) {
        throw ValidationError(std::move(result.violations));
    }
    return result.definition;
}

WorkflowDefinitionPtr DefinitionSerializer::fromString(const std::string& str, const std::string& name) {
    json j;
    try {
        j = json::parse(str);
    } catch (const json::parse_error& e) {
        throw ValidationError({name + ": invalid JSON: " + e.what()});
    }
    return fromJson(j, name);
}

WorkflowDefinitionPtr DefinitionSerializer::parseDefinition(const json& j,
                                                            const std::string& name,
                                                            const std::string& where,
                                                            std::vector<std::string>& violations,
                                                            RejectedStates& rejected) {
    if (!j.is_object()) {
        violations.push_back(where + ": definition must be a JSON object");
        return nullptr;
    }

    std::string startAt;
    if (!j.contains("StartAt")) {
        violations.push_back(where + ": missing 'StartAt'");
    } else {
        readString(j, "StartAt", where, violations, startAt);
    }

    std::string comment;
    readString(j, "Comment", where, violations, comment);

    std::optional<double> timeoutSeconds;
    readNumber(j, "TimeoutSeconds", where, violations, timeoutSeconds);

    std::vector<StateSpec> states;
    if (!j.contains("States")) {
        violations.push_back(where + ": missing 'States'");
    } else if (!j["States"].is_object()) {
        violations.push_back(where + ": 'States' must be an object");
    } else {
        for (const auto& [stateName, stateJson] : j["States"].items()) {
            StateSpec state;
            if (parseState(stateName, stateJson, name, where + ".States." + stateName, state,
                           violations, rejected)) {
                states.push_back(std::move(state));
            } else {
                rejected[name].insert(stateName);
            }
        }
    }

    return std::make_shared<const WorkflowDefinition>(
        name, std::move(startAt), std::move(states), std::move(comment), timeoutSeconds);
}

bool DefinitionSerializer::parseState(const std::string& stateName,
                                      const json& j,
                                      const std::string& definitionName,
                                      const std::string& where,
                                      StateSpec& out,
                                      std::vector<std::string>& violations,
                                      RejectedStates& rejected) {
    if (!j.is_object()) {
        violations.push_back(where + ": state must be an object");
        return false;
    }
    if (!j.contains("Type") || !j["Type"].is_string()) {
        violations.push_back(where + ": missing or non-string 'Type'");
        return false;
    }

    std::string typeStr = j["Type"].get<std::string>();
    auto type = stateTypeFromString(typeStr);
    if (!type) {
        violations.push_back(where + ": unknown state Type '" + typeStr + "'");
        return false;
    }

    out.name = stateName;
    readString(j, "Comment", where, violations, out.comment);

    if (j.contains("Next")) {
        if (j["Next"].is_string()) {
            out.next = j["Next"].get<std::string>();
        } else {
            violations.push_back(where + ": 'Next' must be a string");
        }
    }
    if (j.contains("End")) {
        if (j["End"].is_boolean()) {
            out.end = j["End"].get<bool>();
        } else {
            violations.push_back(where + ": 'End' must be a boolean");
        }
    }

    bool hasPolicies = j.contains("Retry") || j.contains("Catch");
    if (hasPolicies && *type != StateType::Task && *type != StateType::Parallel) {
        violations.push_back(where + ": 'Retry'/'Catch' are only allowed on Task and Parallel states");
    }

    switch (*type) {
        case StateType::Task: {
            TaskState task;
            if (!j.contains("Resource")) {
                violations.push_back(where + ": Task state is missing 'Resource'");
            }
            readString(j, "Resource", where, violations, task.resource);
            readNumber(j, "TimeoutSeconds", where, violations, task.timeoutSeconds);
            readString(j, "InputPath", where, violations, task.inputPath);
            readString(j, "ResultPath", where, violations, task.resultPath);
            readString(j, "OutputPath", where, violations, task.outputPath);
            out.body = std::move(task);
            break;
        }
        case StateType::Parallel: {
            ParallelState parallel;
            if (!j.contains("Branches") || !j["Branches"].is_array()) {
                violations.push_back(where + ": Parallel state requires a 'Branches' array");
            } else {
                size_t index = 0;
                for (const auto& branchJson : j["Branches"]) {
                    std::string suffix = "[" + std::to_string(index) + "]";
                    auto branch = parseDefinition(branchJson,
                                                  definitionName + "/" + stateName + suffix,
                                                  where + ".Branches" + suffix,
                                                  violations,
                                                  rejected);
                    if (branch) {
                        parallel.branches.push_back(std::move(branch));
                    }
                    ++index;
                }
            }
            readString(j, "InputPath", where, violations, parallel.inputPath);
            readString(j, "ResultPath", where, violations, parallel.resultPath);
            readString(j, "OutputPath", where, violations, parallel.outputPath);
            out.body = std::move(parallel);
            break;
        }
        case StateType::Pass: {
            PassState pass;
            if (j.contains("Result")) {
                pass.result = j["Result"];
            }
            readString(j, "ResultPath", where, violations, pass.resultPath);
            out.body = std::move(pass);
            break;
        }
        case StateType::Succeed:
            out.body = SucceedState{};
            break;
        case StateType::Fail: {
            FailState fail;
            readString(j, "Error", where, violations, fail.error);
            readString(j, "Cause", where, violations, fail.cause);
            out.body = std::move(fail);
            break;
        }
    }

    if (j.contains("Retry")) {
        out.retriers = parseRetry(j["Retry"], where + ".Retry", violations);
    }
    if (j.contains("Catch")) {
        out.catchers = parseCatch(j["Catch"], where + ".Catch", violations);
    }

    return true;
}

std::vector<RetryPolicy> DefinitionSerializer::parseRetry(const json& j, const std::string& where,
                                                          std::vector<std::string>& violations) {
    std::vector<RetryPolicy> result;
    if (!j.is_array()) {
        violations.push_back(where + ": must be an array");
        return result;
    }

    for (size_t i = 0; i < j.size(); ++i) {
        const auto& item = j[i];
        std::string itemWhere = where + "[" + std::to_string(i) + "]";
        if (!item.is_object()) {
            violations.push_back(itemWhere + ": retrier must be an object");
            continue;
        }

        RetryPolicy policy;
        policy.errorEquals = readStringList(item, "ErrorEquals", itemWhere, violations);

        std::optional<double> interval;
        readNumber(item, "IntervalSeconds", itemWhere, violations, interval);
        if (interval) policy.intervalSeconds = *interval;

        if (item.contains("MaxAttempts")) {
            const json& attempts = item["MaxAttempts"];
            if (attempts.is_number_unsigned()) {
                auto value = attempts.get<uint64_t>();
                if (value > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
                    violations.push_back(itemWhere + ": 'MaxAttempts' is out of range");
                } else {
                    policy.maxAttempts = static_cast<int>(value);
                }
            } else if (attempts.is_number_integer()) {
                auto value = attempts.get<int64_t>();
                if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
                    violations.push_back(itemWhere + ": 'MaxAttempts' is out of range");
                } else {
                    policy.maxAttempts = static_cast<int>(value);
                }
            } else {
                violations.push_back(itemWhere + ": 'MaxAttempts' must be an integer");
            }
        }

        std::optional<double> rate;
        readNumber(item, "BackoffRate", itemWhere, violations, rate);
        if (rate) policy.backoffRate = *rate;

        readNumber(item, "MaxDelaySeconds", itemWhere, violations, policy.maxDelaySeconds);

        result.push_back(std::move(policy));
    }
    return result;
}

std::vector<CatchPolicy> DefinitionSerializer::parseCatch(const json& j, const std::string& where,
                                                          std::vector<std::string>& violations) {
    std::vector<CatchPolicy> result;
    if (!j.is_array()) {
        violations.push_back(where + ": must be an array");
        return result;
    }

    for (size_t i = 0; i < j.size(); ++i) {
        const auto& item = j[i];
        std::string itemWhere = where + "[" + std::to_string(i) + "]";
        if (!item.is_object()) {
            violations.push_back(itemWhere + ": catcher must be an object");
            continue;
        }

        CatchPolicy policy;
        policy.errorEquals = readStringList(item, "ErrorEquals", itemWhere, violations);
        readString(item, "ResultPath", itemWhere, violations, policy.resultPath);
        if (!item.contains("Next")) {
            violations.push_back(itemWhere + ": missing 'Next'");
        }
        readString(item, "Next", itemWhere, violations, policy.next);

        result.push_back(std::move(policy));
    }
    return result;
}

// =============================================================================
// Serialization
// =============================================================================

json DefinitionSerializer::toJson(const WorkflowDefinition& definition) {
    json result;
    if (!definition.getComment().empty()) {
        result["Comment"] = definition.getComment();
    }
    result["StartAt"] = definition.getStartAt();
    if (definition.getTimeoutSeconds()) {
        result["TimeoutSeconds"] = *definition.getTimeoutSeconds();
    }

    json states = json::object();
    for (const auto& state : definition.getStates()) {
        states[state.name] = stateToJson(state);
    }
    result["States"] = states;
    return result;
}

std::string DefinitionSerializer::toString(const WorkflowDefinition& definition, int indent) {
    return toJson(definition).dump(indent);
}

json DefinitionSerializer::stateToJson(const StateSpec& state) {
    json result;
    result["Type"] = stateTypeToString(state.type());
    if (!state.comment.empty()) {
        result["Comment"] = state.comment;
    }

    if (const auto* task = state.asTask()) {
        result["Resource"] = task->resource;
        if (task->timeoutSeconds) result["TimeoutSeconds"] = *task->timeoutSeconds;
        if (task->inputPath != "$") result["InputPath"] = task->inputPath;
        if (task->resultPath != "$") result["ResultPath"] = task->resultPath;
        if (task->outputPath != "$") result["OutputPath"] = task->outputPath;
    } else if (const auto* parallel = state.asParallel()) {
        json branches = json::array();
        for (const auto& branch : parallel->branches) {
            branches.push_back(toJson(*branch));
        }
        result["Branches"] = branches;
        if (parallel->inputPath != "$") result["InputPath"] = parallel->inputPath;
        if (parallel->resultPath != "$") result["ResultPath"] = parallel->resultPath;
        if (parallel->outputPath != "$") result["OutputPath"] = parallel->outputPath;
    } else if (const auto* pass = state.asPass()) {
        if (pass->result) result["Result"] = *pass->result;
        if (pass->resultPath != "$") result["ResultPath"] = pass->resultPath;
    } else if (const auto* fail = state.asFail()) {
        if (!fail->error.empty()) result["Error"] = fail->error;
        if (!fail->cause.empty()) result["Cause"] = fail->cause;
    }

    if (!state.retriers.empty()) {
        json retry = json::array();
        for (const auto& r : state.retriers) {
            json item = {
                {"ErrorEquals", r.errorEquals},
                {"IntervalSeconds", r.intervalSeconds},
                {"MaxAttempts", r.maxAttempts},
                {"BackoffRate", r.backoffRate}
            };
            if (r.maxDelaySeconds) item["MaxDelaySeconds"] = *r.maxDelaySeconds;
            retry.push_back(item);
        }
        result["Retry"] = retry;
    }

    if (!state.catchers.empty()) {
        json catchers = json::array();
        for (const auto& c : state.catchers) {
            catchers.push_back({
                {"ErrorEquals", c.errorEquals},
                {"ResultPath", c.resultPath},
                {"Next", c.next}
            });
        }
        result["Catch"] = catchers;
    }

    if (state.next) {
        result["Next"] = *state.next;
    } else if (state.end) {
        result["End"] = true;
    }
    return result;
}

} // namespace workflow
} // namespace drflow

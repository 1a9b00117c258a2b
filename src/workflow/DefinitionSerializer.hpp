#pragma once

#include "workflow/Definition.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace drflow {
namespace workflow {

using json = nlohmann::json;

/**
 * Serialization/Deserialization for WorkflowDefinition
 *
 * JSON format (Amazon States Language subset):
 * {
 *   "Comment": "...",
 *   "StartAt": "AssessEmergency",
 *   "TimeoutSeconds": 1800,
 *   "States": {
 *     "AssessEmergency": {"Type": "Task", "Resource": "AssessEmergency", "Next": "Notify",
 *                         "Retry": [{"ErrorEquals": ["States.ALL"], "IntervalSeconds": 2}]},
 *     "Respond": {"Type": "Parallel", "Branches": [{"StartAt": ..., "States": {...}}], "End": true}
 *   }
 * }
 *
 * fromJson rejects the whole document with one ValidationError listing every
 * structural problem (unknown Type, missing fields, wrong field types).
 * Graph-level checks are done by DefinitionValidator; parse() keeps the
 * partial definition so both kinds of problems can be reported together.
 */

/**
 * Names of declared states the parser could not build, by definition name
 */
using RejectedStates = std::map<std::string, std::set<std::string>>;

struct ParseResult {
    WorkflowDefinitionPtr definition;  // null when the document is not an object
    std::vector<std::string> violations;
    RejectedStates rejected;
};

class DefinitionSerializer {
public:
    // === Deserialization ===

    /**
     * Build as much of the definition as possible, never throws
     */
    static ParseResult parse(const json& j, const std::string& name);

    static WorkflowDefinitionPtr fromJson(const json& j, const std::string& name);
    static WorkflowDefinitionPtr fromString(const std::string& str, const std::string& name);

    // === Serialization ===

    static json toJson(const WorkflowDefinition& definition);
    static std::string toString(const WorkflowDefinition& definition, int indent = 2);

private:
    static WorkflowDefinitionPtr parseDefinition(const json& j,
                                                 const std::string& name,
                                                 const std::string& where,
                                                 std::vector<std::string>& violations,
                                                 RejectedStates& rejected);
    static bool parseState(const std::string& stateName,
                           const json& j,
                           const std::string& definitionName,
                           const std::string& where,
                           StateSpec& out,
                           std::vector<std::string>& violations,
                           RejectedStates& rejected);
    static std::vector<RetryPolicy> parseRetry(const json& j, const std::string& where,
                                               std::vector<std::string>& violations);
    static std::vector<CatchPolicy> parseCatch(const json& j, const std::string& where,
                                               std::vector<std::string>& violations);

    static json stateToJson(const StateSpec& state);
};

} // namespace workflow
} // namespace drflow

#pragma once

#include "workflow/Definition.hpp"
#include "workflow/DefinitionSerializer.hpp"
#include <string>
#include <vector>

namespace drflow {
namespace workflow {

/**
 * Static checks over a WorkflowDefinition
 *
 * - StartAt names an existing state, every state reachable from it
 * - no dangling Next / Catch.Next references
 * - Task/Parallel/Pass states have exactly one of Next or End
 * - Parallel branches are themselves well-formed and can terminate
 * - Retry/Catch numeric fields in range, States.ALL alone and last
 *
 * Pure: validating the same definition twice gives the same violations,
 * in the same order.
 *
 * States the parser rejected still count as declared, so a reference to
 * one is not reported twice; reachability past such a state is not judged.
 */
class DefinitionValidator {
public:
    /**
     * Return every violation found (empty when the definition is valid)
     */
    static std::vector<std::string> check(const WorkflowDefinition& definition,
                                          const RejectedStates& rejected = {});

    /**
     * Throw ValidationError listing all violations, if any
     */
    static void validate(const WorkflowDefinition& definition);

    /**
     * Parse and check a document: parse violations first, then the
     * graph-level ones found on whatever could be parsed.
     */
    static std::vector<std::string> checkDocument(const json& document, const std::string& name);

    /**
     * Parse and validate; throws one ValidationError with every violation
     */
    static WorkflowDefinitionPtr load(const json& document, const std::string& name);
    static WorkflowDefinitionPtr loadString(const std::string& text, const std::string& name);

private:
    static void checkDefinition(const WorkflowDefinition& definition,
                                const RejectedStates& rejected,
                                std::vector<std::string>& violations);
    static void checkState(const WorkflowDefinition& definition,
                           const StateSpec& state,
                           const RejectedStates& rejected,
                           std::vector<std::string>& violations);
    static void checkRetriers(const std::string& where,
                              const std::vector<RetryPolicy>& retriers,
                              std::vector<std::string>& violations);
    static void checkCatchers(const WorkflowDefinition& definition,
                              const RejectedStates& rejected,
                              const std::string& where,
                              const std::vector<CatchPolicy>& catchers,
                              std::vector<std::string>& violations);
    static void checkMatchers(const std::string& where,
                              const std::vector<std::string>& matchers,
                              bool isLast,
                              std::vector<std::string>& violations);
    static void checkPath(const std::string& where, const char* field,
                          const std::string& path,
                          std::vector<std::string>& violations);
    static void checkReachability(const WorkflowDefinition& definition,
                                  const RejectedStates& rejected,
                                  std::vector<std::string>& violations);
};

} // namespace workflow
} // namespace drflow

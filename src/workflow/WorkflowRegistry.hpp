#pragma once

#include "workflow/Definition.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace drflow {
namespace workflow {

using json = nlohmann::json;

class TaskRegistry;

/**
 * Validated workflow definitions by name
 *
 * Definitions are immutable once registered and handed out as shared
 * pointers, so executions keep theirs alive even if the name is later
 * re-registered.
 */
class WorkflowRegistry {
public:
    /**
     * Parse, validate and register a definition document.
     * Throws ValidationError listing every problem.
     */
    WorkflowDefinitionPtr registerWorkflow(const std::string& name, const json& document);

    /**
     * Validate and register an already-built definition
     */
    void registerWorkflow(WorkflowDefinitionPtr definition);

    /**
     * Load one JSON file; the workflow is named after the file stem
     */
    WorkflowDefinitionPtr loadFile(const std::string& path);

    /**
     * Load every *.json file of a directory. A file that fails to load is
     * logged and skipped; returns the names that were registered.
     */
    std::vector<std::string> loadDirectory(const std::string& dir);

    WorkflowDefinitionPtr getWorkflow(const std::string& name) const;
    bool hasWorkflow(const std::string& name) const;
    bool removeWorkflow(const std::string& name);
    std::vector<std::string> getWorkflowNames() const;

    /**
     * Task resources referenced by a definition (branches included)
     * that have no handler in `tasks`
     */
    static std::vector<TaskRef> missingResources(const WorkflowDefinition& definition,
                                                 const TaskRegistry& tasks);

    /**
     * Every Task resource of a definition, branches included, sorted and unique
     */
    static std::vector<TaskRef> collectResources(const WorkflowDefinition& definition);

private:
    void store(WorkflowDefinitionPtr definition);

    mutable std::mutex m_mutex;
    std::map<std::string, WorkflowDefinitionPtr> m_workflows;
};

} // namespace workflow
} // namespace drflow

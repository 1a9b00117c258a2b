#include "workflow/WorkflowRegistry.hpp"
#include "workflow/DefinitionSerializer.hpp"
#include "workflow/DefinitionValidator.hpp"
#include "workflow/Errors.hpp"
#include "workflow/TaskRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace drflow {
namespace workflow {

namespace fs = std::filesystem;

namespace {

void collectInto(const WorkflowDefinition& definition, std::set<TaskRef>& out) {
    for (const auto& state : definition.getStates()) {
        if (const TaskState* task = state.asTask()) {
            out.insert(task->resource);
        } else if (const ParallelState* parallel = state.asParallel()) {
            for (const auto& branch : parallel->branches) {
                collectInto(*branch, out);
            }
        }
    }
}

} // anonymous namespace

WorkflowDefinitionPtr WorkflowRegistry::registerWorkflow(const std::string& name, const json& document) {
    auto definition = DefinitionValidator::load(document, name);
    store(definition);
    return definition;
}

void WorkflowRegistry::registerWorkflow(WorkflowDefinitionPtr definition) {
    if (!definition) {
        throw std::invalid_argument("Cannot register a null workflow definition");
    }
    DefinitionValidator::validate(*definition);
    store(std::move(definition));
}

void WorkflowRegistry::store(WorkflowDefinitionPtr definition) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_workflows[definition->getName()] = std::move(definition);
}

WorkflowDefinitionPtr WorkflowRegistry::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open workflow file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string name = fs::path(path).stem().string();
    auto definition = DefinitionValidator::loadString(buffer.str(), name);
    store(definition);
    LOG_INFO("Loaded workflow '" + name + "' from " + path + " (" +
             std::to_string(definition->stateCount()) + " states)");
    return definition;
}

std::vector<std::string> WorkflowRegistry::loadDirectory(const std::string& dir) {
    if (!fs::is_directory(dir)) {
        throw std::runtime_error("Workflow directory not found: " + dir);
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<std::string> loaded;
    for (const auto& file : files) {
        try {
            loaded.push_back(loadFile(file.string())->getName());
        } catch (const ValidationError& e) {
            LOG_ERROR("Rejected workflow " + file.string() + ": " + e.what());
        } catch (const std::runtime_error& e) {
            LOG_ERROR("Failed to load workflow " + file.string() + ": " + e.what());
        }
    }
    return loaded;
}

WorkflowDefinitionPtr WorkflowRegistry::getWorkflow(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_workflows.find(name);
    return it != m_workflows.end() ? it->second : nullptr;
}

bool WorkflowRegistry::hasWorkflow(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_workflows.count(name) > 0;
}

bool WorkflowRegistry::removeWorkflow(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_workflows.erase(name) > 0;
}

std::vector<std::string> WorkflowRegistry::getWorkflowNames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_workflows.size());
    for (const auto& [name, _] : m_workflows) {
        names.push_back(name);
    }
    return names;
}

std::vector<TaskRef> WorkflowRegistry::collectResources(const WorkflowDefinition& definition) {
    std::set<TaskRef> refs;
    collectInto(definition, refs);
    return {refs.begin(), refs.end()};
}

std::vector<TaskRef> WorkflowRegistry::missingResources(const WorkflowDefinition& definition,
                                                        const TaskRegistry& tasks) {
    std::vector<TaskRef> missing;
    for (const auto& ref : collectResources(definition)) {
        if (!tasks.hasTask(ref)) {
            missing.push_back(ref);
        }
    }
    return missing;
}

} // namespace workflow
} // namespace drflow

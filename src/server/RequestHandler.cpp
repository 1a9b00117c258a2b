#include "server/RequestHandler.hpp"
#include "workflow/DefinitionSerializer.hpp"
#include "workflow/DefinitionValidator.hpp"
#include "workflow/Errors.hpp"
#include "workflow/SituationReport.hpp"
#include "core/Logger.hpp"

namespace drflow {
namespace server {

namespace {

json parseStored(const std::string& text) {
    if (text.empty()) return nullptr;
    json value = json::parse(text, nullptr, false);
    return value.is_discarded() ? json(text) : value;
}

json eventToJson(const storage::EventRecord& evt) {
    return json{
        {"sequence", evt.sequence},
        {"timestamp", evt.timestamp},
        {"state", evt.stateName},
        {"kind", evt.kind},
        {"detail", parseStored(evt.detailJson)}
    };
}

} // anonymous namespace

RequestHandler::RequestHandler(workflow::WorkflowRegistry& workflows,
                               workflow::ExecutionService& executions,
                               storage::ExecutionStore& store)
    : m_workflows(workflows)
    , m_executions(executions)
    , m_store(store)
{}

json RequestHandler::handleHealth() {
    return json{
        {"status", "ok"},
        {"service", "drflow"},
        {"version", "1.0.0"},
        {"workflows", m_workflows.getWorkflowNames().size()},
        {"active_executions", m_executions.activeCount()}
    };
}

// =============================================================================
// Workflow definitions
// =============================================================================

json RequestHandler::handleListWorkflows() {
    json list = json::array();
    for (const auto& name : m_workflows.getWorkflowNames()) {
        auto definition = m_workflows.getWorkflow(name);
        if (!definition) continue;
        list.push_back({
            {"name", name},
            {"comment", definition->getComment()},
            {"start_at", definition->getStartAt()},
            {"state_count", definition->stateCount()}
        });
    }
    return json{{"status", "ok"}, {"workflows", list}};
}

json RequestHandler::handleGetWorkflow(const std::string& name) {
    auto definition = m_workflows.getWorkflow(name);
    if (!definition) {
        throw NotFoundError("Workflow not found: " + name);
    }
    return json{
        {"status", "ok"},
        {"name", name},
        {"definition", workflow::DefinitionSerializer::toJson(*definition)}
    };
}

json RequestHandler::handleRegisterWorkflow(const std::string& name, const json& request) {
    // POST /api/workflows/validate is routed to handleValidateWorkflow
    if (name == "validate") {
        throw std::invalid_argument("Workflow name 'validate' is reserved");
    }
    json document = request.contains("definition") ? request["definition"] : request;
    auto definition = m_workflows.registerWorkflow(name, document);
    m_store.saveWorkflow(name, workflow::DefinitionSerializer::toString(*definition, -1));

    LOG_INFO("Registered workflow '" + name + "'");
    return json{
        {"status", "ok"},
        {"name", name},
        {"state_count", definition->stateCount()}
    };
}

json RequestHandler::handleValidateWorkflow(const json& request) {
    json document = request.contains("definition") ? request["definition"] : request;
    std::string name = "unnamed";
    if (request.is_object() && request.contains("name") && request["name"].is_string()) {
        name = request["name"].get<std::string>();
    }

    std::vector<std::string> violations = workflow::DefinitionValidator::checkDocument(document, name);

    return json{
        {"status", "ok"},
        {"valid", violations.empty()},
        {"violations", violations}
    };
}

// =============================================================================
// Executions
// =============================================================================

json RequestHandler::handleStartExecution(const std::string& workflowName, const json& request) {
    if (!m_workflows.hasWorkflow(workflowName)) {
        throw NotFoundError("Workflow not found: " + workflowName);
    }
    json input = (request.is_object() && request.contains("input")) ? request["input"] : request;
    if (input.is_null()) {
        input = json::object();
    }

    std::string id = m_executions.start(workflowName, std::move(input));
    return json{
        {"status", "ok"},
        {"execution_id", id},
        {"workflow", workflowName}
    };
}

json RequestHandler::handleListExecutions(const std::string& workflowName) {
    if (!m_workflows.hasWorkflow(workflowName)) {
        throw NotFoundError("Workflow not found: " + workflowName);
    }
    json list = json::array();
    for (const auto& record : m_executions.listExecutions(workflowName)) {
        list.push_back({
            {"execution_id", record.id},
            {"status", record.status},
            {"current_state", record.currentState},
            {"started_at", record.startedAt},
            {"finished_at", record.finishedAt}
        });
    }
    return json{{"status", "ok"}, {"executions", list}};
}

json RequestHandler::handleGetExecution(const std::string& executionId) {
    // "status" is the execution status here, not the envelope
    return recordToJson(requireExecution(executionId), false);
}

json RequestHandler::handleGetHistory(const std::string& executionId) {
    auto record = requireExecution(executionId);
    json history = json::array();
    for (const auto& evt : record.history) {
        history.push_back(eventToJson(evt));
    }
    return json{
        {"status", "ok"},
        {"execution_id", executionId},
        {"history", history}
    };
}

std::string RequestHandler::handleGetReport(const std::string& executionId) {
    return workflow::SituationReport::render(requireExecution(executionId));
}

json RequestHandler::handleCancelExecution(const std::string& executionId) {
    auto record = requireExecution(executionId);
    bool requested = m_executions.cancel(executionId);
    return json{
        {"status", "ok"},
        {"execution_id", executionId},
        {"cancel_requested", requested},
        {"execution_status", record.status}
    };
}

json RequestHandler::recordToJson(const storage::ExecutionRecord& record, bool includeHistory) {
    json j = {
        {"execution_id", record.id},
        {"workflow", record.workflowName},
        {"status", record.status},
        {"current_state", record.currentState},
        {"input", parseStored(record.inputJson)},
        {"started_at", record.startedAt},
        {"updated_at", record.updatedAt}
    };
    if (record.status == "SUCCEEDED") {
        j["output"] = parseStored(record.payloadJson);
    }
    if (!record.error.empty()) {
        j["error"] = record.error;
        j["cause"] = record.cause;
    }
    if (!record.finishedAt.empty()) {
        j["finished_at"] = record.finishedAt;
    }
    if (includeHistory) {
        json history = json::array();
        for (const auto& evt : record.history) {
            history.push_back(eventToJson(evt));
        }
        j["history"] = history;
    }
    return j;
}

storage::ExecutionRecord RequestHandler::requireExecution(const std::string& executionId) {
    auto record = m_executions.describe(executionId);
    if (!record) {
        throw NotFoundError("Execution not found: " + executionId);
    }
    return *record;
}

} // namespace server
} // namespace drflow

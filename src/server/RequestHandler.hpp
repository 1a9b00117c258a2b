#pragma once

#include "storage/ExecutionStore.hpp"
#include "workflow/ExecutionService.hpp"
#include "workflow/WorkflowRegistry.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace drflow {
namespace server {

using json = nlohmann::json;

/**
 * Unknown workflow or execution (HTTP 404)
 */
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Request handler - business logic behind the HTTP API
 *
 * Handlers return {"status": "ok", ...} bodies and throw NotFoundError,
 * workflow::ValidationError or std::invalid_argument for the session to
 * map onto 404 / 400 responses.
 */
class RequestHandler {
public:
    RequestHandler(workflow::WorkflowRegistry& workflows,
                   workflow::ExecutionService& executions,
                   storage::ExecutionStore& store);

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    json handleHealth();

    // Workflow definitions
    json handleListWorkflows();
    json handleGetWorkflow(const std::string& name);
    json handleRegisterWorkflow(const std::string& name, const json& request);
    json handleValidateWorkflow(const json& request);

    // Executions
    json handleStartExecution(const std::string& workflowName, const json& request);
    json handleListExecutions(const std::string& workflowName);
    json handleGetExecution(const std::string& executionId);
    json handleGetHistory(const std::string& executionId);
    std::string handleGetReport(const std::string& executionId);
    json handleCancelExecution(const std::string& executionId);

    /**
     * JSON view of a stored execution
     */
    static json recordToJson(const storage::ExecutionRecord& record, bool includeHistory);

private:
    storage::ExecutionRecord requireExecution(const std::string& executionId);

    workflow::WorkflowRegistry& m_workflows;
    workflow::ExecutionService& m_executions;
    storage::ExecutionStore& m_store;
};

} // namespace server
} // namespace drflow

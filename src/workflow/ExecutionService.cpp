#include "workflow/ExecutionService.hpp"
#include "workflow/TimeUtil.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <stdexcept>

namespace drflow {
namespace workflow {

ExecutionService::ExecutionService(WorkflowRegistry& workflows,
                                   TaskInvoker& invoker,
                                   storage::ExecutionStore& store,
                                   ServiceOptions options)
    : m_workflows(workflows)
    , m_invoker(invoker)
    , m_store(store)
    , m_options(options)
{}

ExecutionService::~ExecutionService() {
    shutdown();
}

// =============================================================================
// Trigger
// =============================================================================

std::string ExecutionService::start(const std::string& workflowName, json input) {
    auto definition = m_workflows.getWorkflow(workflowName);
    if (!definition) {
        throw std::invalid_argument("Unknown workflow: " + workflowName);
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopped) {
            throw std::runtime_error("Execution service is shut down");
        }
    }

    auto execution = std::make_shared<Execution>(Execution::generateId(), definition,
                                                 std::move(input), timeoutFor(*definition));
    m_store.createExecution(toRecord(*execution));

    LOG_INFO("Started execution " + execution->getId() + " of '" + workflowName + "'");
    std::string id = execution->getId();
    launch(std::move(execution));
    return id;
}

void ExecutionService::launch(std::shared_ptr<Execution> execution) {
    auto active = std::make_shared<Active>();
    active->finished = active->done.get_future().share();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopped) {
        throw std::runtime_error("Execution service is shut down");
    }
    reapFinishedLocked();
    m_active[execution->getId()] = active;
    m_workers.push_back(Worker{
        .active = active,
        .thread = std::thread([this, execution, active]() { drive(*execution, active); })
    });
}

// Caller holds m_mutex
void ExecutionService::reapFinishedLocked() {
    for (auto it = m_workers.begin(); it != m_workers.end();) {
        if (it->active->finished.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it->thread.join();
            it = m_workers.erase(it);
        } else {
            ++it;
        }
    }
}

void ExecutionService::drive(Execution& execution, const std::shared_ptr<Active>& active) {
    LogScope scope(execution.getId(), false);
    Interpreter interpreter(m_invoker, m_options.interpreter);
    interpreter.setCallback([this](const Execution& e, const ExecutionEvent& evt) {
        persistEvent(e, evt);
    });

    ExecutionStatus status = interpreter.run(execution, active->token);
    persistState(execution);

    LOG_INFO("Execution " + execution.getId() + " finished with status " +
             executionStatusToString(status));

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active.erase(execution.getId());
    }
    active->done.set_value();
}

// =============================================================================
// Status
// =============================================================================

bool ExecutionService::cancel(const std::string& executionId) {
    std::shared_ptr<Active> active;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_active.find(executionId);
        if (it == m_active.end()) {
            return false;
        }
        active = it->second;
    }
    LOG_INFO("Cancellation requested for execution " + executionId);
    active->token.cancel(StopReason::Cancelled);
    return true;
}

std::optional<storage::ExecutionRecord> ExecutionService::describe(const std::string& executionId) {
    return m_store.getExecution(executionId);
}

std::optional<storage::ExecutionRecord> ExecutionService::waitForCompletion(
        const std::string& executionId, std::chrono::milliseconds timeout) {
    std::shared_ptr<Active> active;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_active.find(executionId);
        if (it != m_active.end()) {
            active = it->second;
        }
    }
    if (active) {
        active->finished.wait_for(timeout);
    }
    return describe(executionId);
}

std::vector<storage::ExecutionRecord> ExecutionService::listExecutions(const std::string& workflowName) {
    return m_store.listExecutions(workflowName);
}

size_t ExecutionService::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.size();
}

// =============================================================================
// Recovery
// =============================================================================

size_t ExecutionService::recoverInterrupted() {
    size_t resumed = 0;

    for (auto& record : m_store.listByStatus(executionStatusToString(ExecutionStatus::Running))) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopped) break;
            if (m_active.count(record.id)) continue;
        }

        auto definition = m_workflows.getWorkflow(record.workflowName);
        if (!definition) {
            LOG_ERROR("Cannot resume execution " + record.id + ": workflow '" +
                      record.workflowName + "' is not registered");
            record.status = executionStatusToString(ExecutionStatus::Failed);
            record.error = errors::RUNTIME;
            record.cause = "Workflow '" + record.workflowName + "' is not registered";
            record.finishedAt = currentTimestamp();
            m_store.updateExecution(record);
            continue;
        }

        try {
            std::vector<ExecutionEvent> history;
            std::string resumeState;
            json resumePayload = json::parse(record.inputJson);

            for (const auto& evt : m_store.getHistory(record.id)) {
                auto kind = eventKindFromString(evt.kind);
                if (!kind) {
                    throw std::invalid_argument("unknown event kind '" + evt.kind + "'");
                }
                json detail = json::parse(evt.detailJson);
                if (*kind == EventKind::Entered) {
                    resumeState = evt.stateName;
                    resumePayload = detail.value("input", json::object());
                }
                history.push_back(ExecutionEvent{
                    .timestamp = parseTimestamp(evt.timestamp),
                    .stateName = evt.stateName,
                    .kind = *kind,
                    .detail = std::move(detail)
                });
            }

            auto execution = std::make_shared<Execution>(
                record.id, definition, json::parse(record.inputJson),
                std::chrono::milliseconds(record.timeoutMs), parseTimestamp(record.startedAt));
            execution->restoreHistory(std::move(history));
            execution->setCurrentState(resumeState);
            execution->setPayload(std::move(resumePayload));

            LOG_INFO("Resuming execution " + record.id + " of '" + record.workflowName + "' at '" +
                     (resumeState.empty() ? definition->getStartAt() : resumeState) + "'");
            launch(std::move(execution));
            ++resumed;
        } catch (const std::exception& e) {
            LOG_ERROR("Cannot resume execution " + record.id + ": " + e.what());
        }
    }
    return resumed;
}

// =============================================================================
// Shutdown
// =============================================================================

void ExecutionService::shutdown() {
    std::vector<std::shared_ptr<Active>> running;
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopped) return;
        m_stopped = true;
        for (const auto& [id, active] : m_active) {
            running.push_back(active);
        }
        workers.swap(m_workers);
    }
    if (!running.empty()) {
        LOG_INFO("Cancelling " + std::to_string(running.size()) + " running execution(s)");
    }
    for (const auto& active : running) {
        active->token.cancel(StopReason::Cancelled);
    }
    for (auto& worker : workers) {
        worker.thread.join();
    }
}

// =============================================================================
// Persistence
// =============================================================================

void ExecutionService::persistEvent(const Execution& execution, const ExecutionEvent& event) {
    try {
        m_store.appendEvent(execution.getId(), storage::EventRecord{
            .sequence = 0,
            .timestamp = formatTimestamp(event.timestamp),
            .stateName = event.stateName,
            .kind = eventKindToString(event.kind),
            .detailJson = event.detail.dump()
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to persist event for execution " + execution.getId() + ": " + e.what());
        return;
    }
    if (event.kind == EventKind::Entered) {
        persistState(execution);
    }
}

void ExecutionService::persistState(const Execution& execution) {
    try {
        m_store.updateExecution(toRecord(execution));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to persist execution " + execution.getId() + ": " + e.what());
    }
}

storage::ExecutionRecord ExecutionService::toRecord(const Execution& execution) {
    auto finishedAt = execution.getFinishedAt();
    return storage::ExecutionRecord{
        .id = execution.getId(),
        .workflowName = execution.getDefinition().getName(),
        .status = executionStatusToString(execution.getStatus()),
        .currentState = execution.getCurrentState(),
        .inputJson = execution.getInput().dump(),
        .payloadJson = execution.getPayload().dump(),
        .error = execution.getError().error,
        .cause = execution.getError().cause,
        .timeoutMs = execution.getTimeout().count(),
        .startedAt = formatTimestamp(execution.getStartedAt()),
        .updatedAt = "",
        .finishedAt = finishedAt ? formatTimestamp(*finishedAt) : "",
        .history = {}
    };
}

std::chrono::milliseconds ExecutionService::timeoutFor(const WorkflowDefinition& definition) const {
    if (definition.getTimeoutSeconds()) {
        return std::chrono::milliseconds(
            static_cast<int64_t>(std::llround(*definition.getTimeoutSeconds() * 1000.0)));
    }
    return m_options.defaultWorkflowTimeout;
}

} // namespace workflow
} // namespace drflow

#pragma once

#include "storage/ExecutionStore.hpp"
#include "workflow/CancellationToken.hpp"
#include "workflow/Execution.hpp"
#include "workflow/Interpreter.hpp"
#include "workflow/TaskInvoker.hpp"
#include "workflow/WorkflowRegistry.hpp"
#include <chrono>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace drflow {
namespace workflow {

struct ServiceOptions {
    /// Workflow deadline when the definition has no TimeoutSeconds
    std::chrono::milliseconds defaultWorkflowTimeout{std::chrono::minutes(30)};
    InterpreterOptions interpreter;
};

/**
 * Trigger and status interface over the engine
 *
 * start() returns an execution id immediately; the execution then runs on
 * a thread of its own, so its deadline only ever counts time it spent
 * running. Every history event is written through to the store as
 * it happens, so status queries are answered from the store.
 */
class ExecutionService {
public:
    ExecutionService(WorkflowRegistry& workflows,
                     TaskInvoker& invoker,
                     storage::ExecutionStore& store,
                     ServiceOptions options = {});
    ~ExecutionService();

    ExecutionService(const ExecutionService&) = delete;
    ExecutionService& operator=(const ExecutionService&) = delete;

    /**
     * Start a new execution and return its id.
     * Throws std::invalid_argument for an unknown workflow.
     */
    std::string start(const std::string& workflowName, json input);

    /**
     * Request cancellation; false if the execution is not running here
     */
    bool cancel(const std::string& executionId);

    /**
     * Persisted state (status, current state, history, output, error)
     */
    std::optional<storage::ExecutionRecord> describe(const std::string& executionId);

    /**
     * Block until the execution is terminal or `timeout` elapses, then describe it
     */
    std::optional<storage::ExecutionRecord> waitForCompletion(const std::string& executionId,
                                                              std::chrono::milliseconds timeout);

    std::vector<storage::ExecutionRecord> listExecutions(const std::string& workflowName = "");

    /**
     * Resume executions the store still marks RUNNING from a previous process.
     * Returns the number resumed.
     */
    size_t recoverInterrupted();

    size_t activeCount() const;

    /**
     * Cancel every in-flight execution and join their threads
     */
    void shutdown();

    /**
     * Store representation of an execution (history not included)
     */
    static storage::ExecutionRecord toRecord(const Execution& execution);

private:
    struct Active {
        CancellationToken token;
        std::promise<void> done;
        std::shared_future<void> finished;
    };

    struct Worker {
        std::shared_ptr<Active> active;
        std::thread thread;
    };

    void launch(std::shared_ptr<Execution> execution);
    void reapFinishedLocked();
    void drive(Execution& execution, const std::shared_ptr<Active>& active);
    void persistEvent(const Execution& execution, const ExecutionEvent& event);
    void persistState(const Execution& execution);

    std::chrono::milliseconds timeoutFor(const WorkflowDefinition& definition) const;

    WorkflowRegistry& m_workflows;
    TaskInvoker& m_invoker;
    storage::ExecutionStore& m_store;
    ServiceOptions m_options;

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<Active>> m_active;
    std::list<Worker> m_workers;
    bool m_stopped = false;
};

} // namespace workflow
} // namespace drflow

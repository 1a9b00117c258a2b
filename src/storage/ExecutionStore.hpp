#pragma once

#include "storage/ExecutionRecord.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace drflow {
namespace storage {

/**
 * SQLite-based store for execution records, their event history and
 * registered workflow definitions
 *
 * Thread-safe: every call is serialized on one connection.
 *
 * Usage:
 *   ExecutionStore db("./drflow.db");
 *   db.createExecution({.id = "exec_...", .workflowName = "NaturalDisaster", ...});
 *   db.appendEvent("exec_...", {.timestamp = ..., .stateName = "Assess", .kind = "ENTERED"});
 *   auto record = db.getExecution("exec_...");
 */
class ExecutionStore {
public:
    /**
     * Open or create a SQLite database at the given path (":memory:" allowed)
     */
    explicit ExecutionStore(const std::string& dbPath);
    ~ExecutionStore();

    // Non-copyable
    ExecutionStore(const ExecutionStore&) = delete;
    ExecutionStore& operator=(const ExecutionStore&) = delete;

    // Movable
    ExecutionStore(ExecutionStore&&) noexcept;
    ExecutionStore& operator=(ExecutionStore&&) noexcept;

    // === Executions ===

    /**
     * Insert a new execution (updated_at is auto-set)
     * Throws if the id already exists
     */
    void createExecution(const ExecutionRecord& record);

    /**
     * Update status, current state, payload, error and finish time
     * Throws if the execution doesn't exist
     */
    void updateExecution(const ExecutionRecord& record);

    /**
     * Append one event; the sequence number is assigned by the store and returned
     */
    int64_t appendEvent(const std::string& executionId, const EventRecord& event);

    /**
     * Get an execution with its full history
     */
    std::optional<ExecutionRecord> getExecution(const std::string& executionId);

    /**
     * Ordered history of an execution
     */
    std::vector<EventRecord> getHistory(const std::string& executionId);

    /**
     * List executions (without history) ordered by started_at DESC.
     * An empty workflow name lists every execution.
     */
    std::vector<ExecutionRecord> listExecutions(const std::string& workflowName = "");

    /**
     * Executions with the given status, oldest first
     */
    std::vector<ExecutionRecord> listByStatus(const std::string& status);

    /**
     * Delete an execution and its events
     */
    void deleteExecution(const std::string& executionId);

    /**
     * Delete finished executions of a workflow, keeping the N most recent
     * (running executions are never removed)
     */
    void cleanupOldExecutions(const std::string& workflowName, size_t keepCount = 10);

    // === Workflow definitions ===

    /**
     * Insert or replace a definition document
     */
    void saveWorkflow(const std::string& name, const std::string& definitionJson);

    /**
     * All stored definitions ordered by name
     */
    std::vector<WorkflowRecord> loadWorkflows();

    void deleteWorkflow(const std::string& name);

    /**
     * Get the database file path
     */
    const std::string& getDbPath() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace storage
} // namespace drflow

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace drflow {
namespace storage {

/**
 * One persisted history event
 */
struct EventRecord {
    int64_t sequence = 0;                // Position in the execution's history (0-based)
    std::string timestamp;               // ISO 8601 timestamp
    std::string stateName;
    std::string kind;                    // ENTERED, RETRIED, CAUGHT, BRANCHED, JOINED, EXITED
    std::string detailJson;              // Serialized detail object
};

/**
 * Persisted state of one workflow execution
 */
struct ExecutionRecord {
    std::string id;                      // exec_<hex>
    std::string workflowName;
    std::string status;                  // RUNNING, SUCCEEDED, FAILED, TIMED_OUT, CANCELLED
    std::string currentState;
    std::string inputJson;               // Payload the execution was triggered with
    std::string payloadJson;             // Latest payload (output once SUCCEEDED)
    std::string error;                   // Error identifier, empty unless failed
    std::string cause;
    int64_t timeoutMs = 0;               // Workflow-level budget
    std::string startedAt;               // ISO 8601 timestamp
    std::string updatedAt;
    std::string finishedAt;              // empty while RUNNING
    std::vector<EventRecord> history;    // Only filled by getExecution()
};

/**
 * A registered workflow definition document
 */
struct WorkflowRecord {
    std::string name;
    std::string definitionJson;
    std::string createdAt;
    std::string updatedAt;
};

} // namespace storage
} // namespace drflow

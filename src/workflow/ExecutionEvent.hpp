#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace drflow {
namespace workflow {

using json = nlohmann::json;

/**
 * Kind of audit event recorded in an execution's history
 */
enum class EventKind {
    Entered,    // state about to be processed (detail: input)
    Retried,    // failed attempt, retry scheduled (detail: error, cause, attempt, delay_ms)
    Caught,     // error routed to a catcher (detail: error, cause, next)
    Branched,   // Parallel state forked its branches (detail: branch_count)
    Joined,     // Parallel state joined its branches (detail: per-branch status)
    Exited      // state completed (detail: output)
};

std::string eventKindToString(EventKind kind);
std::optional<EventKind> eventKindFromString(const std::string& str);

/**
 * One append-only history entry
 */
struct ExecutionEvent {
    std::chrono::system_clock::time_point timestamp;
    std::string stateName;
    EventKind kind = EventKind::Entered;
    json detail = json::object();

    json toJson() const;
    static ExecutionEvent fromJson(const json& j);
};

class Execution;

/**
 * Callback for history events, invoked on the thread driving the execution
 */
using ExecutionCallback = std::function<void(const Execution&, const ExecutionEvent&)>;

} // namespace workflow
} // namespace drflow

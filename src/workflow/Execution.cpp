#include "workflow/Execution.hpp"
#include "workflow/TimeUtil.hpp"
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

namespace drflow {
namespace workflow {

// =============================================================================
// Enum conversions
// =============================================================================

std::string eventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::Entered: return "ENTERED";
        case EventKind::Retried: return "RETRIED";
        case EventKind::Caught: return "CAUGHT";
        case EventKind::Branched: return "BRANCHED";
        case EventKind::Joined: return "JOINED";
        case EventKind::Exited: return "EXITED";
    }
    return "UNKNOWN";
}

std::optional<EventKind> eventKindFromString(const std::string& str) {
    if (str == "ENTERED") return EventKind::Entered;
    if (str == "RETRIED") return EventKind::Retried;
    if (str == "CAUGHT") return EventKind::Caught;
    if (str == "BRANCHED") return EventKind::Branched;
    if (str == "JOINED") return EventKind::Joined;
    if (str == "EXITED") return EventKind::Exited;
    return std::nullopt;
}

std::string executionStatusToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Running: return "RUNNING";
        case ExecutionStatus::Succeeded: return "SUCCEEDED";
        case ExecutionStatus::Failed: return "FAILED";
        case ExecutionStatus::TimedOut: return "TIMED_OUT";
        case ExecutionStatus::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

std::optional<ExecutionStatus> executionStatusFromString(const std::string& str) {
    if (str == "RUNNING") return ExecutionStatus::Running;
    if (str == "SUCCEEDED") return ExecutionStatus::Succeeded;
    if (str == "FAILED") return ExecutionStatus::Failed;
    if (str == "TIMED_OUT") return ExecutionStatus::TimedOut;
    if (str == "CANCELLED") return ExecutionStatus::Cancelled;
    return std::nullopt;
}

// =============================================================================
// ExecutionEvent
// =============================================================================

json ExecutionEvent::toJson() const {
    return json{
        {"timestamp", formatTimestamp(timestamp)},
        {"state", stateName},
        {"kind", eventKindToString(kind)},
        {"detail", detail}
    };
}

ExecutionEvent ExecutionEvent::fromJson(const json& j) {
    ExecutionEvent evt;
    evt.timestamp = parseTimestamp(j.at("timestamp").get<std::string>());
    evt.stateName = j.at("state").get<std::string>();

    std::string kindStr = j.at("kind").get<std::string>();
    auto kind = eventKindFromString(kindStr);
    if (!kind) {
        throw std::invalid_argument("Unknown event kind: " + kindStr);
    }
    evt.kind = *kind;
    evt.detail = j.value("detail", json::object());
    return evt;
}

// =============================================================================
// Execution
// =============================================================================

Execution::Execution(std::string id,
                     WorkflowDefinitionPtr definition,
                     json input,
                     std::chrono::milliseconds timeout,
                     std::optional<std::chrono::system_clock::time_point> startedAt)
    : m_id(std::move(id))
    , m_definition(std::move(definition))
    , m_input(input)
    , m_payload(std::move(input))
    , m_timeout(timeout)
    , m_startedAt(startedAt.value_or(std::chrono::system_clock::now()))
{
    if (!m_definition) {
        throw std::invalid_argument("Execution requires a workflow definition");
    }

    // The deadline is anchored on the wall-clock start so a rebuilt execution
    // keeps its original budget.
    auto elapsed = std::chrono::system_clock::now() - m_startedAt;
    m_deadline = std::chrono::steady_clock::now() -
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(elapsed) + m_timeout;
}

std::string Execution::generateId() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;
    static std::mutex mutex;

    uint64_t value;
    {
        std::lock_guard<std::mutex> lock(mutex);
        value = dis(gen);
    }
    std::stringstream ss;
    ss << "exec_" << std::hex << std::setfill('0') << std::setw(16) << value;
    return ss.str();
}

const ExecutionEvent& Execution::appendEvent(const std::string& stateName, EventKind kind, json detail) {
    ExecutionEvent evt;
    evt.timestamp = std::chrono::system_clock::now();
    evt.stateName = stateName;
    evt.kind = kind;
    evt.detail = std::move(detail);
    m_history.push_back(std::move(evt));
    return m_history.back();
}

void Execution::finish(ExecutionStatus status, ErrorInfo error) {
    if (isTerminal()) {
        throw std::logic_error("Execution " + m_id + " is already " +
                               executionStatusToString(m_status));
    }
    if (status == ExecutionStatus::Running) {
        throw std::logic_error("Cannot finish execution " + m_id + " as RUNNING");
    }
    m_status = status;
    m_error = std::move(error);
    m_finishedAt = std::chrono::system_clock::now();
}

json Execution::toJson(bool includeHistory) const {
    json j = {
        {"execution_id", m_id},
        {"workflow", m_definition->getName()},
        {"status", executionStatusToString(m_status)},
        {"current_state", m_currentState},
        {"input", m_input},
        {"started_at", formatTimestamp(m_startedAt)},
        {"timeout_seconds", m_timeout.count() / 1000.0}
    };

    if (m_status == ExecutionStatus::Succeeded) {
        j["output"] = m_payload;
    }
    if (!m_error.empty()) {
        j["error"] = m_error.error;
        j["cause"] = m_error.cause;
    }
    if (m_finishedAt) {
        j["finished_at"] = formatTimestamp(*m_finishedAt);
    }
    if (includeHistory) {
        json history = json::array();
        for (const auto& evt : m_history) {
            history.push_back(evt.toJson());
        }
        j["history"] = history;
    }
    return j;
}

} // namespace workflow
} // namespace drflow

#pragma once

#include "workflow/Definition.hpp"
#include "workflow/Errors.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <future>

namespace drflow {
namespace workflow {

using json = nlohmann::json;

/**
 * Result of one task invocation: either an output payload or an error
 */
struct TaskOutcome {
    bool success = false;
    json output;
    ErrorInfo error;

    static TaskOutcome ok(json output) {
        return TaskOutcome{.success = true, .output = std::move(output), .error = {}};
    }
    static TaskOutcome failure(ErrorInfo error) {
        return TaskOutcome{.success = false, .output = nullptr, .error = std::move(error)};
    }
};

/**
 * Port through which the Interpreter executes a named unit of work
 *
 * Implementations must be safe to call concurrently and must satisfy the
 * returned future within `timeout` of the work starting (with a
 * States.Timeout failure if it did not finish). Dropping the future abandons the invocation; it
 * must never block.
 */
class TaskInvoker {
public:
    virtual ~TaskInvoker() = default;

    virtual std::future<TaskOutcome> invoke(const TaskRef& ref,
                                            const json& payload,
                                            std::chrono::milliseconds timeout) = 0;
};

} // namespace workflow
} // namespace drflow

#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace drflow {
namespace workflow {

using json = nlohmann::json;

/**
 * Reserved error identifiers
 */
namespace errors {
    inline constexpr const char* ALL = "States.ALL";
    inline constexpr const char* TIMEOUT = "States.Timeout";
    inline constexpr const char* TASK_FAILED = "States.TaskFailed";
    inline constexpr const char* RUNTIME = "States.Runtime";
    inline constexpr const char* BRANCH_FAILED = "States.BranchFailed";
    inline constexpr const char* CANCELLED = "States.Cancelled";
    inline constexpr const char* FAIL = "States.Fail";
} // namespace errors

/**
 * Error identifier plus human-readable cause.
 * The identifier is what Retry/Catch matchers compare against.
 */
struct ErrorInfo {
    std::string error;
    std::string cause;

    bool empty() const { return error.empty(); }

    json toJson() const {
        return json{{"error", error}, {"cause", cause}};
    }
};

/**
 * Malformed or unreachable workflow definition.
 * Carries every violation found, not just the first.
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(std::vector<std::string> violations);

    const std::vector<std::string>& violations() const { return m_violations; }

private:
    static std::string summarize(const std::vector<std::string>& violations);

    std::vector<std::string> m_violations;
};

/**
 * Base class for errors raised while an execution is running
 */
class WorkflowException : public std::runtime_error {
public:
    explicit WorkflowException(ErrorInfo info);

    const ErrorInfo& info() const { return m_info; }
    const std::string& error() const { return m_info.error; }
    const std::string& cause() const { return m_info.cause; }

private:
    ErrorInfo m_info;
};

/**
 * Failure reported by a task collaborator.
 * Handlers throw this to choose the identifier seen by Retry/Catch matchers.
 */
class TaskInvocationError : public WorkflowException {
public:
    TaskInvocationError(std::string error, std::string cause)
        : WorkflowException(ErrorInfo{std::move(error), std::move(cause)}) {}
    explicit TaskInvocationError(ErrorInfo info)
        : WorkflowException(std::move(info)) {}
};

/**
 * Whole-workflow deadline exceeded
 */
class TimeoutError : public WorkflowException {
public:
    explicit TimeoutError(std::string cause)
        : WorkflowException(ErrorInfo{errors::TIMEOUT, std::move(cause)}) {}
};

/**
 * The last allowed retry attempt failed and no catcher matched
 */
class RetryExhaustedError : public WorkflowException {
public:
    RetryExhaustedError(ErrorInfo info, int attempts)
        : WorkflowException(std::move(info)), m_attempts(attempts) {}

    int attempts() const { return m_attempts; }

private:
    int m_attempts;
};

/**
 * A Parallel state failed because one of its branches failed.
 * Keeps the branch's identifier so outer matchers still see it.
 */
class BranchFailureError : public WorkflowException {
public:
    BranchFailureError(ErrorInfo info, size_t branchIndex)
        : WorkflowException(std::move(info)), m_branchIndex(branchIndex) {}

    size_t branchIndex() const { return m_branchIndex; }

private:
    size_t m_branchIndex;
};

/**
 * Execution stopped by an external request
 */
class CancelledError : public WorkflowException {
public:
    explicit CancelledError(std::string cause)
        : WorkflowException(ErrorInfo{errors::CANCELLED, std::move(cause)}) {}
};

} // namespace workflow
} // namespace drflow

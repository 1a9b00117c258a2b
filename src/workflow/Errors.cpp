#include "workflow/Errors.hpp"

namespace drflow {
namespace workflow {

ValidationError::ValidationError(std::vector<std::string> violations)
    : std::runtime_error(summarize(violations))
    , m_violations(std::move(violations))
{}

std::string ValidationError::summarize(const std::vector<std::string>& violations) {
    std::string message = "Invalid workflow definition";
    if (violations.empty()) {
        return message;
    }
    message += " (" + std::to_string(violations.size()) + " violation";
    message += violations.size() > 1 ? "s): " : "): ";
    for (size_t i = 0; i < violations.size(); ++i) {
        if (i > 0) message += "; ";
        message += violations[i];
    }
    return message;
}

WorkflowException::WorkflowException(ErrorInfo info)
    : std::runtime_error(info.cause.empty() ? info.error : info.error + ": " + info.cause)
    , m_info(std::move(info))
{}

} // namespace workflow
} // namespace drflow

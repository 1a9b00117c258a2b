#pragma once

#include "workflow/TaskRegistry.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace drflow {
namespace server {

using json = nlohmann::json;

/**
 * Blocking Beast HTTP client for task collaborators reached over the network
 *
 * POSTs the task payload as JSON and returns the JSON response body.
 *  - 2xx:              parsed body ({} when empty)
 *  - other status:     TaskInvocationError, identifier from the body's
 *                      "errorType" field or "Http.<status>"
 *  - network failure:  TaskInvocationError(States.TaskFailed)
 *  - timeout:          TaskInvocationError(States.Timeout)
 */
class HttpTaskClient {
public:
    struct Url {
        std::string host;
        std::string port = "80";
        std::string target = "/";
    };

    explicit HttpTaskClient(std::chrono::milliseconds timeout);

    /**
     * Split http://host[:port][/path]; throws std::invalid_argument
     */
    static Url parseUrl(const std::string& url);

    json post(const std::string& url, const json& payload) const;

    /**
     * Task handler forwarding every invocation to `url`
     */
    workflow::TaskHandler handlerFor(const std::string& url) const;

private:
    std::chrono::milliseconds m_timeout;
};

} // namespace server
} // namespace drflow

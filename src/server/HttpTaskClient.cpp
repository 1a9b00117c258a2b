#include "server/HttpTaskClient.hpp"
#include "workflow/Errors.hpp"
#include "core/Logger.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <stdexcept>

namespace drflow {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

using workflow::TaskInvocationError;
namespace errors = workflow::errors;

HttpTaskClient::HttpTaskClient(std::chrono::milliseconds timeout)
    : m_timeout(timeout)
{}

HttpTaskClient::Url HttpTaskClient::parseUrl(const std::string& url) {
    const std::string scheme = "http://";
    if (url.rfind(scheme, 0) != 0) {
        throw std::invalid_argument("Only http:// task endpoints are supported: " + url);
    }

    Url result;
    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        result.target = rest.substr(slash);
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        result.host = authority.substr(0, colon);
        result.port = authority.substr(colon + 1);
        if (result.port.empty() ||
            result.port.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("Invalid port in task endpoint: " + url);
        }
    } else {
        result.host = authority;
    }
    if (result.host.empty()) {
        throw std::invalid_argument("Missing host in task endpoint: " + url);
    }
    return result;
}

json HttpTaskClient::post(const std::string& url, const json& payload) const {
    Url endpoint;
    try {
        endpoint = parseUrl(url);
    } catch (const std::invalid_argument& e) {
        throw TaskInvocationError(errors::RUNTIME, e.what());
    }

    http::request<http::string_body> req{http::verb::post, endpoint.target, 11};
    req.set(http::field::host, endpoint.host);
    req.set(http::field::user_agent, "drflow/1.0");
    req.set(http::field::content_type, "application/json");
    req.body() = payload.dump();
    req.prepare_payload();

    // tcp_stream deadlines only apply to asynchronous operations, so the
    // exchange runs as an async chain on a private io_context.
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::error_code failure;

    resolver.async_resolve(endpoint.host, endpoint.port,
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) { failure = ec; return; }
            stream.expires_after(m_timeout);
            stream.async_connect(results,
                [&](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                    if (ec) { failure = ec; return; }
                    stream.expires_after(m_timeout);
                    http::async_write(stream, req,
                        [&](beast::error_code ec, std::size_t) {
                            if (ec) { failure = ec; return; }
                            http::async_read(stream, buffer, res,
                                [&](beast::error_code ec, std::size_t) {
                                    failure = ec;
                                });
                        });
                });
        });
    ioc.run();

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    if (failure == beast::error::timeout) {
        throw TaskInvocationError(errors::TIMEOUT,
                                  "No response from " + url + " within " +
                                  std::to_string(m_timeout.count()) + " ms");
    }
    if (failure) {
        throw TaskInvocationError(errors::TASK_FAILED,
                                  "Request to " + url + " failed: " + failure.message());
    }

    unsigned status = res.result_int();
    json body = res.body().empty() ? json::object() : json::parse(res.body(), nullptr, false);

    if (status < 200 || status >= 300) {
        std::string error = "Http." + std::to_string(status);
        std::string cause = res.body();
        if (body.is_object()) {
            error = body.value("errorType", error);
            cause = body.value("errorMessage", body.value("message", cause));
        }
        LOG_WARN("Task endpoint " + url + " answered " + std::to_string(status));
        throw TaskInvocationError(error, cause);
    }

    if (body.is_discarded()) {
        throw TaskInvocationError(errors::TASK_FAILED, "Invalid JSON response from " + url);
    }
    return body;
}

workflow::TaskHandler HttpTaskClient::handlerFor(const std::string& url) const {
    HttpTaskClient client(*this);
    return [client, url](const json& payload) {
        return client.post(url, payload);
    };
}

} // namespace server
} // namespace drflow

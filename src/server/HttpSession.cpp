#include "server/HttpSession.hpp"
#include "server/RequestHandler.hpp"
#include "workflow/Errors.hpp"
#include "core/Logger.hpp"
#include <vector>

namespace drflow {
namespace server {

namespace {

/**
 * Create a response with the common headers and log it
 */
http::response<http::string_body> makeResponse(
    http::status status,
    std::string body,
    const std::string& contentType,
    unsigned version,
    bool keepAlive,
    const Logger::RequestTrace& trace)
{
    http::response<http::string_body> res{status, version};
    res.set(http::field::server, "drflow/1.0");
    res.set(http::field::content_type, contentType);
    res.set(http::field::cache_control, "no-store");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
    res.keep_alive(keepAlive);
    res.body() = std::move(body);
    res.prepare_payload();

    Logger::instance().endRequest(trace, static_cast<int>(status), res.body());

    return res;
}

http::response<http::string_body> makeJsonResponse(
    http::status status,
    const json& body,
    unsigned version,
    bool keepAlive,
    const Logger::RequestTrace& trace)
{
    return makeResponse(status, body.dump(), "application/json", version, keepAlive, trace);
}

json errorBody(const std::string& message) {
    return json{{"status", "error"}, {"message", message}};
}

/**
 * "/api/executions/abc/history?x=1" -> {"api", "executions", "abc", "history"}
 */
std::vector<std::string> splitPath(const std::string& target) {
    std::string path = target.substr(0, target.find('?'));
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        if (slash > pos) {
            segments.push_back(path.substr(pos, slash - pos));
        }
        pos = slash + 1;
    }
    return segments;
}

} // anonymous namespace

HttpSession::HttpSession(tcp::socket socket, RequestHandler& handler)
    : m_stream(std::move(socket))
    , m_handler(handler)
{
}

void HttpSession::run() {
    net::dispatch(
        m_stream.get_executor(),
        beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
    m_parser.emplace();
    m_parser->body_limit(8 * 1024 * 1024); // 8 MB
    m_stream.expires_after(std::chrono::seconds(30));

    http::async_read(
        m_stream,
        m_buffer,
        *m_parser,
        beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == http::error::end_of_stream) {
        return doClose();
    }

    if (ec) {
        if (ec != beast::error::timeout) {
            LOG_ERROR("Read error: " + ec.message());
        }
        return;
    }

    sendResponse(handleRequest(m_parser->release()));
}

void HttpSession::sendResponse(http::response<http::string_body> response) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(response));
    bool needEof = sp->need_eof();

    http::async_write(
        m_stream,
        *sp,
        [self = shared_from_this(), sp, needEof](beast::error_code ec, std::size_t bytes) {
            self->onWrite(needEof, ec, bytes);
        });
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        LOG_ERROR("Write error: " + ec.message());
        return;
    }

    if (close) {
        return doClose();
    }

    doRead();
}

void HttpSession::doClose() {
    beast::error_code ec;
    m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

http::response<http::string_body> HttpSession::handleRequest(
    http::request<http::string_body>&& req)
{
    std::string target(req.target());
    std::string method(req.method_string());
    unsigned version = req.version();
    bool keepAlive = req.keep_alive();

    auto trace = Logger::instance().beginRequest(method, target, req.body());

    auto reply = [&](http::status status, const json& body) {
        return makeJsonResponse(status, body, version, keepAlive, trace);
    };

    // CORS preflight
    if (req.method() == http::verb::options) {
        return makeResponse(http::status::ok, "", "text/plain", version, keepAlive, trace);
    }

    auto parseBody = [&req]() -> json {
        if (req.body().empty()) return json::object();
        return json::parse(req.body());
    };

    const bool isGet = req.method() == http::verb::get;
    const bool isPost = req.method() == http::verb::post;
    auto segments = splitPath(target);

    try {
        if (segments.size() < 2 || segments[0] != "api") {
            return reply(http::status::not_found, errorBody("Not found: " + target));
        }

        // GET /api/health
        if (isGet && segments.size() == 2 && segments[1] == "health") {
            return reply(http::status::ok, m_handler.handleHealth());
        }

        // ============================================================
        // Workflow API
        // ============================================================

        if (segments[1] == "workflows") {
            // GET /api/workflows
            if (isGet && segments.size() == 2) {
                return reply(http::status::ok, m_handler.handleListWorkflows());
            }

            // POST /api/workflows/validate
            if (isPost && segments.size() == 3 && segments[2] == "validate") {
                return reply(http::status::ok, m_handler.handleValidateWorkflow(parseBody()));
            }

            if (segments.size() == 3) {
                // GET /api/workflows/:name
                if (isGet) {
                    return reply(http::status::ok, m_handler.handleGetWorkflow(segments[2]));
                }
                // POST /api/workflows/:name
                if (isPost) {
                    return reply(http::status::created,
                                 m_handler.handleRegisterWorkflow(segments[2], parseBody()));
                }
            }

            if (segments.size() == 4 && segments[3] == "executions") {
                // POST /api/workflows/:name/executions
                if (isPost) {
                    return reply(http::status::accepted,
                                 m_handler.handleStartExecution(segments[2], parseBody()));
                }
                // GET /api/workflows/:name/executions
                if (isGet) {
                    return reply(http::status::ok, m_handler.handleListExecutions(segments[2]));
                }
            }
        }

        // ============================================================
        // Execution API
        // ============================================================

        if (segments[1] == "executions" && segments.size() >= 3) {
            const std::string& id = segments[2];

            // GET /api/executions/:id
            if (isGet && segments.size() == 3) {
                return reply(http::status::ok, m_handler.handleGetExecution(id));
            }
            if (segments.size() == 4) {
                // GET /api/executions/:id/history
                if (isGet && segments[3] == "history") {
                    return reply(http::status::ok, m_handler.handleGetHistory(id));
                }
                // GET /api/executions/:id/report
                if (isGet && segments[3] == "report") {
                    return makeResponse(http::status::ok, m_handler.handleGetReport(id),
                                        "text/plain; charset=utf-8", version, keepAlive, trace);
                }
                // POST /api/executions/:id/cancel
                if (isPost && segments[3] == "cancel") {
                    return reply(http::status::ok, m_handler.handleCancelExecution(id));
                }
            }
        }

        return reply(http::status::not_found, errorBody("Not found: " + method + " " + target));

    } catch (const json::parse_error& e) {
        return reply(http::status::bad_request, errorBody("Invalid JSON: " + std::string(e.what())));
    } catch (const workflow::ValidationError& e) {
        json body = errorBody(e.what());
        body["violations"] = e.violations();
        return reply(http::status::bad_request, body);
    } catch (const NotFoundError& e) {
        return reply(http::status::not_found, errorBody(e.what()));
    } catch (const std::invalid_argument& e) {
        return reply(http::status::bad_request, errorBody(e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR("Request " + method + " " + target + " failed: " + e.what());
        return reply(http::status::internal_server_error, errorBody(e.what()));
    }
}

} // namespace server
} // namespace drflow

#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <string>

namespace drflow {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class RequestHandler;

/**
 * HTTP server based on Boost.Beast
 */
class HttpServer {
public:
    HttpServer(net::io_context& ioc, RequestHandler& handler,
               const std::string& address, unsigned short port);

    void run();
    void stop();

    unsigned short port() const;

private:
    void doAccept();

    net::io_context& m_ioc;
    RequestHandler& m_handler;
    tcp::acceptor m_acceptor;
    bool m_running;
};

} // namespace server
} // namespace drflow

#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <string>

namespace opgraph {
namespace server {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class RequestHandler;

/**
 * HTTP server built on Boost.Beast
 */
class HttpServer {
public:
    HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
               RequestHandler& handler);

    void run();
    void stop();

private:
    void doAccept();

    net::io_context& m_ioc;
    tcp::acceptor m_acceptor;
    RequestHandler& m_handler;
    bool m_running;
};

} // namespace server
} // namespace opgraph

#include "server/HttpSession.hpp"
#include "server/RequestHandler.hpp"
#include "server/Logger.hpp"

namespace opgraph {
namespace server {

namespace {

void setCommonHeaders(http::response<http::string_body>& res) {
    res.set(http::field::server, "OpGraphServer/1.0");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
}

// Build a JSON response
http::response<http::string_body> makeJsonResponse(
    unsigned status,
    const json& body,
    unsigned version,
    bool keepAlive,
    uint64_t requestId)
{
    http::response<http::string_body> res{static_cast<http::status>(status), version};
    setCommonHeaders(res);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.keep_alive(keepAlive);
    res.body() = body.dump();
    res.prepare_payload();

    // Log response with request ID correlation
    Logger::instance().logResponse(requestId, static_cast<int>(status), res.body(), res.body().size());

    return res;
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
        LOG_ERROR("Read error: " + ec.message());
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
    auto& logger = Logger::instance();
    std::string target(req.target());
    std::string method(req.method_string());

    // Log request and get request ID for correlation
    uint64_t requestId = logger.logRequest(method, target, req.body());

    // CORS preflight
    if (req.method() == http::verb::options) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        setCommonHeaders(res);
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        logger.logResponse(requestId, 200, "", 0);
        return res;
    }

    auto [status, body] = m_handler.handle(method, target, req.body());
    return makeJsonResponse(status, body, req.version(), req.keep_alive(), requestId);
}

} // namespace server
} // namespace opgraph

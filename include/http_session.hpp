#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <string>
#include <variant>

#include "gateway_services.hpp"
#include "http_gateway_handler.hpp"

namespace edgegate {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// One accepted HTTP connection (plain or TLS). Reads the header first, then
// the body under its own deadline, and hands complete requests to the
// HttpGatewayHandler. Upgrades on the WebSocket path move the stream into a
// WebSocketSession.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(beast::ssl_stream<beast::tcp_stream>&& stream, GatewayServices& services,
                std::shared_ptr<void> conn_guard);

    HttpSession(beast::tcp_stream&& stream, GatewayServices& services,
                std::shared_ptr<void> conn_guard);

    ~HttpSession() = default;

    void run();

    static bool is_body_timeout(bool timer_fired, const beast::error_code& read_ec);

private:
    std::variant<
        beast::ssl_stream<beast::tcp_stream>,
        beast::tcp_stream
    > stream_;
    bool is_tls_;
    beast::flat_buffer buffer_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    GatewayServices& services_;
    HttpGatewayHandler handler_;

    net::steady_timer body_timer_;
    bool body_timed_out_ = false;

    std::string remote_addr_;
    std::shared_ptr<void> conn_guard_;

    beast::tcp_stream& tcp_layer();

    void on_handshake(beast::error_code ec);
    void do_read();
    void on_read_header(beast::error_code ec, std::size_t bytes_transferred);
    void read_body();
    void on_body_timeout();
    void on_read_body(beast::error_code ec, std::size_t bytes_transferred);
    void reject_oversized();

    void handle_request();
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void do_shutdown();

    void upgrade_to_websocket(http::request<http::string_body>&& req);
};

}

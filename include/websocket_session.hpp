#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <memory>
#include <queue>
#include <string>
#include <variant>

#include "frame_sink.hpp"
#include "gateway_services.hpp"
#include "websocket_gateway_handler.hpp"

namespace edgegate {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// Beast transport for one agent WebSocket. Owns the gateway handler and
// feeds it one frame at a time; the next read starts only after the
// handler has finished with the current frame.
class WebSocketSession : public FrameSink, public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(beast::ssl_stream<beast::tcp_stream>&& stream, GatewayServices& services,
                     std::string remote_addr, std::shared_ptr<void> conn_guard);

    WebSocketSession(beast::tcp_stream&& stream, GatewayServices& services,
                     std::string remote_addr, std::shared_ptr<void> conn_guard);

    ~WebSocketSession() override;

    WebSocketSession(const WebSocketSession&) = delete;
    WebSocketSession& operator=(const WebSocketSession&) = delete;

    // Completes the upgrade handshake, then opens the gateway handler.
    void run(http::request<http::string_body> req);

    bool send_text(const std::string& frame) override;
    void close(uint16_t code, const std::string& reason) override;
    bool is_open() const override;

    net::any_io_executor get_executor();

    // Builds the handler's view of the upgrade request.
    static UpgradeRequest make_upgrade_request(const http::request<http::string_body>& req,
                                               const std::string& remote_addr);

private:
    std::variant<
        websocket::stream<beast::ssl_stream<beast::tcp_stream>>,
        websocket::stream<beast::tcp_stream>
    > ws_;

    bool is_tls_;
    GatewayServices& services_;
    std::string remote_addr_;
    std::shared_ptr<void> conn_guard_;
    std::unique_ptr<WebSocketGatewayHandler> handler_;

    beast::flat_buffer read_buffer_;
    std::queue<std::shared_ptr<const std::string>> write_queue_;
    bool is_writing_ = false;
    bool closing_ = false;
    bool close_sent_ = false;
    websocket::close_reason close_reason_;

    template<class Stream>
    void configure(Stream& ws);

    void on_accept(beast::error_code ec, UpgradeRequest upgrade);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);
    void do_close();
};

}

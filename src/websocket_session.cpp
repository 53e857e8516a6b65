#include "websocket_session.hpp"
#include "metrics.hpp"
#include "request_envelope_builder.hpp"
#include "security_logger.hpp"

namespace edgegate {

using Level = SecurityLogger::Level;
using Event = SecurityLogger::EventType;

// Configure session timeouts and message limits
template<class Stream>
void WebSocketSession::configure(Stream& ws) {
    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = std::chrono::seconds(15);
    opt.idle_timeout = std::chrono::seconds(300);
    opt.keep_alive_pings = true;
    ws.set_option(opt);

    // Disable underlying socket-level timeout to let WebSocket layer handle it
    beast::get_lowest_layer(ws).expires_never();

    ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "edgegate");
    }));
    ws.read_message_max(services_.config.max_ws_message_size);
}

WebSocketSession::WebSocketSession(beast::ssl_stream<beast::tcp_stream>&& stream, GatewayServices& services,
                                   std::string remote_addr, std::shared_ptr<void> conn_guard)
    : ws_(websocket::stream<beast::ssl_stream<beast::tcp_stream>>(std::move(stream)))
    , is_tls_(true)
    , services_(services)
    , remote_addr_(std::move(remote_addr))
    , conn_guard_(std::move(conn_guard))
{
    configure(std::get<websocket::stream<beast::ssl_stream<beast::tcp_stream>>>(ws_));
}

// Plaintext WebSocket Constructor (fallback or behind reverse-proxy)
WebSocketSession::WebSocketSession(beast::tcp_stream&& stream, GatewayServices& services,
                                   std::string remote_addr, std::shared_ptr<void> conn_guard)
    : ws_(websocket::stream<beast::tcp_stream>(std::move(stream)))
    , is_tls_(false)
    , services_(services)
    , remote_addr_(std::move(remote_addr))
    , conn_guard_(std::move(conn_guard))
{
    configure(std::get<websocket::stream<beast::tcp_stream>>(ws_));
}

WebSocketSession::~WebSocketSession() {
    // The handler runs its cleanup path on destruction.
    handler_.reset();
}

net::any_io_executor WebSocketSession::get_executor() {
    if (is_tls_) {
        return std::get<websocket::stream<beast::ssl_stream<beast::tcp_stream>>>(ws_).get_executor();
    }
    return std::get<websocket::stream<beast::tcp_stream>>(ws_).get_executor();
}

UpgradeRequest WebSocketSession::make_upgrade_request(const http::request<http::string_body>& req,
                                                      const std::string& remote_addr) {
    UpgradeRequest upgrade;
    upgrade.remote_addr = remote_addr;

    for (const auto& field : req) {
        upgrade.headers[std::string(field.name_string())] = std::string(field.value());
    }

    auto origin = upgrade.headers.find("Origin");
    if (origin != upgrade.headers.end()) upgrade.origin = origin->second;

    std::string target(req.target());
    size_t qmark = target.find('?');
    if (qmark != std::string::npos) {
        auto query = RequestEnvelopeBuilder::parse_query(target.substr(qmark + 1));
        auto token = query.find("session_token");
        if (token != query.end()) upgrade.session_token = token->second;
    }
    if (upgrade.session_token.empty()) {
        auto header = upgrade.headers.find("X-Session-Token");
        if (header != upgrade.headers.end()) upgrade.session_token = header->second;
    }
    return upgrade;
}

void WebSocketSession::run(http::request<http::string_body> req) {
    auto upgrade = make_upgrade_request(req, remote_addr_);
    auto req_ptr = std::make_shared<http::request<http::string_body>>(std::move(req));
    auto handler = [self = shared_from_this(), req_ptr, upgrade](beast::error_code ec) mutable {
        self->on_accept(ec, std::move(upgrade));
    };

    if (is_tls_) {
        std::get<websocket::stream<beast::ssl_stream<beast::tcp_stream>>>(ws_).async_accept(*req_ptr, handler);
    } else {
        std::get<websocket::stream<beast::tcp_stream>>(ws_).async_accept(*req_ptr, handler);
    }
}

void WebSocketSession::on_accept(beast::error_code ec, UpgradeRequest upgrade) {
    if (ec) {
        SecurityLogger::log(Level::WARNING, Event::CONNECTION_REJECTED, remote_addr_,
                            "WebSocket handshake failed: " + ec.message());
        return;
    }

    try {
        handler_ = std::make_unique<WebSocketGatewayHandler>(services_, get_executor(),
                                                             weak_from_this(), std::move(upgrade));
    } catch (const std::exception& e) {
        SecurityLogger::log(Level::ERROR, Event::INTERNAL_ERROR, remote_addr_,
                            std::string("Handler setup failed: ") + e.what());
        close(close_code::INTERNAL_ERROR, "Internal error");
        return;
    }

    if (handler_->open()) {
        do_read();
    }
}

void WebSocketSession::do_read() {
    auto self = shared_from_this();
    auto on_read = [self](beast::error_code ec, std::size_t bytes) {
        self->on_read(ec, bytes);
    };

    if (is_tls_) {
        std::get<websocket::stream<beast::ssl_stream<beast::tcp_stream>>>(ws_).async_read(read_buffer_, on_read);
    } else {
        std::get<websocket::stream<beast::tcp_stream>>(ws_).async_read(read_buffer_, on_read);
    }
}

void WebSocketSession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
        if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
            SecurityLogger::log(Level::INFO, Event::CONNECTION_CLOSED, remote_addr_,
                                "WS read ended: " + ec.message());
        }
        if (handler_) handler_->on_disconnect(ec == websocket::error::closed ? "closed" : ec.message());
        return;
    }

    std::string message = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(bytes_transferred);

    if (!handler_) return;

    // The agent call may finish later on this strand; reading resumes only then.
    auto self = shared_from_this();
    handler_->on_message(message, [self](bool keep_reading) {
        if (keep_reading) self->do_read();
    });
}

// Called on the session strand by the handler and the heartbeat task.
bool WebSocketSession::send_text(const std::string& frame) {
    if (!is_open()) return false;

    write_queue_.push(std::make_shared<const std::string>(frame));
    do_write();
    return true;
}

void WebSocketSession::do_write() {
    if (write_queue_.empty() || is_writing_) {
        return;
    }

    is_writing_ = true;
    auto item = write_queue_.front();
    write_queue_.pop();

    auto self = shared_from_this();
    auto on_write = [self, item](beast::error_code ec, std::size_t bytes) {
        self->on_write(ec, bytes);
    };

    if (is_tls_) {
        auto& ws = std::get<websocket::stream<beast::ssl_stream<beast::tcp_stream>>>(ws_);
        ws.text(true);
        ws.async_write(net::buffer(*item), on_write);
    } else {
        auto& ws = std::get<websocket::stream<beast::tcp_stream>>(ws_);
        ws.text(true);
        ws.async_write(net::buffer(*item), on_write);
    }
}

void WebSocketSession::on_write(beast::error_code ec, std::size_t) {
    is_writing_ = false;

    if (ec) {
        SecurityLogger::log(Level::WARNING, Event::CONNECTION_CLOSED, remote_addr_,
                            "WS write error: " + ec.message());
        while (!write_queue_.empty()) write_queue_.pop();
        closing_ = true;
        return;
    }

    if (!write_queue_.empty()) {
        do_write();
    } else if (closing_) {
        do_close();
    }
}

// Pending frames (an error frame before a policy close) are flushed first.
void WebSocketSession::close(uint16_t code, const std::string& reason) {
    if (closing_) return;
    closing_ = true;
    close_reason_ = websocket::close_reason(code, reason);

    if (!is_writing_ && write_queue_.empty()) {
        do_close();
    }
}

bool WebSocketSession::is_open() const {
    if (closing_) return false;
    if (is_tls_) {
        return std::get<websocket::stream<beast::ssl_stream<beast::tcp_stream>>>(ws_).is_open();
    }
    return std::get<websocket::stream<beast::tcp_stream>>(ws_).is_open();
}

void WebSocketSession::do_close() {
    if (close_sent_) return;
    close_sent_ = true;

    auto self = shared_from_this();
    auto on_close = [self](beast::error_code ec) {
        if (ec && ec != net::error::operation_aborted) {
            SecurityLogger::log(Level::DEBUG, Event::CONNECTION_CLOSED, self->remote_addr_,
                                "WS close error: " + ec.message());
        }
    };

    if (is_tls_) {
        std::get<websocket::stream<beast::ssl_stream<beast::tcp_stream>>>(ws_).async_close(close_reason_, on_close);
    } else {
        std::get<websocket::stream<beast::tcp_stream>>(ws_).async_close(close_reason_, on_close);
    }
}

}

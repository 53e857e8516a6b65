#include "http_session.hpp"
#include "websocket_session.hpp"
#include "gateway_error.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

namespace edgegate {

using Level = SecurityLogger::Level;
using Event = SecurityLogger::EventType;

namespace {

template<class Stream>
std::string peer_address(Stream& stream) {
    beast::error_code ec;
    auto ep = beast::get_lowest_layer(stream).socket().remote_endpoint(ec);
    return ec ? "unknown" : ep.address().to_string();
}

}

// HTTPS Session state (TLS transport)
HttpSession::HttpSession(beast::ssl_stream<beast::tcp_stream>&& stream, GatewayServices& services,
                         std::shared_ptr<void> conn_guard)
    : stream_(std::move(stream))
    , is_tls_(true)
    , services_(services)
    , handler_(services)
    , body_timer_(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).get_executor())
    , conn_guard_(std::move(conn_guard))
{
    remote_addr_ = peer_address(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_));
}

// Plaintext HTTP Session state (usually behind a local proxy or for testing)
HttpSession::HttpSession(beast::tcp_stream&& stream, GatewayServices& services,
                         std::shared_ptr<void> conn_guard)
    : stream_(std::move(stream))
    , is_tls_(false)
    , services_(services)
    , handler_(services)
    , body_timer_(std::get<beast::tcp_stream>(stream_).get_executor())
    , conn_guard_(std::move(conn_guard))
{
    remote_addr_ = peer_address(std::get<beast::tcp_stream>(stream_));
}

beast::tcp_stream& HttpSession::tcp_layer() {
    if (is_tls_) {
        return beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_));
    }
    return std::get<beast::tcp_stream>(stream_);
}

void HttpSession::run() {
    if (is_tls_) {
        auto self = shared_from_this();
        tcp_layer().expires_after(std::chrono::seconds(services_.config.request_timeout_sec));
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    } else {
        do_read();
    }
}

void HttpSession::on_handshake(beast::error_code ec) {
    if (ec) {
        // Silent closure on handshake failure to prevent resource exhaustion from scanners
        return;
    }
    do_read();
}

// Reads only the header; the header deadline also bounds slow-loris clients.
void HttpSession::do_read() {
    parser_.emplace();
    parser_->body_limit(services_.config.max_message_size);
    body_timed_out_ = false;

    tcp_layer().expires_after(std::chrono::seconds(services_.config.request_timeout_sec));

    auto self = shared_from_this();
    auto on_header = [self](beast::error_code ec, std::size_t bytes) {
        self->on_read_header(ec, bytes);
    };

    if (is_tls_) {
        http::async_read_header(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_), buffer_, *parser_, on_header);
    } else {
        http::async_read_header(std::get<beast::tcp_stream>(stream_), buffer_, *parser_, on_header);
    }
}

void HttpSession::on_read_header(beast::error_code ec, std::size_t) {
    // A declared Content-Length above the limit fails here, before any body byte is read
    if (ec == http::error::body_limit) {
        reject_oversized();
        return;
    }
    if (ec) {
        if (ec != http::error::end_of_stream && ec != beast::error::timeout) {
            SecurityLogger::log(Level::DEBUG, Event::INVALID_INPUT, remote_addr_, "Header read failed: " + ec.message());
        }
        return;
    }

    const auto& header = parser_->get();
    if (websocket::is_upgrade(header)) {
        std::string target(header.target());
        if (handler_.is_websocket_path(target.substr(0, target.find('?')))) {
            upgrade_to_websocket(parser_->release());
            return;
        }
    }

    if (parser_->is_done()) {
        handle_request();
        return;
    }

    read_body();
}

// The body gets its own timer instead of the stream deadline: an expiring
// stream deadline closes the socket, and the client must still get a 400.
void HttpSession::read_body() {
    auto content_type = parser_->get()[http::field::content_type];
    auto timeout = services_.envelope_builder.body_read_timeout(
        std::string_view(content_type.data(), content_type.size()));

    tcp_layer().expires_never();

    std::weak_ptr<HttpSession> weak = shared_from_this();
    body_timer_.expires_after(timeout);
    body_timer_.async_wait([weak](beast::error_code ec) {
        if (ec) return;
        if (auto self = weak.lock()) self->on_body_timeout();
    });

    auto self = shared_from_this();
    auto on_body = [self](beast::error_code ec, std::size_t bytes) {
        self->on_read_body(ec, bytes);
    };

    if (is_tls_) {
        http::async_read(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_), buffer_, *parser_, on_body);
    } else {
        http::async_read(std::get<beast::tcp_stream>(stream_), buffer_, *parser_, on_body);
    }
}

// A timer that fires just as the body arrives does not count: only a read
// the timer actually aborted is a timeout.
bool HttpSession::is_body_timeout(bool timer_fired, const beast::error_code& read_ec) {
    return timer_fired && read_ec == net::error::operation_aborted;
}

void HttpSession::on_body_timeout() {
    body_timed_out_ = true;
    beast::error_code ec;
    tcp_layer().socket().cancel(ec);
}

void HttpSession::on_read_body(beast::error_code ec, std::size_t) {
    body_timer_.cancel();

    if (is_body_timeout(body_timed_out_, ec)) {
        SecurityLogger::log(Level::WARNING, Event::INVALID_INPUT, remote_addr_, "Request body read timed out");
        MetricsRegistry::instance().increment_counter("http_body_timeouts_total");
        auto res = handler_.error_response(parser_->get(), ErrorKind::MALFORMED_REQUEST,
                                           "Request body was not received in time");
        res.keep_alive(false);
        send_response(std::move(res));
        return;
    }

    if (ec == http::error::body_limit) {
        reject_oversized();
        return;
    }

    if (ec) {
        return;
    }

    handle_request();
}

void HttpSession::reject_oversized() {
    SecurityLogger::log(Level::WARNING, Event::INVALID_INPUT, remote_addr_, "Request body exceeds size limit");
    auto res = handler_.error_response(parser_->get(), ErrorKind::MALFORMED_REQUEST, "Request body too large");
    res.result(http::status::payload_too_large);
    res.keep_alive(false);
    send_response(std::move(res));
}

// The next read is issued only after the response is written, so a slow
// router holds this connection and nothing else.
void HttpSession::handle_request() {
    auto req = std::make_shared<http::request<http::string_body>>(parser_->release());
    auto self = shared_from_this();
    handler_.handle(*req, remote_addr_, tcp_layer().get_executor(),
                    [self, req](http::response<http::string_body> res) {
                        self->send_response(std::move(res));
                    });
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
    auto self = shared_from_this();

    tcp_layer().expires_after(std::chrono::seconds(services_.config.request_timeout_sec));

    if (is_tls_) {
        http::async_write(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    } else {
        http::async_write(
            std::get<beast::tcp_stream>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    }
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        SecurityLogger::log(Level::DEBUG, Event::CONNECTION_CLOSED, remote_addr_, "HTTP write error: " + ec.message());
        return;
    }

    if (close) {
        do_shutdown();
        return;
    }

    do_read();
}

void HttpSession::do_shutdown() {
    beast::error_code ec;
    tcp_layer().socket().shutdown(tcp::socket::shutdown_send, ec);
}

// Transitions the HTTP session to a long-lived WebSocket session.
// This involves moving ownership of the underlying TCP/SSL stream.
void HttpSession::upgrade_to_websocket(http::request<http::string_body>&& req) {
    tcp_layer().expires_never();

    std::shared_ptr<WebSocketSession> ws_session;
    if (is_tls_) {
        ws_session = std::make_shared<WebSocketSession>(
            std::move(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)),
            services_, remote_addr_, std::move(conn_guard_));
    } else {
        ws_session = std::make_shared<WebSocketSession>(
            std::move(std::get<beast::tcp_stream>(stream_)),
            services_, remote_addr_, std::move(conn_guard_));
    }

    MetricsRegistry::instance().increment_counter("ws_upgrades_total");
    ws_session->run(std::move(req));
}

}

#include "upstream_client.hpp"
#include "gateway_error.hpp"
#include "metrics.hpp"

#include <stdexcept>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace edgegate {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace json = boost::json;
using tcp = net::ip::tcp;

UpstreamClient::UpstreamClient(const std::string& base_url, std::chrono::seconds timeout)
    : endpoint_(parse_url(base_url))
    , timeout_(timeout)
{}

UpstreamClient::Endpoint UpstreamClient::parse_url(const std::string& url) {
    static const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("Upstream URL must start with http://: " + url);
    }

    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    std::string base = slash == std::string::npos ? "" : rest.substr(slash);
    while (!base.empty() && base.back() == '/') base.pop_back();

    if (authority.empty()) {
        throw std::invalid_argument("Upstream URL has no host: " + url);
    }

    Endpoint ep;
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    } else {
        ep.host = authority;
        ep.port = "80";
    }
    if (ep.host.empty() || ep.port.empty()) {
        throw std::invalid_argument("Invalid upstream URL: " + url);
    }
    ep.base_path = base;
    return ep;
}

json::value UpstreamClient::post_json(const std::string& path, const json::value& body) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    http::request<http::string_body> req{http::verb::post, endpoint_.base_path + path, 11};
    req.set(http::field::host, endpoint_.host);
    req.set(http::field::user_agent, "edgegate");
    req.set(http::field::content_type, "application/json");
    req.body() = json::serialize(body);
    req.prepare_payload();

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::error_code ec;

    // tcp_stream deadlines only cover asynchronous operations, so the
    // exchange runs as an async chain on a private io_context.
    resolver.async_resolve(endpoint_.host, endpoint_.port,
        [&](beast::error_code rec, tcp::resolver::results_type results) {
            if (rec) { ec = rec; return; }
            stream.expires_after(timeout_);
            stream.async_connect(results, [&](beast::error_code cec, const tcp::endpoint&) {
                if (cec) { ec = cec; return; }
                http::async_write(stream, req, [&](beast::error_code wec, std::size_t) {
                    if (wec) { ec = wec; return; }
                    http::async_read(stream, buffer, res, [&](beast::error_code rdec, std::size_t) {
                        ec = rdec;
                    });
                });
            });
        });
    ioc.run();

    if (ec) {
        MetricsRegistry::instance().increment_counter("upstream_errors_total", {{"reason", "transport"}});
        throw GatewayError(ErrorKind::ROUTING_ERROR, "Upstream request failed: " + ec.message());
    }

    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);

    if (res.result_int() < 200 || res.result_int() >= 300) {
        MetricsRegistry::instance().increment_counter("upstream_errors_total", {{"reason", "status"}});
        throw GatewayError(ErrorKind::ROUTING_ERROR,
                           "Upstream returned HTTP " + std::to_string(res.result_int()));
    }

    if (res.body().empty()) {
        return json::object();
    }

    json::value parsed = json::parse(res.body(), ec);
    if (ec) {
        throw GatewayError(ErrorKind::ROUTING_ERROR, "Upstream returned invalid JSON");
    }
    return parsed;
}

json::value UpstreamClient::route(const RequestEnvelope& envelope, const AuthContextPtr&) {
    return post_json("/route", envelope.to_payload());
}

json::object UpstreamClient::handle(const json::object& message, const AuthContextPtr& auth,
                                    const std::string& connection_id) {
    json::object body;
    body["message"] = message;
    body["connection_id"] = connection_id;
    body["user_context"] = auth ? json::value(auth->to_json("")) : json::value(nullptr);

    json::value reply = post_json("/agent/message", body);
    if (!reply.is_object()) {
        throw GatewayError(ErrorKind::ROUTING_ERROR, "Agent reply is not a JSON object");
    }
    return reply.as_object();
}

}

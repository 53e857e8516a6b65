#pragma once

#include <exception>
#include <functional>
#include <string>
#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <boost/optional.hpp>

#include "gateway_error.hpp"
#include "gateway_services.hpp"
#include "handlers/health_handler.hpp"

namespace edgegate {

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

/**
 * Request/response side of the gateway.
 *
 * Routes /health, /metrics, CORS preflight and {api_prefix}/{pillar}/{path};
 * the latter runs envelope -> auth -> rate limit -> upload check -> router.
 * The router call runs on the dependency pool; every other step completes
 * inline. Never throws: every failure becomes a JSON error response.
 */
class HttpGatewayHandler {
public:
    using ResponseHandler = std::function<void(HttpResponse)>;

    explicit HttpGatewayHandler(GatewayServices& services);

    // Calls `done` exactly once, on `executor` when the router was involved.
    void handle(const HttpRequest& req, const std::string& remote_addr,
                boost::asio::any_io_executor executor, ResponseHandler done);

    // {"error": message, "kind": kind} with the kind's status and common headers.
    HttpResponse error_response(const HttpRequest& req, ErrorKind kind, const std::string& message) const;

    bool is_websocket_path(const std::string& path) const;
    bool is_anonymous_path(const std::string& path) const;

    // Rate limit key: user id, else session token, else blinded peer address.
    static std::string caller_key(const RequestEnvelope& env, const std::string& remote_addr);

private:
    GatewayServices& services_;
    HealthHandler health_;

    void handle_gateway(const HttpRequest& req, const std::string& remote_addr,
                        boost::asio::any_io_executor executor, ResponseHandler done);

    // Everything before the router. Returns a response when the request stops here.
    boost::optional<HttpResponse> admit(const HttpRequest& req, const std::string& remote_addr,
                                        RequestEnvelope& env, RateLimitResult& limit);

    HttpResponse routed_response(const HttpRequest& req, const std::string& remote_addr,
                                 const RateLimitResult& limit, std::exception_ptr error,
                                 boost::json::value result) const;
    HttpResponse preflight(const HttpRequest& req) const;
    HttpResponse json_response(const HttpRequest& req, http::status status, const boost::json::value& body) const;
    void apply_common_headers(HttpResponse& res, const HttpRequest& req) const;
};

}

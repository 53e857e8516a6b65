#include "http_gateway_handler.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

#include <algorithm>

namespace edgegate {

using Level = SecurityLogger::Level;
using Event = SecurityLogger::EventType;

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

std::string target_path(const HttpRequest& req) {
    std::string target(req.target());
    return target.substr(0, target.find('?'));
}

bool routable_method(http::verb method) {
    switch (method) {
        case http::verb::get:
        case http::verb::post:
        case http::verb::put:
        case http::verb::delete_:
        case http::verb::patch:
            return true;
        default:
            return false;
    }
}

}

HttpGatewayHandler::HttpGatewayHandler(GatewayServices& services)
    : services_(services)
    , health_(services)
{}

bool HttpGatewayHandler::is_websocket_path(const std::string& path) const {
    const std::string& ws = services_.config.websocket_path;
    return path == ws || path == services_.envelope_builder.api_prefix() + ws || path == "/api" + ws;
}

bool HttpGatewayHandler::is_anonymous_path(const std::string& path) const {
    const auto& paths = services_.config.anonymous_paths;
    return std::find(paths.begin(), paths.end(), path) != paths.end();
}

std::string HttpGatewayHandler::caller_key(const RequestEnvelope& env, const std::string& remote_addr) {
    if (env.auth_context && !env.auth_context->user_id.empty()) return "user:" + env.auth_context->user_id;
    if (!env.session_token.empty()) return "session:" + env.session_token;
    return "peer:" + SecurityLogger::blind(remote_addr);
}

void HttpGatewayHandler::apply_common_headers(HttpResponse& res, const HttpRequest& req) const {
    res.set(http::field::server, "edgegate");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("Content-Security-Policy", "default-src 'none'");
    res.set(http::field::cache_control, "no-store");

    auto origin_it = req.find(http::field::origin);
    if (origin_it != req.end()) {
        std::string origin(origin_it->value());
        if (services_.config.allowed_origins.empty()) {
            res.set(http::field::access_control_allow_origin, "*");
        } else if (services_.origin_validator.validate(origin)) {
            res.set(http::field::access_control_allow_origin, origin);
            res.set(http::field::vary, "Origin");
        }
    }
    res.set(http::field::access_control_allow_methods, join(services_.config.allowed_methods));
    res.set(http::field::access_control_allow_headers, join(services_.config.allowed_headers));

    res.keep_alive(req.keep_alive());
}

HttpResponse HttpGatewayHandler::json_response(const HttpRequest& req, http::status status,
                                               const boost::json::value& body) const {
    HttpResponse res{status, req.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = boost::json::serialize(body);
    apply_common_headers(res, req);
    res.prepare_payload();
    return res;
}

HttpResponse HttpGatewayHandler::error_response(const HttpRequest& req, ErrorKind kind,
                                                const std::string& message) const {
    boost::json::object body;
    body["error"] = message;
    body["kind"] = to_string(kind);
    return json_response(req, static_cast<http::status>(http_status_for(kind)), body);
}

HttpResponse HttpGatewayHandler::preflight(const HttpRequest& req) const {
    HttpResponse res{http::status::no_content, req.version()};
    apply_common_headers(res, req);
    res.set(http::field::access_control_max_age, "600");
    res.prepare_payload();
    return res;
}

void HttpGatewayHandler::handle(const HttpRequest& req, const std::string& remote_addr,
                                boost::asio::any_io_executor executor, ResponseHandler done) {
    ResponseHandler respond = [done = std::move(done)](HttpResponse res) {
        MetricsRegistry::instance().increment_counter("http_requests_total",
                                                      {{"status", std::to_string(res.result_int())}});
        done(std::move(res));
    };

    HttpResponse res;
    try {
        const std::string path = target_path(req);

        if (req.method() == http::verb::options) {
            res = preflight(req);
        } else if (path == "/health" && req.method() == http::verb::get) {
            res = health_.handle_health(req.version());
            apply_common_headers(res, req);
        } else if (path == "/metrics" && req.method() == http::verb::get) {
            if (!health_.verify_admin_request(req, remote_addr)) {
                SecurityLogger::log(Level::WARNING, Event::AUTH_FAILURE, remote_addr, "Unauthorized metrics access");
                res = json_response(req, http::status::forbidden, {{"error", "Forbidden"}});
            } else {
                res = health_.handle_metrics(req.version());
                apply_common_headers(res, req);
            }
        } else {
            std::string pillar, sub_path;
            if (services_.envelope_builder.split_gateway_path(path, pillar, sub_path)) {
                handle_gateway(req, remote_addr, std::move(executor), std::move(respond));
                return;
            }
            res = json_response(req, http::status::not_found, {{"error", "Not found"}, {"path", path}});
        }
    } catch (const std::exception& e) {
        SecurityLogger::log(Level::ERROR, Event::INTERNAL_ERROR, remote_addr,
                            std::string("Unhandled error: ") + e.what());
        res = error_response(req, ErrorKind::INTERNAL_ERROR, "Internal server error");
    }

    respond(std::move(res));
}

void HttpGatewayHandler::handle_gateway(const HttpRequest& req, const std::string& remote_addr,
                                        boost::asio::any_io_executor executor, ResponseHandler done) {
    RequestEnvelope env;
    RateLimitResult limit{};
    if (auto early = admit(req, remote_addr, env, limit)) {
        done(std::move(*early));
        return;
    }

    // The pool thread only sees copies: the envelope, the router handle and the request header.
    auto router = services_.deps.request_router;
    auto envelope = std::make_shared<RequestEnvelope>(std::move(env));
    auto head = std::make_shared<HttpRequest>(req.base());

    services_.dependency_pool.submit<boost::json::value>(
        std::move(executor),
        [router, envelope] {
            return router->route(*envelope, envelope->auth_context);
        },
        [this, head, remote_addr, limit, done = std::move(done)](std::exception_ptr error,
                                                                 boost::json::value result) {
            done(routed_response(*head, remote_addr, limit, error, std::move(result)));
        });
}

boost::optional<HttpResponse> HttpGatewayHandler::admit(const HttpRequest& req, const std::string& remote_addr,
                                                        RequestEnvelope& env, RateLimitResult& limit) {
    if (!routable_method(req.method())) {
        HttpResponse res = error_response(req, ErrorKind::MALFORMED_REQUEST, "Method not allowed");
        res.result(http::status::method_not_allowed);
        res.set(http::field::allow, "GET, POST, PUT, DELETE, PATCH");
        return res;
    }

    try {
        env = services_.envelope_builder.build(req, remote_addr);
    } catch (const GatewayError& e) {
        SecurityLogger::log(Level::WARNING, Event::INVALID_INPUT, remote_addr, e.what());
        return error_response(req, e.kind(), e.what());
    }

    try {
        if (is_anonymous_path(env.path)) {
            env.auth_context = AuthResolver::resolve_from_headers(env.headers);
        } else {
            env.auth_context = services_.auth_resolver.resolve_http(env.headers);
        }
    } catch (const GatewayError& e) {
        SecurityLogger::log(Level::WARNING, Event::AUTH_FAILURE, remote_addr, e.what());
        return error_response(req, e.kind(), e.what());
    }

    limit = services_.http_rate_limiter.check(caller_key(env, remote_addr));
    if (!limit.allowed) {
        SecurityLogger::log(Level::WARNING, Event::RATE_LIMIT_HIT, remote_addr, "HTTP rate limit exceeded");
        HttpResponse res = error_response(req, ErrorKind::RATE_LIMIT_EXCEEDED, "Rate limit exceeded");
        res.set(http::field::retry_after, std::to_string(limit.reset_after_sec));
        res.set("X-RateLimit-Limit", std::to_string(limit.limit));
        res.set("X-RateLimit-Remaining", "0");
        res.set("X-RateLimit-Reset", std::to_string(limit.reset_after_sec));
        return res;
    }

    // A multipart upload that carried file parts must include a usable "file" part.
    if (env.multipart && !env.file_fields.empty() && env.files.count("file") == 0) {
        boost::json::array available;
        for (const auto& entry : env.files) available.emplace_back(entry.first);
        SecurityLogger::log(Level::WARNING, Event::INVALID_INPUT, remote_addr, "Upload without main file part");
        return json_response(req, http::status::bad_request, {
            {"success", false},
            {"error", "Main file ('file') is required but not found in upload"},
            {"missing_field", "file"},
            {"available_files", std::move(available)}
        });
    }

    if (!services_.deps.request_router) {
        HttpResponse res = error_response(req, ErrorKind::ROUTING_ERROR, "Request router not available");
        res.result(http::status::service_unavailable);
        return res;
    }
    return boost::none;
}

HttpResponse HttpGatewayHandler::routed_response(const HttpRequest& req, const std::string& remote_addr,
                                                 const RateLimitResult& limit, std::exception_ptr error,
                                                 boost::json::value result) const {
    if (error) {
        try {
            std::rethrow_exception(error);
        } catch (const GatewayError& e) {
            SecurityLogger::log(Level::ERROR, Event::DEPENDENCY_FAILURE, remote_addr, e.what());
            return error_response(req, e.kind(), e.what());
        } catch (const std::exception& e) {
            SecurityLogger::log(Level::ERROR, Event::DEPENDENCY_FAILURE, remote_addr,
                                std::string("Routing failed: ") + e.what());
            return error_response(req, ErrorKind::ROUTING_ERROR, std::string("Internal server error: ") + e.what());
        }
    }

    HttpResponse res = json_response(req, http::status::ok, result);
    res.set("X-RateLimit-Limit", std::to_string(limit.limit));
    res.set("X-RateLimit-Remaining", std::to_string(std::max<long long>(0, limit.limit - limit.current)));
    return res;
}

}

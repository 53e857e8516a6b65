#include "handlers/health_handler.hpp"
#include <boost/json.hpp>
#include <openssl/crypto.h>

namespace edgegate {

namespace json = boost::json;

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    const auto& deps = services_.deps;

    json::object dependencies;
    dependencies["token_validator"] = deps.token_validator != nullptr;
    dependencies["request_router"] = deps.request_router != nullptr;
    dependencies["agent_message_handler"] = deps.agent_message_handler != nullptr;
    dependencies["session_registry"] = deps.session_registry != nullptr;
    dependencies["telemetry"] = deps.telemetry != nullptr;

    json::object response;
    response["status"] = "healthy";
    response["tls"] = services_.config.enable_tls;
    response["websocket_connections"] = static_cast<int64_t>(services_.admission.global_count());
    response["max_global_connections"] = static_cast<int64_t>(services_.admission.max_global());
    response["dependencies"] = std::move(dependencies);

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    MetricsRegistry::instance().set_gauge("ws_active_connections",
                                          static_cast<double>(services_.admission.global_count()));
    std::string body = MetricsRegistry::instance().collect_prometheus();

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();
    return res;
}

bool HealthHandler::is_loopback(const std::string& remote_addr) {
    return remote_addr == "127.0.0.1" || remote_addr == "::1" ||
           remote_addr == "::ffff:127.0.0.1";
}

bool HealthHandler::verify_admin_request(const http::request<http::string_body>& req,
                                         const std::string& remote_addr) {
    // Behind a local reverse proxy every peer is loopback, so this is opt-in.
    if (services_.config.metrics_allow_loopback && is_loopback(remote_addr)) {
        return true;
    }

    // No configured token means remote admin access is disabled.
    const std::string& expected = services_.config.admin_token;
    if (expected.empty()) {
        return false;
    }

    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }

    std::string provided(auth_it->value());
    return provided.size() == expected.size() &&
           CRYPTO_memcmp(provided.data(), expected.data(), expected.size()) == 0;
}

}

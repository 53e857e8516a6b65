#include "server_config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace edgegate {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

int env_int(const char* name, int current) {
    const char* value = env(name);
    if (!value) return current;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid integer for ") + name + ": " + value);
    }
}

size_t env_size(const char* name, size_t current) {
    const char* value = env(name);
    if (!value) return current;
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid size for ") + name + ": " + value);
    }
}

bool env_bool(const char* name, bool current) {
    const char* value = env(name);
    if (!value) return current;
    std::string v(value);
    return v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on";
}

}

std::vector<std::string> split_csv(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(',', start);
        if (end == std::string::npos) end = value.size();

        std::string item = value.substr(start, end - start);
        size_t first = item.find_first_not_of(" \t");
        size_t last = item.find_last_not_of(" \t");
        if (first != std::string::npos) {
            items.push_back(item.substr(first, last - first + 1));
        }
        start = end + 1;
    }
    return items;
}

void apply_env_overrides(ServerConfig& config) {
    // --- Network ---
    if (const char* e = env("EDGEGATE_ADDR")) config.address = e;
    config.port = static_cast<uint16_t>(env_int("EDGEGATE_PORT", config.port));
    config.thread_count = env_int("EDGEGATE_THREADS", config.thread_count);
    config.dependency_threads = env_size("EDGEGATE_DEPENDENCY_THREADS", config.dependency_threads);
    if (const char* e = env("EDGEGATE_REDIS_URL")) config.redis_url = e;
    if (const char* e = env("EDGEGATE_UPSTREAM_URL")) config.upstream_url = e;

    // --- TLS ---
    config.enable_tls = env_bool("EDGEGATE_TLS", config.enable_tls);
    if (const char* e = env("EDGEGATE_CERT_PATH")) config.cert_path = e;
    if (const char* e = env("EDGEGATE_KEY_PATH")) config.key_path = e;

    // --- Routing ---
    if (const char* e = env("EDGEGATE_API_PREFIX")) {
        std::string prefix(e);
        while (prefix.size() > 1 && prefix.back() == '/') prefix.pop_back();
        config.api_prefix = prefix;
    }
    if (const char* e = env("EDGEGATE_ANONYMOUS_PATHS")) config.anonymous_paths = split_csv(e);

    // --- Timeouts ---
    config.request_timeout_sec = env_int("EDGEGATE_REQUEST_TIMEOUT", config.request_timeout_sec);
    config.json_body_timeout_sec = env_int("EDGEGATE_JSON_TIMEOUT", config.json_body_timeout_sec);
    config.upstream_timeout_sec = env_int("EDGEGATE_UPSTREAM_TIMEOUT", config.upstream_timeout_sec);
    config.max_message_size = env_size("EDGEGATE_MAX_BODY", config.max_message_size);

    // --- Connection limits ---
    config.max_connections_per_user = env_size("EDGEGATE_MAX_CONNS_PER_USER", config.max_connections_per_user);
    config.max_global_connections = env_size("EDGEGATE_MAX_GLOBAL_CONNS", config.max_global_connections);
    config.heartbeat_interval_sec = env_int("EDGEGATE_HEARTBEAT_INTERVAL", config.heartbeat_interval_sec);
    config.heartbeat_stale_sec = env_int("EDGEGATE_HEARTBEAT_STALE", config.heartbeat_stale_sec);

    // Granular Rate Limits
    config.ws_max_per_second = env_size("EDGEGATE_WS_MAX_PER_SEC", config.ws_max_per_second);
    config.ws_max_per_minute = env_size("EDGEGATE_WS_MAX_PER_MIN", config.ws_max_per_minute);
    config.http_max_per_second = env_size("EDGEGATE_HTTP_MAX_PER_SEC", config.http_max_per_second);
    config.http_max_per_minute = env_size("EDGEGATE_HTTP_MAX_PER_MIN", config.http_max_per_minute);

    // --- Identity ---
    if (const char* e = env("EDGEGATE_JWT_SECRET")) config.jwt_secret = e;
    if (const char* e = env("EDGEGATE_JWT_ISSUER")) config.jwt_issuer = e;
    if (const char* e = env("EDGEGATE_JWT_AUDIENCE")) config.jwt_audience = e;
    if (const char* e = env("EDGEGATE_ADMIN_TOKEN")) config.admin_token = e;
    config.metrics_allow_loopback = env_bool("EDGEGATE_METRICS_LOOPBACK", config.metrics_allow_loopback);

    // --- Origins ---
    if (const char* e = env("EDGEGATE_ALLOWED_ORIGINS")) config.allowed_origins = split_csv(e);
    config.require_origin = env_bool("EDGEGATE_REQUIRE_ORIGIN", config.require_origin);

    if (config.heartbeat_interval_sec <= 0 || config.json_body_timeout_sec <= 0) {
        throw std::invalid_argument("Heartbeat interval and JSON timeout must be positive");
    }
}

}

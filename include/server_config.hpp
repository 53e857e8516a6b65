#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace edgegate {

 
// Core gateway configuration and admission/rate policy definitions.
struct ServerConfig {
    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    int thread_count = 0;  // 0 defaults to hardware concurrency
    size_t dependency_threads = 16;  // router/agent calls; 0 runs them inline on the caller
    std::string redis_url = "";  // empty disables the Redis session registry
    std::string upstream_url = "";  // business layer base URL, e.g. http://127.0.0.1:9000

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = false;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";

    // --- Routing ---
    std::string api_prefix = "/api/v1";
    std::string websocket_path = "/ws/agent";
    std::vector<std::string> anonymous_paths = {"/api/v1/session/create-user-session"};

    // --- Timeouts ---
    size_t max_message_size = 16 * 1024 * 1024;  // multipart uploads included
    size_t max_ws_message_size = 1024 * 1024;
    int request_timeout_sec = 60;
    int json_body_timeout_sec = 10;
    int upstream_timeout_sec = 30;

    // --- WebSocket Connection Management ---
    size_t max_connections_per_user = 5;
    size_t max_global_connections = 1000;
    int heartbeat_interval_sec = 30;
    int heartbeat_stale_sec = 0;  // close peers silent for this long; 0 disables

    // --- Sliding-window Message Limits ---
    size_t ws_max_per_second = 10;
    size_t ws_max_per_minute = 100;
    size_t http_max_per_second = 20;
    size_t http_max_per_minute = 600;
    int rate_limit_idle_ttl_sec = 300;
    int rate_limit_sweep_interval_sec = 60;

    // --- Identity & Secrets ---
    std::string jwt_secret = "";  // empty disables local token validation
    std::string jwt_issuer = "";
    std::string jwt_audience = "";
    int jwt_leeway_sec = 30;
    std::string admin_token = "";  // Used for privileged metrics access
    bool metrics_allow_loopback = false;  // serve /metrics to loopback peers without a token

    // --- Origin policy (WebSocket) and CORS (HTTP) ---
    std::vector<std::string> allowed_origins = {};
    bool require_origin = false;
    std::vector<std::string> allowed_methods = {"GET", "POST", "PUT", "DELETE", "PATCH", "OPTIONS"};
    std::vector<std::string> allowed_headers = {"Content-Type", "Authorization", "X-Session-Token"};
};

// Applies EDGEGATE_* environment variables on top of the given config.
// Throws std::invalid_argument on unparseable numeric values.
void apply_env_overrides(ServerConfig& config);

// Splits a comma-separated list, trimming whitespace and dropping empty items.
std::vector<std::string> split_csv(const std::string& value);

} 

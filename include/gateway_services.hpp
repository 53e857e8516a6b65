#pragma once

#include "admission_controller.hpp"
#include "auth_resolver.hpp"
#include "dependency_pool.hpp"
#include "gateway_dependencies.hpp"
#include "origin_validator.hpp"
#include "rate_limiter.hpp"
#include "request_envelope_builder.hpp"
#include "server_config.hpp"

namespace edgegate {

// Process-wide gateway state shared by every HTTP and WebSocket handler.
// Built once in main and passed by reference; tests build their own.
struct GatewayServices {
    const ServerConfig config;
    GatewayDependencies deps;
    OriginValidator origin_validator;
    AdmissionController admission;
    RateLimiter ws_rate_limiter;
    RateLimiter http_rate_limiter;
    AuthResolver auth_resolver;
    RequestEnvelopeBuilder envelope_builder;
    DependencyPool dependency_pool;

    GatewayServices(ServerConfig cfg, GatewayDependencies dependencies,
                    RateLimiter::TimeSource clock = nullptr)
        : config(std::move(cfg))
        , deps(std::move(dependencies))
        , origin_validator(config.allowed_origins, config.require_origin)
        , admission(config.max_connections_per_user, config.max_global_connections)
        , ws_rate_limiter(config.ws_max_per_second, config.ws_max_per_minute,
                          std::chrono::seconds(config.rate_limit_idle_ttl_sec), clock)
        , http_rate_limiter(config.http_max_per_second, config.http_max_per_minute,
                            std::chrono::seconds(config.rate_limit_idle_ttl_sec), clock)
        , auth_resolver(deps.token_validator)
        , envelope_builder(config.api_prefix,
                           std::chrono::seconds(config.json_body_timeout_sec),
                           std::chrono::seconds(config.request_timeout_sec))
        , dependency_pool(config.dependency_threads)
    {}

    GatewayServices(const GatewayServices&) = delete;
    GatewayServices& operator=(const GatewayServices&) = delete;
};

}

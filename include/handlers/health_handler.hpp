#pragma once

#include <boost/beast/http.hpp>
#include "gateway_services.hpp"
#include "metrics.hpp"

namespace edgegate {

namespace beast = boost::beast;
namespace http = beast::http;

// Operational endpoints: GET /health and GET /metrics.
class HealthHandler {
public:
    explicit HealthHandler(GatewayServices& services)
        : services_(services) {}

    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_metrics(unsigned version);

    // Loopback peers, or a matching X-Admin-Token when one is configured.
    bool verify_admin_request(const http::request<http::string_body>& req, const std::string& remote_addr);

    static bool is_loopback(const std::string& remote_addr);

private:
    GatewayServices& services_;
};

}

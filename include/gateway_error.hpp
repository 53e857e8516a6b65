#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace edgegate {

enum class ErrorKind {
    ORIGIN_REJECTED,
    ADMISSION_REJECTED,
    AUTHENTICATION_REQUIRED,
    INVALID_TOKEN,
    AUTH_SERVICE_UNAVAILABLE,
    RATE_LIMIT_EXCEEDED,
    MALFORMED_REQUEST,
    ROUTING_ERROR,
    INTERNAL_ERROR
};

// WebSocket application close codes.
namespace close_code {
    constexpr uint16_t ORIGIN_REJECTED = 4003;
    constexpr uint16_t PER_USER_LIMIT = 4004;
    constexpr uint16_t SERVER_AT_CAPACITY = 4005;
    constexpr uint16_t INTERNAL_ERROR = 4006;
    constexpr uint16_t RATE_LIMITED = 4029;
}

// Exception type for every failure the gateway surfaces to a client.
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ORIGIN_REJECTED: return "origin_rejected";
        case ErrorKind::ADMISSION_REJECTED: return "admission_rejected";
        case ErrorKind::AUTHENTICATION_REQUIRED: return "authentication_required";
        case ErrorKind::INVALID_TOKEN: return "invalid_token";
        case ErrorKind::AUTH_SERVICE_UNAVAILABLE: return "auth_service_unavailable";
        case ErrorKind::RATE_LIMIT_EXCEEDED: return "rate_limit_exceeded";
        case ErrorKind::MALFORMED_REQUEST: return "malformed_request";
        case ErrorKind::ROUTING_ERROR: return "routing_error";
        case ErrorKind::INTERNAL_ERROR: return "internal_error";
    }
    return "internal_error";
}

inline unsigned http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ORIGIN_REJECTED: return 403;
        case ErrorKind::ADMISSION_REJECTED: return 503;
        case ErrorKind::AUTHENTICATION_REQUIRED: return 401;
        case ErrorKind::INVALID_TOKEN: return 401;
        case ErrorKind::AUTH_SERVICE_UNAVAILABLE: return 503;
        case ErrorKind::RATE_LIMIT_EXCEEDED: return 429;
        case ErrorKind::MALFORMED_REQUEST: return 400;
        case ErrorKind::ROUTING_ERROR: return 500;
        case ErrorKind::INTERNAL_ERROR: return 500;
    }
    return 500;
}

// Close code for kinds that terminate a WebSocket; 0 for recoverable kinds.
// Admission rejections carry their own 4004/4005 distinction and map to the per-user code here.
inline uint16_t ws_close_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ORIGIN_REJECTED: return close_code::ORIGIN_REJECTED;
        case ErrorKind::ADMISSION_REJECTED: return close_code::PER_USER_LIMIT;
        case ErrorKind::RATE_LIMIT_EXCEEDED: return close_code::RATE_LIMITED;
        case ErrorKind::ROUTING_ERROR:
        case ErrorKind::INTERNAL_ERROR: return close_code::INTERNAL_ERROR;
        default: return 0;
    }
}

}

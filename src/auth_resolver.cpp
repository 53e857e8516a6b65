#include "auth_resolver.hpp"
#include "gateway_error.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include "server_config.hpp"

#include <algorithm>
#include <cctype>

namespace edgegate {

AuthResolver::AuthResolver(std::shared_ptr<TokenValidator> validator)
    : validator_(std::move(validator))
{}

AuthContextPtr AuthResolver::resolve_from_headers(const HeaderMap& headers) {
    auto user = headers.find("X-User-Id");
    if (user == headers.end() || user->second.empty()) {
        return nullptr;
    }

    auto value_of = [&headers](const char* name) {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : std::string();
    };

    auto roles = split_csv(value_of("X-User-Roles"));
    auto permissions = split_csv(value_of("X-User-Permissions"));

    return std::make_shared<const AuthContext>(
        user->second,
        value_of("X-Tenant-Id"),
        std::set<std::string>(roles.begin(), roles.end()),
        std::set<std::string>(permissions.begin(), permissions.end()),
        AuthContext::Origin::FORWARD_AUTH);
}

AuthContextPtr AuthResolver::resolve_from_token(const std::string& token) const {
    if (!validator_) {
        throw GatewayError(ErrorKind::AUTH_SERVICE_UNAVAILABLE, "Token validation service not configured");
    }

    try {
        auto ctx = std::make_shared<const AuthContext>(validator_->validate(token));
        MetricsRegistry::instance().increment_counter("auth_success_total");
        return ctx;
    } catch (const GatewayError& e) {
        MetricsRegistry::instance().increment_counter("auth_failure_total", {{"kind", to_string(e.kind())}});
        if (e.kind() == ErrorKind::AUTH_SERVICE_UNAVAILABLE) {
            throw;
        }
        throw GatewayError(ErrorKind::INVALID_TOKEN, e.what());
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter("auth_failure_total", {{"kind", "invalid_token"}});
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::AUTH_FAILURE,
                            "internal", std::string("Token validator error: ") + e.what());
        throw GatewayError(ErrorKind::INVALID_TOKEN, "Invalid or expired token");
    }
}

AuthContextPtr AuthResolver::resolve_http(const HeaderMap& headers) const {
    if (auto ctx = resolve_from_headers(headers)) {
        return ctx;
    }

    auto auth = headers.find("Authorization");
    if (auth == headers.end() || auth->second.empty()) {
        throw GatewayError(ErrorKind::AUTHENTICATION_REQUIRED, "Authentication required");
    }

    std::string token = extract_bearer(auth->second);
    if (token.empty()) {
        throw GatewayError(ErrorKind::AUTHENTICATION_REQUIRED, "Authorization header must use the Bearer scheme");
    }

    return resolve_from_token(token);
}

std::string AuthResolver::extract_bearer(const std::string& value) {
    static const std::string scheme = "bearer ";
    if (value.size() <= scheme.size()) return "";

    for (size_t i = 0; i < scheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(value[i])) != scheme[i]) return "";
    }

    size_t start = value.find_first_not_of(' ', scheme.size());
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

bool AuthResolver::looks_like_jwt(const std::string& token) {
    if (token.empty() || token.size() > 8192) return false;
    if (std::count(token.begin(), token.end(), '.') != 2) return false;

    size_t first = token.find('.');
    size_t second = token.find('.', first + 1);
    if (first == 0 || second == first + 1 || second == token.size() - 1) return false;

    return std::all_of(token.begin(), token.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '=';
    });
}

}

#pragma once

#include <memory>
#include <string>

#include "auth_context.hpp"
#include "gateway_dependencies.hpp"
#include "request_envelope.hpp"

namespace edgegate {

// Resolves caller identity for both transports.
// Trusted forwarded headers win; otherwise a bearer or session token is
// handed to the injected TokenValidator.
class AuthResolver {
public:
    explicit AuthResolver(std::shared_ptr<TokenValidator> validator);

    // Null when X-User-Id is absent. Roles and permissions are CSV lists.
    static AuthContextPtr resolve_from_headers(const HeaderMap& headers);

    /**
     * Validates a token through the configured TokenValidator.
     * @throws GatewayError AUTH_SERVICE_UNAVAILABLE when no validator is
     *         configured or the validator is unreachable, INVALID_TOKEN otherwise.
     */
    AuthContextPtr resolve_from_token(const std::string& token) const;

    // Headers first, then "Authorization: Bearer". Throws AUTHENTICATION_REQUIRED
    // when neither is present.
    AuthContextPtr resolve_http(const HeaderMap& headers) const;

    // Token part of "Bearer <token>" (scheme compared case-insensitively), else empty.
    static std::string extract_bearer(const std::string& value);

    // Three non-empty base64url segments separated by dots.
    static bool looks_like_jwt(const std::string& token);

    bool has_validator() const { return validator_ != nullptr; }

private:
    std::shared_ptr<TokenValidator> validator_;
};

}

#pragma once

#include <chrono>
#include <functional>
#include <set>
#include <string>
#include <boost/json.hpp>

#include "gateway_dependencies.hpp"

namespace edgegate {

// Local TokenValidator for HS256 compact JWS tokens.
// No network round trip; every failure surfaces as GatewayError INVALID_TOKEN.
class JwtTokenValidator : public TokenValidator {
public:
    using WallClock = std::function<std::chrono::system_clock::time_point()>;

    JwtTokenValidator(std::string secret,
                      std::string issuer = "",
                      std::string audience = "",
                      std::chrono::seconds leeway = std::chrono::seconds(30),
                      WallClock now = nullptr);

    AuthContext validate(const std::string& token) override;

    // Decodes base64url without padding. Returns false on invalid input.
    static bool base64url_decode(const std::string& in, std::string& out);
    static std::string base64url_encode(const std::string& in);

    // HMAC-SHA256 of data, raw bytes.
    static std::string hmac_sha256(const std::string& key, const std::string& data);

private:
    std::string secret_;
    std::string issuer_;
    std::string audience_;
    std::chrono::seconds leeway_;
    WallClock now_;

    boost::json::object decode_segment(const std::string& segment, const char* what) const;
    void check_time_claims(const boost::json::object& claims) const;
    void check_audience(const boost::json::object& claims) const;
    static std::set<std::string> string_set(const boost::json::value* v);
};

}

#include "jwt_validator.hpp"
#include "gateway_error.hpp"
#include "server_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <boost/beast/core/detail/base64.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace edgegate {

namespace json = boost::json;

JwtTokenValidator::JwtTokenValidator(std::string secret, std::string issuer, std::string audience,
                                     std::chrono::seconds leeway, WallClock now)
    : secret_(std::move(secret))
    , issuer_(std::move(issuer))
    , audience_(std::move(audience))
    , leeway_(leeway)
    , now_(now ? std::move(now) : WallClock([] { return std::chrono::system_clock::now(); }))
{}

bool JwtTokenValidator::base64url_decode(const std::string& in, std::string& out) {
    std::string std_b64;
    std_b64.reserve(in.size() + 3);
    for (char c : in) {
        if (c == '-') std_b64 += '+';
        else if (c == '_') std_b64 += '/';
        else if (c == '=') break;
        else if (std::isalnum(static_cast<unsigned char>(c))) std_b64 += c;
        else return false;
    }
    if (std_b64.size() % 4 == 1) return false;

    // Beast decodes a trailing partial quantum without padding
    out.resize((std_b64.size() + 3) / 4 * 3);
    auto result = boost::beast::detail::base64::decode(&out[0], std_b64.data(), std_b64.size());
    if (result.second != std_b64.size()) return false;
    out.resize(result.first);
    return true;
}

std::string JwtTokenValidator::base64url_encode(const std::string& in) {
    std::string out;
    out.resize(boost::beast::detail::base64::encoded_size(in.size()));
    out.resize(boost::beast::detail::base64::encode(&out[0], in.data(), in.size()));
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    out.erase(std::remove(out.begin(), out.end(), '='), out.end());
    return out;
}

std::string JwtTokenValidator::hmac_sha256(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &len)) {
        throw GatewayError(ErrorKind::INTERNAL_ERROR, "HMAC computation failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), len);
}

json::object JwtTokenValidator::decode_segment(const std::string& segment, const char* what) const {
    std::string raw;
    if (!base64url_decode(segment, raw)) {
        throw GatewayError(ErrorKind::INVALID_TOKEN, std::string("Malformed token ") + what);
    }

    boost::system::error_code ec;
    json::value v = json::parse(raw, ec);
    if (ec || !v.is_object()) {
        throw GatewayError(ErrorKind::INVALID_TOKEN, std::string("Malformed token ") + what);
    }
    return v.as_object();
}

AuthContext JwtTokenValidator::validate(const std::string& token) {
    size_t first = token.find('.');
    size_t second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
    if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
        throw GatewayError(ErrorKind::INVALID_TOKEN, "Token is not a compact JWS");
    }

    const std::string header_b64 = token.substr(0, first);
    const std::string payload_b64 = token.substr(first + 1, second - first - 1);
    const std::string signature_b64 = token.substr(second + 1);

    json::object header = decode_segment(header_b64, "header");
    auto alg = header.if_contains("alg");
    if (!alg || !alg->is_string() || alg->as_string() != "HS256") {
        throw GatewayError(ErrorKind::INVALID_TOKEN, "Unsupported token algorithm");
    }

    std::string signature;
    if (!base64url_decode(signature_b64, signature)) {
        throw GatewayError(ErrorKind::INVALID_TOKEN, "Malformed token signature");
    }

    std::string expected = hmac_sha256(secret_, header_b64 + "." + payload_b64);
    if (signature.size() != expected.size() ||
        CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
        throw GatewayError(ErrorKind::INVALID_TOKEN, "Token signature mismatch");
    }

    json::object claims = decode_segment(payload_b64, "payload");
    check_time_claims(claims);

    if (!issuer_.empty()) {
        auto iss = claims.if_contains("iss");
        if (!iss || !iss->is_string() || iss->as_string() != issuer_) {
            throw GatewayError(ErrorKind::INVALID_TOKEN, "Token issuer mismatch");
        }
    }
    check_audience(claims);

    auto sub = claims.if_contains("sub");
    if (!sub || !sub->is_string() || sub->as_string().empty()) {
        throw GatewayError(ErrorKind::INVALID_TOKEN, "Token has no subject");
    }

    std::string tenant;
    if (auto t = claims.if_contains("tenant_id"); t && t->is_string()) {
        tenant = json::value_to<std::string>(*t);
    } else if (auto meta = claims.if_contains("app_metadata"); meta && meta->is_object()) {
        if (auto mt = meta->as_object().if_contains("tenant_id"); mt && mt->is_string()) {
            tenant = json::value_to<std::string>(*mt);
        }
    }

    auto roles = string_set(claims.if_contains("roles"));
    if (auto role = claims.if_contains("role"); role && role->is_string()) {
        roles.insert(json::value_to<std::string>(*role));
    }

    return AuthContext(json::value_to<std::string>(*sub), tenant, std::move(roles),
                       string_set(claims.if_contains("permissions")),
                       AuthContext::Origin::LOCAL_VALIDATION);
}

void JwtTokenValidator::check_time_claims(const json::object& claims) const {
    const long long now = std::chrono::duration_cast<std::chrono::seconds>(
        now_().time_since_epoch()).count();
    const long long leeway = leeway_.count();

    auto numeric = [](const json::value* v, long long& out) {
        if (!v) return false;
        if (v->is_int64()) { out = v->as_int64(); return true; }
        if (v->is_uint64()) {
            out = static_cast<long long>(std::min<uint64_t>(v->as_uint64(), std::numeric_limits<long long>::max()));
            return true;
        }
        if (v->is_double()) {
            // Fractional seconds are allowed; beyond 2^53 a double is not a usable timestamp.
            double d = v->as_double();
            if (!std::isfinite(d) || std::fabs(d) > 9007199254740992.0) {
                throw GatewayError(ErrorKind::INVALID_TOKEN, "Token time claim out of range");
            }
            out = static_cast<long long>(d);
            return true;
        }
        throw GatewayError(ErrorKind::INVALID_TOKEN, "Token time claim is not numeric");
    };

    long long exp = 0;
    if (numeric(claims.if_contains("exp"), exp) && now - leeway > exp) {
        throw GatewayError(ErrorKind::INVALID_TOKEN, "Token expired");
    }
    long long nbf = 0;
    if (numeric(claims.if_contains("nbf"), nbf) && now + leeway < nbf) {
        throw GatewayError(ErrorKind::INVALID_TOKEN, "Token not yet valid");
    }
}

// "aud" may be a single string or an array of strings.
void JwtTokenValidator::check_audience(const json::object& claims) const {
    if (audience_.empty()) return;

    auto aud = claims.if_contains("aud");
    if (aud && aud->is_string() && aud->as_string() == audience_) return;
    if (aud && aud->is_array()) {
        for (const auto& item : aud->as_array()) {
            if (item.is_string() && item.as_string() == audience_) return;
        }
    }
    throw GatewayError(ErrorKind::INVALID_TOKEN, "Token audience mismatch");
}

std::set<std::string> JwtTokenValidator::string_set(const json::value* v) {
    std::set<std::string> out;
    if (!v) return out;
    if (v->is_string()) {
        for (auto& item : split_csv(json::value_to<std::string>(*v))) out.insert(item);
    } else if (v->is_array()) {
        for (const auto& item : v->as_array()) {
            if (item.is_string() && !item.as_string().empty()) {
                out.insert(json::value_to<std::string>(item));
            }
        }
    }
    return out;
}

}

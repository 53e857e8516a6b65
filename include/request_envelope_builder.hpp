#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <boost/beast/http.hpp>

#include "request_envelope.hpp"

namespace edgegate {

namespace http = boost::beast::http;

// Normalizes a raw HTTP request into a RequestEnvelope.
// Throws GatewayError MALFORMED_REQUEST on an unparseable body; an absent
// body is never an error.
class RequestEnvelopeBuilder {
public:
    static constexpr int kMaxJsonDepth = 64;

    RequestEnvelopeBuilder(std::string api_prefix,
                           std::chrono::seconds json_body_timeout,
                           std::chrono::seconds request_timeout);

    RequestEnvelope build(const http::request<http::string_body>& req,
                          const std::string& remote_addr = "internal") const;

    // Upper bound for reading the body of a request with this content type.
    std::chrono::seconds body_read_timeout(std::string_view content_type) const;

    /**
     * Splits "{api_prefix}/{pillar}/{path}" into its pillar and sub path.
     * @return false when the path is outside the prefix or has no pillar/sub path.
     */
    bool split_gateway_path(std::string_view path, std::string& pillar, std::string& sub_path) const;

    const std::string& api_prefix() const { return api_prefix_; }

    static bool is_json_content_type(std::string_view content_type);
    static bool is_multipart_content_type(std::string_view content_type);

    // Decodes %XX escapes, and '+' as space when plus_as_space is set.
    // Invalid escapes are kept verbatim.
    static std::string percent_decode(std::string_view in, bool plus_as_space = true);
    static QueryMap parse_query(std::string_view query);

private:
    std::string api_prefix_;
    std::chrono::seconds json_body_timeout_;
    std::chrono::seconds request_timeout_;

    void parse_json_body(RequestEnvelope& env, const std::string& body) const;
    void parse_multipart_body(RequestEnvelope& env, std::string_view content_type,
                              const std::string& body, const std::string& remote_addr) const;
};

}

#pragma once

#include <string>
#include <vector>

namespace edgegate {

// Decides whether a WebSocket upgrade from a given Origin is acceptable.
// Entries are exact origins, "*" or a wildcard subdomain ("https://*.example.com"
// or "*.example.com").
class OriginValidator {
public:
    OriginValidator(std::vector<std::string> allowed_origins, bool require_origin);

    // origin is the raw header value; empty means the header was absent.
    bool validate(const std::string& origin) const;

private:
    std::vector<std::string> allowed_;
    bool require_origin_;

    static std::string normalize(const std::string& origin);
    static bool matches(const std::string& pattern, const std::string& origin);
};

}

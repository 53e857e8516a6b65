#include "origin_validator.hpp"

#include <algorithm>
#include <cctype>

namespace edgegate {

OriginValidator::OriginValidator(std::vector<std::string> allowed_origins, bool require_origin)
    : require_origin_(require_origin)
{
    for (const auto& entry : allowed_origins) {
        std::string n = normalize(entry);
        if (!n.empty()) allowed_.push_back(n);
    }
}

bool OriginValidator::validate(const std::string& origin) const {
    std::string candidate = normalize(origin);
    if (candidate.empty()) {
        return !require_origin_;
    }

    // No allow-list configured: only the same-origin requirement applies.
    if (allowed_.empty()) {
        return true;
    }

    return std::any_of(allowed_.begin(), allowed_.end(),
        [&candidate](const std::string& pattern) { return matches(pattern, candidate); });
}

std::string OriginValidator::normalize(const std::string& origin) {
    size_t first = origin.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    size_t last = origin.find_last_not_of(" \t");
    std::string out = origin.substr(first, last - first + 1);

    while (!out.empty() && out.back() == '/') out.pop_back();
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool OriginValidator::matches(const std::string& pattern, const std::string& origin) {
    if (pattern == "*" || pattern == origin) {
        return true;
    }

    auto star = pattern.find("*.");
    if (star == std::string::npos) {
        return false;
    }

    // "https://*.example.com" binds the scheme, "*.example.com" accepts any.
    std::string scheme = pattern.substr(0, star);
    std::string suffix = pattern.substr(star + 1);  // ".example.com"

    std::string host = origin;
    if (!scheme.empty()) {
        if (origin.compare(0, scheme.size(), scheme) != 0) return false;
        host = origin.substr(scheme.size());
    } else {
        auto sep = origin.find("://");
        if (sep != std::string::npos) host = origin.substr(sep + 3);
    }

    if (host.size() <= suffix.size()) return false;
    if (host.compare(host.size() - suffix.size(), suffix.size(), suffix) != 0) return false;

    std::string label = host.substr(0, host.size() - suffix.size());
    return !label.empty() && label.find('/') == std::string::npos;
}

}

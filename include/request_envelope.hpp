#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <string>
#include <boost/json.hpp>

#include "auth_context.hpp"

namespace edgegate {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
            [](char x, char y) {
                return std::tolower(static_cast<unsigned char>(x)) < std::tolower(static_cast<unsigned char>(y));
            });
    }
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;
using QueryMap = std::map<std::string, std::string>;

struct FileBlob {
    std::string filename;
    std::string bytes;
    std::string content_type;
};

// Canonical unit handed to the RequestRouter. Created per HTTP request.
struct RequestEnvelope {
    std::string method;
    std::string path;
    std::string pillar;
    std::string sub_path;
    HeaderMap headers;
    QueryMap query_params;
    boost::json::object body;
    std::map<std::string, FileBlob> files;
    std::set<std::string> file_fields;  // every file part seen, empty ones included
    std::string session_token;
    AuthContextPtr auth_context;

    bool multipart = false;

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : std::string();
    }

    // Builds {endpoint, method, params, headers, user_id, session_token,
    // query_params, user_context, files?}. File contents are base64-encoded.
    boost::json::object to_payload() const;
};

}

#include "request_envelope.hpp"

#include <boost/beast/core/detail/base64.hpp>

namespace edgegate {

namespace json = boost::json;

namespace {

std::string to_base64(const std::string& bytes) {
    std::string out;
    out.resize(boost::beast::detail::base64::encoded_size(bytes.size()));
    out.resize(boost::beast::detail::base64::encode(&out[0], bytes.data(), bytes.size()));
    return out;
}

}

json::object RequestEnvelope::to_payload() const {
    json::object payload;
    payload["endpoint"] = path;
    payload["method"] = method;

    json::object params = body;

    json::object header_obj;
    for (const auto& [name, value] : headers) header_obj[name] = value;
    payload["headers"] = std::move(header_obj);

    payload["user_id"] = auth_context ? auth_context->user_id : std::string("anonymous");
    payload["session_token"] = session_token.empty() ? json::value(nullptr) : json::value(session_token);

    json::object query_obj;
    for (const auto& [name, value] : query_params) query_obj[name] = value;
    payload["query_params"] = std::move(query_obj);

    payload["user_context"] = auth_context ? json::value(auth_context->to_json(session_token))
                                           : json::value(nullptr);

    if (!files.empty()) {
        json::object file_obj;
        for (const auto& [field, blob] : files) {
            std::string encoded = to_base64(blob.bytes);
            file_obj[field] = {
                {"filename", blob.filename},
                {"content", encoded},
                {"content_type", blob.content_type}
            };

            if (field == "file") {
                params["file_data"] = encoded;
                params["filename"] = blob.filename;
                params["content_type"] = blob.content_type;
            } else if (field == "copybook") {
                params["copybook_data"] = encoded;
                params["copybook_filename"] = blob.filename;
            }
        }
        payload["files"] = std::move(file_obj);
    }

    payload["params"] = std::move(params);
    return payload;
}

}

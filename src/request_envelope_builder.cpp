#include "request_envelope_builder.hpp"
#include "gateway_error.hpp"
#include "multipart_parser.hpp"
#include "security_logger.hpp"

#include <algorithm>
#include <cctype>

namespace edgegate {

namespace json = boost::json;

namespace {

std::string lower_media_type(std::string_view content_type) {
    std::string_view essence = content_type.substr(0, content_type.find(';'));
    while (!essence.empty() && essence.back() == ' ') essence.remove_suffix(1);
    while (!essence.empty() && essence.front() == ' ') essence.remove_prefix(1);
    std::string out(essence);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

RequestEnvelopeBuilder::RequestEnvelopeBuilder(std::string api_prefix,
                                               std::chrono::seconds json_body_timeout,
                                               std::chrono::seconds request_timeout)
    : api_prefix_(std::move(api_prefix))
    , json_body_timeout_(json_body_timeout)
    , request_timeout_(request_timeout)
{
    while (!api_prefix_.empty() && api_prefix_.back() == '/') api_prefix_.pop_back();
}

bool RequestEnvelopeBuilder::is_json_content_type(std::string_view content_type) {
    std::string media = lower_media_type(content_type);
    if (media == "application/json") return true;
    return media.size() > 5 && media.compare(media.size() - 5, 5, "+json") == 0;
}

bool RequestEnvelopeBuilder::is_multipart_content_type(std::string_view content_type) {
    return lower_media_type(content_type) == "multipart/form-data";
}

std::chrono::seconds RequestEnvelopeBuilder::body_read_timeout(std::string_view content_type) const {
    return is_json_content_type(content_type) ? json_body_timeout_ : request_timeout_;
}

std::string RequestEnvelopeBuilder::percent_decode(std::string_view in, bool plus_as_space) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '+' && plus_as_space) {
            out += ' ';
        } else if (c == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) {
                out += c;
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

QueryMap RequestEnvelopeBuilder::parse_query(std::string_view query) {
    QueryMap params;
    while (!query.empty()) {
        size_t amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = percent_decode(pair.substr(0, eq));
            std::string value = eq == std::string_view::npos ? "" : percent_decode(pair.substr(eq + 1));
            if (!key.empty()) params[key] = std::move(value);
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return params;
}

bool RequestEnvelopeBuilder::split_gateway_path(std::string_view path, std::string& pillar,
                                                std::string& sub_path) const {
    if (path.size() <= api_prefix_.size() + 1 ||
        path.compare(0, api_prefix_.size(), api_prefix_) != 0 ||
        path[api_prefix_.size()] != '/') {
        return false;
    }

    std::string_view rest = path.substr(api_prefix_.size() + 1);
    size_t slash = rest.find('/');
    if (slash == 0 || slash == std::string_view::npos || slash + 1 >= rest.size()) {
        return false;
    }

    pillar = std::string(rest.substr(0, slash));
    sub_path = std::string(rest.substr(slash + 1));
    return true;
}

RequestEnvelope RequestEnvelopeBuilder::build(const http::request<http::string_body>& req,
                                              const std::string& remote_addr) const {
    RequestEnvelope env;
    env.method = std::string(req.method_string());

    std::string_view target(req.target().data(), req.target().size());
    size_t qmark = target.find('?');
    env.path = percent_decode(target.substr(0, qmark), false);
    if (qmark != std::string_view::npos) {
        env.query_params = parse_query(target.substr(qmark + 1));
    }
    split_gateway_path(env.path, env.pillar, env.sub_path);

    for (const auto& field : req) {
        env.headers[std::string(field.name_string())] = std::string(field.value());
    }
    env.session_token = env.header("X-Session-Token");

    const std::string content_type = env.header("Content-Type");
    const std::string& body = req.body();
    bool blank = std::all_of(body.begin(), body.end(),
                             [](unsigned char c) { return std::isspace(c); });

    if (is_multipart_content_type(content_type)) {
        env.multipart = true;
        if (!blank) {
            parse_multipart_body(env, content_type, body, remote_addr);
        }
    } else if (is_json_content_type(content_type) && !blank) {
        parse_json_body(env, body);
    }

    return env;
}

void RequestEnvelopeBuilder::parse_json_body(RequestEnvelope& env, const std::string& body) const {
    json::parse_options opts;
    opts.max_depth = kMaxJsonDepth;

    boost::system::error_code ec;
    json::value v = json::parse(body, ec, json::storage_ptr(), opts);
    if (ec) {
        throw GatewayError(ErrorKind::MALFORMED_REQUEST, "Invalid JSON body: " + ec.message());
    }
    if (!v.is_object()) {
        throw GatewayError(ErrorKind::MALFORMED_REQUEST, "JSON body must be an object");
    }
    env.body = std::move(v.as_object());
}

// File parts become FileBlobs, other parts string body fields. Zero-byte
// files are only recorded in file_fields.
void RequestEnvelopeBuilder::parse_multipart_body(RequestEnvelope& env, std::string_view content_type,
                                                  const std::string& body,
                                                  const std::string& remote_addr) const {
    std::string boundary = MultipartParser::boundary_from_content_type(content_type);
    if (boundary.empty()) {
        throw GatewayError(ErrorKind::MALFORMED_REQUEST, "Multipart body without boundary");
    }

    for (auto& part : MultipartParser::parse(body, boundary)) {
        if (!part.is_file()) {
            env.body[part.name] = part.body;
            continue;
        }

        env.file_fields.insert(part.name);
        if (part.body.empty()) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                                remote_addr, "Empty file part '" + part.name + "' ignored");
            continue;
        }

        std::string filename = part.filename->empty() ? "unknown_" + part.name : *part.filename;
        env.files[part.name] = FileBlob{std::move(filename), std::move(part.body), std::move(part.content_type)};
    }
}

}

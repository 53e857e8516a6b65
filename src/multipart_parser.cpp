#include "multipart_parser.hpp"
#include "gateway_error.hpp"

#include <algorithm>
#include <cctype>

namespace edgegate {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool consume(std::string_view& input, std::string_view prefix) {
    if (input.substr(0, prefix.size()) != prefix) return false;
    input.remove_prefix(prefix.size());
    return true;
}

[[noreturn]] void fail(const std::string& what) {
    throw GatewayError(ErrorKind::MALFORMED_REQUEST, "Malformed multipart body: " + what);
}

}

std::string MultipartParser::boundary_from_content_type(std::string_view content_type) {
    size_t pos = 0;
    while (pos < content_type.size()) {
        size_t semi = content_type.find(';', pos);
        std::string_view param = trim(content_type.substr(pos, semi == std::string_view::npos ? std::string_view::npos : semi - pos));
        size_t eq = param.find('=');
        if (eq != std::string_view::npos && iequals(trim(param.substr(0, eq)), "boundary")) {
            std::string_view value = trim(param.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            return std::string(value);
        }
        if (semi == std::string_view::npos) break;
        pos = semi + 1;
    }
    return "";
}

// Reads up to the closing quote and restores %0A, %0D and %22 escapes.
std::string MultipartParser::parse_quoted(std::string_view& input) {
    size_t end = input.find_first_of("\"\r\n");
    if (end == std::string_view::npos || input[end] != '"') {
        fail("unterminated quoted parameter");
    }

    std::string_view raw = input.substr(0, end);
    input.remove_prefix(end + 1);

    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '%' && i + 2 < raw.size()) {
            std::string_view seq = raw.substr(i, 3);
            if (seq == "%0A") { out += '\n'; i += 2; continue; }
            if (seq == "%0D") { out += '\r'; i += 2; continue; }
            if (seq == "%22") { out += '"'; i += 2; continue; }
        }
        out += raw[i];
    }
    return out;
}

MultipartPart MultipartParser::parse_headers(std::string_view& input) {
    MultipartPart part;
    bool has_name = false;

    while (true) {
        if (consume(input, "\r\n")) {
            if (!has_name) fail("part without a name");
            return part;
        }

        size_t line_end = input.find("\r\n");
        if (line_end == std::string_view::npos) fail("unterminated part headers");
        std::string_view line = input.substr(0, line_end);
        input.remove_prefix(line_end + 2);

        size_t colon = line.find(':');
        if (colon == std::string_view::npos) fail("header line without ':'");
        std::string_view header_name = trim(line.substr(0, colon));
        std::string_view header_value = trim(line.substr(colon + 1));
        if (header_name.empty()) fail("empty header name");

        if (iequals(header_name, "content-disposition")) {
            size_t semi = header_value.find(';');
            if (!iequals(trim(header_value.substr(0, semi)), "form-data")) fail("disposition is not form-data");
            if (semi == std::string_view::npos) fail("part without a name");
            std::string_view params = header_value.substr(semi + 1);

            while (!params.empty()) {
                params = trim(params);
                size_t eq = params.find('=');
                if (eq == std::string_view::npos) break;
                std::string_view key = trim(params.substr(0, eq));
                params.remove_prefix(eq + 1);

                std::string value;
                if (consume(params, "\"")) {
                    value = parse_quoted(params);
                } else {
                    size_t next = params.find(';');
                    value = std::string(trim(params.substr(0, next)));
                    params.remove_prefix(next == std::string_view::npos ? params.size() : next);
                }

                if (iequals(key, "name")) {
                    part.name = value;
                    has_name = true;
                } else if (iequals(key, "filename")) {
                    part.filename = value;
                }

                params = trim(params);
                if (!consume(params, ";")) break;
            }
        } else if (iequals(header_name, "content-type")) {
            part.content_type = std::string(header_value);
        }
    }
}

std::vector<MultipartPart> MultipartParser::parse(std::string_view body, const std::string& boundary) {
    if (boundary.empty()) {
        fail("missing boundary");
    }

    const std::string delimiter = "--" + boundary;
    std::vector<MultipartPart> parts;

    // Skip any preamble before the first delimiter.
    size_t start = body.find(delimiter);
    if (start == std::string_view::npos) fail("boundary not found");
    std::string_view input = body.substr(start);

    while (true) {
        if (!consume(input, delimiter)) fail("expected boundary");

        if (consume(input, "--")) {
            return parts;
        }
        if (!consume(input, "\r\n")) fail("expected CRLF after boundary");

        MultipartPart part = parse_headers(input);

        // The body runs until CRLF followed by the next delimiter.
        const std::string next = "\r\n" + delimiter;
        size_t end = input.find(next);
        if (end == std::string_view::npos) fail("unterminated part body");
        part.body = std::string(input.substr(0, end));
        input.remove_prefix(end + 2);

        if (part.is_file() && part.content_type.empty()) {
            part.content_type = "application/octet-stream";
        }
        parts.push_back(std::move(part));
    }
}

}

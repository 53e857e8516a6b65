#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace edgegate {

struct MultipartPart {
    std::string name;
    std::optional<std::string> filename;  // set only for file parts
    std::string content_type;
    std::string body;

    bool is_file() const { return filename.has_value(); }
};

// multipart/form-data (RFC 7578) body parser.
// Malformed framing throws GatewayError MALFORMED_REQUEST.
class MultipartParser {
public:
    // Value of the boundary parameter (quotes removed), empty when absent.
    static std::string boundary_from_content_type(std::string_view content_type);

    static std::vector<MultipartPart> parse(std::string_view body, const std::string& boundary);

private:
    static MultipartPart parse_headers(std::string_view& input);
    static std::string parse_quoted(std::string_view& input);
};

}

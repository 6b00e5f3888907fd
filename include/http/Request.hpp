#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>
#include "const/rest_enums.hpp"

namespace mpupload {
namespace http {

/**
 * Outbound HTTP request
 */
struct Request {
    HttpMethod method = HttpMethod::GET;
    std::string url;                                         // Absolute URL
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;                                        // Raw body, binary safe

    void setHeader(const std::string& name, const std::string& value) {
        headers.emplace_back(name, value);
    }
};

/**
 * HTTP response as received from the wire
 */
struct Response {
    long status = 0;
    std::vector<std::pair<std::string, std::string>> headers;  // In arrival order
    std::string body;

    // Case-insensitive header lookup, first match wins
    std::optional<std::string> header(const std::string& name) const;

    bool ok() const { return status == 200; }
};

// ASCII case-insensitive comparison for header names
bool equalsIgnoreCase(const std::string& a, const std::string& b);

} // namespace http
} // namespace mpupload

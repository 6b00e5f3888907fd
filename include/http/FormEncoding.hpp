#pragma once

#include <string>
#include <utility>
#include <vector>

namespace mpupload {
namespace http {

// Percent-encodes every byte outside the RFC 3986 unreserved set
std::string percentEncode(const std::string& value);

// Builds an application/x-www-form-urlencoded body, fields kept in order
std::string formEncode(const std::vector<std::pair<std::string, std::string>>& fields);

} // namespace http
} // namespace mpupload

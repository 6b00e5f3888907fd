#include "http/Request.hpp"
#include <cctype>

namespace mpupload {
namespace http {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> Response::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (equalsIgnoreCase(h.first, name)) {
            return h.second;
        }
    }
    return std::nullopt;
}

} // namespace http
} // namespace mpupload

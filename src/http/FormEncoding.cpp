#include "http/FormEncoding.hpp"
#include <curl/curl.h>
#include <stdexcept>

namespace mpupload {
namespace http {

std::string percentEncode(const std::string& value) {
    if (value.empty()) {
        return value;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    char* escaped = curl_easy_escape(curl, value.data(), static_cast<int>(value.size()));
    curl_easy_cleanup(curl);
    if (!escaped) {
        throw std::runtime_error("Failed to percent-encode form value");
    }

    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::string formEncode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string body;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) body += '&';
        body += percentEncode(fields[i].first);
        body += '=';
        body += percentEncode(fields[i].second);
    }
    return body;
}

} // namespace http
} // namespace mpupload

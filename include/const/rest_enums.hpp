#pragma once

#include <string>
#include <stdexcept>

namespace mpupload {

enum class HttpMethod {
    GET,
    POST,
    PUT,
};


inline const char* to_string(HttpMethod method) {
    switch(method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        default: return "UNKNOWN";
    }
}


inline HttpMethod from_string(const std::string& method) {
    if (method == "GET") return HttpMethod::GET;
    else if (method == "POST") return HttpMethod::POST;
    else if (method == "PUT") return HttpMethod::PUT;
    else throw std::invalid_argument("Invalid HTTP method string: " + method);
}

} // namespace mpupload

#pragma once

#include "http/Request.hpp"

namespace mpupload {
namespace http {

/**
 * Performs one blocking HTTP exchange at a time.
 *
 * Implementations return any status the server sends (including 3xx, 4xx and
 * 5xx) as a Response and throw TransportError only when no response could be
 * obtained: connection refused/reset, DNS failure, timeout.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Response perform(const Request& request) = 0;
};

} // namespace http
} // namespace mpupload

#pragma once

#include "http/HttpTransport.hpp"

namespace mpupload {
namespace http {

// libcurl-backed transport. One easy handle per request, redirects are never followed.
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(long timeoutSeconds = 30, long connectTimeoutSeconds = 10);

    Response perform(const Request& request) override;

private:
    long timeoutSeconds_;
    long connectTimeoutSeconds_;
};

} // namespace http
} // namespace mpupload

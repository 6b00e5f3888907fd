#include "client/PartUploader.hpp"
#include "upload/UploadErrors.hpp"
#include <iostream>

namespace mpupload {

PartUploader::PartUploader(http::HttpTransport& transport) : transport_(transport) {}

std::string PartUploader::putPart(const std::string& presignedUrl, const std::string& bytes,
                                  const std::string& contentType) {
    http::Request request;
    request.method = HttpMethod::PUT;
    request.url = presignedUrl;
    request.setHeader("Content-Length", std::to_string(bytes.size()));
    request.setHeader("Content-Type", contentType);
    request.body = bytes;

    http::Response response;
    try {
        response = transport_.perform(request);
    } catch (const TransportError& e) {
        throw PartUploadError(PartFailure::Transport, e.what());
    }

    if (response.status != 200) {
        std::cerr << "Part upload HTTP error " << response.status << ": "
                  << response.body.substr(0, 500) << std::endl;
        throw PartUploadError(PartFailure::NonSuccessStatus,
                              "HTTP status " + std::to_string(response.status),
                              response.status);
    }

    auto etag = response.header("ETag");
    if (!etag || etag->empty()) {
        throw PartUploadError(PartFailure::MissingIdentifier, "No ETag returned", response.status);
    }

    return *etag;
}

} // namespace mpupload

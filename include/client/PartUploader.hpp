#pragma once

#include <string>
#include "http/HttpTransport.hpp"

namespace mpupload {

// PUTs one part's bytes to a presigned URL
class PartUploader {
public:
    explicit PartUploader(http::HttpTransport& transport);

    /**
     * Uploads bytes and returns the part identifier (ETag header).
     * Only HTTP 200 counts as success.
     * @throws PartUploadError with reason transport, nonSuccessStatus or missingIdentifier
     */
    std::string putPart(const std::string& presignedUrl, const std::string& bytes,
                        const std::string& contentType = "application/octet-stream");

private:
    http::HttpTransport& transport_;
};

} // namespace mpupload

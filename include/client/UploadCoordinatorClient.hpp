#pragma once

#include <string>
#include <vector>
#include "http/HttpTransport.hpp"
#include "upload/UploadErrors.hpp"
#include "upload/UploadSession.hpp"

namespace mpupload {

struct InitiateResult {
    std::string uploadId;
    std::string key;
};

/**
 * Client for the backend upload coordinator.
 *
 * Every call is a single blocking request. Any failure, including a 200 with
 * an unexpected body or a transport failure, throws CoordinatorError tagged
 * with the stage that failed.
 */
class UploadCoordinatorClient {
public:
    UploadCoordinatorClient(http::HttpTransport& transport, const std::string& baseUrl);

    // POST /upload/initiate (form: filename, content_type)
    InitiateResult initiate(const std::string& filename, const std::string& contentType);

    // POST /upload/presigned-url (form: key, uploadId, partNumber)
    std::string getPartUploadUrl(const std::string& key, const std::string& uploadId,
                                 int partNumber);

    // POST /upload/complete (JSON). Parts are sent in the given order.
    void complete(const std::string& key, const std::string& uploadId,
                  const std::vector<PartResult>& parts);

    // POST /upload/abort (JSON)
    void abort(const std::string& key, const std::string& uploadId);

    const std::string& baseUrl() const { return baseUrl_; }

private:
    http::HttpTransport& transport_;
    std::string baseUrl_;

    http::Response postForm(const std::string& path,
                            const std::vector<std::pair<std::string, std::string>>& fields,
                            CoordinatorStage stage, int partNumber = 0);

    http::Response postJson(const std::string& path, const std::string& body,
                            CoordinatorStage stage);
};

} // namespace mpupload

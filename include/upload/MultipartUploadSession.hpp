#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include "client/PartUploader.hpp"
#include "client/UploadCoordinatorClient.hpp"
#include "config/UploaderConfig.hpp"
#include "upload/PartPlanner.hpp"
#include "upload/UploadSession.hpp"
#include "upload/UploadTarget.hpp"

namespace mpupload {

struct SessionOptions {
    uint64_t chunkSize = MPUPLOAD_CHUNK_SIZE;
    int maxPartRetries = 0;
    long retryBackoffMs = MPUPLOAD_RETRY_BACKOFF_MS;
    bool abortOnFailure = false;

    static SessionOptions fromConfig(const UploaderConfig& config);
};

/**
 * Drives one file through initiate -> presign/PUT per part -> complete.
 *
 * Parts go strictly one at a time in ascending order. The first failure is
 * terminal: no further part is attempted and complete is never called.
 * A session runs once; retrying a file takes a fresh session.
 */
class MultipartUploadSession {
public:
    using Listener = std::function<void(SessionState state, const std::string& status)>;

    MultipartUploadSession(UploadTarget target, UploadCoordinatorClient& coordinator,
                           PartUploader& uploader, SessionOptions options = SessionOptions());

    // Runs to a terminal state and returns it. Upload failures never throw.
    // @throws std::logic_error if the session already ran
    SessionState run();

    // Invoked on every state transition and status update
    void setListener(Listener listener) { listener_ = std::move(listener); }

    SessionState state() const { return session_.state; }
    const std::string& status() const { return status_; }
    const UploadSession& session() const { return session_; }
    const PartPlan& plan() const { return plan_; }
    const UploadTarget& target() const { return target_; }

private:
    UploadTarget target_;
    UploadCoordinatorClient& coordinator_;
    PartUploader& uploader_;
    SessionOptions options_;
    Listener listener_;

    UploadSession session_;
    PartPlan plan_;
    std::string status_;

    void transition(SessionState next, const std::string& status);
    void updateStatus(const std::string& status);
    SessionState fail(const std::string& status);

    std::string putPartWithRetry(const std::string& url, const std::string& bytes, int partNumber);
};

} // namespace mpupload

#include "upload/MultipartUploadSession.hpp"
#include "upload/UploadErrors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace mpupload {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Initiating: return "Initiating";
        case SessionState::UploadingParts: return "UploadingParts";
        case SessionState::Completing: return "Completing";
        case SessionState::Done: return "Done";
        case SessionState::Failed: return "Failed";
        default: return "Unknown";
    }
}

SessionOptions SessionOptions::fromConfig(const UploaderConfig& config) {
    SessionOptions options;
    options.chunkSize = config.chunkSize;
    options.maxPartRetries = config.maxPartRetries;
    options.retryBackoffMs = config.retryBackoffMs;
    options.abortOnFailure = config.abortOnFailure;
    return options;
}

MultipartUploadSession::MultipartUploadSession(UploadTarget target,
                                               UploadCoordinatorClient& coordinator,
                                               PartUploader& uploader, SessionOptions options)
    : target_(std::move(target)), coordinator_(coordinator), uploader_(uploader),
      options_(options) {
    if (options_.chunkSize == 0) {
        throw std::invalid_argument("chunkSize must be > 0");
    }
    if (options_.maxPartRetries < 0 || options_.maxPartRetries > MPUPLOAD_MAX_PART_RETRIES) {
        throw std::invalid_argument("maxPartRetries must be in [0, " +
                                    std::to_string(MPUPLOAD_MAX_PART_RETRIES) + "]");
    }
}

void MultipartUploadSession::transition(SessionState next, const std::string& status) {
    session_.state = next;
    updateStatus(status);
}

void MultipartUploadSession::updateStatus(const std::string& status) {
    status_ = status;
    if (listener_) {
        listener_(session_.state, status_);
    }
}

SessionState MultipartUploadSession::fail(const std::string& status) {
    std::cerr << "Upload of " << target_.name() << " failed: " << status << std::endl;
    transition(SessionState::Failed, status);

    // Nothing to abort before the coordinator handed out an uploadId
    if (options_.abortOnFailure && !session_.uploadId.empty()) {
        try {
            coordinator_.abort(session_.key, session_.uploadId);
            std::cout << "Aborted multipart upload " << session_.uploadId << std::endl;
        } catch (const CoordinatorError& e) {
            std::cerr << "Abort of " << session_.uploadId << " failed: " << e.what() << std::endl;
        }
    }

    return session_.state;
}

std::string MultipartUploadSession::putPartWithRetry(const std::string& url,
                                                     const std::string& bytes, int partNumber) {
    long backoffMs = std::min(options_.retryBackoffMs, MPUPLOAD_MAX_RETRY_BACKOFF_MS);

    for (int attempt = 0;; ++attempt) {
        try {
            return uploader_.putPart(url, bytes, "application/octet-stream");
        } catch (const PartUploadError& e) {
            if (e.reason() != PartFailure::Transport || attempt >= options_.maxPartRetries) {
                throw;
            }
            std::cerr << "Part " << partNumber << " transport failure (" << e.cause()
                      << "), retry " << (attempt + 1) << "/" << options_.maxPartRetries
                      << " in " << backoffMs << " ms" << std::endl;
            if (backoffMs > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
            }
            backoffMs = backoffMs > MPUPLOAD_MAX_RETRY_BACKOFF_MS / 2
                            ? MPUPLOAD_MAX_RETRY_BACKOFF_MS
                            : backoffMs * 2;
        }
    }
}

SessionState MultipartUploadSession::run() {
    if (session_.state != SessionState::Idle) {
        throw std::logic_error("MultipartUploadSession can only run once");
    }

    std::cout << "Starting upload of " << target_.name() << " (" << target_.size()
              << " bytes, " << target_.contentType() << ")" << std::endl;
    transition(SessionState::Initiating, "Starting upload...");

    try {
        InitiateResult initiated = coordinator_.initiate(target_.name(), target_.contentType());
        session_.key = initiated.key;
        session_.uploadId = initiated.uploadId;
    } catch (const CoordinatorError& e) {
        return fail("Failed to initiate upload: " + e.body());
    }

    try {
        plan_ = PartPlanner::plan(target_.size(), options_.chunkSize);
    } catch (const std::invalid_argument& e) {
        return fail(std::string("Upload failed: ") + e.what());
    }
    const size_t partCount = plan_.size();
    std::cout << "Initiated " << session_.key << " (uploadId " << session_.uploadId << "), "
              << partCount << " part(s)" << std::endl;
    transition(SessionState::UploadingParts,
               "Uploading " + std::to_string(partCount) + " part(s)...");

    for (const auto& part : plan_) {
        std::string url;
        try {
            url = coordinator_.getPartUploadUrl(session_.key, session_.uploadId, part.partNumber);
        } catch (const CoordinatorError& e) {
            return fail("Failed to get presigned URL for part " +
                        std::to_string(part.partNumber) + ": " + e.body());
        }

        std::string etag;
        try {
            std::string bytes = target_.read(part.byteStart, part.byteEnd);
            etag = putPartWithRetry(url, bytes, part.partNumber);
        } catch (const PartUploadError& e) {
            if (e.reason() == PartFailure::MissingIdentifier) {
                return fail("Failed: No ETag returned for part " +
                            std::to_string(part.partNumber));
            }
            return fail("Upload failed: " + e.cause());
        } catch (const std::runtime_error& e) {
            return fail(std::string("Upload failed: ") + e.what());
        }

        session_.parts.push_back({part.partNumber, etag});
        updateStatus("Uploaded part " + std::to_string(part.partNumber) + " of " +
                     std::to_string(partCount));
    }

    transition(SessionState::Completing, "Completing upload...");

    try {
        coordinator_.complete(session_.key, session_.uploadId, session_.parts);
    } catch (const CoordinatorError& e) {
        return fail("Failed to complete upload: " + e.body());
    }

    std::cout << "Upload complete: " << target_.name() << " -> " << session_.key << std::endl;
    transition(SessionState::Done, "Upload complete!");
    return session_.state;
}

} // namespace mpupload

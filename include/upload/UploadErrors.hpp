#pragma once

#include <string>
#include <stdexcept>

namespace mpupload {

class UploadError : public std::runtime_error {
public:
    explicit UploadError(const std::string& message) : std::runtime_error(message) {}
};

// No HTTP response was obtained (connect/DNS/timeout/reset)
class TransportError : public UploadError {
public:
    explicit TransportError(const std::string& message) : UploadError(message) {}
};

enum class CoordinatorStage {
    Initiate,
    Presign,
    Complete,
    Abort,
};

const char* to_string(CoordinatorStage stage);

/**
 * Failure of a coordinator call. httpStatus is 0 when the request never got
 * a response; body then holds the transport message.
 */
class CoordinatorError : public UploadError {
public:
    CoordinatorError(CoordinatorStage stage, long httpStatus, const std::string& body,
                     int partNumber = 0);

    CoordinatorStage stage() const { return stage_; }
    long httpStatus() const { return httpStatus_; }
    const std::string& body() const { return body_; }
    int partNumber() const { return partNumber_; }

private:
    CoordinatorStage stage_;
    long httpStatus_;
    std::string body_;
    int partNumber_;
};

enum class PartFailure {
    Transport,
    MissingIdentifier,
    NonSuccessStatus,
};

const char* to_string(PartFailure reason);

class PartUploadError : public UploadError {
public:
    PartUploadError(PartFailure reason, const std::string& cause, long httpStatus = 0);

    PartFailure reason() const { return reason_; }
    const std::string& cause() const { return cause_; }
    long httpStatus() const { return httpStatus_; }

private:
    PartFailure reason_;
    std::string cause_;
    long httpStatus_;
};

} // namespace mpupload

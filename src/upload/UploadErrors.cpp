#include "upload/UploadErrors.hpp"

namespace mpupload {

namespace {
    std::string describeCoordinatorFailure(CoordinatorStage stage, long httpStatus,
                                           const std::string& body, int partNumber) {
        std::string message = std::string("Coordinator ") + to_string(stage) + " failed";
        if (stage == CoordinatorStage::Presign && partNumber > 0) {
            message += " for part " + std::to_string(partNumber);
        }
        if (httpStatus != 0) {
            message += " (HTTP " + std::to_string(httpStatus) + ")";
        }
        if (!body.empty()) {
            message += ": " + body;
        }
        return message;
    }
}

const char* to_string(CoordinatorStage stage) {
    switch (stage) {
        case CoordinatorStage::Initiate: return "initiate";
        case CoordinatorStage::Presign: return "presign";
        case CoordinatorStage::Complete: return "complete";
        case CoordinatorStage::Abort: return "abort";
        default: return "unknown";
    }
}

const char* to_string(PartFailure reason) {
    switch (reason) {
        case PartFailure::Transport: return "transport";
        case PartFailure::MissingIdentifier: return "missingIdentifier";
        case PartFailure::NonSuccessStatus: return "nonSuccessStatus";
        default: return "unknown";
    }
}

CoordinatorError::CoordinatorError(CoordinatorStage stage, long httpStatus,
                                   const std::string& body, int partNumber)
    : UploadError(describeCoordinatorFailure(stage, httpStatus, body, partNumber)),
      stage_(stage), httpStatus_(httpStatus), body_(body), partNumber_(partNumber) {}

PartUploadError::PartUploadError(PartFailure reason, const std::string& cause, long httpStatus)
    : UploadError(cause), reason_(reason), cause_(cause), httpStatus_(httpStatus) {}

} // namespace mpupload

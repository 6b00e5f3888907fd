#pragma once

#include <string>
#include <vector>

namespace mpupload {

enum class SessionState {
    Idle,
    Initiating,
    UploadingParts,
    Completing,
    Done,
    Failed,
};

const char* to_string(SessionState state);

inline bool isTerminal(SessionState state) {
    return state == SessionState::Done || state == SessionState::Failed;
}

struct PartResult {
    int partNumber;
    std::string partIdentifier;  // ETag as returned by storage, quotes included
};

// Coordinator-side identity of one upload plus the parts collected so far
struct UploadSession {
    std::string key;
    std::string uploadId;
    std::vector<PartResult> parts;
    SessionState state = SessionState::Idle;
};

} // namespace mpupload

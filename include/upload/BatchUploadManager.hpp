#pragma once

#include <string>
#include <vector>
#include "upload/MultipartUploadSession.hpp"

namespace mpupload {

struct BatchEntry {
    UploadTarget target;
    std::string status;
    SessionState state;
};

// Selected files and their latest status, in selection order
class BatchState {
public:
    void reset(const std::vector<UploadTarget>& targets);
    void update(size_t index, SessionState state, const std::string& status);
    void setInProgress(bool inProgress) { inProgress_ = inProgress; }

    const std::vector<BatchEntry>& entries() const { return entries_; }
    const BatchEntry& at(size_t index) const { return entries_.at(index); }
    size_t size() const { return entries_.size(); }
    bool inProgress() const { return inProgress_; }

private:
    std::vector<BatchEntry> entries_;
    bool inProgress_ = false;
};

class BatchObserver {
public:
    virtual ~BatchObserver() = default;

    virtual void onStatusChanged(size_t /*index*/, const BatchEntry& /*entry*/) {}
    virtual void onInProgressChanged(bool /*inProgress*/) {}
};

struct FileOutcome {
    std::string name;
    SessionState state;
    std::string status;

    bool succeeded() const { return state == SessionState::Done; }
};

/**
 * Uploads selected files one after another. A failed file never stops the
 * batch; the next file starts only after the previous one is terminal.
 */
class BatchUploadManager {
public:
    BatchUploadManager(UploadCoordinatorClient& coordinator, PartUploader& uploader,
                       SessionOptions options = SessionOptions());

    // Replaces the selection; every entry starts as "Not uploaded"
    void select(const std::vector<UploadTarget>& targets);

    // Uploads the current selection
    std::vector<FileOutcome> uploadSelected();

    // select() followed by uploadSelected()
    std::vector<FileOutcome> uploadAll(const std::vector<UploadTarget>& targets);

    // Observers must outlive the manager or be removed first
    void addObserver(BatchObserver& observer);
    void removeObserver(BatchObserver& observer);

    const BatchState& state() const { return state_; }
    bool inProgress() const { return state_.inProgress(); }

private:
    UploadCoordinatorClient& coordinator_;
    PartUploader& uploader_;
    SessionOptions options_;
    BatchState state_;
    std::vector<BatchObserver*> observers_;

    void setStatus(size_t index, SessionState state, const std::string& status);
    void setInProgress(bool inProgress);
};

} // namespace mpupload

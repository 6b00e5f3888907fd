#include "upload/BatchUploadManager.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace mpupload {

void BatchState::reset(const std::vector<UploadTarget>& targets) {
    entries_.clear();
    entries_.reserve(targets.size());
    for (const auto& target : targets) {
        entries_.push_back({target, "Not uploaded", SessionState::Idle});
    }
}

void BatchState::update(size_t index, SessionState state, const std::string& status) {
    BatchEntry& entry = entries_.at(index);
    entry.state = state;
    entry.status = status;
}

BatchUploadManager::BatchUploadManager(UploadCoordinatorClient& coordinator,
                                       PartUploader& uploader, SessionOptions options)
    : coordinator_(coordinator), uploader_(uploader), options_(options) {
    if (options_.chunkSize == 0) {
        throw std::invalid_argument("chunkSize must be > 0");
    }
    if (options_.maxPartRetries < 0 || options_.maxPartRetries > MPUPLOAD_MAX_PART_RETRIES) {
        throw std::invalid_argument("maxPartRetries must be in [0, " +
                                    std::to_string(MPUPLOAD_MAX_PART_RETRIES) + "]");
    }
}

void BatchUploadManager::addObserver(BatchObserver& observer) {
    if (std::find(observers_.begin(), observers_.end(), &observer) == observers_.end()) {
        observers_.push_back(&observer);
    }
}

void BatchUploadManager::removeObserver(BatchObserver& observer) {
    observers_.erase(std::remove(observers_.begin(), observers_.end(), &observer),
                     observers_.end());
}

void BatchUploadManager::setStatus(size_t index, SessionState state, const std::string& status) {
    state_.update(index, state, status);
    for (auto* observer : observers_) {
        observer->onStatusChanged(index, state_.at(index));
    }
}

void BatchUploadManager::setInProgress(bool inProgress) {
    if (state_.inProgress() == inProgress) {
        return;
    }
    state_.setInProgress(inProgress);
    for (auto* observer : observers_) {
        observer->onInProgressChanged(inProgress);
    }
}

void BatchUploadManager::select(const std::vector<UploadTarget>& targets) {
    if (state_.inProgress()) {
        throw std::logic_error("Cannot change the selection while uploading");
    }

    state_.reset(targets);
    for (size_t i = 0; i < state_.size(); ++i) {
        for (auto* observer : observers_) {
            observer->onStatusChanged(i, state_.at(i));
        }
    }
}

std::vector<FileOutcome> BatchUploadManager::uploadSelected() {
    std::vector<FileOutcome> outcomes;
    if (state_.size() == 0) {
        return outcomes;
    }

    outcomes.reserve(state_.size());
    setInProgress(true);

    try {
        for (size_t i = 0; i < state_.size(); ++i) {
            MultipartUploadSession session(state_.at(i).target, coordinator_, uploader_, options_);
            session.setListener([this, i](SessionState state, const std::string& status) {
                setStatus(i, state, status);
            });

            SessionState result = session.run();
            outcomes.push_back({session.target().name(), result, session.status()});
        }
    } catch (...) {
        setInProgress(false);
        throw;
    }

    setInProgress(false);

    size_t succeeded = std::count_if(outcomes.begin(), outcomes.end(),
                                     [](const FileOutcome& o) { return o.succeeded(); });
    std::cout << "Batch finished: " << succeeded << "/" << outcomes.size()
              << " file(s) uploaded" << std::endl;
    return outcomes;
}

std::vector<FileOutcome> BatchUploadManager::uploadAll(const std::vector<UploadTarget>& targets) {
    select(targets);
    return uploadSelected();
}

} // namespace mpupload

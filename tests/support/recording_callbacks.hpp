#pragma once

#include "uplift/transfer/lifecycle_callbacks.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace uplift::test {

// Records every lifecycle event; can decline uploads before they start
class RecordingCallbacks : public transfer::UploadLifecycleCallbacks {
public:
    struct Finished {
        std::string session_id;
        transfer::UploadOutcome outcome;
        std::string message;
    };

    struct Paused {
        std::string session_id;
        std::string reason;
        bool constraint_violation;
    };

    void decline_uploads(const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        decline_reason_ = reason;
    }

    transfer::BeforeUploadDecision on_before_upload(const std::filesystem::path& source) override {
        std::lock_guard<std::mutex> lock(mutex_);
        before_upload_.push_back(source.string());
        if (!decline_reason_.empty()) {
            return transfer::BeforeUploadDecision::abort(decline_reason_);
        }
        return transfer::BeforeUploadDecision::continue_upload();
    }

    void on_upload_complete(const std::string& session_id, transfer::UploadOutcome outcome,
                            const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_.push_back({session_id, outcome, message});
    }

    void on_upload_paused(const std::string& session_id, const std::string& reason,
                          bool is_constraint_violation) override {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_.push_back({session_id, reason, is_constraint_violation});
    }

    void on_upload_resumed(const std::string& session_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        resumed_.push_back(session_id);
    }

    std::vector<Finished> finished() const { std::lock_guard<std::mutex> lock(mutex_); return finished_; }
    std::vector<Paused> paused() const { std::lock_guard<std::mutex> lock(mutex_); return paused_; }
    std::vector<std::string> resumed() const { std::lock_guard<std::mutex> lock(mutex_); return resumed_; }
    std::vector<std::string> before_upload() const { std::lock_guard<std::mutex> lock(mutex_); return before_upload_; }

private:
    mutable std::mutex mutex_;
    std::string decline_reason_;
    std::vector<Finished> finished_;
    std::vector<Paused> paused_;
    std::vector<std::string> resumed_;
    std::vector<std::string> before_upload_;
};

}

#pragma once

#include <filesystem>
#include <string>

namespace uplift::transfer {

enum class UploadOutcome {
    COMPLETED,
    FAILED,
    CANCELLED
};

inline const char* to_string(UploadOutcome outcome) {
    switch (outcome) {
        case UploadOutcome::COMPLETED: return "completed";
        case UploadOutcome::FAILED: return "failed";
        case UploadOutcome::CANCELLED: return "cancelled";
    }
    return "unknown";
}

struct BeforeUploadDecision {
    bool proceed = true;
    std::string reason;
    
    static BeforeUploadDecision continue_upload() { return {true, ""}; }
    static BeforeUploadDecision abort(std::string reason) { return {false, std::move(reason)}; }
};

// Application hooks around an upload's life. Called from worker threads;
// implementations must not call back into the manager synchronously.
class UploadLifecycleCallbacks {
public:
    virtual ~UploadLifecycleCallbacks() = default;
    
    virtual BeforeUploadDecision on_before_upload(const std::filesystem::path& source) {
        (void)source;
        return BeforeUploadDecision::continue_upload();
    }
    
    virtual void on_upload_complete(const std::string& session_id, UploadOutcome outcome,
                                    const std::string& message) {
        (void)session_id;
        (void)outcome;
        (void)message;
    }
    
    virtual void on_upload_paused(const std::string& session_id, const std::string& reason,
                                  bool is_constraint_violation) {
        (void)session_id;
        (void)reason;
        (void)is_constraint_violation;
    }
    
    virtual void on_upload_resumed(const std::string& session_id) {
        (void)session_id;
    }
};

}

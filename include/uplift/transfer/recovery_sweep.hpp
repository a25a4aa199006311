#pragma once

#include "../storage/upload_records.hpp"
#include "../storage/upload_store.hpp"
#include "../core/result.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace uplift::transfer {

struct RecoveryCandidate {
    std::string session_id;
    size_t reset_parts = 0;
};

// Finds sessions left running by a process that is gone and puts their parts
// back in a state the dispatch loop can pick up again
class RecoverySweep {
public:
    static constexpr std::chrono::hours DEFAULT_RETENTION{24 * 7};

    using LivenessCheck = std::function<bool(const std::string& session_id)>;

    RecoverySweep(std::shared_ptr<storage::UploadStore> store, std::chrono::milliseconds stale_threshold);

    // PENDING and IN_PROGRESS sessions without a live coordinator. Sessions
    // whose source vanished or changed are failed instead of returned.
    core::UploadResult scan(const LivenessCheck& is_live, std::vector<RecoveryCandidate>& candidates);

    // Deletes terminal sessions last touched before now - retention
    core::UploadResult cleanup(std::chrono::hours retention, size_t& removed);

    std::chrono::milliseconds stale_threshold() const { return stale_threshold_; }

private:
    std::shared_ptr<storage::UploadStore> store_;
    std::chrono::milliseconds stale_threshold_;

    bool source_still_valid(const storage::UploadSession& session);
};

}

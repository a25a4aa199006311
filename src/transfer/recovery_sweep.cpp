#include "uplift/transfer/recovery_sweep.hpp"
#include "uplift/storage/source_file.hpp"
#include "uplift/core/logger.hpp"
#include "uplift/core/utils.hpp"

namespace uplift::transfer {

using core::UploadError;
using core::UploadResult;
using core::utils::TimeUtils;
using storage::SessionStatus;

RecoverySweep::RecoverySweep(std::shared_ptr<storage::UploadStore> store, std::chrono::milliseconds stale_threshold)
    : store_(std::move(store)), stale_threshold_(stale_threshold) {
}

UploadResult RecoverySweep::scan(const LivenessCheck& is_live, std::vector<RecoveryCandidate>& candidates) {
    candidates.clear();

    std::vector<storage::UploadSession> sessions;
    auto result = store_->query_sessions_by_statuses({SessionStatus::PENDING, SessionStatus::IN_PROGRESS}, sessions);
    if (!result) {
        return result;
    }

    auto cutoff = TimeUtils::now() - stale_threshold_;

    for (const auto& session : sessions) {
        if (is_live && is_live(session.session_id)) {
            continue;
        }

        if (!source_still_valid(session)) {
            continue;
        }

        RecoveryCandidate candidate;
        candidate.session_id = session.session_id;

        result = store_->reset_stale_uploading_parts(session.session_id, cutoff, candidate.reset_parts);
        if (!result) {
            return result;
        }

        LOG_INFO("Recovering interrupted upload {} ({}), reset {} stale part(s)",
                 session.session_id, session.file_name, candidate.reset_parts);
        candidates.push_back(std::move(candidate));
    }

    return UploadResult();
}

UploadResult RecoverySweep::cleanup(std::chrono::hours retention, size_t& removed) {
    auto cutoff = TimeUtils::now() - retention;

    auto result = store_->delete_terminal_sessions_older_than(cutoff, removed);
    if (result && removed > 0) {
        LOG_INFO("Removed {} finished session(s) older than {}", removed, TimeUtils::to_iso_string(cutoff));
    }
    return result;
}

bool RecoverySweep::source_still_valid(const storage::UploadSession& session) {
    storage::SourceFile source(session.source_path);
    auto check = source.verify(session.fingerprint);
    if (check) {
        return true;
    }

    LOG_WARN("Cannot recover {}: {}", session.session_id, check.message);

    auto result = store_->transition_session(session.session_id,
                                             {SessionStatus::PENDING, SessionStatus::IN_PROGRESS},
                                             SessionStatus::FAILED, check.message);
    if (!result && result.error != UploadError::INVALID_STATE) {
        LOG_ERROR("Failed to mark {} as failed: {}", session.session_id, result.message);
    }
    return false;
}

}

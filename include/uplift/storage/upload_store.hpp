#pragma once

#include "upload_records.hpp"
#include "../core/result.hpp"
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace uplift::storage {

// Fields written by a part status change. Empty optionals leave the stored
// value untouched; the integrity token is always rewritten (cleared unless
// the new status is UPLOADED).
struct PartUpdate {
    PartStatus status = PartStatus::PENDING;
    std::optional<std::string> integrity_token;
    std::optional<uint32_t> retry_count;
    std::optional<std::chrono::system_clock::time_point> last_attempt_at;
    std::optional<std::string> content_digest;
};

// Durable record of sessions and parts. Safe to share between threads; every
// call is serialized on one connection.
class UploadStore {
public:
    explicit UploadStore(const std::filesystem::path& database_path);
    ~UploadStore();

    UploadStore(const UploadStore&) = delete;
    UploadStore& operator=(const UploadStore&) = delete;

    bool initialize();

    // Sessions
    core::UploadResult create_session(const UploadSession& session, const std::vector<UploadPart>& parts);
    core::UploadResult get_session(const std::string& session_id, UploadSession& session);
    core::UploadResult get_parts(const std::string& session_id, std::vector<UploadPart>& parts);

    // Conditional status change. INVALID_STATE when the stored status is not
    // one of `expected`, NOT_FOUND when the session is unknown.
    core::UploadResult transition_session(const std::string& session_id,
                                          const std::vector<SessionStatus>& expected,
                                          SessionStatus next,
                                          const std::optional<std::string>& error_message = std::nullopt);

    // IN_PROGRESS -> PAUSED, recording who asked for it
    core::UploadResult pause_session(const std::string& session_id, bool auto_paused, const std::string& reason);
    core::UploadResult set_pause_state(const std::string& session_id, bool auto_paused, const std::string& reason);

    // Recorded once; a second call with a different id is rejected
    core::UploadResult set_remote_upload(const std::string& session_id,
                                         const std::string& remote_upload_id,
                                         const std::string& remote_path);

    core::UploadResult update_constraints(const std::string& session_id,
                                          const transfer::UploadConstraints& constraints);

    core::UploadResult query_sessions_by_status(SessionStatus status, std::vector<UploadSession>& sessions);
    core::UploadResult query_sessions_by_statuses(const std::vector<SessionStatus>& statuses,
                                                  std::vector<UploadSession>& sessions);
    core::UploadResult list_sessions(std::vector<UploadSession>& sessions);
    core::UploadResult find_active_session_for_source(const std::string& source_path, UploadSession& session);

    core::UploadResult delete_session(const std::string& session_id);
    core::UploadResult delete_terminal_sessions_older_than(std::chrono::system_clock::time_point cutoff,
                                                           size_t& removed);

    // Parts
    core::UploadResult update_part_status(const std::string& session_id, uint32_t part_number,
                                          const PartUpdate& update,
                                          std::optional<PartStatus> expected = std::nullopt);
    core::UploadResult count_uploaded_parts(const std::string& session_id, uint32_t& count);
    core::UploadResult reset_stale_uploading_parts(const std::string& session_id,
                                                   std::chrono::system_clock::time_point cutoff,
                                                   size_t& reset);

    const std::filesystem::path& path() const { return db_path_; }

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    mutable std::mutex mutex_;

    bool create_tables();
    bool execute(const char* sql);
    core::UploadResult error(const std::string& context) const;
    core::UploadResult check_open() const;
    core::UploadResult load_sessions(const std::string& sql, const std::vector<std::string>& params,
                                     std::vector<UploadSession>& sessions);
    core::UploadResult status_mismatch(const std::string& session_id);
};

}

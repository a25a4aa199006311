#pragma once

#include "../transfer/upload_constraints.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace uplift::storage {

enum class SessionStatus {
    PENDING,
    IN_PROGRESS,
    PAUSED,
    COMPLETED,
    FAILED,
    ABORTED
};

enum class PartStatus {
    PENDING,
    UPLOADING,
    UPLOADED,
    FAILED
};

const char* to_string(SessionStatus status);
const char* to_string(PartStatus status);

// Unknown codes are rejected rather than mapped to a default
std::optional<SessionStatus> session_status_from_string(std::string_view value);
std::optional<PartStatus> part_status_from_string(std::string_view value);

bool is_terminal(SessionStatus status);

// Half-open [start, end) byte interval of the source file
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;
    
    uint64_t size() const { return end - start; }
    bool operator==(const ByteRange&) const = default;
};

// Size and modification time of the source as recorded at session creation
struct SourceFingerprint {
    uint64_t size = 0;
    int64_t modified_ms = 0;
    
    bool operator==(const SourceFingerprint&) const = default;
};

struct UploadSession {
    std::string session_id;
    std::string source_path;
    std::string file_name;
    std::string content_type;
    uint64_t total_bytes = 0;
    uint64_t chunk_bytes = 0;
    uint32_t total_parts = 0;
    std::string remote_upload_id;
    std::string remote_path;
    SessionStatus status = SessionStatus::PENDING;
    transfer::UploadConstraints constraints;
    int max_retries = 0;
    bool auto_paused = false;
    std::string pause_reason;
    SourceFingerprint fingerprint;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
    std::optional<std::string> error_message;
    
    bool has_remote_upload() const { return !remote_upload_id.empty(); }
};

struct UploadPart {
    std::string session_id;
    uint32_t part_number = 0;
    ByteRange range;
    PartStatus status = PartStatus::PENDING;
    std::optional<std::string> integrity_token;
    uint32_t retry_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_attempt_at;
    std::string content_digest;
    
    uint64_t size() const { return range.size(); }
    uint64_t uploaded_bytes() const { return status == PartStatus::UPLOADED ? range.size() : 0; }
};

}

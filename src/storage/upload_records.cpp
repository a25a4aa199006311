#include "uplift/storage/upload_records.hpp"

namespace uplift::storage {

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::PENDING: return "PENDING";
        case SessionStatus::IN_PROGRESS: return "IN_PROGRESS";
        case SessionStatus::PAUSED: return "PAUSED";
        case SessionStatus::COMPLETED: return "COMPLETED";
        case SessionStatus::FAILED: return "FAILED";
        case SessionStatus::ABORTED: return "ABORTED";
    }
    return "UNKNOWN";
}

const char* to_string(PartStatus status) {
    switch (status) {
        case PartStatus::PENDING: return "PENDING";
        case PartStatus::UPLOADING: return "UPLOADING";
        case PartStatus::UPLOADED: return "UPLOADED";
        case PartStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

std::optional<SessionStatus> session_status_from_string(std::string_view value) {
    if (value == "PENDING") return SessionStatus::PENDING;
    if (value == "IN_PROGRESS") return SessionStatus::IN_PROGRESS;
    if (value == "PAUSED") return SessionStatus::PAUSED;
    if (value == "COMPLETED") return SessionStatus::COMPLETED;
    if (value == "FAILED") return SessionStatus::FAILED;
    if (value == "ABORTED") return SessionStatus::ABORTED;
    return std::nullopt;
}

std::optional<PartStatus> part_status_from_string(std::string_view value) {
    if (value == "PENDING") return PartStatus::PENDING;
    if (value == "UPLOADING") return PartStatus::UPLOADING;
    if (value == "UPLOADED") return PartStatus::UPLOADED;
    if (value == "FAILED") return PartStatus::FAILED;
    return std::nullopt;
}

bool is_terminal(SessionStatus status) {
    return status == SessionStatus::COMPLETED ||
           status == SessionStatus::FAILED ||
           status == SessionStatus::ABORTED;
}

}

#include "uplift/core/result.hpp"

namespace uplift::core {

const char* to_string(UploadError error) {
    switch (error) {
        case UploadError::SUCCESS: return "Success";
        case UploadError::INVALID_CONFIGURATION: return "InvalidConfiguration";
        case UploadError::TRANSIENT_NETWORK: return "TransientNetworkError";
        case UploadError::PERMANENT_REJECTION: return "PermanentRejection";
        case UploadError::SOURCE_READ: return "SourceReadError";
        case UploadError::PERSISTENCE: return "PersistenceError";
        case UploadError::CANCELLED: return "Cancelled";
        case UploadError::NOT_FOUND: return "NotFound";
        case UploadError::INVALID_STATE: return "InvalidState";
    }
    return "Unknown";
}

}

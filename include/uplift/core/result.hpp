#pragma once

#include <string>

namespace uplift::core {

// Error taxonomy for every upload operation
enum class UploadError {
    SUCCESS = 0,
    INVALID_CONFIGURATION,
    TRANSIENT_NETWORK,
    PERMANENT_REJECTION,
    SOURCE_READ,
    PERSISTENCE,
    CANCELLED,
    NOT_FOUND,
    INVALID_STATE
};

const char* to_string(UploadError error);

struct UploadResult {
    UploadError error;
    std::string message;
    
    UploadResult(UploadError err = UploadError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == UploadError::SUCCESS; }
    operator bool() const { return success(); }
    
    // Transient network failures are the only ones worth another attempt
    bool is_retryable() const { return error == UploadError::TRANSIENT_NETWORK; }
};

}

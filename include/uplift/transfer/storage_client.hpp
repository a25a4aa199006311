#pragma once

#include "../core/result.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace uplift::transfer {

struct SourceMetadata {
    std::string file_name;
    std::string content_type;
    uint64_t file_size = 0;
};

// Handle of a multipart upload opened on the backend
struct RemoteUpload {
    std::string upload_id;
    std::string remote_path;
};

struct PresignedPart {
    std::string url;
    std::map<std::string, std::string> headers;
};

struct CompletedPart {
    uint32_t part_number = 0;
    std::string integrity_token;
};

// Backend operations of a multipart upload. Implementations classify failures
// as TRANSIENT_NETWORK (worth retrying) or PERMANENT_REJECTION.
class StorageClient {
public:
    virtual ~StorageClient() = default;
    
    virtual core::UploadResult initiate(const SourceMetadata& source, RemoteUpload& upload) = 0;
    
    virtual core::UploadResult presign_part(const RemoteUpload& upload, uint32_t part_number,
                                            PresignedPart& target) = 0;
    
    // Sends one part body; stops early with CANCELLED once `cancelled` is set
    virtual core::UploadResult upload_bytes(const PresignedPart& target,
                                            std::span<const uint8_t> bytes,
                                            std::chrono::milliseconds timeout,
                                            const std::atomic<bool>& cancelled,
                                            std::string& integrity_token) = 0;
    
    // `parts` is ordered by part number
    virtual core::UploadResult complete(const RemoteUpload& upload, const std::vector<CompletedPart>& parts) = 0;
    
    virtual core::UploadResult abort(const RemoteUpload& upload) = 0;
};

}

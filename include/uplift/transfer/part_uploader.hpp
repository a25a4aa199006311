#pragma once

#include "storage_client.hpp"
#include "../storage/upload_records.hpp"
#include "../core/result.hpp"
#include <atomic>
#include <chrono>
#include <string>

namespace uplift::transfer {

struct PartReceipt {
    std::string integrity_token;
    std::string content_digest;
    uint64_t bytes_sent = 0;
};

// One attempt at one part: presign, read the range, send it. Touches no
// persistent state; the caller records the outcome.
class PartUploader {
public:
    PartUploader(StorageClient& client, std::chrono::milliseconds timeout);
    
    core::UploadResult upload(const storage::UploadSession& session,
                              const storage::UploadPart& part,
                              const std::atomic<bool>& cancelled,
                              PartReceipt& receipt);
    
private:
    StorageClient& client_;
    std::chrono::milliseconds timeout_;
};

}

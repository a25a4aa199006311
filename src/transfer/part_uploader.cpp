#include "uplift/transfer/part_uploader.hpp"
#include "uplift/crypto/hash.hpp"
#include "uplift/storage/source_file.hpp"
#include "uplift/core/logger.hpp"
#include <vector>

namespace uplift::transfer {

PartUploader::PartUploader(StorageClient& client, std::chrono::milliseconds timeout)
    : client_(client), timeout_(timeout) {
}

core::UploadResult PartUploader::upload(const storage::UploadSession& session,
                                        const storage::UploadPart& part,
                                        const std::atomic<bool>& cancelled,
                                        PartReceipt& receipt) {
    if (cancelled) {
        return core::UploadResult(core::UploadError::CANCELLED, "Upload cancelled");
    }
    
    if (!session.has_remote_upload()) {
        return core::UploadResult(core::UploadError::INVALID_STATE,
                                  "Session " + session.session_id + " has no remote upload");
    }
    
    storage::SourceFile source(session.source_path);
    auto result = source.verify(session.fingerprint);
    if (!result) {
        return result;
    }
    
    RemoteUpload remote{session.remote_upload_id, session.remote_path};
    PresignedPart target;
    result = client_.presign_part(remote, part.part_number, target);
    if (!result) {
        LOG_DEBUG("Presign of part {} for {} failed: {}", part.part_number, session.session_id, result.message);
        return result;
    }
    
    std::vector<uint8_t> bytes;
    result = source.read_range(part.range, bytes);
    if (!result) {
        return result;
    }
    
    crypto::ContentDigest digest{};
    result = crypto::ContentHasher::hash(bytes, digest);
    if (!result) {
        return core::UploadResult(core::UploadError::SOURCE_READ, "Cannot digest part bytes: " + result.message);
    }
    receipt.content_digest = crypto::hash_utils::to_hex(digest);
    
    if (!part.content_digest.empty() && part.content_digest != receipt.content_digest) {
        return core::UploadResult(core::UploadError::SOURCE_READ,
                                  "Source content of part " + std::to_string(part.part_number) +
                                  " changed since the previous attempt");
    }
    
    if (cancelled) {
        return core::UploadResult(core::UploadError::CANCELLED, "Upload cancelled");
    }
    
    std::string token;
    result = client_.upload_bytes(target, bytes, timeout_, cancelled, token);
    if (!result) {
        return result;
    }
    
    if (token.empty()) {
        return core::UploadResult(core::UploadError::PERMANENT_REJECTION,
                                  "Backend returned no integrity token for part " + std::to_string(part.part_number));
    }
    
    receipt.integrity_token = std::move(token);
    receipt.bytes_sent = bytes.size();
    return core::UploadResult();
}

}

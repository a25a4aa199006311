#pragma once

#include "upload_records.hpp"
#include "../core/result.hpp"
#include <cstdint>
#include <vector>

namespace uplift::storage {

// Splits a byte length into the contiguous ranges of a multipart upload
class ChunkPlanner {
public:
    static constexpr uint64_t DEFAULT_MINIMUM_CHUNK_SIZE = 5ULL * 1024 * 1024;
    
    explicit ChunkPlanner(uint64_t minimum_chunk_size = DEFAULT_MINIMUM_CHUNK_SIZE);
    
    // Ranges are ascending, contiguous and cover [0, total_bytes); only the
    // last one may be shorter than chunk_bytes
    core::UploadResult plan(uint64_t total_bytes, uint64_t chunk_bytes,
                            std::vector<ByteRange>& ranges) const;
    
    // Checks that stored parts still describe the session's layout
    core::UploadResult verify_layout(const UploadSession& session,
                                     const std::vector<UploadPart>& parts) const;
    
    static uint32_t part_count(uint64_t total_bytes, uint64_t chunk_bytes);
    
    uint64_t minimum_chunk_size() const { return minimum_chunk_size_; }

private:
    uint64_t minimum_chunk_size_;
};

}

#include "uplift/storage/chunk_planner.hpp"
#include <algorithm>
#include <limits>

namespace uplift::storage {

ChunkPlanner::ChunkPlanner(uint64_t minimum_chunk_size)
    : minimum_chunk_size_(minimum_chunk_size) {
}

core::UploadResult ChunkPlanner::plan(uint64_t total_bytes, uint64_t chunk_bytes,
                                      std::vector<ByteRange>& ranges) const {
    ranges.clear();
    
    if (total_bytes == 0) {
        return core::UploadResult(core::UploadError::INVALID_CONFIGURATION, "Source is empty");
    }
    
    if (chunk_bytes == 0 || chunk_bytes < minimum_chunk_size_) {
        return core::UploadResult(core::UploadError::INVALID_CONFIGURATION,
                                  "Chunk size " + std::to_string(chunk_bytes) +
                                  " is below the minimum of " + std::to_string(minimum_chunk_size_));
    }
    
    auto count = (total_bytes + chunk_bytes - 1) / chunk_bytes;
    if (count > std::numeric_limits<uint32_t>::max()) {
        return core::UploadResult(core::UploadError::INVALID_CONFIGURATION, "Too many parts for source size");
    }
    
    ranges.reserve(static_cast<size_t>(count));
    for (uint64_t start = 0; start < total_bytes; start += chunk_bytes) {
        ranges.push_back(ByteRange{start, std::min(start + chunk_bytes, total_bytes)});
    }
    
    return core::UploadResult();
}

core::UploadResult ChunkPlanner::verify_layout(const UploadSession& session,
                                               const std::vector<UploadPart>& parts) const {
    if (parts.size() != session.total_parts) {
        return core::UploadResult(core::UploadError::INVALID_STATE,
                                  "Expected " + std::to_string(session.total_parts) +
                                  " parts, found " + std::to_string(parts.size()));
    }
    
    uint64_t expected_start = 0;
    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& part = parts[i];
        
        if (part.part_number != i + 1) {
            return core::UploadResult(core::UploadError::INVALID_STATE,
                                      "Part numbers are not dense at " + std::to_string(i + 1));
        }
        
        if (part.range.start != expected_start || part.range.end <= part.range.start) {
            return core::UploadResult(core::UploadError::INVALID_STATE,
                                      "Part " + std::to_string(part.part_number) + " range is not contiguous");
        }
        
        bool last = i + 1 == parts.size();
        if (!last && part.range.size() != session.chunk_bytes) {
            return core::UploadResult(core::UploadError::INVALID_STATE,
                                      "Part " + std::to_string(part.part_number) + " is shorter than the chunk size");
        }
        
        if ((part.status == PartStatus::UPLOADED) != part.integrity_token.has_value()) {
            return core::UploadResult(core::UploadError::INVALID_STATE,
                                      "Part " + std::to_string(part.part_number) + " integrity token does not match status");
        }
        
        expected_start = part.range.end;
    }
    
    if (expected_start != session.total_bytes) {
        return core::UploadResult(core::UploadError::INVALID_STATE, "Parts do not cover the whole source");
    }
    
    return core::UploadResult();
}

uint32_t ChunkPlanner::part_count(uint64_t total_bytes, uint64_t chunk_bytes) {
    if (chunk_bytes == 0) return 0;
    return static_cast<uint32_t>((total_bytes + chunk_bytes - 1) / chunk_bytes);
}

}

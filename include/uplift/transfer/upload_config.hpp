#pragma once

#include "upload_constraints.hpp"
#include "../core/config.hpp"
#include "../core/result.hpp"
#include <chrono>
#include <cstdint>

namespace uplift::transfer {

struct UploadConfig {
    // Backend floor for every part but the last (S3 rule)
    static constexpr uint64_t MIN_CHUNK_SIZE = 5ULL * 1024 * 1024;
    static constexpr uint64_t DEFAULT_CHUNK_SIZE = MIN_CHUNK_SIZE;
    static constexpr int DEFAULT_MAX_CONCURRENT_PARTS = 3;
    static constexpr int MAX_CONCURRENT_PARTS_LIMIT = 10;
    static constexpr int DEFAULT_MAX_RETRIES = 3;
    static constexpr std::chrono::milliseconds DEFAULT_RETRY_DELAY{1000};
    static constexpr std::chrono::milliseconds DEFAULT_PART_TIMEOUT{120000};
    static constexpr std::chrono::milliseconds DEFAULT_STALE_UPLOAD_THRESHOLD{300000};
    static constexpr uint32_t MAX_BACKOFF_SHIFT = 10;
    
    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
    uint64_t minimum_chunk_size = MIN_CHUNK_SIZE;
    int max_concurrent_parts = DEFAULT_MAX_CONCURRENT_PARTS;
    int max_retries = DEFAULT_MAX_RETRIES;
    std::chrono::milliseconds retry_delay = DEFAULT_RETRY_DELAY;
    bool use_exponential_backoff = true;
    std::chrono::milliseconds part_timeout = DEFAULT_PART_TIMEOUT;
    std::chrono::milliseconds stale_upload_threshold = DEFAULT_STALE_UPLOAD_THRESHOLD;
    UploadConstraints default_constraints;
    
    core::UploadResult validate() const;
    
    uint32_t part_count(uint64_t file_size) const;
    
    // retry_delay * 2^min(retry_count, 10), or the flat delay without backoff
    std::chrono::milliseconds retry_delay_for(uint32_t retry_count) const;
    
    static UploadConfig from_config(const core::Config& config);
    
    static UploadConfig for_large_files();
    static UploadConfig for_unreliable_network();
    static UploadConfig wifi_only();
    static UploadConfig power_saving();
};

}

#include "uplift/transfer/upload_config.hpp"
#include "uplift/core/logger.hpp"
#include <algorithm>

namespace uplift::transfer {

core::UploadResult UploadConfig::validate() const {
    if (minimum_chunk_size == 0) {
        return core::UploadResult(core::UploadError::INVALID_CONFIGURATION,
                                  "Minimum chunk size must be positive");
    }
    
    if (chunk_size < minimum_chunk_size) {
        return core::UploadResult(core::UploadError::INVALID_CONFIGURATION,
                                  "Chunk size must be at least " + std::to_string(minimum_chunk_size) + " bytes");
    }
    
    if (max_concurrent_parts < 1 || max_concurrent_parts > MAX_CONCURRENT_PARTS_LIMIT) {
        return core::UploadResult(core::UploadError::INVALID_CONFIGURATION,
                                  "Concurrent parts must be between 1 and " + std::to_string(MAX_CONCURRENT_PARTS_LIMIT));
    }
    
    if (max_retries < 0) {
        return core::UploadResult(core::UploadError::INVALID_CONFIGURATION, "Max retries must be non-negative");
    }
    
    if (retry_delay.count() < 0) {
        return core::UploadResult(core::UploadError::INVALID_CONFIGURATION, "Retry delay must be non-negative");
    }
    
    if (part_timeout.count() <= 0) {
        return core::UploadResult(core::UploadError::INVALID_CONFIGURATION, "Part timeout must be positive");
    }
    
    if (stale_upload_threshold.count() < 0) {
        return core::UploadResult(core::UploadError::INVALID_CONFIGURATION,
                                  "Stale upload threshold must be non-negative");
    }
    
    if (!default_constraints.is_valid()) {
        return core::UploadResult(core::UploadError::INVALID_CONFIGURATION,
                                  "Auto-resume delay must be non-negative");
    }
    
    return core::UploadResult();
}

uint32_t UploadConfig::part_count(uint64_t file_size) const {
    if (chunk_size == 0) return 0;
    return static_cast<uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

std::chrono::milliseconds UploadConfig::retry_delay_for(uint32_t retry_count) const {
    if (!use_exponential_backoff) {
        return retry_delay;
    }
    
    auto shift = std::min(retry_count, MAX_BACKOFF_SHIFT);
    return retry_delay * (int64_t{1} << shift);
}

UploadConfig UploadConfig::from_config(const core::Config& config) {
    UploadConfig result;
    
    auto chunk = config.get_int64("upload.chunk_size", static_cast<int64_t>(DEFAULT_CHUNK_SIZE));
    result.chunk_size = chunk > 0 ? static_cast<uint64_t>(chunk) : 0;
    
    auto minimum = config.get_int64("upload.minimum_chunk_size", static_cast<int64_t>(MIN_CHUNK_SIZE));
    result.minimum_chunk_size = minimum > 0 ? static_cast<uint64_t>(minimum) : 0;
    
    result.max_concurrent_parts = config.get_int("upload.max_concurrent_parts", DEFAULT_MAX_CONCURRENT_PARTS);
    result.max_retries = config.get_int("upload.max_retries", DEFAULT_MAX_RETRIES);
    result.retry_delay = std::chrono::milliseconds(
        config.get_int64("upload.retry_delay_ms", DEFAULT_RETRY_DELAY.count()));
    result.use_exponential_backoff = config.get_bool("upload.exponential_backoff", true);
    result.part_timeout = std::chrono::milliseconds(
        config.get_int64("upload.part_timeout_ms", DEFAULT_PART_TIMEOUT.count()));
    result.stale_upload_threshold = std::chrono::milliseconds(
        config.get_int64("upload.stale_threshold_ms", DEFAULT_STALE_UPLOAD_THRESHOLD.count()));
    
    auto network = config.get_string("constraints.network", "CONNECTED");
    if (auto type = network_type_from_string(network)) {
        result.default_constraints.network_type = *type;
    } else {
        LOG_WARN("Unknown network constraint '{}', using CONNECTED", network);
    }
    result.default_constraints.requires_charging = config.get_bool("constraints.charging", false);
    result.default_constraints.requires_battery_not_low = config.get_bool("constraints.battery_not_low", false);
    result.default_constraints.requires_storage_not_low = config.get_bool("constraints.storage_not_low", false);
    result.default_constraints.auto_resume_when_satisfied = config.get_bool("constraints.auto_resume", true);
    result.default_constraints.auto_resume_delay = std::chrono::milliseconds(
        config.get_int64("constraints.auto_resume_delay_ms", UploadConstraints::DEFAULT_AUTO_RESUME_DELAY.count()));
    
    return result;
}

UploadConfig UploadConfig::for_large_files() {
    UploadConfig config;
    config.chunk_size = 10ULL * 1024 * 1024;
    config.max_concurrent_parts = 5;
    config.max_retries = 5;
    return config;
}

UploadConfig UploadConfig::for_unreliable_network() {
    UploadConfig config;
    config.chunk_size = MIN_CHUNK_SIZE;
    config.max_concurrent_parts = 1;
    config.max_retries = 5;
    config.retry_delay = std::chrono::milliseconds(2000);
    return config;
}

UploadConfig UploadConfig::wifi_only() {
    UploadConfig config;
    config.default_constraints = UploadConstraints::wifi_only();
    return config;
}

UploadConfig UploadConfig::power_saving() {
    UploadConfig config;
    config.default_constraints = UploadConstraints::power_saving();
    return config;
}

}

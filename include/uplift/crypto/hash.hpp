#pragma once

#include "../core/result.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace uplift::crypto {

constexpr size_t CONTENT_DIGEST_SIZE = 32;

using ContentDigest = std::array<std::uint8_t, CONTENT_DIGEST_SIZE>;

// Incremental BLAKE2b over part bytes
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();
    
    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;
    
    core::UploadResult initialize();
    core::UploadResult update(std::span<const std::uint8_t> data);
    core::UploadResult finalize(ContentDigest& output);
    
    static core::UploadResult hash(std::span<const std::uint8_t> data, ContentDigest& output);
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {
    std::string to_hex(std::span<const std::uint8_t> bytes);
}

}

#include "uplift/crypto/hash.hpp"
#include "uplift/crypto/random.hpp"
#include <sodium.h>

namespace uplift::crypto {

struct ContentHasher::Impl {
    crypto_generichash_state state;
};

ContentHasher::ContentHasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

ContentHasher::~ContentHasher() = default;

core::UploadResult ContentHasher::initialize() {
    if (!SecureRandom::initialize()) {
        return core::UploadResult(core::UploadError::INVALID_STATE, "libsodium unavailable");
    }
    
    if (crypto_generichash_init(&impl_->state, nullptr, 0, CONTENT_DIGEST_SIZE) != 0) {
        return core::UploadResult(core::UploadError::INVALID_STATE, "Failed to initialize hasher");
    }
    
    initialized_ = true;
    return core::UploadResult();
}

core::UploadResult ContentHasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return core::UploadResult(core::UploadError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return core::UploadResult(core::UploadError::INVALID_STATE, "Failed to update hash");
    }
    
    return core::UploadResult();
}

core::UploadResult ContentHasher::finalize(ContentDigest& output) {
    if (!initialized_) {
        return core::UploadResult(core::UploadError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (crypto_generichash_final(&impl_->state, output.data(), output.size()) != 0) {
        return core::UploadResult(core::UploadError::INVALID_STATE, "Failed to finalize hash");
    }
    
    initialized_ = false; // Hasher is consumed
    return core::UploadResult();
}

core::UploadResult ContentHasher::hash(std::span<const std::uint8_t> data, ContentDigest& output) {
    ContentHasher hasher;
    
    auto result = hasher.initialize();
    if (!result) return result;
    
    result = hasher.update(data);
    if (!result) return result;
    
    return hasher.finalize(output);
}

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        out.push_back(hex[byte >> 4]);
        out.push_back(hex[byte & 0x0F]);
    }
    return out;
}

}

}

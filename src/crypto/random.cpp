#include "uplift/crypto/random.hpp"
#include "uplift/core/logger.hpp"
#include <sodium.h>
#include <array>
#include <stdexcept>

namespace uplift::crypto {

std::atomic<bool> SecureRandom::initialized_{false};

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }
    
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    
    initialized_ = true;
    LOG_DEBUG("Cryptographic random number generator initialized");
    return true;
}

core::UploadResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return core::UploadResult(core::UploadError::INVALID_STATE, "Random generator not initialized");
    }
    
    if (output.empty()) {
        return core::UploadResult(core::UploadError::INVALID_CONFIGURATION, "Output buffer is empty");
    }
    
    randombytes_buf(output.data(), output.size());
    return core::UploadResult();
}

std::string SecureRandom::generate_uuid() {
    std::array<std::uint8_t, 16> bytes{};
    auto result = generate_bytes(std::span(bytes));
    if (!result.success()) {
        throw std::runtime_error("Failed to generate session id: " + result.message);
    }
    
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);
    
    static constexpr char hex[] = "0123456789abcdef";
    std::string uuid;
    uuid.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            uuid.push_back('-');
        }
        uuid.push_back(hex[bytes[i] >> 4]);
        uuid.push_back(hex[bytes[i] & 0x0F]);
    }
    return uuid;
}

}

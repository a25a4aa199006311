#pragma once

#include "../core/result.hpp"
#include <atomic>
#include <cstdint>
#include <span>
#include <string>

namespace uplift::crypto {

class SecureRandom {
public:
    static bool initialize();
    
    static core::UploadResult generate_bytes(std::span<std::uint8_t> output);
    
    // Random (version 4) UUID in canonical 8-4-4-4-12 form
    static std::string generate_uuid();
    
private:
    static std::atomic<bool> initialized_;
};

}

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace uplift::transfer {

enum class NetworkType {
    NOT_REQUIRED,
    CONNECTED,
    UNMETERED,
    NOT_ROAMING,
    METERED
};

const char* to_string(NetworkType type);
std::optional<NetworkType> network_type_from_string(std::string_view value);

// What the host environment currently offers
struct EnvironmentState {
    bool connected = true;
    bool metered = false;
    bool roaming = false;
    bool charging = false;
    bool battery_low = false;
    bool storage_low = false;
};

struct UploadConstraints {
    static constexpr std::chrono::milliseconds DEFAULT_AUTO_RESUME_DELAY{2000};
    
    NetworkType network_type = NetworkType::CONNECTED;
    bool requires_charging = false;
    bool requires_battery_not_low = false;
    bool requires_storage_not_low = false;
    bool auto_resume_when_satisfied = true;
    std::chrono::milliseconds auto_resume_delay = DEFAULT_AUTO_RESUME_DELAY;
    
    bool is_satisfied_by(const EnvironmentState& state) const;
    bool is_valid() const { return auto_resume_delay.count() >= 0; }
    
    // One line summary for logs and the status command
    std::string describe() const;
    
    static UploadConstraints wifi_only();
    static UploadConstraints power_saving();
    static UploadConstraints low_priority();
    
    bool operator==(const UploadConstraints&) const = default;
};

}

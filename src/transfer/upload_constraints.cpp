#include "uplift/transfer/upload_constraints.hpp"
#include <sstream>

namespace uplift::transfer {

const char* to_string(NetworkType type) {
    switch (type) {
        case NetworkType::NOT_REQUIRED: return "NOT_REQUIRED";
        case NetworkType::CONNECTED: return "CONNECTED";
        case NetworkType::UNMETERED: return "UNMETERED";
        case NetworkType::NOT_ROAMING: return "NOT_ROAMING";
        case NetworkType::METERED: return "METERED";
    }
    return "CONNECTED";
}

std::optional<NetworkType> network_type_from_string(std::string_view value) {
    if (value == "NOT_REQUIRED") return NetworkType::NOT_REQUIRED;
    if (value == "CONNECTED") return NetworkType::CONNECTED;
    if (value == "UNMETERED") return NetworkType::UNMETERED;
    if (value == "NOT_ROAMING") return NetworkType::NOT_ROAMING;
    if (value == "METERED") return NetworkType::METERED;
    return std::nullopt;
}

bool UploadConstraints::is_satisfied_by(const EnvironmentState& state) const {
    switch (network_type) {
        case NetworkType::NOT_REQUIRED:
            break;
        case NetworkType::CONNECTED:
            if (!state.connected) return false;
            break;
        case NetworkType::UNMETERED:
            if (!state.connected || state.metered) return false;
            break;
        case NetworkType::NOT_ROAMING:
            if (!state.connected || state.roaming) return false;
            break;
        case NetworkType::METERED:
            if (!state.connected || !state.metered) return false;
            break;
    }
    
    if (requires_charging && !state.charging) return false;
    if (requires_battery_not_low && state.battery_low) return false;
    if (requires_storage_not_low && state.storage_low) return false;
    
    return true;
}

std::string UploadConstraints::describe() const {
    std::ostringstream oss;
    oss << "network=" << to_string(network_type);
    if (requires_charging) oss << " charging";
    if (requires_battery_not_low) oss << " battery-not-low";
    if (requires_storage_not_low) oss << " storage-not-low";
    oss << " auto-resume=" << (auto_resume_when_satisfied ? "on" : "off")
        << " delay=" << auto_resume_delay.count() << "ms";
    return oss.str();
}

UploadConstraints UploadConstraints::wifi_only() {
    UploadConstraints constraints;
    constraints.network_type = NetworkType::UNMETERED;
    return constraints;
}

UploadConstraints UploadConstraints::power_saving() {
    UploadConstraints constraints;
    constraints.network_type = NetworkType::UNMETERED;
    constraints.requires_charging = true;
    constraints.requires_battery_not_low = true;
    return constraints;
}

UploadConstraints UploadConstraints::low_priority() {
    UploadConstraints constraints;
    constraints.requires_battery_not_low = true;
    constraints.requires_storage_not_low = true;
    return constraints;
}

}

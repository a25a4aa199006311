#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace uplift::core::utils {

class StringUtils {
public:
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    
    static std::string format_bytes(uint64_t bytes);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::filesystem::path get_home_dir();
    
    // Replaces a leading "~" with the home directory
    static std::filesystem::path expand_user(const std::string& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static int64_t to_epoch_ms(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point from_epoch_ms(int64_t ms);
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
    static std::string format_timestamp(const std::chrono::system_clock::time_point& time);
};

}

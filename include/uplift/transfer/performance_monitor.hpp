#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace uplift::transfer {

struct SessionStats {
    std::string session_id;
    uint64_t total_bytes = 0;
    uint64_t bytes_transferred = 0;
    std::optional<uint64_t> current_speed_bps;
    std::optional<std::chrono::milliseconds> estimated_time_remaining;
};

// Sliding-window throughput per session, fed by finished part uploads
class PerformanceMonitor {
public:
    PerformanceMonitor();
    
    // Session management
    void start_session(const std::string& session_id, uint64_t total_bytes, uint64_t already_transferred = 0);
    void end_session(const std::string& session_id);
    
    // Data tracking
    void on_bytes_transferred(const std::string& session_id, uint64_t bytes);
    
    // Statistics retrieval
    SessionStats get_session_stats(const std::string& session_id) const;
    
    static constexpr std::chrono::seconds HISTORY_WINDOW{30};
    
private:
    struct SessionData {
        uint64_t total_bytes = 0;
        uint64_t bytes_transferred = 0;
        std::chrono::steady_clock::time_point start_time;
        std::deque<std::pair<std::chrono::steady_clock::time_point, uint64_t>> transfer_history;
    };
    
    std::unordered_map<std::string, SessionData> sessions_;
    mutable std::mutex mutex_;
    
    std::optional<uint64_t> calculate_speed(const SessionData& session,
                                            std::chrono::steady_clock::time_point now) const;
    void cleanup_old_history(SessionData& session, std::chrono::steady_clock::time_point now);
};

}

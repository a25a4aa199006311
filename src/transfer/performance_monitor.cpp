#include "uplift/transfer/performance_monitor.hpp"
#include <algorithm>

namespace uplift::transfer {

PerformanceMonitor::PerformanceMonitor() {
}

void PerformanceMonitor::start_session(const std::string& session_id, uint64_t total_bytes,
                                       uint64_t already_transferred) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    SessionData data;
    data.total_bytes = total_bytes;
    data.bytes_transferred = already_transferred;
    data.start_time = std::chrono::steady_clock::now();
    sessions_[session_id] = std::move(data);
}

void PerformanceMonitor::end_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
}

void PerformanceMonitor::on_bytes_transferred(const std::string& session_id, uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        auto& session = it->second;
        auto now = std::chrono::steady_clock::now();
        
        session.bytes_transferred = std::min(session.total_bytes, session.bytes_transferred + bytes);
        session.transfer_history.emplace_back(now, bytes);
        
        cleanup_old_history(session, now);
    }
}

SessionStats PerformanceMonitor::get_session_stats(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    SessionStats stats;
    stats.session_id = session_id;
    
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return stats;
    }
    
    const auto& session = it->second;
    stats.total_bytes = session.total_bytes;
    stats.bytes_transferred = session.bytes_transferred;
    stats.current_speed_bps = calculate_speed(session, std::chrono::steady_clock::now());
    
    if (stats.current_speed_bps && *stats.current_speed_bps > 0) {
        uint64_t remaining = session.total_bytes - session.bytes_transferred;
        stats.estimated_time_remaining = std::chrono::milliseconds(
            static_cast<int64_t>(remaining * 1000 / *stats.current_speed_bps));
    }
    
    return stats;
}

std::optional<uint64_t> PerformanceMonitor::calculate_speed(const SessionData& session,
                                                            std::chrono::steady_clock::time_point now) const {
    auto cutoff = now - HISTORY_WINDOW;
    
    uint64_t window_bytes = 0;
    for (const auto& [timestamp, bytes] : session.transfer_history) {
        if (timestamp >= cutoff) {
            window_bytes += bytes;
        }
    }
    
    if (window_bytes == 0) {
        return std::nullopt;
    }
    
    // Measure from whichever is later: the window start or the session start
    auto window_start = std::max(cutoff, session.start_time);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - window_start);
    if (elapsed.count() <= 0) {
        return std::nullopt;
    }
    
    return window_bytes * 1000 / static_cast<uint64_t>(elapsed.count());
}

void PerformanceMonitor::cleanup_old_history(SessionData& session, std::chrono::steady_clock::time_point now) {
    auto cutoff = now - HISTORY_WINDOW;
    
    while (!session.transfer_history.empty() && 
           session.transfer_history.front().first < cutoff) {
        session.transfer_history.pop_front();
    }
}

}

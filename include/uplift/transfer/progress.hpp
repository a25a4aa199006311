#pragma once

#include "performance_monitor.hpp"
#include "../storage/upload_records.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace uplift::transfer {

struct ProgressSnapshot {
    std::string session_id;
    std::string file_name;
    uint64_t total_bytes = 0;
    uint64_t uploaded_bytes = 0;
    uint32_t total_parts = 0;
    uint32_t uploaded_parts = 0;
    std::optional<uint32_t> current_part_number;
    double current_part_progress = 0.0;   // percent
    double overall_progress = 0.0;        // percent
    storage::SessionStatus status = storage::SessionStatus::PENDING;
    std::optional<uint64_t> bytes_per_second;
    std::optional<int64_t> eta_ms;
    std::optional<std::string> error_message;
    
    static ProgressSnapshot from_records(const storage::UploadSession& session,
                                         const std::vector<storage::UploadPart>& parts);
    
    void apply(const SessionStats& stats);
    
    std::string to_progress_string() const;
    std::string to_parts_string() const;
    std::optional<std::string> to_speed_string() const;
    std::optional<std::string> to_eta_string() const;
};

// Fan-out of snapshots to per-session and global observers
class ProgressHub {
public:
    using Observer = std::function<void(const ProgressSnapshot&)>;
    using Token = uint64_t;
    
    Token subscribe(const std::string& session_id, Observer observer);
    Token subscribe_all(Observer observer);
    void unsubscribe(Token token);
    
    // Observers run on the publishing thread, outside the hub lock
    void publish(const ProgressSnapshot& snapshot);
    
    size_t observer_count() const;
    
private:
    struct Subscription {
        std::optional<std::string> session_id;
        Observer observer;
    };
    
    std::map<Token, Subscription> subscriptions_;
    Token next_token_ = 1;
    mutable std::mutex mutex_;
};

}

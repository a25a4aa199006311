#include "uplift/transfer/progress.hpp"
#include "uplift/core/logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace uplift::transfer {

ProgressSnapshot ProgressSnapshot::from_records(const storage::UploadSession& session,
                                                const std::vector<storage::UploadPart>& parts) {
    ProgressSnapshot snapshot;
    snapshot.session_id = session.session_id;
    snapshot.file_name = session.file_name;
    snapshot.total_bytes = session.total_bytes;
    snapshot.total_parts = session.total_parts;
    snapshot.status = session.status;
    snapshot.error_message = session.error_message;
    
    for (const auto& part : parts) {
        if (part.status == storage::PartStatus::UPLOADED) {
            snapshot.uploaded_parts++;
            snapshot.uploaded_bytes += part.size();
        } else if (part.status == storage::PartStatus::UPLOADING && !snapshot.current_part_number) {
            snapshot.current_part_number = part.part_number;
        }
    }
    
    if (snapshot.total_bytes > 0) {
        snapshot.overall_progress = static_cast<double>(snapshot.uploaded_bytes) * 100.0 /
                                    static_cast<double>(snapshot.total_bytes);
    }
    if (session.status == storage::SessionStatus::COMPLETED) {
        snapshot.overall_progress = 100.0;
    }
    
    return snapshot;
}

void ProgressSnapshot::apply(const SessionStats& stats) {
    if (storage::is_terminal(status) || status == storage::SessionStatus::PAUSED) {
        return;
    }
    
    bytes_per_second = stats.current_speed_bps;
    if (bytes_per_second && *bytes_per_second > 0 && uploaded_bytes <= total_bytes) {
        eta_ms = static_cast<int64_t>((total_bytes - uploaded_bytes) * 1000 / *bytes_per_second);
    }
}

std::string ProgressSnapshot::to_progress_string() const {
    constexpr double mb = 1024.0 * 1024.0;
    return fmt::format("{:.1f} / {:.1f} MB ({:.1f}%)",
                       static_cast<double>(uploaded_bytes) / mb,
                       static_cast<double>(total_bytes) / mb,
                       overall_progress);
}

std::string ProgressSnapshot::to_parts_string() const {
    return fmt::format("{} / {} parts", uploaded_parts, total_parts);
}

std::optional<std::string> ProgressSnapshot::to_speed_string() const {
    if (!bytes_per_second) {
        return std::nullopt;
    }
    
    auto bps = *bytes_per_second;
    if (bps >= 1024 * 1024) {
        return fmt::format("{:.1f} MB/s", static_cast<double>(bps) / (1024.0 * 1024.0));
    }
    if (bps >= 1024) {
        return fmt::format("{:.1f} KB/s", static_cast<double>(bps) / 1024.0);
    }
    return fmt::format("{} B/s", bps);
}

std::optional<std::string> ProgressSnapshot::to_eta_string() const {
    if (!eta_ms) {
        return std::nullopt;
    }
    
    auto seconds = *eta_ms / 1000;
    if (seconds >= 3600) {
        return fmt::format("{}:{:02}:{:02}", seconds / 3600, (seconds % 3600) / 60, seconds % 60);
    }
    if (seconds >= 60) {
        return fmt::format("{}:{:02}", seconds / 60, seconds % 60);
    }
    return fmt::format("{}s", seconds);
}

ProgressHub::Token ProgressHub::subscribe(const std::string& session_id, Observer observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto token = next_token_++;
    subscriptions_[token] = Subscription{session_id, std::move(observer)};
    return token;
}

ProgressHub::Token ProgressHub::subscribe_all(Observer observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto token = next_token_++;
    subscriptions_[token] = Subscription{std::nullopt, std::move(observer)};
    return token;
}

void ProgressHub::unsubscribe(Token token) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(token);
}

void ProgressHub::publish(const ProgressSnapshot& snapshot) {
    std::vector<Observer> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [token, subscription] : subscriptions_) {
            if (!subscription.session_id || *subscription.session_id == snapshot.session_id) {
                targets.push_back(subscription.observer);
            }
        }
    }
    
    for (const auto& observer : targets) {
        try {
            observer(snapshot);
        } catch (const std::exception& e) {
            LOG_WARN("Progress observer for {} threw: {}", snapshot.session_id, e.what());
        }
    }
}

size_t ProgressHub::observer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

}

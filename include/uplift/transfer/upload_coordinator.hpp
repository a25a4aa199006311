#pragma once

#include "lifecycle_callbacks.hpp"
#include "part_uploader.hpp"
#include "performance_monitor.hpp"
#include "progress.hpp"
#include "storage_client.hpp"
#include "upload_config.hpp"
#include "../storage/upload_records.hpp"
#include "../storage/upload_store.hpp"
#include "../core/result.hpp"
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace uplift::transfer {

// Drives one session: dispatches parts onto the session's worker pool with at
// most max_concurrent_parts in flight, retries with backoff, and completes or
// fails the remote upload. The store is written before the in-memory mirror.
// Observers and callbacks are only invoked with no coordinator lock held.
class UploadCoordinator : public std::enable_shared_from_this<UploadCoordinator> {
public:
    UploadCoordinator(std::string session_id,
                      std::shared_ptr<storage::UploadStore> store,
                      std::shared_ptr<StorageClient> client,
                      const UploadConfig& config,
                      std::shared_ptr<boost::asio::thread_pool> workers,
                      ProgressHub& progress,
                      PerformanceMonitor& monitor,
                      std::shared_ptr<UploadLifecycleCallbacks> callbacks);
    ~UploadCoordinator();

    UploadCoordinator(const UploadCoordinator&) = delete;
    UploadCoordinator& operator=(const UploadCoordinator&) = delete;

    // Loads the session and starts dispatching if it is PENDING or IN_PROGRESS
    core::UploadResult attach();

    // attach() in two steps. load() reads the session and notifies nobody;
    // start() publishes what load() found and begins dispatching. A session
    // failed by load() is reported by the following start().
    core::UploadResult load();
    void start();

    // Control
    core::UploadResult pause(bool constraint_violation = false, const std::string& reason = "Paused by user");
    core::UploadResult resume();
    core::UploadResult cancel();

    // Constraint handling
    void on_constraints_violated(const std::string& reason);
    void on_constraints_satisfied();
    void set_constraints(const UploadConstraints& constraints);

    // Re-evaluates dispatch so parts orphaned by a dead process get reclaimed
    void reclaim_stale_parts();

    // True once the session is terminal, stalled, or paused with nothing in flight
    bool wait_until_settled(std::chrono::milliseconds timeout);

    // Stops scheduling new work; in-flight parts still record their results
    void shutdown();

    // State
    const std::string& session_id() const { return session_id_; }
    storage::SessionStatus status() const;
    bool is_terminal() const;
    bool is_stalled() const;
    // No worker task of this session is queued or running
    bool is_idle() const { return active_tasks_ == 0; }
    std::set<uint32_t> in_flight_parts() const;
    ProgressSnapshot snapshot() const;

private:
    struct Events {
        bool progress = false;
        bool resumed = false;
        std::optional<std::pair<std::string, bool>> paused;
        std::optional<std::pair<UploadOutcome, std::string>> finished;
        std::optional<RemoteUpload> orphaned_remote;
    };

    std::string session_id_;
    std::shared_ptr<storage::UploadStore> store_;
    std::shared_ptr<StorageClient> client_;
    UploadConfig config_;
    std::shared_ptr<boost::asio::thread_pool> workers_;
    ProgressHub& progress_;
    PerformanceMonitor& monitor_;
    std::shared_ptr<UploadLifecycleCallbacks> callbacks_;

    mutable std::mutex mutex_;
    std::condition_variable settled_cv_;
    std::atomic<bool> cancelled_;
    std::atomic<uint32_t> active_tasks_{0};
    Events pending_;

    storage::UploadSession session_;
    std::vector<storage::UploadPart> parts_;
    std::set<uint32_t> in_flight_;
    std::map<uint32_t, std::chrono::steady_clock::time_point> not_before_;

    bool attached_ = false;
    bool shutting_down_ = false;
    bool stalled_ = false;
    std::string stall_reason_;
    bool initiating_ = false;
    uint32_t initiate_failures_ = 0;
    std::optional<std::chrono::steady_clock::time_point> initiate_not_before_;
    bool completion_triggered_ = false;

    boost::asio::steady_timer retry_timer_;
    bool retry_timer_armed_ = false;
    std::chrono::steady_clock::time_point retry_deadline_;
    boost::asio::steady_timer completion_timer_;
    boost::asio::steady_timer auto_resume_timer_;
    bool auto_resume_armed_ = false;
    uint64_t constraint_generation_ = 0;

    // Worker entry points
    void run_initiate();
    void run_part(uint32_t part_number);
    void run_completion(uint32_t attempt);
    void on_retry_timer(std::chrono::steady_clock::time_point deadline);
    void on_auto_resume(uint64_t generation);

    // Helpers below expect mutex_ to be held
    void dispatch(Events& events);
    bool refresh_status(Events& events);
    void launch_part(storage::UploadPart& part, Events& events);
    void finish_part(uint32_t part_number, const core::UploadResult& result,
                     const PartReceipt& receipt, Events& events);
    void release_part(storage::UploadPart& part);
    void sync_part(storage::UploadPart& part);
    void fail_session(const std::string& reason, Events& events);
    void stall(const std::string& reason);
    void arm_retry_timer(std::chrono::steady_clock::time_point when);
    void cancel_timers();
    core::UploadResult resume_locked(bool automatic, Events& events);
    bool all_parts_uploaded() const;
    bool settled() const;
    ProgressSnapshot snapshot_locked() const;

    void post_task(std::function<void()> task);
    void emit(Events& events);
};

}

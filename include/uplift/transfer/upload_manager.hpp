#pragma once

#include "job_scheduler.hpp"
#include "lifecycle_callbacks.hpp"
#include "performance_monitor.hpp"
#include "progress.hpp"
#include "recovery_sweep.hpp"
#include "storage_client.hpp"
#include "upload_config.hpp"
#include "upload_constraints.hpp"
#include "upload_coordinator.hpp"
#include "../storage/upload_store.hpp"
#include "../core/result.hpp"
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace uplift::transfer {

// Entry point for applications: starts uploads, routes control calls to the
// coordinator owning each session, and recovers sessions after a restart.
// Every session runs on its own worker pool, so a session whose uploads are
// blocked on the network never holds up another.
class UploadManager {
public:
    // Answers whether the current environment satisfies a set of constraints
    using EnvironmentProbe = std::function<bool(const UploadConstraints&)>;

    UploadManager(std::shared_ptr<storage::UploadStore> store,
                  std::shared_ptr<StorageClient> client,
                  const UploadConfig& config = UploadConfig());
    ~UploadManager();

    UploadManager(const UploadManager&) = delete;
    UploadManager& operator=(const UploadManager&) = delete;

    // Session management
    core::UploadResult start(const std::filesystem::path& source, std::string& session_id);
    core::UploadResult start(const std::filesystem::path& source, const UploadConstraints& constraints,
                             std::string& session_id);

    // Transfer control
    core::UploadResult pause(const std::string& session_id);
    core::UploadResult resume(const std::string& session_id);
    core::UploadResult cancel(const std::string& session_id);

    // Progress
    core::UploadResult get_progress(const std::string& session_id, ProgressSnapshot& snapshot);
    ProgressHub::Token observe_progress(const std::string& session_id, ProgressHub::Observer observer);
    ProgressHub::Token observe_all(ProgressHub::Observer observer);
    void stop_observing(ProgressHub::Token token);

    // Recovery
    core::UploadResult recover_interrupted(std::set<std::string>& recovered);
    core::UploadResult cleanup_old_sessions(std::chrono::hours retention, size_t& removed);
    // The job captures this manager; cancel it before the manager goes away
    JobScheduler::JobId schedule_recovery(JobScheduler& scheduler, std::chrono::milliseconds interval,
                                          std::chrono::hours retention = RecoverySweep::DEFAULT_RETENTION);

    // Constraints
    void on_constraints_violated(const std::string& session_id, const std::string& reason);
    void on_constraints_satisfied(const std::string& session_id);
    core::UploadResult update_constraints(const UploadConstraints& constraints, bool apply_to_existing);
    core::UploadResult constraint_candidates(std::vector<storage::UploadSession>& sessions);

    // Configuration
    void set_lifecycle_callbacks(std::shared_ptr<UploadLifecycleCallbacks> callbacks);
    void set_environment_probe(EnvironmentProbe probe);
    const UploadConfig& config() const { return config_; }

    // Blocks until the session is terminal, stalled, or paused with nothing in flight
    bool wait_for(const std::string& session_id, std::chrono::milliseconds timeout);

    std::vector<std::string> active_sessions() const;

    void shutdown();

private:
    std::shared_ptr<storage::UploadStore> store_;
    std::shared_ptr<StorageClient> client_;
    UploadConfig config_;
    RecoverySweep sweep_;

    ProgressHub progress_;
    PerformanceMonitor monitor_;

    struct Lane {
        std::shared_ptr<boost::asio::thread_pool> workers;
        std::shared_ptr<UploadCoordinator> coordinator;
    };

    std::unordered_map<std::string, Lane> lanes_;
    // Finished or replaced sessions whose workers still need joining
    std::vector<Lane> retired_;
    mutable std::mutex coordinators_mutex_;
    std::mutex attach_mutex_;

    std::shared_ptr<UploadLifecycleCallbacks> callbacks_;
    std::shared_ptr<UploadLifecycleCallbacks> relay_;
    EnvironmentProbe probe_;
    mutable std::mutex settings_mutex_;

    std::atomic<bool> shut_down_{false};

    std::shared_ptr<UploadCoordinator> find_coordinator(const std::string& session_id) const;
    core::UploadResult find_or_attach(const std::string& session_id, std::shared_ptr<UploadCoordinator>& coordinator);
    // Like find_or_attach, but a coordinator created here is only loaded; the
    // caller must start() it when loaded comes back true
    core::UploadResult find_or_load(const std::string& session_id, std::shared_ptr<UploadCoordinator>& coordinator,
                                    bool& loaded);
    Lane make_lane(const std::string& session_id);
    void prune_finished();

    core::UploadResult reuse_existing(const storage::UploadSession& session, std::string& session_id);
    bool environment_allows(const UploadConstraints& constraints) const;
    std::shared_ptr<UploadLifecycleCallbacks> callbacks() const;
};

}

#include "uplift/transfer/upload_manager.hpp"
#include "uplift/storage/chunk_planner.hpp"
#include "uplift/storage/source_file.hpp"
#include "uplift/crypto/random.hpp"
#include "uplift/core/logger.hpp"
#include "uplift/core/utils.hpp"
#include <stdexcept>

namespace uplift::transfer {

using core::UploadError;
using core::UploadResult;
using core::utils::StringUtils;
using core::utils::TimeUtils;
using storage::SessionStatus;

namespace {

const UploadConfig& validated(const UploadConfig& config) {
    auto result = config.validate();
    if (!result) {
        throw std::invalid_argument(result.message);
    }
    return config;
}

// Workers of one session: parts block at most max_concurrent_parts of them,
// the extra one keeps timers and control work moving
size_t lane_size(const UploadConfig& config) {
    return static_cast<size_t>(config.max_concurrent_parts) + 1;
}

// Forwards coordinator events to whatever callbacks the manager holds now
class CallbackRelay : public UploadLifecycleCallbacks {
public:
    using Source = std::function<std::shared_ptr<UploadLifecycleCallbacks>()>;

    explicit CallbackRelay(Source source) : source_(std::move(source)) {}

    void on_upload_complete(const std::string& session_id, UploadOutcome outcome,
                            const std::string& message) override {
        if (auto target = source_()) {
            target->on_upload_complete(session_id, outcome, message);
        }
    }

    void on_upload_paused(const std::string& session_id, const std::string& reason,
                          bool is_constraint_violation) override {
        if (auto target = source_()) {
            target->on_upload_paused(session_id, reason, is_constraint_violation);
        }
    }

    void on_upload_resumed(const std::string& session_id) override {
        if (auto target = source_()) {
            target->on_upload_resumed(session_id);
        }
    }

private:
    Source source_;
};

std::string normalized_path(const std::filesystem::path& source) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(source, ec);
    if (ec) {
        return source.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

std::string unsatisfied_reason(const UploadConstraints& constraints) {
    return "Constraints not satisfied: " + constraints.describe();
}

}

UploadManager::UploadManager(std::shared_ptr<storage::UploadStore> store,
                             std::shared_ptr<StorageClient> client,
                             const UploadConfig& config)
    : store_(std::move(store))
    , client_(std::move(client))
    , config_(validated(config))
    , sweep_(store_, config.stale_upload_threshold)
{
    relay_ = std::make_shared<CallbackRelay>([this]() { return callbacks(); });
}

UploadManager::~UploadManager() {
    shutdown();

    std::lock_guard<std::mutex> lock(coordinators_mutex_);
    lanes_.clear();
    retired_.clear();
}

UploadResult UploadManager::start(const std::filesystem::path& source, std::string& session_id) {
    UploadConstraints constraints;
    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        constraints = config_.default_constraints;
    }
    return start(source, constraints, session_id);
}

UploadResult UploadManager::start(const std::filesystem::path& source, const UploadConstraints& constraints,
                                  std::string& session_id) {
    if (shut_down_) {
        return UploadResult(UploadError::INVALID_STATE, "Upload manager is shut down");
    }

    if (!constraints.is_valid()) {
        return UploadResult(UploadError::INVALID_CONFIGURATION, "Auto-resume delay must not be negative");
    }

    if (auto hooks = callbacks()) {
        auto decision = hooks->on_before_upload(source);
        if (!decision.proceed) {
            LOG_INFO("Upload of {} declined before start: {}", source.string(), decision.reason);
            return UploadResult(UploadError::CANCELLED, "Upload declined: " + decision.reason);
        }
    }

    auto source_path = normalized_path(source);

    storage::UploadSession existing;
    auto result = store_->find_active_session_for_source(source_path, existing);
    if (result) {
        return reuse_existing(existing, session_id);
    }
    if (result.error != UploadError::NOT_FOUND) {
        return result;
    }

    storage::SourceFile file(source_path);
    storage::SourceFingerprint fingerprint;
    result = file.fingerprint(fingerprint);
    if (!result) {
        return result;
    }

    if (fingerprint.size == 0) {
        return UploadResult(UploadError::INVALID_CONFIGURATION, "Source file is empty: " + source_path);
    }

    UploadConfig config;
    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        config = config_;
    }

    storage::ChunkPlanner planner(config.minimum_chunk_size);
    std::vector<storage::ByteRange> ranges;
    result = planner.plan(fingerprint.size, config.chunk_size, ranges);
    if (!result) {
        return result;
    }

    storage::UploadSession session;
    try {
        session.session_id = crypto::SecureRandom::generate_uuid();
    } catch (const std::exception& e) {
        return UploadResult(UploadError::INVALID_STATE, e.what());
    }

    auto now = TimeUtils::now();
    session.source_path = source_path;
    session.file_name = file.file_name();
    session.content_type = file.content_type();
    session.total_bytes = fingerprint.size;
    session.chunk_bytes = config.chunk_size;
    session.total_parts = static_cast<uint32_t>(ranges.size());
    session.status = SessionStatus::PENDING;
    session.constraints = constraints;
    session.max_retries = config.max_retries;
    session.fingerprint = fingerprint;
    session.created_at = now;
    session.updated_at = now;

    // Born paused when the environment already rules the upload out
    bool held_by_constraints = !environment_allows(constraints);
    if (held_by_constraints) {
        session.status = SessionStatus::PAUSED;
        session.auto_paused = true;
        session.pause_reason = unsatisfied_reason(constraints);
    }

    std::vector<storage::UploadPart> parts;
    parts.reserve(ranges.size());
    for (size_t i = 0; i < ranges.size(); ++i) {
        storage::UploadPart part;
        part.session_id = session.session_id;
        part.part_number = static_cast<uint32_t>(i + 1);
        part.range = ranges[i];
        parts.push_back(std::move(part));
    }

    result = store_->create_session(session, parts);
    if (!result) {
        return result;
    }

    LOG_INFO("Started upload {} of {} ({}, {} part(s) of {})", session.session_id, session.file_name,
             StringUtils::format_bytes(session.total_bytes), session.total_parts,
             StringUtils::format_bytes(session.chunk_bytes));

    std::shared_ptr<UploadCoordinator> coordinator;
    result = find_or_attach(session.session_id, coordinator);
    if (!result) {
        return result;
    }

    session_id = session.session_id;

    if (held_by_constraints) {
        LOG_INFO("Upload {} waiting for constraints ({})", session_id, constraints.describe());
        relay_->on_upload_paused(session_id, session.pause_reason, true);
    }

    return UploadResult();
}

UploadResult UploadManager::reuse_existing(const storage::UploadSession& session, std::string& session_id) {
    LOG_INFO("Reusing session {} for {} ({})", session.session_id, session.source_path,
             storage::to_string(session.status));

    std::shared_ptr<UploadCoordinator> coordinator;
    auto result = find_or_attach(session.session_id, coordinator);
    if (!result) {
        return result;
    }

    if (session.status == SessionStatus::PAUSED && !session.auto_paused) {
        result = coordinator->resume();
        if (!result) {
            return result;
        }
    }

    session_id = session.session_id;
    return UploadResult();
}

UploadResult UploadManager::pause(const std::string& session_id) {
    std::shared_ptr<UploadCoordinator> coordinator;
    bool loaded = false;
    auto result = find_or_load(session_id, coordinator, loaded);
    if (!result) {
        return result;
    }

    result = coordinator->pause(false, "Paused by user");
    if (loaded) {
        coordinator->start();
    }
    return result;
}

UploadResult UploadManager::resume(const std::string& session_id) {
    std::shared_ptr<UploadCoordinator> coordinator;
    auto result = find_or_attach(session_id, coordinator);
    if (!result) {
        return result;
    }
    return coordinator->resume();
}

UploadResult UploadManager::cancel(const std::string& session_id) {
    std::shared_ptr<UploadCoordinator> coordinator;
    bool loaded = false;
    auto result = find_or_load(session_id, coordinator, loaded);
    if (!result) {
        return result;
    }

    result = coordinator->cancel();
    if (loaded) {
        coordinator->start();
    }
    prune_finished();
    return result;
}

UploadResult UploadManager::get_progress(const std::string& session_id, ProgressSnapshot& snapshot) {
    if (auto coordinator = find_coordinator(session_id)) {
        snapshot = coordinator->snapshot();
        return UploadResult();
    }

    storage::UploadSession session;
    auto result = store_->get_session(session_id, session);
    if (!result) {
        return result;
    }

    std::vector<storage::UploadPart> parts;
    result = store_->get_parts(session_id, parts);
    if (!result) {
        return result;
    }

    snapshot = ProgressSnapshot::from_records(session, parts);
    snapshot.apply(monitor_.get_session_stats(session_id));
    return UploadResult();
}

ProgressHub::Token UploadManager::observe_progress(const std::string& session_id, ProgressHub::Observer observer) {
    return progress_.subscribe(session_id, std::move(observer));
}

ProgressHub::Token UploadManager::observe_all(ProgressHub::Observer observer) {
    return progress_.subscribe_all(std::move(observer));
}

void UploadManager::stop_observing(ProgressHub::Token token) {
    progress_.unsubscribe(token);
}

UploadResult UploadManager::recover_interrupted(std::set<std::string>& recovered) {
    recovered.clear();

    if (shut_down_) {
        return UploadResult(UploadError::INVALID_STATE, "Upload manager is shut down");
    }

    prune_finished();

    std::vector<std::shared_ptr<UploadCoordinator>> live;
    {
        std::lock_guard<std::mutex> lock(coordinators_mutex_);
        for (const auto& [id, lane] : lanes_) {
            live.push_back(lane.coordinator);
        }
    }
    for (const auto& coordinator : live) {
        if (!coordinator->is_stalled()) {
            coordinator->reclaim_stale_parts();
        }
    }

    auto is_live = [this](const std::string& session_id) {
        auto coordinator = find_coordinator(session_id);
        return coordinator && !coordinator->is_stalled() && !coordinator->is_terminal();
    };

    std::vector<RecoveryCandidate> candidates;
    auto result = sweep_.scan(is_live, candidates);
    if (!result) {
        return result;
    }

    for (const auto& candidate : candidates) {
        // A stalled coordinator gives way to a fresh one
        std::shared_ptr<UploadCoordinator> stale;
        {
            std::lock_guard<std::mutex> lock(coordinators_mutex_);
            auto it = lanes_.find(candidate.session_id);
            if (it != lanes_.end()) {
                stale = it->second.coordinator;
                retired_.push_back(std::move(it->second));
                lanes_.erase(it);
            }
        }
        if (stale) {
            stale->shutdown();
        }

        std::shared_ptr<UploadCoordinator> coordinator;
        auto attached = find_or_attach(candidate.session_id, coordinator);
        if (!attached) {
            LOG_WARN("Could not resume recovered upload {}: {}", candidate.session_id, attached.message);
            continue;
        }
        recovered.insert(candidate.session_id);
    }

    if (!recovered.empty()) {
        LOG_INFO("Recovered {} interrupted upload(s)", recovered.size());
    }
    return UploadResult();
}

UploadResult UploadManager::cleanup_old_sessions(std::chrono::hours retention, size_t& removed) {
    removed = 0;
    if (retention.count() < 0) {
        return UploadResult(UploadError::INVALID_CONFIGURATION, "Retention period must not be negative");
    }

    prune_finished();
    return sweep_.cleanup(retention, removed);
}

JobScheduler::JobId UploadManager::schedule_recovery(JobScheduler& scheduler, std::chrono::milliseconds interval,
                                                     std::chrono::hours retention) {
    return scheduler.schedule_periodic(interval, [this, retention]() {
        std::set<std::string> recovered;
        auto result = recover_interrupted(recovered);
        if (!result) {
            LOG_WARN("Scheduled recovery failed: {}", result.message);
        }

        size_t removed = 0;
        result = cleanup_old_sessions(retention, removed);
        if (!result) {
            LOG_WARN("Scheduled cleanup failed: {}", result.message);
        }
    });
}

void UploadManager::on_constraints_violated(const std::string& session_id, const std::string& reason) {
    auto coordinator = find_coordinator(session_id);
    if (coordinator && !coordinator->is_terminal()) {
        coordinator->on_constraints_violated(reason);
        return;
    }

    // Nobody is driving it here; only the stored state needs to change
    auto result = store_->pause_session(session_id, true, reason);
    if (result) {
        LOG_INFO("Paused upload {} ({})", session_id, reason);
        relay_->on_upload_paused(session_id, reason, true);
    } else if (result.error != UploadError::INVALID_STATE) {
        LOG_WARN("Could not pause {} for constraints: {}", session_id, result.message);
    }
}

void UploadManager::on_constraints_satisfied(const std::string& session_id) {
    storage::UploadSession session;
    auto result = store_->get_session(session_id, session);
    if (!result) {
        LOG_WARN("Constraint update for unknown session {}: {}", session_id, result.message);
        return;
    }

    if (session.status != SessionStatus::PAUSED || !session.auto_paused) {
        return;
    }

    std::shared_ptr<UploadCoordinator> coordinator;
    result = find_or_attach(session_id, coordinator);
    if (!result) {
        LOG_WARN("Could not attach {} for auto-resume: {}", session_id, result.message);
        return;
    }
    coordinator->on_constraints_satisfied();
}

UploadResult UploadManager::update_constraints(const UploadConstraints& constraints, bool apply_to_existing) {
    if (!constraints.is_valid()) {
        return UploadResult(UploadError::INVALID_CONFIGURATION, "Auto-resume delay must not be negative");
    }

    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        config_.default_constraints = constraints;
    }
    LOG_INFO("Default upload constraints now {}", constraints.describe());

    if (!apply_to_existing) {
        return UploadResult();
    }

    std::vector<storage::UploadSession> sessions;
    auto result = constraint_candidates(sessions);
    if (!result) {
        return result;
    }

    bool allowed = environment_allows(constraints);
    for (const auto& session : sessions) {
        result = store_->update_constraints(session.session_id, constraints);
        if (!result) {
            return result;
        }

        if (auto coordinator = find_coordinator(session.session_id)) {
            coordinator->set_constraints(constraints);
        }

        if (allowed) {
            on_constraints_satisfied(session.session_id);
        } else {
            on_constraints_violated(session.session_id, unsatisfied_reason(constraints));
        }
    }

    return UploadResult();
}

UploadResult UploadManager::constraint_candidates(std::vector<storage::UploadSession>& sessions) {
    return store_->query_sessions_by_statuses(
        {SessionStatus::PENDING, SessionStatus::IN_PROGRESS, SessionStatus::PAUSED}, sessions);
}

void UploadManager::set_lifecycle_callbacks(std::shared_ptr<UploadLifecycleCallbacks> callbacks) {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    callbacks_ = std::move(callbacks);
}

void UploadManager::set_environment_probe(EnvironmentProbe probe) {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    probe_ = std::move(probe);
}

bool UploadManager::wait_for(const std::string& session_id, std::chrono::milliseconds timeout) {
    if (auto coordinator = find_coordinator(session_id)) {
        return coordinator->wait_until_settled(timeout);
    }

    storage::UploadSession session;
    auto result = store_->get_session(session_id, session);
    return result && storage::is_terminal(session.status);
}

std::vector<std::string> UploadManager::active_sessions() const {
    std::lock_guard<std::mutex> lock(coordinators_mutex_);

    std::vector<std::string> ids;
    for (const auto& [id, lane] : lanes_) {
        if (!lane.coordinator->is_terminal()) {
            ids.push_back(id);
        }
    }
    return ids;
}

void UploadManager::shutdown() {
    std::vector<Lane> lanes;
    {
        std::lock_guard<std::mutex> attach_lock(attach_mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;

        std::lock_guard<std::mutex> lock(coordinators_mutex_);
        for (const auto& [id, lane] : lanes_) {
            lanes.push_back(lane);
        }
        lanes.insert(lanes.end(), retired_.begin(), retired_.end());
    }

    for (const auto& lane : lanes) {
        lane.coordinator->shutdown();
    }

    // Lets in-flight parts record their results
    for (const auto& lane : lanes) {
        if (lane.workers->get_executor().running_in_this_thread()) {
            LOG_WARN("Upload manager shut down from a worker of {}; not waiting for it",
                     lane.coordinator->session_id());
            continue;
        }
        lane.workers->join();
    }
    LOG_DEBUG("Upload manager stopped ({} session(s))", lanes.size());
}

std::shared_ptr<UploadCoordinator> UploadManager::find_coordinator(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(coordinators_mutex_);

    auto it = lanes_.find(session_id);
    if (it == lanes_.end()) {
        return nullptr;
    }
    return it->second.coordinator;
}

UploadResult UploadManager::find_or_attach(const std::string& session_id,
                                           std::shared_ptr<UploadCoordinator>& coordinator) {
    bool loaded = false;
    auto result = find_or_load(session_id, coordinator, loaded);
    if (result && loaded) {
        coordinator->start();
    }
    return result;
}

UploadResult UploadManager::find_or_load(const std::string& session_id,
                                         std::shared_ptr<UploadCoordinator>& coordinator, bool& loaded) {
    loaded = false;

    Lane created;
    UploadResult result;
    {
        std::lock_guard<std::mutex> attach_lock(attach_mutex_);

        if (auto existing = find_coordinator(session_id)) {
            coordinator = existing;
            return UploadResult();
        }

        if (shut_down_) {
            return UploadResult(UploadError::INVALID_STATE, "Upload manager is shut down");
        }

        created = make_lane(session_id);
        result = created.coordinator->load();
        if (result) {
            std::lock_guard<std::mutex> lock(coordinators_mutex_);
            lanes_[session_id] = created;
        }
    }

    if (!result) {
        // Publishes a failure recorded while loading
        created.coordinator->start();
        return result;
    }

    coordinator = created.coordinator;
    loaded = true;
    return UploadResult();
}

UploadManager::Lane UploadManager::make_lane(const std::string& session_id) {
    UploadConfig config;
    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        config = config_;
    }

    Lane lane;
    lane.workers = std::make_shared<boost::asio::thread_pool>(lane_size(config));
    lane.coordinator = std::make_shared<UploadCoordinator>(session_id, store_, client_, config, lane.workers,
                                                           progress_, monitor_, relay_);
    return lane;
}

void UploadManager::prune_finished() {
    std::vector<Lane> drained;
    {
        std::lock_guard<std::mutex> lock(coordinators_mutex_);

        for (auto it = lanes_.begin(); it != lanes_.end();) {
            if (it->second.coordinator->is_terminal()) {
                retired_.push_back(std::move(it->second));
                it = lanes_.erase(it);
            } else {
                ++it;
            }
        }

        // Idle lanes only, and never from one of their own workers
        for (auto it = retired_.begin(); it != retired_.end();) {
            if (it->coordinator->is_idle() && !it->workers->get_executor().running_in_this_thread()) {
                drained.push_back(std::move(*it));
                it = retired_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& lane : drained) {
        lane.workers->join();
    }
}

bool UploadManager::environment_allows(const UploadConstraints& constraints) const {
    EnvironmentProbe probe;
    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        probe = probe_;
    }
    return !probe || probe(constraints);
}

std::shared_ptr<UploadLifecycleCallbacks> UploadManager::callbacks() const {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return callbacks_;
}

}

#include "uplift/transfer/upload_coordinator.hpp"
#include "uplift/transfer/part_uploader.hpp"
#include "uplift/storage/chunk_planner.hpp"
#include "uplift/storage/source_file.hpp"
#include "uplift/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>

namespace uplift::transfer {

using core::UploadError;
using core::UploadResult;
using storage::PartStatus;
using storage::SessionStatus;

UploadCoordinator::UploadCoordinator(std::string session_id,
                                     std::shared_ptr<storage::UploadStore> store,
                                     std::shared_ptr<StorageClient> client,
                                     const UploadConfig& config,
                                     std::shared_ptr<boost::asio::thread_pool> workers,
                                     ProgressHub& progress,
                                     PerformanceMonitor& monitor,
                                     std::shared_ptr<UploadLifecycleCallbacks> callbacks)
    : session_id_(std::move(session_id))
    , store_(std::move(store))
    , client_(std::move(client))
    , config_(config)
    , workers_(std::move(workers))
    , progress_(progress)
    , monitor_(monitor)
    , callbacks_(std::move(callbacks))
    , cancelled_(false)
    , retry_timer_(workers_->get_executor())
    , completion_timer_(workers_->get_executor())
    , auto_resume_timer_(workers_->get_executor()) {
}

UploadCoordinator::~UploadCoordinator() = default;

UploadResult UploadCoordinator::attach() {
    auto result = load();
    start();
    return result;
}

UploadResult UploadCoordinator::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (attached_) {
        return UploadResult();
    }

    auto result = store_->get_session(session_id_, session_);
    if (!result) {
        return result;
    }

    result = store_->get_parts(session_id_, parts_);
    if (!result) {
        return result;
    }

    if (storage::is_terminal(session_.status)) {
        return UploadResult(UploadError::INVALID_STATE,
                            "Session " + session_id_ + " is already " + storage::to_string(session_.status));
    }

    storage::ChunkPlanner planner(config_.minimum_chunk_size);
    result = planner.verify_layout(session_, parts_);
    if (!result) {
        fail_session("Stored part layout is inconsistent: " + result.message, pending_);
        return UploadResult(UploadError::INVALID_STATE, result.message);
    }

    uint64_t uploaded = 0;
    for (const auto& part : parts_) {
        uploaded += part.uploaded_bytes();
    }
    monitor_.start_session(session_id_, session_.total_bytes, uploaded);

    if (session_.status == SessionStatus::PENDING) {
        result = store_->transition_session(session_id_, {SessionStatus::PENDING}, SessionStatus::IN_PROGRESS);
        if (!result) {
            return result;
        }
        session_.status = SessionStatus::IN_PROGRESS;
    }

    attached_ = true;
    pending_.progress = true;
    LOG_DEBUG("Coordinator attached to {} ({}, {} parts)", session_id_,
              storage::to_string(session_.status), parts_.size());
    return UploadResult();
}

void UploadCoordinator::start() {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(events, pending_);

        if (attached_ && session_.status == SessionStatus::IN_PROGRESS) {
            dispatch(events);
        }
    }
    emit(events);
}

UploadResult UploadCoordinator::pause(bool constraint_violation, const std::string& reason) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!attached_) {
            return UploadResult(UploadError::INVALID_STATE, "Session " + session_id_ + " is not attached");
        }

        if (session_.status == SessionStatus::PAUSED) {
            // A user pause overrides an automatic one so constraints cannot resume it
            if (!constraint_violation && session_.auto_paused) {
                auto result = store_->set_pause_state(session_id_, false, reason);
                if (!result) {
                    return result;
                }
                session_.auto_paused = false;
                session_.pause_reason = reason;
                ++constraint_generation_;
                auto_resume_timer_.cancel();
                auto_resume_armed_ = false;
            }
            return UploadResult();
        }

        if (session_.status != SessionStatus::IN_PROGRESS) {
            return UploadResult(UploadError::INVALID_STATE,
                                "Cannot pause a " + std::string(storage::to_string(session_.status)) + " session");
        }

        auto result = store_->pause_session(session_id_, constraint_violation, reason);
        if (!result) {
            return result;
        }

        session_.status = SessionStatus::PAUSED;
        session_.auto_paused = constraint_violation;
        session_.pause_reason = reason;

        retry_timer_.cancel();
        retry_timer_armed_ = false;
        ++constraint_generation_;

        events.progress = true;
        events.paused = std::make_pair(reason, constraint_violation);
        LOG_INFO("Paused upload {} ({}), {} part(s) still in flight", session_id_, reason, in_flight_.size());
    }
    emit(events);
    return UploadResult();
}

UploadResult UploadCoordinator::resume() {
    Events events;
    UploadResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = resume_locked(false, events);
    }
    emit(events);
    return result;
}

UploadResult UploadCoordinator::resume_locked(bool automatic, Events& events) {
    if (!attached_) {
        return UploadResult(UploadError::INVALID_STATE, "Session " + session_id_ + " is not attached");
    }

    if (session_.status != SessionStatus::PAUSED) {
        return UploadResult(UploadError::INVALID_STATE,
                            "Cannot resume a " + std::string(storage::to_string(session_.status)) + " session");
    }

    storage::SourceFile source(session_.source_path);
    auto result = source.verify(session_.fingerprint);
    if (!result) {
        fail_session(result.message, events);
        return result;
    }

    // Parts claimed by an earlier process that never reported back
    for (auto& part : parts_) {
        if (part.status == PartStatus::UPLOADING && !in_flight_.count(part.part_number)) {
            release_part(part);
        }
    }

    result = store_->transition_session(session_id_, {SessionStatus::PAUSED}, SessionStatus::IN_PROGRESS);
    if (!result) {
        return result;
    }

    session_.status = SessionStatus::IN_PROGRESS;
    session_.auto_paused = false;
    session_.pause_reason.clear();
    stalled_ = false;
    stall_reason_.clear();
    ++constraint_generation_;

    events.progress = true;
    events.resumed = true;
    LOG_INFO("Resumed upload {}{}", session_id_, automatic ? " (constraints satisfied)" : "");

    dispatch(events);
    return UploadResult();
}

UploadResult UploadCoordinator::cancel() {
    RemoteUpload remote;
    bool has_remote = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!attached_ && !storage::is_terminal(session_.status)) {
            return UploadResult(UploadError::INVALID_STATE, "Session " + session_id_ + " is not attached");
        }

        if (storage::is_terminal(session_.status)) {
            return UploadResult(UploadError::INVALID_STATE,
                                "Session " + session_id_ + " is already " + storage::to_string(session_.status));
        }

        cancelled_ = true;
        cancel_timers();

        has_remote = session_.has_remote_upload();
        remote = RemoteUpload{session_.remote_upload_id, session_.remote_path};
    }

    if (has_remote) {
        auto result = client_->abort(remote);
        if (!result) {
            LOG_WARN("Abort of remote upload {} failed: {}", remote.upload_id, result.message);
        }
    }

    Events events;
    UploadResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        result = store_->transition_session(session_id_,
                                            {SessionStatus::PENDING, SessionStatus::IN_PROGRESS, SessionStatus::PAUSED},
                                            SessionStatus::ABORTED);
        if (!result) {
            // Lost a race with completion or failure; report what the store holds
            if (result.error == UploadError::INVALID_STATE) {
                refresh_status(events);
            } else if (result.error == UploadError::PERSISTENCE) {
                stall(result.message);
            }
        } else {
            session_.status = SessionStatus::ABORTED;
            monitor_.end_session(session_id_);

            events.progress = true;
            events.finished = std::make_pair(UploadOutcome::CANCELLED, std::string("Upload cancelled"));
            LOG_INFO("Cancelled upload {}", session_id_);
        }
    }
    emit(events);
    return result;
}

void UploadCoordinator::on_constraints_violated(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        ++constraint_generation_;
        auto_resume_timer_.cancel();
        auto_resume_armed_ = false;

        if (session_.status != SessionStatus::IN_PROGRESS) {
            return;
        }
    }

    auto result = pause(true, reason);
    if (!result && result.error != UploadError::INVALID_STATE) {
        LOG_WARN("Could not pause {} for constraints: {}", session_id_, result.message);
    }
}

void UploadCoordinator::on_constraints_satisfied() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (session_.status != SessionStatus::PAUSED || !session_.auto_paused ||
        !session_.constraints.auto_resume_when_satisfied || auto_resume_armed_) {
        return;
    }

    auto generation = ++constraint_generation_;
    auto_resume_armed_ = true;

    LOG_DEBUG("Constraints satisfied for {}, resuming in {}ms", session_id_,
              session_.constraints.auto_resume_delay.count());

    auto_resume_timer_.expires_after(session_.constraints.auto_resume_delay);
    auto_resume_timer_.async_wait([self = shared_from_this(), generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        self->on_auto_resume(generation);
    });
}

void UploadCoordinator::on_auto_resume(uint64_t generation) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto_resume_armed_ = false;
        if (generation != constraint_generation_ || shutting_down_ ||
            session_.status != SessionStatus::PAUSED || !session_.auto_paused) {
            return;
        }

        auto result = resume_locked(true, events);
        if (!result) {
            LOG_WARN("Automatic resume of {} failed: {}", session_id_, result.message);
        }
    }
    emit(events);
}

void UploadCoordinator::set_constraints(const UploadConstraints& constraints) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.constraints = constraints;
}

void UploadCoordinator::reclaim_stale_parts() {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!attached_) {
            return;
        }
        dispatch(events);
    }
    emit(events);
}

bool UploadCoordinator::wait_until_settled(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return settled_cv_.wait_for(lock, timeout, [this] { return settled(); });
}

void UploadCoordinator::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    shutting_down_ = true;
    cancel_timers();
}

SessionStatus UploadCoordinator::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.status;
}

bool UploadCoordinator::is_terminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return storage::is_terminal(session_.status);
}

bool UploadCoordinator::is_stalled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stalled_;
}

std::set<uint32_t> UploadCoordinator::in_flight_parts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

ProgressSnapshot UploadCoordinator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked();
}

ProgressSnapshot UploadCoordinator::snapshot_locked() const {
    auto snapshot = ProgressSnapshot::from_records(session_, parts_);
    snapshot.apply(monitor_.get_session_stats(session_id_));
    if (stalled_ && !snapshot.error_message) {
        snapshot.error_message = stall_reason_;
    }
    return snapshot;
}

void UploadCoordinator::run_initiate() {
    SourceMetadata metadata;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metadata.file_name = session_.file_name;
        metadata.content_type = session_.content_type;
        metadata.file_size = session_.total_bytes;
    }

    RemoteUpload remote;
    UploadResult result;
    try {
        result = client_->initiate(metadata, remote);
    } catch (const std::exception& e) {
        result = UploadResult(UploadError::PERMANENT_REJECTION, std::string("Initiate threw: ") + e.what());
    }

    Events events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        initiating_ = false;

        if (cancelled_ || storage::is_terminal(session_.status)) {
            if (result) {
                events.orphaned_remote = remote;
            }
        } else if (result) {
            auto stored = store_->set_remote_upload(session_id_, remote.upload_id, remote.remote_path);
            if (!stored) {
                if (stored.error == UploadError::PERSISTENCE) {
                    stall(stored.message);
                } else {
                    fail_session("Could not record remote upload: " + stored.message, events);
                }
            } else {
                session_.remote_upload_id = remote.upload_id;
                session_.remote_path = remote.remote_path;
                initiate_failures_ = 0;
                initiate_not_before_.reset();
                LOG_INFO("Initiated remote upload {} for {}", remote.upload_id, session_id_);
                dispatch(events);
            }
        } else {
            ++initiate_failures_;
            if (result.is_retryable() && initiate_failures_ <= static_cast<uint32_t>(config_.max_retries)) {
                auto delay = config_.retry_delay_for(initiate_failures_);
                LOG_WARN("Initiate for {} failed ({}), retrying in {}ms", session_id_, result.message, delay.count());
                initiate_not_before_ = std::chrono::steady_clock::now() + delay;
                dispatch(events);
            } else {
                fail_session("Failed to initiate upload: " + result.message, events);
            }
        }
    }
    emit(events);
}

void UploadCoordinator::run_part(uint32_t part_number) {
    storage::UploadSession session;
    storage::UploadPart part;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = session_;
        part = parts_[part_number - 1];
    }

    PartReceipt receipt;
    UploadResult result;
    try {
        PartUploader uploader(*client_, config_.part_timeout);
        result = uploader.upload(session, part, cancelled_, receipt);
    } catch (const std::exception& e) {
        result = UploadResult(UploadError::PERMANENT_REJECTION, std::string("Part upload threw: ") + e.what());
    }

    if (result) {
        monitor_.on_bytes_transferred(session_id_, receipt.bytes_sent);
    }

    Events events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finish_part(part_number, result, receipt, events);
        dispatch(events);
    }
    emit(events);
}

void UploadCoordinator::run_completion(uint32_t attempt) {
    RemoteUpload remote;
    std::vector<CompletedPart> completed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || storage::is_terminal(session_.status)) {
            return;
        }

        remote = RemoteUpload{session_.remote_upload_id, session_.remote_path};
        for (const auto& part : parts_) {
            completed.push_back(CompletedPart{part.part_number, part.integrity_token.value_or("")});
        }
    }

    UploadResult result;
    try {
        result = client_->complete(remote, completed);
    } catch (const std::exception& e) {
        result = UploadResult(UploadError::PERMANENT_REJECTION, std::string("Complete threw: ") + e.what());
    }

    Events events;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (cancelled_ || storage::is_terminal(session_.status)) {
            LOG_DEBUG("Discarding completion result for {}", session_id_);
        } else if (result) {
            auto stored = store_->transition_session(session_id_,
                                                     {SessionStatus::IN_PROGRESS, SessionStatus::PAUSED},
                                                     SessionStatus::COMPLETED);
            if (!stored) {
                if (stored.error == UploadError::PERSISTENCE) {
                    stall(stored.message);
                } else {
                    refresh_status(events);
                }
            } else {
                session_.status = SessionStatus::COMPLETED;
                monitor_.end_session(session_id_);
                cancel_timers();
                events.progress = true;
                events.finished = std::make_pair(UploadOutcome::COMPLETED, std::string("Upload completed"));
                LOG_INFO("Completed upload {} ({} parts)", session_id_, parts_.size());
            }
        } else if (attempt == 0) {
            auto delay = config_.retry_delay_for(1);
            LOG_WARN("Completing {} failed ({}), retrying in {}ms", session_id_, result.message, delay.count());

            ++active_tasks_;
            completion_timer_.expires_after(delay);
            completion_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    self->run_completion(1);
                }
                --self->active_tasks_;
            });
        } else {
            fail_session("Failed to complete upload: " + result.message, events);
        }
    }
    emit(events);
}

void UploadCoordinator::on_retry_timer(std::chrono::steady_clock::time_point deadline) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // A wait re-armed for another deadline still owns the flag
        if (retry_timer_armed_ && retry_deadline_ == deadline) {
            retry_timer_armed_ = false;
        }
        dispatch(events);
    }
    emit(events);
}

void UploadCoordinator::dispatch(Events& events) {
    if (!attached_ || shutting_down_ || cancelled_ || stalled_) {
        return;
    }

    if (!refresh_status(events) || session_.status != SessionStatus::IN_PROGRESS) {
        return;
    }

    auto now = std::chrono::steady_clock::now();

    if (!session_.has_remote_upload()) {
        if (initiating_) {
            return;
        }
        if (initiate_not_before_ && *initiate_not_before_ > now) {
            arm_retry_timer(*initiate_not_before_);
            return;
        }
        initiating_ = true;
        post_task([this] { run_initiate(); });
        return;
    }

    if (all_parts_uploaded()) {
        if (!completion_triggered_) {
            completion_triggered_ = true;
            post_task([this] { run_completion(0); });
        }
        return;
    }

    auto wall_now = std::chrono::system_clock::now();
    std::optional<std::chrono::steady_clock::time_point> wake;
    auto limit = static_cast<size_t>(config_.max_concurrent_parts);

    for (auto& part : parts_) {
        if (in_flight_.size() >= limit) {
            break;
        }

        if (in_flight_.count(part.part_number)) {
            continue;
        }

        if (part.status == PartStatus::UPLOADING) {
            // Claimed but not ours: only reclaim once its last attempt looks abandoned
            auto stale_at = part.last_attempt_at.value_or(wall_now) + config_.stale_upload_threshold;
            if (!part.last_attempt_at || stale_at <= wall_now) {
                LOG_INFO("Reclaiming stale part {} of {}", part.part_number, session_id_);
                release_part(part);
                if (stalled_) {
                    return;
                }
            } else {
                auto at = now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(stale_at - wall_now);
                wake = wake ? std::min(*wake, at) : at;
                continue;
            }
        }

        if (part.status != PartStatus::PENDING) {
            continue;
        }

        auto backoff = not_before_.find(part.part_number);
        if (backoff != not_before_.end() && backoff->second > now) {
            wake = wake ? std::min(*wake, backoff->second) : backoff->second;
            continue;
        }

        launch_part(part, events);
        if (stalled_) {
            return;
        }
    }

    if (wake && in_flight_.size() < limit) {
        arm_retry_timer(*wake);
    }
}

bool UploadCoordinator::refresh_status(Events& events) {
    storage::UploadSession stored;
    auto result = store_->get_session(session_id_, stored);
    if (!result) {
        if (result.error == UploadError::PERSISTENCE) {
            stall(result.message);
        } else {
            LOG_WARN("Session {} disappeared from the store: {}", session_id_, result.message);
            cancelled_ = true;
            cancel_timers();
        }
        return false;
    }

    if (stored.status == session_.status) {
        return true;
    }

    // Another process changed the session underneath us
    LOG_INFO("Session {} changed externally: {} -> {}", session_id_,
             storage::to_string(session_.status), storage::to_string(stored.status));

    session_.status = stored.status;
    session_.auto_paused = stored.auto_paused;
    session_.pause_reason = stored.pause_reason;
    session_.error_message = stored.error_message;
    events.progress = true;

    if (storage::is_terminal(stored.status)) {
        cancelled_ = true;
        cancel_timers();
        monitor_.end_session(session_id_);

        UploadOutcome outcome = stored.status == SessionStatus::COMPLETED ? UploadOutcome::COMPLETED
                              : stored.status == SessionStatus::ABORTED ? UploadOutcome::CANCELLED
                              : UploadOutcome::FAILED;
        events.finished = std::make_pair(outcome, stored.error_message.value_or(storage::to_string(stored.status)));
    }
    return true;
}

void UploadCoordinator::launch_part(storage::UploadPart& part, Events& events) {
    auto attempt_at = std::chrono::system_clock::now();

    storage::PartUpdate update;
    update.status = PartStatus::UPLOADING;
    update.last_attempt_at = attempt_at;

    auto result = store_->update_part_status(session_id_, part.part_number, update, PartStatus::PENDING);
    if (!result) {
        if (result.error == UploadError::PERSISTENCE) {
            stall(result.message);
        } else {
            LOG_WARN("Could not claim part {} of {}: {}", part.part_number, session_id_, result.message);
            sync_part(part);
        }
        return;
    }

    part.status = PartStatus::UPLOADING;
    part.last_attempt_at = attempt_at;
    in_flight_.insert(part.part_number);
    not_before_.erase(part.part_number);
    events.progress = true;

    LOG_DEBUG("Launching part {} of {} (attempt {})", part.part_number, session_id_, part.retry_count + 1);

    auto part_number = part.part_number;
    post_task([this, part_number] { run_part(part_number); });
}

void UploadCoordinator::finish_part(uint32_t part_number, const UploadResult& result,
                                    const PartReceipt& receipt, Events& events) {
    in_flight_.erase(part_number);
    auto& part = parts_[part_number - 1];

    if (cancelled_ || storage::is_terminal(session_.status)) {
        LOG_DEBUG("Discarding result of part {} for {}", part_number, session_id_);
        release_part(part);
        return;
    }

    std::optional<std::string> digest;
    if (part.content_digest.empty() && !receipt.content_digest.empty()) {
        digest = receipt.content_digest;
    }

    if (result) {
        storage::PartUpdate update;
        update.status = PartStatus::UPLOADED;
        update.integrity_token = receipt.integrity_token;
        update.content_digest = digest;

        auto stored = store_->update_part_status(session_id_, part_number, update, PartStatus::UPLOADING);
        if (!stored) {
            if (stored.error == UploadError::PERSISTENCE) {
                stall(stored.message);
            } else {
                LOG_WARN("Part {} of {} changed while uploading: {}", part_number, session_id_, stored.message);
                sync_part(part);
            }
            return;
        }

        part.status = PartStatus::UPLOADED;
        part.integrity_token = receipt.integrity_token;
        if (digest) {
            part.content_digest = *digest;
        }
        events.progress = true;
        LOG_DEBUG("Part {} of {} uploaded", part_number, session_id_);
        return;
    }

    if (result.error == UploadError::CANCELLED) {
        release_part(part);
        return;
    }

    auto retry_count = part.retry_count + 1;
    bool retryable = result.is_retryable() && retry_count <= static_cast<uint32_t>(session_.max_retries);

    storage::PartUpdate update;
    update.status = retryable || result.error == UploadError::SOURCE_READ ? PartStatus::PENDING : PartStatus::FAILED;
    update.retry_count = retry_count;
    update.content_digest = digest;

    auto stored = store_->update_part_status(session_id_, part_number, update, PartStatus::UPLOADING);
    if (!stored) {
        if (stored.error == UploadError::PERSISTENCE) {
            stall(stored.message);
        } else {
            LOG_WARN("Part {} of {} changed while uploading: {}", part_number, session_id_, stored.message);
            sync_part(part);
        }
        return;
    }

    part.status = update.status;
    part.retry_count = retry_count;
    part.integrity_token.reset();
    if (digest) {
        part.content_digest = *digest;
    }
    events.progress = true;

    if (result.error == UploadError::SOURCE_READ) {
        fail_session(result.message, events);
        return;
    }

    if (retryable) {
        auto delay = config_.retry_delay_for(retry_count);
        not_before_[part_number] = std::chrono::steady_clock::now() + delay;
        LOG_WARN("Part {} of {} failed ({}), retry {}/{} in {}ms", part_number, session_id_,
                 result.message, retry_count, session_.max_retries, delay.count());
        return;
    }

    fail_session("Part " + std::to_string(part_number) + " failed after " + std::to_string(retry_count) +
                 " attempt(s): " + result.message, events);
}

void UploadCoordinator::release_part(storage::UploadPart& part) {
    if (part.status != PartStatus::UPLOADING) {
        return;
    }

    storage::PartUpdate update;
    update.status = PartStatus::PENDING;

    auto result = store_->update_part_status(session_id_, part.part_number, update, PartStatus::UPLOADING);
    if (!result) {
        if (result.error == UploadError::PERSISTENCE) {
            stall(result.message);
        } else {
            sync_part(part);
        }
        return;
    }

    part.status = PartStatus::PENDING;
    part.integrity_token.reset();
}

void UploadCoordinator::sync_part(storage::UploadPart& part) {
    std::vector<storage::UploadPart> stored;
    auto result = store_->get_parts(session_id_, stored);
    if (!result) {
        if (result.error == UploadError::PERSISTENCE) {
            stall(result.message);
        }
        return;
    }

    for (auto& candidate : stored) {
        if (candidate.part_number == part.part_number) {
            part = std::move(candidate);
            return;
        }
    }
}

void UploadCoordinator::fail_session(const std::string& reason, Events& events) {
    cancelled_ = true;
    cancel_timers();

    auto result = store_->transition_session(session_id_,
                                             {SessionStatus::PENDING, SessionStatus::IN_PROGRESS, SessionStatus::PAUSED},
                                             SessionStatus::FAILED, reason);
    if (!result) {
        if (result.error == UploadError::PERSISTENCE) {
            stall(result.message);
        } else {
            refresh_status(events);
        }
        return;
    }

    session_.status = SessionStatus::FAILED;
    session_.error_message = reason;
    monitor_.end_session(session_id_);

    events.progress = true;
    events.finished = std::make_pair(UploadOutcome::FAILED, reason);
    LOG_ERROR("Upload {} failed: {}", session_id_, reason);
}

void UploadCoordinator::stall(const std::string& reason) {
    if (!stalled_) {
        LOG_ERROR("Upload {} stalled on a store failure, leaving it for recovery: {}", session_id_, reason);
    }
    stalled_ = true;
    stall_reason_ = reason;
    cancel_timers();
}

void UploadCoordinator::arm_retry_timer(std::chrono::steady_clock::time_point when) {
    if (retry_timer_armed_ && retry_deadline_ <= when) {
        return;
    }

    retry_timer_armed_ = true;
    retry_deadline_ = when;
    retry_timer_.expires_at(when);
    retry_timer_.async_wait([self = shared_from_this(), when](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        self->on_retry_timer(when);
    });
}

void UploadCoordinator::cancel_timers() {
    retry_timer_.cancel();
    retry_timer_armed_ = false;
    completion_timer_.cancel();
    auto_resume_timer_.cancel();
    auto_resume_armed_ = false;
}

bool UploadCoordinator::all_parts_uploaded() const {
    return !parts_.empty() && std::all_of(parts_.begin(), parts_.end(), [](const storage::UploadPart& part) {
        return part.status == PartStatus::UPLOADED;
    });
}

bool UploadCoordinator::settled() const {
    if (storage::is_terminal(session_.status) || stalled_) {
        return true;
    }
    return session_.status == SessionStatus::PAUSED && in_flight_.empty();
}

void UploadCoordinator::post_task(std::function<void()> task) {
    ++active_tasks_;
    boost::asio::post(*workers_, [self = shared_from_this(), task = std::move(task)] {
        task();
        --self->active_tasks_;
    });
}

void UploadCoordinator::emit(Events& events) {
    if (events.orphaned_remote) {
        auto result = client_->abort(*events.orphaned_remote);
        if (!result) {
            LOG_WARN("Abort of orphaned remote upload {} failed: {}", events.orphaned_remote->upload_id, result.message);
        }
    }

    if (events.progress) {
        progress_.publish(snapshot());
    }

    if (callbacks_) {
        if (events.paused) {
            callbacks_->on_upload_paused(session_id_, events.paused->first, events.paused->second);
        }
        if (events.resumed) {
            callbacks_->on_upload_resumed(session_id_);
        }
        if (events.finished) {
            callbacks_->on_upload_complete(session_id_, events.finished->first, events.finished->second);
        }
    }

    settled_cv_.notify_all();
}

}

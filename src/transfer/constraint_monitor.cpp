#include "uplift/transfer/constraint_monitor.hpp"
#include "uplift/core/logger.hpp"

namespace uplift::transfer {

using core::UploadResult;
using storage::SessionStatus;

ConstraintMonitor::ConstraintMonitor(UploadManager& manager, const EnvironmentState& initial)
    : manager_(manager), state_(initial) {
    manager_.set_environment_probe([this](const UploadConstraints& constraints) {
        return allows(constraints);
    });
}

ConstraintMonitor::~ConstraintMonitor() {
    manager_.set_environment_probe(nullptr);
}

UploadResult ConstraintMonitor::update(const EnvironmentState& state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = state;
    }

    LOG_DEBUG("Environment changed: connected={} metered={} roaming={} charging={} battery_low={} storage_low={}",
              state.connected, state.metered, state.roaming, state.charging, state.battery_low, state.storage_low);

    std::vector<storage::UploadSession> sessions;
    auto result = manager_.constraint_candidates(sessions);
    if (!result) {
        return result;
    }

    for (const auto& session : sessions) {
        apply(session, state);
    }
    return UploadResult();
}

UploadResult ConstraintMonitor::evaluate(const std::string& session_id) {
    std::vector<storage::UploadSession> sessions;
    auto result = manager_.constraint_candidates(sessions);
    if (!result) {
        return result;
    }

    auto state = current();
    for (const auto& session : sessions) {
        if (session.session_id == session_id) {
            apply(session, state);
            return UploadResult();
        }
    }

    return UploadResult(core::UploadError::NOT_FOUND, "No active session " + session_id);
}

EnvironmentState ConstraintMonitor::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConstraintMonitor::allows(const UploadConstraints& constraints) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return constraints.is_satisfied_by(state_);
}

void ConstraintMonitor::apply(const storage::UploadSession& session, const EnvironmentState& state) {
    if (session.constraints.is_satisfied_by(state)) {
        if (session.status == SessionStatus::PAUSED && session.auto_paused) {
            manager_.on_constraints_satisfied(session.session_id);
        }
        return;
    }

    // Also reaches paused sessions so a pending auto-resume is called off
    manager_.on_constraints_violated(session.session_id,
                                     "Constraints not satisfied: " + session.constraints.describe());
}

}

#pragma once

#include "upload_constraints.hpp"
#include "upload_manager.hpp"
#include "../core/result.hpp"
#include <mutex>
#include <string>

namespace uplift::transfer {

// Turns environment changes (network, power, storage) into pause and resume
// calls for every session whose constraints they affect
class ConstraintMonitor {
public:
    explicit ConstraintMonitor(UploadManager& manager, const EnvironmentState& initial = EnvironmentState());
    ~ConstraintMonitor();

    ConstraintMonitor(const ConstraintMonitor&) = delete;
    ConstraintMonitor& operator=(const ConstraintMonitor&) = delete;

    // Records the new state and re-evaluates every non-terminal session
    core::UploadResult update(const EnvironmentState& state);

    // Re-evaluates one session against the last known state
    core::UploadResult evaluate(const std::string& session_id);

    EnvironmentState current() const;
    bool allows(const UploadConstraints& constraints) const;

private:
    UploadManager& manager_;
    EnvironmentState state_;
    mutable std::mutex mutex_;

    void apply(const storage::UploadSession& session, const EnvironmentState& state);
};

}

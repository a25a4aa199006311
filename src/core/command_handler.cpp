#include "uplift/core/command_handler.hpp"
#include "uplift/core/logger.hpp"
#include "uplift/core/config.hpp"
#include "uplift/core/utils.hpp"
#include "uplift/network/http_storage_client.hpp"
#include "uplift/storage/upload_store.hpp"
#include "uplift/transfer/job_scheduler.hpp"
#include "uplift/transfer/recovery_sweep.hpp"
#include "uplift/transfer/upload_config.hpp"
#include "uplift/transfer/upload_manager.hpp"
#include <algorithm>
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

namespace uplift::core {

using storage::SessionStatus;
using storage::UploadStore;
using transfer::ProgressSnapshot;
using transfer::UploadManager;
using utils::FileUtils;
using utils::StringUtils;
using utils::TimeUtils;

namespace {

constexpr std::chrono::milliseconds WAIT_INTERVAL{500};

std::atomic<bool> interrupted{false};
std::mutex output_mutex;

void interrupt_handler(int) {
    interrupted = true;
}

struct UploadEngine {
    std::shared_ptr<UploadStore> store;
    std::unique_ptr<UploadManager> manager;
};

CommandResult open_store(std::shared_ptr<UploadStore>& store) {
    auto& config = Config::instance();
    auto path = FileUtils::expand_user(config.get_string("store.database", "~/.uplift/uplift.db"));

    if (path.has_parent_path() && !FileUtils::create_directories(path.parent_path())) {
        return CommandResult::error("Cannot create directory for " + path.string());
    }

    store = std::make_shared<UploadStore>(path);
    if (!store->initialize()) {
        return CommandResult::error("Failed to open upload database: " + path.string());
    }

    LOG_DEBUG("Using upload database {}", path.string());
    return CommandResult::ok();
}

CommandResult open_engine(UploadEngine& engine) {
    auto result = open_store(engine.store);
    if (!result.success) {
        return result;
    }

    auto& config = Config::instance();
    auto client = network::HttpStorageClient::from_config(config);
    if (!client->endpoints().is_valid()) {
        return CommandResult::error("No upload backend configured. Set backend.base_url or pass --base-url");
    }

    engine.manager = std::make_unique<UploadManager>(engine.store, client,
                                                     transfer::UploadConfig::from_config(config));
    return CommandResult::ok();
}

std::chrono::hours retention_from_config() {
    auto days = Config::instance().get_int("recovery.retention_days", 7);
    return std::chrono::hours(24 * std::max(days, 0));
}

void print_progress(const ProgressSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << "\r  " << snapshot.file_name << ": " << snapshot.to_progress_string()
              << "  " << snapshot.to_parts_string();
    if (auto speed = snapshot.to_speed_string()) {
        std::cout << "  " << *speed;
    }
    if (auto eta = snapshot.to_eta_string()) {
        std::cout << "  ETA " << *eta;
    }
    std::cout << "    " << std::flush;
}

bool report_outcome(UploadStore& store, const std::string& session_id) {
    storage::UploadSession session;
    auto result = store.get_session(session_id, session);

    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << "\n";
    if (!result) {
        std::cout << "✗ " << session_id << ": " << result.message << "\n";
        return false;
    }

    switch (session.status) {
        case SessionStatus::COMPLETED:
            std::cout << "✓ Uploaded " << session.file_name << " to " << session.remote_path << "\n";
            return true;
        case SessionStatus::PAUSED:
            std::cout << "Paused " << session.file_name << ". Continue with 'uplift resume "
                      << session_id << "'\n";
            return true;
        case SessionStatus::FAILED:
            std::cout << "✗ Upload of " << session.file_name << " failed: "
                      << session.error_message.value_or("unknown error") << "\n";
            return false;
        case SessionStatus::ABORTED:
            std::cout << "✗ Upload of " << session.file_name << " was cancelled\n";
            return false;
        default:
            std::cout << "✗ Upload of " << session.file_name
                      << " stopped making progress. Run 'uplift recover' to pick it up again\n";
            return false;
    }
}

// Blocks until every session settles. Ctrl+C pauses them; parts already in
// flight are allowed to finish.
CommandResult follow_uploads(UploadEngine& engine, const std::vector<std::string>& session_ids) {
    auto& manager = *engine.manager;

    std::vector<transfer::ProgressHub::Token> tokens;
    for (const auto& id : session_ids) {
        tokens.push_back(manager.observe_progress(id, print_progress));
    }

    transfer::AsioJobScheduler scheduler;
    scheduler.start();
    auto recovery_job = manager.schedule_recovery(scheduler, manager.config().stale_upload_threshold,
                                                  retention_from_config());

    interrupted = false;
    auto previous_handler = std::signal(SIGINT, interrupt_handler);
    bool pause_requested = false;

    std::set<std::string> pending(session_ids.begin(), session_ids.end());
    while (!pending.empty()) {
        for (auto it = pending.begin(); it != pending.end();) {
            if (manager.wait_for(*it, WAIT_INTERVAL / static_cast<int64_t>(pending.size()))) {
                it = pending.erase(it);
            } else {
                ++it;
            }
        }

        if (interrupted && !pause_requested) {
            pause_requested = true;
            {
                std::lock_guard<std::mutex> lock(output_mutex);
                std::cout << "\nPausing, letting parts in flight finish...\n";
            }
            for (const auto& id : pending) {
                auto result = manager.pause(id);
                if (!result) {
                    LOG_WARN("Could not pause {}: {}", id, result.message);
                }
            }
        }
    }

    std::signal(SIGINT, previous_handler);
    scheduler.cancel(recovery_job);
    scheduler.stop();
    for (auto token : tokens) {
        manager.stop_observing(token);
    }
    manager.shutdown();

    size_t failures = 0;
    for (const auto& id : session_ids) {
        if (!report_outcome(*engine.store, id)) {
            failures++;
        }
    }

    if (failures > 0) {
        return CommandResult::error(std::to_string(failures) + " upload(s) did not finish");
    }
    return CommandResult::ok();
}

bool parse_constraints(const std::string& name, transfer::UploadConstraints& constraints) {
    if (name == "wifi-only") {
        constraints = transfer::UploadConstraints::wifi_only();
    } else if (name == "power-saving") {
        constraints = transfer::UploadConstraints::power_saving();
    } else if (name == "low-priority") {
        constraints = transfer::UploadConstraints::low_priority();
    } else {
        return false;
    }
    return true;
}

}

// UploadCommandHandler Implementation
CommandResult UploadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::filesystem::path file_path = args[1];
    if (!FileUtils::is_file(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }

    try {
        UploadEngine engine;
        auto opened = open_engine(engine);
        if (!opened.success) {
            return opened;
        }

        auto constraints = engine.manager->config().default_constraints;
        if (args.size() == 3 && !parse_constraints(args[2], constraints)) {
            return CommandResult::error("Unknown constraint profile: " + args[2] + "\nUsage: " + get_usage());
        }

        std::string session_id;
        auto result = engine.manager->start(file_path, constraints, session_id);
        if (!result) {
            return CommandResult::error("Failed to start upload: " + result.message);
        }

        auto size = FileUtils::file_size(file_path).value_or(0);
        std::cout << "Uploading " << file_path.filename().string() << " (" << StringUtils::format_bytes(size) << ")\n";
        std::cout << "  Session: " << session_id << "\n";
        std::cout << "Press Ctrl+C to pause\n";

        return follow_uploads(engine, {session_id});

    } catch (const std::exception& e) {
        return CommandResult::error("Upload failed: " + std::string(e.what()));
    }
}

// ResumeCommandHandler Implementation
CommandResult ResumeCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    const auto& session_id = args[1];

    try {
        UploadEngine engine;
        auto opened = open_engine(engine);
        if (!opened.success) {
            return opened;
        }

        storage::UploadSession session;
        auto result = engine.store->get_session(session_id, session);
        if (!result) {
            return CommandResult::error("Unknown session: " + session_id);
        }

        if (storage::is_terminal(session.status)) {
            return CommandResult::error("Upload is already " + StringUtils::to_lower(storage::to_string(session.status)));
        }

        if (session.status == SessionStatus::PAUSED) {
            result = engine.manager->resume(session_id);
            if (!result) {
                return CommandResult::error("Failed to resume upload: " + result.message);
            }
        } else {
            // Left running by a process that is gone
            std::set<std::string> recovered;
            result = engine.manager->recover_interrupted(recovered);
            if (!result) {
                return CommandResult::error("Failed to recover upload: " + result.message);
            }
            if (!recovered.count(session_id)) {
                report_outcome(*engine.store, session_id);
                return CommandResult::error("Upload could not be resumed");
            }
        }

        std::cout << "Resuming " << session.file_name << "\n";
        std::cout << "Press Ctrl+C to pause\n";

        return follow_uploads(engine, {session_id});

    } catch (const std::exception& e) {
        return CommandResult::error("Resume failed: " + std::string(e.what()));
    }
}

// CancelCommandHandler Implementation
CommandResult CancelCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    try {
        UploadEngine engine;
        auto opened = open_engine(engine);
        if (!opened.success) {
            return opened;
        }

        auto result = engine.manager->cancel(args[1]);
        engine.manager->shutdown();
        if (!result) {
            return CommandResult::error("Failed to cancel upload: " + result.message);
        }

        std::cout << "✓ Upload " << args[1] << " cancelled\n";
        return CommandResult::ok();

    } catch (const std::exception& e) {
        return CommandResult::error("Cancel failed: " + std::string(e.what()));
    }
}

// StatusCommandHandler Implementation
CommandResult StatusCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() > 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    try {
        std::shared_ptr<UploadStore> store;
        auto opened = open_store(store);
        if (!opened.success) {
            return opened;
        }

        if (args.size() == 1) {
            std::vector<storage::UploadSession> sessions;
            auto result = store->list_sessions(sessions);
            if (!result) {
                return CommandResult::error("Failed to list uploads: " + result.message);
            }

            if (sessions.empty()) {
                std::cout << "No uploads recorded.\n";
                return CommandResult::ok();
            }

            std::cout << "Uploads:\n";
            for (const auto& session : sessions) {
                uint32_t uploaded = 0;
                result = store->count_uploaded_parts(session.session_id, uploaded);
                if (!result) {
                    return CommandResult::error("Failed to read parts: " + result.message);
                }

                std::cout << "  " << session.session_id << "  " << std::left << std::setw(12)
                          << storage::to_string(session.status) << uploaded << "/" << session.total_parts
                          << " parts  " << session.file_name << "\n";
            }
            return CommandResult::ok();
        }

        const auto& session_id = args[1];
        storage::UploadSession session;
        auto result = store->get_session(session_id, session);
        if (!result) {
            return CommandResult::error("Unknown session: " + session_id);
        }

        std::vector<storage::UploadPart> parts;
        result = store->get_parts(session_id, parts);
        if (!result) {
            return CommandResult::error("Failed to read parts: " + result.message);
        }

        auto snapshot = ProgressSnapshot::from_records(session, parts);

        std::cout << "Upload " << session.session_id << "\n";
        std::cout << "  File: " << session.source_path << "\n";
        std::cout << "  Status: " << storage::to_string(session.status);
        if (session.status == SessionStatus::PAUSED && !session.pause_reason.empty()) {
            std::cout << " (" << session.pause_reason << ")";
        }
        std::cout << "\n";
        std::cout << "  Progress: " << snapshot.to_progress_string() << ", " << snapshot.to_parts_string() << "\n";
        std::cout << "  Constraints: " << session.constraints.describe() << "\n";
        if (session.has_remote_upload()) {
            std::cout << "  Remote: " << session.remote_path << " (" << session.remote_upload_id << ")\n";
        }
        if (session.error_message) {
            std::cout << "  Error: " << *session.error_message << "\n";
        }
        std::cout << "  Created: " << TimeUtils::format_timestamp(session.created_at) << "\n";
        std::cout << "  Updated: " << TimeUtils::format_timestamp(session.updated_at) << "\n";

        std::cout << "\n  Parts:\n";
        for (const auto& part : parts) {
            std::cout << "    [" << std::right << std::setw(5) << part.part_number << "] "
                      << std::left << std::setw(10) << storage::to_string(part.status)
                      << std::setw(12) << StringUtils::format_bytes(part.size());
            if (part.retry_count > 0) {
                std::cout << " retries: " << part.retry_count;
            }
            std::cout << "\n";
        }

        return CommandResult::ok();

    } catch (const std::exception& e) {
        return CommandResult::error("Failed to get status: " + std::string(e.what()));
    }
}

// RecoverCommandHandler Implementation
CommandResult RecoverCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return CommandResult::error("Usage: " + get_usage());
    }

    try {
        UploadEngine engine;
        auto opened = open_engine(engine);
        if (!opened.success) {
            return opened;
        }

        std::set<std::string> recovered;
        auto result = engine.manager->recover_interrupted(recovered);
        if (!result) {
            return CommandResult::error("Recovery failed: " + result.message);
        }

        if (recovered.empty()) {
            std::cout << "Nothing to recover.\n";
            return CommandResult::ok();
        }

        std::cout << "Recovered " << recovered.size() << " upload(s)\n";
        std::cout << "Press Ctrl+C to pause\n";

        return follow_uploads(engine, std::vector<std::string>(recovered.begin(), recovered.end()));

    } catch (const std::exception& e) {
        return CommandResult::error("Recovery failed: " + std::string(e.what()));
    }
}

// CleanupCommandHandler Implementation
CommandResult CleanupCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() > 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto retention = retention_from_config();
    if (args.size() == 2) {
        int days = -1;
        try {
            days = std::stoi(args[1]);
        } catch (const std::logic_error&) {
            days = -1;
        }
        if (days < 0) {
            return CommandResult::error("Retention must be a number of days: " + args[1]);
        }
        retention = std::chrono::hours(24 * days);
    }

    try {
        std::shared_ptr<UploadStore> store;
        auto opened = open_store(store);
        if (!opened.success) {
            return opened;
        }

        auto config = transfer::UploadConfig::from_config(Config::instance());
        transfer::RecoverySweep sweep(store, config.stale_upload_threshold);

        size_t removed = 0;
        auto result = sweep.cleanup(retention, removed);
        if (!result) {
            return CommandResult::error("Cleanup failed: " + result.message);
        }

        std::cout << "Removed " << removed << " finished upload(s)\n";
        return CommandResult::ok();

    } catch (const std::exception& e) {
        return CommandResult::error("Cleanup failed: " + std::string(e.what()));
    }
}

}

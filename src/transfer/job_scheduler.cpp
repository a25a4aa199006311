#include "uplift/transfer/job_scheduler.hpp"
#include "uplift/core/logger.hpp"

namespace uplift::transfer {

AsioJobScheduler::AsioJobScheduler()
    : running_(false) {
}

AsioJobScheduler::~AsioJobScheduler() {
    stop();
}

void AsioJobScheduler::start() {
    if (running_) {
        return;
    }

    if (io_context_.stopped()) {
        io_context_.restart();
    }
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    running_ = true;

    worker_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (const std::exception& e) {
            LOG_ERROR("Job scheduler loop stopped: {}", e.what());
        }
    });

    LOG_DEBUG("Job scheduler started");
}

void AsioJobScheduler::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, entry] : jobs_) {
            entry.timer->cancel();
        }
        jobs_.clear();
    }

    work_guard_.reset();
    io_context_.stop();

    if (worker_.joinable()) {
        worker_.join();
    }

    LOG_DEBUG("Job scheduler stopped");
}

JobScheduler::JobId AsioJobScheduler::schedule_once(std::chrono::milliseconds delay, Job job) {
    return add_job(delay, std::move(job), std::nullopt);
}

JobScheduler::JobId AsioJobScheduler::schedule_periodic(std::chrono::milliseconds interval, Job job) {
    return add_job(interval, std::move(job), interval);
}

bool AsioJobScheduler::cancel(JobId id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return false;
    }

    it->second.timer->cancel();
    jobs_.erase(it);
    return true;
}

size_t AsioJobScheduler::pending_jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

JobScheduler::JobId AsioJobScheduler::add_job(std::chrono::milliseconds delay, Job job,
                                              std::optional<std::chrono::milliseconds> interval) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto id = next_id_++;
    jobs_[id] = Entry{std::make_shared<boost::asio::steady_timer>(io_context_), std::move(job), interval};
    arm(id, delay);
    return id;
}

void AsioJobScheduler::arm(JobId id, std::chrono::milliseconds delay) {
    auto timer = jobs_[id].timer;
    timer->expires_after(delay);
    timer->async_wait([this, id, timer](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        fire(id);
    });
}

void AsioJobScheduler::fire(JobId id) {
    Job job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return;
        }
        job = it->second.job;
        if (!it->second.interval) {
            jobs_.erase(it);
        }
    }

    try {
        job();
    } catch (const std::exception& e) {
        LOG_ERROR("Scheduled job {} failed: {}", id, e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it != jobs_.end() && it->second.interval) {
        arm(id, *it->second.interval);
    }
}

}

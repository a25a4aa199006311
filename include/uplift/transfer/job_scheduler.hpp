#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace uplift::transfer {

// Deferred and periodic background work, kept out of the upload engine so
// hosts can plug in their own executor
class JobScheduler {
public:
    using JobId = uint64_t;
    using Job = std::function<void()>;

    virtual ~JobScheduler() = default;

    virtual JobId schedule_once(std::chrono::milliseconds delay, Job job) = 0;
    virtual JobId schedule_periodic(std::chrono::milliseconds interval, Job job) = 0;
    virtual bool cancel(JobId id) = 0;
};

class AsioJobScheduler : public JobScheduler {
public:
    AsioJobScheduler();
    ~AsioJobScheduler() override;

    AsioJobScheduler(const AsioJobScheduler&) = delete;
    AsioJobScheduler& operator=(const AsioJobScheduler&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

    JobId schedule_once(std::chrono::milliseconds delay, Job job) override;
    JobId schedule_periodic(std::chrono::milliseconds interval, Job job) override;
    bool cancel(JobId id) override;

    size_t pending_jobs() const;

private:
    struct Entry {
        std::shared_ptr<boost::asio::steady_timer> timer;
        Job job;
        std::optional<std::chrono::milliseconds> interval;
    };

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread worker_;
    std::atomic<bool> running_;

    std::map<JobId, Entry> jobs_;
    JobId next_id_ = 1;
    mutable std::mutex mutex_;

    JobId add_job(std::chrono::milliseconds delay, Job job, std::optional<std::chrono::milliseconds> interval);
    void arm(JobId id, std::chrono::milliseconds delay);
    void fire(JobId id);
};

}

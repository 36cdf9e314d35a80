#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>
#include "../interfaces/IScheduler.hpp"

namespace PageFetch {
    // Timer queue whose jobs run on whichever thread calls RunUntil().
    // ScheduleAfter() is safe from any thread.
    class EventLoop : public IScheduler {
    public:
        EventLoop() = default;
        EventLoop(const EventLoop&) = delete;
        EventLoop& operator=(const EventLoop&) = delete;

        void ScheduleAfter(Duration delay, Job job) override;
        void Post(Job job) { ScheduleAfter(Duration::zero(), std::move(job)); }

        // Runs due jobs until done() holds. done() is checked on the calling
        // thread before each wait, so it may read state that jobs write.
        void RunUntil(const std::function<bool()>& done);

        size_t Pending() const;

    private:
        struct ScheduledJob {
            std::chrono::steady_clock::time_point execution_time;
            uint64_t sequence;
            Job job;
        };

        std::vector<ScheduledJob> jobs;
        mutable std::mutex jobs_mutex;
        std::condition_variable cv;
        uint64_t next_sequence_ = 0;
    };
}

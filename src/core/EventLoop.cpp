#include "EventLoop.hpp"
#include <algorithm>

namespace PageFetch {

void EventLoop::ScheduleAfter(Duration delay, Job job) {
    if (delay < Duration::zero()) delay = Duration::zero();
    // Notify under the lock: once the job is visible the loop may finish and be destroyed.
    std::lock_guard<std::mutex> lock(jobs_mutex);
    jobs.push_back({std::chrono::steady_clock::now() + delay, next_sequence_++, std::move(job)});
    cv.notify_one();
}

size_t EventLoop::Pending() const {
    std::lock_guard<std::mutex> lock(jobs_mutex);
    return jobs.size();
}

void EventLoop::RunUntil(const std::function<bool()>& done) {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    while (!done()) {
        if (jobs.empty()) {
            cv.wait(lock, [this] { return !jobs.empty(); });
            continue;
        }

        // back() is the earliest job; equal times keep submission order.
        std::sort(jobs.begin(), jobs.end(), [](const ScheduledJob& a, const ScheduledJob& b) {
            if (a.execution_time != b.execution_time) return a.execution_time > b.execution_time;
            return a.sequence > b.sequence;
        });

        auto now = std::chrono::steady_clock::now();
        ScheduledJob& next_job = jobs.back();

        if (next_job.execution_time <= now) {
            Job job_to_run = std::move(next_job.job);
            jobs.pop_back();
            // Unlock while running so the job (or another thread) can schedule more.
            lock.unlock();
            job_to_run();
            lock.lock();
        } else {
            auto wake_at = next_job.execution_time;
            cv.wait_until(lock, wake_at);
        }
    }
}

}

#pragma once
#include <chrono>
#include <functional>

namespace PageFetch {

// Suspension primitive for fetch continuations. Implementations must accept
// ScheduleAfter() from any thread.
class IScheduler {
public:
    using Job = std::function<void()>;
    using Duration = std::chrono::steady_clock::duration;

    virtual ~IScheduler() = default;
    virtual void ScheduleAfter(Duration delay, Job job) = 0;
};

}

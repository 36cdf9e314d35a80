#pragma once
#include "IScheduler.hpp"

namespace PageFetch {

class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    // Claims the next request slot and returns how long the caller must pause
    // before using it.
    virtual IScheduler::Duration Reserve() = 0;

    // Blocks the calling thread until the next slot.
    virtual void Wait() = 0;

    // Suspending variant: resumes on the scheduler once the slot is due.
    void WaitAsync(IScheduler& scheduler, IScheduler::Job resume) {
        scheduler.ScheduleAfter(Reserve(), std::move(resume));
    }
};

}

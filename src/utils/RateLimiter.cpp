
#include "RateLimiter.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <thread>

namespace PageFetch {

double RequestsPerSecond(RatePreset preset) {
    switch (preset) {
        case RatePreset::Standard:       return kStandardRequestsPerSecond;
        case RatePreset::HighThroughput: return kHighThroughputRequestsPerSecond;
    }
    return kStandardRequestsPerSecond;
}

RateLimiter::RateLimiter(double requests_per_second) : rate_(requests_per_second) {
    if (!std::isfinite(requests_per_second) || requests_per_second <= 0.0) {
        throw std::invalid_argument("requests_per_second must be > 0, got " + std::to_string(requests_per_second));
    }
    const std::chrono::duration<double> interval(1.0 / requests_per_second);
    if (interval >= std::chrono::duration<double>(Clock::duration::max() / 2)) {
        throw std::invalid_argument("requests_per_second is too small, got " + std::to_string(requests_per_second));
    }
    min_interval_ = std::chrono::duration_cast<Clock::duration>(interval);
}

std::shared_ptr<RateLimiter> RateLimiter::FromPreset(RatePreset preset) {
    return std::make_shared<RateLimiter>(PageFetch::RequestsPerSecond(preset));
}

IScheduler::Duration RateLimiter::Reserve() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    if (!last_request_ || now - *last_request_ >= min_interval_) {
        last_request_ = now;
        return IScheduler::Duration::zero();
    }

    // The slot is stamped with the time the caller resumes, not the time it asked.
    auto slot = *last_request_ + min_interval_;
    last_request_ = slot;
    return slot - now;
}

void RateLimiter::Wait() {
    auto pause = Reserve();
    if (pause > IScheduler::Duration::zero()) {
        std::this_thread::sleep_for(pause);
    }
}

}

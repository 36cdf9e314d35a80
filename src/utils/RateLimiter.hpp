#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include "../interfaces/IRateLimiter.hpp"

namespace PageFetch {

    enum class RatePreset {
        Standard,       // 5 requests/second
        HighThroughput  // 250 requests/second
    };

    constexpr double kStandardRequestsPerSecond = 5.0;
    constexpr double kHighThroughputRequestsPerSecond = 250.0;

    double RequestsPerSecond(RatePreset preset);

    // Single-slot throttle: consecutive slots are at least 1/rps apart.
    class RateLimiter : public IRateLimiter {
    public:
        using Clock = std::chrono::steady_clock;

        // Throws std::invalid_argument unless requests_per_second is finite, > 0 and
        // large enough that 1/rps fits comfortably in a Clock::duration.
        explicit RateLimiter(double requests_per_second = kStandardRequestsPerSecond);

        static std::shared_ptr<RateLimiter> FromPreset(RatePreset preset);

        IScheduler::Duration Reserve() override;
        void Wait() override;

        double RequestsPerSecond() const { return rate_; }
        Clock::duration MinInterval() const { return min_interval_; }

    private:
        double rate_;
        Clock::duration min_interval_;
        std::optional<Clock::time_point> last_request_;
        std::mutex mutex_;
    };
}

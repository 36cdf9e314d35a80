#include "RetryPolicy.hpp"
#include <algorithm>
#include <random>

namespace PageFetch {

namespace {

std::chrono::milliseconds ApplyJitter(std::chrono::milliseconds delay) {
    if (delay.count() <= 1) return delay;
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<long long> dist(delay.count() / 2, delay.count());
    return std::chrono::milliseconds(dist(rng));
}

}

bool RetryPolicy::IsRetryableByDefault(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectionFailure:
        case ErrorKind::Timeout:
        case ErrorKind::HttpStatus:
        case ErrorKind::RateLimited:
            return true;
        default:
            return false;
    }
}

std::chrono::milliseconds RetryPolicy::ExponentialDelay(int attempts_made) const {
    if (attempts_made < 1) attempts_made = 1;
    auto delay = base_delay;
    for (int i = 1; i < attempts_made && delay < max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay);
}

bool RetryPolicy::IsRetryable(ErrorKind kind) const {
    return is_retryable ? is_retryable(kind) : IsRetryableByDefault(kind);
}

std::optional<std::chrono::milliseconds> RetryPolicy::NextDelay(ErrorKind kind, int attempts_made,
                                                                std::chrono::milliseconds elapsed) const {
    if (!IsRetryable(kind)) return std::nullopt;
    if (attempts_made >= max_attempts) return std::nullopt;

    auto delay = backoff ? backoff(attempts_made) : ExponentialDelay(attempts_made);
    if (jitter) delay = ApplyJitter(delay);
    if (delay.count() < 0) delay = std::chrono::milliseconds(0);

    if (elapsed + delay >= max_elapsed) return std::nullopt;
    return delay;
}

}

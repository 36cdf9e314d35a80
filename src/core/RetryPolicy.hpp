#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include "FetchTypes.hpp"

namespace PageFetch {

constexpr int kDefaultMaxAttempts = 3;
constexpr std::chrono::milliseconds kDefaultMaxRetryTime{90000};

// Decides whether a failed attempt is retried and how long to back off first.
struct RetryPolicy {
    using Predicate = std::function<bool(ErrorKind)>;
    using Schedule = std::function<std::chrono::milliseconds(int attempts_made)>;

    int max_attempts = kDefaultMaxAttempts;
    std::chrono::milliseconds max_elapsed = kDefaultMaxRetryTime;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{60000};
    bool jitter = true;

    // Unset members fall back to IsRetryableByDefault / ExponentialDelay.
    Predicate is_retryable;
    Schedule backoff;

    static bool IsRetryableByDefault(ErrorKind kind);

    // base_delay * 2^(attempts_made - 1), capped at max_delay, before jitter.
    std::chrono::milliseconds ExponentialDelay(int attempts_made) const;

    bool IsRetryable(ErrorKind kind) const;

    // Backoff before the next attempt, or nullopt to give up. `elapsed` is the
    // time since the fetch started; no attempt may start past max_elapsed.
    std::optional<std::chrono::milliseconds> NextDelay(ErrorKind kind, int attempts_made,
                                                       std::chrono::milliseconds elapsed) const;
};

}

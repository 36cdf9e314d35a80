#include <catch2/catch_all.hpp>
#include "core/RetryPolicy.hpp"

using namespace PageFetch;
using std::chrono::milliseconds;

TEST_CASE("Default retryable kinds") {
    CHECK(RetryPolicy::IsRetryableByDefault(ErrorKind::ConnectionFailure));
    CHECK(RetryPolicy::IsRetryableByDefault(ErrorKind::Timeout));
    CHECK(RetryPolicy::IsRetryableByDefault(ErrorKind::HttpStatus));
    CHECK(RetryPolicy::IsRetryableByDefault(ErrorKind::RateLimited));

    CHECK_FALSE(RetryPolicy::IsRetryableByDefault(ErrorKind::InvalidUrl));
    CHECK_FALSE(RetryPolicy::IsRetryableByDefault(ErrorKind::TooManyRedirects));
    CHECK_FALSE(RetryPolicy::IsRetryableByDefault(ErrorKind::ContentTypeMismatch));
    CHECK_FALSE(RetryPolicy::IsRetryableByDefault(ErrorKind::Unexpected));
}

TEST_CASE("Exponential delay doubles and caps") {
    RetryPolicy policy;
    policy.base_delay = milliseconds(1000);
    policy.max_delay = milliseconds(5000);

    CHECK(policy.ExponentialDelay(1) == milliseconds(1000));
    CHECK(policy.ExponentialDelay(2) == milliseconds(2000));
    CHECK(policy.ExponentialDelay(3) == milliseconds(4000));
    CHECK(policy.ExponentialDelay(4) == milliseconds(5000));
    CHECK(policy.ExponentialDelay(40) == milliseconds(5000));
}

TEST_CASE("NextDelay stops at max_attempts") {
    RetryPolicy policy;
    policy.jitter = false;

    auto first = policy.NextDelay(ErrorKind::Timeout, 1, milliseconds(0));
    REQUIRE(first.has_value());
    CHECK(*first == milliseconds(1000));
    auto second = policy.NextDelay(ErrorKind::Timeout, 2, milliseconds(1000));
    REQUIRE(second.has_value());
    CHECK(*second == milliseconds(2000));
    CHECK_FALSE(policy.NextDelay(ErrorKind::Timeout, 3, milliseconds(3000)).has_value());
}

TEST_CASE("NextDelay never starts an attempt past the time ceiling") {
    RetryPolicy policy;
    policy.jitter = false;
    policy.max_attempts = 100;
    policy.max_elapsed = milliseconds(10000);

    CHECK(policy.NextDelay(ErrorKind::HttpStatus, 1, milliseconds(8000)).has_value());
    CHECK_FALSE(policy.NextDelay(ErrorKind::HttpStatus, 1, milliseconds(9500)).has_value());
}

TEST_CASE("NextDelay refuses permanent errors") {
    RetryPolicy policy;
    CHECK_FALSE(policy.NextDelay(ErrorKind::ContentTypeMismatch, 1, milliseconds(0)).has_value());
    CHECK_FALSE(policy.NextDelay(ErrorKind::InvalidUrl, 1, milliseconds(0)).has_value());
}

TEST_CASE("Jitter stays within half to full delay") {
    RetryPolicy policy;
    policy.base_delay = milliseconds(800);
    for (int i = 0; i < 50; ++i) {
        auto d = policy.NextDelay(ErrorKind::Timeout, 1, milliseconds(0));
        REQUIRE(d.has_value());
        CHECK(*d >= milliseconds(400));
        CHECK(*d <= milliseconds(800));
    }
}

TEST_CASE("Predicate and schedule are replaceable") {
    RetryPolicy policy;
    policy.jitter = false;
    policy.is_retryable = [](ErrorKind kind) { return kind == ErrorKind::Unexpected; };
    policy.backoff = [](int attempts_made) { return milliseconds(10 * attempts_made); };

    CHECK_FALSE(policy.NextDelay(ErrorKind::Timeout, 1, milliseconds(0)).has_value());
    auto d = policy.NextDelay(ErrorKind::Unexpected, 2, milliseconds(0));
    REQUIRE(d.has_value());
    CHECK(*d == milliseconds(20));
}

#include <catch2/catch_all.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>
#include "utils/RateLimiter.hpp"
#include "utils/TextDecoder.hpp"
#include "utils/UrlUtil.hpp"

using namespace PageFetch;

TEST_CASE("RateLimiter spaces consecutive waits by the minimum interval") {
    RateLimiter rl(5.0);
    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 10; ++i) rl.Wait();
    auto elapsed = std::chrono::steady_clock::now() - start;
    // First slot is immediate, the other nine are 200ms apart.
    CHECK(elapsed >= std::chrono::milliseconds(1800));
}

TEST_CASE("RateLimiter reservations queue behind each other") {
    RateLimiter rl(5.0);
    CHECK(rl.Reserve() == IScheduler::Duration::zero());
    auto second = rl.Reserve();
    auto third = rl.Reserve();
    CHECK(second > std::chrono::milliseconds(150));
    CHECK(third > std::chrono::milliseconds(350));
    CHECK(third > second);
}

TEST_CASE("RateLimiter presets and invalid rates") {
    CHECK(RequestsPerSecond(RatePreset::Standard) == 5.0);
    CHECK(RequestsPerSecond(RatePreset::HighThroughput) == 250.0);
    auto interval = RateLimiter::FromPreset(RatePreset::HighThroughput)->MinInterval();
    CHECK(interval > std::chrono::microseconds(3999));
    CHECK(interval < std::chrono::microseconds(4001));
    CHECK(RateLimiter().RequestsPerSecond() == kStandardRequestsPerSecond);

    CHECK_THROWS_AS(RateLimiter(0.0), std::invalid_argument);
    CHECK_THROWS_AS(RateLimiter(-2.0), std::invalid_argument);
    CHECK_THROWS_AS(RateLimiter(std::nan("")), std::invalid_argument);
    CHECK_THROWS_AS(RateLimiter(std::numeric_limits<double>::infinity()), std::invalid_argument);
    // 1/rps would overflow the clock's duration type.
    CHECK_THROWS_AS(RateLimiter(1e-11), std::invalid_argument);
    CHECK_THROWS_AS(RateLimiter(std::numeric_limits<double>::denorm_min()), std::invalid_argument);
    CHECK(RateLimiter(1e-6).MinInterval() > std::chrono::hours(277));
}

TEST_CASE("IsValidUrl accepts http and https only") {
    using UrlUtil::IsValidUrl;

    CHECK(IsValidUrl("https://example.com"));
    CHECK(IsValidUrl("HTTP://Example.com/path?q=1#top"));
    CHECK(IsValidUrl("http://user:pw@example.com:8080/"));

    CHECK_FALSE(IsValidUrl(""));
    CHECK_FALSE(IsValidUrl("not a url"));
    CHECK_FALSE(IsValidUrl("ftp://example.com/file"));
    CHECK_FALSE(IsValidUrl("http://"));
    CHECK_FALSE(IsValidUrl("https:///path"));
    CHECK_FALSE(IsValidUrl("https://exa mple.com"));
    CHECK_FALSE(IsValidUrl("http://:80/"));
}

TEST_CASE("AppendQuery encodes params and keeps the fragment last") {
    using UrlUtil::AppendQuery;

    CHECK(AppendQuery("https://a.com/p", {}) == "https://a.com/p");
    CHECK(AppendQuery("https://a.com/p", {{"q", "a b"}, {"x", "1"}}) == "https://a.com/p?q=a%20b&x=1");
    CHECK(AppendQuery("https://a.com/p?z=0#frag", {{"q", "1"}}) == "https://a.com/p?z=0&q=1#frag");
}

TEST_CASE("TextDecoder reads the charset parameter") {
    using TextDecoder::CharsetFromContentType;

    CHECK(CharsetFromContentType("text/html; charset=ISO-8859-1") == "iso-8859-1");
    CHECK(CharsetFromContentType("text/html; charset=\"utf-8\"") == "utf-8");
    CHECK(CharsetFromContentType("text/html;charset=windows-1252; foo=bar") == "windows-1252");
    CHECK(CharsetFromContentType("application/json").empty());
}

TEST_CASE("TextDecoder decodes and replaces invalid bytes") {
    using TextDecoder::Decode;

    CHECK(Decode("caf\xC3\xA9", "") == "caf\xC3\xA9");
    CHECK(Decode("caf\xE9", "iso-8859-1") == "caf\xC3\xA9");
    CHECK(Decode("ok\xFF", "utf-8") == "ok\xEF\xBF\xBD");
    // Unknown charsets fall back to UTF-8.
    CHECK(Decode("plain", "x-no-such-charset") == "plain");
}

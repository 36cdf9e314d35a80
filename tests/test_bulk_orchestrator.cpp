#include <catch2/catch_all.hpp>
#include <vector>
#include "FakeConnectionContext.hpp"
#include "core/BulkOrchestrator.hpp"

using namespace PageFetch;
using Testing::FakeConnectionContext;
using std::chrono::milliseconds;

namespace {

HttpResponse EchoUrl(const HttpRequest& request) {
    return FakeConnectionContext::Ok("body of " + request.url);
}

}

TEST_CASE("FetchAll keeps input order with a slow middle URL") {
    FakeConnectionContext fake(EchoUrl);
    fake.SetDelay("https://example.com/slow", milliseconds(300));
    BulkOrchestrator orchestrator;

    const std::vector<std::string> urls = {
        "https://example.com/fast1",
        "https://example.com/slow",
        "https://example.com/fast2",
    };
    std::vector<std::string> completion_order;
    FetchCallbacks callbacks;
    callbacks.on_success = [&](const FetchResult& r) { completion_order.push_back(r.url); };

    auto results = orchestrator.FetchAll(urls, FetchConfig{}, fake, callbacks);

    REQUIRE(results.size() == 3);
    for (size_t i = 0; i < urls.size(); ++i) {
        REQUIRE(results[i].IsOk());
        CHECK(results[i].Url() == urls[i]);
        CHECK(results[i].Result().content == "body of " + urls[i]);
    }
    // The slow one finished last, but still sits in its own slot.
    REQUIRE(completion_order.size() == 3);
    CHECK(completion_order.back() == "https://example.com/slow");
}

TEST_CASE("FetchAll runs fetches concurrently") {
    FakeConnectionContext fake(EchoUrl);
    std::vector<std::string> urls;
    for (int i = 0; i < 5; ++i) {
        urls.push_back("https://example.com/" + std::to_string(i));
        fake.SetDelay(urls.back(), milliseconds(200));
    }
    BulkOrchestrator orchestrator;

    auto start = std::chrono::steady_clock::now();
    auto results = orchestrator.FetchAll(urls, FetchConfig{}, fake);
    auto took = std::chrono::steady_clock::now() - start;

    CHECK(results.size() == 5);
    CHECK(took < milliseconds(900));
}

TEST_CASE("One invalid URL does not affect its siblings") {
    FakeConnectionContext fake(EchoUrl);
    BulkOrchestrator orchestrator;
    const std::vector<std::string> urls = {"https://example.com/a", "not a url", "https://example.com/b"};

    BatchResults results;
    REQUIRE_NOTHROW(results = orchestrator.FetchAll(urls, FetchConfig{}, fake));
    REQUIRE(results.size() == 3);
    CHECK(results[0].IsOk());
    REQUIRE_FALSE(results[1].IsOk());
    CHECK(results[1].Error().kind == ErrorKind::InvalidUrl);
    CHECK(results[2].IsOk());
    CHECK(fake.CallCount() == 2);
}

TEST_CASE("Empty input yields empty output") {
    FakeConnectionContext fake(EchoUrl);
    BulkOrchestrator orchestrator;
    CHECK(orchestrator.FetchAll({}, FetchConfig{}, fake).empty());
    CHECK(orchestrator.FetchAll({}, FetchConfig{}).empty());
    CHECK(orchestrator.FetchAllSequential({}, FetchConfig{}).empty());
    CHECK(fake.CallCount() == 0);
}

TEST_CASE("Strict batches report the first error in input order") {
    FakeConnectionContext fake([](const HttpRequest& request) {
        if (request.url.find("missing") != std::string::npos) return FakeConnectionContext::Status(404);
        return FakeConnectionContext::Ok("x");
    });
    RetryPolicy policy;
    policy.base_delay = milliseconds(5);
    policy.jitter = false;
    BulkOrchestrator orchestrator{FetchEngine(policy)};

    // The 404 fails fast; the invalid URL comes first in input order.
    fake.SetDelay("https://example.com/ok", milliseconds(100));
    const std::vector<std::string> urls = {
        "https://example.com/ok",
        "bogus",
        "https://example.com/missing",
    };
    auto batch = orchestrator.FetchAllStrict(urls, FetchConfig{}, fake);

    CHECK_FALSE(batch.Ok());
    REQUIRE(batch.first_error.has_value());
    CHECK(batch.first_error->kind == ErrorKind::InvalidUrl);
    CHECK(batch.first_error->url == "bogus");
    REQUIRE(batch.results.size() == 3);
    CHECK(batch.results[0].IsOk());
    REQUIRE_FALSE(batch.results[2].IsOk());
    CHECK(batch.results[2].Error().kind == ErrorKind::HttpStatus);
}

TEST_CASE("Strict batch with no failures is Ok") {
    FakeConnectionContext fake(EchoUrl);
    BulkOrchestrator orchestrator;
    auto batch = orchestrator.FetchAllStrict({"https://example.com/1", "https://example.com/2"}, FetchConfig{}, fake);
    CHECK(batch.Ok());
    CHECK(batch.results.size() == 2);
}

TEST_CASE("Sequential batches fetch one URL at a time") {
    FakeConnectionContext fake(EchoUrl);
    BulkOrchestrator orchestrator;
    const std::vector<std::string> urls = {"https://example.com/1", "https://example.com/2", "https://example.com/3"};

    auto results = orchestrator.FetchAllSequential(urls, FetchConfig{}, fake);
    REQUIRE(results.size() == 3);
    auto requests = fake.Requests();
    REQUIRE(requests.size() == 3);
    for (size_t i = 0; i < urls.size(); ++i) {
        CHECK(requests[i].url == urls[i]);
        CHECK(results[i].Url() == urls[i]);
    }
}

TEST_CASE("Batches share the configured rate limiter") {
    FakeConnectionContext fake(EchoUrl);
    BulkOrchestrator orchestrator;
    FetchConfig config = FetchConfig::WithRatePreset(RatePreset::Standard);

    auto start = std::chrono::steady_clock::now();
    auto results = orchestrator.FetchAll(
        {"https://example.com/1", "https://example.com/2", "https://example.com/3", "https://example.com/4"},
        config, fake);
    auto took = std::chrono::steady_clock::now() - start;

    CHECK(results.size() == 4);
    // Four slots at 5/s span at least 600ms.
    CHECK(took >= milliseconds(580));
}

TEST_CASE("Detached batches run on their own thread") {
    BulkOrchestrator orchestrator;
    // Only invalid URLs, so the batch completes without touching the network.
    auto future = orchestrator.FetchAllDetached({"nope", "also nope"}, FetchConfig{});
    auto results = future.get();
    REQUIRE(results.size() == 2);
    CHECK(results[0].Error().kind == ErrorKind::InvalidUrl);
    CHECK(results[1].Error().url == "also nope");
}

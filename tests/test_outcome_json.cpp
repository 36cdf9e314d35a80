#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include "core/OutcomeJson.hpp"

using namespace PageFetch;

TEST_CASE("Successful outcomes serialize their result fields") {
    FetchResult result;
    result.url = "https://example.com/";
    result.effective_url = "https://example.com/home";
    result.status_code = 200;
    result.content = "hello";
    result.content_type = "text/html";
    result.elapsed = std::chrono::milliseconds(42);
    result.attempts = 1;

    auto line = nlohmann::json::parse(ToJsonLine(FetchOutcome(result)));
    CHECK(line["url"] == "https://example.com/");
    CHECK(line["ok"] == true);
    CHECK(line["status"] == 200);
    CHECK(line["bytes"] == 5);
    CHECK(line["elapsed_ms"] == 42);
    CHECK(line["effective_url"] == "https://example.com/home");
}

TEST_CASE("Failed outcomes serialize kind and message") {
    FetchError error;
    error.kind = ErrorKind::HttpStatus;
    error.url = "https://example.com/missing";
    error.message = "HTTP error for https://example.com/missing: status 404";
    error.status_code = 404;
    error.attempts = 3;

    auto line = ToJson(FetchOutcome(error));
    CHECK(line["ok"] == false);
    CHECK(line["error"] == "HttpStatus");
    CHECK(line["status"] == 404);
    CHECK(line["attempts"] == 3);
    CHECK_FALSE(line.contains("bytes"));
}

TEST_CASE("Invalid UTF-8 in a URL is replaced, not thrown") {
    FetchError error;
    error.kind = ErrorKind::InvalidUrl;
    error.url = "https://example.com/\xFF\xFE";
    error.message = "Invalid URL format: " + error.url;

    std::string text;
    REQUIRE_NOTHROW(text = ToJsonLine(FetchOutcome(error)));
    CHECK(text.find("\xEF\xBF\xBD") != std::string::npos);
    CHECK(nlohmann::json::parse(text)["ok"] == false);
}

#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include "../interfaces/IConnectionContext.hpp"
#include "../interfaces/IRateLimiter.hpp"
#include "../utils/RateLimiter.hpp"

namespace PageFetch {

enum class ErrorKind {
    InvalidUrl,
    ConnectionFailure,
    Timeout,
    TooManyRedirects,
    HttpStatus,
    RateLimited,
    ContentTypeMismatch,
    Unexpected
};

const char* ToString(ErrorKind kind);

constexpr std::chrono::milliseconds kDefaultRequestTimeout{30000};
constexpr long kDefaultMaxRedirects = 10;

// Browser-like header set sent when FetchConfig::custom_headers is unset.
const HeaderMap& DefaultHeaders();

struct FetchConfig {
    std::optional<HeaderMap> custom_headers;
    QueryParams params;
    CookieMap cookies;
    std::chrono::milliseconds timeout = kDefaultRequestTimeout;
    bool follow_redirects = true;
    long max_redirects = kDefaultMaxRedirects;
    bool verify_tls = true;
    std::optional<std::string> expected_content_type;
    std::optional<std::string> proxy;
    // Shared by every fetch that copies this config; null means unthrottled.
    std::shared_ptr<IRateLimiter> rate_limiter;

    // Fresh config with its own limiter at the preset's rate.
    static FetchConfig WithRatePreset(RatePreset preset);
};

struct FetchResult {
    std::string url;
    std::string effective_url;
    long status_code = 0;
    std::string content;
    std::string text;
    HeaderMap headers;
    std::chrono::milliseconds elapsed{0};
    std::string content_type;
    int attempts = 0;
    bool success = true;
};

struct FetchError {
    ErrorKind kind = ErrorKind::Unexpected;
    std::string url;
    std::string message;
    std::optional<long> status_code;
    int attempts = 0;
};

// Exactly one of FetchResult or FetchError.
class FetchOutcome {
public:
    FetchOutcome(FetchResult result) : value_(std::move(result)) {}
    FetchOutcome(FetchError error) : value_(std::move(error)) {}

    bool IsOk() const { return std::holds_alternative<FetchResult>(value_); }
    explicit operator bool() const { return IsOk(); }

    // Throws std::bad_variant_access when the other alternative is held.
    const FetchResult& Result() const { return std::get<FetchResult>(value_); }
    const FetchError& Error() const { return std::get<FetchError>(value_); }
    FetchResult& Result() { return std::get<FetchResult>(value_); }
    FetchError& Error() { return std::get<FetchError>(value_); }

    const std::string& Url() const { return IsOk() ? Result().url : Error().url; }

private:
    std::variant<FetchResult, FetchError> value_;
};

struct FetchCallbacks {
    std::function<void(const FetchResult&)> on_success;
    std::function<void(const FetchError&)> on_failure;
};

}

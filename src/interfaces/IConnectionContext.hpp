#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../utils/HeaderMap.hpp"

namespace PageFetch {

using QueryParams = std::vector<std::pair<std::string, std::string>>;
using CookieMap = std::map<std::string, std::string>;

struct HttpRequest {
    std::string url;
    HeaderMap headers;
    QueryParams query;
    CookieMap cookies;
    bool follow_redirects = true;
    long max_redirects = 10;
    bool verify_tls = true;
    std::optional<std::string> proxy;
    std::chrono::milliseconds timeout{30000};
};

enum class TransportError {
    None,
    ConnectionFailed,
    TimedOut,
    TooManyRedirects,
    Aborted,
    Other
};

struct HttpResponse {
    long status_code = 0;
    HeaderMap headers;
    std::string body;
    std::string effective_url;
    TransportError error = TransportError::None;
    std::string error_message;
};

// A pooled transport session. Get() may complete inline or on another thread.
class IConnectionContext {
public:
    using Callback = std::function<void(HttpResponse)>;
    virtual ~IConnectionContext() = default;
    virtual void Get(const HttpRequest& request, Callback cb) = 0;
};

}

#include "FetchEngine.hpp"
#include <algorithm>
#include <iomanip>
#include <memory>
#include <optional>
#include <sstream>
#include "EventLoop.hpp"
#include "../network/CurlEasyContext.hpp"
#include "../utils/Logger.hpp"
#include "../utils/TextDecoder.hpp"
#include "../utils/UrlUtil.hpp"

namespace PageFetch {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::string Seconds(std::chrono::milliseconds d) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << (d.count() / 1000.0);
    return out.str();
}

ErrorKind KindFor(TransportError error) {
    switch (error) {
        case TransportError::ConnectionFailed: return ErrorKind::ConnectionFailure;
        case TransportError::TimedOut:         return ErrorKind::Timeout;
        case TransportError::TooManyRedirects: return ErrorKind::TooManyRedirects;
        default:                               return ErrorKind::Unexpected;
    }
}

std::string DescribeTransportError(TransportError error, const std::string& url, const std::string& detail) {
    switch (error) {
        case TransportError::ConnectionFailed: return "Connection error for " + url + ": " + detail;
        case TransportError::TimedOut:         return "Timeout error for " + url + ": " + detail;
        case TransportError::TooManyRedirects: return "Too many redirects for " + url + ": " + detail;
        default:                               return "Unexpected error while loading " + url + ": " + detail;
    }
}

// Logs a terminal failure and runs on_failure. Callback exceptions are logged, not rethrown.
void ReportFailure(const FetchCallbacks& callbacks, const FetchError& error) {
    Logger::Log(LogLevel::Error, std::string(ToString(error.kind)) + " after " + std::to_string(error.attempts) +
                                 " attempt(s): " + error.message);
    if (!callbacks.on_failure) return;
    try {
        callbacks.on_failure(error);
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Exception in on_failure callback for " + error.url + ": " + std::string(e.what()));
    } catch (...) {
        Logger::Log(LogLevel::Error, "Unknown exception in on_failure callback for " + error.url);
    }
}

// One fetch, including its retries. Kept alive by the shared_ptrs captured in
// pending scheduler jobs and transport callbacks.
class FetchOperation : public std::enable_shared_from_this<FetchOperation> {
public:
    FetchOperation(std::string url, FetchConfig config, IConnectionContext& context, IScheduler& scheduler,
                   RetryPolicy policy, FetchEngine::Validator validator, FetchCallbacks callbacks,
                   FetchEngine::CompletionHandler done)
        : url_(std::move(url)), config_(std::move(config)), context_(context), scheduler_(scheduler),
          policy_(std::move(policy)), validator_(std::move(validator)), callbacks_(std::move(callbacks)),
          done_(std::move(done)) {}

    void Start() {
        started_ = Clock::now();
        Guarded([this] {
            if (!validator_(url_)) {
                Finish(MakeError(ErrorKind::InvalidUrl, "Invalid URL format: " + url_));
                return;
            }
            BeginAttempt();
        });
    }

private:
    // Steps 2-5 of an attempt; re-entered on every retry.
    void BeginAttempt() {
        ++attempts_;
        auto self = shared_from_this();
        if (config_.rate_limiter) {
            config_.rate_limiter->WaitAsync(scheduler_, [self] {
                self->Guarded([self] { self->Dispatch(); });
            });
        } else {
            Dispatch();
        }
    }

    void Dispatch() {
        Logger::Log(LogLevel::Debug, "Dispatching attempt " + std::to_string(attempts_) + " for URL: " + url_);
        auto self = shared_from_this();
        try {
            context_.Get(BuildRequest(), [self](HttpResponse response) {
                // The transport may call back on its own thread; continue on the scheduler.
                self->scheduler_.ScheduleAfter(IScheduler::Duration::zero(),
                    [self, response = std::move(response)]() mutable {
                        self->Guarded([&] { self->OnResponse(std::move(response)); });
                    });
            });
        } catch (const std::exception& e) {
            HandleFailure(MakeError(ErrorKind::Unexpected,
                                    "Unexpected error while loading " + url_ + ": " + std::string(e.what())));
        }
    }

    HttpRequest BuildRequest() const {
        HttpRequest request;
        request.url = url_;
        request.headers = config_.custom_headers ? *config_.custom_headers : DefaultHeaders();
        request.query = config_.params;
        request.cookies = config_.cookies;
        request.follow_redirects = config_.follow_redirects;
        request.max_redirects = config_.max_redirects;
        request.verify_tls = config_.verify_tls;
        request.proxy = config_.proxy;
        // No attempt may outlive the retry budget.
        auto remaining = policy_.max_elapsed - Since(started_);
        request.timeout = std::max(std::chrono::milliseconds(1), std::min(config_.timeout, remaining));
        return request;
    }

    void OnResponse(HttpResponse response) {
        if (response.error != TransportError::None) {
            HandleFailure(MakeError(KindFor(response.error),
                                    DescribeTransportError(response.error, url_, response.error_message)));
            return;
        }

        const long status = response.status_code;
        if (status == 429 || status == 503) {
            HandleFailure(MakeError(ErrorKind::RateLimited, "Rate limit exceeded: " + std::to_string(status), status));
            return;
        }
        if (status >= 400) {
            HandleFailure(MakeError(ErrorKind::HttpStatus,
                                    "HTTP error for " + url_ + ": status " + std::to_string(status), status));
            return;
        }

        std::string content_type = HeaderValue(response.headers, "Content-Type");
        const auto& expected = config_.expected_content_type;
        if (expected && !expected->empty() && content_type.find(*expected) == std::string::npos) {
            HandleFailure(MakeError(ErrorKind::ContentTypeMismatch,
                                    "Expected content type '" + *expected + "' but got '" + content_type + "'", status));
            return;
        }

        FetchResult result;
        result.url = url_;
        result.effective_url = response.effective_url.empty() ? url_ : response.effective_url;
        result.status_code = status;
        result.text = TextDecoder::Decode(response.body, TextDecoder::CharsetFromContentType(content_type));
        result.content = std::move(response.body);
        result.headers = std::move(response.headers);
        result.content_type = std::move(content_type);
        result.elapsed = Since(started_);
        result.attempts = attempts_;
        Finish(std::move(result));
    }

    void HandleFailure(FetchError error) {
        auto delay = policy_.NextDelay(error.kind, attempts_, Since(started_));
        if (!delay) {
            Finish(std::move(error));
            return;
        }

        Logger::Log(LogLevel::Warn, "Backing off " + Seconds(*delay) + " seconds after " + std::to_string(attempts_) +
                                    " tries fetching " + url_ + ": " + error.message);
        auto self = shared_from_this();
        scheduler_.ScheduleAfter(*delay, [self] {
            self->Guarded([self] { self->BeginAttempt(); });
        });
    }

    void Finish(FetchResult result) {
        if (completed_) return;
        completed_ = true;
        Logger::Log(LogLevel::Debug, "Fetched " + url_ + " (status " + std::to_string(result.status_code) + ", " +
                                     std::to_string(result.content.size()) + " bytes, " +
                                     std::to_string(result.elapsed.count()) + " ms)");
        if (callbacks_.on_success) {
            try {
                callbacks_.on_success(result);
            } catch (const std::exception& e) {
                Logger::Log(LogLevel::Error, "Exception in on_success callback for " + url_ + ": " + std::string(e.what()));
            } catch (...) {
                Logger::Log(LogLevel::Error, "Unknown exception in on_success callback for " + url_);
            }
        }
        done_(FetchOutcome(std::move(result)));
    }

    void Finish(FetchError error) {
        if (completed_) return;
        completed_ = true;
        ReportFailure(callbacks_, error);
        done_(FetchOutcome(std::move(error)));
    }

    FetchError MakeError(ErrorKind kind, std::string message, std::optional<long> status = std::nullopt) const {
        FetchError error;
        error.kind = kind;
        error.url = url_;
        error.message = std::move(message);
        error.status_code = status;
        error.attempts = attempts_;
        return error;
    }

    // Anything thrown past the classification points ends the fetch as Unexpected.
    template <typename Fn>
    void Guarded(Fn&& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            Finish(MakeError(ErrorKind::Unexpected, "Unexpected error while loading " + url_ + ": " + std::string(e.what())));
        } catch (...) {
            Finish(MakeError(ErrorKind::Unexpected, "Unexpected error while loading " + url_));
        }
    }

    std::string url_;
    FetchConfig config_;
    IConnectionContext& context_;
    IScheduler& scheduler_;
    RetryPolicy policy_;
    FetchEngine::Validator validator_;
    FetchCallbacks callbacks_;
    FetchEngine::CompletionHandler done_;

    Clock::time_point started_;
    int attempts_ = 0;
    bool completed_ = false;
};

}

FetchEngine::FetchEngine(RetryPolicy policy, Validator validator, ContextFactory context_factory)
    : policy_(std::move(policy)),
      validator_(validator ? std::move(validator) : Validator(&UrlUtil::IsValidUrl)),
      context_factory_(context_factory ? std::move(context_factory) : ContextFactory([] {
          return std::unique_ptr<IConnectionContext>(std::make_unique<CurlEasyContext>());
      })) {}

void FetchEngine::FetchAsync(const std::string& url, const FetchConfig& config,
                             IConnectionContext& context, IScheduler& scheduler,
                             CompletionHandler done, const FetchCallbacks& callbacks) const {
    auto op = std::make_shared<FetchOperation>(url, config, context, scheduler, policy_, validator_,
                                               callbacks, std::move(done));
    op->Start();
}

FetchOutcome FetchEngine::Fetch(const std::string& url, const FetchConfig& config,
                                IConnectionContext* context, const FetchCallbacks& callbacks) const {
    // Ad-hoc context: owned by this call only, released on every return path.
    std::unique_ptr<IConnectionContext> owned_context;
    if (!context) {
        std::string reason;
        try {
            owned_context = context_factory_();
        } catch (const std::exception& e) {
            reason = e.what();
        }
        if (!owned_context) {
            FetchError error;
            error.kind = ErrorKind::Unexpected;
            error.url = url;
            error.message = "Could not create a connection context for " + url +
                            (reason.empty() ? std::string() : ": " + reason);
            ReportFailure(callbacks, error);
            return FetchOutcome(std::move(error));
        }
        context = owned_context.get();
    }

    // A fresh loop per call; nothing carries over between invocations.
    EventLoop loop;
    std::optional<FetchOutcome> outcome;
    FetchAsync(url, config, *context, loop,
               [&outcome](FetchOutcome o) { outcome = std::move(o); }, callbacks);
    loop.RunUntil([&outcome] { return outcome.has_value(); });
    return std::move(*outcome);
}

}

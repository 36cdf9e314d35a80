#pragma once
#include <functional>
#include <memory>
#include <string>
#include "FetchTypes.hpp"
#include "RetryPolicy.hpp"
#include "../interfaces/IConnectionContext.hpp"
#include "../interfaces/IScheduler.hpp"

namespace PageFetch {

// Fetches a single URL: validate, throttle, GET, classify, retry.
class FetchEngine {
public:
    using Validator = std::function<bool(const std::string&)>;
    using CompletionHandler = std::function<void(FetchOutcome)>;
    // Builds the ad-hoc context of a blocking Fetch without a caller context.
    using ContextFactory = std::function<std::unique_ptr<IConnectionContext>()>;

    // An empty validator means UrlUtil::IsValidUrl; an empty factory makes a CurlEasyContext.
    explicit FetchEngine(RetryPolicy policy = RetryPolicy{}, Validator validator = nullptr,
                         ContextFactory context_factory = nullptr);

    // Blocking. Runs the fetch on a private event loop. With no context, one is
    // made by the context factory for this call and released before returning.
    FetchOutcome Fetch(const std::string& url, const FetchConfig& config,
                       IConnectionContext* context = nullptr,
                       const FetchCallbacks& callbacks = {}) const;

    // Cooperative. Every continuation runs on `scheduler`, and `done` is
    // invoked there exactly once. `context` and `scheduler` must outlive the
    // fetch. Never throws once started; failures arrive through `done`.
    void FetchAsync(const std::string& url, const FetchConfig& config,
                    IConnectionContext& context, IScheduler& scheduler,
                    CompletionHandler done, const FetchCallbacks& callbacks = {}) const;

private:
    RetryPolicy policy_;
    Validator validator_;
    ContextFactory context_factory_;
};

}

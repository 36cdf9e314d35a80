#include "BulkOrchestrator.hpp"
#include <chrono>
#include "EventLoop.hpp"
#include "../network/CurlEasyContext.hpp"
#include "../network/CurlMultiContext.hpp"
#include "../utils/Logger.hpp"

namespace PageFetch {

namespace {

void LogSummary(const BatchResults& results, std::chrono::steady_clock::time_point started) {
    size_t failed = 0;
    for (const auto& outcome : results) {
        if (!outcome.IsOk()) ++failed;
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    Logger::Log(LogLevel::Info, "Batch finished: " + std::to_string(results.size() - failed) + " succeeded, " +
                                std::to_string(failed) + " failed in " + std::to_string(ms.count()) + " ms");
}

}

BulkOrchestrator::BulkOrchestrator(FetchEngine engine, long max_connections)
    : engine_(std::move(engine)), max_connections_(max_connections) {}

BatchResults BulkOrchestrator::FetchAll(const std::vector<std::string>& urls, const FetchConfig& config,
                                        const FetchCallbacks& callbacks) const {
    if (urls.empty()) return {};
    CurlMultiContext context(max_connections_);
    return FetchAll(urls, config, context, callbacks);
}

BatchResults BulkOrchestrator::FetchAll(const std::vector<std::string>& urls, const FetchConfig& config,
                                        IConnectionContext& context, const FetchCallbacks& callbacks) const {
    if (urls.empty()) return {};

    Logger::Log(LogLevel::Info, "Fetching batch of " + std::to_string(urls.size()) + " URL(s)");
    const auto started = std::chrono::steady_clock::now();

    // Every completion runs on this thread inside RunUntil, so the slots need no lock.
    EventLoop loop;
    std::vector<std::optional<FetchOutcome>> slots(urls.size());
    size_t remaining = urls.size();

    for (size_t i = 0; i < urls.size(); ++i) {
        engine_.FetchAsync(urls[i], config, context, loop,
            [&slots, &remaining, i](FetchOutcome outcome) {
                slots[i] = std::move(outcome);
                --remaining;
            },
            callbacks);
    }
    loop.RunUntil([&remaining] { return remaining == 0; });

    BatchResults results;
    results.reserve(slots.size());
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    LogSummary(results, started);
    return results;
}

BatchOutcome BulkOrchestrator::FetchAllStrict(const std::vector<std::string>& urls, const FetchConfig& config,
                                              const FetchCallbacks& callbacks) const {
    BatchOutcome outcome;
    outcome.results = FetchAll(urls, config, callbacks);
    for (const auto& result : outcome.results) {
        if (!result.IsOk()) {
            outcome.first_error = result.Error();
            break;
        }
    }
    return outcome;
}

BatchResults BulkOrchestrator::FetchAllSequential(const std::vector<std::string>& urls, const FetchConfig& config,
                                                  const FetchCallbacks& callbacks) const {
    if (urls.empty()) return {};
    CurlEasyContext context;
    return FetchAllSequential(urls, config, context, callbacks);
}

BatchResults BulkOrchestrator::FetchAllSequential(const std::vector<std::string>& urls, const FetchConfig& config,
                                                  IConnectionContext& context, const FetchCallbacks& callbacks) const {
    if (urls.empty()) return {};

    Logger::Log(LogLevel::Info, "Fetching " + std::to_string(urls.size()) + " URL(s) sequentially");
    const auto started = std::chrono::steady_clock::now();

    BatchResults results;
    results.reserve(urls.size());
    for (const auto& url : urls) {
        results.push_back(engine_.Fetch(url, config, &context, callbacks));
    }
    LogSummary(results, started);
    return results;
}

std::future<BatchResults> BulkOrchestrator::FetchAllDetached(std::vector<std::string> urls, FetchConfig config,
                                                             FetchCallbacks callbacks) const {
    // The worker owns a copy of the orchestrator and builds its own loop and context.
    BulkOrchestrator self = *this;
    return std::async(std::launch::async,
        [self = std::move(self), urls = std::move(urls), config = std::move(config),
         callbacks = std::move(callbacks)]() {
            return self.FetchAll(urls, config, callbacks);
        });
}

}

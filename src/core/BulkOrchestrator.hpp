#pragma once
#include <future>
#include <optional>
#include <string>
#include <vector>
#include "FetchEngine.hpp"

namespace PageFetch {
    using BatchResults = std::vector<FetchOutcome>;

    // Result of a fail-together batch: every slot, plus the first error in input order.
    struct BatchOutcome {
        BatchResults results;
        std::optional<FetchError> first_error;

        bool Ok() const { return !first_error.has_value(); }
    };

    // Fetches a list of URLs concurrently over one connection context. Output
    // order always matches input order; a failed URL fills its own slot.
    class BulkOrchestrator {
    public:
        // max_connections caps the pool of batches that create their own context; 0 is unlimited.
        explicit BulkOrchestrator(FetchEngine engine = FetchEngine{}, long max_connections = 0);

        BatchResults FetchAll(const std::vector<std::string>& urls, const FetchConfig& config,
                              const FetchCallbacks& callbacks = {}) const;

        // The caller keeps ownership of context; it stays open afterwards.
        BatchResults FetchAll(const std::vector<std::string>& urls, const FetchConfig& config,
                              IConnectionContext& context, const FetchCallbacks& callbacks = {}) const;

        BatchOutcome FetchAllStrict(const std::vector<std::string>& urls, const FetchConfig& config,
                                    const FetchCallbacks& callbacks = {}) const;

        // One URL at a time over a single blocking context.
        BatchResults FetchAllSequential(const std::vector<std::string>& urls, const FetchConfig& config,
                                        const FetchCallbacks& callbacks = {}) const;
        BatchResults FetchAllSequential(const std::vector<std::string>& urls, const FetchConfig& config,
                                        IConnectionContext& context, const FetchCallbacks& callbacks = {}) const;

        // Runs FetchAll on a separate thread. urls and config are copied.
        std::future<BatchResults> FetchAllDetached(std::vector<std::string> urls, FetchConfig config,
                                                   FetchCallbacks callbacks = {}) const;

    private:
        FetchEngine engine_;
        long max_connections_;
    };
}

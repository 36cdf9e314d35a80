#pragma once
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "../src/core/FetchTypes.hpp"
#include "../src/core/RetryPolicy.hpp"

namespace PageFetch {
    struct Config {
        long http_timeout_ms = 30000;
        long http_max_redirects = 10;
        bool follow_redirects = true;
        bool verify_tls = true;
        std::string rate_preset = "standard"; // standard | high_throughput | none
        double rate_per_sec = 0.0;            // > 0 overrides rate_preset
        int max_attempts = 3;
        long max_retry_seconds = 90;
        long backoff_base_ms = 1000;
        bool backoff_jitter = true;
        long max_connections = 0;
        std::string expected_content_type;
        std::string proxy;
        std::map<std::string, std::string> custom_headers; // empty: built-in browser headers
        std::string log_level = "info";

        // Throws std::runtime_error if the file cannot be read or a value is invalid.
        void Load(const std::string& path);
        static void CreateDefault(const std::string& path);
        void Validate() const;

        nlohmann::json ToJson() const;

        // Each call builds a new config with its own rate limiter.
        FetchConfig ToFetchConfig() const;
        RetryPolicy ToRetryPolicy() const;
    };
}

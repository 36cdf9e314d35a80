#include "Config.hpp"
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include "../src/utils/Logger.hpp"
#include "../src/utils/RateLimiter.hpp"

namespace PageFetch {

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(f);
        if (!data.is_object()) {
            throw std::runtime_error("top-level value must be an object");
        }

        http_timeout_ms = data.value("http_timeout_ms", 30000L);
        http_max_redirects = data.value("http_max_redirects", 10L);
        follow_redirects = data.value("follow_redirects", true);
        verify_tls = data.value("verify_tls", true);
        rate_preset = data.value("rate_preset", std::string("standard"));
        rate_per_sec = data.value("rate_per_sec", 0.0);
        max_attempts = data.value("max_attempts", 3);
        max_retry_seconds = data.value("max_retry_seconds", 90L);
        backoff_base_ms = data.value("backoff_base_ms", 1000L);
        backoff_jitter = data.value("backoff_jitter", true);
        max_connections = data.value("max_connections", 0L);
        expected_content_type = data.value("expected_content_type", std::string());
        proxy = data.value("proxy", std::string());
        log_level = data.value("log_level", std::string("info"));

        custom_headers.clear();
        if (data.contains("custom_headers")) {
            if (!data["custom_headers"].is_object()) {
                throw std::runtime_error("custom_headers must be an object of strings");
            }
            for (const auto& item : data["custom_headers"].items()) {
                custom_headers[item.key()] = item.value().get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }

    Validate();

    // Write back missing keys so an older config.json picks up new options.
    // Unknown keys are preserved.
    const nlohmann::json defaults = ToJson();
    bool changed = false;
    for (const auto& item : defaults.items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }

    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::Log(LogLevel::Warn, "Could not back up " + path + ": " + ec.message());
        }

        std::ofstream o(path, std::ios::trunc);
        o << std::setw(4) << data << std::endl;
        if (!o.good()) {
            // Startup continues with the values already loaded.
            Logger::Log(LogLevel::Warn, "Could not write missing keys back to " + path);
        }
    }
}

void Config::Validate() const {
    if (http_timeout_ms <= 0) {
        throw std::runtime_error("http_timeout_ms must be positive");
    }
    if (http_max_redirects < 0) {
        throw std::runtime_error("http_max_redirects must not be negative");
    }
    if (rate_preset != "standard" && rate_preset != "high_throughput" && rate_preset != "none") {
        throw std::runtime_error("rate_preset must be one of standard, high_throughput, none (got '" + rate_preset + "')");
    }
    if (!std::isfinite(rate_per_sec) || rate_per_sec < 0.0) {
        throw std::runtime_error("rate_per_sec must be zero or a positive number");
    }
    if (rate_per_sec > 0.0) {
        try {
            RateLimiter check(rate_per_sec);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("rate_per_sec: ") + e.what());
        }
    }
    if (max_attempts < 1) {
        throw std::runtime_error("max_attempts must be at least 1");
    }
    if (max_retry_seconds <= 0) {
        throw std::runtime_error("max_retry_seconds must be positive");
    }
    if (backoff_base_ms < 0) {
        throw std::runtime_error("backoff_base_ms must not be negative");
    }
    if (max_connections < 0) {
        throw std::runtime_error("max_connections must not be negative");
    }
    const std::string level = [this] {
        std::string s;
        for (unsigned char c : log_level) s.push_back(static_cast<char>(std::tolower(c)));
        return s;
    }();
    if (level != "debug" && level != "info" && level != "warn" && level != "warning" &&
        level != "error" && level != "err") {
        throw std::runtime_error("log_level must be one of debug, info, warn, error (got '" + log_level + "')");
    }
}

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["http_timeout_ms"] = http_timeout_ms;
    data["http_max_redirects"] = http_max_redirects;
    data["follow_redirects"] = follow_redirects;
    data["verify_tls"] = verify_tls;
    data["rate_preset"] = rate_preset;
    data["rate_per_sec"] = rate_per_sec;
    data["max_attempts"] = max_attempts;
    data["max_retry_seconds"] = max_retry_seconds;
    data["backoff_base_ms"] = backoff_base_ms;
    data["backoff_jitter"] = backoff_jitter;
    data["max_connections"] = max_connections;
    data["expected_content_type"] = expected_content_type;
    data["proxy"] = proxy;
    data["custom_headers"] = nlohmann::json::object();
    for (const auto& [name, value] : custom_headers) {
        data["custom_headers"][name] = value;
    }
    data["log_level"] = log_level;
    return data;
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << Config{}.ToJson() << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

FetchConfig Config::ToFetchConfig() const {
    FetchConfig config;
    config.timeout = std::chrono::milliseconds(http_timeout_ms);
    config.max_redirects = http_max_redirects;
    config.follow_redirects = follow_redirects;
    config.verify_tls = verify_tls;
    if (!expected_content_type.empty()) config.expected_content_type = expected_content_type;
    if (!proxy.empty()) config.proxy = proxy;
    if (!custom_headers.empty()) {
        config.custom_headers = HeaderMap(custom_headers.begin(), custom_headers.end());
    }

    if (rate_per_sec > 0.0) {
        config.rate_limiter = std::make_shared<RateLimiter>(rate_per_sec);
    } else if (rate_preset == "standard") {
        config.rate_limiter = RateLimiter::FromPreset(RatePreset::Standard);
    } else if (rate_preset == "high_throughput") {
        config.rate_limiter = RateLimiter::FromPreset(RatePreset::HighThroughput);
    }
    return config;
}

RetryPolicy Config::ToRetryPolicy() const {
    RetryPolicy policy;
    policy.max_attempts = max_attempts;
    policy.max_elapsed = std::chrono::seconds(max_retry_seconds);
    policy.base_delay = std::chrono::milliseconds(backoff_base_ms);
    policy.jitter = backoff_jitter;
    return policy;
}

}

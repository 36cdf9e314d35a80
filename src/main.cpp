#include <iostream>
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <string>
#include <vector>
#include "../config/Config.hpp"
#include "core/BulkOrchestrator.hpp"
#include "core/FetchEngine.hpp"
#include "core/OutcomeJson.hpp"
#include "utils/Logger.hpp"

namespace {

enum class BatchMode { Concurrent, Sequential, Strict };

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config PATH] [--sequential|--strict] [URL...]\n"
              << "Reads URLs from stdin, one per line, when none are given.\n";
}

std::string Trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

}

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        PageFetch::Logger::Log(PageFetch::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    std::filesystem::path exe_dir = std::filesystem::path(argv[0]).parent_path();
    std::filesystem::path config_path = exe_dir / "config" / "config.json";

    BatchMode mode = BatchMode::Concurrent;
    std::vector<std::string> urls;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                PrintUsage(argv[0]);
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "--sequential") {
            mode = BatchMode::Sequential;
        } else if (arg == "--strict") {
            mode = BatchMode::Strict;
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            PrintUsage(argv[0]);
            return 1;
        } else {
            urls.push_back(arg);
        }
    }
    const std::string config_path_str = config_path.string();

    // Load Config
    PageFetch::Config config;
    try {
        if (!std::filesystem::exists(config_path)) {
            PageFetch::Logger::Log(PageFetch::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
            PageFetch::Config::CreateDefault(config_path_str);
        }
        config.Load(config_path_str);
    } catch (const std::exception& e) {
        PageFetch::Logger::Log(PageFetch::LogLevel::Error, "Failed to load config: " + std::string(e.what()));
        return 1;
    }
    PageFetch::Logger::Init(exe_dir.string(), PageFetch::Logger::FromString(config.log_level));
    PageFetch::Logger::Log(PageFetch::LogLevel::Info, "Configuration loaded from: " + config_path_str);

    if (urls.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            line = Trim(line);
            if (!line.empty() && line[0] != '#') urls.push_back(line);
        }
    }
    if (urls.empty()) {
        PageFetch::Logger::Log(PageFetch::LogLevel::Warn, "No URLs given.");
        return 0;
    }

    // Initialize global resources
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        PageFetch::Logger::Log(PageFetch::LogLevel::Error, "curl_global_init failed.");
        return 1;
    }

    int exit_code = 0;
    try {
        PageFetch::BulkOrchestrator orchestrator(PageFetch::FetchEngine(config.ToRetryPolicy()), config.max_connections);
        const PageFetch::FetchConfig fetch_config = config.ToFetchConfig();

        PageFetch::BatchResults results;
        switch (mode) {
            case BatchMode::Sequential:
                results = orchestrator.FetchAllSequential(urls, fetch_config);
                break;
            case BatchMode::Strict: {
                auto batch = orchestrator.FetchAllStrict(urls, fetch_config);
                if (batch.first_error) {
                    PageFetch::Logger::Log(PageFetch::LogLevel::Error, "Batch failed: " + batch.first_error->message);
                }
                results = std::move(batch.results);
                break;
            }
            default:
                results = orchestrator.FetchAll(urls, fetch_config);
                break;
        }

        for (const auto& outcome : results) {
            std::cout << PageFetch::ToJsonLine(outcome) << "\n";
            if (!outcome.IsOk()) exit_code = 2;
        }
        std::cout.flush();
    } catch (const std::exception& e) {
        PageFetch::Logger::Log(PageFetch::LogLevel::Error, "Fetch failed: " + std::string(e.what()));
        exit_code = 1;
    }

    // Cleanup global resources
    curl_global_cleanup();
    return exit_code;
}

#pragma once
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace PageFetch {
    enum class LogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    class Logger {
    public:
        // Enables the daily log file under <base_dir>/logs.
        static void Init(const std::string& base_dir, LogLevel min_level);
        static void SetMinLevel(LogLevel level);
        static LogLevel FromString(const std::string& s);
        static const char* ToString(LogLevel level);
        static void Log(LogLevel level, const std::string& message);
    private:
        static std::mutex mutex_;
        static LogLevel min_level_;
        static std::filesystem::path logs_dir_;
        static std::string current_date_;
        static std::ofstream file_;
        static void EnsureLogFileUnlocked(const std::tm& now_tm);
    };
}

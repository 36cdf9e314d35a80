
#include "Logger.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace PageFetch {

std::mutex Logger::mutex_;
LogLevel Logger::min_level_ = LogLevel::Info;
std::filesystem::path Logger::logs_dir_{};
std::string Logger::current_date_{};
std::ofstream Logger::file_{};

void Logger::Init(const std::string& base_dir, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(mutex_);
    logs_dir_ = std::filesystem::path(base_dir) / "logs";
    std::error_code ec;
    std::filesystem::create_directories(logs_dir_, ec);
    if (ec) {
        std::cerr << "Could not create log directory " << logs_dir_.string() << ": " << ec.message() << std::endl;
        logs_dir_.clear();
    }
    min_level_ = min_level;
    // The file for today is opened lazily by the first Log() call.
}

void Logger::SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::FromString(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (unsigned char c : s) t.push_back(static_cast<char>(std::tolower(c)));
    if (t == "debug") return LogLevel::Debug;
    if (t == "info")  return LogLevel::Info;
    if (t == "warn" || t == "warning") return LogLevel::Warn;
    if (t == "error" || t == "err") return LogLevel::Error;
    return LogLevel::Info;
}

const char* Logger::ToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "Debug";
        case LogLevel::Info:  return "Info";
        case LogLevel::Warn:  return "Warn";
        case LogLevel::Error: return "Error";
    }
    return "Info";
}

void Logger::EnsureLogFileUnlocked(const std::tm& now_tm) {
    std::ostringstream date;
    date << std::put_time(&now_tm, "%Y-%m-%d");
    if (date.str() == current_date_ && file_.is_open()) return;

    current_date_ = date.str();
    if (file_.is_open()) file_.close();
    file_.open(logs_dir_ / (current_date_ + ".log"), std::ios::out | std::ios::app);
}

void Logger::Log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) return;

    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm buf;
    #ifdef _WIN32
    localtime_s(&buf, &in_time_t);
    #else
    localtime_r(&in_time_t, &buf);
    #endif

    std::ostringstream line;
    line << std::put_time(&buf, "%Y-%m-%d %X") << " [" << ToString(level) << "] " << message;

    // Console output goes to stderr; stdout carries fetch results.
    std::clog << line.str() << std::endl;

    // File (logs/YYYY-MM-DD.log)
    if (!logs_dir_.empty()) {
        EnsureLogFileUnlocked(buf);
        if (file_.is_open()) {
            file_ << line.str() << std::endl;
        }
    }
}

}

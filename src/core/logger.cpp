#include "core/logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <filesystem>

using namespace std::chrono;

LogLevel logLevelFromString(const std::string& s) {
    if (s == "debug")   return LogLevel::Debug;
    if (s == "info")    return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error")   return LogLevel::Error;
    return LogLevel::Info;
}

// =======================
// Singleton
// =======================
Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger()
    : lastRotation_(steady_clock::now()) {}

// =======================
// Configuration
// =======================
void Logger::setLevel(LogLevel level) {
    level_ = level;
}

LogLevel Logger::level() const {
    return level_.load();
}

void Logger::setFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    logPath_ = path;

    if (out_.is_open())
        out_.close();

    if (path.empty()) {
        fileSize_ = 0;
        return;
    }

    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);

    out_.open(path, std::ios::app);
    fileSize_ = std::filesystem::exists(path, ec)
        ? std::filesystem::file_size(path, ec)
        : 0;
}

// =======================
// LogLevel helpers
// =======================
const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "UNKNOWN";
    }
}

// =======================
// Rotation
// =======================
void Logger::rotateIfNeeded() {
    constexpr size_t MAX_SIZE = 50 * 1024 * 1024; // 50 MB

    if (!out_.is_open() || fileSize_.load() < MAX_SIZE)
        return;

    out_.close();

    std::filesystem::path base(logPath_);
    std::error_code ec;

    // Rotate: log.4 -> log.5, ..., log -> log.1
    for (int i = 4; i >= 1; --i) {
        std::filesystem::path old = base.string() + "." + std::to_string(i);
        std::filesystem::path next = base.string() + "." + std::to_string(i + 1);

        if (std::filesystem::exists(old, ec)) {
            std::filesystem::rename(old, next, ec);
        }
    }

    if (std::filesystem::exists(base, ec)) {
        std::filesystem::rename(base, base.string() + ".1", ec);
    }

    out_.open(logPath_, std::ios::app);
    fileSize_.store(0);
    lastRotation_ = steady_clock::now();
}

// =======================
// Logging
// =======================
void Logger::log(LogLevel level, const std::string& message) {
    if (level < level_.load())
        return;
    std::lock_guard<std::mutex> log_lock(mutex_);
    rotateIfNeeded();

    auto now = system_clock::now();
    std::time_t tt = system_clock::to_time_t(now);

    std::tm tm{};
    localtime_r(&tt, &tm);

    // stdout carries command output, diagnostics go to stderr
    std::ostream& os = out_.is_open()
        ? static_cast<std::ostream&>(out_)
        : std::cerr;

    writeToStream(os, level, message, tm);

    fileSize_.fetch_add(message.size() + 32, std::memory_order_relaxed);
}

void Logger::writeToStream(
    std::ostream& os,
    LogLevel level,
    const std::string& message,
    const std::tm& tm
) {
    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << " [" << levelToString(level) << "] "
       << message << std::endl;
}

#pragma once
#include <fstream>
#include <mutex>
#include <string>
#include <atomic>
#include <chrono>
#include <ctime>

enum class LogLevel { Debug, Info, Warn, Error };

LogLevel logLevelFromString(const std::string& s);

class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    void setFile(const std::string& path);
    void log(LogLevel level, const std::string& message);

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream out_;
    std::mutex mutex_;
    std::atomic<LogLevel> level_{LogLevel::Info};
    static const char* levelToString(LogLevel level);

    // Rotation state
    std::atomic<size_t> fileSize_{0};
    std::chrono::steady_clock::time_point lastRotation_;
    std::string logPath_;

    void rotateIfNeeded();
    void writeToStream(std::ostream& os, LogLevel level, const std::string& message, const std::tm& tm);
};

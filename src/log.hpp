#pragma once
#include <functional>
#include <iostream>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

// Process-wide logger. Runs and workers on any thread write through it,
// so every call takes the mutex.
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    // Replace the output; an empty sink restores the default stderr writer.
    void set_sink(Sink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;
        if (sink_) {
            sink_(level, message);
            return;
        }
        std::cerr << "[" << level_name(level) << "] " << message << std::endl;
    }

    static const char* level_name(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO:  return "info";
            case LogLevel::WARN:  return "warn";
            case LogLevel::ERROR: return "error";
        }
        return "unknown";
    }

private:
    Logger() = default;

    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::INFO;
    Sink sink_;
};

#define LOG_DEBUG(msg) Logger::get().log(LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  Logger::get().log(LogLevel::INFO, msg)
#define LOG_WARN(msg)  Logger::get().log(LogLevel::WARN, msg)
#define LOG_ERROR(msg) Logger::get().log(LogLevel::ERROR, msg)

#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace sandrun::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    // Run id of the thread currently logging; every run has its own
    // orchestration and worker threads.
    inline std::string& thread_run_id() {
        thread_local std::string run_id;
        return run_id;
    }

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole app shares one sink
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            const std::string& run_id = thread_run_id();
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (level < min_level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (run_id.empty() ? "" : "[" + run_id + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;
    };

    // Tags every log line written by this thread with `run_id` until the
    // scope ends.
    class ScopedRunId {
    public:
        explicit ScopedRunId(const std::string& run_id)
            : previous_(thread_run_id()) {
            thread_run_id() = run_id;
        }
        ~ScopedRunId() { thread_run_id() = previous_; }

        ScopedRunId(const ScopedRunId&) = delete;
        ScopedRunId& operator=(const ScopedRunId&) = delete;

    private:
        std::string previous_;
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) sandrun::core::logging::Logger::get().log(sandrun::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  sandrun::core::logging::Logger::get().log(sandrun::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  sandrun::core::logging::Logger::get().log(sandrun::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) sandrun::core::logging::Logger::get().log(sandrun::core::logging::LogLevel::ERROR, msg)

} // namespace sandrun::core::logging

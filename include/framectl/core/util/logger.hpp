/**
 * @file logger.hpp
 * @brief Logging utilities for framectl.
 *
 * Provides a singleton Logger class and logging macros for different log levels.
 */
#pragma once
#include <string>
#include <functional>
#include <mutex>
#include <atomic>
#include <iostream>

namespace framectl {

    /**
     * @enum LogLevel
     * @brief Log levels for the logger.
     */
    enum class LogLevel { Trace, Debug, Info, Warn, Error, Off };

    /**
     * @class Logger
     * @brief Process-wide logger with a replaceable sink.
     *
     * Thread-safe. The sink is invoked under the logger mutex, so sinks must not log.
     */
    class Logger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        /**
         * @brief Get the singleton Logger instance.
         */
        static Logger& inst() {
            static Logger L;  return L;
        }

        /**
         * @brief Set the minimum log level. LogLevel::Off silences everything.
         */
        void setLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
        LogLevel level() const { return level_.load(std::memory_order_relaxed); }

        /**
         * @brief Replace the sink. Passing an empty function restores the stdout sink.
         */
        void setSink(Sink s) {
            std::scoped_lock lk(m_);
            sink_ = s ? std::move(s) : defaultSink();
        }

        bool enabled(LogLevel lvl) const { return lvl >= level() && lvl != LogLevel::Off; }

        /**
         * @brief Log a message at the specified log level.
         */
        void log(LogLevel lvl, const std::string& msg) {
            if (!enabled(lvl)) return;
            std::scoped_lock lk(m_);
            sink_(lvl, msg);
        }

        static const char* levelName(LogLevel l) {
            static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR","OFF" };
            return names[static_cast<int>(l)];
        }

    private:
        Logger() : sink_(defaultSink()) {}

        static Sink defaultSink() {
            return [](LogLevel l, const std::string& m) {
                std::cout << "[" << levelName(l) << "] " << m << '\n';
            };
        }

        std::mutex             m_;
        std::atomic<LogLevel>  level_{ LogLevel::Info };
        Sink                   sink_;
    };

#define LOG_TRACE(msg) ::framectl::Logger::inst().log(::framectl::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) ::framectl::Logger::inst().log(::framectl::LogLevel::Debug, msg)
#define LOG_INFO(msg)  ::framectl::Logger::inst().log(::framectl::LogLevel::Info,  msg)
#define LOG_WARN(msg)  ::framectl::Logger::inst().log(::framectl::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) ::framectl::Logger::inst().log(::framectl::LogLevel::Error, msg)
}

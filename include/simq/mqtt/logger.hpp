#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace simq::mqtt {

    enum class LogLevel : int {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3,
        OFF = 4
    };

    inline const char* to_string(LogLevel level) {
        switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "OFF";
        }
    }

    class Logger {
    private:
        static std::mutex& get_mutex() {
            static std::mutex mutex_;
            return mutex_;
        }

        static std::atomic<int>& threshold() {
            static std::atomic<int> level_{ static_cast<int>(LogLevel::INFO) };
            return level_;
        }

    public:
        static void set_level(LogLevel level) {
            threshold().store(static_cast<int>(level));
        }

        static bool enabled(LogLevel level) {
            return level != LogLevel::OFF &&
                static_cast<int>(level) >= threshold().load();
        }

        static void log(LogLevel level, const std::string& prefix, const std::string& message) {
            std::lock_guard<std::mutex> lock(get_mutex());

            auto now = std::chrono::system_clock::now();
            auto time_t = std::chrono::system_clock::to_time_t(now);

            struct tm tm_info;
            localtime_r(&time_t, &tm_info);

            std::cout << std::put_time(&tm_info, "%H:%M:%S")
                << " [" << to_string(level) << "][" << prefix << "] "
                << message
                << "\n";
            std::cout.flush();
        }
    };

    class LogStream {
    private:
        std::stringstream ss_;
        LogLevel level_;
        std::string prefix_;

    public:
        LogStream(LogLevel level, const std::string& prefix)
            : level_(level), prefix_(prefix) {}

        LogStream(const LogStream&) = delete;
        LogStream& operator=(const LogStream&) = delete;

        template<typename T>
        LogStream& operator<<(const T& value) {
            ss_ << value;
            return *this;
        }

        ~LogStream() {
            Logger::log(level_, prefix_, ss_.str());
        }
    };

// The stream is only constructed when the level passes the threshold, so
// disabled statements cost a single comparison.
#define SIMQ_LOG(level, prefix) \
    if (!::simq::mqtt::Logger::enabled(level)) ; \
    else ::simq::mqtt::LogStream(level, prefix)

#define SIMQ_LOG_DEBUG(prefix) SIMQ_LOG(::simq::mqtt::LogLevel::DEBUG, prefix)
#define SIMQ_LOG_INFO(prefix) SIMQ_LOG(::simq::mqtt::LogLevel::INFO, prefix)
#define SIMQ_LOG_WARN(prefix) SIMQ_LOG(::simq::mqtt::LogLevel::WARN, prefix)
#define SIMQ_LOG_ERROR(prefix) SIMQ_LOG(::simq::mqtt::LogLevel::ERROR, prefix)

} // namespace simq::mqtt

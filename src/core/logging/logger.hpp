#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace station::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Engine diagnostics only. Step output travels over the InteractionChannel,
    // and stdout belongs to the console protocol, so this writes to stderr.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_run_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            run_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::clog << "[" << level_to_string(level) << "] "
                      << (run_id_.empty() ? "" : "[" + run_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string run_id_;
        LogLevel min_level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define STATION_LOG_DEBUG(msg) station::core::logging::Logger::get().log(station::core::logging::LogLevel::DEBUG, msg)
    #define STATION_LOG_INFO(msg)  station::core::logging::Logger::get().log(station::core::logging::LogLevel::INFO, msg)
    #define STATION_LOG_WARN(msg)  station::core::logging::Logger::get().log(station::core::logging::LogLevel::WARN, msg)
    #define STATION_LOG_ERROR(msg) station::core::logging::Logger::get().log(station::core::logging::LogLevel::ERROR, msg)

} // namespace station::core::logging

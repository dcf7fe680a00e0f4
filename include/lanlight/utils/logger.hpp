/**
 * @file logger.hpp
 * @brief Thread-safe logging for LanLight.
 *
 * Header-only. Component-tagged, level-filtered log lines with timestamps
 * and `{}` placeholders. Output goes to stderr unless redirected.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#include "lanlight/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace lanlight {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @class Logger
 * @brief Singleton logger shared by every LanLight component.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Discovery", "Device {} answered from {}", fingerprint, ip);
 * @endcode
 */
class LANLIGHT_UTILS_API Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable ANSI colours around the level tag.
     */
    void setColorEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        colorEnabled_ = enabled;
    }

    /**
     * @brief Redirect output. Passing nullptr restores stderr.
     *
     * The stream must outlive every log call made while it is installed.
     */
    void setOutput(std::ostream* out) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : &std::cerr;
    }

    /**
     * @brief Fixed-width name of a level, as printed in log lines.
     */
    static const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            case LogLevel::OFF:   return "OFF  ";
        }
        return "?????";
    }

    /**
     * @brief Parse a level name ("TRACE" .. "OFF", case-sensitive).
     * @return The parsed level, or @p fallback if the name is unknown.
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO) {
        if (name == "TRACE") return LogLevel::TRACE;
        if (name == "DEBUG") return LogLevel::DEBUG;
        if (name == "INFO")  return LogLevel::INFO;
        if (name == "WARN")  return LogLevel::WARN;
        if (name == "ERROR") return LogLevel::ERROR;
        if (name == "FATAL") return LogLevel::FATAL;
        if (name == "OFF")   return LogLevel::OFF;
        return fallback;
    }

    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::string message = formatMessage(format, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif

        std::lock_guard<std::mutex> lock(mutex_);

        std::ostringstream oss;
        oss << "["
            << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << "] ";
        if (colorEnabled_) {
            oss << colorCode(level);
        }
        oss << "[" << levelTag(level) << "]";
        if (colorEnabled_) {
            oss << "\033[0m";
        }
        oss << " [" << component << "] " << message;

        *out_ << oss.str() << std::endl;

        if (level == LogLevel::FATAL) {
            std::abort();
        }
    }

private:
    Logger()
        : level_(static_cast<int>(LogLevel::INFO))
        , colorEnabled_(true)
        , out_(&std::cerr)
    {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string formatMessage(const char* format) {
        return std::string(format);
    }

    // Substitutes arguments into `{}` placeholders left to right.
    // Surplus arguments are dropped, surplus placeholders are kept verbatim.
    template<typename T, typename... Args>
    static std::string formatMessage(const char* format, T&& value, Args&&... args) {
        std::ostringstream oss;

        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                return oss.str() + formatMessage(format + 2, std::forward<Args>(args)...);
            }
            oss << *format++;
        }

        return oss.str();
    }

    static const char* colorCode(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "\033[90m";
            case LogLevel::DEBUG: return "\033[36m";
            case LogLevel::INFO:  return "\033[32m";
            case LogLevel::WARN:  return "\033[33m";
            case LogLevel::ERROR: return "\033[31m";
            case LogLevel::FATAL: return "\033[35;1m";
            default:              return "";
        }
    }

    std::atomic<int> level_;
    bool colorEnabled_;
    std::ostream* out_;
    std::mutex mutex_;
};

}  // namespace utils
}  // namespace lanlight

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::lanlight::utils::Logger::instance().log(::lanlight::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::lanlight::utils::Logger::instance().log(::lanlight::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::lanlight::utils::Logger::instance().log(::lanlight::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::lanlight::utils::Logger::instance().log(::lanlight::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::lanlight::utils::Logger::instance().log(::lanlight::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::lanlight::utils::Logger::instance().log(::lanlight::utils::LogLevel::FATAL, component, __VA_ARGS__)

#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::lanlight::utils::Logger::instance().isEnabled(level)) { \
            ::lanlight::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while(0)

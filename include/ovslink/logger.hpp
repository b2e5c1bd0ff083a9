#ifndef OVSLINK_LOGGER_HPP
#define OVSLINK_LOGGER_HPP

#include <string>    // For std::string, std::to_string
#include <iostream>  // For std::cout, std::cerr, std::endl, std::ostream
#include <ctime>     // For std::time_t, std::time, std::localtime, std::strftime, struct std::tm
#include <cstdio>    // For std::snprintf
#include <cstddef>   // For std::size_t
#include <mutex>     // For std::mutex, std::lock_guard
#include <optional>

namespace ovslink {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

// Parses "debug", "info", "warning", "error" or "critical" (case-sensitive, lower case).
inline std::optional<LogLevel> log_level_from_string(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

class Logger {
public:
    explicit Logger(LogLevel min_level = LogLevel::INFO) : min_log_level_(min_level) {}
    virtual ~Logger() = default;

    void set_min_log_level(LogLevel level) {
        min_log_level_ = level;
    }

    LogLevel get_min_log_level() const {
        return min_log_level_;
    }

    // The connection reader thread logs too, so whole lines are written under a lock.
    virtual void log(LogLevel level, const std::string& component, const std::string& message) const {
        if (level < min_log_level_) {
            return;
        }

        std::time_t t = std::time(nullptr);
        char time_buf[100];
        struct std::tm local_tm_storage;
        struct std::tm* local_tm = localtime_r(&t, &local_tm_storage);

        if (!local_tm || !std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", local_tm)) {
            std::snprintf(time_buf, sizeof(time_buf), "YYYY-MM-DD HH:MM:SS");
        }

        std::ostream& output_stream = (level >= LogLevel::ERROR) ? std::cerr : std::cout;

        std::lock_guard<std::mutex> lock(output_mutex_);
        output_stream << "[" << time_buf << "] "
                      << "[" << level_to_string(level) << "] "
                      << "[" << component << "] "
                      << message << std::endl;
    }

    void debug(const std::string& component, const std::string& message) const {
        log(LogLevel::DEBUG, component, message);
    }
    void info(const std::string& component, const std::string& message) const {
        log(LogLevel::INFO, component, message);
    }
    void warning(const std::string& component, const std::string& message) const {
        log(LogLevel::WARNING, component, message);
    }
    void error(const std::string& component, const std::string& message) const {
        log(LogLevel::ERROR, component, message);
    }
    void critical(const std::string& component, const std::string& message) const {
        log(LogLevel::CRITICAL, component, message);
    }

public:
    void log_transaction(const std::string& bridge, std::size_t operations, bool ok) const {
        if (min_log_level_ > LogLevel::DEBUG && ok) return;
        std::string message = "Transaction with " + std::to_string(operations) +
                              " operations against bridge " + bridge +
                              (ok ? " committed" : " failed");
        log(ok ? LogLevel::DEBUG : LogLevel::ERROR, "TRANSACT", message);
    }

    void log_device_step(const std::string& device, const std::string& step, const std::string& value) const {
        if (min_log_level_ > LogLevel::DEBUG) return;
        std::string message = step + " on " + device;
        if (!value.empty()) {
            message += " -> " + value;
        }
        log(LogLevel::DEBUG, "LINK", message);
    }

private:
    LogLevel min_log_level_;
    mutable std::mutex output_mutex_;

    std::string level_to_string(LogLevel level) const {
        switch (level) {
            case LogLevel::DEBUG:    return "DEBUG   ";
            case LogLevel::INFO:     return "INFO    ";
            case LogLevel::WARNING:  return "WARNING ";
            case LogLevel::ERROR:    return "ERROR   ";
            case LogLevel::CRITICAL: return "CRITICAL";
            default:                 return "UNKNOWN ";
        }
    }
};

} // namespace ovslink

#endif // OVSLINK_LOGGER_HPP

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <string>
#include <thread>

namespace warden {
namespace common {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Structured logging context for adding key-value pairs to log entries.
 * Fields are kept ordered so formatted output is stable.
 */
class LogContext {
public:
    LogContext& add(const std::string& key, const std::string& value) {
        fields_[key] = value;
        return *this;
    }

    LogContext& add(const std::string& key, const char* value) {
        fields_[key] = value ? value : "";
        return *this;
    }

    LogContext& add(const std::string& key, bool value) {
        fields_[key] = value ? "true" : "false";
        return *this;
    }

    template<typename T>
    LogContext& add(const std::string& key, const T& value) {
        std::ostringstream oss;
        oss << value;
        fields_[key] = oss.str();
        return *this;
    }

    LogContext& merge(const LogContext& other) {
        for (const auto& [key, value] : other.fields_) {
            fields_[key] = value;
        }
        return *this;
    }

    bool empty() const { return fields_.empty(); }

    std::string to_json() const;

    const std::map<std::string, std::string>& get_fields() const {
        return fields_;
    }

private:
    std::map<std::string, std::string> fields_;
};

/**
 * Process-wide structured logger.
 *
 * Entries go to the console, an optional file and an optional sink callback.
 * With async logging enabled a background thread drains a bounded queue;
 * shutdown() flushes it and joins the thread.
 */
class Logger {
public:
    enum class OutputFormat {
        PLAIN,      // Human-readable format
        JSON,       // Structured JSON format
        LOGFMT      // Key=value format
    };

    struct Config {
        LogLevel level = LogLevel::INFO;
        OutputFormat format = OutputFormat::PLAIN;
        bool enable_file_output = false;
        std::string log_file_path = "warden.log";
        bool enable_console_output = true;
        bool enable_async_logging = false;
        size_t async_buffer_size = 1000;
        bool include_thread_id = true;
    };

    struct Entry {
        LogLevel level;
        std::string message;
        LogContext context;
        std::chrono::system_clock::time_point timestamp;
        std::thread::id thread_id;
    };

    // Receives every entry that passes the level filter, already formatted
    using Sink = std::function<void(const Entry& entry, const std::string& formatted)>;

    static void initialize(const std::string& name, const Config& config);
    static void set_level(LogLevel level);
    static LogLevel get_level();
    static void set_format(OutputFormat format);
    static void set_sink(Sink sink);
    static void shutdown();

    static bool is_enabled(LogLevel level) { return level >= current_level_.load(); }

    template<typename... Args>
    static void log(LogLevel level, const std::string& format, Args&&... args) {
        if (!is_enabled(level)) return;

        std::string message = format_string(format, std::forward<Args>(args)...);
        log_with_context(level, message, LogContext{});
    }

    static void log_structured(LogLevel level, const std::string& message, const LogContext& context);

    static void log_error(const std::string& message, const std::exception& e, const LogContext& context = {});

    static void log_performance(const std::string& operation, uint64_t duration_ns, const LogContext& context = {});

    static std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static LogLevel level_from_string(const std::string& name);

private:
    static Config config_;
    static std::atomic<LogLevel> current_level_;
    static std::string logger_name_;
    static std::mutex log_mutex_;
    static std::unique_ptr<std::ofstream> log_file_;
    static std::unique_ptr<std::thread> async_thread_;
    static std::atomic<bool> async_shutdown_;
    static Sink sink_;

    static std::queue<Entry> async_queue_;
    static std::mutex async_mutex_;
    static std::condition_variable async_cv_;

    static void log_with_context(LogLevel level, const std::string& message, const LogContext& context);
    static void write_log_entry(const Entry& entry);
    static void async_logging_thread();

    static std::string format_log_entry(const Entry& entry);
    static std::string format_plain(const Entry& entry);
    static std::string format_json(const Entry& entry);
    static std::string format_logfmt(const Entry& entry);

    template<typename T>
    static std::string format_string(const std::string& format, T&& value) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string result = format;
            result.replace(pos, 2, oss.str());
            return result;
        }
        return format;
    }

    template<typename T, typename... Args>
    static std::string format_string(const std::string& format, T&& value, Args&&... args) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string partial = format;
            partial.replace(pos, 2, oss.str());
            return format_string(partial, std::forward<Args>(args)...);
        }
        return format;
    }

    static std::string format_string(const std::string& format) {
        return format;
    }
};

#define LOG_TRACE(...) warden::common::Logger::log(warden::common::LogLevel::TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) warden::common::Logger::log(warden::common::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...) warden::common::Logger::log(warden::common::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARNING(...) warden::common::Logger::log(warden::common::LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERROR(...) warden::common::Logger::log(warden::common::LogLevel::ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) warden::common::Logger::log(warden::common::LogLevel::CRITICAL, __VA_ARGS__)

#define LOG_STRUCTURED(level, message, context) \
    warden::common::Logger::log_structured(level, message, context)

#define LOG_ERROR_WITH_EXCEPTION(message, exception, context) \
    warden::common::Logger::log_error(message, exception, context)

#define LOG_PERFORMANCE(operation, duration_ns, context) \
    warden::common::Logger::log_performance(operation, duration_ns, context)

// Logs the lifetime of a scope as a performance entry
class PerformanceTimer {
public:
    explicit PerformanceTimer(const std::string& operation_name, const LogContext& context = {})
        : operation_name_(operation_name), context_(context),
          start_time_(std::chrono::steady_clock::now()) {}

    ~PerformanceTimer() {
        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time_);
        Logger::log_performance(operation_name_, duration.count(), context_);
    }

private:
    std::string operation_name_;
    LogContext context_;
    std::chrono::steady_clock::time_point start_time_;
};

#define PERFORMANCE_TIMER(operation_name) \
    warden::common::PerformanceTimer _perf_timer(operation_name)

#define PERFORMANCE_TIMER_WITH_CONTEXT(operation_name, context) \
    warden::common::PerformanceTimer _perf_timer(operation_name, context)

} // namespace common
} // namespace warden

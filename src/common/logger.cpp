#include "common/logger.hpp"
#include "common/types.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <json/json.h>
#include <typeinfo>

namespace warden {
namespace common {

Logger::Config Logger::config_;
std::atomic<LogLevel> Logger::current_level_{LogLevel::INFO};
std::string Logger::logger_name_ = "warden";
std::mutex Logger::log_mutex_;
std::unique_ptr<std::ofstream> Logger::log_file_;
std::unique_ptr<std::thread> Logger::async_thread_;
std::atomic<bool> Logger::async_shutdown_{false};
Logger::Sink Logger::sink_;
std::queue<Logger::Entry> Logger::async_queue_;
std::mutex Logger::async_mutex_;
std::condition_variable Logger::async_cv_;

namespace {

std::string format_timestamp(std::chrono::system_clock::time_point timestamp, bool utc) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    if (utc) {
        gmtime_r(&time_t, &tm_buf);
    } else {
        localtime_r(&time_t, &tm_buf);
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    if (utc) {
        oss << 'Z';
    }
    return oss.str();
}

std::string compact_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // namespace

std::string LogContext::to_json() const {
    Json::Value json(Json::objectValue);
    for (const auto& [key, value] : fields_) {
        json[key] = value;
    }
    return compact_json(json);
}

void Logger::initialize(const std::string& name, const Config& config) {
    shutdown();

    std::lock_guard<std::mutex> lock(log_mutex_);
    logger_name_ = name;
    config_ = config;
    current_level_.store(config.level);

    if (config_.enable_file_output) {
        log_file_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!log_file_->is_open()) {
            std::cerr << "Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }

    if (config_.enable_async_logging) {
        async_shutdown_.store(false);
        async_thread_ = std::make_unique<std::thread>(async_logging_thread);
    }
}

void Logger::set_level(LogLevel level) {
    current_level_.store(level);
}

LogLevel Logger::get_level() {
    return current_level_.load();
}

void Logger::set_format(OutputFormat format) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    config_.format = format;
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    sink_ = std::move(sink);
}

void Logger::shutdown() {
    if (async_thread_) {
        async_shutdown_.store(true);
        async_cv_.notify_all();
        if (async_thread_->joinable()) {
            async_thread_->join();
        }
        async_thread_.reset();
    }

    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_file_) {
        log_file_->close();
        log_file_.reset();
    }
}

LogLevel Logger::level_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical" || lower == "crit") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void Logger::log_structured(LogLevel level, const std::string& message, const LogContext& context) {
    if (!is_enabled(level)) return;
    log_with_context(level, message, context);
}

void Logger::log_error(const std::string& message, const std::exception& e, const LogContext& context) {
    if (!is_enabled(LogLevel::ERROR)) return;

    LogContext error_context = context;
    error_context.add("exception_type", typeid(e).name())
                 .add("exception_message", e.what());

    log_with_context(LogLevel::ERROR, message, error_context);
}

void Logger::log_performance(const std::string& operation, uint64_t duration_ns, const LogContext& context) {
    if (!is_enabled(LogLevel::DEBUG)) return;

    LogContext perf_context = context;
    perf_context.add("operation", operation)
                .add("duration_ns", std::to_string(duration_ns))
                .add("duration_ms", std::to_string(duration_ns / 1000000.0))
                .add("log_type", "performance");

    log_with_context(LogLevel::DEBUG, "Performance: " + operation, perf_context);
}

void Logger::log_with_context(LogLevel level, const std::string& message, const LogContext& context) {
    Entry entry{
        level,
        message,
        context,
        std::chrono::system_clock::now(),
        std::this_thread::get_id()
    };

    if (WARDEN_UNLIKELY(async_thread_ != nullptr)) {
        {
            std::lock_guard<std::mutex> lock(async_mutex_);
            async_queue_.push(std::move(entry));

            // Drop the oldest entries once the buffer is full
            while (async_queue_.size() > config_.async_buffer_size) {
                async_queue_.pop();
            }
        }
        async_cv_.notify_one();
    } else {
        write_log_entry(entry);
    }
}

void Logger::write_log_entry(const Entry& entry) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    std::string formatted = format_log_entry(entry);

    if (config_.enable_console_output) {
        std::ostream& out = entry.level >= LogLevel::ERROR ? std::cerr : std::cout;
        out << formatted << std::endl;
    }

    if (config_.enable_file_output && log_file_ && log_file_->is_open()) {
        *log_file_ << formatted << std::endl;
        log_file_->flush();
    }

    if (sink_) {
        sink_(entry, formatted);
    }
}

void Logger::async_logging_thread() {
    while (!async_shutdown_.load()) {
        std::unique_lock<std::mutex> lock(async_mutex_);
        async_cv_.wait(lock, [] { return !async_queue_.empty() || async_shutdown_.load(); });

        while (!async_queue_.empty()) {
            Entry entry = std::move(async_queue_.front());
            async_queue_.pop();
            lock.unlock();

            write_log_entry(entry);

            lock.lock();
        }
    }

    // Process remaining entries
    std::lock_guard<std::mutex> lock(async_mutex_);
    while (!async_queue_.empty()) {
        write_log_entry(async_queue_.front());
        async_queue_.pop();
    }
}

std::string Logger::format_log_entry(const Entry& entry) {
    switch (config_.format) {
        case OutputFormat::JSON:
            return format_json(entry);
        case OutputFormat::LOGFMT:
            return format_logfmt(entry);
        case OutputFormat::PLAIN:
        default:
            return format_plain(entry);
    }
}

std::string Logger::format_plain(const Entry& entry) {
    std::ostringstream oss;
    oss << format_timestamp(entry.timestamp, false);
    oss << " [" << level_to_string(entry.level) << "]";

    if (config_.include_thread_id) {
        oss << " [" << entry.thread_id << "]";
    }

    oss << " " << entry.message;

    const auto& fields = entry.context.get_fields();
    if (!fields.empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : fields) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

std::string Logger::format_json(const Entry& entry) {
    Json::Value json(Json::objectValue);
    json["timestamp"] = format_timestamp(entry.timestamp, true);
    json["level"] = level_to_string(entry.level);
    json["logger"] = logger_name_;
    json["message"] = entry.message;

    if (config_.include_thread_id) {
        std::ostringstream tid;
        tid << entry.thread_id;
        json["thread_id"] = tid.str();
    }

    for (const auto& [key, value] : entry.context.get_fields()) {
        json[key] = value;
    }

    return compact_json(json);
}

std::string Logger::format_logfmt(const Entry& entry) {
    std::ostringstream oss;
    oss << "timestamp=" << format_timestamp(entry.timestamp, true);
    oss << " level=" << level_to_string(entry.level);
    oss << " logger=" << logger_name_;
    oss << " message=\"" << entry.message << "\"";

    if (config_.include_thread_id) {
        oss << " thread_id=" << entry.thread_id;
    }

    for (const auto& [key, value] : entry.context.get_fields()) {
        if (value.find(' ') != std::string::npos) {
            oss << " " << key << "=\"" << value << "\"";
        } else {
            oss << " " << key << "=" << value;
        }
    }

    return oss.str();
}

} // namespace common
} // namespace warden

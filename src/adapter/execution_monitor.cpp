#include "adapter/execution_monitor.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace warden {
namespace adapter {

namespace {

std::string percent(double ratio) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << ratio * 100.0 << "%";
    return oss.str();
}

std::string compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

common::LogContext base_context(const ToolContext& context) {
    common::LogContext log_context;
    log_context.add("tool", context.tool_name)
               .add("operation", context.operation)
               .add("session_id", context.session_id)
               .add("trace_id", context.trace_id);
    if (!context.request_id.empty()) {
        log_context.add("request_id", context.request_id);
    }
    if (!context.user_id.empty()) {
        log_context.add("user_id", context.user_id);
    }
    return log_context;
}

} // namespace

ExecutionMonitor::ExecutionMonitor(std::shared_ptr<common::Clock> clock, size_t max_history)
    : clock_(clock ? std::move(clock) : common::default_clock())
    , max_history_(max_history == 0 ? 1 : max_history) {}

ExecutionMetrics ExecutionMonitor::log_start(const ToolContext& context) {
    ExecutionMetrics metrics;
    metrics.start_time = clock_->now();

    common::LogContext log_context = base_context(context);
    log_context.add("parameters", compact(context.parameters));
    LOG_STRUCTURED(common::LogLevel::INFO, "Tool execution started: " + context.tool_name, log_context);

    return metrics;
}

void ExecutionMonitor::log_complete(const ToolContext& context, const ExecutionMetrics& metrics,
                                    ExecutionStatus status, const std::optional<Json::Value>& result) {
    ExecutionRecord entry;
    entry.status = status;
    entry.context = context;
    entry.metrics = metrics;
    if (!entry.metrics.end_time) {
        entry.metrics.finish(clock_->now());
    }
    entry.result = result;

    common::LogContext log_context = base_context(context);
    log_context.add("status", execution_status_to_string(status))
               .add("duration_ms", entry.metrics.duration->count())
               .add("cache_hit", entry.metrics.cache_hit.value_or(false))
               .add("retry_count", entry.metrics.retry_count);
    LOG_STRUCTURED(common::LogLevel::INFO, "Tool execution completed: " + context.tool_name, log_context);

    record(std::move(entry));
}

void ExecutionMonitor::log_error(const ToolContext& context, const ExecutionMetrics& metrics,
                                 const std::exception& error) {
    ExecutionRecord entry;
    entry.status = ExecutionStatus::FAILURE;
    entry.context = context;
    entry.metrics = metrics;
    if (!entry.metrics.end_time) {
        entry.metrics.finish(clock_->now());
    }
    entry.metrics.error_count = std::max<u32>(entry.metrics.error_count, 1);
    entry.error_message = error.what();

    common::LogContext log_context = base_context(context);
    log_context.add("duration_ms", entry.metrics.duration->count())
               .add("retry_count", entry.metrics.retry_count);
    LOG_ERROR_WITH_EXCEPTION("Tool execution failed: " + context.tool_name, error, log_context);

    record(std::move(entry));
}

void ExecutionMonitor::log_warning(const ToolContext& context, const std::string& message,
                                   const Json::Value& details) {
    common::LogContext log_context = base_context(context);
    if (!details.isNull()) {
        log_context.add("details", compact(details));
    }
    LOG_STRUCTURED(common::LogLevel::WARNING, "Tool warning: " + message, log_context);

    std::lock_guard<std::mutex> lock(mutex_);
    aggregates_[context.tool_name].warning_count++;
}

void ExecutionMonitor::record(ExecutionRecord entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    ToolAggregate& aggregate = aggregates_[entry.context.tool_name];
    aggregate.total_executions++;
    switch (entry.status) {
        case ExecutionStatus::SUCCESS:
        case ExecutionStatus::CACHED:
            aggregate.success_count++;
            break;
        case ExecutionStatus::FAILURE:
            aggregate.failure_count++;
            break;
        case ExecutionStatus::PARTIAL:
            aggregate.partial_count++;
            break;
        case ExecutionStatus::DEGRADED:
            aggregate.degraded_count++;
            break;
    }
    if (entry.metrics.cache_hit.value_or(false)) {
        aggregate.cache_hits++;
    }
    aggregate.retry_count += entry.metrics.retry_count;
    if (entry.metrics.duration) {
        aggregate.total_duration_ms += static_cast<double>(entry.metrics.duration->count());
    }

    history_.push_back(std::move(entry));
    while (history_.size() > max_history_) {
        history_.pop_front();
    }
}

ToolMetrics ExecutionMonitor::to_metrics(const std::string& tool_name, const ToolAggregate& aggregate) {
    ToolMetrics metrics;
    metrics.tool_name = tool_name;
    metrics.total_executions = aggregate.total_executions;
    metrics.success_count = aggregate.success_count;
    metrics.failure_count = aggregate.failure_count;
    metrics.partial_count = aggregate.partial_count;
    metrics.degraded_count = aggregate.degraded_count;
    metrics.cache_hits = aggregate.cache_hits;
    metrics.retry_count = aggregate.retry_count;
    metrics.warning_count = aggregate.warning_count;

    if (aggregate.total_executions > 0) {
        const double total = static_cast<double>(aggregate.total_executions);
        metrics.avg_duration_ms = aggregate.total_duration_ms / total;
        metrics.cache_hit_rate = static_cast<double>(aggregate.cache_hits) / total;
        metrics.error_rate = static_cast<double>(aggregate.failure_count) / total;
        metrics.success_rate = static_cast<double>(aggregate.success_count) / total;
    }
    return metrics;
}

std::optional<ToolMetrics> ExecutionMonitor::get_metrics(const std::string& tool_name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = aggregates_.find(tool_name);
    if (it == aggregates_.end()) {
        return std::nullopt;
    }
    return to_metrics(it->first, it->second);
}

std::vector<ToolMetrics> ExecutionMonitor::get_all_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ToolMetrics> all;
    all.reserve(aggregates_.size());
    for (const auto& [name, aggregate] : aggregates_) {
        all.push_back(to_metrics(name, aggregate));
    }
    return all;
}

std::vector<ExecutionRecord> ExecutionMonitor::get_execution_history(
    const std::optional<std::string>& tool_name, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    // Most recent `limit` matching records, oldest first
    std::vector<ExecutionRecord> matches;
    for (auto it = history_.rbegin(); it != history_.rend() && matches.size() < limit; ++it) {
        if (!tool_name || it->context.tool_name == *tool_name) {
            matches.push_back(*it);
        }
    }
    return std::vector<ExecutionRecord>(matches.rbegin(), matches.rend());
}

void ExecutionMonitor::log_summary() const {
    for (const auto& metrics : get_all_metrics()) {
        if (metrics.total_executions == 0) {
            continue;
        }

        common::LogContext log_context;
        log_context.add("tool", metrics.tool_name)
                   .add("executions", metrics.total_executions)
                   .add("success_rate", percent(metrics.success_rate))
                   .add("avg_duration_ms", metrics.avg_duration_ms)
                   .add("cache_hit_rate", percent(metrics.cache_hit_rate))
                   .add("error_rate", percent(metrics.error_rate));
        LOG_STRUCTURED(common::LogLevel::INFO, "Tool metrics summary", log_context);
    }
}

size_t ExecutionMonitor::history_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

void ExecutionMonitor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
    aggregates_.clear();
}

} // namespace adapter
} // namespace warden

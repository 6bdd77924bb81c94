#pragma once

#include "adapter/tool_context.hpp"
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace adapter {

struct ExecutionRecord {
    ExecutionStatus status = ExecutionStatus::SUCCESS;
    ToolContext context;
    ExecutionMetrics metrics;
    std::optional<Json::Value> result;
    std::optional<std::string> error_message;
};

struct ToolMetrics {
    std::string tool_name;
    u64 total_executions = 0;
    u64 success_count = 0;      // SUCCESS and CACHED
    u64 failure_count = 0;
    u64 partial_count = 0;
    u64 degraded_count = 0;
    u64 cache_hits = 0;
    u64 retry_count = 0;
    u64 warning_count = 0;
    double avg_duration_ms = 0.0;
    double cache_hit_rate = 0.0;
    double error_rate = 0.0;
    double success_rate = 0.0;
};

/**
 * Sink for per-invocation logging and metrics.
 *
 * Adapters call log_start once per execute(), then exactly one of
 * log_complete or log_error with the metrics returned by log_start.
 */
class ExecutionLogger {
public:
    virtual ~ExecutionLogger() = default;

    virtual ExecutionMetrics log_start(const ToolContext& context) = 0;
    virtual void log_complete(const ToolContext& context, const ExecutionMetrics& metrics,
                              ExecutionStatus status,
                              const std::optional<Json::Value>& result = std::nullopt) = 0;
    virtual void log_error(const ToolContext& context, const ExecutionMetrics& metrics,
                           const std::exception& error) = 0;
    virtual void log_warning(const ToolContext& context, const std::string& message,
                             const Json::Value& details = Json::Value()) = 0;

    virtual std::optional<ToolMetrics> get_metrics(const std::string& tool_name) const = 0;
    virtual std::vector<ToolMetrics> get_all_metrics() const = 0;
    virtual std::vector<ExecutionRecord> get_execution_history(
        const std::optional<std::string>& tool_name = std::nullopt, size_t limit = 100) const = 0;
};

} // namespace adapter
} // namespace warden

#pragma once

#include "adapter/execution_logger.hpp"
#include "common/clock.hpp"
#include <deque>
#include <map>
#include <memory>
#include <mutex>

namespace warden {
namespace adapter {

/**
 * Default ExecutionLogger backed by the process logger.
 *
 * Keeps a bounded history of finished invocations and running per-tool
 * aggregates. Each record is logged with the tool, operation, session and
 * trace ids as structured fields.
 */
class ExecutionMonitor : public ExecutionLogger {
public:
    static constexpr size_t DEFAULT_MAX_HISTORY = 10000;

    explicit ExecutionMonitor(std::shared_ptr<common::Clock> clock = common::default_clock(),
                              size_t max_history = DEFAULT_MAX_HISTORY);

    ExecutionMetrics log_start(const ToolContext& context) override;
    void log_complete(const ToolContext& context, const ExecutionMetrics& metrics,
                      ExecutionStatus status,
                      const std::optional<Json::Value>& result = std::nullopt) override;
    void log_error(const ToolContext& context, const ExecutionMetrics& metrics,
                   const std::exception& error) override;
    void log_warning(const ToolContext& context, const std::string& message,
                     const Json::Value& details = Json::Value()) override;

    std::optional<ToolMetrics> get_metrics(const std::string& tool_name) const override;
    std::vector<ToolMetrics> get_all_metrics() const override;
    std::vector<ExecutionRecord> get_execution_history(
        const std::optional<std::string>& tool_name = std::nullopt, size_t limit = 100) const override;

    // One INFO line per tool with rates and average duration
    void log_summary() const;

    size_t history_size() const;
    void reset();

private:
    struct ToolAggregate {
        u64 total_executions = 0;
        u64 success_count = 0;
        u64 failure_count = 0;
        u64 partial_count = 0;
        u64 degraded_count = 0;
        u64 cache_hits = 0;
        u64 retry_count = 0;
        u64 warning_count = 0;
        double total_duration_ms = 0.0;
    };

    void record(ExecutionRecord record);
    static ToolMetrics to_metrics(const std::string& tool_name, const ToolAggregate& aggregate);

    std::shared_ptr<common::Clock> clock_;
    const size_t max_history_;

    mutable std::mutex mutex_;
    std::deque<ExecutionRecord> history_;
    std::map<std::string, ToolAggregate> aggregates_;
};

} // namespace adapter
} // namespace warden

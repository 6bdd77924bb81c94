#include "runtime/service_runtime.hpp"
#include "common/logger.hpp"
#include <iomanip>
#include <sstream>

namespace warden {
namespace runtime {

namespace {

constexpr double MAX_HEALTHY_FAILURE_RATE = 0.05;

void write_metric(std::ostringstream& oss, const std::string& name, const std::string& help,
                  const std::string& type, double value, const std::string& labels = "") {
    oss << "# HELP " << name << " " << help << "\n";
    oss << "# TYPE " << name << " " << type << "\n";
    oss << name << labels << " " << value << "\n";
}

} // namespace

ServiceRuntime::ServiceRuntime(const RuntimeConfig& config, std::shared_ptr<common::Clock> clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : common::default_clock()) {

    if (config_.configure_logger) {
        common::Logger::initialize("warden", config_.logger);
        owns_logger_ = true;
    }

    cache_ = std::make_unique<cache::CacheManager>(config_.cache, clock_);
    error_handler_ = std::make_unique<resilience::ErrorHandler>(config_.error_handler, clock_);
    monitor_ = std::make_unique<adapter::ExecutionMonitor>(clock_, config_.max_history);

    LOG_DEBUG("Service runtime created");
}

ServiceRuntime::~ServiceRuntime() {
    shutdown();
    if (owns_logger_) {
        common::Logger::shutdown();
    }
}

void ServiceRuntime::start() {
    if (running_.exchange(true)) {
        return;
    }
    cache_->start_cleanup();
    LOG_INFO("Service runtime started");
}

void ServiceRuntime::shutdown() {
    error_handler_->cancel_pending_retries();
    cache_->stop_cleanup();

    if (running_.exchange(false)) {
        monitor_->log_summary();
        LOG_INFO("Service runtime shutdown complete");
    }
}

void ServiceRuntime::reset() {
    cache_->reset();
    error_handler_->reset();
    monitor_->reset();
    LOG_INFO("Service runtime state reset");
}

ServiceRuntime::Stats ServiceRuntime::get_stats() const {
    Stats stats;
    stats.cache_metrics = cache_->get_aggregate_metrics();
    stats.cache_health = cache_->get_health_status().status;
    stats.circuit_breaker_stats = error_handler_->circuit_breakers().get_aggregated_stats();

    for (const auto& tool : monitor_->get_all_metrics()) {
        stats.total_executions += tool.total_executions;
        stats.successful_executions += tool.success_count;
        stats.failed_executions += tool.failure_count;
        stats.degraded_executions += tool.degraded_count + tool.partial_count;
        stats.cache_hits += tool.cache_hits;
        stats.retries += tool.retry_count;
    }

    if (stats.total_executions > 0) {
        stats.overall_success_rate =
            static_cast<double>(stats.successful_executions) / static_cast<double>(stats.total_executions);
    } else {
        stats.overall_success_rate = 1.0;
    }
    return stats;
}

bool ServiceRuntime::is_healthy() const {
    const Stats stats = get_stats();

    const bool circuit_breakers_healthy = stats.circuit_breaker_stats.open_circuits == 0;
    const bool cache_healthy = stats.cache_health != cache::HealthState::CRITICAL;
    const bool failure_rate_healthy = stats.total_executions == 0 ||
        static_cast<double>(stats.failed_executions) / static_cast<double>(stats.total_executions)
            <= MAX_HEALTHY_FAILURE_RATE;

    return circuit_breakers_healthy && cache_healthy && failure_rate_healthy;
}

std::string ServiceRuntime::export_prometheus_metrics() const {
    const Stats stats = get_stats();
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4);

    // Cache metrics
    write_metric(oss, "warden_cache_hits_total", "Cache hits across all layers", "counter",
                 static_cast<double>(stats.cache_metrics.hits));
    write_metric(oss, "warden_cache_misses_total", "Cache misses across all layers", "counter",
                 static_cast<double>(stats.cache_metrics.misses));
    write_metric(oss, "warden_cache_evictions_total", "Cache evictions across all layers", "counter",
                 static_cast<double>(stats.cache_metrics.evictions));
    write_metric(oss, "warden_cache_entries", "Entries held across all layers", "gauge",
                 static_cast<double>(stats.cache_metrics.entry_count));
    write_metric(oss, "warden_cache_memory_bytes", "Estimated cache memory usage", "gauge",
                 static_cast<double>(stats.cache_metrics.memory_usage));
    write_metric(oss, "warden_cache_hit_rate", "Overall cache hit rate", "gauge",
                 stats.cache_metrics.hit_rate);

    oss << "# HELP warden_cache_layer_entries Entries held per cache layer\n";
    oss << "# TYPE warden_cache_layer_entries gauge\n";
    for (const auto& [layer, metrics] : cache_->get_all_metrics()) {
        oss << "warden_cache_layer_entries{layer=\"" << cache::layer_to_string(layer) << "\"} "
            << metrics.entry_count << "\n";
    }

    // Circuit breaker metrics
    write_metric(oss, "warden_circuit_breaker_total", "Total number of circuit breakers", "gauge",
                 static_cast<double>(stats.circuit_breaker_stats.total_circuits));
    write_metric(oss, "warden_circuit_breaker_open", "Number of open circuit breakers", "gauge",
                 static_cast<double>(stats.circuit_breaker_stats.open_circuits));
    write_metric(oss, "warden_circuit_breaker_requests_total", "Total circuit breaker requests", "counter",
                 static_cast<double>(stats.circuit_breaker_stats.total_requests));
    write_metric(oss, "warden_circuit_breaker_rejections_total", "Calls rejected by open breakers", "counter",
                 static_cast<double>(stats.circuit_breaker_stats.total_rejections));

    // Execution metrics
    write_metric(oss, "warden_executions_total", "Total adapter executions", "counter",
                 static_cast<double>(stats.total_executions));
    write_metric(oss, "warden_executions_failed_total", "Executions that raised an error", "counter",
                 static_cast<double>(stats.failed_executions));
    write_metric(oss, "warden_executions_degraded_total", "Executions answered by a fallback", "counter",
                 static_cast<double>(stats.degraded_executions));
    write_metric(oss, "warden_retries_total", "Retries performed by adapters", "counter",
                 static_cast<double>(stats.retries));
    write_metric(oss, "warden_success_rate", "Overall execution success rate", "gauge",
                 stats.overall_success_rate);
    write_metric(oss, "warden_runtime_healthy", "Runtime health status", "gauge",
                 is_healthy() ? 1.0 : 0.0);

    return oss.str();
}

} // namespace runtime
} // namespace warden

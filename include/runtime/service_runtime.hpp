#pragma once

#include "adapter/execution_monitor.hpp"
#include "adapter/service_adapter.hpp"
#include "cache/cache_manager.hpp"
#include "common/clock.hpp"
#include "resilience/error_handler.hpp"
#include "runtime/runtime_config.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace warden {
namespace runtime {

/**
 * Composition root for the caching and resilience state.
 *
 * Owns the cache manager, error handler (with its breaker registry) and
 * execution monitor that all adapters built by make_adapter() share.
 * Nothing here is global: tests build as many isolated runtimes as they
 * need and tear them down with shutdown().
 */
class ServiceRuntime {
public:
    explicit ServiceRuntime(const RuntimeConfig& config = RuntimeConfig{},
                            std::shared_ptr<common::Clock> clock = common::default_clock());
    ~ServiceRuntime();

    ServiceRuntime(const ServiceRuntime&) = delete;
    ServiceRuntime& operator=(const ServiceRuntime&) = delete;

    // Starts the cache cleanup thread
    void start();
    // Stops background work and cancels pending retry delays
    void shutdown();
    // Clears caches, breakers and execution history
    void reset();
    bool is_running() const { return running_.load(); }

    template<typename Params, typename Result>
    std::unique_ptr<adapter::ServiceAdapter<Params, Result>>
    make_adapter(std::shared_ptr<adapter::ServiceOperation<Params, Result>> operation) {
        return make_adapter(std::move(operation), config_.fallback);
    }

    template<typename Params, typename Result>
    std::unique_ptr<adapter::ServiceAdapter<Params, Result>>
    make_adapter(std::shared_ptr<adapter::ServiceOperation<Params, Result>> operation,
                 const adapter::FallbackConfig& fallback_config) {
        return std::make_unique<adapter::ServiceAdapter<Params, Result>>(
            std::move(operation), *cache_, *error_handler_, *monitor_, fallback_config, clock_);
    }

    cache::CacheManager& cache() { return *cache_; }
    resilience::ErrorHandler& error_handler() { return *error_handler_; }
    adapter::ExecutionMonitor& monitor() { return *monitor_; }
    const RuntimeConfig& config() const { return config_; }
    std::shared_ptr<common::Clock> clock() const { return clock_; }

    struct Stats {
        cache::CacheMetrics cache_metrics;
        cache::HealthState cache_health = cache::HealthState::HEALTHY;
        resilience::CircuitBreakerRegistry::AggregatedStats circuit_breaker_stats;
        u64 total_executions = 0;
        u64 successful_executions = 0;
        u64 failed_executions = 0;
        u64 degraded_executions = 0;
        u64 cache_hits = 0;
        u64 retries = 0;
        double overall_success_rate = 0.0;
    };

    Stats get_stats() const;

    // No open breakers, cache not critical and at most 5% failed executions
    bool is_healthy() const;

    std::string export_prometheus_metrics() const;

private:
    const RuntimeConfig config_;
    std::shared_ptr<common::Clock> clock_;

    std::unique_ptr<cache::CacheManager> cache_;
    std::unique_ptr<resilience::ErrorHandler> error_handler_;
    std::unique_ptr<adapter::ExecutionMonitor> monitor_;

    std::atomic<bool> running_{false};
    bool owns_logger_ = false;
};

} // namespace runtime
} // namespace warden

#pragma once

#include "adapter/fallback_config.hpp"
#include "cache/cache_manager.hpp"
#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "resilience/error_handler.hpp"
#include <string>

namespace warden {
namespace runtime {

/**
 * Settings for one ServiceRuntime.
 *
 * Recognised INI sections (every key optional):
 *
 *   [cache]              max_total_memory_mb, cleanup_interval_ms
 *   [cache.<layer>]      max_entries, max_memory_mb, ttl_ms (0 = never expires),
 *                        eviction_policy (lru | lfu | ttl)
 *   [circuit_breaker]    failure_threshold, recovery_timeout_ms, half_open_max_calls
 *   [retry]              max_attempts, base_delay_ms, backoff_multiplier, max_delay_ms
 *   [adapter]            enable_fallback, fallback_strategy, fallback_chain,
 *                        max_retries, retry_delay_ms, backoff_multiplier,
 *                        max_retry_delay_ms, operation_timeout_ms
 *   [monitor]            max_history
 *   [logger]             level, format (plain | json | logfmt), console, file, async
 */
struct RuntimeConfig {
    cache::CacheManager::Config cache = cache::CacheManager::Config::defaults();
    resilience::ErrorHandler::Config error_handler;
    adapter::FallbackConfig fallback;
    size_t max_history = 10000;

    // The runtime only reconfigures the process logger when asked to
    bool configure_logger = false;
    common::Logger::Config logger;

    // Throws ConfigException on values that cannot be interpreted
    static RuntimeConfig from_config(const common::ConfigManager& config);
    static RuntimeConfig from_file(const std::string& path);
};

} // namespace runtime
} // namespace warden

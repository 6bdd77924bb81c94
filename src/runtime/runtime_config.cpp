#include "runtime/runtime_config.hpp"
#include "common/error_handling.hpp"
#include <sstream>

namespace warden {
namespace runtime {

namespace {

constexpr size_t MiB = 1024 * 1024;

Milliseconds millis(const common::ConfigManager& config, const std::string& key, Milliseconds fallback) {
    const i64 value = config.get<i64>(key, fallback.count());
    WARDEN_THROW_IF(value < 0, ConfigException, key + " must not be negative");
    return Milliseconds(value);
}

size_t count(const common::ConfigManager& config, const std::string& key, size_t fallback) {
    const i64 value = config.get<i64>(key, static_cast<i64>(fallback));
    WARDEN_THROW_IF(value < 0, ConfigException, key + " must not be negative");
    return static_cast<size_t>(value);
}

adapter::FallbackStrategy strategy(const std::string& key, const std::string& name) {
    auto parsed = adapter::fallback_strategy_from_string(name);
    WARDEN_THROW_IF(!parsed, ConfigException, "unknown fallback strategy '" + name + "' in " + key);
    return *parsed;
}

void apply_cache(const common::ConfigManager& config, cache::CacheManager::Config& out) {
    out.max_total_memory_bytes = count(config, "cache.max_total_memory_mb", out.max_total_memory_bytes / MiB) * MiB;
    out.cleanup_interval = millis(config, "cache.cleanup_interval_ms", out.cleanup_interval);

    for (cache::CacheLayer layer : cache::ALL_CACHE_LAYERS) {
        const std::string section = std::string("cache.") + cache::layer_to_string(layer) + ".";
        cache::CacheLayerConfig& layer_config = out.layers[layer];

        layer_config.max_entries = count(config, section + "max_entries", layer_config.max_entries);
        layer_config.max_memory_bytes =
            count(config, section + "max_memory_mb", layer_config.max_memory_bytes / MiB) * MiB;

        if (config.has_key(section + "ttl_ms")) {
            const Milliseconds ttl = millis(config, section + "ttl_ms", Milliseconds(0));
            layer_config.default_ttl = ttl.count() == 0 ? std::nullopt : std::optional<Milliseconds>(ttl);
        }

        if (config.has_key(section + "eviction_policy")) {
            const std::string name = config.get<std::string>(section + "eviction_policy");
            auto policy = cache::eviction_policy_from_string(name);
            WARDEN_THROW_IF(!policy, ConfigException,
                            "unknown eviction policy '" + name + "' in " + section + "eviction_policy");
            layer_config.eviction_policy = *policy;
        }
    }
}

void apply_error_handler(const common::ConfigManager& config, resilience::ErrorHandler::Config& out) {
    out.circuit_breaker.failure_threshold = static_cast<u32>(
        count(config, "circuit_breaker.failure_threshold", out.circuit_breaker.failure_threshold));
    out.circuit_breaker.recovery_timeout =
        millis(config, "circuit_breaker.recovery_timeout_ms", out.circuit_breaker.recovery_timeout);
    out.circuit_breaker.half_open_max_calls = static_cast<u32>(
        count(config, "circuit_breaker.half_open_max_calls", out.circuit_breaker.half_open_max_calls));

    out.retry.max_attempts = static_cast<u32>(count(config, "retry.max_attempts", out.retry.max_attempts));
    out.retry.base_delay = millis(config, "retry.base_delay_ms", out.retry.base_delay);
    out.retry.backoff_multiplier = config.get<double>("retry.backoff_multiplier", out.retry.backoff_multiplier);
    out.retry.max_delay = millis(config, "retry.max_delay_ms", out.retry.max_delay);
    out.enable_fallbacks = config.get<bool>("adapter.enable_fallback", out.enable_fallbacks);

    WARDEN_THROW_IF(out.circuit_breaker.failure_threshold == 0, ConfigException,
                    "circuit_breaker.failure_threshold must be positive");
}

void apply_fallback(const common::ConfigManager& config, adapter::FallbackConfig& out) {
    out.enable_fallback = config.get<bool>("adapter.enable_fallback", out.enable_fallback);
    if (config.has_key("adapter.fallback_strategy")) {
        out.fallback_strategy = strategy("adapter.fallback_strategy",
                                         config.get<std::string>("adapter.fallback_strategy"));
    }
    if (config.has_key("adapter.fallback_chain")) {
        out.fallback_chain.clear();
        std::istringstream items(config.get<std::string>("adapter.fallback_chain"));
        std::string item;
        while (std::getline(items, item, ',')) {
            item.erase(0, item.find_first_not_of(" \t"));
            item.erase(item.find_last_not_of(" \t") + 1);
            if (!item.empty()) {
                out.fallback_chain.push_back(strategy("adapter.fallback_chain", item));
            }
        }
    }

    out.max_retries = static_cast<u32>(count(config, "adapter.max_retries", out.max_retries));
    out.retry_delay = millis(config, "adapter.retry_delay_ms", out.retry_delay);
    out.backoff_multiplier = config.get<double>("adapter.backoff_multiplier", out.backoff_multiplier);
    out.max_retry_delay = millis(config, "adapter.max_retry_delay_ms", out.max_retry_delay);
    out.operation_timeout = millis(config, "adapter.operation_timeout_ms", out.operation_timeout);
}

void apply_logger(const common::ConfigManager& config, common::Logger::Config& out) {
    out.level = common::Logger::level_from_string(config.get<std::string>("logger.level", "info"));

    const std::string format = config.get<std::string>("logger.format", "plain");
    if (format == "json") {
        out.format = common::Logger::OutputFormat::JSON;
    } else if (format == "logfmt") {
        out.format = common::Logger::OutputFormat::LOGFMT;
    } else if (format == "plain") {
        out.format = common::Logger::OutputFormat::PLAIN;
    } else {
        throw ConfigException("unknown logger.format '" + format + "'");
    }

    out.enable_console_output = config.get<bool>("logger.console", out.enable_console_output);
    if (config.has_key("logger.file")) {
        out.enable_file_output = true;
        out.log_file_path = config.get<std::string>("logger.file");
    }
    out.enable_async_logging = config.get<bool>("logger.async", out.enable_async_logging);
}

} // namespace

RuntimeConfig RuntimeConfig::from_config(const common::ConfigManager& config) {
    RuntimeConfig result;

    apply_cache(config, result.cache);
    apply_error_handler(config, result.error_handler);
    apply_fallback(config, result.fallback);
    result.max_history = count(config, "monitor.max_history", result.max_history);

    if (!config.get_section_keys("logger").empty()) {
        result.configure_logger = true;
        apply_logger(config, result.logger);
    }

    return result;
}

RuntimeConfig RuntimeConfig::from_file(const std::string& path) {
    common::ConfigManager config;
    WARDEN_THROW_IF(!config.load_from_file(path), ConfigException, "cannot read " + path);
    return from_config(config);
}

} // namespace runtime
} // namespace warden

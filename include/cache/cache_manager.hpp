#pragma once

#include "common/clock.hpp"
#include "common/types.hpp"
#include <json/json.h>
#include <array>
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace warden::cache {

// Named partitions; identical keys in different layers never collide
enum class CacheLayer {
    PROJECT_ANALYSIS,
    TEMPLATE_COMPILATION,
    CONFIGURATION,
    COVERAGE,
    DEPENDENCIES,
    TEST_GENERATION,
    TEST_EXECUTION
};

constexpr std::array<CacheLayer, 7> ALL_CACHE_LAYERS = {
    CacheLayer::PROJECT_ANALYSIS,
    CacheLayer::TEMPLATE_COMPILATION,
    CacheLayer::CONFIGURATION,
    CacheLayer::COVERAGE,
    CacheLayer::DEPENDENCIES,
    CacheLayer::TEST_GENERATION,
    CacheLayer::TEST_EXECUTION
};

const char* layer_to_string(CacheLayer layer);
std::optional<CacheLayer> layer_from_string(const std::string& name);

enum class EvictionPolicy {
    LRU,    // oldest last access, then fewest accesses
    LFU,    // fewest accesses, then oldest last access
    TTL     // expired first, then soonest expiry, then LRU
};

const char* eviction_policy_to_string(EvictionPolicy policy);
std::optional<EvictionPolicy> eviction_policy_from_string(const std::string& name);

struct CacheLayerConfig {
    size_t max_entries = 100;
    size_t max_memory_bytes = 10 * 1024 * 1024;
    std::optional<Milliseconds> default_ttl;   // empty means entries never expire
    EvictionPolicy eviction_policy = EvictionPolicy::LRU;

    static CacheLayerConfig defaults_for(CacheLayer layer);
};

struct CacheEntry {
    std::string key;
    Json::Value value;
    timestamp_t created_at;
    std::optional<timestamp_t> expires_at;
    timestamp_t last_accessed_at;
    u64 access_count = 0;
    size_t size_bytes = 0;

    bool is_expired(timestamp_t now) const {
        return expires_at.has_value() && *expires_at <= now;
    }
};

struct CacheMetrics {
    u64 hits = 0;
    u64 misses = 0;
    double hit_rate = 0.0;
    u64 evictions = 0;
    size_t entry_count = 0;
    size_t memory_usage = 0;
};

enum class HealthState {
    HEALTHY,
    DEGRADED,
    CRITICAL
};

const char* health_state_to_string(HealthState state);

struct LayerHealth {
    CacheLayer layer;
    HealthState status;
    CacheMetrics metrics;
    double memory_utilization;
    double entry_utilization;
};

struct HealthStatus {
    HealthState status = HealthState::HEALTHY;
    size_t total_memory_usage = 0;
    size_t total_entries = 0;
    double overall_hit_rate = 0.0;
    std::vector<LayerHealth> layer_status;
};

/**
 * Layered in-memory cache for operation results.
 *
 * Every layer has its own entry map, TTL default, eviction policy, budgets
 * and counters, guarded by a per-layer mutex. Expired entries are purged
 * lazily on read and by a background cleanup thread started with
 * start_cleanup(). Cache faults never reach the caller: reads degrade to a
 * miss and writes to a no-op.
 */
class CacheManager {
public:
    struct Config {
        std::map<CacheLayer, CacheLayerConfig> layers;
        size_t max_total_memory_bytes = 256 * 1024 * 1024;
        Milliseconds cleanup_interval{60000};

        // Per-layer defaults for every layer
        static Config defaults();
    };

    CacheManager() : CacheManager(Config::defaults()) {}
    explicit CacheManager(const Config& config,
                          std::shared_ptr<common::Clock> clock = common::default_clock());
    ~CacheManager();

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    // Core cache operations
    std::optional<Json::Value> get(CacheLayer layer, const std::string& key) noexcept;
    void set(CacheLayer layer, const std::string& key, const Json::Value& value,
             std::optional<Milliseconds> ttl = std::nullopt) noexcept;
    bool remove(CacheLayer layer, const std::string& key) noexcept;
    void clear(CacheLayer layer) noexcept;
    void clear_all() noexcept;

    // Returns the stored value even when expired; does not touch metrics
    std::optional<Json::Value> get_stale(CacheLayer layer, const std::string& key) const noexcept;

    // Statistics and monitoring
    CacheMetrics get_metrics(CacheLayer layer) const;
    CacheMetrics get_aggregate_metrics() const;
    std::map<CacheLayer, CacheMetrics> get_all_metrics() const;
    HealthStatus get_health_status() const;

    // Background expiry
    void start_cleanup();
    void stop_cleanup();
    bool is_cleanup_running() const { return cleanup_running_.load(); }
    size_t cleanup_expired();

    // Drops all entries and zeroes all counters
    void reset();
    // Stops background work and drops all entries
    void shutdown();

    const CacheLayerConfig& layer_config(CacheLayer layer) const;
    size_t total_memory_usage() const { return total_memory_.load(); }
    size_t max_total_memory_bytes() const { return max_total_memory_bytes_; }

    static size_t estimate_size(const Json::Value& value);

private:
    struct Layer {
        explicit Layer(const CacheLayerConfig& cfg) : config(cfg) {}

        CacheLayerConfig config;
        mutable std::mutex mutex;
        std::unordered_map<std::string, CacheEntry> entries;
        size_t memory_usage = 0;

        std::atomic<u64> hits{0};
        std::atomic<u64> misses{0};
        std::atomic<u64> evictions{0};
    };

    Layer& layer_for(CacheLayer layer);
    const Layer& layer_for(CacheLayer layer) const;

    // Callers hold layer.mutex
    void erase_entry_locked(Layer& layer, std::unordered_map<std::string, CacheEntry>::iterator it);
    // Never picks written_key while another entry can go instead
    void evict_locked(Layer& layer, CacheLayer id, timestamp_t now, const std::string& written_key);
    std::unordered_map<std::string, CacheEntry>::iterator
    select_victim_locked(Layer& layer, timestamp_t now, const std::string& protected_key);
    bool exceeds_alone_locked(const Layer& layer, const CacheEntry& entry) const;
    bool over_budget_locked(const Layer& layer) const;

    CacheMetrics snapshot(const Layer& layer) const;
    void cleanup_thread_main();

    std::shared_ptr<common::Clock> clock_;
    size_t max_total_memory_bytes_;
    Milliseconds cleanup_interval_;
    std::array<std::unique_ptr<Layer>, ALL_CACHE_LAYERS.size()> layers_;
    std::atomic<size_t> total_memory_{0};

    std::thread cleanup_thread_;
    std::atomic<bool> cleanup_running_{false};
    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_cv_;
};

} // namespace warden::cache

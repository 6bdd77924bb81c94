#include "cache/cache_manager.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace warden::cache {

namespace {

constexpr double CRITICAL_MEMORY_RATIO = 0.9;
constexpr double DEGRADED_MEMORY_RATIO = 0.75;
constexpr double FULL_LAYER_RATIO = 0.9;
constexpr double MIN_HEALTHY_HIT_RATE = 0.5;
constexpr u64 MIN_LOOKUPS_FOR_HIT_RATE = 20;

constexpr size_t MiB = 1024 * 1024;

double ratio(size_t value, size_t budget) {
    return budget == 0 ? 0.0 : static_cast<double>(value) / static_cast<double>(budget);
}

double compute_hit_rate(u64 hits, u64 misses) {
    const u64 total = hits + misses;
    return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
}

} // namespace

const char* layer_to_string(CacheLayer layer) {
    switch (layer) {
        case CacheLayer::PROJECT_ANALYSIS: return "project_analysis";
        case CacheLayer::TEMPLATE_COMPILATION: return "template_compilation";
        case CacheLayer::CONFIGURATION: return "configuration";
        case CacheLayer::COVERAGE: return "coverage";
        case CacheLayer::DEPENDENCIES: return "dependencies";
        case CacheLayer::TEST_GENERATION: return "test_generation";
        case CacheLayer::TEST_EXECUTION: return "test_execution";
    }
    return "unknown";
}

std::optional<CacheLayer> layer_from_string(const std::string& name) {
    for (CacheLayer layer : ALL_CACHE_LAYERS) {
        if (name == layer_to_string(layer)) {
            return layer;
        }
    }
    return std::nullopt;
}

const char* eviction_policy_to_string(EvictionPolicy policy) {
    switch (policy) {
        case EvictionPolicy::LRU: return "lru";
        case EvictionPolicy::LFU: return "lfu";
        case EvictionPolicy::TTL: return "ttl";
    }
    return "unknown";
}

std::optional<EvictionPolicy> eviction_policy_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "lru") return EvictionPolicy::LRU;
    if (lower == "lfu") return EvictionPolicy::LFU;
    if (lower == "ttl") return EvictionPolicy::TTL;
    return std::nullopt;
}

const char* health_state_to_string(HealthState state) {
    switch (state) {
        case HealthState::HEALTHY: return "healthy";
        case HealthState::DEGRADED: return "degraded";
        case HealthState::CRITICAL: return "critical";
    }
    return "unknown";
}

CacheLayerConfig CacheLayerConfig::defaults_for(CacheLayer layer) {
    using std::chrono::minutes;
    auto ttl = [](minutes m) { return std::optional<Milliseconds>(std::chrono::duration_cast<Milliseconds>(m)); };

    switch (layer) {
        case CacheLayer::PROJECT_ANALYSIS:
            return {100, 50 * MiB, ttl(minutes(10)), EvictionPolicy::LRU};
        case CacheLayer::TEMPLATE_COMPILATION:
            return {500, 100 * MiB, std::nullopt, EvictionPolicy::LFU};
        case CacheLayer::CONFIGURATION:
            return {50, 10 * MiB, ttl(minutes(5)), EvictionPolicy::TTL};
        case CacheLayer::COVERAGE:
            return {200, 30 * MiB, ttl(minutes(5)), EvictionPolicy::LRU};
        case CacheLayer::DEPENDENCIES:
            return {100, 20 * MiB, ttl(minutes(30)), EvictionPolicy::LRU};
        case CacheLayer::TEST_GENERATION:
            return {150, 40 * MiB, ttl(minutes(15)), EvictionPolicy::LRU};
        case CacheLayer::TEST_EXECUTION:
            return {100, 25 * MiB, ttl(minutes(5)), EvictionPolicy::LRU};
    }
    return {};
}

CacheManager::Config CacheManager::Config::defaults() {
    Config config;
    for (CacheLayer layer : ALL_CACHE_LAYERS) {
        config.layers[layer] = CacheLayerConfig::defaults_for(layer);
    }
    return config;
}

CacheManager::CacheManager(const Config& config, std::shared_ptr<common::Clock> clock)
    : clock_(clock ? std::move(clock) : common::default_clock())
    , max_total_memory_bytes_(config.max_total_memory_bytes)
    , cleanup_interval_(config.cleanup_interval) {

    for (CacheLayer layer : ALL_CACHE_LAYERS) {
        auto it = config.layers.find(layer);
        const CacheLayerConfig layer_config =
            it != config.layers.end() ? it->second : CacheLayerConfig::defaults_for(layer);
        layers_[static_cast<size_t>(layer)] = std::make_unique<Layer>(layer_config);
    }
}

CacheManager::~CacheManager() {
    stop_cleanup();
}

CacheManager::Layer& CacheManager::layer_for(CacheLayer layer) {
    return *layers_[static_cast<size_t>(layer)];
}

const CacheManager::Layer& CacheManager::layer_for(CacheLayer layer) const {
    return *layers_[static_cast<size_t>(layer)];
}

const CacheLayerConfig& CacheManager::layer_config(CacheLayer layer) const {
    return layer_for(layer).config;
}

size_t CacheManager::estimate_size(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value).size() * 2;
}

std::optional<Json::Value> CacheManager::get(CacheLayer layer_id, const std::string& key) noexcept {
    try {
        Layer& layer = layer_for(layer_id);
        const timestamp_t now = clock_->now();

        std::lock_guard<std::mutex> lock(layer.mutex);
        auto it = layer.entries.find(key);
        if (it == layer.entries.end()) {
            layer.misses.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        if (it->second.is_expired(now)) {
            erase_entry_locked(layer, it);
            layer.misses.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        CacheEntry& entry = it->second;
        entry.last_accessed_at = now;
        ++entry.access_count;
        layer.hits.fetch_add(1, std::memory_order_relaxed);
        return entry.value;

    } catch (const std::exception& e) {
        LOG_DEBUG("Cache get failed for {}:{}: {}", layer_to_string(layer_id), key, e.what());
        return std::nullopt;
    }
}

void CacheManager::set(CacheLayer layer_id, const std::string& key, const Json::Value& value,
                       std::optional<Milliseconds> ttl) noexcept {
    try {
        Layer& layer = layer_for(layer_id);
        const timestamp_t now = clock_->now();
        const size_t size = estimate_size(value);

        const std::optional<Milliseconds> effective_ttl = ttl ? ttl : layer.config.default_ttl;

        CacheEntry entry;
        entry.key = key;
        entry.value = value;
        entry.created_at = now;
        entry.last_accessed_at = now;
        entry.size_bytes = size;
        if (effective_ttl) {
            entry.expires_at = now + *effective_ttl;
        }

        std::lock_guard<std::mutex> lock(layer.mutex);
        auto existing = layer.entries.find(key);
        if (existing != layer.entries.end()) {
            erase_entry_locked(layer, existing);
        }

        layer.entries.emplace(key, std::move(entry));
        layer.memory_usage += size;
        total_memory_.fetch_add(size);

        evict_locked(layer, layer_id, now, key);

    } catch (const std::exception& e) {
        LOG_DEBUG("Cache set failed for {}:{}: {}", layer_to_string(layer_id), key, e.what());
    }
}

bool CacheManager::remove(CacheLayer layer_id, const std::string& key) noexcept {
    Layer& layer = layer_for(layer_id);
    std::lock_guard<std::mutex> lock(layer.mutex);

    auto it = layer.entries.find(key);
    if (it == layer.entries.end()) {
        return false;
    }
    erase_entry_locked(layer, it);
    return true;
}

void CacheManager::clear(CacheLayer layer_id) noexcept {
    Layer& layer = layer_for(layer_id);
    std::lock_guard<std::mutex> lock(layer.mutex);

    total_memory_.fetch_sub(layer.memory_usage);
    layer.memory_usage = 0;
    layer.entries.clear();
}

void CacheManager::clear_all() noexcept {
    for (CacheLayer layer : ALL_CACHE_LAYERS) {
        clear(layer);
    }
}

std::optional<Json::Value> CacheManager::get_stale(CacheLayer layer_id, const std::string& key) const noexcept {
    try {
        const Layer& layer = layer_for(layer_id);
        std::lock_guard<std::mutex> lock(layer.mutex);

        auto it = layer.entries.find(key);
        if (it == layer.entries.end()) {
            return std::nullopt;
        }
        return it->second.value;

    } catch (const std::exception& e) {
        LOG_DEBUG("Stale cache read failed for {}:{}: {}", layer_to_string(layer_id), key, e.what());
        return std::nullopt;
    }
}

void CacheManager::erase_entry_locked(Layer& layer, std::unordered_map<std::string, CacheEntry>::iterator it) {
    const size_t size = it->second.size_bytes;
    layer.memory_usage -= std::min(layer.memory_usage, size);
    total_memory_.fetch_sub(size);
    layer.entries.erase(it);
}

bool CacheManager::over_budget_locked(const Layer& layer) const {
    return layer.entries.size() > layer.config.max_entries ||
           layer.memory_usage > layer.config.max_memory_bytes;
}

bool CacheManager::exceeds_alone_locked(const Layer& layer, const CacheEntry& entry) const {
    return layer.config.max_entries == 0 ||
           entry.size_bytes > layer.config.max_memory_bytes ||
           entry.size_bytes > max_total_memory_bytes_;
}

std::unordered_map<std::string, CacheEntry>::iterator
CacheManager::select_victim_locked(Layer& layer, timestamp_t now, const std::string& protected_key) {
    auto older_access = [](const CacheEntry& a, const CacheEntry& b) {
        if (a.last_accessed_at != b.last_accessed_at) {
            return a.last_accessed_at < b.last_accessed_at;
        }
        return a.access_count < b.access_count;
    };

    auto fewer_accesses = [](const CacheEntry& a, const CacheEntry& b) {
        if (a.access_count != b.access_count) {
            return a.access_count < b.access_count;
        }
        return a.last_accessed_at < b.last_accessed_at;
    };

    auto sooner_expiry = [&](const CacheEntry& a, const CacheEntry& b) {
        const bool a_expired = a.is_expired(now);
        const bool b_expired = b.is_expired(now);
        if (a_expired != b_expired) {
            return a_expired;
        }
        if (a.expires_at != b.expires_at) {
            if (!a.expires_at) return false;
            if (!b.expires_at) return true;
            return *a.expires_at < *b.expires_at;
        }
        return older_access(a, b);
    };

    auto victim = layer.entries.end();
    for (auto it = layer.entries.begin(); it != layer.entries.end(); ++it) {
        if (it->first == protected_key) {
            continue;
        }
        if (victim == layer.entries.end()) {
            victim = it;
            continue;
        }

        bool better = false;
        switch (layer.config.eviction_policy) {
            case EvictionPolicy::LRU: better = older_access(it->second, victim->second); break;
            case EvictionPolicy::LFU: better = fewer_accesses(it->second, victim->second); break;
            case EvictionPolicy::TTL: better = sooner_expiry(it->second, victim->second); break;
        }
        if (better) {
            victim = it;
        }
    }
    return victim;
}

void CacheManager::evict_locked(Layer& layer, CacheLayer id, timestamp_t now, const std::string& written_key) {
    while (!layer.entries.empty() &&
           (over_budget_locked(layer) || total_memory_.load() > max_total_memory_bytes_)) {
        auto victim = select_victim_locked(layer, now, written_key);
        if (victim == layer.entries.end()) {
            // Only the written entry is left; drop it only when it cannot fit on its own
            victim = layer.entries.find(written_key);
            if (victim == layer.entries.end() || !exceeds_alone_locked(layer, victim->second)) {
                break;
            }
        }
        LOG_DEBUG("Evicting {} from cache layer {}", victim->first, layer_to_string(id));
        erase_entry_locked(layer, victim);
        layer.evictions.fetch_add(1, std::memory_order_relaxed);
    }
}

CacheMetrics CacheManager::snapshot(const Layer& layer) const {
    CacheMetrics metrics;
    metrics.hits = layer.hits.load(std::memory_order_relaxed);
    metrics.misses = layer.misses.load(std::memory_order_relaxed);
    metrics.hit_rate = compute_hit_rate(metrics.hits, metrics.misses);
    metrics.evictions = layer.evictions.load(std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(layer.mutex);
    metrics.entry_count = layer.entries.size();
    metrics.memory_usage = layer.memory_usage;
    return metrics;
}

CacheMetrics CacheManager::get_metrics(CacheLayer layer) const {
    return snapshot(layer_for(layer));
}

std::map<CacheLayer, CacheMetrics> CacheManager::get_all_metrics() const {
    std::map<CacheLayer, CacheMetrics> all;
    for (CacheLayer layer : ALL_CACHE_LAYERS) {
        all[layer] = get_metrics(layer);
    }
    return all;
}

CacheMetrics CacheManager::get_aggregate_metrics() const {
    CacheMetrics total;
    for (CacheLayer layer : ALL_CACHE_LAYERS) {
        const CacheMetrics metrics = get_metrics(layer);
        total.hits += metrics.hits;
        total.misses += metrics.misses;
        total.evictions += metrics.evictions;
        total.entry_count += metrics.entry_count;
        total.memory_usage += metrics.memory_usage;
    }
    total.hit_rate = compute_hit_rate(total.hits, total.misses);
    return total;
}

HealthStatus CacheManager::get_health_status() const {
    HealthStatus health;
    size_t memory_budget = 0;
    bool layer_nearly_full = false;
    u64 hits = 0;
    u64 misses = 0;

    for (CacheLayer layer_id : ALL_CACHE_LAYERS) {
        const CacheLayerConfig& config = layer_config(layer_id);
        const CacheMetrics metrics = get_metrics(layer_id);

        LayerHealth layer_health{layer_id, HealthState::HEALTHY, metrics,
                                 ratio(metrics.memory_usage, config.max_memory_bytes),
                                 ratio(metrics.entry_count, config.max_entries)};

        if (layer_health.memory_utilization > CRITICAL_MEMORY_RATIO) {
            layer_health.status = HealthState::CRITICAL;
        } else if (layer_health.memory_utilization > DEGRADED_MEMORY_RATIO ||
                   layer_health.entry_utilization >= FULL_LAYER_RATIO) {
            layer_health.status = HealthState::DEGRADED;
        }

        layer_nearly_full = layer_nearly_full || layer_health.entry_utilization >= FULL_LAYER_RATIO;
        memory_budget += config.max_memory_bytes;
        health.total_memory_usage += metrics.memory_usage;
        health.total_entries += metrics.entry_count;
        hits += metrics.hits;
        misses += metrics.misses;

        health.layer_status.push_back(layer_health);
    }

    health.overall_hit_rate = compute_hit_rate(hits, misses);
    const double memory_ratio = ratio(health.total_memory_usage, memory_budget);
    const bool enough_lookups = hits + misses >= MIN_LOOKUPS_FOR_HIT_RATE;

    if (memory_ratio > CRITICAL_MEMORY_RATIO || health.total_memory_usage > max_total_memory_bytes_) {
        health.status = HealthState::CRITICAL;
    } else if (memory_ratio > DEGRADED_MEMORY_RATIO || layer_nearly_full ||
               (enough_lookups && health.overall_hit_rate < MIN_HEALTHY_HIT_RATE)) {
        health.status = HealthState::DEGRADED;
    }

    return health;
}

size_t CacheManager::cleanup_expired() {
    const timestamp_t now = clock_->now();
    size_t removed = 0;

    for (CacheLayer layer_id : ALL_CACHE_LAYERS) {
        Layer& layer = layer_for(layer_id);
        std::lock_guard<std::mutex> lock(layer.mutex);

        for (auto it = layer.entries.begin(); it != layer.entries.end();) {
            if (it->second.is_expired(now)) {
                auto next = std::next(it);
                erase_entry_locked(layer, it);
                it = next;
                ++removed;
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        LOG_DEBUG("Cache cleanup removed {} expired entries", removed);
    }
    return removed;
}

void CacheManager::start_cleanup() {
    std::lock_guard<std::mutex> lock(cleanup_mutex_);
    if (cleanup_running_.load()) {
        return;
    }

    cleanup_running_.store(true);
    cleanup_thread_ = std::thread(&CacheManager::cleanup_thread_main, this);
    LOG_INFO("Cache cleanup started, interval {} ms", cleanup_interval_.count());
}

void CacheManager::stop_cleanup() {
    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        if (!cleanup_running_.load()) {
            return;
        }
        cleanup_running_.store(false);
    }
    cleanup_cv_.notify_all();

    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }
    LOG_INFO("Cache cleanup stopped");
}

void CacheManager::cleanup_thread_main() {
    std::unique_lock<std::mutex> lock(cleanup_mutex_);
    while (cleanup_running_.load()) {
        cleanup_cv_.wait_for(lock, cleanup_interval_, [this] { return !cleanup_running_.load(); });
        if (!cleanup_running_.load()) {
            break;
        }

        lock.unlock();
        cleanup_expired();
        lock.lock();
    }
}

void CacheManager::reset() {
    clear_all();
    for (auto& layer : layers_) {
        layer->hits.store(0);
        layer->misses.store(0);
        layer->evictions.store(0);
    }
}

void CacheManager::shutdown() {
    stop_cleanup();
    clear_all();
}

} // namespace warden::cache

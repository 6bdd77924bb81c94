#pragma once

#include "common/clock.hpp"
#include "common/types.hpp"
#include "resilience/error_types.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace warden {
namespace resilience {

/**
 * Consecutive-failure circuit breaker.
 *
 * CLOSED counts consecutive failures and opens at failure_threshold. OPEN
 * rejects calls until recovery_timeout has passed since the last failure,
 * then moves to HALF_OPEN and admits up to half_open_max_calls probes. A
 * successful probe closes the breaker; a failed probe reopens it and
 * restarts the recovery timer.
 */
class CircuitBreaker {
public:
    enum class State {
        CLOSED,     // Normal operation
        OPEN,       // Rejecting requests
        HALF_OPEN   // Probing for recovery
    };

    struct Config {
        u32 failure_threshold = 5;
        Milliseconds recovery_timeout{60000};
        u32 half_open_max_calls = 3;
    };

    struct Snapshot {
        std::string service_name;
        State state = State::CLOSED;
        u32 consecutive_failures = 0;
        std::optional<timestamp_t> last_failure_time;
        u32 half_open_probes_used = 0;

        u64 total_requests = 0;
        u64 successful_requests = 0;
        u64 failed_requests = 0;
        u64 rejected_requests = 0;
        u64 state_changes = 0;
    };

    CircuitBreaker(const std::string& name, const Config& config,
                   std::shared_ptr<common::Clock> clock = common::default_clock());

    // Run func under breaker protection; throws CircuitOpenError when rejected
    template<typename Func>
    auto execute(Func&& func) -> decltype(func()) {
        if (!allow_request()) {
            record_rejected();
            throw CircuitOpenError(name_);
        }

        try {
            if constexpr (std::is_void_v<decltype(func())>) {
                func();
                record_success();
            } else {
                auto result = func();
                record_success();
                return result;
            }
        } catch (...) {
            record_failure();
            throw;
        }
    }

    // Admission check; may move OPEN to HALF_OPEN and consume a probe slot
    bool allow_request();

    // Side-effect free view of whether a request would be admitted
    bool is_available() const;

    void record_success();
    void record_failure();
    void record_rejected();

    State get_state() const;
    const std::string& get_name() const { return name_; }
    const Config& get_config() const { return config_; }
    Snapshot snapshot() const;

    // Time left before an OPEN breaker admits a probe
    Milliseconds remaining_open_time() const;

    void force_open();
    void reset();

private:
    bool recovery_elapsed_locked(timestamp_t now) const;
    void transition_locked(State next);

    const std::string name_;
    const Config config_;
    std::shared_ptr<common::Clock> clock_;

    mutable std::mutex mutex_;
    State state_ = State::CLOSED;
    u32 consecutive_failures_ = 0;
    std::optional<timestamp_t> last_failure_time_;
    u32 half_open_probes_used_ = 0;

    struct AtomicStats {
        std::atomic<u64> total_requests{0};
        std::atomic<u64> successful_requests{0};
        std::atomic<u64> failed_requests{0};
        std::atomic<u64> rejected_requests{0};
        std::atomic<u64> state_changes{0};
    };

    AtomicStats stats_;
};

const char* circuit_state_to_string(CircuitBreaker::State state);

/**
 * Per-service breaker registry. Breakers are created lazily on first use
 * with the registry's default config.
 */
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(const CircuitBreaker::Config& default_config = {},
                                    std::shared_ptr<common::Clock> clock = common::default_clock());

    std::shared_ptr<CircuitBreaker> get_or_create(const std::string& name);
    std::shared_ptr<CircuitBreaker> get(const std::string& name) const;

    void remove(const std::string& name);
    void clear();

    std::vector<std::string> list_circuit_breakers() const;
    std::map<std::string, CircuitBreaker::Snapshot> snapshots() const;

    struct AggregatedStats {
        u64 total_circuits = 0;
        u64 open_circuits = 0;
        u64 half_open_circuits = 0;
        u64 closed_circuits = 0;
        u64 total_requests = 0;
        u64 total_failures = 0;
        u64 total_rejections = 0;
    };

    AggregatedStats get_aggregated_stats() const;

    const CircuitBreaker::Config& default_config() const { return default_config_; }

private:
    const CircuitBreaker::Config default_config_;
    std::shared_ptr<common::Clock> clock_;

    mutable std::mutex breakers_mutex_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

} // namespace resilience
} // namespace warden

#include "resilience/circuit_breaker.hpp"
#include "common/logger.hpp"
#include <algorithm>

namespace warden {
namespace resilience {

const char* circuit_state_to_string(CircuitBreaker::State state) {
    switch (state) {
        case CircuitBreaker::State::CLOSED: return "closed";
        case CircuitBreaker::State::OPEN: return "open";
        case CircuitBreaker::State::HALF_OPEN: return "half_open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(const std::string& name, const Config& config,
                               std::shared_ptr<common::Clock> clock)
    : name_(name), config_(config), clock_(clock ? std::move(clock) : common::default_clock()) {

    LOG_DEBUG("Circuit breaker '{}' initialized with failure_threshold={}, recovery_timeout={}ms",
              name_, config_.failure_threshold, config_.recovery_timeout.count());
}

bool CircuitBreaker::recovery_elapsed_locked(timestamp_t now) const {
    if (!last_failure_time_) {
        return true;
    }
    return now - *last_failure_time_ >= config_.recovery_timeout;
}

void CircuitBreaker::transition_locked(State next) {
    if (state_ == next) {
        return;
    }

    LOG_INFO("Circuit breaker '{}' {} -> {}", name_,
             circuit_state_to_string(state_), circuit_state_to_string(next));

    state_ = next;
    half_open_probes_used_ = 0;
    stats_.state_changes.fetch_add(1);
}

bool CircuitBreaker::allow_request() {
    std::lock_guard<std::mutex> lock(mutex_);

    switch (state_) {
        case State::CLOSED:
            return true;

        case State::OPEN:
            if (recovery_elapsed_locked(clock_->now())) {
                transition_locked(State::HALF_OPEN);
                half_open_probes_used_ = 1;
                return true;
            }
            return false;

        case State::HALF_OPEN:
            if (half_open_probes_used_ < config_.half_open_max_calls) {
                ++half_open_probes_used_;
                return true;
            }
            return false;
    }

    return false;
}

bool CircuitBreaker::is_available() const {
    std::lock_guard<std::mutex> lock(mutex_);

    switch (state_) {
        case State::CLOSED:
            return true;
        case State::OPEN:
            return recovery_elapsed_locked(clock_->now());
        case State::HALF_OPEN:
            return half_open_probes_used_ < config_.half_open_max_calls;
    }
    return false;
}

void CircuitBreaker::record_success() {
    stats_.total_requests.fetch_add(1);
    stats_.successful_requests.fetch_add(1);

    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_failures_ = 0;
    if (state_ == State::HALF_OPEN) {
        transition_locked(State::CLOSED);
    }
}

void CircuitBreaker::record_failure() {
    stats_.total_requests.fetch_add(1);
    stats_.failed_requests.fetch_add(1);

    std::lock_guard<std::mutex> lock(mutex_);
    ++consecutive_failures_;
    last_failure_time_ = clock_->now();

    if (state_ == State::HALF_OPEN) {
        LOG_WARNING("Circuit breaker '{}' probe failed, reopening", name_);
        transition_locked(State::OPEN);
    } else if (state_ == State::CLOSED && consecutive_failures_ >= config_.failure_threshold) {
        LOG_WARNING("Circuit breaker '{}' opened after {} consecutive failures",
                    name_, consecutive_failures_);
        transition_locked(State::OPEN);
    }
}

void CircuitBreaker::record_rejected() {
    stats_.rejected_requests.fetch_add(1);
}

CircuitBreaker::State CircuitBreaker::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CircuitBreaker::Snapshot CircuitBreaker::snapshot() const {
    Snapshot result;
    result.service_name = name_;
    result.total_requests = stats_.total_requests.load();
    result.successful_requests = stats_.successful_requests.load();
    result.failed_requests = stats_.failed_requests.load();
    result.rejected_requests = stats_.rejected_requests.load();
    result.state_changes = stats_.state_changes.load();

    std::lock_guard<std::mutex> lock(mutex_);
    result.state = state_;
    result.consecutive_failures = consecutive_failures_;
    result.last_failure_time = last_failure_time_;
    result.half_open_probes_used = half_open_probes_used_;
    return result;
}

Milliseconds CircuitBreaker::remaining_open_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::OPEN || !last_failure_time_) {
        return Milliseconds(0);
    }

    auto elapsed = std::chrono::duration_cast<Milliseconds>(clock_->now() - *last_failure_time_);
    return std::max(Milliseconds(0), config_.recovery_timeout - elapsed);
}

void CircuitBreaker::force_open() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_failure_time_ = clock_->now();
    transition_locked(State::OPEN);
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    transition_locked(State::CLOSED);
    consecutive_failures_ = 0;
    last_failure_time_.reset();
    half_open_probes_used_ = 0;
}

CircuitBreakerRegistry::CircuitBreakerRegistry(const CircuitBreaker::Config& default_config,
                                               std::shared_ptr<common::Clock> clock)
    : default_config_(default_config), clock_(clock ? std::move(clock) : common::default_clock()) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get_or_create(const std::string& name) {
    std::lock_guard<std::mutex> lock(breakers_mutex_);

    auto it = breakers_.find(name);
    if (it != breakers_.end()) {
        return it->second;
    }

    auto breaker = std::make_shared<CircuitBreaker>(name, default_config_, clock_);
    breakers_[name] = breaker;
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(breakers_mutex_);

    auto it = breakers_.find(name);
    return it != breakers_.end() ? it->second : nullptr;
}

void CircuitBreakerRegistry::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(breakers_mutex_);
    breakers_.erase(name);
}

void CircuitBreakerRegistry::clear() {
    std::lock_guard<std::mutex> lock(breakers_mutex_);
    breakers_.clear();
}

std::vector<std::string> CircuitBreakerRegistry::list_circuit_breakers() const {
    std::lock_guard<std::mutex> lock(breakers_mutex_);

    std::vector<std::string> names;
    names.reserve(breakers_.size());
    for (const auto& [name, breaker] : breakers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::map<std::string, CircuitBreaker::Snapshot> CircuitBreakerRegistry::snapshots() const {
    std::lock_guard<std::mutex> lock(breakers_mutex_);

    std::map<std::string, CircuitBreaker::Snapshot> result;
    for (const auto& [name, breaker] : breakers_) {
        result[name] = breaker->snapshot();
    }
    return result;
}

CircuitBreakerRegistry::AggregatedStats CircuitBreakerRegistry::get_aggregated_stats() const {
    AggregatedStats stats;

    for (const auto& [name, snapshot] : snapshots()) {
        stats.total_circuits++;
        switch (snapshot.state) {
            case CircuitBreaker::State::OPEN: stats.open_circuits++; break;
            case CircuitBreaker::State::HALF_OPEN: stats.half_open_circuits++; break;
            case CircuitBreaker::State::CLOSED: stats.closed_circuits++; break;
        }
        stats.total_requests += snapshot.total_requests;
        stats.total_failures += snapshot.failed_requests;
        stats.total_rejections += snapshot.rejected_requests;
    }

    return stats;
}

} // namespace resilience
} // namespace warden

#pragma once

#include "common/clock.hpp"
#include "common/logger.hpp"
#include "common/types.hpp"
#include "resilience/circuit_breaker.hpp"
#include "resilience/error_classifier.hpp"
#include "resilience/error_types.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace warden {
namespace resilience {

struct RetryPolicy {
    u32 max_attempts = 3;
    Milliseconds base_delay{1000};
    double backoff_multiplier = 2.0;
    Milliseconds max_delay{30000};

    // Delay before the attempt following failed attempt number `attempt` (1-based)
    Milliseconds delay_for_attempt(u32 attempt) const;
};

/**
 * Central error handling: classification, standardized responses,
 * per-service circuit breakers and retry with backoff.
 *
 * Owns the breaker registry; one handler is shared by every adapter of a
 * runtime. Retry delays wait on a condition variable so shutdown can cut
 * them short with cancel_pending_retries().
 */
class ErrorHandler {
public:
    struct Config {
        CircuitBreaker::Config circuit_breaker;
        RetryPolicy retry;
        bool enable_fallbacks = true;
    };

    // Called before each retry delay
    using RetryObserver = std::function<void(u32 attempt, const std::exception& error, Milliseconds delay)>;

    ErrorHandler() : ErrorHandler(Config{}) {}
    explicit ErrorHandler(const Config& config,
                          std::shared_ptr<common::Clock> clock = common::default_clock());
    ~ErrorHandler();

    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    // Build the caller-facing response for a failure and log it
    ErrorResponse handle_error(const std::exception& error,
                               const std::string& tool_name,
                               const std::string& operation,
                               const std::optional<std::string>& request_id = std::nullopt) const;

    // Classification only: no code, suggestions or logging
    StandardizedError categorize(const std::exception& error,
                                 const std::string& tool_name,
                                 const std::string& operation) const;

    bool is_retryable(const std::exception& error) const;

    template<typename Func>
    auto execute_with_circuit_breaker(const std::string& service_name, Func&& operation)
        -> decltype(operation()) {
        auto breaker = circuit_breakers_.get_or_create(service_name);
        if (!breaker->allow_request()) {
            breaker->record_rejected();
            LOG_WARNING("Circuit breaker OPEN for {}, rejecting call", service_name);
            throw CircuitOpenError(service_name);
        }
        return run_guarded(*breaker, std::forward<Func>(operation));
    }

    // As above, but an open breaker answers with fallback() instead of throwing
    template<typename Func, typename Fallback>
    auto execute_with_circuit_breaker(const std::string& service_name, Func&& operation, Fallback&& fallback)
        -> decltype(operation()) {
        auto breaker = circuit_breakers_.get_or_create(service_name);
        if (!breaker->allow_request()) {
            breaker->record_rejected();
            if (config_.enable_fallbacks) {
                LOG_INFO("Circuit breaker OPEN for {}, using fallback", service_name);
                return fallback();
            }
            throw CircuitOpenError(service_name);
        }
        return run_guarded(*breaker, std::forward<Func>(operation));
    }

    template<typename Func>
    auto execute_with_retry(Func&& operation, const std::string& tool_name,
                            const std::string& operation_name, u32 max_attempts)
        -> decltype(operation()) {
        RetryPolicy policy = config_.retry;
        policy.max_attempts = max_attempts;
        return execute_with_retry(std::forward<Func>(operation), tool_name, operation_name, policy);
    }

    template<typename Func>
    auto execute_with_retry(Func&& operation, const std::string& tool_name,
                            const std::string& operation_name, const RetryPolicy& policy,
                            const RetryObserver& observer = {})
        -> decltype(operation()) {
        const u32 attempts = std::max<u32>(1, policy.max_attempts);
        std::exception_ptr last_error;

        for (u32 attempt = 1; attempt <= attempts; ++attempt) {
            try {
                return operation();
            } catch (const std::exception& e) {
                last_error = std::current_exception();

                if (attempt == attempts) {
                    break;
                }
                if (!is_retryable(e)) {
                    LOG_DEBUG("Not retrying {}.{}: {}", tool_name, operation_name, e.what());
                    break;
                }

                const Milliseconds delay = policy.delay_for_attempt(attempt);
                LOG_WARNING("Attempt {}/{} failed for {}.{}, retrying in {}ms: {}",
                            attempt, attempts, tool_name, operation_name, delay.count(), e.what());

                if (observer) {
                    observer(attempt, e, delay);
                }
                if (!wait_before_retry(delay)) {
                    LOG_INFO("Retries cancelled for {}.{}", tool_name, operation_name);
                    break;
                }
            }
        }

        std::rethrow_exception(last_error);
    }

    bool is_service_available(const std::string& service_name) const;
    void reset_circuit_breaker(const std::string& service_name);
    std::map<std::string, CircuitBreaker::Snapshot> get_circuit_breaker_states() const;

    // Wakes every pending retry delay and fails further retries until reset()
    void cancel_pending_retries();
    bool retries_cancelled() const { return retries_cancelled_.load(); }

    // Drops all breakers and re-enables retries
    void reset();

    CircuitBreakerRegistry& circuit_breakers() { return circuit_breakers_; }
    const CircuitBreakerRegistry& circuit_breakers() const { return circuit_breakers_; }
    const Config& config() const { return config_; }

    static std::string generate_error_code(ErrorCategory category, ErrorSeverity severity);
    static std::vector<std::string> generate_suggestions(ErrorCategory category);
    static Json::Value sanitize_context(const Json::Value& context);

private:
    template<typename Func>
    auto run_guarded(CircuitBreaker& breaker, Func&& operation) -> decltype(operation()) {
        try {
            if constexpr (std::is_void_v<decltype(operation())>) {
                operation();
                breaker.record_success();
            } else {
                auto result = operation();
                breaker.record_success();
                return result;
            }
        } catch (...) {
            breaker.record_failure();
            throw;
        }
    }

    // False when the wait was cut short by cancel_pending_retries()
    bool wait_before_retry(Milliseconds delay);

    Milliseconds retry_after_for(const std::string& service_name) const;
    void log_error(const StandardizedError& error) const;

    const Config config_;
    std::shared_ptr<common::Clock> clock_;
    CircuitBreakerRegistry circuit_breakers_;

    std::mutex retry_mutex_;
    std::condition_variable retry_cv_;
    std::atomic<bool> retries_cancelled_{false};
};

} // namespace resilience
} // namespace warden

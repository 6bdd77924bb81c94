#pragma once

#include "adapter/execution_logger.hpp"
#include "adapter/fallback_config.hpp"
#include "adapter/service_operation.hpp"
#include "adapter/tool_context.hpp"
#include "cache/cache_manager.hpp"
#include "common/clock.hpp"
#include "common/id_generator.hpp"
#include "common/logger.hpp"
#include "resilience/error_classifier.hpp"
#include "resilience/error_handler.hpp"
#include "resilience/error_types.hpp"
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace warden {
namespace adapter {

template<typename Result>
struct ExecutionResult {
    Result value;
    ExecutionStatus status = ExecutionStatus::SUCCESS;
    bool cache_hit = false;
    std::optional<FallbackStrategy> fallback_strategy;
    ExecutionMetrics metrics;
};

struct HealthReport {
    bool healthy = true;
    std::string status;
    std::string details;
};

/**
 * Runs a ServiceOperation through the shared caching and resilience
 * pipeline: validate, cache lookup, breaker-guarded core call bounded by
 * the operation timeout and retried with backoff, best-effort cache store,
 * then the fallback chain when the primary path fails.
 *
 * The adapter holds no per-call state; concurrent execute() calls are safe
 * as long as the operation itself is.
 *
 * Every failure leaving execute() is a resilience::ServiceError whose
 * error() is the fully populated StandardizedError.
 */
template<typename Params, typename Result>
class ServiceAdapter {
public:
    using Operation = ServiceOperation<Params, Result>;

    ServiceAdapter(std::shared_ptr<Operation> operation,
                   cache::CacheManager& cache,
                   resilience::ErrorHandler& error_handler,
                   ExecutionLogger& execution_logger,
                   const FallbackConfig& config = FallbackConfig{},
                   std::shared_ptr<common::Clock> clock = common::default_clock())
        : operation_(std::move(operation))
        , cache_(cache)
        , error_handler_(error_handler)
        , execution_logger_(execution_logger)
        , config_(config)
        , clock_(clock ? std::move(clock) : common::default_clock()) {
        WARDEN_ASSERT(operation_ != nullptr, "ServiceAdapter requires an operation");
    }

    ExecutionResult<Result> execute(const Json::Value& raw_params, const ToolContext& caller_context = ToolContext{}) {
        Params params = validate(raw_params, caller_context);

        const std::string key = operation_->cache_key(params);
        const ToolContext context = build_context(raw_params, caller_context);
        ExecutionMetrics metrics = execution_logger_.log_start(context);

        // get() purges expired entries, so keep the stale copy for the cache fallback first
        std::optional<Json::Value> stale;
        if (uses_cache_fallback()) {
            stale = cache_.get_stale(operation_->cache_layer(), key);
        }

        if (auto cached = lookup_cache(key, context)) {
            metrics.cache_hit = true;
            metrics.finish(clock_->now());
            execution_logger_.log_complete(context, metrics, ExecutionStatus::CACHED, cached->second);
            return {std::move(cached->first), ExecutionStatus::CACHED, true, std::nullopt, metrics};
        }
        metrics.cache_hit = false;

        try {
            Json::Value raw = run_primary(params, context, metrics);
            Result value = operation_->transform_output(raw);

            cache_.set(operation_->cache_layer(), key, raw, operation_->ttl());

            metrics.finish(clock_->now());
            execution_logger_.log_complete(context, metrics, ExecutionStatus::SUCCESS, raw);
            return {std::move(value), ExecutionStatus::SUCCESS, false, std::nullopt, metrics};

        } catch (const std::exception& primary) {
            metrics.error_count++;
            return recover(primary, params, key, stale, context, metrics);
        } catch (...) {
            metrics.error_count++;
            resilience::ServiceError wrapped("Non-standard exception from " + name(),
                                             resilience::ErrorCategory::EXECUTION,
                                             resilience::ErrorSeverity::MEDIUM);
            return recover(wrapped, params, key, stale, context, metrics);
        }
    }

    // Exercises the core path only; cached values and fallbacks never count as healthy
    HealthReport health_check() {
        auto raw_params = operation_->health_check_params();
        if (!raw_params) {
            return {true, "healthy", "No health check parameters, execution skipped"};
        }

        ToolContext context;
        context.operation = "health_check";
        context.tool_name = name();
        context.parameters = *raw_params;
        try {
            Params params = operation_->validate_input(*raw_params);
            Json::Value raw = error_handler_.execute_with_circuit_breaker(name(), [&]() {
                return run_with_timeout(params, context);
            });
            operation_->transform_output(raw);
            return {true, "healthy", "Health check completed"};
        } catch (const std::exception& e) {
            LOG_WARNING("Health check failed for {}: {}", name(), e.what());
            return {false, "failed", e.what()};
        } catch (...) {
            LOG_WARNING("Health check failed for {}: non-standard exception", name());
            return {false, "failed", "Non-standard exception from " + name()};
        }
    }

    std::string name() const { return operation_->name(); }
    std::string description() const { return operation_->description(); }
    std::string cache_key(const Params& params) const { return operation_->cache_key(params); }
    std::optional<Milliseconds> ttl() const { return operation_->ttl(); }
    const FallbackConfig& fallback_config() const { return config_; }
    Operation& operation() { return *operation_; }

private:
    Params validate(const Json::Value& raw_params, const ToolContext& caller_context) {
        try {
            return operation_->validate_input(raw_params);
        } catch (const resilience::ServiceError& e) {
            throw standardized(e, caller_context);
        } catch (const std::exception& e) {
            resilience::ValidationError wrapped(std::string("Invalid parameters: ") + e.what());
            throw standardized(wrapped, caller_context);
        } catch (...) {
            resilience::ValidationError wrapped("Invalid parameters: non-standard exception");
            throw standardized(wrapped, caller_context);
        }
    }

    resilience::ServiceError standardized(const std::exception& error, const ToolContext& context) const {
        auto response = error_handler_.handle_error(error, name(), operation_name(context), optional_request_id(context));
        return resilience::ServiceError(response.error);
    }

    static std::string operation_name(const ToolContext& context) {
        return context.operation.empty() ? "execute" : context.operation;
    }

    static std::optional<std::string> optional_request_id(const ToolContext& context) {
        if (context.request_id.empty()) {
            return std::nullopt;
        }
        return context.request_id;
    }

    ToolContext build_context(const Json::Value& raw_params, const ToolContext& caller_context) const {
        ToolContext context = caller_context;
        context.tool_name = name();
        context.operation = operation_name(caller_context);
        context.parameters = raw_params;
        if (context.session_id.empty()) {
            context.session_id = common::generate_prefixed_id(context.tool_name);
        }
        if (context.trace_id.empty()) {
            context.trace_id = common::generate_prefixed_id("trace");
        }
        return context;
    }

    bool uses_cache_fallback() const {
        if (!config_.enable_fallback) {
            return false;
        }
        for (FallbackStrategy strategy : config_.effective_chain()) {
            if (strategy == FallbackStrategy::FAIL) {
                return false;
            }
            if (strategy == FallbackStrategy::CACHE) {
                return true;
            }
        }
        return false;
    }

    // Transformed value and raw document for a cache hit
    std::optional<std::pair<Result, Json::Value>> lookup_cache(const std::string& key, const ToolContext& context) {
        auto cached = cache_.get(operation_->cache_layer(), key);
        if (!cached) {
            return std::nullopt;
        }

        try {
            return std::make_pair(operation_->transform_output(*cached), *cached);
        } catch (const std::exception& e) {
            Json::Value details(Json::objectValue);
            details["key"] = key;
            details["error"] = e.what();
            execution_logger_.log_warning(context, "Dropping cached value that failed to transform", details);
            cache_.remove(operation_->cache_layer(), key);
            return std::nullopt;
        }
    }

    Json::Value run_primary(const Params& params, const ToolContext& context, ExecutionMetrics& metrics) {
        auto guarded = [&]() {
            return error_handler_.execute_with_circuit_breaker(name(), [&]() {
                return run_with_timeout(params, context);
            });
        };

        if (config_.max_retries == 0) {
            return guarded();
        }

        return error_handler_.execute_with_retry(
            guarded, name(), context.operation, config_.retry_policy(),
            [&metrics](u32, const std::exception&, Milliseconds) {
                metrics.retry_count++;
                metrics.error_count++;
            });
    }

    Json::Value run_with_timeout(const Params& params, const ToolContext& context) {
        if (config_.operation_timeout.count() <= 0) {
            return operation_->execute_core(params, context);
        }

        auto promise = std::make_shared<std::promise<Json::Value>>();
        auto future = promise->get_future();

        // The worker keeps its own references; a timed-out call finishes in the background
        std::thread([operation = operation_, params, context, promise]() {
            try {
                promise->set_value(operation->execute_core(params, context));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();

        if (future.wait_for(config_.operation_timeout) == std::future_status::timeout) {
            throw resilience::TimeoutError(name(), config_.operation_timeout);
        }
        return future.get();
    }

    std::optional<Result> attempt_fallback(FallbackStrategy strategy, const Params& params,
                                           const std::string& key, const std::optional<Json::Value>& stale,
                                           const ToolContext& context) {
        switch (strategy) {
            case FallbackStrategy::CACHE: {
                auto cached = stale ? stale : cache_.get_stale(operation_->cache_layer(), key);
                if (!cached) {
                    return std::nullopt;
                }
                return operation_->transform_output(*cached);
            }
            case FallbackStrategy::SIMPLIFIED:
                return operation_->execute_simplified(params, context);
            case FallbackStrategy::PARTIAL:
                return operation_->execute_partial(params, context);
            case FallbackStrategy::DEFAULT:
                return operation_->default_result(params);
            case FallbackStrategy::FAIL:
                return std::nullopt;
        }
        return std::nullopt;
    }

    ExecutionResult<Result> recover(const std::exception& primary, const Params& params,
                                    const std::string& key, const std::optional<Json::Value>& stale,
                                    const ToolContext& context, ExecutionMetrics& metrics) {
        const auto category = resilience::ErrorClassifier::classify(primary).category;
        const bool fallback_allowed = config_.enable_fallback &&
                                      category != resilience::ErrorCategory::VALIDATION &&
                                      category != resilience::ErrorCategory::AUTHORIZATION;

        if (!fallback_allowed) {
            resilience::ServiceError error = standardized(primary, context);
            metrics.finish(clock_->now());
            execution_logger_.log_error(context, metrics, error);
            throw error;
        }

        std::string fallback_cause = "no fallback strategy configured";
        for (FallbackStrategy strategy : config_.effective_chain()) {
            if (strategy == FallbackStrategy::FAIL) {
                break;
            }

            try {
                if (auto value = attempt_fallback(strategy, params, key, stale, context)) {
                    const ExecutionStatus status = strategy == FallbackStrategy::PARTIAL
                        ? ExecutionStatus::PARTIAL
                        : ExecutionStatus::DEGRADED;

                    Json::Value details(Json::objectValue);
                    details["strategy"] = fallback_strategy_to_string(strategy);
                    details["error"] = primary.what();
                    execution_logger_.log_warning(context, "Primary execution failed, using fallback", details);

                    metrics.finish(clock_->now());
                    execution_logger_.log_complete(context, metrics, status);
                    return {std::move(*value), status, false, strategy, metrics};
                }
                fallback_cause = std::string(fallback_strategy_to_string(strategy)) + " fallback has no result";
            } catch (const std::exception& e) {
                metrics.error_count++;
                fallback_cause = std::string(fallback_strategy_to_string(strategy)) + " fallback failed: " + e.what();
            }
        }

        auto response = error_handler_.handle_error(primary, name(), context.operation, optional_request_id(context));
        resilience::StandardizedError combined = response.error;
        combined.message = std::string("Both primary and fallback execution failed: primary: ") +
                           primary.what() + "; fallback: " + fallback_cause;
        combined.severity = resilience::ErrorSeverity::HIGH;
        combined.code = resilience::ErrorHandler::generate_error_code(combined.category, combined.severity);

        resilience::ServiceError error(combined);
        metrics.finish(clock_->now());
        execution_logger_.log_error(context, metrics, error);
        throw error;
    }

    std::shared_ptr<Operation> operation_;
    cache::CacheManager& cache_;
    resilience::ErrorHandler& error_handler_;
    ExecutionLogger& execution_logger_;
    const FallbackConfig config_;
    std::shared_ptr<common::Clock> clock_;
};

} // namespace adapter
} // namespace warden

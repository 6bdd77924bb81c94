#pragma once

#include "common/error_handling.hpp"
#include "common/types.hpp"
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace resilience {

enum class ErrorCategory {
    VALIDATION,
    PERFORMANCE,
    EXTERNAL,
    RATE_LIMIT,
    AUTHORIZATION,
    RESOURCE,
    SYSTEM,
    EXECUTION
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class DegradationStrategy {
    FAIL,       // Surface the error immediately
    RETRY,      // Retry with exponential backoff
    FALLBACK,   // Use fallback data or a cheaper path
    CIRCUIT     // Let the circuit breaker shed load
};

const char* category_to_string(ErrorCategory category);
const char* severity_to_string(ErrorSeverity severity);
const char* strategy_to_string(DegradationStrategy strategy);

struct ValidationIssue {
    std::string path;
    std::string message;
};

/**
 * Caller-facing error envelope.
 *
 * Produced by ErrorHandler::handle_error with code, suggestions and a
 * sanitized context filled in; origins that throw a ServiceError only set
 * the classification fields.
 */
struct StandardizedError {
    std::string code;
    std::string message;
    ErrorCategory category = ErrorCategory::EXECUTION;
    ErrorSeverity severity = ErrorSeverity::MEDIUM;
    std::string tool_name;
    std::string operation;
    wall_time_t timestamp = std::chrono::system_clock::now();
    std::optional<std::string> request_id;
    std::vector<std::string> suggestions;
    Json::Value context{Json::objectValue};

    Json::Value to_json() const;
};

struct ErrorResponse {
    bool success = false;
    StandardizedError error;

    struct Metadata {
        DegradationStrategy degradation_strategy = DegradationStrategy::FAIL;
        bool retryable = false;
        std::optional<Milliseconds> retry_after;
    } metadata;

    Json::Value to_json() const;
};

/**
 * Error raised at its origin with an explicit classification.
 *
 * Classification carried here always wins over message-based
 * classification.
 */
class ServiceError : public WardenException {
public:
    explicit ServiceError(StandardizedError error, std::optional<bool> retryable = std::nullopt)
        : WardenException(error.message), error_(std::move(error)), retryable_(retryable) {}

    ServiceError(const std::string& message, ErrorCategory category, ErrorSeverity severity,
                 Json::Value context = Json::Value(Json::objectValue))
        : WardenException(message), error_(make_error(message, category, severity, std::move(context))) {}

    const StandardizedError& error() const { return error_; }
    ErrorCategory category() const { return error_.category; }
    ErrorSeverity severity() const { return error_.severity; }
    const std::string& tool_name() const { return error_.tool_name; }
    const std::string& operation() const { return error_.operation; }
    const Json::Value& context() const { return error_.context; }

    // Set when the origin knows better than the category default
    std::optional<bool> retryable() const { return retryable_; }

    ServiceError& with_origin(const std::string& tool_name, const std::string& operation) {
        if (error_.tool_name.empty()) error_.tool_name = tool_name;
        if (error_.operation.empty()) error_.operation = operation;
        return *this;
    }

protected:
    void set_retryable(bool retryable) { retryable_ = retryable; }

private:
    static StandardizedError make_error(const std::string& message, ErrorCategory category,
                                        ErrorSeverity severity, Json::Value context) {
        StandardizedError error;
        error.message = message;
        error.category = category;
        error.severity = severity;
        error.context = context.isObject() ? std::move(context) : Json::Value(Json::objectValue);
        return error;
    }

    StandardizedError error_;
    std::optional<bool> retryable_;
};

class ValidationError : public ServiceError {
public:
    ValidationError(const std::string& message, std::vector<ValidationIssue> issues = {})
        : ServiceError(message, ErrorCategory::VALIDATION, ErrorSeverity::MEDIUM, issues_to_json(issues))
        , issues_(std::move(issues)) {}

    const std::vector<ValidationIssue>& issues() const { return issues_; }

private:
    static Json::Value issues_to_json(const std::vector<ValidationIssue>& issues);

    std::vector<ValidationIssue> issues_;
};

class TimeoutError : public ServiceError {
public:
    TimeoutError(const std::string& operation, Milliseconds timeout)
        : ServiceError("Operation '" + operation + "' timed out after " +
                       std::to_string(timeout.count()) + " ms",
                       ErrorCategory::PERFORMANCE, ErrorSeverity::HIGH) {}
};

// Thrown while a breaker rejects calls; retrying would only be rejected again
class CircuitOpenError : public ServiceError {
public:
    explicit CircuitOpenError(const std::string& service_name)
        : ServiceError("Service " + service_name + " is currently unavailable (circuit breaker OPEN)",
                       ErrorCategory::EXTERNAL, ErrorSeverity::HIGH)
        , service_name_(service_name) {
        set_retryable(false);
    }

    const std::string& service_name() const { return service_name_; }

private:
    std::string service_name_;
};

} // namespace resilience
} // namespace warden

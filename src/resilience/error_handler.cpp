#include "resilience/error_handler.hpp"
#include <cctype>
#include <cmath>

namespace warden {
namespace resilience {

namespace {

constexpr size_t MAX_CONTEXT_STRING_LENGTH = 1000;
const char* const REDACTED = "[REDACTED]";
const char* const TRUNCATED_MARKER = "...[TRUNCATED]";

bool is_sensitive_key(const std::string& key) {
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const char* marker : {"password", "token", "secret", "apikey", "api_key",
                               "credential", "authorization"}) {
        if (lower.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

Json::Value sanitize_value(const Json::Value& value) {
    if (value.isObject()) {
        Json::Value sanitized(Json::objectValue);
        for (const auto& key : value.getMemberNames()) {
            sanitized[key] = is_sensitive_key(key) ? Json::Value(REDACTED) : sanitize_value(value[key]);
        }
        return sanitized;
    }

    if (value.isArray()) {
        Json::Value sanitized(Json::arrayValue);
        for (const auto& item : value) {
            sanitized.append(sanitize_value(item));
        }
        return sanitized;
    }

    if (value.isString()) {
        const std::string text = value.asString();
        if (text.size() > MAX_CONTEXT_STRING_LENGTH) {
            return Json::Value(text.substr(0, MAX_CONTEXT_STRING_LENGTH) + TRUNCATED_MARKER);
        }
    }

    return value;
}

std::string compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // namespace

Milliseconds RetryPolicy::delay_for_attempt(u32 attempt) const {
    const double exponent = attempt > 0 ? static_cast<double>(attempt - 1) : 0.0;
    const double delay = static_cast<double>(base_delay.count()) * std::pow(backoff_multiplier, exponent);
    const double capped = std::min(delay, static_cast<double>(max_delay.count()));
    return Milliseconds(static_cast<Milliseconds::rep>(std::max(0.0, capped)));
}

ErrorHandler::ErrorHandler(const Config& config, std::shared_ptr<common::Clock> clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : common::default_clock())
    , circuit_breakers_(config.circuit_breaker, clock_) {}

ErrorHandler::~ErrorHandler() {
    cancel_pending_retries();
}

StandardizedError ErrorHandler::categorize(const std::exception& error,
                                           const std::string& tool_name,
                                           const std::string& operation) const {
    if (const auto* service_error = dynamic_cast<const ServiceError*>(&error)) {
        StandardizedError result = service_error->error();
        if (result.tool_name.empty()) result.tool_name = tool_name;
        if (result.operation.empty()) result.operation = operation;
        return result;
    }

    const auto classification = ErrorClassifier::classify(error);

    StandardizedError result;
    result.message = error.what();
    result.category = classification.category;
    result.severity = classification.severity;
    result.tool_name = tool_name;
    result.operation = operation;
    return result;
}

bool ErrorHandler::is_retryable(const std::exception& error) const {
    return ErrorClassifier::classify(error).retryable;
}

ErrorResponse ErrorHandler::handle_error(const std::exception& error,
                                         const std::string& tool_name,
                                         const std::string& operation,
                                         const std::optional<std::string>& request_id) const {
    const auto classification = ErrorClassifier::classify(error);

    ErrorResponse response;
    response.error = categorize(error, tool_name, operation);
    response.error.code = generate_error_code(response.error.category, response.error.severity);
    response.error.suggestions = generate_suggestions(response.error.category);
    response.error.context = sanitize_context(response.error.context);
    response.error.timestamp = std::chrono::system_clock::now();
    if (request_id) {
        response.error.request_id = request_id;
    }

    response.metadata.degradation_strategy = classification.strategy;
    response.metadata.retryable = classification.retryable;
    if (classification.retryable) {
        response.metadata.retry_after = retry_after_for(response.error.tool_name);
    }

    log_error(response.error);
    return response;
}

std::string ErrorHandler::generate_error_code(ErrorCategory category, ErrorSeverity severity) {
    std::string category_code;
    for (const char* c = category_to_string(category); *c != '\0'; ++c) {
        if (*c != '_') {
            category_code += static_cast<char>(std::toupper(static_cast<unsigned char>(*c)));
        }
    }

    std::string severity_code = severity_to_string(severity);
    std::transform(severity_code.begin(), severity_code.end(), severity_code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    return "WARDEN_" + category_code + "_" + severity_code;
}

std::vector<std::string> ErrorHandler::generate_suggestions(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::VALIDATION:
            return {"Check input parameters for correct format and values",
                    "Refer to tool documentation for required parameters"};
        case ErrorCategory::EXTERNAL:
            return {"Check network connectivity",
                    "Verify external service is available",
                    "Consider using cached data if available"};
        case ErrorCategory::PERFORMANCE:
            return {"Reduce request complexity or size",
                    "Consider breaking operation into smaller chunks"};
        case ErrorCategory::RATE_LIMIT:
            return {"Implement exponential backoff for retries",
                    "Reduce request frequency"};
        case ErrorCategory::RESOURCE:
            return {"Check if file or resource exists",
                    "Verify permissions for resource access"};
        case ErrorCategory::AUTHORIZATION:
            return {"Check authentication credentials",
                    "Verify required permissions are granted"};
        case ErrorCategory::SYSTEM:
            return {"Check available memory and file handles"};
        case ErrorCategory::EXECUTION:
            return {"Retry the operation"};
    }
    return {};
}

Json::Value ErrorHandler::sanitize_context(const Json::Value& context) {
    if (context.isNull()) {
        return Json::Value(Json::objectValue);
    }
    return sanitize_value(context);
}

Milliseconds ErrorHandler::retry_after_for(const std::string& service_name) const {
    auto breaker = circuit_breakers_.get(service_name);
    if (breaker && breaker->get_state() == CircuitBreaker::State::OPEN) {
        return breaker->remaining_open_time();
    }
    return config_.retry.base_delay;
}

void ErrorHandler::log_error(const StandardizedError& error) const {
    common::LogContext context;
    context.add("code", error.code)
           .add("category", category_to_string(error.category))
           .add("severity", severity_to_string(error.severity))
           .add("tool_name", error.tool_name)
           .add("operation", error.operation);
    if (error.request_id) {
        context.add("request_id", *error.request_id);
    }
    if (!error.context.empty()) {
        context.add("context", compact(error.context));
    }

    switch (error.severity) {
        case ErrorSeverity::CRITICAL:
            LOG_STRUCTURED(common::LogLevel::CRITICAL, "CRITICAL error: " + error.message, context);
            break;
        case ErrorSeverity::HIGH:
            LOG_STRUCTURED(common::LogLevel::ERROR, "HIGH error: " + error.message, context);
            break;
        case ErrorSeverity::MEDIUM:
            LOG_STRUCTURED(common::LogLevel::WARNING, "MEDIUM error: " + error.message, context);
            break;
        case ErrorSeverity::LOW:
            LOG_STRUCTURED(common::LogLevel::INFO, "LOW error: " + error.message, context);
            break;
    }
}

bool ErrorHandler::is_service_available(const std::string& service_name) const {
    auto breaker = circuit_breakers_.get(service_name);
    return !breaker || breaker->is_available();
}

void ErrorHandler::reset_circuit_breaker(const std::string& service_name) {
    if (auto breaker = circuit_breakers_.get(service_name)) {
        breaker->reset();
        LOG_INFO("Circuit breaker reset for {}", service_name);
    }
}

std::map<std::string, CircuitBreaker::Snapshot> ErrorHandler::get_circuit_breaker_states() const {
    return circuit_breakers_.snapshots();
}

bool ErrorHandler::wait_before_retry(Milliseconds delay) {
    std::unique_lock<std::mutex> lock(retry_mutex_);
    return !retry_cv_.wait_for(lock, delay, [this] { return retries_cancelled_.load(); });
}

void ErrorHandler::cancel_pending_retries() {
    {
        std::lock_guard<std::mutex> lock(retry_mutex_);
        retries_cancelled_.store(true);
    }
    retry_cv_.notify_all();
}

void ErrorHandler::reset() {
    circuit_breakers_.clear();
    std::lock_guard<std::mutex> lock(retry_mutex_);
    retries_cancelled_.store(false);
}

} // namespace resilience
} // namespace warden

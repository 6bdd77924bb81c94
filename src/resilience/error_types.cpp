#include "resilience/error_types.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace warden {
namespace resilience {

namespace {

std::string to_iso8601(wall_time_t timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

} // namespace

const char* category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::VALIDATION: return "validation";
        case ErrorCategory::PERFORMANCE: return "performance";
        case ErrorCategory::EXTERNAL: return "external";
        case ErrorCategory::RATE_LIMIT: return "rate_limit";
        case ErrorCategory::AUTHORIZATION: return "authorization";
        case ErrorCategory::RESOURCE: return "resource";
        case ErrorCategory::SYSTEM: return "system";
        case ErrorCategory::EXECUTION: return "execution";
    }
    return "unknown";
}

const char* severity_to_string(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "low";
        case ErrorSeverity::MEDIUM: return "medium";
        case ErrorSeverity::HIGH: return "high";
        case ErrorSeverity::CRITICAL: return "critical";
    }
    return "unknown";
}

const char* strategy_to_string(DegradationStrategy strategy) {
    switch (strategy) {
        case DegradationStrategy::FAIL: return "fail";
        case DegradationStrategy::RETRY: return "retry";
        case DegradationStrategy::FALLBACK: return "fallback";
        case DegradationStrategy::CIRCUIT: return "circuit";
    }
    return "unknown";
}

Json::Value StandardizedError::to_json() const {
    Json::Value json(Json::objectValue);
    json["code"] = code;
    json["message"] = message;
    json["category"] = category_to_string(category);
    json["severity"] = severity_to_string(severity);
    json["timestamp"] = to_iso8601(timestamp);
    json["context"] = context;

    Json::Value suggestion_list(Json::arrayValue);
    for (const auto& suggestion : suggestions) {
        suggestion_list.append(suggestion);
    }
    json["suggestions"] = suggestion_list;

    if (!tool_name.empty()) json["toolName"] = tool_name;
    if (!operation.empty()) json["operation"] = operation;
    if (request_id) json["requestId"] = *request_id;
    return json;
}

Json::Value ErrorResponse::to_json() const {
    Json::Value json(Json::objectValue);
    json["success"] = success;
    json["error"] = error.to_json();

    Json::Value meta(Json::objectValue);
    meta["degradationStrategy"] = strategy_to_string(metadata.degradation_strategy);
    meta["retryable"] = metadata.retryable;
    if (metadata.retry_after) {
        meta["retryAfterMs"] = static_cast<Json::Int64>(metadata.retry_after->count());
    }
    json["metadata"] = meta;
    return json;
}

Json::Value ValidationError::issues_to_json(const std::vector<ValidationIssue>& issues) {
    Json::Value context(Json::objectValue);
    Json::Value list(Json::arrayValue);
    for (const auto& issue : issues) {
        Json::Value item(Json::objectValue);
        item["path"] = issue.path;
        item["message"] = issue.message;
        list.append(item);
    }
    context["issues"] = list;
    return context;
}

} // namespace resilience
} // namespace warden

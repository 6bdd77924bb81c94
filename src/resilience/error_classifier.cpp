#include "resilience/error_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <initializer_list>
#include <new>

namespace warden {
namespace resilience {

namespace {

std::string to_lower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool contains_any(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (text.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

ErrorClassifier::Classification ErrorClassifier::for_category(ErrorCategory category, ErrorSeverity severity) {
    switch (category) {
        case ErrorCategory::VALIDATION:
            return {category, severity, DegradationStrategy::FAIL, false};
        case ErrorCategory::PERFORMANCE:
            return {category, severity,
                    severity == ErrorSeverity::CRITICAL ? DegradationStrategy::CIRCUIT : DegradationStrategy::RETRY,
                    true};
        case ErrorCategory::EXTERNAL:
            return {category, severity, DegradationStrategy::CIRCUIT, true};
        case ErrorCategory::RATE_LIMIT:
            return {category, severity, DegradationStrategy::RETRY, true};
        case ErrorCategory::AUTHORIZATION:
            return {category, severity, DegradationStrategy::FAIL, false};
        case ErrorCategory::RESOURCE:
            return {category, severity, DegradationStrategy::FALLBACK, true};
        case ErrorCategory::SYSTEM:
            return {category, severity, DegradationStrategy::FAIL, false};
        case ErrorCategory::EXECUTION:
            return {category, severity, DegradationStrategy::RETRY, true};
    }
    return {ErrorCategory::EXECUTION, severity, DegradationStrategy::RETRY, true};
}

ErrorClassifier::Classification ErrorClassifier::classify_message(const std::string& message) {
    const std::string text = to_lower(message);

    if (contains_any(text, {"validation", "invalid"})) {
        return for_category(ErrorCategory::VALIDATION, ErrorSeverity::MEDIUM);
    }
    if (contains_any(text, {"timeout", "timed out", "etimedout"})) {
        return for_category(ErrorCategory::PERFORMANCE, ErrorSeverity::HIGH);
    }
    if (contains_any(text, {"econnrefused", "enotfound", "connection refused", "network"})) {
        return for_category(ErrorCategory::EXTERNAL, ErrorSeverity::HIGH);
    }
    if (contains_any(text, {"rate limit", "too many requests"})) {
        return for_category(ErrorCategory::RATE_LIMIT, ErrorSeverity::MEDIUM);
    }
    if (contains_any(text, {"permission", "unauthorized", "forbidden", "access denied"})) {
        return for_category(ErrorCategory::AUTHORIZATION, ErrorSeverity::HIGH);
    }
    if (contains_any(text, {"enoent", "not found", "no such file"})) {
        return for_category(ErrorCategory::RESOURCE, ErrorSeverity::MEDIUM);
    }
    if (contains_any(text, {"enomem", "emfile", "out of memory"})) {
        return for_category(ErrorCategory::SYSTEM, ErrorSeverity::CRITICAL);
    }
    return for_category(ErrorCategory::EXECUTION, ErrorSeverity::MEDIUM);
}

ErrorClassifier::Classification ErrorClassifier::classify(const std::exception& error) {
    if (const auto* service_error = dynamic_cast<const ServiceError*>(&error)) {
        Classification result = for_category(service_error->category(), service_error->severity());
        if (auto retryable = service_error->retryable()) {
            result.retryable = *retryable;
        }
        return result;
    }

    if (dynamic_cast<const std::bad_alloc*>(&error) != nullptr) {
        return for_category(ErrorCategory::SYSTEM, ErrorSeverity::CRITICAL);
    }

    if (dynamic_cast<const std::filesystem::filesystem_error*>(&error) != nullptr) {
        return for_category(ErrorCategory::RESOURCE, ErrorSeverity::MEDIUM);
    }

    return classify_message(error.what());
}

} // namespace resilience
} // namespace warden

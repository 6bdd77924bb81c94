#pragma once

#include "resilience/error_types.hpp"
#include <exception>
#include <string>

namespace warden {
namespace resilience {

/**
 * Maps failures onto the error taxonomy.
 *
 * ServiceErrors keep the classification they were raised with. Anything
 * else crossed an opaque boundary and is classified from its type and a
 * case-insensitive keyword scan of its message, first match wins:
 *
 *   validation    "validation", "invalid"
 *   performance   "timeout", "timed out", "etimedout"
 *   external      "econnrefused", "enotfound", "connection refused", "network"
 *   rate limit    "rate limit", "too many requests"
 *   authorization "permission", "unauthorized", "forbidden", "access denied"
 *   resource      "enoent", "not found", "no such file"
 *   system        "enomem", "emfile", "out of memory"
 *   anything else is an execution error
 */
class ErrorClassifier {
public:
    struct Classification {
        ErrorCategory category;
        ErrorSeverity severity;
        DegradationStrategy strategy;
        bool retryable;
    };

    static Classification classify(const std::exception& error);
    static Classification classify_message(const std::string& message);

    // Default strategy and retryability for a category
    static Classification for_category(ErrorCategory category, ErrorSeverity severity);
};

} // namespace resilience
} // namespace warden

#pragma once

#include "common/types.hpp"
#include "resilience/error_handler.hpp"
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace adapter {

enum class FallbackStrategy {
    CACHE,       // Any value cached for the key, expired or not
    SIMPLIFIED,  // The operation's cheaper code path
    PARTIAL,     // Incomplete result
    DEFAULT,     // The operation's default result
    FAIL         // Stop without attempting anything further
};

const char* fallback_strategy_to_string(FallbackStrategy strategy);
std::optional<FallbackStrategy> fallback_strategy_from_string(const std::string& name);

struct FallbackConfig {
    bool enable_fallback = true;
    FallbackStrategy fallback_strategy = FallbackStrategy::CACHE;
    u32 max_retries = 3;
    Milliseconds retry_delay{1000};
    double backoff_multiplier = 2.0;
    Milliseconds max_retry_delay{10000};
    Milliseconds operation_timeout{30000};   // zero runs the core inline without a bound

    // Tried in order when set; otherwise just fallback_strategy
    std::vector<FallbackStrategy> fallback_chain;

    std::vector<FallbackStrategy> effective_chain() const {
        if (!fallback_chain.empty()) {
            return fallback_chain;
        }
        return {fallback_strategy};
    }

    // max_retries + 1 attempts in total
    resilience::RetryPolicy retry_policy() const {
        resilience::RetryPolicy policy;
        policy.max_attempts = max_retries + 1;
        policy.base_delay = retry_delay;
        policy.backoff_multiplier = backoff_multiplier;
        policy.max_delay = max_retry_delay;
        return policy;
    }
};

} // namespace adapter
} // namespace warden

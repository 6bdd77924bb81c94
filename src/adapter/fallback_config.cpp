#include "adapter/fallback_config.hpp"
#include <algorithm>
#include <cctype>

namespace warden {
namespace adapter {

const char* fallback_strategy_to_string(FallbackStrategy strategy) {
    switch (strategy) {
        case FallbackStrategy::CACHE: return "cache";
        case FallbackStrategy::SIMPLIFIED: return "simplified";
        case FallbackStrategy::PARTIAL: return "partial";
        case FallbackStrategy::DEFAULT: return "default";
        case FallbackStrategy::FAIL: return "fail";
    }
    return "unknown";
}

std::optional<FallbackStrategy> fallback_strategy_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (FallbackStrategy strategy : {FallbackStrategy::CACHE, FallbackStrategy::SIMPLIFIED,
                                      FallbackStrategy::PARTIAL, FallbackStrategy::DEFAULT,
                                      FallbackStrategy::FAIL}) {
        if (lower == fallback_strategy_to_string(strategy)) {
            return strategy;
        }
    }
    return std::nullopt;
}

} // namespace adapter
} // namespace warden

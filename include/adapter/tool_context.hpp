#pragma once

#include "common/types.hpp"
#include <json/json.h>
#include <optional>
#include <string>

namespace warden {
namespace adapter {

// Identity of one invocation, carried through logging and errors
struct ToolContext {
    std::string tool_name;
    std::string operation;
    Json::Value parameters{Json::objectValue};
    std::string user_id;
    std::string session_id;
    std::string trace_id;
    std::string request_id;
};

enum class ExecutionStatus {
    SUCCESS,
    FAILURE,
    PARTIAL,
    CACHED,
    DEGRADED
};

const char* execution_status_to_string(ExecutionStatus status);

struct ExecutionMetrics {
    timestamp_t start_time{};
    std::optional<timestamp_t> end_time;
    std::optional<Milliseconds> duration;
    std::optional<bool> cache_hit;
    u32 retry_count = 0;
    u32 error_count = 0;

    // Stamps end_time and duration
    void finish(timestamp_t now) {
        end_time = now;
        duration = std::chrono::duration_cast<Milliseconds>(now - start_time);
    }
};

} // namespace adapter
} // namespace warden

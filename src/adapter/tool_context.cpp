#include "adapter/tool_context.hpp"

namespace warden {
namespace adapter {

const char* execution_status_to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::SUCCESS: return "success";
        case ExecutionStatus::FAILURE: return "failure";
        case ExecutionStatus::PARTIAL: return "partial";
        case ExecutionStatus::CACHED: return "cached";
        case ExecutionStatus::DEGRADED: return "degraded";
    }
    return "unknown";
}

} // namespace adapter
} // namespace warden

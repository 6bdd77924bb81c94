#pragma once

#include "adapter/tool_context.hpp"
#include "cache/cache_manager.hpp"
#include <json/json.h>
#include <optional>
#include <string>

namespace warden {
namespace adapter {

/**
 * One backend operation exposed through a ServiceAdapter.
 *
 * execute_core produces the raw JSON document that gets cached;
 * transform_output turns raw documents (fresh or cached) into Result.
 * validate_input reports bad input by throwing resilience::ValidationError.
 *
 * The fallback hooks return nothing when the operation has no such path.
 */
template<typename Params, typename Result>
class ServiceOperation {
public:
    virtual ~ServiceOperation() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual cache::CacheLayer cache_layer() const = 0;

    virtual Params validate_input(const Json::Value& raw) const = 0;
    virtual std::string cache_key(const Params& params) const = 0;

    // Empty means the cache layer default
    virtual std::optional<Milliseconds> ttl() const { return std::nullopt; }

    // May run on a worker thread when the adapter enforces a timeout
    virtual Json::Value execute_core(const Params& params, const ToolContext& context) = 0;
    virtual Result transform_output(const Json::Value& raw) const = 0;

    virtual std::optional<Result> execute_simplified(const Params& /*params*/, const ToolContext& /*context*/) {
        return std::nullopt;
    }

    virtual std::optional<Result> execute_partial(const Params& /*params*/, const ToolContext& /*context*/) {
        return std::nullopt;
    }

    virtual std::optional<Result> default_result(const Params& /*params*/) const {
        return std::nullopt;
    }

    virtual std::optional<Json::Value> health_check_params() const {
        return std::nullopt;
    }
};

} // namespace adapter
} // namespace warden

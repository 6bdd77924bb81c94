#pragma once

#include "resilience/error_types.hpp"
#include <json/json.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace adapter {

/**
 * Declarative field rules for JSON parameters.
 *
 * Paths are dot-separated member names ("options.depth"). Constraints on a
 * field are only checked when the field is present; required() adds the
 * presence check. All issues are collected before returning.
 */
class ParamValidator {
public:
    enum class FieldType {
        STRING,
        INTEGER,
        NUMBER,
        BOOLEAN,
        ARRAY,
        OBJECT
    };

    struct Result {
        bool ok = true;
        std::vector<resilience::ValidationIssue> issues;
    };

    // Returns an error message, or nothing when the value is acceptable
    using Check = std::function<std::optional<std::string>(const Json::Value& value)>;

    ParamValidator& required(const std::string& path, FieldType type);
    ParamValidator& optional(const std::string& path, FieldType type);
    ParamValidator& min_length(const std::string& path, size_t min);
    ParamValidator& range(const std::string& path, double min, double max);
    ParamValidator& one_of(const std::string& path, std::vector<std::string> allowed);
    ParamValidator& custom(const std::string& path, Check check);

    Result validate(const Json::Value& input) const;

    // Throws ValidationError carrying every issue
    void validate_or_throw(const Json::Value& input, const std::string& tool_name = "") const;

    static const char* type_name(FieldType type);
    static bool matches_type(const Json::Value& value, FieldType type);

private:
    struct Rule {
        std::string path;
        bool presence_required;
        Check check;
    };

    static const Json::Value* resolve(const Json::Value& input, const std::string& path);

    std::vector<Rule> rules_;
};

} // namespace adapter
} // namespace warden

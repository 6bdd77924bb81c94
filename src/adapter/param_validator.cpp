#include "adapter/param_validator.hpp"
#include <sstream>

namespace warden {
namespace adapter {

const char* ParamValidator::type_name(FieldType type) {
    switch (type) {
        case FieldType::STRING: return "string";
        case FieldType::INTEGER: return "integer";
        case FieldType::NUMBER: return "number";
        case FieldType::BOOLEAN: return "boolean";
        case FieldType::ARRAY: return "array";
        case FieldType::OBJECT: return "object";
    }
    return "unknown";
}

bool ParamValidator::matches_type(const Json::Value& value, FieldType type) {
    switch (type) {
        case FieldType::STRING: return value.isString();
        case FieldType::INTEGER: return value.isIntegral() && !value.isBool();
        case FieldType::NUMBER: return value.isNumeric() && !value.isBool();
        case FieldType::BOOLEAN: return value.isBool();
        case FieldType::ARRAY: return value.isArray();
        case FieldType::OBJECT: return value.isObject();
    }
    return false;
}

const Json::Value* ParamValidator::resolve(const Json::Value& input, const std::string& path) {
    const Json::Value* current = &input;
    std::istringstream parts(path);
    std::string part;

    while (std::getline(parts, part, '.')) {
        if (!current->isObject() || !current->isMember(part)) {
            return nullptr;
        }
        current = &(*current)[part];
    }
    return current;
}

ParamValidator& ParamValidator::required(const std::string& path, FieldType type) {
    rules_.push_back({path, true, [type](const Json::Value& value) -> std::optional<std::string> {
        if (!matches_type(value, type)) {
            return std::string("Expected ") + type_name(type);
        }
        return std::nullopt;
    }});
    return *this;
}

ParamValidator& ParamValidator::optional(const std::string& path, FieldType type) {
    rules_.push_back({path, false, [type](const Json::Value& value) -> std::optional<std::string> {
        if (!value.isNull() && !matches_type(value, type)) {
            return std::string("Expected ") + type_name(type);
        }
        return std::nullopt;
    }});
    return *this;
}

ParamValidator& ParamValidator::min_length(const std::string& path, size_t min) {
    rules_.push_back({path, false, [min](const Json::Value& value) -> std::optional<std::string> {
        size_t length = 0;
        if (value.isString()) {
            length = value.asString().size();
        } else if (value.isArray()) {
            length = value.size();
        } else {
            return std::nullopt;
        }
        if (length < min) {
            return "Must have at least " + std::to_string(min) + " element(s)";
        }
        return std::nullopt;
    }});
    return *this;
}

ParamValidator& ParamValidator::range(const std::string& path, double min, double max) {
    rules_.push_back({path, false, [min, max](const Json::Value& value) -> std::optional<std::string> {
        if (!value.isNumeric() || value.isBool()) {
            return std::nullopt;
        }
        const double number = value.asDouble();
        if (number < min || number > max) {
            std::ostringstream oss;
            oss << "Must be between " << min << " and " << max;
            return oss.str();
        }
        return std::nullopt;
    }});
    return *this;
}

ParamValidator& ParamValidator::one_of(const std::string& path, std::vector<std::string> allowed) {
    rules_.push_back({path, false, [allowed = std::move(allowed)](const Json::Value& value)
                                       -> std::optional<std::string> {
        if (!value.isString()) {
            return std::nullopt;
        }
        for (const auto& candidate : allowed) {
            if (value.asString() == candidate) {
                return std::nullopt;
            }
        }

        std::string message = "Must be one of:";
        for (const auto& candidate : allowed) {
            message += " " + candidate;
        }
        return message;
    }});
    return *this;
}

ParamValidator& ParamValidator::custom(const std::string& path, Check check) {
    rules_.push_back({path, false, std::move(check)});
    return *this;
}

ParamValidator::Result ParamValidator::validate(const Json::Value& input) const {
    Result result;

    if (!input.isObject()) {
        result.ok = false;
        result.issues.push_back({"", "Expected an object"});
        return result;
    }

    for (const auto& rule : rules_) {
        const Json::Value* value = resolve(input, rule.path);
        if (value == nullptr) {
            if (rule.presence_required) {
                result.issues.push_back({rule.path, "Required"});
            }
            continue;
        }

        if (auto message = rule.check(*value)) {
            result.issues.push_back({rule.path, *message});
        }
    }

    result.ok = result.issues.empty();
    return result;
}

void ParamValidator::validate_or_throw(const Json::Value& input, const std::string& tool_name) const {
    Result result = validate(input);
    if (result.ok) {
        return;
    }

    std::string message = "Invalid parameters";
    if (!tool_name.empty()) {
        message += " for " + tool_name;
    }
    message += ":";
    for (const auto& issue : result.issues) {
        message += " " + (issue.path.empty() ? std::string("<root>") : issue.path) + " (" + issue.message + ")";
    }

    resilience::ValidationError error(message, std::move(result.issues));
    error.with_origin(tool_name, "validate_input");
    throw error;
}

} // namespace adapter
} // namespace warden

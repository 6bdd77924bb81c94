#pragma once

#include <stdexcept>
#include <string>

namespace warden {

// Base exception class for the warden runtime
class WardenException : public std::runtime_error {
public:
    explicit WardenException(const std::string& message)
        : std::runtime_error(message) {}
};

// Configuration exceptions
class ConfigException : public WardenException {
public:
    explicit ConfigException(const std::string& message)
        : WardenException("Configuration Error: " + message) {}
};

// Utility macros for error handling
#define WARDEN_THROW_IF(condition, exception_type, message) \
    do { \
        if (condition) { \
            throw exception_type(message); \
        } \
    } while(0)

#define WARDEN_ASSERT(condition, message) \
    WARDEN_THROW_IF(!(condition), warden::WardenException, message)

} // namespace warden

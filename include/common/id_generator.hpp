#pragma once

#include <string>

namespace warden {
namespace common {

// Random RFC 4122 identifier, lower-case hex
std::string generate_uuid();

// "<prefix>-<uuid>"
std::string generate_prefixed_id(const std::string& prefix);

} // namespace common
} // namespace warden

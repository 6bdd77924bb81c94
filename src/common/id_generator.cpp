#include "common/id_generator.hpp"
#include <uuid/uuid.h>

namespace warden {
namespace common {

std::string generate_uuid() {
    uuid_t uuid;
    uuid_generate_random(uuid);

    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);

    return std::string(uuid_str);
}

std::string generate_prefixed_id(const std::string& prefix) {
    return prefix + "-" + generate_uuid();
}

} // namespace common
} // namespace warden

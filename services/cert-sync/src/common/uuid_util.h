/**
 * @file uuid_util.h
 * @brief Random (v4) UUID generation
 */

#pragma once

#include <uuid/uuid.h>
#include <string>

namespace certsync::common {

/// @brief Lowercase canonical form, e.g. "3f2b...-...."
inline std::string generateUuid() {
    uuid_t uuid;
    char uuidStr[37];
    uuid_generate_random(uuid);
    uuid_unparse_lower(uuid, uuidStr);
    return std::string(uuidStr);
}

} // namespace certsync::common

/**
 * @file uuid.cpp
 * @brief Random UUID generation implementation
 */

#include "utils/uuid.h"

#include <uuid/uuid.h>

namespace monitorgate::utils {

namespace {
constexpr size_t kUuidStringSize = 37;  // 36 characters + NUL
}  // namespace

std::string GenerateUuidV4() {
  uuid_t uuid;
  uuid_generate_random(uuid);
  char buffer[kUuidStringSize];  // NOLINT(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)
  uuid_unparse_lower(uuid, buffer);
  return std::string(buffer);
}

}  // namespace monitorgate::utils

/**
 * @file uuid.h
 * @brief Random (version 4) UUID generation
 */

#pragma once

#include <string>

namespace monitorgate::utils {

/**
 * @brief Generate a random RFC 4122 version 4 UUID
 *
 * Thread-safe; backed by libuuid.
 *
 * @return Lower-case canonical form, e.g. "3b241101-e2bb-4255-8caf-4136c566a962"
 */
std::string GenerateUuidV4();

}  // namespace monitorgate::utils

#pragma once

#include <string>

namespace hsync::core {

/**
 * @brief Mint a random, collision-resistant identifier (UUID v4 text form)
 *
 * Used for record ids created on-device, outbox entry ids and conflict ids.
 * Thread safe.
 */
std::string generate_id();

} // namespace hsync::core

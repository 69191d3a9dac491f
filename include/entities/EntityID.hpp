/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_ID_HPP
#define ENTITY_ID_HPP

#include <cstdint>

namespace CosmicEngine {

// Opaque handle owned by the host entity store. 0 is never a live entity.
using EntityID = uint64_t;

constexpr EntityID INVALID_ENTITY_ID = 0;

} // namespace CosmicEngine

#endif // ENTITY_ID_HPP

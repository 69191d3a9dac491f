/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_INFO_HPP
#define COLLISION_INFO_HPP

#include "entities/EntityID.hpp"
#include "utils/Vector2D.hpp"

namespace CosmicEngine {

// One overlapping pair. Always a < b, overlap > 0, normal is unit length
// and points from a toward b.
struct CollisionInfo {
    EntityID a{INVALID_ENTITY_ID};
    EntityID b{INVALID_ENTITY_ID};
    float overlap{0.0f};
    Vector2D normal{1.0f, 0.0f};
    Vector2D contact{0.0f, 0.0f};
};

// Result of a ray query against a single collider
struct RaycastHit {
    EntityID entity{INVALID_ENTITY_ID};
    Vector2D point{0.0f, 0.0f};
    Vector2D normal{0.0f, 0.0f};
    float distance{0.0f};
};

} // namespace CosmicEngine

#endif // COLLISION_INFO_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef I_COLLISION_WORLD_HPP
#define I_COLLISION_WORLD_HPP

#include <optional>
#include "entities/EntityID.hpp"
#include "utils/Vector2D.hpp"

namespace CosmicEngine {

/**
 * @brief Host-side entity storage seen by the collision code
 *
 * Getters return std::nullopt when the entity has no such component; the
 * caller skips the entity for that operation. Setters on unknown entities
 * are expected to be ignored by the host.
 */
class ICollisionWorld {
public:
    virtual ~ICollisionWorld() = default;

    virtual std::optional<Vector2D> getPosition(EntityID id) const = 0;
    virtual void setPosition(EntityID id, const Vector2D& position) = 0;

    virtual std::optional<Vector2D> getVelocity(EntityID id) const = 0;
    virtual void setVelocity(EntityID id, const Vector2D& velocity) = 0;

    // Missing or non-positive mass is treated as 1
    virtual std::optional<float> getMass(EntityID id) const = 0;
};

} // namespace CosmicEngine

#endif // I_COLLISION_WORLD_HPP

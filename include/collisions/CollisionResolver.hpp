/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_RESOLVER_HPP
#define COLLISION_RESOLVER_HPP

#include <cstdint>
#include <optional>
#include <random>
#include "collisions/CollisionConfig.hpp"
#include "collisions/CollisionInfo.hpp"
#include "collisions/ICollisionWorld.hpp"
#include "entities/EntityID.hpp"
#include "utils/Vector2D.hpp"

namespace CosmicEngine {

// Share of the total separation given to each side of a collision
struct MassRatios {
    float a{0.5f};
    float b{0.5f};
};

/**
 * @brief Immediate positional and velocity responses to collisions
 *
 * Works directly on the host world: positions and velocities are read and
 * written back through ICollisionWorld. Entities lacking the needed component
 * are left alone. Nothing here is called by the pipeline on its own.
 */
class CollisionResolver {
public:
    static constexpr float DEFAULT_BOUNCINESS = 0.5f;
    // Closer than this to a push origin, the direction is picked at random
    static constexpr float COINCIDENT_EPSILON = 1e-4f;

    explicit CollisionResolver(ICollisionWorld& world,
                               const CollisionConfig& config = CollisionConfig());
    // Fixed seed for reproducible pushAwayFromPoint directions
    CollisionResolver(ICollisionWorld& world, const CollisionConfig& config, uint32_t seed);

    /**
     * @brief Moves a along -normal and b along +normal until they no longer overlap
     *
     * Total travel is overlap + separation buffer. By default a gets
     * mB / (mA + mB) of it and b the rest, so the heavier entity moves less.
     * Explicit ratios replace the mass split.
     */
    void separateEntities(const CollisionInfo& collision,
                          std::optional<MassRatios> ratios = std::nullopt);

    // velocity += direction * force / mass
    void applyKnockback(EntityID entity, const Vector2D& direction, float force);
    void applyKnockbackFromCollision(const CollisionInfo& collision, float force);

    // Separation, then knockback when force > 0
    void resolveCollision(const CollisionInfo& collision, float knockbackForce = 0.0f);

    // Reflects the velocity off a surface it is moving into; bounciness is
    // clamped to [0, 1]
    void bounceEntity(EntityID entity, const Vector2D& normal,
                      float bounciness = DEFAULT_BOUNCINESS);

    void pushAwayFromPoint(EntityID entity, const Vector2D& point, float force,
                           float minDistance = 0.0f);

    // Host mass, or 1 when missing, non-positive or not finite
    float getEffectiveMass(EntityID entity) const;

    void setSeparationBuffer(float buffer);
    float getSeparationBuffer() const { return m_separationBuffer; }

private:
    ICollisionWorld& m_world;
    float m_separationBuffer;
    std::mt19937 m_rng;
};

} // namespace CosmicEngine

#endif // COLLISION_RESOLVER_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_CONTEXT_HPP
#define COLLISION_CONTEXT_HPP

#include <cstdint>
#include <optional>
#include "collisions/CollisionConfig.hpp"
#include "collisions/CollisionResolver.hpp"
#include "collisions/CollisionSystem.hpp"
#include "collisions/ICollisionWorld.hpp"
#include "collisions/SpatialHash.hpp"
#include "entities/EntityID.hpp"

namespace CosmicEngine {

/**
 * @brief Owns one spatial index, pipeline and resolver bound to one host world
 *
 * Construct one per simulation and hand references to the systems that need
 * collision data. The world must outlive the context.
 */
class CollisionContext {
public:
    explicit CollisionContext(ICollisionWorld& world,
                              const CollisionConfig& config = CollisionConfig(),
                              std::optional<uint32_t> resolverSeed = std::nullopt);

    CollisionContext(const CollisionContext&) = delete;
    CollisionContext& operator=(const CollisionContext&) = delete;

    // One simulation tick of collision detection
    void update();

    // Tests the pair on live positions (layers ignored) and pushes it apart
    // by mass if it overlaps. Returns whether anything moved.
    bool separatePair(EntityID a, EntityID b);

    SpatialHash& getSpatialHash() { return m_spatialHash; }
    const SpatialHash& getSpatialHash() const { return m_spatialHash; }
    CollisionSystem& getCollisionSystem() { return m_collisionSystem; }
    const CollisionSystem& getCollisionSystem() const { return m_collisionSystem; }
    CollisionResolver& getResolver() { return m_resolver; }
    const CollisionConfig& getConfig() const { return m_config; }
    uint64_t getTickCount() const { return m_tickCount; }

private:
    CollisionConfig m_config;
    SpatialHash m_spatialHash;
    CollisionSystem m_collisionSystem;
    CollisionResolver m_resolver;
    uint64_t m_tickCount{0};
};

} // namespace CosmicEngine

#endif // COLLISION_CONTEXT_HPP

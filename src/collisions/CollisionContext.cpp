/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionContext.hpp"
#include "core/Logger.hpp"
#include <random>
#include <string>

namespace CosmicEngine {

CollisionContext::CollisionContext(ICollisionWorld& world, const CollisionConfig& config,
                                   std::optional<uint32_t> resolverSeed)
    : m_config(config),
      m_spatialHash(config.cellSize),
      m_collisionSystem(m_spatialHash, world, config),
      m_resolver(world, config, resolverSeed.value_or(std::random_device{}())) {
    COLLISION_INFO("Collision context created (cell size " +
                   std::to_string(m_spatialHash.getCellSize()) + ", check budget " +
                   std::to_string(m_collisionSystem.getMaxChecksPerFrame()) + ")");
}

void CollisionContext::update() {
    m_collisionSystem.update();
    ++m_tickCount;
}

bool CollisionContext::separatePair(EntityID a, EntityID b) {
    const auto collision = m_collisionSystem.testPair(a, b);
    if (!collision.has_value()) {
        return false;
    }
    m_resolver.separateEntities(*collision);
    return true;
}

} // namespace CosmicEngine

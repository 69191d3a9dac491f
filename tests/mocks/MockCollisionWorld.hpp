/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_COLLISION_WORLD_HPP
#define MOCK_COLLISION_WORLD_HPP

#include <optional>
#include <unordered_map>
#include "collisions/ICollisionWorld.hpp"

// In-memory host world for tests. Every component is optional so tests can
// drop positions, velocities or masses individually.
class MockCollisionWorld : public CosmicEngine::ICollisionWorld {
public:
    using EntityID = CosmicEngine::EntityID;
    using Vector2D = CosmicEngine::Vector2D;

    void setEntity(EntityID id, const Vector2D& position,
                   std::optional<Vector2D> velocity = std::nullopt,
                   std::optional<float> mass = std::nullopt) {
        m_positions[id] = position;
        if (velocity) m_velocities[id] = *velocity; else m_velocities.erase(id);
        if (mass) m_masses[id] = *mass; else m_masses.erase(id);
    }

    void removePosition(EntityID id) { m_positions.erase(id); }
    void removeEntity(EntityID id) {
        m_positions.erase(id);
        m_velocities.erase(id);
        m_masses.erase(id);
    }

    std::optional<Vector2D> getPosition(EntityID id) const override {
        auto it = m_positions.find(id);
        if (it == m_positions.end()) return std::nullopt;
        return it->second;
    }

    // Mirrors a host that only writes components the entity already has
    void setPosition(EntityID id, const Vector2D& position) override {
        ++positionWrites;
        auto it = m_positions.find(id);
        if (it != m_positions.end()) it->second = position;
    }

    std::optional<Vector2D> getVelocity(EntityID id) const override {
        auto it = m_velocities.find(id);
        if (it == m_velocities.end()) return std::nullopt;
        return it->second;
    }

    void setVelocity(EntityID id, const Vector2D& velocity) override {
        auto it = m_velocities.find(id);
        if (it != m_velocities.end()) it->second = velocity;
    }

    std::optional<float> getMass(EntityID id) const override {
        auto it = m_masses.find(id);
        if (it == m_masses.end()) return std::nullopt;
        return it->second;
    }

    int positionWrites{0};

private:
    std::unordered_map<EntityID, Vector2D> m_positions;
    std::unordered_map<EntityID, Vector2D> m_velocities;
    std::unordered_map<EntityID, float> m_masses;
};

#endif // MOCK_COLLISION_WORLD_HPP

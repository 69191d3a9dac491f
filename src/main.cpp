/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Headless collision demo: a box of circles and crates bouncing around for a
// fixed number of ticks, with blocking contacts resolved every tick.
//
// Usage: cosmic_collision_demo [config.json] [entities] [ticks]

#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

#include "collisions/CollisionContext.hpp"
#include "core/Logger.hpp"

using namespace CosmicEngine;

namespace {

constexpr float WORLD_HALF_EXTENT{1000.0f};
constexpr float TICK_SECONDS{1.0f / 60.0f};
constexpr size_t DEFAULT_ENTITY_COUNT{1000};
constexpr size_t DEFAULT_TICK_COUNT{600};
constexpr uint32_t DEMO_SEED{1337};

class DemoWorld : public ICollisionWorld {
public:
    struct Body {
        Vector2D position;
        Vector2D velocity;
        float mass{1.0f};
    };

    void add(EntityID id, const Body& body) { m_bodies[id] = body; }

    std::optional<Vector2D> getPosition(EntityID id) const override {
        auto it = m_bodies.find(id);
        if (it == m_bodies.end()) return std::nullopt;
        return it->second.position;
    }

    void setPosition(EntityID id, const Vector2D& position) override {
        auto it = m_bodies.find(id);
        if (it != m_bodies.end()) it->second.position = position;
    }

    std::optional<Vector2D> getVelocity(EntityID id) const override {
        auto it = m_bodies.find(id);
        if (it == m_bodies.end()) return std::nullopt;
        return it->second.velocity;
    }

    void setVelocity(EntityID id, const Vector2D& velocity) override {
        auto it = m_bodies.find(id);
        if (it != m_bodies.end()) it->second.velocity = velocity;
    }

    std::optional<float> getMass(EntityID id) const override {
        auto it = m_bodies.find(id);
        if (it == m_bodies.end()) return std::nullopt;
        return it->second.mass;
    }

    // Explicit Euler step, reflecting off the world bounds
    void integrate(float dt) {
        for (auto& [id, body] : m_bodies) {
            body.position += body.velocity * dt;
            if (std::abs(body.position.getX()) > WORLD_HALF_EXTENT) {
                body.velocity.setX(-body.velocity.getX());
                body.position.setX(std::clamp(body.position.getX(), -WORLD_HALF_EXTENT, WORLD_HALF_EXTENT));
            }
            if (std::abs(body.position.getY()) > WORLD_HALF_EXTENT) {
                body.velocity.setY(-body.velocity.getY());
                body.position.setY(std::clamp(body.position.getY(), -WORLD_HALF_EXTENT, WORLD_HALF_EXTENT));
            }
        }
    }

private:
    std::unordered_map<EntityID, Body> m_bodies;
};

size_t parseCount(const char* arg, size_t fallback) {
    char* end = nullptr;
    const unsigned long long value = std::strtoull(arg, &end, 10);
    if (end == arg || *end != '\0' || value == 0) {
        DEMO_WARN(std::string("Ignoring invalid count '") + arg + "'");
        return fallback;
    }
    return static_cast<size_t>(value);
}

} // namespace

int main(int argc, char* argv[]) {
    // Per-entity attach messages would drown the summary
    Logger::SetMinimumLevel(LogLevel::INFO);

    CollisionConfig config;
    if (argc > 1 && !config.loadFromFile(argv[1])) {
        std::cerr << "Could not use config " << argv[1] << ", continuing with defaults" << std::endl;
    }
    const size_t entityCount = argc > 2 ? parseCount(argv[2], DEFAULT_ENTITY_COUNT) : DEFAULT_ENTITY_COUNT;
    const size_t tickCount = argc > 3 ? parseCount(argv[3], DEFAULT_TICK_COUNT) : DEFAULT_TICK_COUNT;

    DemoWorld world;
    CollisionContext context(world, config, DEMO_SEED);
    CollisionSystem& collisions = context.getCollisionSystem();
    CollisionResolver& resolver = context.getResolver();

    std::mt19937 rng(DEMO_SEED);
    std::uniform_real_distribution<float> posDist(-WORLD_HALF_EXTENT, WORLD_HALF_EXTENT);
    std::uniform_real_distribution<float> velDist(-120.0f, 120.0f);
    std::uniform_real_distribution<float> sizeDist(4.0f, 16.0f);
    std::uniform_real_distribution<float> massDist(0.5f, 4.0f);

    for (size_t i = 0; i < entityCount; ++i) {
        const EntityID id = static_cast<EntityID>(i + 1);
        world.add(id, DemoWorld::Body{Vector2D(posDist(rng), posDist(rng)),
                                      Vector2D(velDist(rng), velDist(rng)), massDist(rng)});

        // Every tenth entity is a crate, every twenty-fifth a pickup zone
        Collider collider;
        if (i % 25 == 0) {
            collider = Collider::circle(sizeDist(rng) * 2.0f, Layer_Pickup, CollisionMasks::Pickup, true);
        } else if (i % 10 == 0) {
            collider = Collider::rect(sizeDist(rng) * 2.0f, sizeDist(rng) * 2.0f, Layer_Wall, CollisionMasks::Wall);
        } else if (i % 2 == 0) {
            collider = Collider::circle(sizeDist(rng), Layer_Enemy, CollisionMasks::Enemy);
        } else {
            collider = Collider::circle(sizeDist(rng), Layer_Player, CollisionMasks::Player);
        }
        collisions.attachCollider(id, collider);
    }

    size_t blockingTotal = 0;
    size_t triggerEnters = 0;
    size_t triggerExits = 0;
    size_t truncatedTicks = 0;

    collisions.onCollision([&](const CollisionInfo& info) {
        ++blockingTotal;
        resolver.resolveCollision(info, 20.0f);
    });
    collisions.onTriggerEnter([&](EntityID, EntityID) { ++triggerEnters; });
    collisions.onTriggerExit([&](EntityID, EntityID) { ++triggerExits; });

    DEMO_INFO("Running " + std::to_string(tickCount) + " ticks with " +
              std::to_string(entityCount) + " entities");

    const Uint64 frequency = SDL_GetPerformanceFrequency();
    const Uint64 start = SDL_GetPerformanceCounter();
    Uint64 worstTick = 0;

    for (size_t tick = 0; tick < tickCount; ++tick) {
        const Uint64 tickStart = SDL_GetPerformanceCounter();
        world.integrate(TICK_SECONDS);
        context.update();
        worstTick = std::max(worstTick, SDL_GetPerformanceCounter() - tickStart);
        if (collisions.wasBudgetExceeded()) {
            ++truncatedTicks;
        }
    }

    const double totalMs = static_cast<double>(SDL_GetPerformanceCounter() - start) * 1000.0 /
                           static_cast<double>(frequency);
    const double worstMs = static_cast<double>(worstTick) * 1000.0 / static_cast<double>(frequency);

    context.getSpatialHash().logStatistics();

    std::cout << std::fixed << std::setprecision(3)
              << "Ticks:              " << tickCount << "\n"
              << "Entities:           " << entityCount << "\n"
              << "Blocking contacts:  " << blockingTotal << "\n"
              << "Trigger enter/exit: " << triggerEnters << " / " << triggerExits << "\n"
              << "Truncated ticks:    " << truncatedTicks << "\n"
              << "Average tick (ms):  " << totalMs / static_cast<double>(tickCount) << "\n"
              << "Worst tick (ms):    " << worstMs << std::endl;

    return 0;
}

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionResolver.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace CosmicEngine {

namespace {
constexpr float TWO_PI = 6.28318530717958647692f;

float sanitizeBuffer(float buffer) {
    if (!std::isfinite(buffer) || buffer < 0.0f) {
        RESOLVER_WARN("Invalid separation buffer " + std::to_string(buffer) + ", using default");
        return CollisionConfig::DEFAULT_SEPARATION_BUFFER;
    }
    return buffer;
}
} // namespace

CollisionResolver::CollisionResolver(ICollisionWorld& world, const CollisionConfig& config)
    : CollisionResolver(world, config, std::random_device{}()) {}

CollisionResolver::CollisionResolver(ICollisionWorld& world, const CollisionConfig& config,
                                     uint32_t seed)
    : m_world(world),
      m_separationBuffer(sanitizeBuffer(config.separationBuffer)),
      m_rng(seed) {}

float CollisionResolver::getEffectiveMass(EntityID entity) const {
    const auto mass = m_world.getMass(entity);
    if (!mass.has_value() || !std::isfinite(*mass) || *mass <= 0.0f) {
        return 1.0f;
    }
    return *mass;
}

void CollisionResolver::separateEntities(const CollisionInfo& collision,
                                         std::optional<MassRatios> ratios) {
    const auto positionA = m_world.getPosition(collision.a);
    const auto positionB = m_world.getPosition(collision.b);
    if (!positionA.has_value() && !positionB.has_value()) {
        return;
    }

    float ratioA;
    float ratioB;
    if (ratios.has_value()) {
        ratioA = ratios->a;
        ratioB = ratios->b;
    } else {
        const float massA = getEffectiveMass(collision.a);
        const float massB = getEffectiveMass(collision.b);
        const float totalMass = massA + massB;
        ratioA = massB / totalMass;
        ratioB = massA / totalMass;
    }

    const float totalSeparation = collision.overlap + m_separationBuffer;
    const Vector2D push = collision.normal * totalSeparation;

    if (positionA.has_value()) {
        m_world.setPosition(collision.a, *positionA - push * ratioA);
    }
    if (positionB.has_value()) {
        m_world.setPosition(collision.b, *positionB + push * ratioB);
    }
}

void CollisionResolver::applyKnockback(EntityID entity, const Vector2D& direction, float force) {
    const auto velocity = m_world.getVelocity(entity);
    if (!velocity.has_value()) {
        return;
    }
    const float impulse = force / getEffectiveMass(entity);
    m_world.setVelocity(entity, *velocity + direction * impulse);
}

void CollisionResolver::applyKnockbackFromCollision(const CollisionInfo& collision, float force) {
    applyKnockback(collision.a, -collision.normal, force);
    applyKnockback(collision.b, collision.normal, force);
}

void CollisionResolver::resolveCollision(const CollisionInfo& collision, float knockbackForce) {
    separateEntities(collision);
    if (knockbackForce > 0.0f) {
        applyKnockbackFromCollision(collision, knockbackForce);
    }
}

void CollisionResolver::bounceEntity(EntityID entity, const Vector2D& normal, float bounciness) {
    const auto velocity = m_world.getVelocity(entity);
    if (!velocity.has_value()) {
        return;
    }

    const float dot = velocity->dot(normal);
    // Already separating: reflecting again would send it back into the surface
    if (!(dot < 0.0f)) {
        return;
    }

    const float restitution = std::clamp(bounciness, 0.0f, 1.0f);
    m_world.setVelocity(entity, *velocity - normal * ((1.0f + restitution) * dot));
}

void CollisionResolver::pushAwayFromPoint(EntityID entity, const Vector2D& point, float force,
                                          float minDistance) {
    const auto position = m_world.getPosition(entity);
    if (!position.has_value()) {
        return;
    }

    const Vector2D offset = *position - point;
    const float dist = offset.length();

    if (dist < COINCIDENT_EPSILON) {
        std::uniform_real_distribution<float> angle(0.0f, TWO_PI);
        applyKnockback(entity, Vector2D::fromAngle(angle(m_rng)), force);
        return;
    }

    const Vector2D direction = offset / dist;
    applyKnockback(entity, direction, force);

    if (minDistance > 0.0f && dist < minDistance) {
        m_world.setPosition(entity, point + direction * minDistance);
    }
}

void CollisionResolver::setSeparationBuffer(float buffer) {
    m_separationBuffer = sanitizeBuffer(buffer);
}

} // namespace CosmicEngine

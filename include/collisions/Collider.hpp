/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLIDER_HPP
#define COLLIDER_HPP

#include <cstdint>
#include <variant>
#include "collisions/AABB.hpp"
#include "utils/Vector2D.hpp"

namespace CosmicEngine {

// Bitmask collision layers (combine via bitwise OR)
enum CollisionLayer : uint32_t {
    Layer_None             = 0,
    Layer_Player           = 1u << 0,
    Layer_Enemy            = 1u << 1,
    Layer_PlayerProjectile = 1u << 2,
    Layer_EnemyProjectile  = 1u << 3,
    Layer_Pickup           = 1u << 4,
    Layer_Wall             = 1u << 5,
    Layer_Trigger          = 1u << 6,
};

// Mask presets: which layers each category wants to hear about
namespace CollisionMasks {
    constexpr uint32_t Player = Layer_Enemy | Layer_EnemyProjectile | Layer_Pickup | Layer_Wall;
    constexpr uint32_t Enemy = Layer_Player | Layer_PlayerProjectile | Layer_Wall;
    constexpr uint32_t PlayerProjectile = Layer_Enemy | Layer_Wall;
    constexpr uint32_t EnemyProjectile = Layer_Player | Layer_Wall;
    constexpr uint32_t Pickup = Layer_Player;
    constexpr uint32_t Wall = Layer_Player | Layer_Enemy | Layer_PlayerProjectile | Layer_EnemyProjectile;
    constexpr uint32_t All = 0xFFFFFFFFu;
} // namespace CollisionMasks

struct CircleShape {
    float radius{0.0f};
};

struct RectShape {
    float width{0.0f};
    float height{0.0f};
};

using ColliderShape = std::variant<CircleShape, RectShape>;

/**
 * @brief Collision descriptor attached to a host entity
 *
 * The shape is centered on entity position + offset. A pair of colliders is
 * considered at all only if (layerA & maskB) or (layerB & maskA) is non-zero.
 * Triggers report enter/exit and never block.
 */
struct Collider {
    ColliderShape shape{CircleShape{}};
    Vector2D offset{0.0f, 0.0f};
    uint32_t layer{Layer_None};
    uint32_t mask{CollisionMasks::All};
    bool isTrigger{false};

    static Collider circle(float radius, uint32_t layer, uint32_t mask,
                           bool trigger = false, const Vector2D& offset = Vector2D()) {
        return Collider{CircleShape{radius}, offset, layer, mask, trigger};
    }

    static Collider rect(float width, float height, uint32_t layer, uint32_t mask,
                         bool trigger = false, const Vector2D& offset = Vector2D()) {
        return Collider{RectShape{width, height}, offset, layer, mask, trigger};
    }

    bool isCircle() const { return std::holds_alternative<CircleShape>(shape); }
    bool isRect() const { return std::holds_alternative<RectShape>(shape); }

    // Enclosing radius used by the broad phase (half diagonal for rects)
    float boundingRadius() const;

    // Bounds of the shape when the owning entity sits at 'position'
    AABB bounds(const Vector2D& position) const;

    // Positive finite extents and a finite offset
    bool isValid() const;

    bool interactsWith(const Collider& other) const {
        return (layer & other.mask) != 0 || (other.layer & mask) != 0;
    }
};

} // namespace CosmicEngine

#endif // COLLIDER_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/Collider.hpp"
#include <cmath>

namespace CosmicEngine {

float Collider::boundingRadius() const {
    if (const auto* circle = std::get_if<CircleShape>(&shape)) {
        return circle->radius;
    }
    const auto& rect = std::get<RectShape>(shape);
    return std::sqrt(rect.width * rect.width + rect.height * rect.height) * 0.5f;
}

AABB Collider::bounds(const Vector2D& position) const {
    const Vector2D center = position + offset;
    if (const auto* circle = std::get_if<CircleShape>(&shape)) {
        return AABB(center, Vector2D(circle->radius, circle->radius));
    }
    const auto& rect = std::get<RectShape>(shape);
    return AABB::fromCenterSize(center, rect.width, rect.height);
}

bool Collider::isValid() const {
    if (!offset.isFinite()) {
        return false;
    }
    if (const auto* circle = std::get_if<CircleShape>(&shape)) {
        return std::isfinite(circle->radius) && circle->radius > 0.0f;
    }
    const auto& rect = std::get<RectShape>(shape);
    return std::isfinite(rect.width) && std::isfinite(rect.height) &&
           rect.width > 0.0f && rect.height > 0.0f;
}

} // namespace CosmicEngine

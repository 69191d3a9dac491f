/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"
#include <algorithm>
#include <cmath>

namespace CosmicEngine {

bool AABB::intersects(const AABB& other) const {
    return overlapX(other) > 0.0f && overlapY(other) > 0.0f;
}

bool AABB::touches(const AABB& other) const {
    return right() >= other.left() && left() <= other.right() &&
           bottom() >= other.top() && top() <= other.bottom();
}

bool AABB::contains(const Vector2D& p) const {
    return p.getX() >= left() && p.getX() <= right() &&
           p.getY() >= top()  && p.getY() <= bottom();
}

Vector2D AABB::closestPoint(const Vector2D& p) const {
    return Vector2D{std::clamp(p.getX(), left(), right()),
                    std::clamp(p.getY(), top(), bottom())};
}

float AABB::overlapX(const AABB& other) const {
    return (halfSize.getX() + other.halfSize.getX()) -
           std::fabs(other.center.getX() - center.getX());
}

float AABB::overlapY(const AABB& other) const {
    return (halfSize.getY() + other.halfSize.getY()) -
           std::fabs(other.center.getY() - center.getY());
}

} // namespace CosmicEngine

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector2D.hpp"

namespace CosmicEngine {

// Axis-aligned box stored as center + half extents. Y grows downward, so
// top() is the smaller y.
struct AABB {
    Vector2D center;
    Vector2D halfSize;

    AABB() = default;
    AABB(float cx, float cy, float hw, float hh) : center(cx, cy), halfSize(hw, hh) {}
    AABB(const Vector2D& c, const Vector2D& half) : center(c), halfSize(half) {}

    static AABB fromCenterSize(const Vector2D& c, float width, float height) {
        return AABB(c.getX(), c.getY(), width * 0.5f, height * 0.5f);
    }

    float left() const { return center.getX() - halfSize.getX(); }
    float right() const { return center.getX() + halfSize.getX(); }
    float top() const { return center.getY() - halfSize.getY(); }
    float bottom() const { return center.getY() + halfSize.getY(); }

    // Strict: touching edges do not intersect
    bool intersects(const AABB& other) const;
    // Inclusive: touching edges count, used by broad-phase queries
    bool touches(const AABB& other) const;
    bool contains(const Vector2D& p) const;
    Vector2D closestPoint(const Vector2D& p) const;

    // Penetration depth on each axis; <= 0 means separated on that axis
    float overlapX(const AABB& other) const;
    float overlapY(const AABB& other) const;
};

} // namespace CosmicEngine

#endif // AABB_HPP

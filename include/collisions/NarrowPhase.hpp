/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NARROW_PHASE_HPP
#define NARROW_PHASE_HPP

#include <optional>
#include "collisions/AABB.hpp"
#include "collisions/Collider.hpp"
#include "collisions/CollisionInfo.hpp"
#include "entities/EntityID.hpp"
#include "utils/Vector2D.hpp"

namespace CosmicEngine {

struct Circle {
    Vector2D center;
    float radius{0.0f};
};

// Overlap between two shapes. The normal is unit length and points from the
// first argument toward the second; the first shape separates along -normal.
struct Contact {
    float overlap{0.0f};
    Vector2D normal{1.0f, 0.0f};
    Vector2D point;
};

/**
 * @brief Exact overlap tests for the collider shapes
 *
 * Every function is pure: results depend only on the arguments. A Contact is
 * returned only for strictly positive overlap, so touching shapes do not
 * collide.
 *
 * Two tie-breaks are arbitrary rather than geometrically meaningful and are
 * kept fixed so replays stay deterministic:
 *  - rectVsRect picks the X axis when both axis overlaps are equal.
 *  - circleVsRect with the circle center inside the rect exits through the
 *    nearest edge, preferring left, then right, then top, then bottom.
 */
namespace NarrowPhase {

    // Below this center distance a direction cannot be derived; +X is used
    constexpr float COINCIDENT_EPSILON = 1e-4f;
    // Ray components below this are treated as parallel to a slab
    constexpr float PARALLEL_EPSILON = 1e-4f;

    std::optional<Contact> circleVsCircle(const Circle& a, const Circle& b);
    std::optional<Contact> circleVsRect(const Circle& circle, const AABB& rect);
    std::optional<Contact> rectVsRect(const AABB& a, const AABB& b);

    // 'direction' must be unit length. The returned hit has no entity set.
    std::optional<RaycastHit> rayVsCircle(const Vector2D& origin, const Vector2D& direction,
                                          float maxDistance, const Circle& circle);
    std::optional<RaycastHit> rayVsAABB(const Vector2D& origin, const Vector2D& direction,
                                        float maxDistance, const AABB& box);

    bool pointInCircle(const Vector2D& point, const Circle& circle);
    bool pointInAABB(const Vector2D& point, const AABB& box);

    /**
     * @brief Runs the test matching the two collider shapes
     *
     * Centers are shape centers (entity position plus collider offset). The
     * result is canonical: a is the smaller id and the normal points from a
     * toward b regardless of argument order.
     */
    std::optional<CollisionInfo> collide(EntityID idA, const Collider& colliderA, const Vector2D& centerA,
                                         EntityID idB, const Collider& colliderB, const Vector2D& centerB);

} // namespace NarrowPhase

} // namespace CosmicEngine

#endif // NARROW_PHASE_HPP

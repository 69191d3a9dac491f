/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/NarrowPhase.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace CosmicEngine {
namespace NarrowPhase {

std::optional<Contact> circleVsCircle(const Circle& a, const Circle& b) {
    const Vector2D delta = b.center - a.center;
    const float distSq = delta.lengthSquared();
    const float combinedRadius = a.radius + b.radius;

    if (distSq >= combinedRadius * combinedRadius) {
        return std::nullopt;
    }

    const float dist = std::sqrt(distSq);
    Contact contact;
    contact.overlap = combinedRadius - dist;
    contact.normal = dist > COINCIDENT_EPSILON ? delta / dist : Vector2D(1.0f, 0.0f);
    // Midpoint of the penetration segment
    contact.point = a.center + contact.normal * (a.radius - contact.overlap * 0.5f);
    return contact;
}

std::optional<Contact> circleVsRect(const Circle& circle, const AABB& rect) {
    const Vector2D closest = rect.closestPoint(circle.center);
    const Vector2D toCenter = circle.center - closest;
    const float distSq = toCenter.lengthSquared();

    if (distSq >= circle.radius * circle.radius) {
        return std::nullopt;
    }

    const float dist = std::sqrt(distSq);
    Contact contact;

    if (dist > COINCIDENT_EPSILON) {
        contact.overlap = circle.radius - dist;
        contact.normal = (closest - circle.center) / dist;
        contact.point = closest;
        return contact;
    }

    // Center inside the rect: leave through the nearest edge.
    // Strict '<' keeps the earlier edge on ties (left, right, top, bottom).
    const float cx = circle.center.getX();
    const float cy = circle.center.getY();
    float edgeDist = cx - rect.left();
    Vector2D exitDir(-1.0f, 0.0f);
    Vector2D edgePoint(rect.left(), cy);

    const float rightDist = rect.right() - cx;
    if (rightDist < edgeDist) {
        edgeDist = rightDist;
        exitDir = Vector2D(1.0f, 0.0f);
        edgePoint = Vector2D(rect.right(), cy);
    }
    const float topDist = cy - rect.top();
    if (topDist < edgeDist) {
        edgeDist = topDist;
        exitDir = Vector2D(0.0f, -1.0f);
        edgePoint = Vector2D(cx, rect.top());
    }
    const float bottomDist = rect.bottom() - cy;
    if (bottomDist < edgeDist) {
        edgeDist = bottomDist;
        exitDir = Vector2D(0.0f, 1.0f);
        edgePoint = Vector2D(cx, rect.bottom());
    }

    contact.overlap = circle.radius + std::max(edgeDist, 0.0f);
    contact.normal = -exitDir;
    contact.point = edgePoint;
    return contact;
}

std::optional<Contact> rectVsRect(const AABB& a, const AABB& b) {
    const float overlapX = a.overlapX(b);
    const float overlapY = a.overlapY(b);

    if (overlapX <= 0.0f || overlapY <= 0.0f) {
        return std::nullopt;
    }

    Contact contact;
    // Minimum translation axis; equal overlaps go to X
    if (overlapX <= overlapY) {
        contact.overlap = overlapX;
        contact.normal = Vector2D(b.center.getX() >= a.center.getX() ? 1.0f : -1.0f, 0.0f);
    } else {
        contact.overlap = overlapY;
        contact.normal = Vector2D(0.0f, b.center.getY() >= a.center.getY() ? 1.0f : -1.0f);
    }

    // Center of the overlap region
    contact.point = Vector2D(
        (std::max(a.left(), b.left()) + std::min(a.right(), b.right())) * 0.5f,
        (std::max(a.top(), b.top()) + std::min(a.bottom(), b.bottom())) * 0.5f);
    return contact;
}

std::optional<RaycastHit> rayVsCircle(const Vector2D& origin, const Vector2D& direction,
                                      float maxDistance, const Circle& circle) {
    const Vector2D toCenter = circle.center - origin;
    const float t = toCenter.dot(direction);
    const Vector2D closest = origin + direction * t;
    const float distSq = Vector2D::distanceSquared(circle.center, closest);
    const float radiusSq = circle.radius * circle.radius;

    if (distSq > radiusSq) {
        return std::nullopt;
    }

    const float halfChord = std::sqrt(radiusSq - distSq);
    float hitDistance = t - halfChord;
    // Origin inside the circle: report the exit point
    if (hitDistance < 0.0f) {
        hitDistance = t + halfChord;
    }
    if (hitDistance < 0.0f || hitDistance > maxDistance) {
        return std::nullopt;
    }

    RaycastHit hit;
    hit.point = origin + direction * hitDistance;
    hit.normal = (hit.point - circle.center) / circle.radius;
    hit.distance = hitDistance;
    return hit;
}

std::optional<RaycastHit> rayVsAABB(const Vector2D& origin, const Vector2D& direction,
                                    float maxDistance, const AABB& box) {
    float tMin = 0.0f;
    float tMax = maxDistance;
    Vector2D normal(0.0f, 0.0f);

    // X slab
    if (std::fabs(direction.getX()) < PARALLEL_EPSILON) {
        if (origin.getX() < box.left() || origin.getX() > box.right()) {
            return std::nullopt;
        }
    } else {
        const float inv = 1.0f / direction.getX();
        float t1 = (box.left() - origin.getX()) * inv;
        float t2 = (box.right() - origin.getX()) * inv;
        float n1 = -1.0f;
        if (t1 > t2) {
            std::swap(t1, t2);
            n1 = 1.0f;
        }
        if (t1 > tMin) {
            tMin = t1;
            normal = Vector2D(n1, 0.0f);
        }
        tMax = std::min(tMax, t2);
        if (tMin > tMax) {
            return std::nullopt;
        }
    }

    // Y slab
    if (std::fabs(direction.getY()) < PARALLEL_EPSILON) {
        if (origin.getY() < box.top() || origin.getY() > box.bottom()) {
            return std::nullopt;
        }
    } else {
        const float inv = 1.0f / direction.getY();
        float t1 = (box.top() - origin.getY()) * inv;
        float t2 = (box.bottom() - origin.getY()) * inv;
        float n1 = -1.0f;
        if (t1 > t2) {
            std::swap(t1, t2);
            n1 = 1.0f;
        }
        if (t1 > tMin) {
            tMin = t1;
            normal = Vector2D(0.0f, n1);
        }
        tMax = std::min(tMax, t2);
        if (tMin > tMax) {
            return std::nullopt;
        }
    }

    if (tMin > maxDistance) {
        return std::nullopt;
    }

    RaycastHit hit;
    hit.point = origin + direction * tMin;
    hit.normal = normal;
    hit.distance = tMin;
    return hit;
}

bool pointInCircle(const Vector2D& point, const Circle& circle) {
    return Vector2D::distanceSquared(point, circle.center) <= circle.radius * circle.radius;
}

bool pointInAABB(const Vector2D& point, const AABB& box) {
    return box.contains(point);
}

std::optional<CollisionInfo> collide(EntityID idA, const Collider& colliderA, const Vector2D& centerA,
                                     EntityID idB, const Collider& colliderB, const Vector2D& centerB) {
    const Collider* first = &colliderA;
    const Collider* second = &colliderB;
    Vector2D firstPos = centerA;
    Vector2D secondPos = centerB;
    if (idB < idA) {
        std::swap(idA, idB);
        std::swap(first, second);
        std::swap(firstPos, secondPos);
    }

    std::optional<Contact> contact;
    const auto* circleA = std::get_if<CircleShape>(&first->shape);
    const auto* circleB = std::get_if<CircleShape>(&second->shape);
    const auto* rectA = std::get_if<RectShape>(&first->shape);
    const auto* rectB = std::get_if<RectShape>(&second->shape);

    if (circleA && circleB) {
        contact = circleVsCircle(Circle{firstPos, circleA->radius},
                                 Circle{secondPos, circleB->radius});
    } else if (circleA && rectB) {
        contact = circleVsRect(Circle{firstPos, circleA->radius},
                               AABB::fromCenterSize(secondPos, rectB->width, rectB->height));
    } else if (rectA && circleB) {
        contact = circleVsRect(Circle{secondPos, circleB->radius},
                               AABB::fromCenterSize(firstPos, rectA->width, rectA->height));
        if (contact) {
            contact->normal = -contact->normal;
        }
    } else if (rectA && rectB) {
        contact = rectVsRect(AABB::fromCenterSize(firstPos, rectA->width, rectA->height),
                             AABB::fromCenterSize(secondPos, rectB->width, rectB->height));
    }

    if (!contact || !(contact->overlap > 0.0f)) {
        return std::nullopt;
    }

    CollisionInfo info;
    info.a = idA;
    info.b = idB;
    info.overlap = contact->overlap;
    info.normal = contact->normal;
    info.contact = contact->point;
    return info;
}

} // namespace NarrowPhase
} // namespace CosmicEngine

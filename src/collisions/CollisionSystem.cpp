/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionSystem.hpp"
#include "collisions/NarrowPhase.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace CosmicEngine {

namespace {
// Clears the in-update flag however update() is left
struct UpdateScope {
    explicit UpdateScope(bool& flag) : m_flag(flag) { m_flag = true; }
    ~UpdateScope() { m_flag = false; }
    UpdateScope(const UpdateScope&) = delete;
    UpdateScope& operator=(const UpdateScope&) = delete;
    bool& m_flag;
};
} // namespace

CollisionSystem::CollisionSystem(SpatialHash& spatialHash, ICollisionWorld& world,
                                 const CollisionConfig& config)
    : m_spatialHash(spatialHash),
      m_world(world),
      m_queryPadding(config.queryPadding),
      m_maxChecksPerFrame(config.maxChecksPerFrame) {
    if (!std::isfinite(m_queryPadding) || m_queryPadding < 0.0f) {
        COLLISION_WARN("Invalid query padding " + std::to_string(m_queryPadding) + ", using default");
        m_queryPadding = CollisionConfig::DEFAULT_QUERY_PADDING;
    }
    if (m_maxChecksPerFrame == 0) {
        COLLISION_WARN("Check budget of 0 would disable detection, using default");
        m_maxChecksPerFrame = CollisionConfig::DEFAULT_MAX_CHECKS_PER_FRAME;
    }
    m_collisions.reserve(64);
    m_candidateScratch.reserve(64);
}

bool CollisionSystem::attachCollider(EntityID id, const Collider& collider) {
    if (id == INVALID_ENTITY_ID) {
        COLLISION_WARN("Rejected collider for the invalid entity id");
        return false;
    }
    if (!collider.isValid()) {
        COLLISION_WARN("Rejected invalid collider for entity " + std::to_string(id) +
                       " (extents must be positive and finite)");
        return false;
    }
    m_pendingCommands.push_back(PendingCommand{CommandType::Attach, id, collider});
    return true;
}

void CollisionSystem::detachCollider(EntityID id) {
    m_pendingCommands.push_back(PendingCommand{CommandType::Detach, id, Collider()});
}

void CollisionSystem::processPendingCommands() {
    if (m_inUpdate) {
        COLLISION_WARN("processPendingCommands() ignored inside a collision callback; "
                       "commands apply at the start of the next tick");
        return;
    }
    applyPendingCommands();
}

void CollisionSystem::applyPendingCommands() {
    if (m_pendingCommands.empty()) {
        return;
    }

    // Swap out first so commands queued while applying wait for the next drain
    std::vector<PendingCommand> commands;
    commands.swap(m_pendingCommands);

    for (const auto& cmd : commands) {
        switch (cmd.type) {
            case CommandType::Attach: {
                m_colliders[cmd.id] = cmd.collider;
                auto position = m_world.getPosition(cmd.id);
                if (position.has_value() && position->isFinite()) {
                    const Vector2D center = *position + cmd.collider.offset;
                    m_spatialHash.insert(cmd.id, center.getX(), center.getY(),
                                         cmd.collider.boundingRadius(), cmd.collider.layer);
                } else {
                    // Re-attach without a position must not leave the old shape indexed
                    m_spatialHash.remove(cmd.id);
                }
                COLLISION_DEBUG("Attached collider to entity " + std::to_string(cmd.id));
                break;
            }
            case CommandType::Detach:
                if (m_colliders.erase(cmd.id) != 0) {
                    COLLISION_DEBUG("Detached collider from entity " + std::to_string(cmd.id));
                }
                m_spatialHash.remove(cmd.id);
                break;
        }
    }
}

void CollisionSystem::update() {
    if (m_inUpdate) {
        COLLISION_WARN("update() ignored inside a collision callback");
        return;
    }
    if (!m_enabled) {
        return;
    }

    {
        UpdateScope scope(m_inUpdate);

        m_collisions.clear();
        m_currentTriggerPairs.clear();
        m_checksThisFrame = 0;
        m_budgetExceeded = false;
        m_truncatedAt = PairKey{};

        applyPendingCommands();
        syncSpatialHash();
        detectCollisions();
        processTriggerExits();
    }

    applyDeferredCallbacks();
}

void CollisionSystem::syncSpatialHash() {
    for (const auto& [id, collider] : m_colliders) {
        auto position = m_world.getPosition(id);
        if (!position.has_value() || !position->isFinite()) {
            // No position this tick: nothing can collide with a stale shape
            m_spatialHash.remove(id);
            continue;
        }
        const Vector2D center = *position + collider.offset;
        m_spatialHash.update(id, center.getX(), center.getY(),
                             collider.boundingRadius(), collider.layer);
    }
}

void CollisionSystem::detectCollisions() {
    for (const auto& [idA, colliderA] : m_colliders) {
        if (m_budgetExceeded) {
            break;
        }

        const SpatialHash::SpatialRecord* recordA = m_spatialHash.getRecord(idA);
        if (recordA == nullptr) {
            continue;
        }
        const Vector2D centerA(recordA->x, recordA->y);

        const auto& nearby = m_spatialHash.queryRadius(recordA->x, recordA->y,
                                                       recordA->radius + m_queryPadding);
        m_candidateScratch.assign(nearby.begin(), nearby.end());
        std::sort(m_candidateScratch.begin(), m_candidateScratch.end());

        for (EntityID idB : m_candidateScratch) {
            if (idA >= idB) {
                continue;
            }
            if (m_checksThisFrame >= m_maxChecksPerFrame) {
                m_budgetExceeded = true;
                m_truncatedAt = PairKey{idA, idB};
                COLLISION_WARN("Check budget of " + std::to_string(m_maxChecksPerFrame) +
                               " reached, remaining pairs deferred to next tick");
                break;
            }
            ++m_checksThisFrame;
            checkPair(idA, colliderA, centerA, idB);
        }
    }
}

void CollisionSystem::checkPair(EntityID idA, const Collider& colliderA,
                                const Vector2D& centerA, EntityID idB) {
    auto itB = m_colliders.find(idB);
    if (itB == m_colliders.end()) {
        return;
    }
    const Collider& colliderB = itB->second;
    const PairKey key{idA, idB};
    const bool triggerPair = colliderA.isTrigger || colliderB.isTrigger;

    if (!colliderA.interactsWith(colliderB)) {
        return;
    }

    const SpatialHash::SpatialRecord* recordB = m_spatialHash.getRecord(idB);
    if (recordB == nullptr) {
        return;
    }

    auto info = NarrowPhase::collide(idA, colliderA, centerA,
                                     idB, colliderB, Vector2D(recordB->x, recordB->y));
    if (!info.has_value()) {
        return;
    }

    if (triggerPair) {
        m_currentTriggerPairs.insert(key);
        if (m_activeTriggerPairs.count(key) == 0) {
            const size_t count = m_triggerEnterCallbacks.size();
            for (size_t i = 0; i < count; ++i) {
                m_triggerEnterCallbacks[i](idA, idB);
            }
        }
        return;
    }

    m_collisions.push_back(*info);
    const size_t count = m_collisionCallbacks.size();
    for (size_t i = 0; i < count; ++i) {
        m_collisionCallbacks[i](*info);
    }
}

void CollisionSystem::processTriggerExits() {
    for (const PairKey& key : m_activeTriggerPairs) {
        if (m_currentTriggerPairs.count(key) != 0) {
            continue;
        }

        // Pairs are visited in ascending (first, second) order, so everything
        // from the pair the budget stopped at onwards was never looked at
        if (m_budgetExceeded && key >= m_truncatedAt &&
            hasCollider(key.first) && hasCollider(key.second) &&
            m_spatialHash.contains(key.first) && m_spatialHash.contains(key.second)) {
            m_currentTriggerPairs.insert(key);
            continue;
        }

        const size_t count = m_triggerExitCallbacks.size();
        for (size_t i = 0; i < count; ++i) {
            m_triggerExitCallbacks[i](key.first, key.second);
        }
    }

    m_activeTriggerPairs.swap(m_currentTriggerPairs);
    m_currentTriggerPairs.clear();
}

// While update() is dispatching, the callback lists must not change under the
// running callback; registrations wait until the tick is over
void CollisionSystem::onCollision(CollisionCallback cb) {
    if (m_inUpdate) {
        m_deferredCollisionCallbacks.push_back(std::move(cb));
        return;
    }
    m_collisionCallbacks.push_back(std::move(cb));
}

void CollisionSystem::onTriggerEnter(TriggerCallback cb) {
    if (m_inUpdate) {
        m_deferredTriggerEnterCallbacks.push_back(std::move(cb));
        return;
    }
    m_triggerEnterCallbacks.push_back(std::move(cb));
}

void CollisionSystem::onTriggerExit(TriggerCallback cb) {
    if (m_inUpdate) {
        m_deferredTriggerExitCallbacks.push_back(std::move(cb));
        return;
    }
    m_triggerExitCallbacks.push_back(std::move(cb));
}

void CollisionSystem::clearCallbacks() {
    m_deferredCollisionCallbacks.clear();
    m_deferredTriggerEnterCallbacks.clear();
    m_deferredTriggerExitCallbacks.clear();
    if (m_inUpdate) {
        m_clearCallbacksDeferred = true;
        return;
    }
    m_collisionCallbacks.clear();
    m_triggerEnterCallbacks.clear();
    m_triggerExitCallbacks.clear();
}

void CollisionSystem::applyDeferredCallbacks() {
    if (m_clearCallbacksDeferred) {
        m_collisionCallbacks.clear();
        m_triggerEnterCallbacks.clear();
        m_triggerExitCallbacks.clear();
        m_clearCallbacksDeferred = false;
    }
    for (auto& cb : m_deferredCollisionCallbacks) {
        m_collisionCallbacks.push_back(std::move(cb));
    }
    for (auto& cb : m_deferredTriggerEnterCallbacks) {
        m_triggerEnterCallbacks.push_back(std::move(cb));
    }
    for (auto& cb : m_deferredTriggerExitCallbacks) {
        m_triggerExitCallbacks.push_back(std::move(cb));
    }
    m_deferredCollisionCallbacks.clear();
    m_deferredTriggerEnterCallbacks.clear();
    m_deferredTriggerExitCallbacks.clear();
}

std::optional<CollisionInfo> CollisionSystem::testPair(EntityID a, EntityID b) const {
    if (a == b) {
        return std::nullopt;
    }
    const Collider* colliderA = getCollider(a);
    const Collider* colliderB = getCollider(b);
    if (colliderA == nullptr || colliderB == nullptr) {
        return std::nullopt;
    }
    auto positionA = m_world.getPosition(a);
    auto positionB = m_world.getPosition(b);
    if (!positionA.has_value() || !positionB.has_value()) {
        return std::nullopt;
    }
    return NarrowPhase::collide(a, *colliderA, *positionA + colliderA->offset,
                                b, *colliderB, *positionB + colliderB->offset);
}

std::optional<RaycastHit> CollisionSystem::rayVsCollider(EntityID id, const Vector2D& origin,
                                                         const Vector2D& direction,
                                                         float maxDistance) const {
    const Collider* collider = getCollider(id);
    const SpatialHash::SpatialRecord* record = m_spatialHash.getRecord(id);
    if (collider == nullptr || record == nullptr) {
        return std::nullopt;
    }

    const Vector2D center(record->x, record->y);
    std::optional<RaycastHit> hit;
    if (const auto* circle = std::get_if<CircleShape>(&collider->shape)) {
        hit = NarrowPhase::rayVsCircle(origin, direction, maxDistance, Circle{center, circle->radius});
    } else {
        const auto& rect = std::get<RectShape>(collider->shape);
        hit = NarrowPhase::rayVsAABB(origin, direction, maxDistance,
                                     AABB::fromCenterSize(center, rect.width, rect.height));
    }
    if (hit.has_value()) {
        hit->entity = id;
    }
    return hit;
}

std::vector<RaycastHit> CollisionSystem::raycastAll(const Vector2D& origin, const Vector2D& direction,
                                                    float maxDistance, uint32_t layerMask) const {
    std::vector<RaycastHit> hits;

    const float length = direction.length();
    if (!(length >= MIN_RAY_DIRECTION) || !(maxDistance >= 0.0f) || !origin.isFinite()) {
        return hits;
    }
    const Vector2D dir = direction / length;
    const Vector2D end = origin + dir * maxDistance;

    const float minX = std::min(origin.getX(), end.getX());
    const float maxX = std::max(origin.getX(), end.getX());
    const float minY = std::min(origin.getY(), end.getY());
    const float maxY = std::max(origin.getY(), end.getY());

    const auto& candidates = m_spatialHash.queryRect((minX + maxX) * 0.5f, (minY + maxY) * 0.5f,
                                                     maxX - minX + RAY_QUERY_BUFFER,
                                                     maxY - minY + RAY_QUERY_BUFFER);
    for (EntityID id : candidates) {
        const SpatialHash::SpatialRecord* record = m_spatialHash.getRecord(id);
        if (record == nullptr || (record->layer & layerMask) == 0) {
            continue;
        }
        if (auto hit = rayVsCollider(id, origin, dir, maxDistance)) {
            hits.push_back(*hit);
        }
    }

    std::sort(hits.begin(), hits.end(), [](const RaycastHit& lhs, const RaycastHit& rhs) {
        if (lhs.distance != rhs.distance) {
            return lhs.distance < rhs.distance;
        }
        return lhs.entity < rhs.entity;
    });
    return hits;
}

std::optional<RaycastHit> CollisionSystem::raycast(const Vector2D& origin, const Vector2D& direction,
                                                   float maxDistance, uint32_t layerMask) const {
    auto hits = raycastAll(origin, direction, maxDistance, layerMask);
    if (hits.empty()) {
        return std::nullopt;
    }
    return hits.front();
}

std::optional<EntityID> CollisionSystem::pointInCollider(const Vector2D& point,
                                                         uint32_t layerMask) const {
    std::optional<EntityID> found;
    const auto& candidates = m_spatialHash.queryRadius(point.getX(), point.getY(), 1.0f);

    for (EntityID id : candidates) {
        if (found.has_value() && id > *found) {
            continue;
        }
        const SpatialHash::SpatialRecord* record = m_spatialHash.getRecord(id);
        const Collider* collider = getCollider(id);
        if (record == nullptr || collider == nullptr || (record->layer & layerMask) == 0) {
            continue;
        }

        const Vector2D center(record->x, record->y);
        bool inside;
        if (const auto* circle = std::get_if<CircleShape>(&collider->shape)) {
            inside = NarrowPhase::pointInCircle(point, Circle{center, circle->radius});
        } else {
            const auto& rect = std::get<RectShape>(collider->shape);
            inside = NarrowPhase::pointInAABB(point, AABB::fromCenterSize(center, rect.width, rect.height));
        }
        if (inside) {
            found = id;
        }
    }
    return found;
}

std::vector<EntityID> CollisionSystem::overlapCircle(const Vector2D& center, float radius,
                                                     uint32_t layerMask) const {
    std::vector<EntityID> results;
    if (!(radius >= 0.0f) || !center.isFinite()) {
        return results;
    }

    const auto& candidates = m_spatialHash.queryRadius(center.getX(), center.getY(), radius);
    for (EntityID id : candidates) {
        const SpatialHash::SpatialRecord* record = m_spatialHash.getRecord(id);
        const Collider* collider = getCollider(id);
        if (record == nullptr || collider == nullptr || (record->layer & layerMask) == 0) {
            continue;
        }

        const Vector2D shapeCenter(record->x, record->y);
        bool overlaps;
        if (const auto* circle = std::get_if<CircleShape>(&collider->shape)) {
            const float reach = radius + circle->radius;
            overlaps = Vector2D::distanceSquared(center, shapeCenter) <= reach * reach;
        } else {
            const auto& rect = std::get<RectShape>(collider->shape);
            const Vector2D closest =
                AABB::fromCenterSize(shapeCenter, rect.width, rect.height).closestPoint(center);
            overlaps = Vector2D::distanceSquared(center, closest) <= radius * radius;
        }
        if (overlaps) {
            results.push_back(id);
        }
    }

    std::sort(results.begin(), results.end());
    return results;
}

void CollisionSystem::setMaxChecksPerFrame(size_t maxChecks) {
    if (maxChecks == 0) {
        COLLISION_WARN("Ignoring check budget of 0");
        return;
    }
    m_maxChecksPerFrame = maxChecks;
}

const Collider* CollisionSystem::getCollider(EntityID id) const {
    auto it = m_colliders.find(id);
    return it == m_colliders.end() ? nullptr : &it->second;
}

void CollisionSystem::reset() {
    if (m_inUpdate) {
        COLLISION_WARN("reset() ignored inside a collision callback");
        return;
    }
    m_colliders.clear();
    m_pendingCommands.clear();
    m_spatialHash.clear();
    m_collisions.clear();
    m_activeTriggerPairs.clear();
    m_currentTriggerPairs.clear();
    m_checksThisFrame = 0;
    m_budgetExceeded = false;
    m_truncatedAt = PairKey{};
    COLLISION_INFO("Collision system reset");
}

} // namespace CosmicEngine

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_SYSTEM_HPP
#define COLLISION_SYSTEM_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>
#include <boost/container/flat_map.hpp>
#include <boost/container/flat_set.hpp>

#include "collisions/Collider.hpp"
#include "collisions/CollisionConfig.hpp"
#include "collisions/CollisionInfo.hpp"
#include "collisions/ICollisionWorld.hpp"
#include "collisions/SpatialHash.hpp"
#include "entities/EntityID.hpp"
#include "utils/Vector2D.hpp"

namespace CosmicEngine {

/**
 * @brief Per-tick broad phase, narrow phase and event dispatch
 *
 * Colliders are attached and detached through a command queue that is drained
 * at the start of update(). Each tick the live position of every collider is
 * read from the host world and pushed into the spatial index, then entities
 * are visited in ascending id order and tested against their neighbours.
 *
 * Blocking overlaps are collected into getCollisions() and reported through
 * onCollision. Pairs where either side is a trigger are tracked across ticks
 * and reported through onTriggerEnter / onTriggerExit, always as (smaller id,
 * larger id). Callbacks run synchronously inside update() in registration
 * order. They may attach or detach colliders (applied next tick) and run
 * queries. Callbacks registered or cleared from inside a callback take effect
 * once the tick is over. update(), reset() and processPendingCommands() are
 * refused with a warning while a tick is running.
 *
 * The number of pair checks per tick is capped. Once the cap is hit the rest
 * of the tick is skipped; the skipped pairs are simply checked again next
 * tick. Trigger pairs at or past the point where the tick stopped keep their
 * active state instead of reporting a false exit.
 *
 * The resolver is never called from here; respond to onCollision instead.
 */
class CollisionSystem {
public:
    using CollisionCallback = std::function<void(const CollisionInfo&)>;
    using TriggerCallback = std::function<void(EntityID, EntityID)>;
    using PairKey = std::pair<EntityID, EntityID>;

    // Layer mask used by queries when the caller gives none
    static constexpr uint32_t DEFAULT_QUERY_MASK = 0xFFFFu;
    // Widening of a ray's bounding box so large colliders near the ray are found
    static constexpr float RAY_QUERY_BUFFER = 100.0f;
    // Below this length a ray direction is rejected
    static constexpr float MIN_RAY_DIRECTION = 1e-4f;

    CollisionSystem(SpatialHash& spatialHash, ICollisionWorld& world,
                    const CollisionConfig& config = CollisionConfig());

    CollisionSystem(const CollisionSystem&) = delete;
    CollisionSystem& operator=(const CollisionSystem&) = delete;

    // Validates and queues; returns false (nothing queued) for an invalid
    // descriptor or the invalid id. Re-attaching replaces the collider.
    bool attachCollider(EntityID id, const Collider& collider);
    void detachCollider(EntityID id);
    // Applies queued attach/detach commands immediately. Ignored inside a
    // callback.
    void processPendingCommands();

    void update();

    void onCollision(CollisionCallback cb);
    void onTriggerEnter(TriggerCallback cb);
    void onTriggerExit(TriggerCallback cb);
    void clearCallbacks();

    // Blocking collisions found by the last update()
    const std::vector<CollisionInfo>& getCollisions() const { return m_collisions; }

    // Narrow phase on live positions, ignoring layers and the check budget
    std::optional<CollisionInfo> testPair(EntityID a, EntityID b) const;

    // Queries below read the index as of the last update()
    std::optional<RaycastHit> raycast(const Vector2D& origin, const Vector2D& direction,
                                      float maxDistance,
                                      uint32_t layerMask = DEFAULT_QUERY_MASK) const;
    // All hits, nearest first
    std::vector<RaycastHit> raycastAll(const Vector2D& origin, const Vector2D& direction,
                                       float maxDistance,
                                       uint32_t layerMask = DEFAULT_QUERY_MASK) const;
    // Smallest id whose shape contains the point (edges inclusive)
    std::optional<EntityID> pointInCollider(const Vector2D& point,
                                            uint32_t layerMask = DEFAULT_QUERY_MASK) const;
    // Ids whose shape touches the circle, ascending
    std::vector<EntityID> overlapCircle(const Vector2D& center, float radius,
                                        uint32_t layerMask = DEFAULT_QUERY_MASK) const;

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    void setMaxChecksPerFrame(size_t maxChecks);
    size_t getMaxChecksPerFrame() const { return m_maxChecksPerFrame; }
    size_t getCollisionChecksThisFrame() const { return m_checksThisFrame; }
    bool wasBudgetExceeded() const { return m_budgetExceeded; }

    size_t getActiveTriggerCount() const { return m_activeTriggerPairs.size(); }
    size_t getColliderCount() const { return m_colliders.size(); }
    size_t getPendingCommandCount() const { return m_pendingCommands.size(); }
    bool hasCollider(EntityID id) const { return m_colliders.count(id) != 0; }
    const Collider* getCollider(EntityID id) const;

    // Drops colliders, queued commands, index contents and trigger state.
    // Callbacks stay registered. Ignored inside a callback.
    void reset();

private:
    enum class CommandType { Attach, Detach };

    struct PendingCommand {
        CommandType type;
        EntityID id;
        Collider collider;
    };

    void applyPendingCommands();
    void applyDeferredCallbacks();
    void syncSpatialHash();
    void detectCollisions();
    void checkPair(EntityID idA, const Collider& colliderA, const Vector2D& centerA, EntityID idB);
    void processTriggerExits();
    std::optional<RaycastHit> rayVsCollider(EntityID id, const Vector2D& origin,
                                            const Vector2D& direction, float maxDistance) const;

    SpatialHash& m_spatialHash;
    ICollisionWorld& m_world;

    float m_queryPadding;
    size_t m_maxChecksPerFrame;

    // Ascending id order keeps the tick deterministic
    boost::container::flat_map<EntityID, Collider> m_colliders;
    std::vector<PendingCommand> m_pendingCommands;

    std::vector<CollisionInfo> m_collisions;
    boost::container::flat_set<PairKey> m_activeTriggerPairs;
    boost::container::flat_set<PairKey> m_currentTriggerPairs;
    // First pair the check budget refused; only meaningful when truncated
    PairKey m_truncatedAt{};

    std::vector<CollisionCallback> m_collisionCallbacks;
    std::vector<TriggerCallback> m_triggerEnterCallbacks;
    std::vector<TriggerCallback> m_triggerExitCallbacks;
    // Registered from inside a callback, appended after the tick
    std::vector<CollisionCallback> m_deferredCollisionCallbacks;
    std::vector<TriggerCallback> m_deferredTriggerEnterCallbacks;
    std::vector<TriggerCallback> m_deferredTriggerExitCallbacks;
    bool m_clearCallbacksDeferred{false};

    // Copy of the index result; callbacks may run their own queries
    std::vector<EntityID> m_candidateScratch;

    size_t m_checksThisFrame{0};
    bool m_budgetExceeded{false};
    bool m_enabled{true};
    bool m_inUpdate{false};
};

} // namespace CosmicEngine

#endif // COLLISION_SYSTEM_HPP

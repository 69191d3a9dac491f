/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_HASH_HPP
#define SPATIAL_HASH_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <boost/container/small_vector.hpp>
#include "collisions/Collider.hpp"
#include "entities/EntityID.hpp"

namespace CosmicEngine {

struct SpatialHashStats {
    size_t entityCount{0};
    size_t cellCount{0};       // live (non-empty) cells
    size_t pooledCellCount{0}; // idle containers waiting for reuse
    float avgEntitiesPerCell{0.0f};
};

/**
 * @brief Uniform grid broad phase keyed by a shifted pairing of cell coordinates
 *
 * Each entity is stored as a bounding circle and registered in every cell its
 * bounding square touches. Cell containers live in a flat arena; a cell whose
 * last occupant leaves is unlinked from the key map and its slot goes on a free
 * list, keeping its capacity for the next cell that needs one.
 *
 * The cell size is a fixed tuning value. Cells much smaller than typical entity
 * radii inflate the number of cells per entity; much larger cells inflate the
 * number of false candidates per query.
 *
 * Query results are written to an internal buffer that is overwritten by the
 * next query. Copy the result if it has to outlive that. Not thread-safe.
 */
class SpatialHash {
public:
    static constexpr float DEFAULT_CELL_SIZE = 64.0f;

    // Cell coordinates are shifted into [0, 65535] before pairing
    static constexpr int32_t CELL_COORD_OFFSET = 32768;
    static constexpr int32_t CELL_COORD_SPAN = 65536;
    static constexpr int32_t MIN_CELL_COORD = -CELL_COORD_OFFSET;
    static constexpr int32_t MAX_CELL_COORD = CELL_COORD_SPAN - CELL_COORD_OFFSET - 1;

    using CellKey = uint32_t;
    using CellKeyList = boost::container::small_vector<CellKey, 4>;
    using CellVector = boost::container::small_vector<EntityID, 8>;

    struct SpatialRecord {
        EntityID id{INVALID_ENTITY_ID};
        float x{0.0f};
        float y{0.0f};
        float radius{0.0f};
        uint32_t layer{Layer_None};
        CellKeyList cells; // exactly the cells covered by (x, y, radius)
    };

    explicit SpatialHash(float cellSize = DEFAULT_CELL_SIZE);

    void insert(EntityID id, float x, float y, float radius, uint32_t layer = Layer_None);
    void update(EntityID id, float x, float y, float radius,
                std::optional<uint32_t> layer = std::nullopt);
    void remove(EntityID id);
    void clear();

    // Entities whose bounding circle reaches within 'radius' of (x, y)
    const std::vector<EntityID>& queryRadius(float x, float y, float radius) const;
    // Entities whose bounding square touches the rect centered on (x, y)
    const std::vector<EntityID>& queryRect(float x, float y, float width, float height) const;
    // queryRadius restricted to entities sharing a bit with layerMask
    const std::vector<EntityID>& queryRadiusWithLayer(float x, float y, float radius,
                                                      uint32_t layerMask) const;

    const SpatialRecord* getRecord(EntityID id) const;
    bool contains(EntityID id) const { return m_records.count(id) != 0; }
    bool setEntityLayer(EntityID id, uint32_t layer);

    static CellKey makeCellKey(int32_t cellX, int32_t cellY);
    int32_t worldToCell(float value) const;
    void computeCells(float x, float y, float radius, CellKeyList& out) const;

    float getCellSize() const { return m_cellSize; }
    size_t getEntityCount() const { return m_records.size(); }
    size_t getCellCount() const { return m_cellSlots.size(); }
    size_t getPooledCellCount() const { return m_freeSlots.size(); }
    SpatialHashStats getStats() const;
    void logStatistics() const;

private:
    struct CellRange {
        int32_t minX, maxX, minY, maxY;
        size_t cellCount() const {
            return static_cast<size_t>(maxX - minX + 1) * static_cast<size_t>(maxY - minY + 1);
        }
    };

    CellRange rangeFor(float minX, float minY, float maxX, float maxY) const;
    void joinCell(CellKey key, EntityID id);
    void leaveCell(CellKey key, EntityID id);

    // Calls accept(record) once per distinct entity found in 'range'
    template <typename Accept>
    void gatherCandidates(const CellRange& range, Accept&& accept) const;

    float m_cellSize{DEFAULT_CELL_SIZE};

    std::unordered_map<EntityID, SpatialRecord> m_records;

    // Cell storage: key -> arena slot, plus free slots for reuse
    std::unordered_map<CellKey, uint32_t> m_cellSlots;
    std::vector<CellVector> m_cellArena;
    std::vector<uint32_t> m_freeSlots;

    CellKeyList m_cellScratch;

    // Reused across queries (single caller per tick)
    mutable std::unordered_set<EntityID> m_seenScratch;
    mutable std::vector<EntityID> m_queryResults;
};

} // namespace CosmicEngine

#endif // SPATIAL_HASH_HPP

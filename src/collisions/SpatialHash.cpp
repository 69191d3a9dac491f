/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/SpatialHash.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace CosmicEngine {

SpatialHash::SpatialHash(float cellSize) : m_cellSize(cellSize) {
    if (!std::isfinite(cellSize) || cellSize <= 0.0f) {
        SPATIAL_WARN("Invalid cell size " + std::to_string(cellSize) +
                     ", falling back to " + std::to_string(DEFAULT_CELL_SIZE));
        m_cellSize = DEFAULT_CELL_SIZE;
    }
    m_cellArena.reserve(256);
    m_freeSlots.reserve(256);
    m_queryResults.reserve(64);
}

SpatialHash::CellKey SpatialHash::makeCellKey(int32_t cellX, int32_t cellY) {
    const auto x = static_cast<uint32_t>(cellX + CELL_COORD_OFFSET);
    const auto y = static_cast<uint32_t>(cellY + CELL_COORD_OFFSET);
    return x + y * static_cast<uint32_t>(CELL_COORD_SPAN);
}

int32_t SpatialHash::worldToCell(float value) const {
    const float cell = std::floor(value / m_cellSize);
    if (std::isnan(cell)) {
        return 0;
    }
    // Outside the pairable range everything lands in the border cell
    const float clamped = std::clamp(cell, static_cast<float>(MIN_CELL_COORD),
                                     static_cast<float>(MAX_CELL_COORD));
    return static_cast<int32_t>(clamped);
}

SpatialHash::CellRange SpatialHash::rangeFor(float minX, float minY,
                                             float maxX, float maxY) const {
    return CellRange{worldToCell(minX), worldToCell(maxX),
                     worldToCell(minY), worldToCell(maxY)};
}

void SpatialHash::computeCells(float x, float y, float radius, CellKeyList& out) const {
    out.clear();
    const CellRange range = rangeFor(x - radius, y - radius, x + radius, y + radius);
    for (int32_t cy = range.minY; cy <= range.maxY; ++cy) {
        for (int32_t cx = range.minX; cx <= range.maxX; ++cx) {
            out.push_back(makeCellKey(cx, cy));
        }
    }
}

void SpatialHash::joinCell(CellKey key, EntityID id) {
    auto it = m_cellSlots.find(key);
    if (it == m_cellSlots.end()) {
        uint32_t slot;
        if (!m_freeSlots.empty()) {
            slot = m_freeSlots.back();
            m_freeSlots.pop_back();
        } else {
            slot = static_cast<uint32_t>(m_cellArena.size());
            m_cellArena.emplace_back();
        }
        it = m_cellSlots.emplace(key, slot).first;
    }
    m_cellArena[it->second].push_back(id);
}

void SpatialHash::leaveCell(CellKey key, EntityID id) {
    auto it = m_cellSlots.find(key);
    if (it == m_cellSlots.end()) {
        return;
    }
    CellVector& cell = m_cellArena[it->second];
    auto pos = std::find(cell.begin(), cell.end(), id);
    if (pos != cell.end()) {
        *pos = cell.back();
        cell.pop_back();
    }
    if (cell.empty()) {
        // clear() keeps the capacity for whichever cell reuses the slot
        cell.clear();
        m_freeSlots.push_back(it->second);
        m_cellSlots.erase(it);
    }
}

void SpatialHash::insert(EntityID id, float x, float y, float radius, uint32_t layer) {
    if (m_records.count(id) != 0) {
        remove(id);
    }

    SpatialRecord record;
    record.id = id;
    record.x = x;
    record.y = y;
    record.radius = std::max(radius, 0.0f);
    record.layer = layer;
    computeCells(x, y, record.radius, record.cells);

    for (CellKey key : record.cells) {
        joinCell(key, id);
    }
    m_records.emplace(id, std::move(record));
}

void SpatialHash::update(EntityID id, float x, float y, float radius,
                         std::optional<uint32_t> layer) {
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        insert(id, x, y, radius, layer.value_or(Layer_None));
        return;
    }

    SpatialRecord& record = it->second;
    radius = std::max(radius, 0.0f);
    computeCells(x, y, radius, m_cellScratch);

    // Both lists come out of the same row-major walk, so equal ranges give
    // equal sequences and the recorded keys can stay untouched
    if (m_cellScratch != record.cells) {
        for (CellKey key : record.cells) {
            if (std::find(m_cellScratch.begin(), m_cellScratch.end(), key) == m_cellScratch.end()) {
                leaveCell(key, id);
            }
        }
        for (CellKey key : m_cellScratch) {
            if (std::find(record.cells.begin(), record.cells.end(), key) == record.cells.end()) {
                joinCell(key, id);
            }
        }
        record.cells.swap(m_cellScratch);
    }

    record.x = x;
    record.y = y;
    record.radius = radius;
    if (layer.has_value()) {
        record.layer = *layer;
    }
}

void SpatialHash::remove(EntityID id) {
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return;
    }
    for (CellKey key : it->second.cells) {
        leaveCell(key, id);
    }
    m_records.erase(it);
}

void SpatialHash::clear() {
    for (const auto& [key, slot] : m_cellSlots) {
        m_cellArena[slot].clear();
        m_freeSlots.push_back(slot);
    }
    m_cellSlots.clear();
    m_records.clear();
    m_seenScratch.clear();
    m_queryResults.clear();
}

template <typename Accept>
void SpatialHash::gatherCandidates(const CellRange& range, Accept&& accept) const {
    m_seenScratch.clear();
    m_queryResults.clear();

    // A query wider than the populated grid walks the records instead of
    // probing thousands of empty cells
    if (range.cellCount() > m_cellSlots.size()) {
        for (const auto& [id, record] : m_records) {
            if (accept(record)) {
                m_queryResults.push_back(id);
            }
        }
        return;
    }

    for (int32_t cy = range.minY; cy <= range.maxY; ++cy) {
        for (int32_t cx = range.minX; cx <= range.maxX; ++cx) {
            auto cellIt = m_cellSlots.find(makeCellKey(cx, cy));
            if (cellIt == m_cellSlots.end()) continue;

            for (EntityID id : m_cellArena[cellIt->second]) {
                if (!m_seenScratch.emplace(id).second) continue;

                auto recIt = m_records.find(id);
                if (recIt == m_records.end()) continue;

                if (accept(recIt->second)) {
                    m_queryResults.push_back(id);
                }
            }
        }
    }
}

const std::vector<EntityID>& SpatialHash::queryRadius(float x, float y, float radius) const {
    const CellRange range = rangeFor(x - radius, y - radius, x + radius, y + radius);
    gatherCandidates(range, [&](const SpatialRecord& rec) {
        const float dx = rec.x - x;
        const float dy = rec.y - y;
        const float reach = radius + rec.radius;
        return dx * dx + dy * dy <= reach * reach;
    });
    return m_queryResults;
}

const std::vector<EntityID>& SpatialHash::queryRect(float x, float y,
                                                    float width, float height) const {
    const AABB area = AABB::fromCenterSize(Vector2D(x, y), width, height);
    const CellRange range = rangeFor(area.left(), area.top(), area.right(), area.bottom());
    gatherCandidates(range, [&](const SpatialRecord& rec) {
        return AABB(rec.x, rec.y, rec.radius, rec.radius).touches(area);
    });
    return m_queryResults;
}

const std::vector<EntityID>& SpatialHash::queryRadiusWithLayer(float x, float y, float radius,
                                                               uint32_t layerMask) const {
    const CellRange range = rangeFor(x - radius, y - radius, x + radius, y + radius);
    gatherCandidates(range, [&](const SpatialRecord& rec) {
        if ((rec.layer & layerMask) == 0) {
            return false;
        }
        const float dx = rec.x - x;
        const float dy = rec.y - y;
        const float reach = radius + rec.radius;
        return dx * dx + dy * dy <= reach * reach;
    });
    return m_queryResults;
}

const SpatialHash::SpatialRecord* SpatialHash::getRecord(EntityID id) const {
    auto it = m_records.find(id);
    return it == m_records.end() ? nullptr : &it->second;
}

bool SpatialHash::setEntityLayer(EntityID id, uint32_t layer) {
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return false;
    }
    it->second.layer = layer;
    return true;
}

SpatialHashStats SpatialHash::getStats() const {
    SpatialHashStats stats;
    stats.entityCount = m_records.size();
    stats.cellCount = m_cellSlots.size();
    stats.pooledCellCount = m_freeSlots.size();

    size_t totalInCells = 0;
    for (const auto& [key, slot] : m_cellSlots) {
        totalInCells += m_cellArena[slot].size();
    }
    stats.avgEntitiesPerCell = stats.cellCount > 0
        ? static_cast<float>(totalInCells) / static_cast<float>(stats.cellCount)
        : 0.0f;
    return stats;
}

void SpatialHash::logStatistics() const {
    const SpatialHashStats stats = getStats();
    SPATIAL_INFO("Spatial hash statistics:");
    SPATIAL_INFO("  Cell size: " + std::to_string(m_cellSize));
    SPATIAL_INFO("  Entities: " + std::to_string(stats.entityCount));
    SPATIAL_INFO("  Live cells: " + std::to_string(stats.cellCount) +
                 ", pooled: " + std::to_string(stats.pooledCellCount));
    SPATIAL_INFO("  Avg entities per cell: " + std::to_string(stats.avgEntitiesPerCell));
}

} // namespace CosmicEngine

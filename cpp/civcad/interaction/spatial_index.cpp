#include "civcad/interaction/spatial_index.h"
#include "civcad/entity/entity_bounds.h"
#include "civcad/geometry/geometry.h"
#include "civcad/interaction/selection.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <utility>

namespace civcad {

namespace {

void sortUnique(std::vector<EntityId>& ids) {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
}

double cellSpan(std::int64_t minX, std::int64_t maxX, std::int64_t minY, std::int64_t maxY) {
    return static_cast<double>(maxX - minX + 1) * static_cast<double>(maxY - minY + 1);
}

} // namespace

// =============================================================================
// SpatialIndex
// =============================================================================

SpatialIndex::SpatialIndex(double cellSize) : cellSize_(cellSize > 0.0 ? cellSize : kernel_constants::SPATIAL_CELL_SIZE) {}

std::int64_t SpatialIndex::hash(std::int64_t ix, std::int64_t iy) const {
    const auto ux = static_cast<std::uint64_t>(ix) * 73856093u;
    const auto uy = static_cast<std::uint64_t>(iy) * 19349663u;
    return static_cast<std::int64_t>(ux ^ uy);
}

std::int64_t SpatialIndex::cellCoord(double v) const {
    // Clamped so the cast stays defined for extreme or infinite coordinates.
    const double c = std::floor(v / cellSize_);
    if (!(c > -1e12)) return static_cast<std::int64_t>(-1e12);
    if (c > 1e12) return static_cast<std::int64_t>(1e12);
    return static_cast<std::int64_t>(c);
}

void SpatialIndex::insert(EntityId id, const AABB& bounds) {
    remove(id);

    const std::int64_t minX = cellCoord(bounds.minX);
    const std::int64_t maxX = cellCoord(bounds.maxX);
    const std::int64_t minY = cellCoord(bounds.minY);
    const std::int64_t maxY = cellCoord(bounds.maxY);

    if (cellSpan(minX, maxX, minY, maxY) > kMaxCellsPerEntity) {
        oversized_[id] = true;
        return;
    }

    std::vector<std::int64_t> cellKeys;
    for (std::int64_t x = minX; x <= maxX; ++x) {
        for (std::int64_t y = minY; y <= maxY; ++y) {
            const std::int64_t key = hash(x, y);
            cells_[key].push_back(id);
            cellKeys.push_back(key);
        }
    }
    entityCells_[id] = std::move(cellKeys);
}

void SpatialIndex::remove(EntityId id) {
    oversized_.erase(id);

    auto it = entityCells_.find(id);
    if (it == entityCells_.end()) return;

    for (std::int64_t key : it->second) {
        auto cell = cells_.find(key);
        if (cell == cells_.end()) continue;
        auto& list = cell->second;
        // Swap-remove
        for (std::size_t i = 0; i < list.size(); ++i) {
            if (list[i] == id) {
                list[i] = list.back();
                list.pop_back();
                break;
            }
        }
        if (list.empty()) cells_.erase(cell);
    }
    entityCells_.erase(it);
}

void SpatialIndex::clear() {
    cells_.clear();
    entityCells_.clear();
    oversized_.clear();
}

std::vector<EntityId> SpatialIndex::query(const AABB& bounds) const {
    std::vector<EntityId> results;
    for (const auto& entry : oversized_) results.push_back(entry.first);

    const std::int64_t minX = cellCoord(bounds.minX);
    const std::int64_t maxX = cellCoord(bounds.maxX);
    const std::int64_t minY = cellCoord(bounds.minY);
    const std::int64_t maxY = cellCoord(bounds.maxY);

    if (cellSpan(minX, maxX, minY, maxY) > kMaxCellsPerEntity) {
        // Huge query windows are cheaper answered from the per-entity table.
        for (const auto& entry : entityCells_) results.push_back(entry.first);
    } else {
        for (std::int64_t x = minX; x <= maxX; ++x) {
            for (std::int64_t y = minY; y <= maxY; ++y) {
                auto it = cells_.find(hash(x, y));
                if (it != cells_.end()) {
                    results.insert(results.end(), it->second.begin(), it->second.end());
                }
            }
        }
    }

    sortUnique(results);
    return results;
}

std::vector<EntityId> SpatialIndex::queryNear(const Point2& point, double radius) const {
    const double r = std::fabs(radius);
    return query(AABB{point.x - r, point.y - r, point.x + r, point.y + r});
}

// =============================================================================
// EntityIndex
// =============================================================================

EntityIndex::EntityIndex(double cellSize) : grid_(cellSize) {}

void EntityIndex::rebuild(const EntityList& entities) {
    clear();
    for (std::size_t i = 0; i < entities.size(); ++i) {
        const Entity& e = entities[i];
        const AABB box = computeEntityBounds(e);
        grid_.insert(e.id, box);
        order_[e.id] = i;
        bounds_[e.id] = box;
    }
}

void EntityIndex::clear() {
    grid_.clear();
    order_.clear();
    bounds_.clear();
}

std::vector<EntityId> EntityIndex::selectInBox(const AABB& box) const {
    std::vector<EntityId> hits;
    for (EntityId id : grid_.query(box)) {
        auto it = bounds_.find(id);
        if (it != bounds_.end() && boxContainsBox(box, it->second)) hits.push_back(id);
    }
    std::sort(hits.begin(), hits.end(),
              [this](EntityId a, EntityId b) { return order_.at(a) < order_.at(b); });
    return hits;
}

std::vector<EntityId> EntityIndex::pick(const EntityList& entities, const Point2& point, double tolerance) const {
    std::vector<std::size_t> positions;
    for (EntityId id : grid_.queryNear(point, tolerance)) {
        auto it = order_.find(id);
        if (it != order_.end() && it->second < entities.size()) positions.push_back(it->second);
    }
    std::sort(positions.begin(), positions.end(), std::greater<std::size_t>());

    std::vector<EntityId> hits;
    for (std::size_t pos : positions) {
        const Entity& e = entities[pos];
        if (e.visible && isPointNearEntity(e, point, tolerance)) hits.push_back(e.id);
    }
    return hits;
}

} // namespace civcad

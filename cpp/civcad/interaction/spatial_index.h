#pragma once

#include "civcad/core/kernel_constants.h"
#include "civcad/core/types.h"
#include "civcad/entity/entity_types.h"
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace civcad {

// Uniform hash grid over entity bounds. Queries return candidate ids whose
// cells overlap the query box; callers run the exact test.
class SpatialIndex {
public:
    explicit SpatialIndex(double cellSize = kernel_constants::SPATIAL_CELL_SIZE);

    void insert(EntityId id, const AABB& bounds);
    void remove(EntityId id);
    void clear();

    // Unique candidate ids, ascending.
    std::vector<EntityId> query(const AABB& bounds) const;
    std::vector<EntityId> queryNear(const Point2& point, double radius) const;

    bool contains(EntityId id) const { return entityCells_.count(id) != 0 || oversized_.count(id) != 0; }
    std::size_t size() const noexcept { return entityCells_.size() + oversized_.size(); }
    double cellSize() const noexcept { return cellSize_; }

private:
    // Bounds covering more cells than this skip the grid and match every query.
    static constexpr std::int64_t kMaxCellsPerEntity = 4096;

    double cellSize_;
    std::unordered_map<std::int64_t, std::vector<EntityId>> cells_;
    std::unordered_map<EntityId, std::vector<std::int64_t>> entityCells_;
    std::unordered_map<EntityId, bool> oversized_;

    std::int64_t hash(std::int64_t ix, std::int64_t iy) const;
    std::int64_t cellCoord(double v) const;
};

// SpatialIndex built over an entity list. Results match selectEntitiesInBox and
// pickEntities on the same list.
class EntityIndex {
public:
    explicit EntityIndex(double cellSize = kernel_constants::SPATIAL_CELL_SIZE);

    void rebuild(const EntityList& entities);
    void clear();

    std::vector<EntityId> selectInBox(const AABB& box) const;

    // `entities` must be the list last passed to rebuild.
    std::vector<EntityId> pick(const EntityList& entities, const Point2& point,
                               double tolerance = kernel_constants::DEFAULT_PICK_TOLERANCE) const;

    std::size_t size() const noexcept { return order_.size(); }

private:
    SpatialIndex grid_;
    std::unordered_map<EntityId, std::size_t> order_;
    std::unordered_map<EntityId, AABB> bounds_;
};

} // namespace civcad

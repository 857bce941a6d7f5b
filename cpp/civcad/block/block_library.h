#pragma once

#include "civcad/block/block_definition.h"
#include "civcad/core/id_source.h"
#include "civcad/entity/entity_types.h"
#include <memory>
#include <string>
#include <vector>

namespace civcad {

using BlockDefinitionPtr = std::shared_ptr<const BlockDefinition>;

// =============================================================================
// Definitions and instances
// =============================================================================

// Copies `entities` under fresh ids.
BlockDefinitionPtr createBlockDefinition(IdSource& ids, std::string name, const EntityList& entities,
                                         const Point2& basePoint = Point2{});

// (p - base) * scale, rotated about the origin, + position.
Point2 transformBlockPoint(const Point2& p, const Point2& basePoint, const Point2& position,
                           double scale, double rotation);

/**
 * Transformed copy of the definition's entities for an insertion. Each entity is
 * moved to the origin relative to basePoint, scaled, rotated and moved to
 * position using the same per-kind rules as the transform engine. Sub-entity ids
 * are kept.
 */
EntityList materializeBlock(const BlockDefinition& definition, const Point2& position,
                            double scale, double rotation);

/**
 * New block instance entity with a fresh id and its materialized copy.
 * @throws KernelException(UnknownBlock) when definition is null.
 */
Entity insertBlock(IdSource& ids, const BlockDefinitionPtr& definition, const Point2& position,
                   double scale = 1.0, double rotation = 0.0, LayerId layerId = kDefaultLayerId);

// Regenerates the materialized copy from the instance's definition and parameters.
// Instances without a definition (e.g. imported INSERT records) stay empty.
void rematerialize(BlockInstanceGeom& instance);

// Copy of a block instance entity with new insertion parameters. Other kinds are returned unchanged.
Entity setInsertion(const Entity& instance, const Point2& position, double scale, double rotation);

// =============================================================================
// Library
// =============================================================================

class BlockLibrary {
public:
    // Replaces a definition with the same name.
    BlockDefinitionPtr registerDefinition(BlockDefinitionPtr definition);
    bool remove(const std::string& name);
    void clear() { definitions_.clear(); }

    const BlockDefinition* find(const std::string& name) const;
    const BlockDefinition* findById(BlockId id) const;
    BlockDefinitionPtr findShared(const std::string& name) const;

    // @throws KernelException(UnknownBlock)
    BlockDefinitionPtr get(const std::string& name) const;

    std::vector<std::string> names() const;
    const std::vector<BlockDefinitionPtr>& definitions() const noexcept { return definitions_; }
    std::size_t size() const noexcept { return definitions_.size(); }
    bool empty() const noexcept { return definitions_.empty(); }

private:
    std::vector<BlockDefinitionPtr> definitions_;
};

// =============================================================================
// Standard civil engineering symbols
// =============================================================================

BlockDefinitionPtr createNorthArrow(IdSource& ids, double size = 20.0);
BlockDefinitionPtr createSectionMarker(IdSource& ids, const std::string& label = "A", double size = 10.0);
BlockDefinitionPtr createLevelMarker(IdSource& ids, const std::string& elevation = "0.00", double size = 8.0);
BlockDefinitionPtr createDoorSymbol(IdSource& ids, double width = 900.0, double openingAngleDeg = 90.0);
BlockDefinitionPtr createWindowSymbol(IdSource& ids, double width = 1200.0, double wallThickness = 200.0);
BlockDefinitionPtr createColumnSymbol(IdSource& ids, double width = 300.0, double depth = 300.0);
BlockDefinitionPtr createToiletSymbol(IdSource& ids);
BlockDefinitionPtr createSinkSymbol(IdSource& ids);
BlockDefinitionPtr createTreeSymbol(IdSource& ids, double radius = 2000.0);
BlockDefinitionPtr createManholeSymbol(IdSource& ids, double diameter = 600.0);
BlockDefinitionPtr createBenchmarkSymbol(IdSource& ids, double size = 10.0);
BlockDefinitionPtr createTraditionalHausSymbol(IdSource& ids, double width = 6000.0, double depth = 4000.0);
BlockDefinitionPtr createWaterTankSymbol(IdSource& ids, double diameter = 2000.0);
BlockDefinitionPtr createSepticTankSymbol(IdSource& ids, double width = 2000.0, double depth = 1500.0);

// Library key ("north-arrow", "door", ...) to symbol with default parameters.
// @throws KernelException(UnknownBlock)
BlockDefinitionPtr createStandardBlock(IdSource& ids, const std::string& key);
std::vector<std::string> listStandardBlocks();

} // namespace civcad

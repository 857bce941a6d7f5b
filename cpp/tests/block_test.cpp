#include "tests/civcad_test_common.h"
#include "civcad/block/block_library.h"
#include "civcad/core/errors.h"
#include "civcad/core/util.h"
#include "civcad/entity/entity_factory.h"
#include "civcad/geometry/geometry.h"
#include "civcad/transform/transform_engine.h"

using namespace civcad;
using civcad_test::expectPointNear;
using civcad_test::geomOf;

namespace {

BlockDefinitionPtr makeMarker(SequentialIdSource& ids) {
    SequentialIdSource scratch(1000);
    const EntityList parts{
        createLine(scratch, {10, 10}, {12, 10}),
        createCircle(scratch, {10, 10}, 1),
    };
    return createBlockDefinition(ids, "marker", parts, {10, 10});
}

} // namespace

TEST(BlockTest, DefinitionReassignsIds) {
    SequentialIdSource ids;
    const BlockDefinitionPtr def = makeMarker(ids);
    EXPECT_EQ(def->id, 1u);
    EXPECT_EQ(def->name, "marker");
    ASSERT_EQ(def->entities.size(), 2u);
    EXPECT_EQ(def->entities[0].id, 2u);
    EXPECT_EQ(def->entities[1].id, 3u);
}

TEST(BlockTest, InsertMaterializesRelativeToBasePoint) {
    SequentialIdSource ids;
    const BlockDefinitionPtr def = makeMarker(ids);
    const Entity inst = insertBlock(ids, def, {100, 50}, 2.0, kPi / 2.0, 4);

    EXPECT_EQ(inst.id, 4u);
    EXPECT_EQ(inst.layerId, 4u);
    const auto& g = geomOf<BlockInstanceGeom>(inst);
    EXPECT_EQ(g.blockId, def->id);
    EXPECT_EQ(g.blockName, "marker");
    ASSERT_EQ(g.entities.size(), 2u);

    // (12,10) - base = (2,0); scaled (4,0); rotated (0,4); placed (100,54).
    const auto& line = geomOf<LineGeom>(g.entities[0]);
    expectPointNear(line.start, {100, 50}, 1e-9);
    expectPointNear(line.end, {100, 54}, 1e-9);
    const auto& circle = geomOf<CircleGeom>(g.entities[1]);
    expectPointNear(circle.center, {100, 50}, 1e-9);
    EXPECT_DOUBLE_EQ(circle.radius, 2.0);

    expectPointNear(transformBlockPoint({12, 10}, {10, 10}, {100, 50}, 2.0, kPi / 2.0), {100, 54}, 1e-9);

    // Definition stays untouched.
    expectPointNear(geomOf<LineGeom>(def->entities[0]).end, {12, 10});
}

TEST(BlockTest, InsertScalesAndTurnsText) {
    SequentialIdSource ids;
    SequentialIdSource scratch(1000);
    Entity label = createText(scratch, {12, 10}, "MH-1", 2.0);
    std::get<TextGeom>(label.geometry).rotation = 0.25;
    const BlockDefinitionPtr def = createBlockDefinition(ids, "tag", EntityList{label}, {10, 10});

    const Entity inst = insertBlock(ids, def, {0, 0}, 3.0, kPi / 2.0);
    const auto& g = geomOf<BlockInstanceGeom>(inst);
    ASSERT_EQ(g.entities.size(), 1u);
    const auto& text = geomOf<TextGeom>(g.entities[0]);
    expectPointNear(text.position, {0, 6}, 1e-9);
    EXPECT_DOUBLE_EQ(text.fontSize, 6.0);
    EXPECT_NEAR(text.rotation, 0.25 + kPi / 2.0, 1e-12);
    EXPECT_EQ(text.content, "MH-1");
}

TEST(BlockTest, NegativeScaleInstanceKeepsArcOrientation) {
    SequentialIdSource ids;
    SequentialIdSource scratch(1000);
    const BlockDefinitionPtr def =
        createBlockDefinition(ids, "hook", EntityList{createArc(scratch, {0, 0}, 4, 0, 90)}, {0, 0});

    const Entity inst = insertBlock(ids, def, {20, 0}, -1.0, 0.0);
    const auto& arc = geomOf<ArcGeom>(geomOf<BlockInstanceGeom>(inst).entities[0]);
    expectPointNear(arc.center, {20, 0}, 1e-9);
    expectPointNear(polarToCartesian(arc.center, arc.radius, arc.startAngle), {16, 0}, 1e-9);
    expectPointNear(polarToCartesian(arc.center, arc.radius, arc.endAngle), {20, -4}, 1e-9);
}

TEST(BlockTest, NullDefinitionThrows) {
    SequentialIdSource ids;
    try {
        insertBlock(ids, nullptr, {0, 0});
        FAIL() << "expected UnknownBlock";
    } catch (const KernelException& ex) {
        EXPECT_EQ(ex.code(), KernelError::UnknownBlock);
    }
}

TEST(BlockTest, SetInsertionAndTransformsRematerialize) {
    SequentialIdSource ids;
    const BlockDefinitionPtr def = makeMarker(ids);
    const Entity inst = insertBlock(ids, def, {0, 0});

    const Entity moved = setInsertion(inst, {5, 5}, 1.0, 0.0);
    EXPECT_EQ(moved.id, inst.id);
    expectPointNear(geomOf<LineGeom>(geomOf<BlockInstanceGeom>(moved).entities[0]).end, {7, 5});

    const Entity translated = translateEntity(inst, 1, 1);
    expectPointNear(geomOf<BlockInstanceGeom>(translated).position, {1, 1});
    expectPointNear(geomOf<LineGeom>(geomOf<BlockInstanceGeom>(translated).entities[0]).end, {3, 1});

    const Entity scaled = scaleEntity(inst, 3.0, {0, 0});
    EXPECT_DOUBLE_EQ(geomOf<BlockInstanceGeom>(scaled).scale, 3.0);
    EXPECT_DOUBLE_EQ(geomOf<CircleGeom>(geomOf<BlockInstanceGeom>(scaled).entities[1]).radius, 3.0);

    // Non-instances come back unchanged.
    const Entity line = createLine(ids, {0, 0}, {1, 0});
    EXPECT_EQ(setInsertion(line, {9, 9}, 2.0, 1.0), line);
}

TEST(BlockLibraryTest, RegisterLookupRemove) {
    SequentialIdSource ids;
    BlockLibrary library;
    EXPECT_TRUE(library.empty());

    const BlockDefinitionPtr first = library.registerDefinition(makeMarker(ids));
    library.registerDefinition(createNorthArrow(ids));
    EXPECT_EQ(library.size(), 2u);

    const BlockDefinition* marker = library.find("marker");
    ASSERT_EQ(marker, first.get());
    EXPECT_EQ(library.findById(marker->id), marker);
    EXPECT_EQ(library.get("marker").get(), marker);
    EXPECT_EQ(library.find("nope"), nullptr);
    EXPECT_FALSE(library.findShared("nope"));

    try {
        library.get("nope");
        FAIL() << "expected UnknownBlock";
    } catch (const KernelException& ex) {
        EXPECT_EQ(ex.code(), KernelError::UnknownBlock);
    }

    // Same name replaces.
    library.registerDefinition(makeMarker(ids));
    EXPECT_EQ(library.size(), 2u);
    EXPECT_NE(library.find("marker"), marker);

    EXPECT_TRUE(library.remove("marker"));
    EXPECT_FALSE(library.remove("marker"));
    EXPECT_EQ(library.size(), 1u);
}

TEST(StandardBlocksTest, EveryKeyBuildsANamedDefinition) {
    SequentialIdSource ids;
    const auto keys = listStandardBlocks();
    EXPECT_EQ(keys.size(), 14u);
    for (const std::string& key : keys) {
        const BlockDefinitionPtr def = createStandardBlock(ids, key);
        ASSERT_TRUE(def) << key;
        EXPECT_FALSE(def->name.empty()) << key;
        EXPECT_FALSE(def->entities.empty()) << key;
        for (const Entity& e : def->entities) EXPECT_NE(e.id, kNoId) << key;
    }

    EXPECT_THROW(createStandardBlock(ids, "gazebo"), KernelException);
}

TEST(StandardBlocksTest, SectionMarkerUsesLabel) {
    SequentialIdSource ids;
    const BlockDefinitionPtr def = createSectionMarker(ids, "B", 10.0);
    EXPECT_EQ(def->name, "Section B");
    bool found = false;
    for (const Entity& e : def->entities) {
        if (const TextGeom* t = e.as<TextGeom>()) found = found || t->content == "B";
    }
    EXPECT_TRUE(found);
}

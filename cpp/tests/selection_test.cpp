#include "tests/civcad_test_common.h"
#include "civcad/entity/entity_factory.h"
#include "civcad/interaction/selection.h"
#include "civcad/interaction/spatial_index.h"

#include <algorithm>

using namespace civcad;
using civcad_test::hiddenCopy;

namespace {

EntityList buildScene(SequentialIdSource& ids) {
    EntityList list;
    list.push_back(createLine(ids, {0, 0}, {10, 0}));              // 1
    list.push_back(createCircle(ids, {50, 50}, 10));               // 2
    list.push_back(createRectangle(ids, {100, 100}, 20, 10));      // 3
    list.push_back(createLine(ids, {-5, 5}, {300, 5}));            // 4, long
    list.push_back(createArc(ids, {200, 0}, 10, 0, 90));           // 5
    list.push_back(createText(ids, {0, 200}, "GRID A"));           // 6
    list.push_back(createPolyline(ids, {{0, 0}, {40, 40}, {80, 0}}, true)); // 7
    return list;
}

} // namespace

TEST(SelectionTest, BoxSelectionRequiresFullContainment) {
    SequentialIdSource ids;
    const EntityList list = buildScene(ids);

    const auto hits = selectEntitiesInBox(list, AABB{-1, -1, 70, 70});
    // The line at y=5 crosses the box and is left out.
    EXPECT_EQ(hits, (std::vector<EntityId>{1, 2}));

    EXPECT_TRUE(selectEntitiesInBox(list, AABB{500, 500, 600, 600}).empty());
}

TEST(SelectionTest, BoxSelectionIgnoresVisibility) {
    SequentialIdSource ids;
    EntityList list{createLine(ids, {1, 1}, {2, 2})};
    list[0] = hiddenCopy(list[0]);
    EXPECT_EQ(selectEntitiesInBox(list, AABB{0, 0, 10, 10}).size(), 1u);
}

TEST(SelectionTest, PickReturnsTopmostFirst) {
    SequentialIdSource ids;
    EntityList list;
    list.push_back(createLine(ids, {0, 0}, {10, 0}));
    list.push_back(createLine(ids, {5, -5}, {5, 5}));
    list.push_back(createCircle(ids, {5, 0}, 100));

    const auto hits = pickEntities(list, {5, 0}, 1.0);
    EXPECT_EQ(hits, (std::vector<EntityId>{2, 1}));

    const auto top = pickEntity(list, {5, 0}, 1.0);
    ASSERT_TRUE(top.has_value());
    EXPECT_EQ(*top, 2u);

    list[1] = hiddenCopy(list[1]);
    EXPECT_EQ(pickEntities(list, {5, 0}, 1.0), (std::vector<EntityId>{1}));
    EXPECT_FALSE(pickEntity(list, {50, 50}, 1.0).has_value());
}

TEST(SelectionTest, HitTestsPerKind) {
    SequentialIdSource ids;
    const Entity circle = createCircle(ids, {0, 0}, 10);
    EXPECT_TRUE(isPointNearEntity(circle, {10.5, 0}, 1.0));
    EXPECT_FALSE(isPointNearEntity(circle, {0, 0}, 1.0));

    const Entity arc = createArc(ids, {0, 0}, 10, 0, 90);
    EXPECT_TRUE(isPointNearEntity(arc, {0, 10}, 0.5));
    EXPECT_FALSE(isPointNearEntity(arc, {0, -10}, 0.5));

    const Entity closed = createPolyline(ids, {{0, 0}, {10, 0}, {10, 10}}, true);
    EXPECT_TRUE(isPointNearEntity(closed, {5, 5}, 0.1));
    const Entity open = createPolyline(ids, {{0, 0}, {10, 0}, {10, 10}}, false);
    EXPECT_FALSE(isPointNearEntity(open, {5, 5}, 0.1));

    const Entity rect = createRectangle(ids, {0, 0}, 10, 10);
    EXPECT_TRUE(isPointNearEntity(rect, {10, 5}, 0.1));
    EXPECT_FALSE(isPointNearEntity(rect, {5, 5}, 0.1));
}

TEST(SpatialIndexTest, QueryInsertRemove) {
    SpatialIndex index(10.0);
    index.insert(1, AABB{0, 0, 5, 5});
    index.insert(2, AABB{100, 100, 105, 105});
    EXPECT_EQ(index.size(), 2u);

    EXPECT_EQ(index.query(AABB{1, 1, 2, 2}), (std::vector<EntityId>{1}));
    EXPECT_EQ(index.queryNear({102, 102}, 1.0), (std::vector<EntityId>{2}));

    index.remove(1);
    EXPECT_FALSE(index.contains(1));
    EXPECT_TRUE(index.query(AABB{1, 1, 2, 2}).empty());

    // Re-inserting moves the entry.
    index.insert(2, AABB{0, 0, 1, 1});
    EXPECT_EQ(index.query(AABB{0, 0, 1, 1}), (std::vector<EntityId>{2}));
    EXPECT_TRUE(index.query(AABB{100, 100, 101, 101}).empty());
}

TEST(SpatialIndexTest, OversizedEntriesMatchEveryQuery) {
    SpatialIndex index(1.0);
    index.insert(7, AABB{-1e6, -1e6, 1e6, 1e6});
    index.insert(8, AABB{0, 0, 1, 1});
    EXPECT_TRUE(index.contains(7));
    EXPECT_EQ(index.query(AABB{500, 500, 501, 501}), (std::vector<EntityId>{7}));
    EXPECT_EQ(index.query(AABB{0, 0, 0.5, 0.5}), (std::vector<EntityId>{7, 8}));
}

TEST(EntityIndexTest, MatchesLinearScans) {
    SequentialIdSource ids;
    EntityList list = buildScene(ids);
    list[1] = hiddenCopy(list[1]);

    EntityIndex index(25.0);
    index.rebuild(list);
    EXPECT_EQ(index.size(), list.size());

    const AABB boxes[] = {
        {-1, -1, 70, 70},
        {-10, -10, 400, 400},
        {95, 95, 125, 115},
        {190, -15, 215, 15},
        {1000, 1000, 1001, 1001},
    };
    for (const AABB& box : boxes) {
        EXPECT_EQ(index.selectInBox(box), selectEntitiesInBox(list, box));
    }

    const Point2 points[] = {{5, 0}, {5, 5}, {60, 50}, {120, 105}, {200, 10}, {40, 40}, {-100, -100}};
    for (const Point2& p : points) {
        EXPECT_EQ(index.pick(list, p, 2.0), pickEntities(list, p, 2.0));
    }
}

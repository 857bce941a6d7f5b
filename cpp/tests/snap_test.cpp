#include "tests/civcad_test_common.h"
#include "civcad/entity/entity_factory.h"
#include "civcad/geometry/geometry.h"
#include "civcad/interaction/snap_solver.h"

#include <algorithm>

using namespace civcad;
using civcad_test::expectPointNear;
using civcad_test::hiddenCopy;

namespace {

std::size_t countKind(const std::vector<SnapPoint>& points, SnapKind kind) {
    return static_cast<std::size_t>(
        std::count_if(points.begin(), points.end(), [kind](const SnapPoint& sp) { return sp.kind == kind; }));
}

SnapSettings objectSnapsOnly() {
    SnapSettings s;
    s.gridSnap = false;
    return s;
}

} // namespace

TEST(SnapTest, NearestCandidateWins) {
    const std::vector<SnapPoint> candidates{
        SnapPoint{{0, 0}, SnapKind::Endpoint, 1},
        SnapPoint{{100, 100}, SnapKind::Endpoint, 2},
    };
    const auto hit = findNearestSnapPoint({5, 5}, candidates, 20.0);
    ASSERT_TRUE(hit.has_value());
    expectPointNear(hit->point, {0, 0});
    EXPECT_EQ(hit->sourceId, 1u);

    EXPECT_FALSE(findNearestSnapPoint({5, 5}, {}, 20.0).has_value());
    EXPECT_FALSE(findNearestSnapPoint({50, 50}, candidates, 20.0).has_value());
}

TEST(SnapTest, MaxDistanceIsExclusive) {
    const std::vector<SnapPoint> candidates{SnapPoint{{10, 0}, SnapKind::Endpoint, 1}};
    EXPECT_FALSE(findNearestSnapPoint({0, 0}, candidates, 10.0).has_value());
    EXPECT_TRUE(findNearestSnapPoint({0, 0}, candidates, 10.001).has_value());
}

TEST(SnapTest, CollectRespectsFlagsAndVisibility) {
    SequentialIdSource ids;
    EntityList list;
    list.push_back(createLine(ids, {0, 0}, {10, 0}));
    list.push_back(createCircle(ids, {50, 0}, 5));

    SnapSettings settings;
    auto points = collectSnapPoints(list, settings);
    EXPECT_EQ(countKind(points, SnapKind::Endpoint), 2u);
    EXPECT_EQ(countKind(points, SnapKind::Midpoint), 1u);
    EXPECT_EQ(countKind(points, SnapKind::Center), 1u);
    EXPECT_EQ(countKind(points, SnapKind::Quadrant), 4u);

    settings.endpoint = false;
    points = collectSnapPoints(list, settings);
    EXPECT_EQ(countKind(points, SnapKind::Endpoint), 0u);
    EXPECT_EQ(countKind(points, SnapKind::Quadrant), 0u);

    list[0] = hiddenCopy(list[0]);
    points = collectSnapPoints(list, SnapSettings{});
    EXPECT_EQ(countKind(points, SnapKind::Midpoint), 0u);
}

TEST(SnapTest, ClosedPolylineGetsClosingMidpoint) {
    SequentialIdSource ids;
    const EntityList list{createPolyline(ids, {{0, 0}, {10, 0}, {10, 10}}, true)};
    const auto points = collectSnapPoints(list, SnapSettings{});
    EXPECT_EQ(countKind(points, SnapKind::Endpoint), 3u);
    EXPECT_EQ(countKind(points, SnapKind::Midpoint), 3u);
}

TEST(SnapTest, IntersectionsNearCursor) {
    SequentialIdSource ids;
    EntityList list;
    list.push_back(createLine(ids, {0, 0}, {10, 10}));
    list.push_back(createLine(ids, {0, 10}, {10, 0}));
    list.push_back(createCircle(ids, {5, 5}, 2));

    const auto near = collectIntersectionSnapPoints(list, {5, 5}, 0.5);
    ASSERT_EQ(near.size(), 1u);
    expectPointNear(near[0].point, {5, 5});

    const auto all = collectIntersectionSnapPoints(list, {5, 5}, 3.0);
    // One crossing plus two circle hits per line.
    EXPECT_EQ(all.size(), 5u);
    for (const SnapPoint& sp : all) EXPECT_EQ(sp.kind, SnapKind::Intersection);
}

TEST(SnapTest, PerpendicularAndNearest) {
    SequentialIdSource ids;
    const Entity line = createLine(ids, {0, 0}, {10, 0});
    const auto foot = perpendicularSnapPoint(line, {4, 7});
    ASSERT_TRUE(foot.has_value());
    expectPointNear(foot->point, {4, 0});
    EXPECT_FALSE(perpendicularSnapPoint(line, {14, 7}).has_value());

    const Entity circle = createCircle(ids, {0, 0}, 5);
    EXPECT_FALSE(perpendicularSnapPoint(circle, {1, 1}).has_value());
    const auto nearest = nearestSnapPoint(circle, {10, 0});
    ASSERT_TRUE(nearest.has_value());
    expectPointNear(nearest->point, {5, 0});
}

TEST(SnapTest, PerpendicularUsesClosingEdge) {
    SequentialIdSource ids;
    const std::vector<Point2> square{{0, 0}, {10, 0}, {10, 10}, {0, 10}};
    const auto closed = perpendicularSnapPoint(createPolyline(ids, square, true), {-3, 5});
    ASSERT_TRUE(closed.has_value());
    expectPointNear(closed->point, {0, 5});

    const auto open = perpendicularSnapPoint(createPolyline(ids, square, false), {-3, 5});
    ASSERT_TRUE(open.has_value());
    expectPointNear(open->point, {10, 5});
}

TEST(SnapTest, TangentPoints) {
    const auto outside = tangentSnapPoints({0, 0}, 5.0, {10, 0});
    ASSERT_EQ(outside.size(), 2u);
    for (const SnapPoint& sp : outside) {
        EXPECT_NEAR(distance(sp.point, {0, 0}), 5.0, 1e-9);
        // Radius is perpendicular to the tangent line.
        const Point2 r{sp.point.x, sp.point.y};
        const Point2 t{10 - sp.point.x, 0 - sp.point.y};
        EXPECT_NEAR(r.x * t.x + r.y * t.y, 0.0, 1e-9);
    }

    EXPECT_TRUE(tangentSnapPoints({0, 0}, 5.0, {1, 1}).empty());
    EXPECT_TRUE(tangentSnapPoints({0, 0}, 5.0, {5, 0}).empty());
}

TEST(SnapTest, GridRounding) {
    expectPointNear(snapToGrid({14, -6}, 10.0), {10, -10});
    expectPointNear(snapToGrid({3.3, 4.4}, 0.0), {3.3, 4.4});
}

TEST(SnapTest, SolveSnapPrefersObjectsThenGrid) {
    SequentialIdSource ids;
    const EntityList list{createLine(ids, {0, 0}, {100, 0})};

    const auto onEnd = solveSnap(list, {-2, 1}, SnapSettings{});
    ASSERT_TRUE(onEnd.has_value());
    EXPECT_EQ(onEnd->kind, SnapKind::Endpoint);
    expectPointNear(onEnd->point, {0, 0});

    // Perpendicular foot is the only object candidate away from the ends.
    const auto onFoot = solveSnap(list, {33, 4}, SnapSettings{});
    ASSERT_TRUE(onFoot.has_value());
    EXPECT_EQ(onFoot->kind, SnapKind::Perpendicular);
    expectPointNear(onFoot->point, {33, 0});

    const auto onGrid = solveSnap(list, {33, 44}, SnapSettings{});
    ASSERT_TRUE(onGrid.has_value());
    EXPECT_EQ(onGrid->kind, SnapKind::Grid);
    expectPointNear(onGrid->point, {30, 40});

    EXPECT_FALSE(solveSnap(list, {33, 44}, objectSnapsOnly()).has_value());

    SnapSettings disabled;
    disabled.enabled = false;
    EXPECT_FALSE(solveSnap(list, {2, 3}, disabled).has_value());
}

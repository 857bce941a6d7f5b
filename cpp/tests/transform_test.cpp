#include "tests/civcad_test_common.h"
#include "civcad/core/util.h"
#include "civcad/entity/dimension_factory.h"
#include "civcad/entity/entity_factory.h"
#include "civcad/geometry/geometry.h"
#include "civcad/transform/transform_engine.h"

using namespace civcad;
using civcad_test::expectPointNear;
using civcad_test::geomOf;

TEST(TransformTest, TranslateKeepsIdAndMovesGeometry) {
    SequentialIdSource ids;
    const Entity line = createLine(ids, {0, 0}, {10, 0});
    const Entity moved = translateEntity(line, 3, -2);
    EXPECT_EQ(moved.id, line.id);
    expectPointNear(geomOf<LineGeom>(moved).start, {3, -2});
    expectPointNear(geomOf<LineGeom>(moved).end, {13, -2});
    // Source is untouched.
    expectPointNear(geomOf<LineGeom>(line).start, {0, 0});

    const Entity rect = translateEntity(createRectangle(ids, {1, 1}, 2, 2), 1, 1);
    expectPointNear(geomOf<RectangleGeom>(rect).topLeft, {2, 2});
}

TEST(TransformTest, RotateArcShiftsAngles) {
    SequentialIdSource ids;
    const Entity arc = createArc(ids, {10, 0}, 5, 0, 90);
    const Entity rotated = rotateEntity(arc, kPi / 2.0, {0, 0});
    const auto& g = geomOf<ArcGeom>(rotated);
    expectPointNear(g.center, {0, 10});
    EXPECT_NEAR(g.startAngle, kPi / 2.0, 1e-12);
    EXPECT_NEAR(g.endAngle, kPi, 1e-12);
}

TEST(TransformTest, RotateRectanglePromotesToPolyline) {
    SequentialIdSource ids;
    const Entity rect = createRectangle(ids, {0, 0}, 10, 5);

    const Entity same = rotateEntity(rect, 0.0, {0, 0});
    EXPECT_EQ(same.kind(), EntityKind::Rectangle);

    const Entity rotated = rotateEntity(rect, kPi / 2.0, {0, 0});
    ASSERT_EQ(rotated.kind(), EntityKind::Polyline);
    const auto& poly = geomOf<PolylineGeom>(rotated);
    EXPECT_TRUE(poly.closed);
    ASSERT_EQ(poly.points.size(), 4u);
    expectPointNear(poly.points[1], {0, 10}, 1e-9);
    EXPECT_EQ(rotated.id, rect.id);
}

TEST(TransformTest, ScaleAboutCenter) {
    SequentialIdSource ids;
    const Entity circle = createCircle(ids, {2, 2}, 3);
    const auto& c = geomOf<CircleGeom>(scaleEntity(circle, 2.0, {0, 0}));
    expectPointNear(c.center, {4, 4});
    EXPECT_DOUBLE_EQ(c.radius, 6.0);

    const Entity text = createText(ids, {1, 0}, "A", 10.0);
    EXPECT_DOUBLE_EQ(geomOf<TextGeom>(scaleEntity(text, 0.5, {0, 0})).fontSize, 5.0);
}

TEST(TransformTest, NegativeScaleIsPointReflection) {
    SequentialIdSource ids;
    const Entity arc = createArc(ids, {10, 0}, 5, 0, 90);
    const auto& g = geomOf<ArcGeom>(scaleEntity(arc, -1.0, {0, 0}));
    expectPointNear(g.center, {-10, 0});
    EXPECT_DOUBLE_EQ(g.radius, 5.0);
    expectPointNear(polarToCartesian(g.center, g.radius, g.startAngle), {-15, 0}, 1e-9);
    expectPointNear(polarToCartesian(g.center, g.radius, g.endAngle), {-10, -5}, 1e-9);

    const Entity text = createText(ids, {4, 0}, "N", 2.0);
    const auto& t = geomOf<TextGeom>(scaleEntity(text, -2.0, {0, 0}));
    expectPointNear(t.position, {-8, 0});
    EXPECT_DOUBLE_EQ(t.fontSize, 4.0);
    EXPECT_NEAR(t.rotation, kPi, 1e-12);
}

TEST(TransformTest, ScaleRegeneratesDimensionText) {
    SequentialIdSource ids;
    const Entity dim = createLinearDimension(ids, {0, 0}, {10, 0});
    const Entity scaled = scaleEntity(dim, 2.0, {0, 0});
    const auto& g = geomOf<DimensionGeom>(scaled);
    EXPECT_DOUBLE_EQ(g.measuredValue, 20.0);
    EXPECT_EQ(g.displayText, "20.00 m");
}

TEST(TransformTest, MirrorLineTwiceRestoresEndpoints) {
    SequentialIdSource ids;
    const Entity line = createLine(ids, {1, 2}, {7, -3});
    const Point2 a{-4, 1};
    const Point2 b{6, 9};
    const Entity twice = mirrorEntity(mirrorEntity(line, a, b), a, b);
    expectPointNear(geomOf<LineGeom>(twice).start, {1, 2}, 1e-9);
    expectPointNear(geomOf<LineGeom>(twice).end, {7, -3}, 1e-9);
}

TEST(TransformTest, MirrorArcReversesSweep) {
    SequentialIdSource ids;
    const Entity arc = createArc(ids, {5, 5}, 2, 0, 90);
    const Entity mirrored = mirrorEntity(arc, {0, 0}, {10, 0});
    const auto& g = geomOf<ArcGeom>(mirrored);
    expectPointNear(g.center, {5, -5});
    EXPECT_NEAR(g.startAngle, -kPi / 2.0, 1e-12);
    EXPECT_NEAR(g.endAngle, 0.0, 1e-12);
}

TEST(TransformTest, MirrorRectangle) {
    SequentialIdSource ids;
    const Entity rect = createRectangle(ids, {1, 1}, 4, 2);

    const Entity vertical = mirrorEntity(rect, {0, 0}, {0, 10});
    ASSERT_EQ(vertical.kind(), EntityKind::Rectangle);
    const auto& r = geomOf<RectangleGeom>(vertical);
    expectPointNear(r.topLeft, {-5, 1});
    EXPECT_DOUBLE_EQ(r.width, 4.0);
    EXPECT_DOUBLE_EQ(r.height, 2.0);

    const Entity diagonal = mirrorEntity(rect, {0, 0}, {1, 1});
    EXPECT_EQ(diagonal.kind(), EntityKind::Polyline);

    // Degenerate axis.
    EXPECT_EQ(mirrorEntity(rect, {3, 3}, {3, 3}), rect);
}

TEST(TransformTest, OffsetLineRoundTrip) {
    SequentialIdSource ids;
    const Entity line = createLine(ids, {1, 1}, {8, 5});
    for (double d : {2.5, -4.0, 0.001}) {
        const auto out = offsetEntity(line, d);
        ASSERT_TRUE(out.has_value());
        const auto back = offsetEntity(*out, -d);
        ASSERT_TRUE(back.has_value());
        expectPointNear(geomOf<LineGeom>(*back).start, {1, 1}, 1e-9);
        expectPointNear(geomOf<LineGeom>(*back).end, {8, 5}, 1e-9);
    }
}

TEST(TransformTest, OffsetLineUsesLeftNormal) {
    SequentialIdSource ids;
    const auto out = offsetEntity(createLine(ids, {0, 0}, {10, 0}), 5.0);
    ASSERT_TRUE(out.has_value());
    expectPointNear(geomOf<LineGeom>(*out).start, {0, 5});
    expectPointNear(geomOf<LineGeom>(*out).end, {10, 5});
}

TEST(TransformTest, OffsetCircleAndDegenerates) {
    SequentialIdSource ids;
    const Entity circle = createCircle(ids, {0, 0}, 5);
    const auto grown = offsetEntity(circle, 2.0);
    ASSERT_TRUE(grown.has_value());
    EXPECT_DOUBLE_EQ(geomOf<CircleGeom>(*grown).radius, 7.0);
    EXPECT_FALSE(offsetEntity(circle, -5.0).has_value());

    EXPECT_FALSE(offsetEntity(createLine(ids, {1, 1}, {1, 1}), 2.0).has_value());
    EXPECT_FALSE(offsetEntity(createText(ids, {0, 0}, "x"), 1.0).has_value());
    EXPECT_FALSE(offsetEntity(createPolyline(ids, {{0, 0}}), 1.0).has_value());
}

TEST(TransformTest, OffsetClosedSquare) {
    SequentialIdSource ids;
    // Counter-clockwise square: left normals point inward.
    const Entity square = createPolyline(ids, {{0, 0}, {10, 0}, {10, 10}, {0, 10}}, true);
    const auto out = offsetEntity(square, 1.0);
    ASSERT_TRUE(out.has_value());
    const auto& pts = geomOf<PolylineGeom>(*out).points;
    ASSERT_EQ(pts.size(), 4u);
    const double k = 1.0 / std::sqrt(2.0);
    expectPointNear(pts[0], {k, k}, 1e-9);
    expectPointNear(pts[2], {10 - k, 10 - k}, 1e-9);
}

TEST(TransformTest, OffsetOpenPolylineEnds) {
    SequentialIdSource ids;
    const Entity path = createPolyline(ids, {{0, 0}, {10, 0}, {10, 10}});
    const auto out = offsetEntity(path, 1.0);
    ASSERT_TRUE(out.has_value());
    const auto& pts = geomOf<PolylineGeom>(*out).points;
    ASSERT_EQ(pts.size(), 3u);
    // End vertices follow their single edge; the corner takes the averaged normal.
    expectPointNear(pts[0], {0, 1}, 1e-9);
    expectPointNear(pts[2], {9, 10}, 1e-9);
    const double k = 1.0 / std::sqrt(2.0);
    expectPointNear(pts[1], {10 - k, k}, 1e-9);
}

TEST(TransformTest, TrimAtIntersection) {
    SequentialIdSource ids;
    const Entity target = createLine(ids, {0, 0}, {10, 0});
    const Entity cutter = createLine(ids, {4, -5}, {4, 5});

    const auto trimmed = trimLine(target, cutter, {1, 0});
    ASSERT_TRUE(trimmed.has_value());
    EXPECT_EQ(trimmed->id, target.id);
    expectPointNear(geomOf<LineGeom>(*trimmed).start, {0, 0});
    expectPointNear(geomOf<LineGeom>(*trimmed).end, {4, 0});
}

TEST(TransformTest, TrimWithoutIntersectionIsNull) {
    SequentialIdSource ids;
    const Entity target = createLine(ids, {0, 0}, {10, 0});
    const Entity away = createLine(ids, {20, -5}, {20, 5});
    EXPECT_FALSE(trimLine(target, away, {1, 0}).has_value());

    const Entity circle = createCircle(ids, {5, 0}, 2);
    EXPECT_FALSE(trimLine(target, circle, {1, 0}).has_value());
}

TEST(TransformTest, ExtendToBoundary) {
    SequentialIdSource ids;
    const Entity target = createLine(ids, {0, 0}, {10, 0});
    const Entity boundary = createLine(ids, {25, -5}, {25, 5});

    const auto extended = extendLine(target, boundary, {1, 0});
    ASSERT_TRUE(extended.has_value());
    expectPointNear(geomOf<LineGeom>(*extended).start, {0, 0});
    expectPointNear(geomOf<LineGeom>(*extended).end, {25, 0});

    const Entity parallel = createLine(ids, {0, 5}, {10, 5});
    EXPECT_FALSE(extendLine(target, parallel, {1, 0}).has_value());
}

TEST(TransformTest, ExtendReachesDistantBoundary) {
    SequentialIdSource ids;
    const Entity target = createLine(ids, {0, 0}, {10, 0});
    const Entity distant = createLine(ids, {2000, -5}, {2000, 5});

    const auto extended = extendLine(target, distant, {1, 0});
    ASSERT_TRUE(extended.has_value());
    expectPointNear(geomOf<LineGeom>(*extended).end, {2000, 0}, 1e-6);

    // Behind the start point the kept end is the one nearer the pick.
    const Entity behind = createLine(ids, {-5000, -5}, {-5000, 5});
    const auto back = extendLine(target, behind, {9, 0});
    ASSERT_TRUE(back.has_value());
    expectPointNear(geomOf<LineGeom>(*back).start, {10, 0});
    expectPointNear(geomOf<LineGeom>(*back).end, {-5000, 0}, 1e-6);
}

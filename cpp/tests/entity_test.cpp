#include "tests/civcad_test_common.h"
#include "civcad/core/errors.h"
#include "civcad/core/util.h"
#include "civcad/entity/dimension_factory.h"
#include "civcad/entity/entity_bounds.h"
#include "civcad/entity/entity_factory.h"
#include "civcad/entity/hatch_factory.h"
#include "civcad/geometry/geometry.h"

using namespace civcad;
using civcad_test::expectBoxNear;
using civcad_test::expectPointNear;
using civcad_test::geomOf;

TEST(EntityFactoryTest, AssignsFreshIdsAndDefaults) {
    SequentialIdSource ids;
    const Entity a = createLine(ids, {0, 0}, {1, 1});
    const Entity b = createCircle(ids, {0, 0}, 2.0, 5);

    EXPECT_EQ(a.id, 1u);
    EXPECT_EQ(b.id, 2u);
    EXPECT_EQ(a.kind(), EntityKind::Line);
    EXPECT_EQ(b.kind(), EntityKind::Circle);
    EXPECT_EQ(a.layerId, kDefaultLayerId);
    EXPECT_EQ(b.layerId, 5u);
    EXPECT_TRUE(a.visible);
    EXPECT_FALSE(a.locked);
    EXPECT_EQ(a.style.stroke.source, ColorSource::Explicit);
    EXPECT_EQ(a.style.stroke.rgb, 0x000000u);
    ASSERT_TRUE(a.style.strokeWidth.has_value());
    EXPECT_DOUBLE_EQ(*a.style.strokeWidth, 1.0);
    EXPECT_EQ(a.style.lineType, LineType::Continuous);
}

TEST(EntityFactoryTest, ArcAnglesStoredInRadians) {
    SequentialIdSource ids;
    const Entity arc = createArc(ids, {0, 0}, 5.0, 90.0, 180.0);
    const auto& g = geomOf<ArcGeom>(arc);
    EXPECT_NEAR(g.startAngle, kPi / 2.0, 1e-12);
    EXPECT_NEAR(g.endAngle, kPi, 1e-12);

    const Entity ellipse = createEllipse(ids, {0, 0}, 4.0, 2.0, 45.0);
    EXPECT_NEAR(geomOf<EllipseGeom>(ellipse).rotation, kPi / 4.0, 1e-12);
}

TEST(EntityFactoryTest, CollinearThreePointArcBecomesLine) {
    SequentialIdSource ids;
    const Entity e = createArcFrom3Points(ids, {0, 0}, {5, 0}, {10, 0});
    ASSERT_EQ(e.kind(), EntityKind::Line);
    const auto& line = geomOf<LineGeom>(e);
    expectPointNear(line.start, {0, 0});
    expectPointNear(line.end, {10, 0});
}

TEST(EntityFactoryTest, ThreePointArcCircumscribes) {
    SequentialIdSource ids;
    const Entity e = createArcFrom3Points(ids, {10, 0}, {0, 10}, {-10, 0});
    ASSERT_EQ(e.kind(), EntityKind::Arc);
    const auto& arc = geomOf<ArcGeom>(e);
    expectPointNear(arc.center, {0, 0}, 1e-9);
    EXPECT_NEAR(arc.radius, 10.0, 1e-9);
    EXPECT_NEAR(arc.startAngle, 0.0, 1e-12);
    EXPECT_NEAR(arc.endAngle, kPi, 1e-12);
}

TEST(EntityFactoryTest, SplineInterpolation) {
    SplineGeom open;
    open.controlPoints = {{0, 0}, {10, 10}, {20, 0}};
    const auto pts = interpolateSpline(open, 4);
    ASSERT_EQ(pts.size(), 2u * 4u + 1u);
    expectPointNear(pts.front(), {0, 0});
    expectPointNear(pts[4], {10, 10});
    expectPointNear(pts.back(), {20, 0});

    SplineGeom closed = open;
    closed.closed = true;
    EXPECT_EQ(interpolateSpline(closed, 4).size(), 3u * 4u);

    SplineGeom single;
    single.controlPoints = {{1, 1}};
    EXPECT_EQ(interpolateSpline(single).size(), 1u);

    // Expansion never mutates the spline.
    EXPECT_EQ(open.controlPoints.size(), 3u);
}

TEST(EntityBoundsTest, PerKindBounds) {
    SequentialIdSource ids;
    expectBoxNear(computeEntityBounds(createLine(ids, {5, 1}, {-1, 3})), {-1, 1, 5, 3});
    expectBoxNear(computeEntityBounds(createCircle(ids, {1, 1}, 2)), {-1, -1, 3, 3});
    expectBoxNear(computeEntityBounds(createArc(ids, {0, 0}, 2, 0, 90)), {-2, -2, 2, 2});
    expectBoxNear(computeEntityBounds(createRectangle(ids, {1, 2}, 3, 4)), {1, 2, 4, 6});
    expectBoxNear(computeEntityBounds(createPoint(ids, {0, 0}, PointMarker::Cross, 2.0)), {-1, -1, 1, 1});
    expectBoxNear(computeEntityBounds(createEllipse(ids, {0, 0}, 4, 2, 90)), {-2, -4, 2, 4}, 1e-9);
}

TEST(EntityBoundsTest, TextWidthEstimate) {
    TextGeom text;
    text.position = {0, 0};
    text.content = "ABCD";
    text.fontSize = 10.0;
    expectBoxNear(computeTextBounds(text), {0, 0, 24, 10});

    text.content.clear();
    expectBoxNear(computeTextBounds(text), {0, 0, 60, 10});
}

// =============================================================================
// Dimensions
// =============================================================================

TEST(DimensionTest, LinearDimensionOffsetAlongNormal) {
    SequentialIdSource ids;
    const Entity e = createLinearDimension(ids, {0, 0}, {10, 0}, 5.0);
    EXPECT_EQ(e.layerId, kDimensionsLayerId);
    const auto& g = geomOf<DimensionGeom>(e);
    EXPECT_EQ(g.kind, DimensionKind::Linear);
    EXPECT_DOUBLE_EQ(g.measuredValue, 10.0);
    expectPointNear(g.dimLineStart, {0, 5});
    expectPointNear(g.dimLineEnd, {10, 5});
    expectPointNear(g.textPosition, {5, 5});
    EXPECT_EQ(g.displayText, "10.00 m");
}

TEST(DimensionTest, RadialAndAngularText) {
    SequentialIdSource ids;
    const Entity radiusDim = createRadiusDimension(ids, {0, 0}, 5.0);
    const auto& radius = geomOf<DimensionGeom>(radiusDim);
    EXPECT_EQ(radius.displayText, "R5.00 m");
    expectPointNear(radius.textPosition, {3, 0});

    const Entity angularDim = createAngularDimension(ids, {0, 0}, 0.0, kPi / 2.0, 10.0);
    const auto& angular = geomOf<DimensionGeom>(angularDim);
    EXPECT_NEAR(angular.measuredValue, 90.0, 1e-9);
    EXPECT_EQ(angular.displayText, "90.00\xC2\xB0");
    EXPECT_NEAR(distance(angular.textPosition, {0, 0}), 12.0, 1e-9);
}

TEST(DimensionTest, AreaDimensionUsesPolygonArea) {
    SequentialIdSource ids;
    DimensionStyle style;
    style.precision = 1;
    const Entity e = createAreaDimension(ids, {{0, 0}, {4, 0}, {4, 5}, {0, 5}}, style);
    const auto& g = geomOf<DimensionGeom>(e);
    EXPECT_DOUBLE_EQ(g.measuredValue, 20.0);
    expectPointNear(g.textPosition, {2, 2.5});
    EXPECT_EQ(g.displayText, "20.0 m\xC2\xB2");
}

TEST(DimensionTest, Formatting) {
    DimensionStyle style;
    style.showUnits = false;
    style.precision = 3;
    EXPECT_EQ(formatDimension(1.23456, style), "1.235");
    EXPECT_EQ(formatCoordinates({1, -2.5}), "(1.00, -2.50)");
}

TEST(DimensionTest, Measurements) {
    const auto d = measureDistance({0, 0}, {3, 4});
    EXPECT_DOUBLE_EQ(d.distance, 5.0);
    EXPECT_DOUBLE_EQ(d.deltaX, 3.0);

    EXPECT_NEAR(measureAngle({10, 0}, {0, 0}, {0, 10}).degrees, 90.0, 1e-9);
    EXPECT_DOUBLE_EQ(measureRectangle(3, 4).diagonal, 5.0);
    EXPECT_NEAR(measureCircle(1.0).area, kPi, 1e-12);
    EXPECT_NEAR(measureArc(2.0, 0.0, kPi).arcLength, 2.0 * kPi, 1e-12);
}

// =============================================================================
// Hatches
// =============================================================================

TEST(HatchTest, UnknownPatternFallsBackButKeepsName) {
    const HatchPattern& p = resolveHatchPattern("no-such-pattern");
    EXPECT_STREQ(p.id, "diagonal45");
    EXPECT_EQ(findHatchPattern("no-such-pattern"), nullptr);
    EXPECT_EQ(listHatchPatterns().size(), 18u);

    SequentialIdSource ids;
    const Entity h = createHatch(ids, {{0, 0}, {1, 0}, {1, 1}}, "no-such-pattern");
    EXPECT_EQ(geomOf<HatchGeom>(h).patternName, "no-such-pattern");
}

TEST(HatchTest, FromClosedShapes) {
    SequentialIdSource ids;
    const Entity rect = createRectangle(ids, {0, 0}, 10, 5);
    const Entity fromRect = createHatchFromEntity(ids, rect, "concrete");
    const auto& g = geomOf<HatchGeom>(fromRect);
    EXPECT_EQ(g.boundary.size(), 4u);
    ASSERT_TRUE(g.boundaryRef.has_value());
    EXPECT_EQ(*g.boundaryRef, rect.id);

    const Entity circle = createCircle(ids, {0, 0}, 3);
    EXPECT_EQ(geomOf<HatchGeom>(createHatchFromEntity(ids, circle)).boundary.size(), 32u);
}

TEST(HatchTest, OpenShapesAreRejected) {
    SequentialIdSource ids;
    const Entity open = createPolyline(ids, {{0, 0}, {1, 0}, {1, 1}}, false);
    const Entity line = createLine(ids, {0, 0}, {1, 1});
    try {
        createHatchFromEntity(ids, open);
        FAIL() << "expected InvalidHatchSource";
    } catch (const KernelException& ex) {
        EXPECT_EQ(ex.code(), KernelError::InvalidHatchSource);
    }
    EXPECT_THROW(createHatchFromEntity(ids, line), KernelException);
}

TEST(EntityEqualityTest, StructuralEquality) {
    SequentialIdSource ids;
    Entity a = createLine(ids, {0, 0}, {1, 1});
    Entity b = a;
    EXPECT_EQ(a, b);
    b.metadata["source"] = "survey";
    EXPECT_NE(a, b);
    b = a;
    b.style.stroke = StrokeColor::byLayer();
    EXPECT_NE(a, b);

    const EntityList list{a};
    const Entity* found = findEntity(list, a.id);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->id, a.id);
    EXPECT_EQ(findEntity(list, 999), nullptr);
}

// =====================================================================
//  tests/snapengine_test.cpp — Object snapping tests
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "test_common.h"

#include <QJsonArray>
#include <QtMath>

using namespace draftcore;
using namespace draftcore::kernel;
using namespace draftcore::snap;
using namespace draftcore_test;

using SnapEngineTest = SceneTest;

// ---- Discrete snap points --------------------------------------------

TEST_F(SnapEngineTest, NearestEndpointWithinTolerance) {
    add(Segment(QPointF(0, 0), QPointF(10, 0)));
    SnapEngine engine = engineWith({SnapKind::Endpoint});

    auto snap = engine.findSnap(QPointF(0.2, 0.3), scene, 1.0);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->kind, SnapKind::Endpoint);
    EXPECT_POINT_NEAR(snap->position, QPointF(0, 0), kExact);
    EXPECT_EQ(snap->source, &scene.at(0));
}

TEST_F(SnapEngineTest, ToleranceIsExclusive) {
    add(Segment(QPointF(0, 0), QPointF(10, 0)));
    SnapEngine engine = engineWith({SnapKind::Endpoint});

    EXPECT_FALSE(engine.findSnap(QPointF(1, 0), scene, 1.0).has_value());
    EXPECT_TRUE(engine.findSnap(QPointF(0.999, 0), scene, 1.0).has_value());
}

TEST_F(SnapEngineTest, NothingWhenDisabledOrNoKinds) {
    add(Segment(QPointF(0, 0), QPointF(10, 0)));

    SnapEngine engine;
    engine.setEnabled(false);
    EXPECT_FALSE(engine.findSnap(QPointF(0, 0), scene, 5.0).has_value());

    SnapEngine none = engineWith({});
    EXPECT_FALSE(none.findSnap(QPointF(0, 0), scene, 5.0).has_value());
}

TEST_F(SnapEngineTest, OnlyEnabledKindsAreOffered) {
    add(Segment(QPointF(0, 0), QPointF(10, 0)));
    SnapEngine engine = engineWith({SnapKind::Midpoint});

    auto snap = engine.findSnap(QPointF(1, 0), scene, 20.0);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->kind, SnapKind::Midpoint);
    EXPECT_POINT_NEAR(snap->position, QPointF(5, 0), kExact);
}

TEST_F(SnapEngineTest, TiesGoToTheFirstPrimitive) {
    add(Segment(QPointF(0, 0), QPointF(10, 0)));
    add(Segment(QPointF(0, 0), QPointF(0, 10)));
    SnapEngine engine = engineWith({SnapKind::Endpoint});

    auto snap = engine.findSnap(QPointF(0.3, 0.3), scene, 1.0);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->source, &scene.at(0));
}

TEST_F(SnapEngineTest, ExcludedPrimitiveIsSkipped) {
    add(Segment(QPointF(0, 0), QPointF(10, 0)));
    add(Segment(QPointF(0.5, 0), QPointF(0.5, 10)));
    SnapEngine engine = engineWith({SnapKind::Endpoint});

    auto snap = engine.findSnap(QPointF(0.4, 0), scene, 1.0, &scene.at(1));
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->source, &scene.at(0));
    EXPECT_POINT_NEAR(snap->position, QPointF(0, 0), kExact);
}

TEST_F(SnapEngineTest, CenterAndQuadrantOfCircle) {
    add(Circle(QPointF(20, 20), 5.0));
    SnapEngine engine = engineWith({SnapKind::Center, SnapKind::Quadrant});

    auto center = engine.findSnap(QPointF(20.5, 19.5), scene, 2.0);
    ASSERT_TRUE(center.has_value());
    EXPECT_EQ(center->kind, SnapKind::Center);

    auto quadrant = engine.findSnap(QPointF(20.3, 24.6), scene, 2.0);
    ASSERT_TRUE(quadrant.has_value());
    EXPECT_EQ(quadrant->kind, SnapKind::Quadrant);
    EXPECT_POINT_NEAR(quadrant->position, QPointF(20, 25), kExact);
}

// ---- Intersections ---------------------------------------------------

TEST_F(SnapEngineTest, CrossingSegments) {
    add(Segment(QPointF(0, 0), QPointF(10, 10)));
    add(Segment(QPointF(0, 10), QPointF(10, 0)));
    SnapEngine engine = engineWith({SnapKind::Intersection});

    auto snap = engine.findSnap(QPointF(5.3, 5.2), scene, 1.0);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->kind, SnapKind::Intersection);
    EXPECT_POINT_NEAR(snap->position, QPointF(5, 5), kLoose);
    EXPECT_EQ(snap->source, &scene.at(0));
}

TEST_F(SnapEngineTest, EarlierQuadrantWinsTieWithIntersection) {
    add(Segment(QPointF(-10, 0), QPointF(10, 0)));
    add(Circle(QPointF(0, 0), 5.0));
    SnapEngine engine = engineWith({SnapKind::Endpoint, SnapKind::Quadrant,
                                    SnapKind::Intersection});

    // (5,0) is both a quadrant and an intersection; the quadrant comes first
    auto snap = engine.findSnap(QPointF(4.8, 0.3), scene, 1.0);
    ASSERT_TRUE(snap.has_value());
    EXPECT_POINT_NEAR(snap->position, QPointF(5, 0), kLoose);
    EXPECT_EQ(snap->kind, SnapKind::Quadrant);

    engine.setKindActive(SnapKind::Quadrant, false);
    snap = engine.findSnap(QPointF(4.8, 0.3), scene, 1.0);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->kind, SnapKind::Intersection);
}

TEST(SnapIntersections, ArcOnlyWithinSweep) {
    Primitive arc(Arc(QPointF(0, 0), 5.0, 0.0, 180.0));
    Primitive below(Segment(QPointF(-10, -3), QPointF(10, -3)));
    Primitive above(Segment(QPointF(-10, 3), QPointF(10, 3)));

    EXPECT_TRUE(SnapEngine::intersections(arc, below).isEmpty());

    QVector<SnapPoint> points = SnapEngine::intersections(arc, above);
    ASSERT_EQ(points.size(), 2);
    for (const SnapPoint& sp : points) {
        EXPECT_NEAR(qAbs(sp.position.x()), 4.0, kLoose);
        EXPECT_EQ(sp.source, &arc);
    }
}

TEST(SnapIntersections, SegmentAgainstRectangleEdges) {
    Primitive seg(Segment(QPointF(5, -5), QPointF(5, 5)));
    Primitive rect(Rectangle(QPointF(0, 0), QPointF(10, 10)));

    QVector<SnapPoint> points = SnapEngine::intersections(seg, rect);
    ASSERT_EQ(points.size(), 1);
    EXPECT_POINT_NEAR(points[0].position, QPointF(5, 0), kLoose);
}

TEST(SnapIntersections, SegmentAgainstEllipse) {
    Primitive seg(Segment(QPointF(0, -5), QPointF(0, 0)));
    Primitive ellipse(Ellipse(QPointF(0, 0), 4.0, 2.0));

    QVector<SnapPoint> points = SnapEngine::intersections(seg, ellipse);
    ASSERT_EQ(points.size(), 1);
    EXPECT_POINT_NEAR(points[0].position, QPointF(0, -2), kLoose);
}

TEST(SnapIntersections, CoincidentCirclesAndSplinesGiveNothing) {
    Primitive a(Circle(QPointF(0, 0), 5.0));
    Primitive b(Circle(QPointF(0, 0), 5.0));
    EXPECT_TRUE(SnapEngine::intersections(a, b).isEmpty());

    Primitive spline(*Spline::fromPoints({QPointF(-10, 0), QPointF(10, 0)}));
    EXPECT_TRUE(SnapEngine::intersections(a, spline).isEmpty());
}

// ---- Reference-point snaps -------------------------------------------

TEST_F(SnapEngineTest, PerpendicularFootNeedsReference) {
    add(Segment(QPointF(0, 0), QPointF(10, 0)));
    SnapEngine engine = engineWith({SnapKind::Perpendicular});

    EXPECT_FALSE(engine.findSnap(QPointF(3.1, 0.2), scene, 1.0).has_value());

    auto snap = engine.findSnap(QPointF(3.1, 0.2), scene, 1.0, nullptr, QPointF(3, 5));
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->kind, SnapKind::Perpendicular);
    EXPECT_POINT_NEAR(snap->position, QPointF(3, 0), kExact);
}

TEST(SnapPerpendicular, RectangleUsesEdgeContainingFoot) {
    Primitive rect(Rectangle(QPointF(0, 0), QPointF(10, 4)));
    auto sp = SnapEngine::perpendicular(QPointF(3, -6), rect);
    ASSERT_TRUE(sp.has_value());
    EXPECT_POINT_NEAR(sp->position, QPointF(3, 0), kExact);

    // No edge contains a foot from this diagonal position
    EXPECT_FALSE(SnapEngine::perpendicular(QPointF(20, 20), rect).has_value());
}

TEST(SnapPerpendicular, CircleGivesNearestPoint) {
    Primitive circle(Circle(QPointF(0, 0), 5.0));
    auto sp = SnapEngine::perpendicular(QPointF(0, 12), circle);
    ASSERT_TRUE(sp.has_value());
    EXPECT_POINT_NEAR(sp->position, QPointF(0, 5), kExact);
}

TEST_F(SnapEngineTest, TangentFromReference) {
    add(Circle(QPointF(0, 0), 5.0));
    SnapEngine engine = engineWith({SnapKind::Tangent});

    auto snap = engine.findSnap(QPointF(2.6, 4.2), scene, 1.0, nullptr, QPointF(10, 0));
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->kind, SnapKind::Tangent);
    EXPECT_POINT_NEAR(snap->position, QPointF(2.5, 5.0 * qSin(M_PI / 3.0)), kLoose);
}

TEST(SnapTangents, ArcKeepsOnlyPointsInSweep) {
    Primitive arc(Arc(QPointF(0, 0), 5.0, 0.0, 180.0));
    QVector<SnapPoint> points = SnapEngine::tangents(QPointF(10, 0), arc);
    ASSERT_EQ(points.size(), 1);
    EXPECT_GT(points[0].position.y(), 0.0);

    Primitive seg(Segment(QPointF(0, 0), QPointF(1, 0)));
    EXPECT_TRUE(SnapEngine::tangents(QPointF(10, 0), seg).isEmpty());
}

// ---- Grid ------------------------------------------------------------

TEST_F(SnapEngineTest, GridNodeWhenNothingElse) {
    SnapEngine engine = engineWith({SnapKind::Grid});

    auto snap = engine.findSnap(QPointF(12.4, 18.9), scene, 3.0);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->kind, SnapKind::Grid);
    EXPECT_POINT_NEAR(snap->position, QPointF(10, 20), kExact);
    EXPECT_EQ(snap->source, nullptr);

    EXPECT_FALSE(engine.findSnap(QPointF(15, 15), scene, 3.0).has_value());
}

TEST_F(SnapEngineTest, GridIsOnlyAFallback) {
    add(Segment(QPointF(13.5, 19), QPointF(30, 19)));
    SnapEngine engine = engineWith({SnapKind::Grid, SnapKind::Endpoint});

    auto snap = engine.findSnap(QPointF(11, 19), scene, 3.0);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->kind, SnapKind::Endpoint);
}

// ---- Screen space and settings ---------------------------------------

TEST_F(SnapEngineTest, ScreenToleranceScalesWithZoom) {
    add(Segment(QPointF(0, 0), QPointF(10, 0)));
    SnapEngine engine = engineWith({SnapKind::Endpoint});

    view::ViewTransform view(QSizeF(800, 600));
    view.setZoom(2.0);
    QPointF cursor = view.fromScene(QPointF(3, 0.5));

    // 15 px at zoom 2 is 7.5 scene units
    auto snap = engine.findSnapAtScreen(cursor, scene, view);
    ASSERT_TRUE(snap.has_value());
    EXPECT_POINT_NEAR(snap->position, QPointF(0, 0), kExact);

    // 15 px at zoom 10 is 1.5 scene units
    view.setZoom(10.0);
    cursor = view.fromScene(QPointF(3, 0.5));
    EXPECT_FALSE(engine.findSnapAtScreen(cursor, scene, view).has_value());
}

TEST(SnapSettingsTest, DefaultsAndToggles) {
    SnapEngine engine;
    EXPECT_TRUE(engine.isEnabled());
    EXPECT_DOUBLE_EQ(engine.settings().snapRadius, 15.0);
    EXPECT_TRUE(engine.isKindActive(SnapKind::Endpoint));
    EXPECT_FALSE(engine.isKindActive(SnapKind::Grid));

    engine.toggleKind(SnapKind::Grid);
    EXPECT_TRUE(engine.isKindActive(SnapKind::Grid));
    engine.toggleKind(SnapKind::Endpoint);
    EXPECT_FALSE(engine.isKindActive(SnapKind::Endpoint));
}

TEST(SnapSettingsTest, JsonRoundTrip) {
    SnapSettings settings;
    settings.enabled = false;
    settings.snapRadius = 8.0;
    settings.activeKinds = {SnapKind::Node, SnapKind::Grid};
    settings.gridSpacing = 2.5;

    QJsonObject json = settings.toJson();
    EXPECT_EQ(json.value(QStringLiteral("active_snaps")).toArray().size(), 2);

    SnapSettings restored = SnapSettings::fromJson(json);
    EXPECT_FALSE(restored.enabled);
    EXPECT_DOUBLE_EQ(restored.snapRadius, 8.0);
    EXPECT_DOUBLE_EQ(restored.gridSpacing, 2.5);
    EXPECT_TRUE(restored.activeKinds == settings.activeKinds);
}

TEST(SnapSettingsTest, UnknownKindsAreIgnored) {
    QJsonObject json;
    json[QStringLiteral("active_snaps")] = QJsonArray{
        QStringLiteral("ENDPOINT"), QStringLiteral("wormhole"), QStringLiteral("midpoint")
    };

    SnapSettings settings = SnapSettings::fromJson(json);
    EXPECT_EQ(settings.activeKinds.size(), 2);
    EXPECT_TRUE(settings.activeKinds.contains(SnapKind::Endpoint));
    EXPECT_TRUE(settings.activeKinds.contains(SnapKind::Midpoint));
    EXPECT_TRUE(settings.enabled);
    EXPECT_DOUBLE_EQ(settings.snapRadius, 15.0);
}

TEST(SnapSettingsTest, NegativeRadiusAndGridAreCoerced) {
    QJsonObject json;
    json[QStringLiteral("snap_radius")] = -12.0;
    json[QStringLiteral("grid_spacing")] = -5.0;

    SnapSettings settings = SnapSettings::fromJson(json);
    EXPECT_DOUBLE_EQ(settings.snapRadius, 12.0);
    EXPECT_DOUBLE_EQ(settings.gridSpacing, 5.0);
}

// =====================================================================
//  tests/geometry_test.cpp — Geometry helper tests
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "test_common.h"

#include <draftcore/core.h>
#include <draftcore/geometry/intersections.h>
#include <draftcore/geometry/utils.h>

#include <QLineF>

using namespace draftcore;
using namespace draftcore::geometry;
using namespace draftcore_test;

TEST(Version, IsNotEmpty) {
    ASSERT_NE(draftcore::version(), nullptr);
    EXPECT_STRNE(draftcore::version(), "");
}

// ---- Circumcircle ----------------------------------------------------

TEST(Circumcircle, RightTriangle) {
    auto circle = circumcircle(QPointF(0, 0), QPointF(4, 0), QPointF(0, 3));
    ASSERT_TRUE(circle.has_value());
    EXPECT_POINT_NEAR(circle->center, QPointF(2.0, 1.5), kExact);
    EXPECT_NEAR(circle->radius, 2.5, kExact);
}

TEST(Circumcircle, EveryInputPointLiesOnTheCircle) {
    const QVector<QVector<QPointF>> triples = {
        {QPointF(0, 0), QPointF(4, 0), QPointF(0, 3)},
        {QPointF(-7.5, 2.25), QPointF(13, 8), QPointF(1, -20)},
        {QPointF(100, 100), QPointF(101, 100), QPointF(100, 101.5)},
        {QPointF(0.001, 0), QPointF(0, 0.002), QPointF(-0.003, 0)},
    };

    for (const QVector<QPointF>& t : triples) {
        auto circle = circumcircle(t[0], t[1], t[2]);
        ASSERT_TRUE(circle.has_value());
        for (const QPointF& p : t) {
            EXPECT_NEAR(distance(circle->center, p), circle->radius, kExact);
        }
    }
}

TEST(Circumcircle, CollinearPointsHaveNone) {
    EXPECT_FALSE(circumcircle(QPointF(0, 0), QPointF(1, 1), QPointF(2, 2)).has_value());
    EXPECT_FALSE(circumcircle(QPointF(0, 0), QPointF(0, 0), QPointF(5, 1)).has_value());
}

// ---- Arcs ------------------------------------------------------------

TEST(ArcFromThreePoints, CounterClockwiseUpperHalf) {
    auto arc = arcFromThreePoints(QPointF(10, 0), QPointF(0, 10), QPointF(-10, 0));
    ASSERT_TRUE(arc.has_value());
    EXPECT_POINT_NEAR(arc->center, QPointF(0, 0), kExact);
    EXPECT_NEAR(arc->radius, 10.0, kExact);
    EXPECT_NEAR(arc->startAngle, 0.0, kExact);
    EXPECT_NEAR(arc->sweepAngle, 180.0, kExact);
}

TEST(ArcFromThreePoints, ClockwiseLowerHalf) {
    auto arc = arcFromThreePoints(QPointF(10, 0), QPointF(0, -10), QPointF(-10, 0));
    ASSERT_TRUE(arc.has_value());
    EXPECT_NEAR(arc->sweepAngle, -180.0, kExact);
    EXPECT_POINT_NEAR(arc->pointAt(0.5), QPointF(0, -10), kExact);
}

TEST(CircularArc, ContainsAngleHonoursDirection) {
    CircularArc ccw{QPointF(0, 0), 1.0, 350.0, 20.0};
    EXPECT_TRUE(ccw.containsAngle(0.0));
    EXPECT_TRUE(ccw.containsAngle(-5.0));
    EXPECT_FALSE(ccw.containsAngle(180.0));

    CircularArc cw{QPointF(0, 0), 1.0, 10.0, -20.0};
    EXPECT_TRUE(cw.containsAngle(0.0));
    EXPECT_TRUE(cw.containsAngle(355.0));
    EXPECT_FALSE(cw.containsAngle(20.0));

    CircularArc full{QPointF(0, 0), 1.0, 0.0, 360.0};
    EXPECT_TRUE(full.containsAngle(123.0));
}

// ---- Angles and vectors ----------------------------------------------

TEST(Angles, Normalization) {
    EXPECT_DOUBLE_EQ(normalizeAngle(-90.0), 270.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(720.0), 0.0);
    EXPECT_DOUBLE_EQ(normalizeAngle(45.0), 45.0);

    EXPECT_DOUBLE_EQ(normalizeAngleSigned(270.0), -90.0);
    EXPECT_DOUBLE_EQ(normalizeAngleSigned(180.0), 180.0);
    EXPECT_DOUBLE_EQ(normalizeAngleSigned(-180.0), 180.0);
}

TEST(Vectors, RotateAboutPoint) {
    EXPECT_POINT_NEAR(rotatePointAround(QPointF(2, 1), QPointF(1, 1), 90.0),
                      QPointF(1, 2), kExact);
    EXPECT_POINT_NEAR(normalize(QPointF(0, 0)), QPointF(0, 0), kExact);
    EXPECT_NEAR(vectorAngle(QPointF(0, -1)), -90.0, kExact);
}

TEST(BoundingBoxTest, IncludeAndQueries) {
    BoundingBox box;
    EXPECT_FALSE(box.valid);

    box.include(QPointF(1, 2));
    box.include(QPointF(-3, 5));
    EXPECT_TRUE(box.valid);
    EXPECT_DOUBLE_EQ(box.width(), 4.0);
    EXPECT_DOUBLE_EQ(box.height(), 3.0);
    EXPECT_POINT_NEAR(box.center(), QPointF(-1, 3.5), kExact);
    EXPECT_TRUE(box.contains(QPointF(1, 5)));
    EXPECT_FALSE(box.contains(QPointF(1.1, 5)));

    BoundingBox other(0, 0, 10, 10);
    EXPECT_TRUE(box.intersects(other));
    EXPECT_FALSE(box.intersects(BoundingBox(20, 20, 30, 30)));

    BoundingBox grown = box.adjusted(1.0);
    EXPECT_DOUBLE_EQ(grown.width(), 6.0);
}

// ---- Intersections ---------------------------------------------------

TEST(Intersections, CrossingSegments) {
    auto hit = lineLineIntersection(QPointF(0, 0), QPointF(10, 10),
                                    QPointF(0, 10), QPointF(10, 0));
    ASSERT_TRUE(hit.intersects);
    EXPECT_TRUE(hit.withinSegment1);
    EXPECT_TRUE(hit.withinSegment2);
    EXPECT_POINT_NEAR(hit.point, QPointF(5, 5), kExact);
}

TEST(Intersections, ParallelSegments) {
    auto hit = lineLineIntersection(QPointF(0, 0), QPointF(10, 0),
                                    QPointF(0, 1), QPointF(10, 1));
    EXPECT_FALSE(hit.intersects);
    EXPECT_TRUE(hit.parallel);
}

TEST(Intersections, SegmentThroughCircle) {
    auto hit = lineCircleIntersection(QPointF(-10, 0), QPointF(10, 0), QPointF(0, 0), 5.0);
    ASSERT_EQ(hit.count, 2);
    EXPECT_TRUE(hit.point1InSegment);
    EXPECT_TRUE(hit.point2InSegment);
    EXPECT_NEAR(qAbs(hit.point1.x()), 5.0, kExact);
    EXPECT_NEAR(qAbs(hit.point2.x()), 5.0, kExact);
    EXPECT_NEAR(hit.point1.x() + hit.point2.x(), 0.0, kExact);
}

TEST(Intersections, SegmentStoppingShortOfEllipse) {
    auto hit = lineEllipseIntersection(QPointF(-2, 0), QPointF(2, 0), QPointF(0, 0), 4.0, 2.0);
    ASSERT_EQ(hit.count, 2);
    EXPECT_FALSE(hit.point1InSegment);
    EXPECT_FALSE(hit.point2InSegment);
}

TEST(Intersections, SegmentThroughEllipse) {
    auto hit = lineEllipseIntersection(QPointF(0, -5), QPointF(0, 5), QPointF(0, 0), 4.0, 2.0);
    ASSERT_EQ(hit.count, 2);
    EXPECT_TRUE(hit.point1InSegment);
    EXPECT_TRUE(hit.point2InSegment);
    EXPECT_NEAR(qAbs(hit.point1.y()), 2.0, kLoose);
    EXPECT_NEAR(qAbs(hit.point2.y()), 2.0, kLoose);
}

TEST(Intersections, TwoCircles) {
    auto hit = circleCircleIntersection(QPointF(0, 0), 5.0, QPointF(8, 0), 5.0);
    ASSERT_EQ(hit.count, 2);
    EXPECT_NEAR(hit.point1.x(), 4.0, kExact);
    EXPECT_NEAR(hit.point2.x(), 4.0, kExact);
    EXPECT_NEAR(qAbs(hit.point1.y()), 3.0, kExact);

    auto tangent = circleCircleIntersection(QPointF(0, 0), 5.0, QPointF(10, 0), 5.0);
    ASSERT_EQ(tangent.count, 1);
    EXPECT_POINT_NEAR(tangent.point1, QPointF(5, 0), kLoose);

    auto same = circleCircleIntersection(QPointF(1, 1), 2.0, QPointF(1, 1), 2.0);
    EXPECT_TRUE(same.coincident);
    EXPECT_EQ(same.count, 0);
}

TEST(Intersections, TangentPointsFromExternalPoint) {
    QVector<QPointF> points = circleTangentPoints(QPointF(10, 0), QPointF(0, 0), 5.0);
    ASSERT_EQ(points.size(), 2);
    for (const QPointF& p : points) {
        EXPECT_NEAR(length(p), 5.0, kExact);
        // Radius is perpendicular to the tangent line
        EXPECT_NEAR(dot(p, QPointF(10, 0) - p), 0.0, kLoose);
        EXPECT_NEAR(p.x(), 2.5, kExact);
    }

    EXPECT_TRUE(circleTangentPoints(QPointF(1, 0), QPointF(0, 0), 5.0).isEmpty());
}

// ---- Distances -------------------------------------------------------

TEST(Distances, SegmentClampsToEnds) {
    EXPECT_NEAR(pointToLineDistance(QPointF(5, 3), QPointF(0, 0), QPointF(10, 0)), 3.0, kExact);
    EXPECT_NEAR(pointToLineDistance(QPointF(13, 4), QPointF(0, 0), QPointF(10, 0)), 5.0, kExact);
    // Zero-length segment degrades to point distance
    EXPECT_NEAR(pointToLineDistance(QPointF(3, 4), QPointF(0, 0), QPointF(0, 0)), 5.0, kExact);
}

TEST(Distances, ArcOutsideSweepUsesEndpoints) {
    CircularArc arc{QPointF(0, 0), 10.0, 0.0, 90.0};
    EXPECT_NEAR(pointToArcDistance(QPointF(7.0710678, 7.0710678), arc), 0.0, kLoose);
    EXPECT_NEAR(pointToArcDistance(QPointF(0, -10), arc), QLineF(0, -10, 10, 0).length(), kExact);
}

TEST(Distances, EllipseOutsideInsideAndOn) {
    const QPointF c(1, 1);
    EXPECT_NEAR(pointToEllipseDistance(QPointF(1, 6), c, 4.0, 2.0), 3.0, kLoose);
    EXPECT_NEAR(pointToEllipseDistance(QPointF(7, 1), c, 4.0, 2.0), 2.0, kLoose);
    EXPECT_NEAR(pointToEllipseDistance(c, c, 4.0, 2.0), 2.0, kLoose);
    EXPECT_NEAR(pointToEllipseDistance(QPointF(5, 1), c, 4.0, 2.0), 0.0, kExact);
}

TEST(Distances, EllipseClosestPointIsNormalToTheCurve) {
    const double rx = 5.0;
    const double ry = 3.0;
    const QVector<QPointF> queries = {
        QPointF(9, 7), QPointF(-2, 0.5), QPointF(0.3, -8), QPointF(-40, 25)
    };

    for (const QPointF& q : queries) {
        QPointF p = closestPointOnEllipse(q, QPointF(0, 0), rx, ry);
        EXPECT_NEAR((p.x() * p.x()) / (rx * rx) + (p.y() * p.y()) / (ry * ry), 1.0, kLoose);

        // (q - p) is parallel to the gradient at p
        QPointF normal(p.x() / (rx * rx), p.y() / (ry * ry));
        EXPECT_NEAR(cross(normalize(q - p), normalize(normal)), 0.0, 1e-5);
    }
}

TEST(Distances, DegenerateEllipseActsLikeSegment) {
    EXPECT_NEAR(pointToEllipseDistance(QPointF(2, 3), QPointF(0, 0), 4.0, 0.0), 3.0, kExact);
}

TEST(Distances, ClosedPolylineIncludesClosingEdge) {
    QVector<QPointF> square = {QPointF(0, 0), QPointF(10, 0), QPointF(10, 10), QPointF(0, 10)};
    EXPECT_NEAR(pointToPolylineDistance(QPointF(-1, 5), square, false), QLineF(-1, 5, 0, 10).length(), kExact);
    EXPECT_NEAR(pointToPolylineDistance(QPointF(-1, 5), square, true), 1.0, kExact);
}

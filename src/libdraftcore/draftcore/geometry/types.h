// =====================================================================
//  src/libdraftcore/draftcore/geometry/types.h — Basic geometry types
// =====================================================================
//
//  Plain value types shared by the geometry helpers, the primitive
//  kernel and the snap code.  Positions are always QPointF.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_GEOMETRY_TYPES_H
#define DRAFTCORE_GEOMETRY_TYPES_H

#include "../core.h"

#include <QPointF>
#include <QVector>
#include <QtMath>

namespace draftcore {
namespace geometry {

// ---- Tolerances -----------------------------------------------------

/// Scene-unit epsilon shared by the intersection and projection code.
constexpr double DEFAULT_TOLERANCE = 1e-6;

/// Three points whose signed area falls under this are treated as
/// lying on one line.
constexpr double COLLINEAR_TOLERANCE = 1e-10;

// ---- Intersection records -------------------------------------------
//
//  The solvers treat their inputs as infinite lines / full circles.
//  Segment and sweep membership is reported separately so callers can
//  decide for themselves whether an off-segment hit is useful.

struct LineLineIntersection {
    bool intersects = false;
    bool parallel = false;        // also set for coincident lines
    QPointF point;
    double t1 = 0.0;              // p1 + t1 * (p2 - p1)
    double t2 = 0.0;              // p3 + t2 * (p4 - p3)
    bool withinSegment1 = false;  // t1 in [0, 1]
    bool withinSegment2 = false;  // t2 in [0, 1]
};

struct LineCircleIntersection {
    int count = 0;                // 0, 1 (tangent) or 2
    QPointF point1;
    QPointF point2;
    bool point1InSegment = false;
    bool point2InSegment = false;
};

struct CircleCircleIntersection {
    int count = 0;
    bool coincident = false;      // same center and radius, count stays 0
    QPointF point1;
    QPointF point2;
};

// ---- Round shapes ---------------------------------------------------

struct Circumcircle {
    QPointF center;
    double radius = 0.0;
};

/// Center/radius arc in degrees.  A negative sweep runs clockwise;
/// |sweep| >= 360 is the whole circle.
struct CircularArc {
    QPointF center;
    double radius = 0.0;
    double startAngle = 0.0;
    double sweepAngle = 360.0;

    bool containsAngle(double angle) const;

    QPointF startPoint() const;
    QPointF endPoint() const;

    /// t runs from 0 at the start to 1 at the end of the sweep.
    QPointF pointAt(double t) const;
};

// ---- Extents --------------------------------------------------------

/// Axis-aligned extent.  A default-constructed box is empty
/// (valid == false) and absorbs the first point or box it is given.
struct BoundingBox {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;
    bool valid = false;

    BoundingBox() = default;
    BoundingBox(double x1, double y1, double x2, double y2);
    explicit BoundingBox(const QPointF& point);

    void include(const QPointF& point);
    void include(const BoundingBox& other);

    QPointF center() const;
    double width() const { return maxX - minX; }
    double height() const { return maxY - minY; }

    // Edges count as inside for both queries; an empty box never matches.
    bool contains(const QPointF& point) const;
    bool intersects(const BoundingBox& other) const;

    BoundingBox adjusted(double margin) const;
};

}  // namespace geometry
}  // namespace draftcore

#endif  // DRAFTCORE_GEOMETRY_TYPES_H

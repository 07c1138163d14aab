// =====================================================================
//  src/libdraftcore/draftcore/geometry/utils.h — Vector, angle and curve helpers
// =====================================================================
//
//  Small free functions the primitives are built from: QPointF vector
//  math, polar helpers, three-point circles and Hermite evaluation.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_GEOMETRY_UTILS_H
#define DRAFTCORE_GEOMETRY_UTILS_H

#include "types.h"

#include <optional>

namespace draftcore {
namespace geometry {

// ---- Vectors --------------------------------------------------------
//
//  QPointF doubles as a 2D vector throughout the library.

/// a.x * b.x + a.y * b.y
DRAFTCORE_EXPORT double dot(const QPointF& a, const QPointF& b);

/// z of the 3D cross product; positive when b is CCW of a.
DRAFTCORE_EXPORT double cross(const QPointF& a, const QPointF& b);

/// Euclidean norm of v
DRAFTCORE_EXPORT double length(const QPointF& v);

/// dot(v, v), for comparisons that can skip the square root
DRAFTCORE_EXPORT double lengthSquared(const QPointF& v);

/// length(b - a)
DRAFTCORE_EXPORT double distance(const QPointF& a, const QPointF& b);

/// Unit vector along v, or (0, 0) for a near-zero v.
DRAFTCORE_EXPORT QPointF normalize(const QPointF& v);

/// v turned a quarter turn CCW.
DRAFTCORE_EXPORT QPointF perpendicular(const QPointF& v);

/// a at t = 0, b at t = 1; t is not clamped.
DRAFTCORE_EXPORT QPointF lerp(const QPointF& a, const QPointF& b, double t);

// ---- Angles ---------------------------------------------------------
//
//  All angles are degrees, CCW from +x.

/// Result is in [-180, 180].
DRAFTCORE_EXPORT double vectorAngle(const QPointF& v);

/// center + radius * (cos, sin) of angleDegrees
DRAFTCORE_EXPORT QPointF polarPoint(const QPointF& center, double radius,
                                    double angleDegrees);

/// point turned CCW about center by angleDegrees
DRAFTCORE_EXPORT QPointF rotatePointAround(
    const QPointF& point,
    const QPointF& center,
    double angleDegrees);

// ---- Circles through points -----------------------------------------

/// nullopt when the three points are collinear within
/// COLLINEAR_TOLERANCE.
DRAFTCORE_EXPORT std::optional<Circumcircle> circumcircle(
    const QPointF& p1, const QPointF& p2, const QPointF& p3);

/// Arc from start, a point on the arc, and end.
///
/// The sweep is positive (CCW) when the counter-clockwise angular
/// distance from start to the on-arc point does not exceed the one from
/// start to end; otherwise the arc runs clockwise.  The returned start
/// angle lies in [0, 360).  Returns nullopt for collinear points.
DRAFTCORE_EXPORT std::optional<CircularArc> arcFromThreePoints(
    const QPointF& start, const QPointF& onArc, const QPointF& end);

/// segments + 1 evenly spaced points, start and end included.
DRAFTCORE_EXPORT QVector<QPointF> sampleArc(const CircularArc& arc, int segments);

// ---- Curves and polylines -------------------------------------------

/// Cubic Hermite blend of end points p0, p1 with tangents m0, m1.
DRAFTCORE_EXPORT QPointF hermitePoint(
    const QPointF& p0, const QPointF& p1,
    const QPointF& m0, const QPointF& m1,
    double t);

/// Sum of the edge lengths; an open polyline.
DRAFTCORE_EXPORT double polylineLength(const QVector<QPointF>& points);

/// Empty (invalid) box for an empty list.
DRAFTCORE_EXPORT BoundingBox pointsBounds(const QVector<QPointF>& points);

}  // namespace geometry
}  // namespace draftcore

#endif  // DRAFTCORE_GEOMETRY_UTILS_H

// =====================================================================
//  src/libdraftcore/draftcore/geometry/intersections.h — Intersections, projections, distances
// =====================================================================
//
//  Intersections between lines, circles, arcs and axis-aligned
//  ellipses, closest-point queries, and point-to-boundary distances.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_GEOMETRY_INTERSECTIONS_H
#define DRAFTCORE_GEOMETRY_INTERSECTIONS_H

#include "types.h"

namespace draftcore {
namespace geometry {

// ---- Intersections --------------------------------------------------

/// Infinite lines through (p1, p2) and (p3, p4).  The result carries
/// the parameter on each line so segment membership can be read off.
DRAFTCORE_EXPORT LineLineIntersection lineLineIntersection(
    const QPointF& p1, const QPointF& p2,
    const QPointF& p3, const QPointF& p4);

/// Line through the two points against a full circle.  point1 is the
/// hit nearer lineStart along the line direction.
DRAFTCORE_EXPORT LineCircleIntersection lineCircleIntersection(
    const QPointF& lineStart, const QPointF& lineEnd,
    const QPointF& center, double radius);

/// As lineCircleIntersection, for an axis-aligned ellipse.
DRAFTCORE_EXPORT LineCircleIntersection lineEllipseIntersection(
    const QPointF& lineStart, const QPointF& lineEnd,
    const QPointF& center, double radiusX, double radiusY);

DRAFTCORE_EXPORT CircleCircleIntersection circleCircleIntersection(
    const QPointF& center1, double radius1,
    const QPointF& center2, double radius2);

/// Touch points of the two tangent lines from an outside point.
/// Empty for a point inside the circle.
DRAFTCORE_EXPORT QVector<QPointF> circleTangentPoints(
    const QPointF& from,
    const QPointF& center, double radius);

// ---- Nearest points -------------------------------------------------

/// Clamped to the segment; a zero-length segment yields lineStart.
DRAFTCORE_EXPORT QPointF closestPointOnLine(
    const QPointF& point,
    const QPointF& lineStart, const QPointF& lineEnd);

/// Unclamped foot of the perpendicular.
DRAFTCORE_EXPORT QPointF projectOntoInfiniteLine(
    const QPointF& point,
    const QPointF& linePoint1, const QPointF& linePoint2);

DRAFTCORE_EXPORT QPointF closestPointOnCircle(
    const QPointF& point,
    const QPointF& center, double radius);

/// Radial projection inside the sweep, else the nearer end point.
DRAFTCORE_EXPORT QPointF closestPointOnArc(
    const QPointF& point,
    const CircularArc& arc);

/// Boundary point of an axis-aligned ellipse nearest to point.
///
/// Solved by bisection on the root of the distance equation
/// (D. Eberly, "Distance from a Point to an Ellipse"), so it always
/// converges.  A zero radius collapses the ellipse to a segment or to
/// its center.
DRAFTCORE_EXPORT QPointF closestPointOnEllipse(
    const QPointF& point,
    const QPointF& center, double radiusX, double radiusY);

// ---- Distances ------------------------------------------------------

DRAFTCORE_EXPORT double pointToLineDistance(
    const QPointF& point,
    const QPointF& lineStart, const QPointF& lineEnd);

/// Distance to the circumference, not to the disc.
DRAFTCORE_EXPORT double pointToCircleDistance(
    const QPointF& point,
    const QPointF& center, double radius);

DRAFTCORE_EXPORT double pointToArcDistance(
    const QPointF& point,
    const CircularArc& arc);

DRAFTCORE_EXPORT double pointToEllipseDistance(
    const QPointF& point,
    const QPointF& center, double radiusX, double radiusY);

/// closed adds the edge from the last vertex back to the first.
DRAFTCORE_EXPORT double pointToPolylineDistance(
    const QPointF& point,
    const QVector<QPointF>& polyline,
    bool closed = false);

// ---- Angles ---------------------------------------------------------

/// Wrap to [0, 360).
DRAFTCORE_EXPORT double normalizeAngle(double degrees);

/// Wrap to (-180, 180].
DRAFTCORE_EXPORT double normalizeAngleSigned(double degrees);

}  // namespace geometry
}  // namespace draftcore

#endif  // DRAFTCORE_GEOMETRY_INTERSECTIONS_H

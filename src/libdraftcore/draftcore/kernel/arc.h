// =====================================================================
//  src/libdraftcore/draftcore/kernel/arc.h — Circular arc primitive
// =====================================================================
//
//  Angles are in degrees.  The span is signed: positive runs
//  counter-clockwise from the start angle, negative runs clockwise, and
//  its magnitude never exceeds 360.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_KERNEL_ARC_H
#define DRAFTCORE_KERNEL_ARC_H

#include "primitivetypes.h"
#include "../geometry/types.h"

#include <optional>

namespace draftcore {
namespace kernel {

/// Circular arc given by center, radius, start angle and signed span.
///
/// Control points: 0 = center, 1 = start point, 2 = end point,
/// 3 = radius handle at the arc midpoint.  Dragging the start or end
/// keeps the arc's direction and the opposite end fixed.
class DRAFTCORE_EXPORT Arc {
public:
    /// Direct construction.  A negative radius is made positive and a
    /// span outside [-360, 360] is clamped, both with a warning.
    Arc(const QPointF& center, double radius, double startAngle, double spanAngle);

    /// Arc from two angles.
    ///
    /// With shortestPath = false the arc runs counter-clockwise and its
    /// span is (end - start) normalized into [0, 360), where 0 becomes a
    /// full circle.  With shortestPath = true the span is normalized into
    /// (-180, 180] and 0 stays 0.
    static Arc fromCenterAndAngles(const QPointF& center, double radius,
                                   double startAngle, double endAngle,
                                   bool shortestPath = false);

    /// Arc from its start point, any point on it, and its end point.
    /// Returns nullopt when the three points are collinear.
    static std::optional<Arc> fromThreePoints(
        const QPointF& start, const QPointF& onArc, const QPointF& end);

    QPointF center() const { return m_center; }
    double radius() const { return m_radius; }
    double startAngle() const { return m_startAngle; }
    double spanAngle() const { return m_spanAngle; }
    double endAngle() const { return m_startAngle + m_spanAngle; }

    QPointF startPoint() const;
    QPointF endPoint() const;
    QPointF midPoint() const;
    double arcLength() const;

    /// Check if an angle (in degrees) lies within the sweep
    bool containsAngle(double angleDegrees) const;

    /// Point on the supporting circle at angle (degrees)
    QPointF pointAtAngle(double angleDegrees) const;

    /// Tessellate into segments + 1 points from start to end
    QVector<QPointF> curvePoints(int segments) const;

    QVector<SnapPoint> snapPoints() const;
    QVector<ControlPoint> controlPoints() const;
    bool moveControlPoint(int index, const QPointF& position);

    /// Box over both endpoints and every quadrant point inside the sweep
    geometry::BoundingBox boundingBox() const;

    double distanceTo(const QPointF& point) const;

    QVector<QPointF> toPolyline(int segments) const { return curvePoints(segments); }

    /// Geometry view for the intersection helpers
    geometry::CircularArc toCircularArc() const;

    bool operator==(const Arc& other) const;
    bool operator!=(const Arc& other) const { return !(*this == other); }

private:
    QPointF m_center;
    double m_radius = 0.0;
    double m_startAngle = 0.0;
    double m_spanAngle = 0.0;
};

}  // namespace kernel
}  // namespace draftcore

#endif  // DRAFTCORE_KERNEL_ARC_H

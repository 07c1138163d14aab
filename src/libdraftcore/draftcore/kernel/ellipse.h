// =====================================================================
//  src/libdraftcore/draftcore/kernel/ellipse.h — Axis-aligned ellipse primitive
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_KERNEL_ELLIPSE_H
#define DRAFTCORE_KERNEL_ELLIPSE_H

#include "primitivetypes.h"
#include "../geometry/types.h"

namespace draftcore {
namespace kernel {

/// Ellipse with axes parallel to the coordinate axes.
///
/// Negative radii are made positive (with a warning).  Zero radii are
/// accepted; such an ellipse behaves like a segment or a point.
///
/// Control points: 0 = center, 1 = X axis end, 2 = Y axis end.
class DRAFTCORE_EXPORT Ellipse {
public:
    Ellipse(const QPointF& center, double radiusX, double radiusY);

    /// Radii from the horizontal offset of axisPointX and the vertical
    /// offset of axisPointY
    static Ellipse fromCenterAndAxisPoints(const QPointF& center,
                                           const QPointF& axisPointX,
                                           const QPointF& axisPointY);

    /// Ellipse inscribed in the rectangle with corners p1 and p2
    static Ellipse fromBoundingRectangle(const QPointF& p1, const QPointF& p2);

    QPointF center() const { return m_center; }
    double radiusX() const { return m_radiusX; }
    double radiusY() const { return m_radiusY; }

    double majorRadius() const { return qMax(m_radiusX, m_radiusY); }
    double minorRadius() const { return qMin(m_radiusX, m_radiusY); }
    double eccentricity() const;
    double area() const;

    /// Perimeter (Ramanujan's second approximation)
    double circumference() const;

    /// Point at parametric angle (degrees)
    QPointF pointAtAngle(double angleDegrees) const;

    /// Closest point on the boundary
    QPointF closestPoint(const QPointF& point) const;

    QVector<SnapPoint> snapPoints() const;
    QVector<ControlPoint> controlPoints() const;
    bool moveControlPoint(int index, const QPointF& position);

    geometry::BoundingBox boundingBox() const;

    /// Distance to the boundary (not zero inside)
    double distanceTo(const QPointF& point) const;

    QVector<QPointF> toPolyline(int segments) const;

    bool operator==(const Ellipse& other) const;
    bool operator!=(const Ellipse& other) const { return !(*this == other); }

private:
    QPointF m_center;
    double m_radiusX = 0.0;
    double m_radiusY = 0.0;
};

}  // namespace kernel
}  // namespace draftcore

#endif  // DRAFTCORE_KERNEL_ELLIPSE_H

// =====================================================================
//  src/libdraftcore/draftcore/kernel/circle.h — Circle primitive
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_KERNEL_CIRCLE_H
#define DRAFTCORE_KERNEL_CIRCLE_H

#include "primitivetypes.h"
#include "../geometry/types.h"

#include <optional>

namespace draftcore {
namespace kernel {

/// Circle given by center and radius.
///
/// A negative radius passed to any constructor is replaced by its
/// absolute value (logged as a warning on the draftcore.kernel.circle
/// category so that callers relying on it can be found).
///
/// Control points: 0 = center, 1 = radius handle at (cx + r, cy).
class DRAFTCORE_EXPORT Circle {
public:
    Circle(const QPointF& center, double radius);

    /// Circle from center and diameter
    static Circle fromCenterAndDiameter(const QPointF& center, double diameter);

    /// Circle whose diameter is the segment p1-p2
    static Circle fromTwoPoints(const QPointF& p1, const QPointF& p2);

    /// Circle through three points; nullopt when they are collinear
    static std::optional<Circle> fromThreePoints(
        const QPointF& p1, const QPointF& p2, const QPointF& p3);

    QPointF center() const { return m_center; }
    double radius() const { return m_radius; }

    double diameter() const { return 2.0 * m_radius; }
    double circumference() const;
    double area() const;

    /// Point on the circle at angle (degrees)
    QPointF pointAtAngle(double angleDegrees) const;

    /// Closest point on the circumference
    QPointF closestPoint(const QPointF& point) const;

    QVector<SnapPoint> snapPoints() const;
    QVector<ControlPoint> controlPoints() const;
    bool moveControlPoint(int index, const QPointF& position);

    geometry::BoundingBox boundingBox() const;

    /// Distance to the circumference (not zero inside the disk)
    double distanceTo(const QPointF& point) const;

    QVector<QPointF> toPolyline(int segments) const;

    bool operator==(const Circle& other) const;
    bool operator!=(const Circle& other) const { return !(*this == other); }

private:
    QPointF m_center;
    double m_radius = 0.0;
};

}  // namespace kernel
}  // namespace draftcore

#endif  // DRAFTCORE_KERNEL_CIRCLE_H

// =====================================================================
//  src/libdraftcore/draftcore/kernel/rectangle.h — Axis-aligned rectangle primitive
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_KERNEL_RECTANGLE_H
#define DRAFTCORE_KERNEL_RECTANGLE_H

#include "primitivetypes.h"
#include "../geometry/types.h"

namespace draftcore {
namespace kernel {

/// Axis-aligned rectangle given by two opposite corners.
///
/// The edges are derived from the min/max of the corner coordinates, so
/// the order of the two corners does not matter.  Corner radius and
/// chamfer size are cosmetic record fields: both are kept >= 0 and at
/// most one of them is non-zero (the corner radius wins).
///
/// Control points: 0..3 = corners (left-bottom, right-bottom, right-top,
/// left-top), 4 = center (moves the whole rectangle).  Dragging a corner
/// keeps the diagonally opposite corner fixed.
class DRAFTCORE_EXPORT Rectangle {
public:
    Rectangle(const QPointF& corner1, const QPointF& corner2,
              double cornerRadius = 0.0, double chamferSize = 0.0);

    /// Rectangle from its origin corner and a size
    static Rectangle fromOriginAndSize(const QPointF& origin, double width, double height);

    /// Rectangle centered on a point
    static Rectangle fromCenterAndSize(const QPointF& center, double width, double height);

    QPointF corner1() const { return m_corner1; }
    QPointF corner2() const { return m_corner2; }
    double cornerRadius() const { return m_cornerRadius; }
    double chamferSize() const { return m_chamferSize; }

    double left() const;
    double right() const;
    double bottom() const;
    double top() const;
    double width() const { return right() - left(); }
    double height() const { return top() - bottom(); }
    QPointF center() const;
    double area() const { return width() * height(); }
    double perimeter() const { return 2.0 * (width() + height()); }

    /// Corners counter-clockwise from the left-bottom one
    QVector<QPointF> corners() const;

    QVector<SnapPoint> snapPoints() const;
    QVector<ControlPoint> controlPoints() const;
    bool moveControlPoint(int index, const QPointF& position);

    geometry::BoundingBox boundingBox() const;

    /// Distance to the outline (not zero inside)
    double distanceTo(const QPointF& point) const;

    /// Closed outline: the four corners followed by the first again
    QVector<QPointF> toPolyline(int segments) const;

    bool operator==(const Rectangle& other) const;
    bool operator!=(const Rectangle& other) const { return !(*this == other); }

private:
    QPointF m_corner1;
    QPointF m_corner2;
    double m_cornerRadius = 0.0;
    double m_chamferSize = 0.0;
};

}  // namespace kernel
}  // namespace draftcore

#endif  // DRAFTCORE_KERNEL_RECTANGLE_H

// =====================================================================
//  src/libdraftcore/draftcore/kernel/segment.h — Line segment primitive
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_KERNEL_SEGMENT_H
#define DRAFTCORE_KERNEL_SEGMENT_H

#include "primitivetypes.h"
#include "../geometry/types.h"

namespace draftcore {
namespace kernel {

/// Straight segment between two endpoints.
///
/// Control points: 0 = start, 1 = end, 2 = midpoint (moves the whole
/// segment).
class DRAFTCORE_EXPORT Segment {
public:
    Segment(const QPointF& start, const QPointF& end);

    QPointF start() const { return m_start; }
    QPointF end() const { return m_end; }

    double length() const;
    QPointF midpoint() const;

    /// Direction from start to end in degrees (-180 to 180)
    double angle() const;

    /// Point at parameter t (0 = start, 1 = end)
    QPointF pointAt(double t) const;

    /// Foot of the perpendicular from point onto the segment's line
    QPointF perpendicularFoot(const QPointF& point) const;

    QVector<SnapPoint> snapPoints() const;
    QVector<ControlPoint> controlPoints() const;
    bool moveControlPoint(int index, const QPointF& position);

    geometry::BoundingBox boundingBox() const;

    /// Distance to the segment (projection clamped to the endpoints)
    double distanceTo(const QPointF& point) const;

    QVector<QPointF> toPolyline(int segments) const;

    bool operator==(const Segment& other) const;
    bool operator!=(const Segment& other) const { return !(*this == other); }

private:
    QPointF m_start;
    QPointF m_end;
};

}  // namespace kernel
}  // namespace draftcore

#endif  // DRAFTCORE_KERNEL_SEGMENT_H

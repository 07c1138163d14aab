// =====================================================================
//  src/libdraftcore/draftcore/kernel/spline.h — Interpolating spline primitive
// =====================================================================
//
//  Cubic Hermite spline through its control points with Catmull-Rom
//  tangents.  The tessellated curve is cached per segment count and
//  dropped whenever a control point is added, removed or moved.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_KERNEL_SPLINE_H
#define DRAFTCORE_KERNEL_SPLINE_H

#include "primitivetypes.h"
#include "../geometry/types.h"

#include <optional>

namespace draftcore {
namespace kernel {

/// Default number of segments between two consecutive control points
constexpr int DEFAULT_SPLINE_SEGMENTS = 20;

/// Spline through at least two control points.
///
/// Tangent i is 0.5 * (p[i+1] - p[i-1]).  Open splines use the one-sided
/// 0.5 * (p[1] - p[0]) and 0.5 * (p[n-1] - p[n-2]) at their ends; closed
/// splines wrap indices around.
///
/// Control points: index i is control point i.
class DRAFTCORE_EXPORT Spline {
public:
    /// Spline through points; nullopt when fewer than two are given
    static std::optional<Spline> fromPoints(const QVector<QPointF>& points,
                                            bool closed = false);

    const QVector<QPointF>& points() const { return m_points; }
    int pointCount() const { return m_points.size(); }
    bool isClosed() const { return m_closed; }

    /// Insert a control point before index (append when index is out of range)
    void addPoint(const QPointF& point, int index = -1);

    /// Remove a control point; refused if it would leave fewer than two
    bool removePoint(int index);

    /// Move a control point; false on an invalid index
    bool movePoint(int index, const QPointF& position);

    /// Tessellated curve.  Open splines end on their last control point,
    /// closed splines repeat their first curve point.
    QVector<QPointF> curvePoints(int segmentsPerSpan = DEFAULT_SPLINE_SEGMENTS) const;

    /// Whether a tessellation is currently cached
    bool hasCachedCurve() const { return m_cacheSegments > 0; }

    /// Length of the default tessellation
    double approximateLength() const;

    QVector<SnapPoint> snapPoints() const;
    QVector<ControlPoint> controlPoints() const;
    bool moveControlPoint(int index, const QPointF& position);

    geometry::BoundingBox boundingBox() const;

    double distanceTo(const QPointF& point) const;

    /// Same as curvePoints(); segments counts per span
    QVector<QPointF> toPolyline(int segments) const { return curvePoints(segments); }

    /// Compares control points and closure, not the cache
    bool operator==(const Spline& other) const;
    bool operator!=(const Spline& other) const { return !(*this == other); }

private:
    Spline(const QVector<QPointF>& points, bool closed);

    void invalidate();

    QVector<QPointF> m_points;
    bool m_closed = false;

    mutable QVector<QPointF> m_cache;
    mutable int m_cacheSegments = 0;  ///< 0 = nothing cached
};

}  // namespace kernel
}  // namespace draftcore

#endif  // DRAFTCORE_KERNEL_SPLINE_H

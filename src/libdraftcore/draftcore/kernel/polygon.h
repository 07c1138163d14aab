// =====================================================================
//  src/libdraftcore/draftcore/kernel/polygon.h — Regular polygon primitive
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_KERNEL_POLYGON_H
#define DRAFTCORE_KERNEL_POLYGON_H

#include "primitivetypes.h"
#include "../geometry/types.h"

namespace draftcore {
namespace kernel {

/// How the radius of a regular polygon is measured
enum class PolygonFit {
    Inscribed,     ///< Radius reaches the vertices
    Circumscribed  ///< Radius is the apothem (reaches the side midpoints)
};

/// Largest side count accepted when decoding a polygon record
constexpr int MAX_POLYGON_SIDES = 1024;

/// Regular polygon with n >= 3 sides.
///
/// Vertex i sits at center + R * (cos a, sin a) with
/// a = rotation + i * 360 / n, where R is the radius for an inscribed
/// polygon and radius / cos(pi / n) for a circumscribed one.
///
/// A negative radius is made positive and fewer than 3 sides become 3,
/// both with a warning.
///
/// Control points: 0 = center, 1 = first vertex (sets radius and
/// rotation).
class DRAFTCORE_EXPORT RegularPolygon {
public:
    RegularPolygon(const QPointF& center, double radius, int numSides = 6,
                   PolygonFit fit = PolygonFit::Inscribed,
                   double rotation = 0.0);

    QPointF center() const { return m_center; }
    double radius() const { return m_radius; }
    int numSides() const { return m_numSides; }
    PolygonFit fit() const { return m_fit; }
    double rotation() const { return m_rotation; }   ///< Degrees

    /// Distance from the center to each vertex
    double effectiveRadius() const;

    QVector<QPointF> vertices() const;

    double sideLength() const;
    double apothem() const;
    double area() const;
    double perimeter() const;

    QVector<SnapPoint> snapPoints() const;
    QVector<ControlPoint> controlPoints() const;
    bool moveControlPoint(int index, const QPointF& position);

    geometry::BoundingBox boundingBox() const;

    /// Distance to the outline (not zero inside)
    double distanceTo(const QPointF& point) const;

    /// Closed outline: the vertices followed by the first again
    QVector<QPointF> toPolyline(int segments) const;

    bool operator==(const RegularPolygon& other) const;
    bool operator!=(const RegularPolygon& other) const { return !(*this == other); }

private:
    QPointF m_center;
    double m_radius = 0.0;
    int m_numSides = 3;
    PolygonFit m_fit = PolygonFit::Inscribed;
    double m_rotation = 0.0;
};

}  // namespace kernel
}  // namespace draftcore

#endif  // DRAFTCORE_KERNEL_POLYGON_H

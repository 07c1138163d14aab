// =====================================================================
//  src/libdraftcore/draftcore/kernel/primitive.h — Primitive sum type
// =====================================================================
//
//  A Primitive is exactly one of the seven geometry variants plus a
//  style name.  Every query of the shared contract is dispatched to
//  the active variant.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_KERNEL_PRIMITIVE_H
#define DRAFTCORE_KERNEL_PRIMITIVE_H

#include "arc.h"
#include "circle.h"
#include "ellipse.h"
#include "polygon.h"
#include "primitivetypes.h"
#include "rectangle.h"
#include "segment.h"
#include "spline.h"
#include "../geometry/types.h"

#include <optional>
#include <variant>

namespace draftcore {
namespace kernel {

/// Variant tag, in the order of Primitive::Geometry
enum class PrimitiveType {
    Segment,
    Circle,
    Arc,
    Rectangle,
    Ellipse,
    Polygon,
    Spline
};

/// Record type name of a variant ("line", "circle", ...)
DRAFTCORE_EXPORT QString primitiveTypeName(PrimitiveType type);

/// Inverse of primitiveTypeName(); nullopt for unknown names
DRAFTCORE_EXPORT std::optional<PrimitiveType> primitiveTypeFromName(const QString& name);

/// Default tessellation for circles, arcs and ellipses
constexpr int DEFAULT_POLYLINE_SEGMENTS = 64;

/// One drawable primitive
class DRAFTCORE_EXPORT Primitive {
public:
    using Geometry = std::variant<Segment, Circle, Arc, Rectangle,
                                  Ellipse, RegularPolygon, Spline>;

    Primitive(Geometry geometry, const QString& styleName = defaultStyleName());

    PrimitiveType type() const;

    const Geometry& geometry() const { return m_geometry; }

    /// Typed access; null when the primitive holds another variant
    template <typename T>
    const T* geometryAs() const { return std::get_if<T>(&m_geometry); }

    template <typename T>
    T* geometryAs() { return std::get_if<T>(&m_geometry); }

    QString styleName() const { return m_styleName; }
    void setStyleName(const QString& name) { m_styleName = name; }

    // ---- Shared contract ----

    /// Snap anchors; each one's source is this primitive
    QVector<SnapPoint> snapPoints() const;

    QVector<ControlPoint> controlPoints() const;

    /// Move handle `index` to position.  Returns false and leaves the
    /// primitive unchanged for an unknown index or a degenerate result.
    bool moveControlPoint(int index, const QPointF& position);

    geometry::BoundingBox boundingBox() const;

    /// Distance from point to the primitive's boundary
    double distanceTo(const QPointF& point) const;

    /// Whether the boundary is within tolerance of point
    bool containsPoint(const QPointF& point, double tolerance) const;

    /// Polyline approximation.  For splines `segments` counts per span.
    QVector<QPointF> toPolyline(int segments = DEFAULT_POLYLINE_SEGMENTS) const;

    /// Center for variants that have one
    std::optional<QPointF> center() const;

    bool operator==(const Primitive& other) const;
    bool operator!=(const Primitive& other) const { return !(*this == other); }

private:
    Geometry m_geometry;
    QString m_styleName;
};

/// Bounds of a collection (invalid when empty)
DRAFTCORE_EXPORT geometry::BoundingBox sceneBounds(const QVector<Primitive>& primitives);

}  // namespace kernel
}  // namespace draftcore

#endif  // DRAFTCORE_KERNEL_PRIMITIVE_H

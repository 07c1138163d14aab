// =====================================================================
//  src/libdraftcore/kernel/primitive.cpp — Primitive sum type
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/kernel/primitive.h>

#include <type_traits>
#include <utility>

namespace draftcore {
namespace kernel {

QString primitiveTypeName(PrimitiveType type)
{
    switch (type) {
    case PrimitiveType::Segment:   return QStringLiteral("line");
    case PrimitiveType::Circle:    return QStringLiteral("circle");
    case PrimitiveType::Arc:       return QStringLiteral("arc");
    case PrimitiveType::Rectangle: return QStringLiteral("rectangle");
    case PrimitiveType::Ellipse:   return QStringLiteral("ellipse");
    case PrimitiveType::Polygon:   return QStringLiteral("polygon");
    case PrimitiveType::Spline:    return QStringLiteral("spline");
    }
    return QString();
}

std::optional<PrimitiveType> primitiveTypeFromName(const QString& name)
{
    static const PrimitiveType types[] = {
        PrimitiveType::Segment, PrimitiveType::Circle, PrimitiveType::Arc,
        PrimitiveType::Rectangle, PrimitiveType::Ellipse, PrimitiveType::Polygon,
        PrimitiveType::Spline
    };
    for (PrimitiveType type : types) {
        if (primitiveTypeName(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

Primitive::Primitive(Geometry geometry, const QString& styleName)
    : m_geometry(std::move(geometry))
    , m_styleName(styleName)
{
}

PrimitiveType Primitive::type() const
{
    return static_cast<PrimitiveType>(m_geometry.index());
}

QVector<SnapPoint> Primitive::snapPoints() const
{
    QVector<SnapPoint> points =
        std::visit([](const auto& g) { return g.snapPoints(); }, m_geometry);
    for (SnapPoint& sp : points) {
        sp.source = this;
    }
    return points;
}

QVector<ControlPoint> Primitive::controlPoints() const
{
    return std::visit([](const auto& g) { return g.controlPoints(); }, m_geometry);
}

bool Primitive::moveControlPoint(int index, const QPointF& position)
{
    return std::visit([index, &position](auto& g) {
        return g.moveControlPoint(index, position);
    }, m_geometry);
}

geometry::BoundingBox Primitive::boundingBox() const
{
    return std::visit([](const auto& g) { return g.boundingBox(); }, m_geometry);
}

double Primitive::distanceTo(const QPointF& point) const
{
    return std::visit([&point](const auto& g) { return g.distanceTo(point); }, m_geometry);
}

bool Primitive::containsPoint(const QPointF& point, double tolerance) const
{
    return distanceTo(point) <= tolerance;
}

QVector<QPointF> Primitive::toPolyline(int segments) const
{
    return std::visit([segments](const auto& g) { return g.toPolyline(segments); },
                      m_geometry);
}

std::optional<QPointF> Primitive::center() const
{
    return std::visit([](const auto& g) -> std::optional<QPointF> {
        using T = std::decay_t<decltype(g)>;
        if constexpr (std::is_same_v<T, Segment> || std::is_same_v<T, Spline>) {
            return std::nullopt;
        } else {
            return g.center();
        }
    }, m_geometry);
}

bool Primitive::operator==(const Primitive& other) const
{
    return m_styleName == other.m_styleName && m_geometry == other.m_geometry;
}

geometry::BoundingBox sceneBounds(const QVector<Primitive>& primitives)
{
    geometry::BoundingBox bounds;
    for (const Primitive& p : primitives) {
        bounds.include(p.boundingBox());
    }
    return bounds;
}

}  // namespace kernel
}  // namespace draftcore

// =====================================================================
//  src/libdraftcore/kernel/rectangle.cpp — Axis-aligned rectangle primitive
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/kernel/rectangle.h>
#include <draftcore/geometry/intersections.h>

#include <QLoggingCategory>

namespace draftcore {
namespace kernel {

Q_LOGGING_CATEGORY(logKernelRectangle, "draftcore.kernel.rectangle")

Rectangle::Rectangle(const QPointF& corner1, const QPointF& corner2,
                     double cornerRadius, double chamferSize)
    : m_corner1(corner1)
    , m_corner2(corner2)
    , m_cornerRadius(qMax(0.0, cornerRadius))
    , m_chamferSize(qMax(0.0, chamferSize))
{
    if (cornerRadius < 0 || chamferSize < 0) {
        qCWarning(logKernelRectangle) << "ctor:negative-corner-treatment-coerced"
                                      << cornerRadius << chamferSize;
    }
    if (m_cornerRadius > 0 && m_chamferSize > 0) {
        qCWarning(logKernelRectangle) << "ctor:chamfer-dropped-for-corner-radius"
                                      << m_cornerRadius << m_chamferSize;
        m_chamferSize = 0.0;
    }
}

Rectangle Rectangle::fromOriginAndSize(const QPointF& origin, double width, double height)
{
    return Rectangle(origin, origin + QPointF(width, height));
}

Rectangle Rectangle::fromCenterAndSize(const QPointF& center, double width, double height)
{
    QPointF half(width / 2.0, height / 2.0);
    return Rectangle(center - half, center + half);
}

double Rectangle::left() const
{
    return qMin(m_corner1.x(), m_corner2.x());
}

double Rectangle::right() const
{
    return qMax(m_corner1.x(), m_corner2.x());
}

double Rectangle::bottom() const
{
    return qMin(m_corner1.y(), m_corner2.y());
}

double Rectangle::top() const
{
    return qMax(m_corner1.y(), m_corner2.y());
}

QPointF Rectangle::center() const
{
    return (m_corner1 + m_corner2) / 2.0;
}

QVector<QPointF> Rectangle::corners() const
{
    return {
        QPointF(left(), bottom()),
        QPointF(right(), bottom()),
        QPointF(right(), top()),
        QPointF(left(), top())
    };
}

QVector<SnapPoint> Rectangle::snapPoints() const
{
    QVector<SnapPoint> points;
    points.append({center(), SnapKind::Center, nullptr});

    const QVector<QPointF> c = corners();
    for (const QPointF& corner : c) {
        points.append({corner, SnapKind::Endpoint, nullptr});
    }
    for (int i = 0; i < 4; ++i) {
        points.append({(c[i] + c[(i + 1) % 4]) / 2.0, SnapKind::Midpoint, nullptr});
    }
    return points;
}

QVector<ControlPoint> Rectangle::controlPoints() const
{
    const QVector<QPointF> c = corners();
    return {
        {c[0], QStringLiteral("Left bottom"), 0},
        {c[1], QStringLiteral("Right bottom"), 1},
        {c[2], QStringLiteral("Right top"), 2},
        {c[3], QStringLiteral("Left top"), 3},
        {center(), QStringLiteral("Center"), 4}
    };
}

bool Rectangle::moveControlPoint(int index, const QPointF& position)
{
    if (index >= 0 && index < 4) {
        QPointF opposite = corners()[(index + 2) % 4];
        if (fuzzyEqual(position.x(), opposite.x())
            || fuzzyEqual(position.y(), opposite.y())) {
            return false;  // Would collapse to zero width or height
        }
        m_corner1 = opposite;
        m_corner2 = position;
        return true;
    }

    if (index == 4) {
        QPointF delta = position - center();
        m_corner1 += delta;
        m_corner2 += delta;
        return true;
    }

    return false;
}

geometry::BoundingBox Rectangle::boundingBox() const
{
    return geometry::BoundingBox(m_corner1.x(), m_corner1.y(),
                                 m_corner2.x(), m_corner2.y());
}

double Rectangle::distanceTo(const QPointF& point) const
{
    return geometry::pointToPolylineDistance(point, corners(), true);
}

QVector<QPointF> Rectangle::toPolyline(int /*segments*/) const
{
    QVector<QPointF> outline = corners();
    outline.append(outline.first());
    return outline;
}

bool Rectangle::operator==(const Rectangle& other) const
{
    return fuzzyEqual(m_corner1, other.m_corner1)
        && fuzzyEqual(m_corner2, other.m_corner2)
        && fuzzyEqual(m_cornerRadius, other.m_cornerRadius)
        && fuzzyEqual(m_chamferSize, other.m_chamferSize);
}

}  // namespace kernel
}  // namespace draftcore

// =====================================================================
//  src/libdraftcore/kernel/circle.cpp — Circle primitive
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/kernel/circle.h>
#include <draftcore/geometry/intersections.h>
#include <draftcore/geometry/utils.h>

#include <QLoggingCategory>

namespace draftcore {
namespace kernel {

Q_LOGGING_CATEGORY(logKernelCircle, "draftcore.kernel.circle")

Circle::Circle(const QPointF& center, double radius)
    : m_center(center)
    , m_radius(qAbs(radius))
{
    if (radius < 0) {
        qCWarning(logKernelCircle) << "ctor:negative-radius-coerced" << radius;
    }
}

Circle Circle::fromCenterAndDiameter(const QPointF& center, double diameter)
{
    return Circle(center, diameter / 2.0);
}

Circle Circle::fromTwoPoints(const QPointF& p1, const QPointF& p2)
{
    return Circle((p1 + p2) / 2.0, geometry::distance(p1, p2) / 2.0);
}

std::optional<Circle> Circle::fromThreePoints(
    const QPointF& p1, const QPointF& p2, const QPointF& p3)
{
    std::optional<geometry::Circumcircle> cc = geometry::circumcircle(p1, p2, p3);
    if (!cc) {
        return std::nullopt;
    }
    return Circle(cc->center, cc->radius);
}

double Circle::circumference() const
{
    return 2.0 * M_PI * m_radius;
}

double Circle::area() const
{
    return M_PI * m_radius * m_radius;
}

QPointF Circle::pointAtAngle(double angleDegrees) const
{
    return geometry::polarPoint(m_center, m_radius, angleDegrees);
}

QPointF Circle::closestPoint(const QPointF& point) const
{
    return geometry::closestPointOnCircle(point, m_center, m_radius);
}

QVector<SnapPoint> Circle::snapPoints() const
{
    QVector<SnapPoint> points;
    points.append({m_center, SnapKind::Center, nullptr});
    for (int quadrant = 0; quadrant < 4; ++quadrant) {
        points.append({pointAtAngle(quadrant * 90.0), SnapKind::Quadrant, nullptr});
    }
    return points;
}

QVector<ControlPoint> Circle::controlPoints() const
{
    return {
        {m_center, QStringLiteral("Center"), 0},
        {m_center + QPointF(m_radius, 0), QStringLiteral("Radius"), 1}
    };
}

bool Circle::moveControlPoint(int index, const QPointF& position)
{
    if (index == 0) {
        m_center = position;
        return true;
    }
    if (index == 1) {
        double newRadius = geometry::distance(m_center, position);
        if (newRadius > 0) {
            m_radius = newRadius;
            return true;
        }
    }
    return false;
}

geometry::BoundingBox Circle::boundingBox() const
{
    return geometry::BoundingBox(m_center.x() - m_radius, m_center.y() - m_radius,
                                 m_center.x() + m_radius, m_center.y() + m_radius);
}

double Circle::distanceTo(const QPointF& point) const
{
    return geometry::pointToCircleDistance(point, m_center, m_radius);
}

QVector<QPointF> Circle::toPolyline(int segments) const
{
    geometry::CircularArc full{m_center, m_radius, 0.0, 360.0};
    return geometry::sampleArc(full, segments);
}

bool Circle::operator==(const Circle& other) const
{
    return fuzzyEqual(m_center, other.m_center) && fuzzyEqual(m_radius, other.m_radius);
}

}  // namespace kernel
}  // namespace draftcore

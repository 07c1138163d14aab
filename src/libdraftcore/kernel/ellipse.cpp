// =====================================================================
//  src/libdraftcore/kernel/ellipse.cpp — Axis-aligned ellipse primitive
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/kernel/ellipse.h>
#include <draftcore/geometry/intersections.h>

#include <QLoggingCategory>

namespace draftcore {
namespace kernel {

Q_LOGGING_CATEGORY(logKernelEllipse, "draftcore.kernel.ellipse")

Ellipse::Ellipse(const QPointF& center, double radiusX, double radiusY)
    : m_center(center)
    , m_radiusX(qAbs(radiusX))
    , m_radiusY(qAbs(radiusY))
{
    if (radiusX < 0 || radiusY < 0) {
        qCWarning(logKernelEllipse) << "ctor:negative-radius-coerced" << radiusX << radiusY;
    }
}

Ellipse Ellipse::fromCenterAndAxisPoints(const QPointF& center,
                                         const QPointF& axisPointX,
                                         const QPointF& axisPointY)
{
    return Ellipse(center,
                   qAbs(axisPointX.x() - center.x()),
                   qAbs(axisPointY.y() - center.y()));
}

Ellipse Ellipse::fromBoundingRectangle(const QPointF& p1, const QPointF& p2)
{
    return Ellipse((p1 + p2) / 2.0,
                   qAbs(p2.x() - p1.x()) / 2.0,
                   qAbs(p2.y() - p1.y()) / 2.0);
}

double Ellipse::eccentricity() const
{
    double a = majorRadius();
    double b = minorRadius();
    if (a <= 0) {
        return 0.0;
    }
    return qSqrt(1.0 - (b * b) / (a * a));
}

double Ellipse::area() const
{
    return M_PI * m_radiusX * m_radiusY;
}

double Ellipse::circumference() const
{
    double a = m_radiusX;
    double b = m_radiusY;
    return M_PI * (3.0 * (a + b) - qSqrt((3.0 * a + b) * (a + 3.0 * b)));
}

QPointF Ellipse::pointAtAngle(double angleDegrees) const
{
    double rad = qDegreesToRadians(angleDegrees);
    return QPointF(m_center.x() + m_radiusX * qCos(rad),
                   m_center.y() + m_radiusY * qSin(rad));
}

QPointF Ellipse::closestPoint(const QPointF& point) const
{
    return geometry::closestPointOnEllipse(point, m_center, m_radiusX, m_radiusY);
}

QVector<SnapPoint> Ellipse::snapPoints() const
{
    return {
        {m_center, SnapKind::Center, nullptr},
        {m_center + QPointF(m_radiusX, 0), SnapKind::Quadrant, nullptr},
        {m_center + QPointF(0, m_radiusY), SnapKind::Quadrant, nullptr},
        {m_center - QPointF(m_radiusX, 0), SnapKind::Quadrant, nullptr},
        {m_center - QPointF(0, m_radiusY), SnapKind::Quadrant, nullptr}
    };
}

QVector<ControlPoint> Ellipse::controlPoints() const
{
    return {
        {m_center, QStringLiteral("Center"), 0},
        {m_center + QPointF(m_radiusX, 0), QStringLiteral("X axis"), 1},
        {m_center + QPointF(0, m_radiusY), QStringLiteral("Y axis"), 2}
    };
}

bool Ellipse::moveControlPoint(int index, const QPointF& position)
{
    switch (index) {
    case 0:
        m_center = position;
        return true;
    case 1: {
        double newRadius = qAbs(position.x() - m_center.x());
        if (newRadius > 0) {
            m_radiusX = newRadius;
            return true;
        }
        return false;
    }
    case 2: {
        double newRadius = qAbs(position.y() - m_center.y());
        if (newRadius > 0) {
            m_radiusY = newRadius;
            return true;
        }
        return false;
    }
    default:
        return false;
    }
}

geometry::BoundingBox Ellipse::boundingBox() const
{
    return geometry::BoundingBox(m_center.x() - m_radiusX, m_center.y() - m_radiusY,
                                 m_center.x() + m_radiusX, m_center.y() + m_radiusY);
}

double Ellipse::distanceTo(const QPointF& point) const
{
    return geometry::pointToEllipseDistance(point, m_center, m_radiusX, m_radiusY);
}

QVector<QPointF> Ellipse::toPolyline(int segments) const
{
    segments = qMax(1, segments);
    QVector<QPointF> result;
    result.reserve(segments + 1);
    for (int i = 0; i <= segments; ++i) {
        result.append(pointAtAngle(360.0 * i / segments));
    }
    return result;
}

bool Ellipse::operator==(const Ellipse& other) const
{
    return fuzzyEqual(m_center, other.m_center)
        && fuzzyEqual(m_radiusX, other.m_radiusX)
        && fuzzyEqual(m_radiusY, other.m_radiusY);
}

}  // namespace kernel
}  // namespace draftcore

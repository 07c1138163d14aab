// =====================================================================
//  src/libdraftcore/kernel/polygon.cpp — Regular polygon primitive
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/kernel/polygon.h>
#include <draftcore/geometry/intersections.h>
#include <draftcore/geometry/utils.h>

#include <QLoggingCategory>

namespace draftcore {
namespace kernel {

Q_LOGGING_CATEGORY(logKernelPolygon, "draftcore.kernel.polygon")

RegularPolygon::RegularPolygon(const QPointF& center, double radius, int numSides,
                               PolygonFit fit, double rotation)
    : m_center(center)
    , m_radius(qAbs(radius))
    , m_numSides(qMax(3, numSides))
    , m_fit(fit)
    , m_rotation(rotation)
{
    if (radius < 0) {
        qCWarning(logKernelPolygon) << "ctor:negative-radius-coerced" << radius;
    }
    if (numSides < 3) {
        qCWarning(logKernelPolygon) << "ctor:sides-raised-to-3" << numSides;
    }
}

double RegularPolygon::effectiveRadius() const
{
    if (m_fit == PolygonFit::Circumscribed) {
        return m_radius / qCos(M_PI / m_numSides);
    }
    return m_radius;
}

QVector<QPointF> RegularPolygon::vertices() const
{
    QVector<QPointF> result;
    result.reserve(m_numSides);

    double r = effectiveRadius();
    double step = 360.0 / m_numSides;
    for (int i = 0; i < m_numSides; ++i) {
        result.append(geometry::polarPoint(m_center, r, m_rotation + i * step));
    }
    return result;
}

double RegularPolygon::sideLength() const
{
    return 2.0 * effectiveRadius() * qSin(M_PI / m_numSides);
}

double RegularPolygon::apothem() const
{
    if (m_fit == PolygonFit::Circumscribed) {
        return m_radius;
    }
    return m_radius * qCos(M_PI / m_numSides);
}

double RegularPolygon::area() const
{
    return 0.5 * m_numSides * sideLength() * apothem();
}

double RegularPolygon::perimeter() const
{
    return m_numSides * sideLength();
}

QVector<SnapPoint> RegularPolygon::snapPoints() const
{
    QVector<SnapPoint> points;
    points.append({m_center, SnapKind::Center, nullptr});

    const QVector<QPointF> v = vertices();
    for (const QPointF& vertex : v) {
        points.append({vertex, SnapKind::Endpoint, nullptr});
    }
    for (int i = 0; i < v.size(); ++i) {
        points.append({(v[i] + v[(i + 1) % v.size()]) / 2.0, SnapKind::Midpoint, nullptr});
    }
    return points;
}

QVector<ControlPoint> RegularPolygon::controlPoints() const
{
    return {
        {m_center, QStringLiteral("Center"), 0},
        {vertices().first(), QStringLiteral("Radius"), 1}
    };
}

bool RegularPolygon::moveControlPoint(int index, const QPointF& position)
{
    if (index == 0) {
        m_center = position;
        return true;
    }
    if (index == 1) {
        double newRadius = geometry::distance(m_center, position);
        // The handle is a vertex; store the apothem for circumscribed polygons
        if (m_fit == PolygonFit::Circumscribed) {
            newRadius *= qCos(M_PI / m_numSides);
        }
        if (newRadius > 0) {
            m_radius = newRadius;
            m_rotation = geometry::vectorAngle(position - m_center);
            return true;
        }
    }
    return false;
}

geometry::BoundingBox RegularPolygon::boundingBox() const
{
    return geometry::pointsBounds(vertices());
}

double RegularPolygon::distanceTo(const QPointF& point) const
{
    return geometry::pointToPolylineDistance(point, vertices(), true);
}

QVector<QPointF> RegularPolygon::toPolyline(int /*segments*/) const
{
    QVector<QPointF> outline = vertices();
    outline.append(outline.first());
    return outline;
}

bool RegularPolygon::operator==(const RegularPolygon& other) const
{
    return fuzzyEqual(m_center, other.m_center)
        && fuzzyEqual(m_radius, other.m_radius)
        && m_numSides == other.m_numSides
        && m_fit == other.m_fit
        && fuzzyEqual(m_rotation, other.m_rotation);
}

}  // namespace kernel
}  // namespace draftcore

// =====================================================================
//  src/libdraftcore/kernel/arc.cpp — Circular arc primitive
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/kernel/arc.h>
#include <draftcore/geometry/intersections.h>
#include <draftcore/geometry/utils.h>

#include <QLoggingCategory>

namespace draftcore {
namespace kernel {

Q_LOGGING_CATEGORY(logKernelArc, "draftcore.kernel.arc")

Arc::Arc(const QPointF& center, double radius, double startAngle, double spanAngle)
    : m_center(center)
    , m_radius(qAbs(radius))
    , m_startAngle(startAngle)
    , m_spanAngle(qBound(-360.0, spanAngle, 360.0))
{
    if (radius < 0) {
        qCWarning(logKernelArc) << "ctor:negative-radius-coerced" << radius;
    }
    if (qAbs(spanAngle) > 360.0) {
        qCWarning(logKernelArc) << "ctor:span-clamped" << spanAngle;
    }
}

Arc Arc::fromCenterAndAngles(const QPointF& center, double radius,
                             double startAngle, double endAngle,
                             bool shortestPath)
{
    double span;
    if (shortestPath) {
        span = geometry::normalizeAngleSigned(endAngle - startAngle);
    } else {
        span = geometry::normalizeAngle(endAngle - startAngle);
        if (span == 0.0) {
            span = 360.0;
        }
    }
    return Arc(center, radius, startAngle, span);
}

std::optional<Arc> Arc::fromThreePoints(
    const QPointF& start, const QPointF& onArc, const QPointF& end)
{
    std::optional<geometry::CircularArc> arc =
        geometry::arcFromThreePoints(start, onArc, end);
    if (!arc) {
        return std::nullopt;
    }
    return Arc(arc->center, arc->radius, arc->startAngle, arc->sweepAngle);
}

QPointF Arc::startPoint() const
{
    return pointAtAngle(m_startAngle);
}

QPointF Arc::endPoint() const
{
    return pointAtAngle(endAngle());
}

QPointF Arc::midPoint() const
{
    return pointAtAngle(m_startAngle + m_spanAngle / 2.0);
}

double Arc::arcLength() const
{
    return qAbs(m_radius * qDegreesToRadians(m_spanAngle));
}

bool Arc::containsAngle(double angleDegrees) const
{
    return toCircularArc().containsAngle(angleDegrees);
}

QPointF Arc::pointAtAngle(double angleDegrees) const
{
    return geometry::polarPoint(m_center, m_radius, angleDegrees);
}

QVector<QPointF> Arc::curvePoints(int segments) const
{
    return geometry::sampleArc(toCircularArc(), segments);
}

QVector<SnapPoint> Arc::snapPoints() const
{
    QVector<SnapPoint> points;
    points.append({m_center, SnapKind::Center, nullptr});
    points.append({startPoint(), SnapKind::Endpoint, nullptr});
    points.append({endPoint(), SnapKind::Endpoint, nullptr});
    points.append({midPoint(), SnapKind::Midpoint, nullptr});

    for (int quadrant = 0; quadrant < 4; ++quadrant) {
        double angle = quadrant * 90.0;
        if (containsAngle(angle)) {
            points.append({pointAtAngle(angle), SnapKind::Quadrant, nullptr});
        }
    }
    return points;
}

QVector<ControlPoint> Arc::controlPoints() const
{
    return {
        {m_center, QStringLiteral("Center"), 0},
        {startPoint(), QStringLiteral("Start"), 1},
        {endPoint(), QStringLiteral("End"), 2},
        {midPoint(), QStringLiteral("Radius"), 3}
    };
}

bool Arc::moveControlPoint(int index, const QPointF& position)
{
    switch (index) {
    case 0:
        m_center = position;
        return true;

    case 1: {
        // New start; the end stays where it is and the direction is kept
        double newStart = geometry::vectorAngle(position - m_center);
        double end = endAngle();
        double span = (m_spanAngle >= 0)
            ? geometry::normalizeAngle(end - newStart)
            : -geometry::normalizeAngle(newStart - end);
        if (span == 0.0) {
            return false;
        }
        m_startAngle = newStart;
        m_spanAngle = span;
        return true;
    }

    case 2: {
        double newEnd = geometry::vectorAngle(position - m_center);
        double span = (m_spanAngle >= 0)
            ? geometry::normalizeAngle(newEnd - m_startAngle)
            : -geometry::normalizeAngle(m_startAngle - newEnd);
        if (span == 0.0) {
            return false;
        }
        m_spanAngle = span;
        return true;
    }

    case 3: {
        double newRadius = geometry::distance(m_center, position);
        if (newRadius > 0) {
            m_radius = newRadius;
            return true;
        }
        return false;
    }

    default:
        return false;
    }
}

geometry::BoundingBox Arc::boundingBox() const
{
    geometry::BoundingBox box(startPoint());
    box.include(endPoint());
    for (int quadrant = 0; quadrant < 4; ++quadrant) {
        double angle = quadrant * 90.0;
        if (containsAngle(angle)) {
            box.include(pointAtAngle(angle));
        }
    }
    return box;
}

double Arc::distanceTo(const QPointF& point) const
{
    return geometry::pointToArcDistance(point, toCircularArc());
}

geometry::CircularArc Arc::toCircularArc() const
{
    return geometry::CircularArc{m_center, m_radius, m_startAngle, m_spanAngle};
}

bool Arc::operator==(const Arc& other) const
{
    return fuzzyEqual(m_center, other.m_center)
        && fuzzyEqual(m_radius, other.m_radius)
        && fuzzyEqual(m_startAngle, other.m_startAngle)
        && fuzzyEqual(m_spanAngle, other.m_spanAngle);
}

}  // namespace kernel
}  // namespace draftcore

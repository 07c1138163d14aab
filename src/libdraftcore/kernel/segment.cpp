// =====================================================================
//  src/libdraftcore/kernel/segment.cpp — Line segment primitive
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/kernel/segment.h>
#include <draftcore/geometry/intersections.h>
#include <draftcore/geometry/utils.h>

namespace draftcore {
namespace kernel {

Segment::Segment(const QPointF& start, const QPointF& end)
    : m_start(start)
    , m_end(end)
{
}

double Segment::length() const
{
    return geometry::distance(m_start, m_end);
}

QPointF Segment::midpoint() const
{
    return (m_start + m_end) / 2.0;
}

double Segment::angle() const
{
    return geometry::vectorAngle(m_end - m_start);
}

QPointF Segment::pointAt(double t) const
{
    return geometry::lerp(m_start, m_end, t);
}

QPointF Segment::perpendicularFoot(const QPointF& point) const
{
    return geometry::projectOntoInfiniteLine(point, m_start, m_end);
}

QVector<SnapPoint> Segment::snapPoints() const
{
    return {
        {m_start, SnapKind::Endpoint, nullptr},
        {m_end, SnapKind::Endpoint, nullptr},
        {midpoint(), SnapKind::Midpoint, nullptr}
    };
}

QVector<ControlPoint> Segment::controlPoints() const
{
    return {
        {m_start, QStringLiteral("Start"), 0},
        {m_end, QStringLiteral("End"), 1},
        {midpoint(), QStringLiteral("Midpoint"), 2}
    };
}

bool Segment::moveControlPoint(int index, const QPointF& position)
{
    switch (index) {
    case 0:
        m_start = position;
        return true;
    case 1:
        m_end = position;
        return true;
    case 2: {
        QPointF delta = position - midpoint();
        m_start += delta;
        m_end += delta;
        return true;
    }
    default:
        return false;
    }
}

geometry::BoundingBox Segment::boundingBox() const
{
    return geometry::BoundingBox(m_start.x(), m_start.y(), m_end.x(), m_end.y());
}

double Segment::distanceTo(const QPointF& point) const
{
    return geometry::pointToLineDistance(point, m_start, m_end);
}

QVector<QPointF> Segment::toPolyline(int /*segments*/) const
{
    return {m_start, m_end};
}

bool Segment::operator==(const Segment& other) const
{
    return fuzzyEqual(m_start, other.m_start) && fuzzyEqual(m_end, other.m_end);
}

}  // namespace kernel
}  // namespace draftcore

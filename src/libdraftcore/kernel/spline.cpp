// =====================================================================
//  src/libdraftcore/kernel/spline.cpp — Interpolating spline primitive
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/kernel/spline.h>
#include <draftcore/geometry/intersections.h>
#include <draftcore/geometry/utils.h>

#include <QLoggingCategory>

namespace draftcore {
namespace kernel {

Q_LOGGING_CATEGORY(logKernelSpline, "draftcore.kernel.spline")

Spline::Spline(const QVector<QPointF>& points, bool closed)
    : m_points(points)
    , m_closed(closed)
{
}

std::optional<Spline> Spline::fromPoints(const QVector<QPointF>& points, bool closed)
{
    if (points.size() < 2) {
        qCDebug(logKernelSpline) << "fromPoints:too-few-points" << points.size();
        return std::nullopt;
    }
    return Spline(points, closed);
}

void Spline::invalidate()
{
    m_cache.clear();
    m_cacheSegments = 0;
}

void Spline::addPoint(const QPointF& point, int index)
{
    if (index < 0 || index > m_points.size()) {
        m_points.append(point);
    } else {
        m_points.insert(index, point);
    }
    invalidate();
}

bool Spline::removePoint(int index)
{
    if (m_points.size() <= 2 || index < 0 || index >= m_points.size()) {
        return false;
    }
    m_points.removeAt(index);
    invalidate();
    return true;
}

bool Spline::movePoint(int index, const QPointF& position)
{
    if (index < 0 || index >= m_points.size()) {
        return false;
    }
    m_points[index] = position;
    invalidate();
    return true;
}

QVector<QPointF> Spline::curvePoints(int segmentsPerSpan) const
{
    segmentsPerSpan = qMax(1, segmentsPerSpan);
    if (m_cacheSegments == segmentsPerSpan) {
        return m_cache;
    }

    const int n = m_points.size();
    const int spans = m_closed ? n : n - 1;
    QVector<QPointF> result;
    result.reserve(spans * segmentsPerSpan + 1);

    auto at = [this, n](int i) { return m_points[((i % n) + n) % n]; };

    for (int i = 0; i < spans; ++i) {
        QPointF p0 = at(i);
        QPointF p1 = at(i + 1);

        QPointF m0 = (!m_closed && i == 0)
            ? (p1 - p0) * 0.5
            : (p1 - at(i - 1)) * 0.5;
        QPointF m1 = (!m_closed && i == n - 2)
            ? (p1 - p0) * 0.5
            : (at(i + 2) - p0) * 0.5;

        for (int j = 0; j < segmentsPerSpan; ++j) {
            double t = double(j) / segmentsPerSpan;
            result.append(geometry::hermitePoint(p0, p1, m0, m1, t));
        }
    }

    if (m_closed) {
        result.append(result.first());
    } else {
        result.append(m_points.last());
    }

    m_cache = result;
    m_cacheSegments = segmentsPerSpan;
    return result;
}

double Spline::approximateLength() const
{
    return geometry::polylineLength(curvePoints());
}

QVector<SnapPoint> Spline::snapPoints() const
{
    QVector<SnapPoint> result;
    for (const QPointF& p : m_points) {
        result.append({p, SnapKind::Node, nullptr});
    }
    if (!m_closed) {
        result.append({m_points.first(), SnapKind::Endpoint, nullptr});
        result.append({m_points.last(), SnapKind::Endpoint, nullptr});
    }
    return result;
}

QVector<ControlPoint> Spline::controlPoints() const
{
    QVector<ControlPoint> result;
    for (int i = 0; i < m_points.size(); ++i) {
        result.append({m_points[i], QStringLiteral("Point %1").arg(i + 1), i});
    }
    return result;
}

bool Spline::moveControlPoint(int index, const QPointF& position)
{
    return movePoint(index, position);
}

geometry::BoundingBox Spline::boundingBox() const
{
    return geometry::pointsBounds(curvePoints());
}

double Spline::distanceTo(const QPointF& point) const
{
    return geometry::pointToPolylineDistance(point, curvePoints());
}

bool Spline::operator==(const Spline& other) const
{
    if (m_closed != other.m_closed || m_points.size() != other.m_points.size()) {
        return false;
    }
    for (int i = 0; i < m_points.size(); ++i) {
        if (!fuzzyEqual(m_points[i], other.m_points[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace kernel
}  // namespace draftcore

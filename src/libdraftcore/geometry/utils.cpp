// =====================================================================
//  src/libdraftcore/geometry/utils.cpp — Vector, angle and curve helpers
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/geometry/utils.h>
#include <draftcore/geometry/intersections.h>

#include <QLoggingCategory>

#include <cmath>

namespace draftcore {
namespace geometry {

Q_LOGGING_CATEGORY(logGeometry, "draftcore.geometry")

// ---- Vectors --------------------------------------------------------

double dot(const QPointF& a, const QPointF& b)
{
    return QPointF::dotProduct(a, b);
}

double cross(const QPointF& a, const QPointF& b)
{
    return a.x() * b.y() - b.x() * a.y();
}

double length(const QPointF& v)
{
    return qSqrt(lengthSquared(v));
}

double lengthSquared(const QPointF& v)
{
    return dot(v, v);
}

double distance(const QPointF& a, const QPointF& b)
{
    return length(b - a);
}

QPointF normalize(const QPointF& v)
{
    const double len = length(v);
    return len < DEFAULT_TOLERANCE ? QPointF() : v / len;
}

QPointF perpendicular(const QPointF& v)
{
    return QPointF(-v.y(), v.x());
}

QPointF lerp(const QPointF& a, const QPointF& b, double t)
{
    return a + (b - a) * t;
}

// ---- Angles ---------------------------------------------------------

double vectorAngle(const QPointF& v)
{
    return qRadiansToDegrees(qAtan2(v.y(), v.x()));
}

QPointF polarPoint(const QPointF& center, double radius, double angleDegrees)
{
    const double theta = qDegreesToRadians(angleDegrees);
    return center + radius * QPointF(qCos(theta), qSin(theta));
}

QPointF rotatePointAround(const QPointF& point, const QPointF& center,
                          double angleDegrees)
{
    const double theta = qDegreesToRadians(angleDegrees);
    const QPointF along(qCos(theta), qSin(theta));
    const QPointF rel = point - center;
    // rel * e^(i theta)
    return center + QPointF(rel.x() * along.x() - rel.y() * along.y(),
                            rel.x() * along.y() + rel.y() * along.x());
}

// ---- Circles through points -----------------------------------------

std::optional<Circumcircle> circumcircle(
    const QPointF& p1, const QPointF& p2, const QPointF& p3)
{
    // Work relative to p1 so large coordinates keep their precision
    const QPointF u = p2 - p1;
    const QPointF v = p3 - p1;
    const double d = 2.0 * cross(u, v);
    if (qAbs(d) < COLLINEAR_TOLERANCE) {
        qCDebug(logGeometry) << "circumcircle:collinear" << p1 << p2 << p3;
        return std::nullopt;
    }

    const double uu = lengthSquared(u);
    const double vv = lengthSquared(v);
    const QPointF offset((v.y() * uu - u.y() * vv) / d,
                         (u.x() * vv - v.x() * uu) / d);

    Circumcircle circle;
    circle.center = p1 + offset;
    circle.radius = length(offset);
    return circle;
}

std::optional<CircularArc> arcFromThreePoints(
    const QPointF& start, const QPointF& onArc, const QPointF& end)
{
    std::optional<Circumcircle> circle = circumcircle(start, onArc, end);
    if (!circle) {
        return std::nullopt;
    }

    const QPointF c = circle->center;
    const double twoPi = 2.0 * M_PI;

    auto polar = [&c, twoPi](const QPointF& p) {
        double a = qAtan2(p.y() - c.y(), p.x() - c.x());
        if (a < 0) a += twoPi;
        return a;
    };
    auto wrap = [twoPi](double a) {
        a = std::fmod(a, twoPi);
        if (a < 0) a += twoPi;
        return a;
    };

    double startAngle = polar(start);
    double midAngle = polar(onArc);
    double endAngle = polar(end);

    // CCW angular distances measured from the start point
    double spanCcw = wrap(endAngle - startAngle);
    double midCcw = wrap(midAngle - startAngle);

    double span = (midCcw <= spanCcw) ? spanCcw : -(twoPi - spanCcw);

    CircularArc arc;
    arc.center = c;
    arc.radius = circle->radius;
    arc.startAngle = normalizeAngle(qRadiansToDegrees(startAngle));
    arc.sweepAngle = qRadiansToDegrees(span);
    return arc;
}

QVector<QPointF> sampleArc(const CircularArc& arc, int segments)
{
    const int n = qMax(1, segments);
    QVector<QPointF> samples;
    samples.reserve(n + 1);
    for (int k = 0; k <= n; ++k)
        samples.append(arc.pointAt(double(k) / n));
    return samples;
}

// ---- Curves and polylines -------------------------------------------

QPointF hermitePoint(const QPointF& p0, const QPointF& p1,
                     const QPointF& m0, const QPointF& m1, double t)
{
    double t2 = t * t;
    double t3 = t2 * t;

    double h00 = 2 * t3 - 3 * t2 + 1;
    double h10 = t3 - 2 * t2 + t;
    double h01 = -2 * t3 + 3 * t2;
    double h11 = t3 - t2;

    return p0 * h00 + m0 * h10 + p1 * h01 + m1 * h11;
}

double polylineLength(const QVector<QPointF>& points)
{
    double sum = 0.0;
    for (int k = 1; k < points.size(); ++k)
        sum += distance(points.at(k - 1), points.at(k));
    return sum;
}

BoundingBox pointsBounds(const QVector<QPointF>& points)
{
    BoundingBox box;
    for (const QPointF& p : points) {
        box.include(p);
    }
    return box;
}

}  // namespace geometry
}  // namespace draftcore

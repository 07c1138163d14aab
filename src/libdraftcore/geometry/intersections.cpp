// =====================================================================
//  src/libdraftcore/geometry/intersections.cpp — Intersections, projections, distances
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/geometry/intersections.h>
#include <draftcore/geometry/utils.h>

#include <cmath>
#include <limits>
#include <optional>
#include <utility>

namespace draftcore {
namespace geometry {

namespace {

bool inUnitRange(double t)
{
    return t >= 0.0 && t <= 1.0;
}

// Parameter of the projection of point onto origin + t * dir.
// Returns nullopt for a direction too short to define a line.
std::optional<double> projectionParameter(const QPointF& point,
                                          const QPointF& origin,
                                          const QPointF& dir)
{
    const double lenSq = lengthSquared(dir);
    if (lenSq < DEFAULT_TOLERANCE * DEFAULT_TOLERANCE)
        return std::nullopt;
    return dot(point - origin, dir) / lenSq;
}

}  // namespace

// ---- Lines and circles ----------------------------------------------

LineLineIntersection lineLineIntersection(
    const QPointF& p1, const QPointF& p2,
    const QPointF& p3, const QPointF& p4)
{
    LineLineIntersection hit;

    const QPointF dirA = p2 - p1;
    const QPointF dirB = p4 - p3;
    const double denom = cross(dirA, dirB);
    if (qAbs(denom) < DEFAULT_TOLERANCE) {
        hit.parallel = true;
        return hit;
    }

    const QPointF gap = p3 - p1;
    hit.t1 = cross(gap, dirB) / denom;
    hit.t2 = cross(gap, dirA) / denom;
    hit.point = p1 + dirA * hit.t1;
    hit.intersects = true;
    hit.withinSegment1 = inUnitRange(hit.t1);
    hit.withinSegment2 = inUnitRange(hit.t2);
    return hit;
}

LineCircleIntersection lineCircleIntersection(
    const QPointF& lineStart, const QPointF& lineEnd,
    const QPointF& center, double radius)
{
    LineCircleIntersection hit;

    const QPointF dir = lineEnd - lineStart;
    const double a = lengthSquared(dir);
    if (a < DEFAULT_TOLERANCE * DEFAULT_TOLERANCE)
        return hit;

    // |lineStart + t*dir - center|^2 = r^2, with the linear term halved
    const QPointF rel = lineStart - center;
    const double halfB = dot(rel, dir);
    const double c = lengthSquared(rel) - radius * radius;
    const double quarterDisc = halfB * halfB - a * c;
    if (quarterDisc < 0)
        return hit;

    const double root = qSqrt(quarterDisc);
    const double tNear = (-halfB - root) / a;
    const double tFar = (-halfB + root) / a;

    hit.point1 = lineStart + dir * tNear;
    hit.point1InSegment = inUnitRange(tNear);
    if (2.0 * root < DEFAULT_TOLERANCE) {
        hit.count = 1;
        return hit;
    }
    hit.count = 2;
    hit.point2 = lineStart + dir * tFar;
    hit.point2InSegment = inUnitRange(tFar);
    return hit;
}

LineCircleIntersection lineEllipseIntersection(
    const QPointF& lineStart, const QPointF& lineEnd,
    const QPointF& center, double radiusX, double radiusY)
{
    if (radiusX < DEFAULT_TOLERANCE || radiusY < DEFAULT_TOLERANCE) {
        return LineCircleIntersection();
    }

    // Scale the ellipse onto the unit circle; line parameters are kept
    auto toUnit = [&](const QPointF& p) {
        return QPointF((p.x() - center.x()) / radiusX,
                       (p.y() - center.y()) / radiusY);
    };
    auto fromUnit = [&](const QPointF& p) {
        return QPointF(center.x() + p.x() * radiusX,
                       center.y() + p.y() * radiusY);
    };

    LineCircleIntersection result = lineCircleIntersection(
        toUnit(lineStart), toUnit(lineEnd), QPointF(0, 0), 1.0);

    if (result.count >= 1) result.point1 = fromUnit(result.point1);
    if (result.count >= 2) result.point2 = fromUnit(result.point2);
    return result;
}

CircleCircleIntersection circleCircleIntersection(
    const QPointF& center1, double radius1,
    const QPointF& center2, double radius2)
{
    CircleCircleIntersection hit;

    const QPointF between = center2 - center1;
    const double dist = length(between);
    if (dist < DEFAULT_TOLERANCE) {
        hit.coincident = qAbs(radius1 - radius2) < DEFAULT_TOLERANCE;
        return hit;
    }
    const bool apart = dist > radius1 + radius2 + DEFAULT_TOLERANCE;
    const bool nested = dist < qAbs(radius1 - radius2) - DEFAULT_TOLERANCE;
    if (apart || nested)
        return hit;

    // Distance from center1 to the chord, then half the chord length
    const double along =
        (radius1 * radius1 - radius2 * radius2 + dist * dist) / (2.0 * dist);
    const double halfChord = qSqrt(qMax(0.0, radius1 * radius1 - along * along));

    const QPointF axis = between / dist;
    const QPointF chordMid = center1 + axis * along;
    const QPointF normal(axis.y(), -axis.x());

    hit.point1 = chordMid + normal * halfChord;
    if (halfChord < DEFAULT_TOLERANCE) {
        hit.count = 1;
    } else {
        hit.count = 2;
        hit.point2 = chordMid - normal * halfChord;
    }
    return hit;
}

QVector<QPointF> circleTangentPoints(const QPointF& from,
                                     const QPointF& center, double radius)
{
    QVector<QPointF> result;

    double dx = center.x() - from.x();
    double dy = center.y() - from.y();
    double dist = qSqrt(dx * dx + dy * dy);

    if (dist < radius || dist < DEFAULT_TOLERANCE) {
        return result;
    }

    // Angle at the center between the line to `from` and each tangent point
    double toFrom = qAtan2(-dy, -dx);
    double alpha = qAcos(qBound(-1.0, radius / dist, 1.0));

    result.append(QPointF(center.x() + radius * qCos(toFrom + alpha),
                          center.y() + radius * qSin(toFrom + alpha)));
    result.append(QPointF(center.x() + radius * qCos(toFrom - alpha),
                          center.y() + radius * qSin(toFrom - alpha)));
    return result;
}

// ---- Nearest points -------------------------------------------------

QPointF closestPointOnLine(
    const QPointF& point,
    const QPointF& lineStart, const QPointF& lineEnd)
{
    const QPointF dir = lineEnd - lineStart;
    const std::optional<double> t = projectionParameter(point, lineStart, dir);
    if (!t)
        return lineStart;
    return lineStart + dir * qBound(0.0, *t, 1.0);
}

QPointF projectOntoInfiniteLine(
    const QPointF& point,
    const QPointF& linePoint1, const QPointF& linePoint2)
{
    const QPointF dir = linePoint2 - linePoint1;
    const std::optional<double> t = projectionParameter(point, linePoint1, dir);
    return t ? linePoint1 + dir * *t : linePoint1;
}

QPointF closestPointOnCircle(
    const QPointF& point,
    const QPointF& center, double radius)
{
    const QPointF offset = point - center;
    const double len = length(offset);
    // Every circle point is equally near the center; pick angle 0
    if (len < DEFAULT_TOLERANCE)
        return center + QPointF(radius, 0.0);
    return center + offset * (radius / len);
}

QPointF closestPointOnArc(const QPointF& point, const CircularArc& arc)
{
    double angle = vectorAngle(point - arc.center);

    if (arc.containsAngle(angle)) {
        return closestPointOnCircle(point, arc.center, arc.radius);
    }

    QPointF startPt = arc.startPoint();
    QPointF endPt = arc.endPoint();

    return (distance(point, startPt) <= distance(point, endPt)) ? startPt : endPt;
}

namespace {

// Root of F(s) = (r0*z0/(s+r0))^2 + (z1/(s+1))^2 - 1 by bisection.
// Stops once the midpoint can no longer be distinguished from a bound.
double ellipseRoot(double r0, double z0, double z1, double g)
{
    const int maxIterations = 1100;  // enough to exhaust double precision

    double n0 = r0 * z0;
    double s0 = z1 - 1.0;
    double s1 = (g < 0 ? 0.0 : qSqrt(n0 * n0 + z1 * z1) - 1.0);
    double s = 0.0;

    for (int i = 0; i < maxIterations; ++i) {
        s = (s0 + s1) / 2.0;
        if (s == s0 || s == s1) {
            break;
        }
        double ratio0 = n0 / (s + r0);
        double ratio1 = z1 / (s + 1.0);
        g = ratio0 * ratio0 + ratio1 * ratio1 - 1.0;
        if (g > 0) {
            s0 = s;
        } else if (g < 0) {
            s1 = s;
        } else {
            break;
        }
    }
    return s;
}

// Closest point for e0 >= e1 > 0 and a query in the first quadrant.
QPointF firstQuadrantClosest(double e0, double e1, double y0, double y1)
{
    if (y1 > 0) {
        if (y0 > 0) {
            double z0 = y0 / e0;
            double z1 = y1 / e1;
            double g = z0 * z0 + z1 * z1 - 1.0;
            if (g != 0) {
                double r0 = (e0 / e1) * (e0 / e1);
                double s = ellipseRoot(r0, z0, z1, g);
                return QPointF(r0 * y0 / (s + r0), y1 / (s + 1.0));
            }
            return QPointF(y0, y1);
        }
        return QPointF(0.0, e1);
    }

    double numer0 = e0 * y0;
    double denom0 = e0 * e0 - e1 * e1;
    if (numer0 < denom0) {
        double xde0 = numer0 / denom0;
        return QPointF(e0 * xde0, e1 * qSqrt(1.0 - xde0 * xde0));
    }
    return QPointF(e0, 0.0);
}

}  // namespace

QPointF closestPointOnEllipse(const QPointF& point, const QPointF& center,
                              double radiusX, double radiusY)
{
    radiusX = qAbs(radiusX);
    radiusY = qAbs(radiusY);

    bool flatX = radiusX < DEFAULT_TOLERANCE;
    bool flatY = radiusY < DEFAULT_TOLERANCE;

    if (flatX && flatY) {
        return center;
    }
    if (flatY) {
        return closestPointOnLine(point, center - QPointF(radiusX, 0),
                                  center + QPointF(radiusX, 0));
    }
    if (flatX) {
        return closestPointOnLine(point, center - QPointF(0, radiusY),
                                  center + QPointF(0, radiusY));
    }

    // Reduce to the first quadrant with the major axis along x
    double qx = point.x() - center.x();
    double qy = point.y() - center.y();
    double signX = qx < 0 ? -1.0 : 1.0;
    double signY = qy < 0 ? -1.0 : 1.0;
    double y0 = qAbs(qx);
    double y1 = qAbs(qy);
    double e0 = radiusX;
    double e1 = radiusY;

    bool swapped = e0 < e1;
    if (swapped) {
        std::swap(e0, e1);
        std::swap(y0, y1);
    }

    QPointF local = firstQuadrantClosest(e0, e1, y0, y1);
    double lx = local.x();
    double ly = local.y();
    if (swapped) {
        std::swap(lx, ly);
    }

    return QPointF(center.x() + signX * lx, center.y() + signY * ly);
}

// ---- Distances ------------------------------------------------------

double pointToLineDistance(
    const QPointF& point,
    const QPointF& lineStart, const QPointF& lineEnd)
{
    return distance(point, closestPointOnLine(point, lineStart, lineEnd));
}

double pointToCircleDistance(
    const QPointF& point,
    const QPointF& center, double radius)
{
    return qAbs(distance(point, center) - radius);
}

double pointToArcDistance(const QPointF& point, const CircularArc& arc)
{
    double angle = vectorAngle(point - arc.center);

    if (arc.containsAngle(angle)) {
        return pointToCircleDistance(point, arc.center, arc.radius);
    }

    return qMin(distance(point, arc.startPoint()),
                distance(point, arc.endPoint()));
}

double pointToEllipseDistance(const QPointF& point, const QPointF& center,
                              double radiusX, double radiusY)
{
    return distance(point, closestPointOnEllipse(point, center, radiusX, radiusY));
}

double pointToPolylineDistance(const QPointF& point,
                               const QVector<QPointF>& polyline, bool closed)
{
    if (polyline.isEmpty()) {
        return std::numeric_limits<double>::max();
    }
    if (polyline.size() == 1) {
        return distance(point, polyline.first());
    }

    double best = std::numeric_limits<double>::max();
    for (int i = 1; i < polyline.size(); ++i) {
        best = qMin(best, pointToLineDistance(point, polyline[i - 1], polyline[i]));
    }
    if (closed) {
        best = qMin(best, pointToLineDistance(point, polyline.last(), polyline.first()));
    }
    return best;
}

// ---- Angles ---------------------------------------------------------

double normalizeAngle(double degrees)
{
    double wrapped = std::fmod(degrees, 360.0);
    if (wrapped < 0)
        wrapped += 360.0;
    // fmod of a tiny negative value can round back up to 360
    return wrapped >= 360.0 ? wrapped - 360.0 : wrapped;
}

double normalizeAngleSigned(double degrees)
{
    const double wrapped = normalizeAngle(degrees);
    return wrapped > 180.0 ? wrapped - 360.0 : wrapped;
}

}  // namespace geometry
}  // namespace draftcore

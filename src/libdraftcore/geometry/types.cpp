// =====================================================================
//  src/libdraftcore/geometry/types.cpp — Geometry value types
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/geometry/types.h>
#include <draftcore/geometry/intersections.h>

namespace draftcore {
namespace geometry {

namespace {

QPointF pointAtDegrees(const QPointF& center, double radius, double degrees)
{
    const double rad = qDegreesToRadians(degrees);
    return QPointF(center.x() + radius * qCos(rad),
                   center.y() + radius * qSin(rad));
}

}  // namespace

// ---- CircularArc ----------------------------------------------------

bool CircularArc::containsAngle(double angle) const
{
    const double span = qAbs(sweepAngle);
    if (span >= 360.0 || qFuzzyCompare(span, 360.0))
        return true;

    // Offset of the query from the start, walked in the sweep direction
    const double offset = sweepAngle >= 0
        ? normalizeAngle(angle - startAngle)
        : normalizeAngle(startAngle - angle);
    return offset <= span;
}

QPointF CircularArc::startPoint() const
{
    return pointAtDegrees(center, radius, startAngle);
}

QPointF CircularArc::endPoint() const
{
    return pointAt(1.0);
}

QPointF CircularArc::pointAt(double t) const
{
    return pointAtDegrees(center, radius, startAngle + t * sweepAngle);
}

// ---- BoundingBox ----------------------------------------------------

BoundingBox::BoundingBox(double x1, double y1, double x2, double y2)
{
    include(QPointF(x1, y1));
    include(QPointF(x2, y2));
}

BoundingBox::BoundingBox(const QPointF& point)
{
    include(point);
}

void BoundingBox::include(const QPointF& point)
{
    const double x = point.x();
    const double y = point.y();
    if (valid) {
        if (x < minX) minX = x;
        if (x > maxX) maxX = x;
        if (y < minY) minY = y;
        if (y > maxY) maxY = y;
        return;
    }
    minX = maxX = x;
    minY = maxY = y;
    valid = true;
}

void BoundingBox::include(const BoundingBox& other)
{
    if (!other.valid)
        return;
    include(QPointF(other.minX, other.minY));
    include(QPointF(other.maxX, other.maxY));
}

QPointF BoundingBox::center() const
{
    return QPointF(0.5 * (minX + maxX), 0.5 * (minY + maxY));
}

bool BoundingBox::contains(const QPointF& point) const
{
    return valid
        && minX <= point.x() && point.x() <= maxX
        && minY <= point.y() && point.y() <= maxY;
}

bool BoundingBox::intersects(const BoundingBox& other) const
{
    if (!valid || !other.valid)
        return false;
    const bool apartX = other.minX > maxX || minX > other.maxX;
    const bool apartY = other.minY > maxY || minY > other.maxY;
    return !apartX && !apartY;
}

BoundingBox BoundingBox::adjusted(double margin) const
{
    BoundingBox grown = *this;
    if (grown.valid) {
        grown.minX -= margin;
        grown.minY -= margin;
        grown.maxX += margin;
        grown.maxY += margin;
    }
    return grown;
}

}  // namespace geometry
}  // namespace draftcore

// =====================================================================
//  src/libdraftcore/kernel/primitivetypes.cpp — Snap and control point types
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/kernel/primitivetypes.h>
#include <draftcore/geometry/utils.h>

#include <QtMath>

namespace draftcore {
namespace kernel {

QString defaultStyleName()
{
    return QStringLiteral("solid-primary");
}

QString snapKindName(SnapKind kind)
{
    switch (kind) {
    case SnapKind::Endpoint:      return QStringLiteral("ENDPOINT");
    case SnapKind::Midpoint:      return QStringLiteral("MIDPOINT");
    case SnapKind::Center:        return QStringLiteral("CENTER");
    case SnapKind::Quadrant:      return QStringLiteral("QUADRANT");
    case SnapKind::Node:          return QStringLiteral("NODE");
    case SnapKind::Intersection:  return QStringLiteral("INTERSECTION");
    case SnapKind::Perpendicular: return QStringLiteral("PERPENDICULAR");
    case SnapKind::Tangent:       return QStringLiteral("TANGENT");
    case SnapKind::Grid:          return QStringLiteral("GRID");
    }
    return QString();
}

std::optional<SnapKind> snapKindFromName(const QString& name)
{
    for (SnapKind kind : allSnapKinds()) {
        if (name.compare(snapKindName(kind), Qt::CaseInsensitive) == 0) {
            return kind;
        }
    }
    return std::nullopt;
}

QVector<SnapKind> allSnapKinds()
{
    return {
        SnapKind::Endpoint, SnapKind::Midpoint, SnapKind::Center,
        SnapKind::Quadrant, SnapKind::Node, SnapKind::Intersection,
        SnapKind::Perpendicular, SnapKind::Tangent, SnapKind::Grid
    };
}

double SnapPoint::distanceTo(const QPointF& point) const
{
    return geometry::distance(position, point);
}

bool fuzzyEqual(double a, double b)
{
    if (qFuzzyIsNull(a) && qFuzzyIsNull(b)) {
        return true;
    }
    return qFuzzyCompare(a, b);
}

bool fuzzyEqual(const QPointF& a, const QPointF& b)
{
    return fuzzyEqual(a.x(), b.x()) && fuzzyEqual(a.y(), b.y());
}

}  // namespace kernel
}  // namespace draftcore

// =====================================================================
//  src/libdraftcore/draftcore/kernel/primitivetypes.h — Snap and control point types
// =====================================================================
//
//  Value types shared by every primitive: the anchors a primitive
//  offers for snapping and the handles it offers for editing.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_KERNEL_PRIMITIVETYPES_H
#define DRAFTCORE_KERNEL_PRIMITIVETYPES_H

#include "../core.h"

#include <QHashFunctions>
#include <QPointF>
#include <QString>
#include <QVector>

#include <optional>

namespace draftcore {
namespace kernel {

class Primitive;

/// Style applied when a record carries none
DRAFTCORE_EXPORT QString defaultStyleName();

// =====================================================================
//  Snap Points
// =====================================================================

/// Kinds of snap anchors
enum class SnapKind {
    Endpoint,       ///< End of a segment, arc, edge or open spline
    Midpoint,       ///< Middle of a segment, arc or edge
    Center,         ///< Center of a circular or symmetric primitive
    Quadrant,       ///< Point at 0, 90, 180 or 270 degrees
    Node,           ///< Spline control point
    Intersection,   ///< Crossing of two primitives
    Perpendicular,  ///< Foot of a perpendicular from a reference point
    Tangent,        ///< Tangent point from a reference point
    Grid            ///< Nearest grid node
};

/// Stable upper-case name of a snap kind (e.g. "ENDPOINT")
DRAFTCORE_EXPORT QString snapKindName(SnapKind kind);

/// Parse a snap kind name; nullopt for unknown names
DRAFTCORE_EXPORT std::optional<SnapKind> snapKindFromName(const QString& name);

/// Every snap kind, in declaration order
DRAFTCORE_EXPORT QVector<SnapKind> allSnapKinds();

inline size_t qHash(SnapKind kind, size_t seed = 0) noexcept
{
    return ::qHash(static_cast<int>(kind), seed);
}

/// A candidate anchor emitted by a primitive
struct SnapPoint {
    QPointF position;
    SnapKind kind = SnapKind::Endpoint;
    const Primitive* source = nullptr;  ///< Non-owning; null for grid snaps

    /// Distance from this anchor to a point
    double distanceTo(const QPointF& point) const;
};

// =====================================================================
//  Control Points
// =====================================================================

/// An editable handle.  `index` is what moveControlPoint() expects.
struct ControlPoint {
    QPointF position;
    QString label;
    int index = 0;
};

// =====================================================================
//  Comparison Helpers
// =====================================================================

/// Relative comparison that also treats two near-zero values as equal
DRAFTCORE_EXPORT bool fuzzyEqual(double a, double b);

/// fuzzyEqual() on both coordinates
DRAFTCORE_EXPORT bool fuzzyEqual(const QPointF& a, const QPointF& b);

}  // namespace kernel
}  // namespace draftcore

#endif  // DRAFTCORE_KERNEL_PRIMITIVETYPES_H

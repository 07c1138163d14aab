// =====================================================================
//  src/libdraftcore/draftcore/snap/snapengine.h — Object snapping
// =====================================================================
//
//  Resolves a cursor position to the nearest snap anchor of a primitive
//  collection within a tolerance.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_SNAP_SNAPENGINE_H
#define DRAFTCORE_SNAP_SNAPENGINE_H

#include "../core.h"
#include "../kernel/primitive.h"
#include "../view/viewtransform.h"

#include <QJsonObject>
#include <QSet>
#include <QVector>

#include <optional>

namespace draftcore {
namespace snap {

/// Snap configuration
struct DRAFTCORE_EXPORT SnapSettings {
    bool enabled = true;                 ///< Master switch
    double snapRadius = 15.0;            ///< Tolerance in screen pixels
    QSet<kernel::SnapKind> activeKinds = defaultActiveKinds();
    double gridSpacing = 10.0;           ///< Scene units; used by Grid snaps

    /// Endpoint, Midpoint, Center, Intersection, Perpendicular, Tangent
    static QSet<kernel::SnapKind> defaultActiveKinds();

    /// {enabled, snap_radius, active_snaps:[names], grid_spacing}
    QJsonObject toJson() const;

    /// Missing fields keep their defaults; unknown kind names are skipped
    static SnapSettings fromJson(const QJsonObject& json);
};

/// Nearest-anchor search over a primitive collection.
///
/// Candidates are considered in this order, each replacing the current
/// best only when strictly nearer (so ties go to the first one found):
///   1. every primitive's own snap points, primitive by primitive;
///   2. intersections between pairs of nearby primitives;
///   3. perpendicular and tangent points from a reference point;
///   4. the nearest grid node, only when nothing else was found.
class DRAFTCORE_EXPORT SnapEngine {
public:
    explicit SnapEngine(const SnapSettings& settings = SnapSettings());

    const SnapSettings& settings() const { return m_settings; }
    void setSettings(const SnapSettings& settings) { m_settings = settings; }

    bool isEnabled() const { return m_settings.enabled; }
    void setEnabled(bool enabled) { m_settings.enabled = enabled; }

    bool isKindActive(kernel::SnapKind kind) const;
    void setKindActive(kernel::SnapKind kind, bool active);
    void toggleKind(kernel::SnapKind kind);

    /// Find the nearest enabled anchor closer than tolerance.
    /// @param scenePoint Cursor position in scene space
    /// @param primitives Collection to search
    /// @param tolerance Search radius in scene units
    /// @param exclude Primitive to skip (e.g. the one being drawn)
    /// @param reference Previous construction point for perpendicular
    ///        and tangent snaps
    std::optional<kernel::SnapPoint> findSnap(
        const QPointF& scenePoint,
        const QVector<kernel::Primitive>& primitives,
        double tolerance,
        const kernel::Primitive* exclude = nullptr,
        const std::optional<QPointF>& reference = std::nullopt) const;

    /// findSnap() for a screen position, with the tolerance converted
    /// from snapRadius pixels by the view's zoom
    std::optional<kernel::SnapPoint> findSnapAtScreen(
        const QPointF& screenPoint,
        const QVector<kernel::Primitive>& primitives,
        const view::ViewTransform& view,
        const kernel::Primitive* exclude = nullptr,
        const std::optional<QPointF>& reference = std::nullopt) const;

    // ---- Individual snap computations ----

    /// Crossing points of two primitives (source = a).  Splines do not
    /// take part.
    static QVector<kernel::SnapPoint> intersections(
        const kernel::Primitive& a, const kernel::Primitive& b);

    /// Foot of the perpendicular from reference onto a segment's line,
    /// onto the nearest rectangle or polygon edge containing it, or the
    /// nearest point of a circle or arc
    static std::optional<kernel::SnapPoint> perpendicular(
        const QPointF& reference, const kernel::Primitive& primitive);

    /// Tangent points from reference on a circle or arc (arc points
    /// must lie within the sweep)
    static QVector<kernel::SnapPoint> tangents(
        const QPointF& reference, const kernel::Primitive& primitive);

private:
    SnapSettings m_settings;
};

}  // namespace snap
}  // namespace draftcore

#endif  // DRAFTCORE_SNAP_SNAPENGINE_H

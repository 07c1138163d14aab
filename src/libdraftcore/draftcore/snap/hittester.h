// =====================================================================
//  src/libdraftcore/draftcore/snap/hittester.h — Primitive picking
// =====================================================================
//
//  Nearest-primitive search used for hover highlight, selection and
//  deletion targeting.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_SNAP_HITTESTER_H
#define DRAFTCORE_SNAP_HITTESTER_H

#include "../core.h"
#include "../kernel/primitive.h"
#include "../view/viewtransform.h"

#include <QJsonObject>
#include <QVector>

#include <optional>

namespace draftcore {
namespace snap {

/// Picking configuration
struct DRAFTCORE_EXPORT HitTestSettings {
    double threshold = 10.0;    ///< Pick distance in screen pixels

    QJsonObject toJson() const;
    static HitTestSettings fromJson(const QJsonObject& json);
};

/// Result of a hit test
struct HitTestResult {
    int index = -1;                               ///< Position in the searched collection
    const kernel::Primitive* primitive = nullptr; ///< Hit primitive (non-owning)
    double distance = 0.0;                        ///< Distance from query point to primitive
};

class DRAFTCORE_EXPORT HitTester {
public:
    explicit HitTester(const HitTestSettings& settings = HitTestSettings());

    const HitTestSettings& settings() const { return m_settings; }
    void setSettings(const HitTestSettings& settings) { m_settings = settings; }

    /// Primitive with the smallest distanceTo() strictly below tolerance.
    /// On equal distances the earlier primitive wins.
    /// @param tolerance Scene units
    std::optional<HitTestResult> findNearest(
        const QPointF& point,
        const QVector<kernel::Primitive>& primitives,
        double tolerance) const;

    /// findNearest() for a screen position, using threshold / zoom
    std::optional<HitTestResult> pickAtScreen(
        const QPointF& screenPoint,
        const QVector<kernel::Primitive>& primitives,
        const view::ViewTransform& view) const;

    /// All primitives strictly within tolerance, nearest first
    QVector<HitTestResult> findAllAt(
        const QPointF& point,
        const QVector<kernel::Primitive>& primitives,
        double tolerance) const;

private:
    HitTestSettings m_settings;
};

}  // namespace snap
}  // namespace draftcore

#endif  // DRAFTCORE_SNAP_HITTESTER_H

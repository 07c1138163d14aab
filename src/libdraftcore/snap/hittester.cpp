// =====================================================================
//  src/libdraftcore/snap/hittester.cpp — Primitive picking
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/snap/hittester.h>

#include <QLoggingCategory>

#include <algorithm>

namespace draftcore {
namespace snap {

Q_LOGGING_CATEGORY(logHitTest, "draftcore.snap.hittest")

QJsonObject HitTestSettings::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("threshold")] = threshold;
    return obj;
}

HitTestSettings HitTestSettings::fromJson(const QJsonObject& json)
{
    HitTestSettings settings;
    settings.threshold = json[QStringLiteral("threshold")].toDouble(settings.threshold);
    if (settings.threshold < 0.0) {
        qCWarning(logHitTest) << "settings:negative-threshold-coerced" << settings.threshold;
        settings.threshold = -settings.threshold;
    }
    return settings;
}

HitTester::HitTester(const HitTestSettings& settings)
    : m_settings(settings)
{
}

std::optional<HitTestResult> HitTester::findNearest(
    const QPointF& point,
    const QVector<kernel::Primitive>& primitives,
    double tolerance) const
{
    std::optional<HitTestResult> result;
    double bestDistance = tolerance;

    for (int i = 0; i < primitives.size(); ++i) {
        double dist = primitives[i].distanceTo(point);
        if (dist < bestDistance) {
            bestDistance = dist;
            result = HitTestResult{i, &primitives[i], dist};
        }
    }

    return result;
}

std::optional<HitTestResult> HitTester::pickAtScreen(
    const QPointF& screenPoint,
    const QVector<kernel::Primitive>& primitives,
    const view::ViewTransform& view) const
{
    return findNearest(view.toScene(screenPoint), primitives,
                       m_settings.threshold / view.zoom());
}

QVector<HitTestResult> HitTester::findAllAt(
    const QPointF& point,
    const QVector<kernel::Primitive>& primitives,
    double tolerance) const
{
    QVector<HitTestResult> hits;

    for (int i = 0; i < primitives.size(); ++i) {
        double dist = primitives[i].distanceTo(point);
        if (dist < tolerance) {
            hits.append(HitTestResult{i, &primitives[i], dist});
        }
    }

    // Sort by distance; equal distances keep collection order
    std::stable_sort(hits.begin(), hits.end(),
                     [](const HitTestResult& a, const HitTestResult& b) {
                         return a.distance < b.distance;
                     });

    return hits;
}

}  // namespace snap
}  // namespace draftcore

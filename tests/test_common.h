// =====================================================================
//  tests/test_common.h — Shared helpers for the libdraftcore tests
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_TESTS_TEST_COMMON_H
#define DRAFTCORE_TESTS_TEST_COMMON_H

#include <gtest/gtest.h>

#include <draftcore/kernel/primitive.h>
#include <draftcore/snap/hittester.h>
#include <draftcore/snap/snapengine.h>
#include <draftcore/view/viewtransform.h>

#include <QPointF>
#include <QVector>

namespace draftcore_test {

inline constexpr double kExact = 1e-9;
inline constexpr double kLoose = 1e-6;

/// Both coordinates within tolerance
#define EXPECT_POINT_NEAR(actual, expected, tol)                     \
    do {                                                             \
        const QPointF a_ = (actual);                                 \
        const QPointF e_ = (expected);                               \
        EXPECT_NEAR(a_.x(), e_.x(), (tol)) << "x of " #actual;       \
        EXPECT_NEAR(a_.y(), e_.y(), (tol)) << "y of " #actual;       \
    } while (0)

/// Primitive collection shared by the search tests
class SceneTest : public ::testing::Test {
protected:
    void add(const draftcore::kernel::Primitive::Geometry& geometry)
    {
        scene.append(draftcore::kernel::Primitive(geometry));
    }

    QVector<draftcore::kernel::Primitive> scene;
};

/// Snap engine with exactly the given kinds enabled
inline draftcore::snap::SnapEngine engineWith(
    std::initializer_list<draftcore::kernel::SnapKind> kinds)
{
    draftcore::snap::SnapSettings settings;
    settings.activeKinds.clear();
    for (draftcore::kernel::SnapKind kind : kinds) {
        settings.activeKinds.insert(kind);
    }
    return draftcore::snap::SnapEngine(settings);
}

}  // namespace draftcore_test

#endif  // DRAFTCORE_TESTS_TEST_COMMON_H

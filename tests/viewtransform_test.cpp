// =====================================================================
//  tests/viewtransform_test.cpp — Screen/scene mapping tests
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "test_common.h"

#include <QJsonObject>

#include <limits>

using namespace draftcore;
using namespace draftcore::view;
using namespace draftcore_test;

class ViewTransformTest : public ::testing::Test {
protected:
    ViewTransform view{QSizeF(800, 600)};
};

TEST_F(ViewTransformTest, ZoomedMappingExample) {
    ASSERT_TRUE(view.setZoom(2.0));
    EXPECT_POINT_NEAR(view.toScene(QPointF(500, 300)), QPointF(50, 0), kLoose);
    EXPECT_POINT_NEAR(view.fromScene(QPointF(50, 0)), QPointF(500, 300), kLoose);
}

TEST_F(ViewTransformTest, ScreenYIsFlipped) {
    EXPECT_POINT_NEAR(view.toScene(QPointF(400, 200)), QPointF(0, 100), kLoose);
}

TEST_F(ViewTransformTest, MappingsAreInverse) {
    const double zooms[] = {0.1, 0.5, 1.0, 2.0, 10.0};
    const double rotations[] = {0.0, 45.0, 90.0, 180.0, 270.0};
    const QPointF samples[] = {
        QPointF(0, 0), QPointF(800, 0), QPointF(0, 600), QPointF(800, 600), QPointF(400, 300)
    };

    view.setCamera(QPointF(-123.4, 567.8));
    for (double zoom : zooms) {
        for (double rotation : rotations) {
            ASSERT_TRUE(view.setZoom(zoom));
            view.setRotation(rotation);
            for (const QPointF& p : samples) {
                EXPECT_POINT_NEAR(view.fromScene(view.toScene(p)), p, kLoose);
            }
        }
    }
}

TEST_F(ViewTransformTest, RotationTurnsTheScene) {
    view.setRotation(90.0);
    // Screen right of center maps to scene -Y after a CCW view rotation
    EXPECT_POINT_NEAR(view.toScene(QPointF(500, 300)), QPointF(0, -100), kLoose);
}

TEST_F(ViewTransformTest, CornersAtIdentity) {
    SceneCorners corners = view.sceneCorners();
    EXPECT_POINT_NEAR(corners.topLeft, QPointF(-400, 300), kLoose);
    EXPECT_POINT_NEAR(corners.topRight, QPointF(400, 300), kLoose);
    EXPECT_POINT_NEAR(corners.bottomLeft, QPointF(-400, -300), kLoose);
    EXPECT_POINT_NEAR(corners.bottomRight, QPointF(400, -300), kLoose);

    geometry::BoundingBox visible = view.visibleSceneBounds();
    EXPECT_NEAR(visible.width(), 800.0, kLoose);
    EXPECT_NEAR(visible.height(), 600.0, kLoose);
}

TEST_F(ViewTransformTest, InvalidZoomIsRejected) {
    EXPECT_FALSE(view.setZoom(0.0));
    EXPECT_FALSE(view.setZoom(-1.0));
    EXPECT_FALSE(view.setZoom(std::numeric_limits<double>::infinity()));
    EXPECT_DOUBLE_EQ(view.zoom(), 1.0);
}

TEST_F(ViewTransformTest, RotationIsNormalized) {
    view.setRotation(-90.0);
    EXPECT_DOUBLE_EQ(view.rotation(), 270.0);
    view.rotateBy(100.0);
    EXPECT_DOUBLE_EQ(view.rotation(), 10.0);
}

TEST_F(ViewTransformTest, PanKeepsPointUnderCursor) {
    view.setZoom(2.5);
    view.setRotation(30.0);
    view.setCamera(QPointF(7, -3));

    const QPointF grab(120, 450);
    const QPointF delta(35, -60);
    QPointF grabbed = view.toScene(grab);

    view.panByScreenDelta(delta);
    EXPECT_POINT_NEAR(view.toScene(grab + delta), grabbed, kLoose);
}

TEST_F(ViewTransformTest, ZoomAtKeepsAnchorFixed) {
    view.setRotation(45.0);
    view.setCamera(QPointF(10, 20));

    const QPointF anchor(650, 120);
    QPointF before = view.toScene(anchor);

    ASSERT_TRUE(view.zoomAt(anchor, 4.0));
    EXPECT_DOUBLE_EQ(view.zoom(), 4.0);
    EXPECT_POINT_NEAR(view.toScene(anchor), before, kLoose);
}

TEST_F(ViewTransformTest, ZoomAtClampsToRange) {
    ASSERT_TRUE(view.zoomAt(QPointF(0, 0), 50.0));
    EXPECT_DOUBLE_EQ(view.zoom(), MAX_ZOOM);
    ASSERT_TRUE(view.zoomAt(QPointF(0, 0), 0.001));
    EXPECT_DOUBLE_EQ(view.zoom(), MIN_ZOOM);
    EXPECT_FALSE(view.zoomAt(QPointF(0, 0), -2.0));
}

TEST_F(ViewTransformTest, ZoomToFitCentersBounds) {
    geometry::BoundingBox bounds(100, 100, 300, 200);
    view.zoomToFit(bounds, 0.0);
    EXPECT_POINT_NEAR(view.camera(), QPointF(200, 150), kLoose);
    EXPECT_NEAR(view.zoom(), 4.0, kLoose);

    // Every corner of the bounds is visible
    geometry::BoundingBox visible = view.visibleSceneBounds().adjusted(kLoose);
    EXPECT_TRUE(visible.contains(QPointF(100, 100)));
    EXPECT_TRUE(visible.contains(QPointF(300, 200)));
}

TEST_F(ViewTransformTest, ZoomToFitInvalidBoundsResets) {
    view.setCamera(QPointF(50, 50));
    view.setZoom(3.0);
    view.zoomToFit(geometry::BoundingBox());
    EXPECT_POINT_NEAR(view.camera(), QPointF(0, 0), kExact);
    EXPECT_DOUBLE_EQ(view.zoom(), 1.0);
}

TEST_F(ViewTransformTest, StateRoundTripsThroughJson) {
    view.setCamera(QPointF(12.5, -4));
    view.setZoom(1.75);
    view.setRotation(30.0);

    ViewTransform restored(QSizeF(800, 600));
    ASSERT_TRUE(restored.fromJson(view.toJson()));
    EXPECT_POINT_NEAR(restored.camera(), view.camera(), kExact);
    EXPECT_DOUBLE_EQ(restored.zoom(), 1.75);
    EXPECT_DOUBLE_EQ(restored.rotation(), 30.0);

    QJsonObject bad;
    bad[QStringLiteral("zoom_factor")] = 0.0;
    QString error;
    EXPECT_FALSE(restored.fromJson(bad, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_DOUBLE_EQ(restored.zoom(), 1.75);
}

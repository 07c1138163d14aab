// =====================================================================
//  src/libdraftcore/draftcore/view/viewtransform.h — Screen/scene mapping
// =====================================================================
//
//  Maps between screen space (pixels, origin at the top-left of the
//  viewport, Y down) and scene space (Y up) through a camera position,
//  a zoom factor and a view rotation.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_VIEW_VIEWTRANSFORM_H
#define DRAFTCORE_VIEW_VIEWTRANSFORM_H

#include "../core.h"
#include "../geometry/types.h"

#include <QJsonObject>
#include <QPointF>
#include <QSizeF>

namespace draftcore {
namespace view {

/// Zoom range used by interactive zooming and zoom-to-fit
constexpr double MIN_ZOOM = 0.1;
constexpr double MAX_ZOOM = 10.0;

/// Viewport corners in scene space
struct SceneCorners {
    QPointF topLeft;
    QPointF topRight;
    QPointF bottomLeft;
    QPointF bottomRight;
};

/// Affine mapping between screen and scene.
///
/// toScene() centers the screen point on the viewport, flips Y, rotates
/// by -rotation, divides by zoom and adds the camera.  fromScene() is
/// the exact inverse.
class DRAFTCORE_EXPORT ViewTransform {
public:
    explicit ViewTransform(const QSizeF& viewportSize = QSizeF(0, 0));

    // ---- Mapping ----

    QPointF toScene(const QPointF& screenPoint) const;
    QPointF fromScene(const QPointF& scenePoint) const;

    /// The four viewport corners mapped into the scene
    SceneCorners sceneCorners() const;

    /// Axis-aligned scene box covering the whole (possibly rotated) viewport
    geometry::BoundingBox visibleSceneBounds() const;

    // ---- State ----

    QPointF camera() const { return m_camera; }
    void setCamera(const QPointF& camera) { m_camera = camera; }

    double zoom() const { return m_zoom; }

    /// Set the zoom factor.  Non-positive or non-finite values are
    /// refused and leave the zoom unchanged.
    bool setZoom(double zoom);

    /// Rotation in degrees, always in [0, 360)
    double rotation() const { return m_rotation; }
    void setRotation(double degrees);
    void rotateBy(double degrees);

    QSizeF viewportSize() const { return m_viewportSize; }
    void setViewportSize(const QSizeF& size) { m_viewportSize = size; }

    /// Camera at the origin, zoom 1, no rotation
    void reset();

    // ---- Navigation ----

    /// Move the camera so the scene follows a pointer drag of delta pixels
    void panByScreenDelta(const QPointF& delta);

    /// Change zoom (clamped to [MIN_ZOOM, MAX_ZOOM]) keeping the scene
    /// point under screenAnchor in place
    bool zoomAt(const QPointF& screenAnchor, double zoom);

    /// Center on bounds and pick the largest zoom that shows them with
    /// `padding` (fraction of the size) on each side.  Invalid bounds
    /// reset camera and zoom.
    void zoomToFit(const geometry::BoundingBox& bounds, double padding = 0.1);

    // ---- Persistence ----

    /// {camera_pos:{x,y}, zoom_factor, rotation_angle}
    QJsonObject toJson() const;

    /// Restore camera, zoom and rotation; missing fields take the
    /// defaults.  Returns false (state unchanged) for an invalid zoom.
    bool fromJson(const QJsonObject& json, QString* errorMsg = nullptr);

private:
    QPointF m_camera;
    double m_zoom = 1.0;
    double m_rotation = 0.0;
    QSizeF m_viewportSize;
};

}  // namespace view
}  // namespace draftcore

#endif  // DRAFTCORE_VIEW_VIEWTRANSFORM_H

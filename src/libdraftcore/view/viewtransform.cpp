// =====================================================================
//  src/libdraftcore/view/viewtransform.cpp — Screen/scene mapping
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/view/viewtransform.h>
#include <draftcore/geometry/intersections.h>

#include <QLoggingCategory>
#include <QtMath>

#include <cmath>

namespace draftcore {
namespace view {

Q_LOGGING_CATEGORY(logView, "draftcore.view")

namespace {

QPointF rotate(const QPointF& v, double degrees)
{
    double rad = qDegreesToRadians(degrees);
    double c = qCos(rad);
    double s = qSin(rad);
    return QPointF(v.x() * c - v.y() * s, v.x() * s + v.y() * c);
}

}  // namespace

ViewTransform::ViewTransform(const QSizeF& viewportSize)
    : m_viewportSize(viewportSize)
{
}

// =====================================================================
//  Mapping
// =====================================================================

QPointF ViewTransform::toScene(const QPointF& screenPoint) const
{
    QPointF centered(screenPoint.x() - m_viewportSize.width() / 2.0,
                     m_viewportSize.height() / 2.0 - screenPoint.y());
    return rotate(centered, -m_rotation) / m_zoom + m_camera;
}

QPointF ViewTransform::fromScene(const QPointF& scenePoint) const
{
    QPointF rotated = rotate((scenePoint - m_camera) * m_zoom, m_rotation);
    return QPointF(rotated.x() + m_viewportSize.width() / 2.0,
                   m_viewportSize.height() / 2.0 - rotated.y());
}

SceneCorners ViewTransform::sceneCorners() const
{
    double w = m_viewportSize.width();
    double h = m_viewportSize.height();

    SceneCorners corners;
    corners.topLeft = toScene(QPointF(0, 0));
    corners.topRight = toScene(QPointF(w, 0));
    corners.bottomLeft = toScene(QPointF(0, h));
    corners.bottomRight = toScene(QPointF(w, h));
    return corners;
}

geometry::BoundingBox ViewTransform::visibleSceneBounds() const
{
    SceneCorners c = sceneCorners();
    geometry::BoundingBox box(c.topLeft);
    box.include(c.topRight);
    box.include(c.bottomLeft);
    box.include(c.bottomRight);
    return box;
}

// =====================================================================
//  State
// =====================================================================

bool ViewTransform::setZoom(double zoom)
{
    if (!std::isfinite(zoom) || zoom <= 0) {
        qCWarning(logView) << "setZoom:rejected" << zoom;
        return false;
    }
    m_zoom = zoom;
    return true;
}

void ViewTransform::setRotation(double degrees)
{
    m_rotation = geometry::normalizeAngle(degrees);
}

void ViewTransform::rotateBy(double degrees)
{
    setRotation(m_rotation + degrees);
}

void ViewTransform::reset()
{
    m_camera = QPointF(0, 0);
    m_zoom = 1.0;
    m_rotation = 0.0;
}

// =====================================================================
//  Navigation
// =====================================================================

void ViewTransform::panByScreenDelta(const QPointF& delta)
{
    QPointF flipped(delta.x() / m_zoom, -delta.y() / m_zoom);
    m_camera -= rotate(flipped, -m_rotation);
}

bool ViewTransform::zoomAt(const QPointF& screenAnchor, double zoom)
{
    if (!std::isfinite(zoom) || zoom <= 0) {
        qCWarning(logView) << "zoomAt:rejected" << zoom;
        return false;
    }

    QPointF before = toScene(screenAnchor);
    m_zoom = qBound(MIN_ZOOM, zoom, MAX_ZOOM);
    m_camera += before - toScene(screenAnchor);
    return true;
}

void ViewTransform::zoomToFit(const geometry::BoundingBox& bounds, double padding)
{
    if (!bounds.valid) {
        m_camera = QPointF(0, 0);
        m_zoom = 1.0;
        return;
    }

    double width = bounds.width() * (1.0 + 2.0 * padding);
    double height = bounds.height() * (1.0 + 2.0 * padding);
    if (width < 0.01) width = 10.0;
    if (height < 0.01) height = 10.0;

    // Viewport extent along the scene axes once the view is rotated
    double rad = qDegreesToRadians(m_rotation);
    double c = qAbs(qCos(rad));
    double s = qAbs(qSin(rad));
    double effectiveWidth = m_viewportSize.width() * c + m_viewportSize.height() * s;
    double effectiveHeight = m_viewportSize.width() * s + m_viewportSize.height() * c;

    double zoom = qMin(effectiveWidth / width, effectiveHeight / height);
    m_zoom = qBound(MIN_ZOOM, zoom, MAX_ZOOM);
    m_camera = bounds.center();
}

// =====================================================================
//  Persistence
// =====================================================================

QJsonObject ViewTransform::toJson() const
{
    QJsonObject camera;
    camera[QStringLiteral("x")] = m_camera.x();
    camera[QStringLiteral("y")] = m_camera.y();

    QJsonObject obj;
    obj[QStringLiteral("camera_pos")] = camera;
    obj[QStringLiteral("zoom_factor")] = m_zoom;
    obj[QStringLiteral("rotation_angle")] = m_rotation;
    return obj;
}

bool ViewTransform::fromJson(const QJsonObject& json, QString* errorMsg)
{
    double zoom = json[QStringLiteral("zoom_factor")].toDouble(1.0);
    if (!std::isfinite(zoom) || zoom <= 0) {
        qCWarning(logView) << "fromJson:invalid-zoom" << zoom;
        if (errorMsg) *errorMsg = QStringLiteral("Invalid zoom_factor %1").arg(zoom);
        return false;
    }

    if (json.contains(QStringLiteral("camera_pos"))) {
        QJsonObject camera = json[QStringLiteral("camera_pos")].toObject();
        m_camera = QPointF(camera[QStringLiteral("x")].toDouble(0.0),
                           camera[QStringLiteral("y")].toDouble(0.0));
    }
    m_zoom = zoom;
    setRotation(json[QStringLiteral("rotation_angle")].toDouble(0.0));
    return true;
}

}  // namespace view
}  // namespace draftcore

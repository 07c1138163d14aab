// =====================================================================
//  src/libdraftcore/draftcore/kernel/records.h — Primitive JSON records
// =====================================================================
//
//  Record shapes (field names are the stable interchange format):
//
//    line       {type, start:{x,y}, end:{x,y}, style}
//    circle     {type, center:{x,y}, radius, style}
//    arc        {type, center:{x,y}, radius, start_angle, span_angle, style}
//    rectangle  {type, p1:{x,y}, p2:{x,y}, style, corner_radius, chamfer_size}
//    ellipse    {type, center:{x,y}, radius_x, radius_y, style}
//    polygon    {type, center:{x,y}, radius, num_sides, polygon_type,
//                rotation, style}
//    spline     {type, control_points:[{x,y}...], closed, style}
//
//  A scene document is {"objects": [record, ...]}.
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef DRAFTCORE_KERNEL_RECORDS_H
#define DRAFTCORE_KERNEL_RECORDS_H

#include "primitive.h"

#include <QJsonObject>
#include <QJsonValue>

#include <optional>

namespace draftcore {
namespace kernel {

/// {x, y} object for a point
DRAFTCORE_EXPORT QJsonObject pointToJson(const QPointF& point);

/// Read an {x, y} object; nullopt if either coordinate is missing or
/// not a number
DRAFTCORE_EXPORT std::optional<QPointF> pointFromJson(const QJsonValue& value);

/// Encode a primitive as its record
DRAFTCORE_EXPORT QJsonObject primitiveToJson(const Primitive& primitive);

/// Decode a record.
///
/// Missing optional fields take their defaults (style "solid-primary",
/// num_sides 6, polygon_type "inscribed", rotation 0, closed false,
/// corner_radius and chamfer_size 0).  An unknown type, a missing or
/// mistyped required field, an unknown polygon_type, or fewer than two
/// spline points fail the whole record.
/// @param errorMsg Receives a description of the failure (may be null)
DRAFTCORE_EXPORT std::optional<Primitive> primitiveFromJson(
    const QJsonObject& json, QString* errorMsg = nullptr);

/// Encode a collection as {"objects": [...]}
DRAFTCORE_EXPORT QJsonObject sceneToJson(const QVector<Primitive>& primitives);

/// Decode {"objects": [...]}; fails on the first invalid record
DRAFTCORE_EXPORT std::optional<QVector<Primitive>> sceneFromJson(
    const QJsonObject& json, QString* errorMsg = nullptr);

}  // namespace kernel
}  // namespace draftcore

#endif  // DRAFTCORE_KERNEL_RECORDS_H

// =====================================================================
//  src/libdraftcore/kernel/records.cpp — Primitive JSON records
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/kernel/records.h>

#include <QJsonArray>
#include <QLoggingCategory>

#include <cmath>

namespace draftcore {
namespace kernel {

Q_LOGGING_CATEGORY(logKernelRecords, "draftcore.kernel.records")

namespace {

bool fail(QString* errorMsg, const QString& message)
{
    qCWarning(logKernelRecords) << "decode:failed" << message;
    if (errorMsg) *errorMsg = message;
    return false;
}

QString invalidField(const char* key)
{
    return QStringLiteral("missing or invalid field '%1'").arg(QLatin1String(key));
}

bool readNumber(const QJsonObject& json, const char* key, double* out, QString* errorMsg)
{
    QJsonValue value = json.value(QLatin1String(key));
    if (!value.isDouble()) {
        return fail(errorMsg, invalidField(key));
    }
    *out = value.toDouble();
    return true;
}

bool readOptionalNumber(const QJsonObject& json, const char* key, double fallback,
                        double* out, QString* errorMsg)
{
    QJsonValue value = json.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        *out = fallback;
        return true;
    }
    if (!value.isDouble()) {
        return fail(errorMsg, invalidField(key));
    }
    *out = value.toDouble();
    return true;
}

bool readPoint(const QJsonObject& json, const char* key, QPointF* out, QString* errorMsg)
{
    std::optional<QPointF> point = pointFromJson(json.value(QLatin1String(key)));
    if (!point) {
        return fail(errorMsg, invalidField(key));
    }
    *out = *point;
    return true;
}

QString polygonFitName(PolygonFit fit)
{
    return fit == PolygonFit::Circumscribed ? QStringLiteral("circumscribed")
                                            : QStringLiteral("inscribed");
}

std::optional<Primitive::Geometry> geometryFromJson(PrimitiveType type,
                                                    const QJsonObject& json,
                                                    QString* errorMsg)
{
    switch (type) {
    case PrimitiveType::Segment: {
        QPointF start, end;
        if (!readPoint(json, "start", &start, errorMsg)) return std::nullopt;
        if (!readPoint(json, "end", &end, errorMsg)) return std::nullopt;
        return Primitive::Geometry(Segment(start, end));
    }

    case PrimitiveType::Circle: {
        QPointF center;
        double radius = 0;
        if (!readPoint(json, "center", &center, errorMsg)) return std::nullopt;
        if (!readNumber(json, "radius", &radius, errorMsg)) return std::nullopt;
        return Primitive::Geometry(Circle(center, radius));
    }

    case PrimitiveType::Arc: {
        QPointF center;
        double radius = 0, start = 0, span = 0;
        if (!readPoint(json, "center", &center, errorMsg)) return std::nullopt;
        if (!readNumber(json, "radius", &radius, errorMsg)) return std::nullopt;
        if (!readNumber(json, "start_angle", &start, errorMsg)) return std::nullopt;
        if (!readNumber(json, "span_angle", &span, errorMsg)) return std::nullopt;
        return Primitive::Geometry(Arc(center, radius, start, span));
    }

    case PrimitiveType::Rectangle: {
        QPointF p1, p2;
        double cornerRadius = 0, chamfer = 0;
        if (!readPoint(json, "p1", &p1, errorMsg)) return std::nullopt;
        if (!readPoint(json, "p2", &p2, errorMsg)) return std::nullopt;
        if (!readOptionalNumber(json, "corner_radius", 0.0, &cornerRadius, errorMsg))
            return std::nullopt;
        if (!readOptionalNumber(json, "chamfer_size", 0.0, &chamfer, errorMsg))
            return std::nullopt;
        return Primitive::Geometry(Rectangle(p1, p2, cornerRadius, chamfer));
    }

    case PrimitiveType::Ellipse: {
        QPointF center;
        double rx = 0, ry = 0;
        if (!readPoint(json, "center", &center, errorMsg)) return std::nullopt;
        if (!readNumber(json, "radius_x", &rx, errorMsg)) return std::nullopt;
        if (!readNumber(json, "radius_y", &ry, errorMsg)) return std::nullopt;
        return Primitive::Geometry(Ellipse(center, rx, ry));
    }

    case PrimitiveType::Polygon: {
        QPointF center;
        double radius = 0, sides = 6, rotation = 0;
        if (!readPoint(json, "center", &center, errorMsg)) return std::nullopt;
        if (!readNumber(json, "radius", &radius, errorMsg)) return std::nullopt;
        if (!readOptionalNumber(json, "num_sides", 6.0, &sides, errorMsg))
            return std::nullopt;
        // Whole numbers only; fewer than 3 is coerced by the constructor
        if (sides != std::floor(sides) || sides > MAX_POLYGON_SIDES) {
            fail(errorMsg, invalidField("num_sides"));
            return std::nullopt;
        }
        if (!readOptionalNumber(json, "rotation", 0.0, &rotation, errorMsg))
            return std::nullopt;

        PolygonFit fit = PolygonFit::Inscribed;
        QJsonValue fitValue = json.value(QStringLiteral("polygon_type"));
        if (!fitValue.isUndefined() && !fitValue.isNull()) {
            QString name = fitValue.toString();
            if (name == polygonFitName(PolygonFit::Circumscribed)) {
                fit = PolygonFit::Circumscribed;
            } else if (name != polygonFitName(PolygonFit::Inscribed)) {
                fail(errorMsg, QStringLiteral("unknown polygon_type '%1'").arg(name));
                return std::nullopt;
            }
        }
        return Primitive::Geometry(
            RegularPolygon(center, radius, static_cast<int>(qMax(sides, 0.0)), fit, rotation));
    }

    case PrimitiveType::Spline: {
        QJsonValue pointsValue = json.value(QStringLiteral("control_points"));
        if (!pointsValue.isArray()) {
            fail(errorMsg, invalidField("control_points"));
            return std::nullopt;
        }
        QVector<QPointF> points;
        const QJsonArray array = pointsValue.toArray();
        for (const QJsonValue& item : array) {
            std::optional<QPointF> p = pointFromJson(item);
            if (!p) {
                fail(errorMsg, invalidField("control_points"));
                return std::nullopt;
            }
            points.append(*p);
        }

        bool closed = false;
        QJsonValue closedValue = json.value(QStringLiteral("closed"));
        if (!closedValue.isUndefined() && !closedValue.isNull()) {
            if (!closedValue.isBool()) {
                fail(errorMsg, invalidField("closed"));
                return std::nullopt;
            }
            closed = closedValue.toBool();
        }

        std::optional<Spline> spline = Spline::fromPoints(points, closed);
        if (!spline) {
            fail(errorMsg, QStringLiteral("spline needs at least 2 control points, got %1")
                               .arg(points.size()));
            return std::nullopt;
        }
        return Primitive::Geometry(*spline);
    }
    }

    return std::nullopt;
}

}  // namespace

// =====================================================================
//  Points
// =====================================================================

QJsonObject pointToJson(const QPointF& point)
{
    QJsonObject obj;
    obj[QStringLiteral("x")] = point.x();
    obj[QStringLiteral("y")] = point.y();
    return obj;
}

std::optional<QPointF> pointFromJson(const QJsonValue& value)
{
    if (!value.isObject()) {
        return std::nullopt;
    }
    QJsonObject obj = value.toObject();
    QJsonValue x = obj.value(QStringLiteral("x"));
    QJsonValue y = obj.value(QStringLiteral("y"));
    if (!x.isDouble() || !y.isDouble()) {
        return std::nullopt;
    }
    return QPointF(x.toDouble(), y.toDouble());
}

// =====================================================================
//  Primitives
// =====================================================================

QJsonObject primitiveToJson(const Primitive& primitive)
{
    QJsonObject obj;
    obj[QStringLiteral("type")] = primitiveTypeName(primitive.type());

    switch (primitive.type()) {
    case PrimitiveType::Segment: {
        const Segment* s = primitive.geometryAs<Segment>();
        obj[QStringLiteral("start")] = pointToJson(s->start());
        obj[QStringLiteral("end")] = pointToJson(s->end());
        break;
    }
    case PrimitiveType::Circle: {
        const Circle* c = primitive.geometryAs<Circle>();
        obj[QStringLiteral("center")] = pointToJson(c->center());
        obj[QStringLiteral("radius")] = c->radius();
        break;
    }
    case PrimitiveType::Arc: {
        const Arc* a = primitive.geometryAs<Arc>();
        obj[QStringLiteral("center")] = pointToJson(a->center());
        obj[QStringLiteral("radius")] = a->radius();
        obj[QStringLiteral("start_angle")] = a->startAngle();
        obj[QStringLiteral("span_angle")] = a->spanAngle();
        break;
    }
    case PrimitiveType::Rectangle: {
        const Rectangle* r = primitive.geometryAs<Rectangle>();
        obj[QStringLiteral("p1")] = pointToJson(r->corner1());
        obj[QStringLiteral("p2")] = pointToJson(r->corner2());
        obj[QStringLiteral("corner_radius")] = r->cornerRadius();
        obj[QStringLiteral("chamfer_size")] = r->chamferSize();
        break;
    }
    case PrimitiveType::Ellipse: {
        const Ellipse* e = primitive.geometryAs<Ellipse>();
        obj[QStringLiteral("center")] = pointToJson(e->center());
        obj[QStringLiteral("radius_x")] = e->radiusX();
        obj[QStringLiteral("radius_y")] = e->radiusY();
        break;
    }
    case PrimitiveType::Polygon: {
        const RegularPolygon* p = primitive.geometryAs<RegularPolygon>();
        obj[QStringLiteral("center")] = pointToJson(p->center());
        obj[QStringLiteral("radius")] = p->radius();
        obj[QStringLiteral("num_sides")] = p->numSides();
        obj[QStringLiteral("polygon_type")] = polygonFitName(p->fit());
        obj[QStringLiteral("rotation")] = p->rotation();
        break;
    }
    case PrimitiveType::Spline: {
        const Spline* s = primitive.geometryAs<Spline>();
        QJsonArray points;
        for (const QPointF& p : s->points()) {
            points.append(pointToJson(p));
        }
        obj[QStringLiteral("control_points")] = points;
        obj[QStringLiteral("closed")] = s->isClosed();
        break;
    }
    }

    obj[QStringLiteral("style")] = primitive.styleName();
    return obj;
}

std::optional<Primitive> primitiveFromJson(const QJsonObject& json, QString* errorMsg)
{
    QJsonValue typeValue = json.value(QStringLiteral("type"));
    if (!typeValue.isString()) {
        fail(errorMsg, invalidField("type"));
        return std::nullopt;
    }

    std::optional<PrimitiveType> type = primitiveTypeFromName(typeValue.toString());
    if (!type) {
        fail(errorMsg, QStringLiteral("unknown primitive type '%1'").arg(typeValue.toString()));
        return std::nullopt;
    }

    QString style = defaultStyleName();
    QJsonValue styleValue = json.value(QStringLiteral("style"));
    if (!styleValue.isUndefined() && !styleValue.isNull()) {
        if (!styleValue.isString()) {
            fail(errorMsg, invalidField("style"));
            return std::nullopt;
        }
        style = styleValue.toString();
    }

    std::optional<Primitive::Geometry> geometry = geometryFromJson(*type, json, errorMsg);
    if (!geometry) {
        return std::nullopt;
    }
    return Primitive(std::move(*geometry), style);
}

// =====================================================================
//  Scene Documents
// =====================================================================

QJsonObject sceneToJson(const QVector<Primitive>& primitives)
{
    QJsonArray objects;
    for (const Primitive& p : primitives) {
        objects.append(primitiveToJson(p));
    }

    QJsonObject doc;
    doc[QStringLiteral("objects")] = objects;
    return doc;
}

std::optional<QVector<Primitive>> sceneFromJson(const QJsonObject& json, QString* errorMsg)
{
    QJsonValue objectsValue = json.value(QStringLiteral("objects"));
    if (!objectsValue.isArray()) {
        fail(errorMsg, invalidField("objects"));
        return std::nullopt;
    }

    QVector<Primitive> primitives;
    const QJsonArray objects = objectsValue.toArray();
    for (int i = 0; i < objects.size(); ++i) {
        QString recordError;
        std::optional<Primitive> p = primitiveFromJson(objects.at(i).toObject(), &recordError);
        if (!p) {
            if (errorMsg) {
                *errorMsg = QStringLiteral("object %1: %2").arg(i).arg(recordError);
            }
            return std::nullopt;
        }
        primitives.append(*p);
    }
    return primitives;
}

}  // namespace kernel
}  // namespace draftcore

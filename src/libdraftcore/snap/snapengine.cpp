// =====================================================================
//  src/libdraftcore/snap/snapengine.cpp — Object snapping
// =====================================================================
//
//  Part of libdraftcore.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <draftcore/snap/snapengine.h>
#include <draftcore/geometry/intersections.h>
#include <draftcore/geometry/utils.h>

#include <QJsonArray>
#include <QLoggingCategory>

namespace draftcore {
namespace snap {

Q_LOGGING_CATEGORY(logSnap, "draftcore.snap")

using kernel::Primitive;
using kernel::PrimitiveType;
using kernel::SnapKind;
using kernel::SnapPoint;

namespace {

// Pieces a primitive is decomposed into for intersection tests
struct Piece {
    enum class Kind { Line, Circle, Arc, Ellipse };

    Kind kind = Kind::Line;
    QPointF p1;                   ///< Line start
    QPointF p2;                   ///< Line end
    geometry::CircularArc arc;    ///< Circle (full sweep) or arc
    double radiusX = 0.0;         ///< Ellipse
    double radiusY = 0.0;         ///< Ellipse
};

Piece linePiece(const QPointF& a, const QPointF& b)
{
    Piece piece;
    piece.kind = Piece::Kind::Line;
    piece.p1 = a;
    piece.p2 = b;
    return piece;
}

QVector<Piece> closedOutline(const QVector<QPointF>& vertices)
{
    QVector<Piece> pieces;
    for (int i = 0; i < vertices.size(); ++i) {
        pieces.append(linePiece(vertices[i], vertices[(i + 1) % vertices.size()]));
    }
    return pieces;
}

QVector<Piece> decompose(const Primitive& primitive)
{
    switch (primitive.type()) {
    case PrimitiveType::Segment: {
        const kernel::Segment* s = primitive.geometryAs<kernel::Segment>();
        return {linePiece(s->start(), s->end())};
    }
    case PrimitiveType::Circle: {
        const kernel::Circle* c = primitive.geometryAs<kernel::Circle>();
        Piece piece;
        piece.kind = Piece::Kind::Circle;
        piece.arc = geometry::CircularArc{c->center(), c->radius(), 0.0, 360.0};
        return {piece};
    }
    case PrimitiveType::Arc: {
        Piece piece;
        piece.kind = Piece::Kind::Arc;
        piece.arc = primitive.geometryAs<kernel::Arc>()->toCircularArc();
        return {piece};
    }
    case PrimitiveType::Ellipse: {
        const kernel::Ellipse* e = primitive.geometryAs<kernel::Ellipse>();
        Piece piece;
        piece.kind = Piece::Kind::Ellipse;
        piece.arc.center = e->center();
        piece.radiusX = e->radiusX();
        piece.radiusY = e->radiusY();
        return {piece};
    }
    case PrimitiveType::Rectangle:
        return closedOutline(primitive.geometryAs<kernel::Rectangle>()->corners());
    case PrimitiveType::Polygon:
        return closedOutline(primitive.geometryAs<kernel::RegularPolygon>()->vertices());
    case PrimitiveType::Spline:
        break;
    }
    return {};
}

bool isRound(const Piece& piece)
{
    return piece.kind == Piece::Kind::Circle || piece.kind == Piece::Kind::Arc;
}

bool onSweep(const Piece& piece, const QPointF& point)
{
    if (piece.kind != Piece::Kind::Arc) {
        return true;
    }
    return piece.arc.containsAngle(geometry::vectorAngle(point - piece.arc.center));
}

QVector<QPointF> lineRoundPoints(const Piece& line, const Piece& round)
{
    QVector<QPointF> result;
    geometry::LineCircleIntersection hit = geometry::lineCircleIntersection(
        line.p1, line.p2, round.arc.center, round.arc.radius);

    if (hit.count >= 1 && hit.point1InSegment && onSweep(round, hit.point1)) {
        result.append(hit.point1);
    }
    if (hit.count >= 2 && hit.point2InSegment && onSweep(round, hit.point2)) {
        result.append(hit.point2);
    }
    return result;
}

QVector<QPointF> lineEllipsePoints(const Piece& line, const Piece& ellipse)
{
    QVector<QPointF> result;
    geometry::LineCircleIntersection hit = geometry::lineEllipseIntersection(
        line.p1, line.p2, ellipse.arc.center, ellipse.radiusX, ellipse.radiusY);

    if (hit.count >= 1 && hit.point1InSegment) result.append(hit.point1);
    if (hit.count >= 2 && hit.point2InSegment) result.append(hit.point2);
    return result;
}

QVector<QPointF> intersectPieces(const Piece& a, const Piece& b)
{
    using Kind = Piece::Kind;

    if (a.kind == Kind::Line && b.kind == Kind::Line) {
        geometry::LineLineIntersection hit =
            geometry::lineLineIntersection(a.p1, a.p2, b.p1, b.p2);
        if (hit.intersects && hit.withinSegment1 && hit.withinSegment2) {
            return {hit.point};
        }
        return {};
    }

    if (a.kind == Kind::Line && isRound(b)) return lineRoundPoints(a, b);
    if (isRound(a) && b.kind == Kind::Line) return lineRoundPoints(b, a);

    if (a.kind == Kind::Line && b.kind == Kind::Ellipse) return lineEllipsePoints(a, b);
    if (a.kind == Kind::Ellipse && b.kind == Kind::Line) return lineEllipsePoints(b, a);

    if (isRound(a) && isRound(b)) {
        geometry::CircleCircleIntersection hit = geometry::circleCircleIntersection(
            a.arc.center, a.arc.radius, b.arc.center, b.arc.radius);
        QVector<QPointF> result;
        if (hit.count >= 1 && onSweep(a, hit.point1) && onSweep(b, hit.point1)) {
            result.append(hit.point1);
        }
        if (hit.count >= 2 && onSweep(a, hit.point2) && onSweep(b, hit.point2)) {
            result.append(hit.point2);
        }
        return result;
    }

    // Ellipse against circle, arc or another ellipse is not resolved
    return {};
}

}  // namespace

// =====================================================================
//  SnapSettings
// =====================================================================

QSet<SnapKind> SnapSettings::defaultActiveKinds()
{
    return {
        SnapKind::Endpoint, SnapKind::Midpoint, SnapKind::Center,
        SnapKind::Intersection, SnapKind::Perpendicular, SnapKind::Tangent
    };
}

QJsonObject SnapSettings::toJson() const
{
    QJsonArray kinds;
    // Declaration order keeps the output stable
    for (SnapKind kind : kernel::allSnapKinds()) {
        if (activeKinds.contains(kind)) {
            kinds.append(kernel::snapKindName(kind));
        }
    }

    QJsonObject obj;
    obj[QStringLiteral("enabled")] = enabled;
    obj[QStringLiteral("snap_radius")] = snapRadius;
    obj[QStringLiteral("active_snaps")] = kinds;
    obj[QStringLiteral("grid_spacing")] = gridSpacing;
    return obj;
}

SnapSettings SnapSettings::fromJson(const QJsonObject& json)
{
    SnapSettings settings;
    settings.enabled = json[QStringLiteral("enabled")].toBool(settings.enabled);
    settings.snapRadius = json[QStringLiteral("snap_radius")].toDouble(settings.snapRadius);
    settings.gridSpacing = json[QStringLiteral("grid_spacing")].toDouble(settings.gridSpacing);
    if (settings.snapRadius < 0.0) {
        qCWarning(logSnap) << "settings:negative-radius-coerced" << settings.snapRadius;
        settings.snapRadius = -settings.snapRadius;
    }
    if (settings.gridSpacing < 0.0) {
        qCWarning(logSnap) << "settings:negative-grid-coerced" << settings.gridSpacing;
        settings.gridSpacing = -settings.gridSpacing;
    }

    if (json.contains(QStringLiteral("active_snaps"))) {
        settings.activeKinds.clear();
        const QJsonArray kinds = json[QStringLiteral("active_snaps")].toArray();
        for (const QJsonValue& value : kinds) {
            std::optional<SnapKind> kind = kernel::snapKindFromName(value.toString());
            if (kind) {
                settings.activeKinds.insert(*kind);
            } else {
                qCDebug(logSnap) << "settings:unknown-kind-skipped" << value.toString();
            }
        }
    }
    return settings;
}

// =====================================================================
//  SnapEngine
// =====================================================================

SnapEngine::SnapEngine(const SnapSettings& settings)
    : m_settings(settings)
{
}

bool SnapEngine::isKindActive(SnapKind kind) const
{
    return m_settings.activeKinds.contains(kind);
}

void SnapEngine::setKindActive(SnapKind kind, bool active)
{
    if (active) {
        m_settings.activeKinds.insert(kind);
    } else {
        m_settings.activeKinds.remove(kind);
    }
}

void SnapEngine::toggleKind(SnapKind kind)
{
    setKindActive(kind, !isKindActive(kind));
}

std::optional<SnapPoint> SnapEngine::findSnap(
    const QPointF& scenePoint,
    const QVector<Primitive>& primitives,
    double tolerance,
    const Primitive* exclude,
    const std::optional<QPointF>& reference) const
{
    if (!m_settings.enabled || m_settings.activeKinds.isEmpty()) {
        return std::nullopt;
    }

    std::optional<SnapPoint> best;
    double bestDistance = tolerance;

    auto consider = [&](const SnapPoint& candidate) {
        double d = candidate.distanceTo(scenePoint);
        if (d < bestDistance) {
            bestDistance = d;
            best = candidate;
        }
    };

    // 1. Anchors every primitive offers
    for (const Primitive& primitive : primitives) {
        if (&primitive == exclude) continue;
        const QVector<SnapPoint> points = primitive.snapPoints();
        for (const SnapPoint& sp : points) {
            if (isKindActive(sp.kind)) {
                consider(sp);
            }
        }
    }

    bool wantIntersections = isKindActive(SnapKind::Intersection);
    bool wantPerpendicular = reference && isKindActive(SnapKind::Perpendicular);
    bool wantTangent = reference && isKindActive(SnapKind::Tangent);

    if (wantIntersections || wantPerpendicular || wantTangent) {
        // Only primitives whose outline or center is close take part
        double searchRadius = tolerance * 2.0;
        bool checkCenter = isKindActive(SnapKind::Center);

        QVector<const Primitive*> nearby;
        for (const Primitive& primitive : primitives) {
            if (&primitive == exclude) continue;
            if (primitive.distanceTo(scenePoint) <= searchRadius) {
                nearby.append(&primitive);
                continue;
            }
            std::optional<QPointF> center = primitive.center();
            if (checkCenter && center
                && geometry::distance(*center, scenePoint) <= searchRadius) {
                nearby.append(&primitive);
            }
        }

        // 2. Pairwise intersections
        if (wantIntersections) {
            for (int i = 0; i < nearby.size(); ++i) {
                for (int j = i + 1; j < nearby.size(); ++j) {
                    const QVector<SnapPoint> points = intersections(*nearby[i], *nearby[j]);
                    for (const SnapPoint& sp : points) {
                        consider(sp);
                    }
                }
            }
        }

        // 3. Points relative to the previous construction point
        for (const Primitive* primitive : nearby) {
            if (wantPerpendicular) {
                std::optional<SnapPoint> sp = perpendicular(*reference, *primitive);
                if (sp) consider(*sp);
            }
            if (wantTangent) {
                const QVector<SnapPoint> points = tangents(*reference, *primitive);
                for (const SnapPoint& sp : points) {
                    consider(sp);
                }
            }
        }
    }

    // 4. Grid fallback
    if (!best && isKindActive(SnapKind::Grid) && m_settings.gridSpacing > 0) {
        double g = m_settings.gridSpacing;
        QPointF node(qRound64(scenePoint.x() / g) * g, qRound64(scenePoint.y() / g) * g);
        consider(SnapPoint{node, SnapKind::Grid, nullptr});
    }

    return best;
}

std::optional<SnapPoint> SnapEngine::findSnapAtScreen(
    const QPointF& screenPoint,
    const QVector<Primitive>& primitives,
    const view::ViewTransform& view,
    const Primitive* exclude,
    const std::optional<QPointF>& reference) const
{
    if (!m_settings.enabled) {
        return std::nullopt;
    }

    QPointF scenePoint = view.toScene(screenPoint);
    double tolerance = m_settings.snapRadius / view.zoom();
    return findSnap(scenePoint, primitives, tolerance, exclude, reference);
}

// =====================================================================
//  Individual Snap Computations
// =====================================================================

QVector<SnapPoint> SnapEngine::intersections(const Primitive& a, const Primitive& b)
{
    QVector<SnapPoint> result;

    const QVector<Piece> piecesA = decompose(a);
    const QVector<Piece> piecesB = decompose(b);

    for (const Piece& pa : piecesA) {
        for (const Piece& pb : piecesB) {
            const QVector<QPointF> points = intersectPieces(pa, pb);
            for (const QPointF& p : points) {
                result.append(SnapPoint{p, SnapKind::Intersection, &a});
            }
        }
    }
    return result;
}

std::optional<SnapPoint> SnapEngine::perpendicular(const QPointF& reference,
                                                   const Primitive& primitive)
{
    switch (primitive.type()) {
    case PrimitiveType::Segment: {
        QPointF foot = primitive.geometryAs<kernel::Segment>()->perpendicularFoot(reference);
        return SnapPoint{foot, SnapKind::Perpendicular, &primitive};
    }

    case PrimitiveType::Rectangle:
    case PrimitiveType::Polygon: {
        // Nearest foot that lands on an edge
        std::optional<SnapPoint> best;
        double bestDistance = 0.0;
        const QVector<Piece> edges = decompose(primitive);
        for (const Piece& edge : edges) {
            QPointF foot = geometry::projectOntoInfiniteLine(reference, edge.p1, edge.p2);
            if (geometry::pointToLineDistance(foot, edge.p1, edge.p2) > 1e-5) {
                continue;
            }
            double d = geometry::distance(foot, reference);
            if (!best || d < bestDistance) {
                bestDistance = d;
                best = SnapPoint{foot, SnapKind::Perpendicular, &primitive};
            }
        }
        return best;
    }

    case PrimitiveType::Circle: {
        QPointF p = primitive.geometryAs<kernel::Circle>()->closestPoint(reference);
        return SnapPoint{p, SnapKind::Perpendicular, &primitive};
    }

    case PrimitiveType::Arc: {
        QPointF p = geometry::closestPointOnArc(
            reference, primitive.geometryAs<kernel::Arc>()->toCircularArc());
        return SnapPoint{p, SnapKind::Perpendicular, &primitive};
    }

    case PrimitiveType::Ellipse:
    case PrimitiveType::Spline:
        break;
    }
    return std::nullopt;
}

QVector<SnapPoint> SnapEngine::tangents(const QPointF& reference,
                                        const Primitive& primitive)
{
    QVector<SnapPoint> result;

    geometry::CircularArc round;
    if (const kernel::Circle* c = primitive.geometryAs<kernel::Circle>()) {
        round = geometry::CircularArc{c->center(), c->radius(), 0.0, 360.0};
    } else if (const kernel::Arc* a = primitive.geometryAs<kernel::Arc>()) {
        round = a->toCircularArc();
    } else {
        return result;
    }

    const QVector<QPointF> points =
        geometry::circleTangentPoints(reference, round.center, round.radius);
    for (const QPointF& p : points) {
        if (round.containsAngle(geometry::vectorAngle(p - round.center))) {
            result.append(SnapPoint{p, SnapKind::Tangent, &primitive});
        }
    }
    return result;
}

}  // namespace snap
}  // namespace draftcore

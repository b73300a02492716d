#include "geometry/primitive.h"
#include <QtMath>

QRectF Primitive::bounds() const
{
    if (points.isEmpty()) return QRectF();

    double minX = points.first().x();
    double maxX = minX;
    double minY = points.first().y();
    double maxY = minY;
    for (const QPointF& p : points) {
        minX = qMin(minX, p.x());
        maxX = qMax(maxX, p.x());
        minY = qMin(minY, p.y());
        maxY = qMax(maxY, p.y());
    }
    return QRectF(QPointF(minX, minY), QPointF(maxX, maxY));
}

bool Primitive::operator==(const Primitive& other) const
{
    if (kind != other.kind || points.size() != other.points.size()) return false;
    for (int i = 0; i < points.size(); ++i) {
        if (points[i].x() != other.points[i].x() || points[i].y() != other.points[i].y()) {
            return false;
        }
    }
    return true;
}

int minimumPointCount(PrimitiveKind kind)
{
    switch (kind) {
        case PrimitiveKind::Point:   return 1;
        case PrimitiveKind::Line:    return 2;
        case PrimitiveKind::Polygon: return 3;
    }
    return 1;
}

QString primitiveKindTag(PrimitiveKind kind)
{
    switch (kind) {
        case PrimitiveKind::Point:   return QStringLiteral("POINT");
        case PrimitiveKind::Line:    return QStringLiteral("LINE");
        case PrimitiveKind::Polygon: return QStringLiteral("POLYGON");
    }
    return QString();
}

bool primitiveKindFromTag(const QString& tag, PrimitiveKind* kind)
{
    const QString upper = tag.toUpper();
    PrimitiveKind parsed;
    if (upper == QLatin1String("POINT")) {
        parsed = PrimitiveKind::Point;
    } else if (upper == QLatin1String("LINE")) {
        parsed = PrimitiveKind::Line;
    } else if (upper == QLatin1String("POLYGON")) {
        parsed = PrimitiveKind::Polygon;
    } else {
        return false;
    }
    if (kind) *kind = parsed;
    return true;
}

QString primitiveKindName(PrimitiveKind kind)
{
    switch (kind) {
        case PrimitiveKind::Point:   return QStringLiteral("point");
        case PrimitiveKind::Line:    return QStringLiteral("line");
        case PrimitiveKind::Polygon: return QStringLiteral("polygon");
    }
    return QString();
}

bool isValidGeometry(PrimitiveKind kind, const QVector<QPointF>& points, QString* reason)
{
    const int minimum = minimumPointCount(kind);
    if (kind == PrimitiveKind::Point && points.size() != 1) {
        if (reason) *reason = QString("A point needs exactly 1 coordinate, got %1").arg(points.size());
        return false;
    }
    if (points.size() < minimum) {
        if (reason) {
            *reason = QString("A %1 needs at least %2 points, got %3")
                .arg(primitiveKindName(kind)).arg(minimum).arg(points.size());
        }
        return false;
    }
    for (int i = 0; i < points.size(); ++i) {
        if (!qIsFinite(points[i].x()) || !qIsFinite(points[i].y())) {
            if (reason) *reason = QString("Coordinate %1 is not a finite number").arg(i + 1);
            return false;
        }
    }
    return true;
}

int Scene::count(PrimitiveKind kind) const
{
    int n = 0;
    for (const auto& p : primitives) {
        if (p.kind == kind) ++n;
    }
    return n;
}

int Scene::indexOf(PrimitiveId id) const
{
    if (id == InvalidPrimitiveId) return -1;
    for (int i = 0; i < primitives.size(); ++i) {
        if (primitives[i].id == id) return i;
    }
    return -1;
}

const Primitive* Scene::find(PrimitiveId id) const
{
    int index = indexOf(id);
    return index >= 0 ? &primitives[index] : nullptr;
}

Primitive* Scene::find(PrimitiveId id)
{
    int index = indexOf(id);
    return index >= 0 ? &primitives[index] : nullptr;
}

PrimitiveId Scene::append(PrimitiveKind kind, const QVector<QPointF>& points)
{
    PrimitiveId id = nextId++;
    primitives.append(Primitive(kind, points, id));
    return id;
}

QRectF Scene::extent() const
{
    bool hasData = false;
    double minX = 0, maxX = 0, minY = 0, maxY = 0;
    for (const auto& primitive : primitives) {
        for (const QPointF& p : primitive.points) {
            if (!hasData) {
                minX = maxX = p.x();
                minY = maxY = p.y();
                hasData = true;
                continue;
            }
            minX = qMin(minX, p.x());
            maxX = qMax(maxX, p.x());
            minY = qMin(minY, p.y());
            maxY = qMax(maxY, p.y());
        }
    }
    if (!hasData) return QRectF();
    return QRectF(QPointF(minX, minY), QPointF(maxX, maxY));
}

#include "geometry/geometrymodel.h"
#include <QPolygonF>
#include <QLineF>
#include <QtMath>
#include <QDebug>

GeometryModel::GeometryModel(QObject *parent) : QObject(parent)
{
}

PrimitiveId GeometryModel::addPoint(const QPointF& position)
{
    return addPrimitive(PrimitiveKind::Point, QVector<QPointF>() << position);
}

PrimitiveId GeometryModel::addLine(const QVector<QPointF>& points)
{
    return addPrimitive(PrimitiveKind::Line, points);
}

PrimitiveId GeometryModel::addPolygon(const QVector<QPointF>& points)
{
    return addPrimitive(PrimitiveKind::Polygon, points);
}

PrimitiveId GeometryModel::addPrimitive(PrimitiveKind kind, const QVector<QPointF>& points)
{
    m_lastError.clear();

    QString reason;
    if (!isValidGeometry(kind, points, &reason)) {
        fail(GeoErrorCode::InvalidGeometry, reason);
        return InvalidPrimitiveId;
    }

    PrimitiveId id = m_scene.append(kind, points);
    setModified(true);
    emit primitiveAdded(id);
    return id;
}

bool GeometryModel::removePrimitive(PrimitiveId id)
{
    m_lastError.clear();

    int index = m_scene.indexOf(id);
    if (index < 0) {
        return fail(GeoErrorCode::NotFound, QString("No primitive with id %1").arg(id));
    }

    m_scene.primitives.removeAt(index);
    setModified(true);
    emit primitiveRemoved(id);
    return true;
}

bool GeometryModel::movePoint(PrimitiveId id, int pointIndex, const QPointF& position)
{
    m_lastError.clear();

    Primitive* p = m_scene.find(id);
    if (!p) {
        return fail(GeoErrorCode::NotFound, QString("No primitive with id %1").arg(id));
    }
    if (pointIndex < 0 || pointIndex >= p->points.size()) {
        return fail(GeoErrorCode::IndexOutOfRange,
                    QString("Point index %1 is out of range for %2 %3 with %4 points")
                        .arg(pointIndex).arg(primitiveKindName(p->kind)).arg(id).arg(p->points.size()));
    }
    if (!qIsFinite(position.x()) || !qIsFinite(position.y())) {
        return fail(GeoErrorCode::InvalidGeometry, "Coordinate is not a finite number");
    }

    p->points[pointIndex] = position;
    setModified(true);
    emit primitiveChanged(id);
    return true;
}

bool GeometryModel::translatePrimitive(PrimitiveId id, const QPointF& delta)
{
    m_lastError.clear();

    Primitive* p = m_scene.find(id);
    if (!p) {
        return fail(GeoErrorCode::NotFound, QString("No primitive with id %1").arg(id));
    }
    if (!qIsFinite(delta.x()) || !qIsFinite(delta.y())) {
        return fail(GeoErrorCode::InvalidGeometry, "Offset is not a finite number");
    }
    if (delta.isNull()) return true;

    for (QPointF& pt : p->points) {
        pt += delta;
    }
    setModified(true);
    emit primitiveChanged(id);
    return true;
}

const Primitive* GeometryModel::primitive(PrimitiveId id) const
{
    return m_scene.find(id);
}

bool GeometryModel::contains(PrimitiveId id) const
{
    return m_scene.indexOf(id) >= 0;
}

void GeometryModel::setScene(const Scene& scene)
{
    m_scene = scene;
    // Keep ids unique even if the caller built the scene by hand
    for (const auto& p : m_scene.primitives) {
        if (p.id >= m_scene.nextId) m_scene.nextId = p.id + 1;
    }
    m_lastError.clear();
    setModified(false);
    emit sceneReset();
}

void GeometryModel::clear()
{
    m_scene.clear();
    m_lastError.clear();
    setModified(false);
    emit sceneReset();
}

PrimitiveId GeometryModel::hitTest(const QPointF& worldPos, double tolerance) const
{
    // Reverse paint order: points are drawn last, polygons first
    static const PrimitiveKind order[] = {
        PrimitiveKind::Point, PrimitiveKind::Line, PrimitiveKind::Polygon
    };

    for (PrimitiveKind kind : order) {
        for (int i = m_scene.primitives.size() - 1; i >= 0; --i) {
            const Primitive& p = m_scene.primitives[i];
            if (p.kind != kind) continue;
            if (hitsPrimitive(p, worldPos, tolerance)) return p.id;
        }
    }
    return InvalidPrimitiveId;
}

int GeometryModel::hitTestVertex(PrimitiveId id, const QPointF& worldPos, double tolerance) const
{
    const Primitive* p = m_scene.find(id);
    if (!p) return -1;

    int best = -1;
    double bestDist = tolerance;
    for (int i = 0; i < p->points.size(); ++i) {
        double dist = QLineF(worldPos, p->points[i]).length();
        if (dist <= bestDist) {
            bestDist = dist;
            best = i;
        }
    }
    return best;
}

void GeometryModel::setModified(bool modified)
{
    if (m_modified == modified) return;
    m_modified = modified;
    emit modifiedChanged(m_modified);
}

double GeometryModel::distanceToSegment(const QPointF& p, const QPointF& a, const QPointF& b)
{
    double dx = b.x() - a.x();
    double dy = b.y() - a.y();
    double lengthSq = dx * dx + dy * dy;

    double t = 0;
    if (lengthSq > 1e-12) {
        t = ((p.x() - a.x()) * dx + (p.y() - a.y()) * dy) / lengthSq;
        t = qBound(0.0, t, 1.0);
    }

    QPointF projection(a.x() + t * dx, a.y() + t * dy);
    return QLineF(p, projection).length();
}

bool GeometryModel::fail(GeoErrorCode code, const QString& message)
{
    m_lastError = GeoError(code, message);
    qDebug() << "[GeometryModel]" << geoErrorCodeName(code) << message;
    return false;
}

bool GeometryModel::hitsPrimitive(const Primitive& primitive, const QPointF& worldPos, double tolerance) const
{
    const QVector<QPointF>& pts = primitive.points;
    if (pts.isEmpty()) return false;

    if (primitive.kind == PrimitiveKind::Point) {
        return QLineF(worldPos, pts.first()).length() <= tolerance;
    }

    int segmentCount = primitive.isClosed() ? pts.size() : pts.size() - 1;
    for (int j = 0; j < segmentCount; ++j) {
        if (distanceToSegment(worldPos, pts[j], pts[(j + 1) % pts.size()]) <= tolerance) {
            return true;
        }
    }

    if (primitive.kind == PrimitiveKind::Polygon) {
        return QPolygonF(pts).containsPoint(worldPos, Qt::OddEvenFill);
    }
    return false;
}

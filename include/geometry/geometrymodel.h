#ifndef GEOMETRYMODEL_H
#define GEOMETRYMODEL_H

#include <QObject>
#include <QVector>
#include <QPointF>
#include <QRectF>
#include "core/geoerror.h"
#include "geometry/primitive.h"

// Owns the scene being viewed and edited. Every mutation goes through this
// class so that views can follow along through its signals.
class GeometryModel : public QObject {
    Q_OBJECT

public:
    explicit GeometryModel(QObject *parent = nullptr);

    // Append a primitive and return its id, or InvalidPrimitiveId with an
    // InvalidGeometry error when the vertex count or a coordinate is bad.
    PrimitiveId addPoint(const QPointF& position);
    PrimitiveId addLine(const QVector<QPointF>& points);
    PrimitiveId addPolygon(const QVector<QPointF>& points);
    PrimitiveId addPrimitive(PrimitiveKind kind, const QVector<QPointF>& points);

    bool removePrimitive(PrimitiveId id);
    bool movePoint(PrimitiveId id, int pointIndex, const QPointF& position);
    bool translatePrimitive(PrimitiveId id, const QPointF& delta);

    const Primitive* primitive(PrimitiveId id) const;
    bool contains(PrimitiveId id) const;
    const Scene& scene() const { return m_scene; }
    int count() const { return m_scene.size(); }
    bool isEmpty() const { return m_scene.isEmpty(); }
    QRectF extent() const { return m_scene.extent(); }

    // Replace everything (file load). Clears the modified flag.
    void setScene(const Scene& scene);
    void clear();

    // Topmost primitive within tolerance (world units) of worldPos.
    PrimitiveId hitTest(const QPointF& worldPos, double tolerance) const;
    // Index of the vertex of id nearest to worldPos within tolerance, or -1.
    int hitTestVertex(PrimitiveId id, const QPointF& worldPos, double tolerance) const;

    bool isModified() const { return m_modified; }
    void setModified(bool modified);

    GeoError lastError() const { return m_lastError; }

    static double distanceToSegment(const QPointF& p, const QPointF& a, const QPointF& b);

signals:
    void primitiveAdded(PrimitiveId id);
    void primitiveChanged(PrimitiveId id);
    void primitiveRemoved(PrimitiveId id);
    void sceneReset();
    void modifiedChanged(bool modified);

private:
    bool fail(GeoErrorCode code, const QString& message);
    bool hitsPrimitive(const Primitive& primitive, const QPointF& worldPos, double tolerance) const;

    Scene m_scene;
    bool m_modified{false};
    GeoError m_lastError;
};

#endif // GEOMETRYMODEL_H

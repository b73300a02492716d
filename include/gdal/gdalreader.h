#ifndef GDALREADER_H
#define GDALREADER_H

#include <QString>
#include <QStringList>
#include "geometry/primitive.h"

// Forward declaration of GDAL types
class GDALDataset;
class OGRGeometry;

// Imports the vector layers of any OGR readable dataset as scene
// primitives. Multi-part geometries are split into one primitive per part;
// polygons keep their exterior ring only.
class GdalReader {
public:
    GdalReader();
    ~GdalReader();

    // Initialize GDAL (call once at startup)
    static void initialize();

    bool readFile(const QString& fileName);

    const Scene& scene() const { return m_scene; }

    // Features or parts that could not be represented (holes, curves,
    // empty or degenerate geometries).
    int skippedCount() const { return m_skipped; }
    int layerCount() const { return m_layerCount; }

    // Coordinate Reference System of the first layer that has one (e.g. "EPSG:4326")
    QString crs() const { return m_crs; }

    static QString fileFilter();

    QString lastError() const { return m_lastError; }

private:
    bool readVectorData(GDALDataset* dataset);
    void appendGeometry(const OGRGeometry* geometry);
    void appendPart(PrimitiveKind kind, const QVector<QPointF>& points);

    Scene m_scene;
    int m_skipped{0};
    int m_layerCount{0};
    QString m_crs;
    QString m_lastError;
};

#endif // GDALREADER_H

#ifndef GDALWRITER_H
#define GDALWRITER_H

#include <QString>
#include <QVector>
#include "geometry/primitive.h"

// Forward declarations
class GDALDataset;
class GDALDriver;
class OGRSpatialReference;

enum class ExportFormat {
    GeoJSON,
    Shapefile,
    KML,
    GeoPackage
};

/**
 * @brief GdalWriter - Export scene primitives to GIS formats using GDAL/OGR
 */
class GdalWriter {
public:
    GdalWriter();
    ~GdalWriter();

    /**
     * @brief Export a scene
     *
     * GeoJSON gets a single layer holding every primitive. KML and
     * GeoPackage get one layer per primitive kind ("points", "lines",
     * "polygons"). Shapefiles hold a single geometry type, so a mixed scene
     * is written as <name>_points.shp, <name>_lines.shp and
     * <name>_polygons.shp next to the requested path.
     *
     * @param scene Primitives to export
     * @param filePath Output file path; an existing file is replaced
     * @param format Output format
     * @param crs Coordinate Reference System (e.g., "EPSG:4326"), ignored for KML
     * @return true if successful
     */
    bool exportScene(const Scene& scene,
                     const QString& filePath,
                     ExportFormat format,
                     const QString& crs = "");

    static QString driverName(ExportFormat format);
    static QString suffix(ExportFormat format);
    static QString fileFilter();
    static bool formatFromFilter(const QString& filter, ExportFormat* format);
    static bool formatFromPath(const QString& filePath, ExportFormat* format);

    /**
     * @brief Get last error message
     */
    QString lastError() const { return m_lastError; }

private:
    GDALDataset* createDataset(GDALDriver* driver, const QString& filePath);
    bool writeLayer(GDALDataset* dataset, const QString& layerName, OGRSpatialReference* srs,
                    const Scene& scene, const QVector<PrimitiveKind>& kinds);
    bool exportShapefiles(GDALDriver* driver, const Scene& scene,
                          const QString& filePath, OGRSpatialReference* srs);

    QString m_lastError;
};

#endif // GDALWRITER_H

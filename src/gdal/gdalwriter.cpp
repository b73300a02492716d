#include "gdal/gdalwriter.h"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <ogr_spatialref.h>
#include <cpl_conv.h>
#include <QFileInfo>
#include <QDir>
#include <QDebug>

namespace {

const PrimitiveKind s_allKinds[] = {
    PrimitiveKind::Point, PrimitiveKind::Line, PrimitiveKind::Polygon
};

OGRwkbGeometryType geometryType(PrimitiveKind kind)
{
    switch (kind) {
        case PrimitiveKind::Point:   return wkbPoint;
        case PrimitiveKind::Line:    return wkbLineString;
        case PrimitiveKind::Polygon: return wkbPolygon;
    }
    return wkbUnknown;
}

QString layerNameFor(PrimitiveKind kind)
{
    switch (kind) {
        case PrimitiveKind::Point:   return QStringLiteral("points");
        case PrimitiveKind::Line:    return QStringLiteral("lines");
        case PrimitiveKind::Polygon: return QStringLiteral("polygons");
    }
    return QString();
}

}

GdalWriter::GdalWriter() {}
GdalWriter::~GdalWriter() {}

bool GdalWriter::exportScene(const Scene& scene,
                             const QString& filePath,
                             ExportFormat format,
                             const QString& crs)
{
    m_lastError.clear();

    if (scene.isEmpty()) {
        m_lastError = "No primitives to export";
        return false;
    }

    const QString name = driverName(format);
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(name.toUtf8().constData());
    if (!driver) {
        m_lastError = QString("%1 driver not available").arg(name);
        return false;
    }

    // Set up spatial reference if provided (KML is always WGS84)
    OGRSpatialReference srs;
    OGRSpatialReference* srsPtr = nullptr;
    if (!crs.isEmpty() && format != ExportFormat::KML) {
        if (srs.SetFromUserInput(crs.toUtf8().constData()) == OGRERR_NONE) {
            srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
            srsPtr = &srs;
        } else {
            qWarning() << "[GdalWriter] Ignoring unknown CRS" << crs;
        }
    }

    if (format == ExportFormat::Shapefile) {
        return exportShapefiles(driver, scene, filePath, srsPtr);
    }

    GDALDataset* dataset = createDataset(driver, filePath);
    if (!dataset) return false;

    bool success = true;
    if (format == ExportFormat::GeoJSON) {
        // GeoJSON holds one layer of mixed geometry
        QVector<PrimitiveKind> kinds;
        for (PrimitiveKind kind : s_allKinds) kinds.append(kind);
        success = writeLayer(dataset, QFileInfo(filePath).completeBaseName(), srsPtr, scene, kinds);
    } else {
        for (PrimitiveKind kind : s_allKinds) {
            if (scene.count(kind) == 0) continue;
            if (!writeLayer(dataset, layerNameFor(kind), srsPtr, scene, QVector<PrimitiveKind>() << kind)) {
                success = false;
                break;
            }
        }
    }

    GDALClose(dataset);

    if (success) {
        qDebug() << "[GdalWriter] Exported" << scene.size() << "primitives to" << filePath << "as" << name;
    }
    return success;
}

bool GdalWriter::exportShapefiles(GDALDriver* driver, const Scene& scene,
                                  const QString& filePath, OGRSpatialReference* srs)
{
    QVector<PrimitiveKind> present;
    for (PrimitiveKind kind : s_allKinds) {
        if (scene.count(kind) > 0) present.append(kind);
    }

    QFileInfo info(filePath);
    const QString baseName = info.completeBaseName();
    const QDir dir = info.absoluteDir();

    for (PrimitiveKind kind : present) {
        QString path = filePath;
        if (present.size() > 1) {
            path = dir.filePath(QString("%1_%2.shp").arg(baseName, layerNameFor(kind)));
        }

        GDALDataset* dataset = createDataset(driver, path);
        if (!dataset) return false;

        bool ok = writeLayer(dataset, QFileInfo(path).completeBaseName(), srs, scene,
                             QVector<PrimitiveKind>() << kind);
        GDALClose(dataset);
        if (!ok) return false;
    }

    qDebug() << "[GdalWriter] Exported" << scene.size() << "primitives to" << present.size() << "shapefile(s)";
    return true;
}

GDALDataset* GdalWriter::createDataset(GDALDriver* driver, const QString& filePath)
{
    const QByteArray path = filePath.toUtf8();

    if (QFileInfo::exists(filePath)) {
        if (driver->Delete(path.constData()) != CE_None) {
            m_lastError = QString("Cannot replace %1: %2").arg(filePath).arg(CPLGetLastErrorMsg());
            qWarning() << "[GdalWriter]" << m_lastError;
            return nullptr;
        }
    }

    GDALDataset* dataset = driver->Create(path.constData(), 0, 0, 0, GDT_Unknown, nullptr);
    if (!dataset) {
        m_lastError = QString("Failed to create file: %1").arg(CPLGetLastErrorMsg());
        qWarning() << "[GdalWriter]" << m_lastError;
    }
    return dataset;
}

bool GdalWriter::writeLayer(GDALDataset* dataset, const QString& layerName, OGRSpatialReference* srs,
                            const Scene& scene, const QVector<PrimitiveKind>& kinds)
{
    OGRwkbGeometryType type = kinds.size() == 1 ? geometryType(kinds.first()) : wkbUnknown;
    OGRLayer* layer = dataset->CreateLayer(layerName.toUtf8().constData(), srs, type, nullptr);
    if (!layer) {
        m_lastError = QString("Failed to create layer %1: %2").arg(layerName).arg(CPLGetLastErrorMsg());
        return false;
    }

    OGRFieldDefn idField("id", OFTInteger);
    if (layer->CreateField(&idField) != OGRERR_NONE) {
        qWarning() << "[GdalWriter] Failed to create id field";
    }

    OGRFieldDefn kindField("kind", OFTString);
    kindField.SetWidth(16);
    if (layer->CreateField(&kindField) != OGRERR_NONE) {
        qWarning() << "[GdalWriter] Failed to create kind field";
    }

    bool hasArea = kinds.contains(PrimitiveKind::Polygon);
    if (hasArea) {
        OGRFieldDefn areaField("area", OFTReal);
        if (layer->CreateField(&areaField) != OGRERR_NONE) {
            qWarning() << "[GdalWriter] Failed to create area field";
            hasArea = false;
        }
    }

    for (const Primitive& primitive : scene.primitives) {
        if (!kinds.contains(primitive.kind)) continue;

        OGRFeature* feature = OGRFeature::CreateFeature(layer->GetLayerDefn());
        feature->SetField("id", primitive.id);
        feature->SetField("kind", primitiveKindTag(primitive.kind).toUtf8().constData());

        switch (primitive.kind) {
            case PrimitiveKind::Point: {
                OGRPoint point(primitive.position().x(), primitive.position().y());
                feature->SetGeometry(&point);
                break;
            }

            case PrimitiveKind::Line: {
                OGRLineString line;
                for (const auto& pt : primitive.points) {
                    line.addPoint(pt.x(), pt.y());
                }
                feature->SetGeometry(&line);
                break;
            }

            case PrimitiveKind::Polygon: {
                OGRLinearRing ring;
                for (const auto& pt : primitive.points) {
                    ring.addPoint(pt.x(), pt.y());
                }
                ring.closeRings();

                OGRPolygon polygon;
                polygon.addRing(&ring);
                feature->SetGeometry(&polygon);
                if (hasArea) feature->SetField("area", polygon.get_Area());
                break;
            }
        }

        OGRErr err = layer->CreateFeature(feature);
        OGRFeature::DestroyFeature(feature);
        if (err != OGRERR_NONE) {
            m_lastError = QString("Failed to write %1 %2: %3")
                .arg(primitiveKindName(primitive.kind)).arg(primitive.id).arg(CPLGetLastErrorMsg());
            qWarning() << "[GdalWriter]" << m_lastError;
            return false;
        }
    }

    return true;
}

QString GdalWriter::driverName(ExportFormat format)
{
    switch (format) {
        case ExportFormat::GeoJSON:    return "GeoJSON";
        case ExportFormat::Shapefile:  return "ESRI Shapefile";
        case ExportFormat::KML:        return "KML";
        case ExportFormat::GeoPackage: return "GPKG";
    }
    return QString();
}

QString GdalWriter::suffix(ExportFormat format)
{
    switch (format) {
        case ExportFormat::GeoJSON:    return "geojson";
        case ExportFormat::Shapefile:  return "shp";
        case ExportFormat::KML:        return "kml";
        case ExportFormat::GeoPackage: return "gpkg";
    }
    return QString();
}

QString GdalWriter::fileFilter()
{
    return "GeoJSON (*.geojson);;"
           "Shapefile (*.shp);;"
           "KML (*.kml);;"
           "GeoPackage (*.gpkg)";
}

bool GdalWriter::formatFromFilter(const QString& filter, ExportFormat* format)
{
    ExportFormat parsed;
    if (filter.startsWith("GeoJSON")) {
        parsed = ExportFormat::GeoJSON;
    } else if (filter.startsWith("Shapefile")) {
        parsed = ExportFormat::Shapefile;
    } else if (filter.startsWith("KML")) {
        parsed = ExportFormat::KML;
    } else if (filter.startsWith("GeoPackage")) {
        parsed = ExportFormat::GeoPackage;
    } else {
        return false;
    }
    if (format) *format = parsed;
    return true;
}

bool GdalWriter::formatFromPath(const QString& filePath, ExportFormat* format)
{
    const QString ext = QFileInfo(filePath).suffix().toLower();
    ExportFormat parsed;
    if (ext == "geojson" || ext == "json") {
        parsed = ExportFormat::GeoJSON;
    } else if (ext == "shp") {
        parsed = ExportFormat::Shapefile;
    } else if (ext == "kml") {
        parsed = ExportFormat::KML;
    } else if (ext == "gpkg") {
        parsed = ExportFormat::GeoPackage;
    } else {
        return false;
    }
    if (format) *format = parsed;
    return true;
}

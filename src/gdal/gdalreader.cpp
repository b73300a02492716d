#include "gdal/gdalreader.h"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <cpl_conv.h>
#include <QFileInfo>
#include <QDebug>

namespace {

QVector<QPointF> curvePoints(const OGRSimpleCurve* curve)
{
    QVector<QPointF> points;
    points.reserve(curve->getNumPoints());
    for (int j = 0; j < curve->getNumPoints(); ++j) {
        points.append(QPointF(curve->getX(j), curve->getY(j)));
    }
    return points;
}

}

GdalReader::GdalReader() {}

GdalReader::~GdalReader() {}

void GdalReader::initialize()
{
    GDALAllRegister();
}

bool GdalReader::readFile(const QString& fileName)
{
    m_scene.clear();
    m_skipped = 0;
    m_layerCount = 0;
    m_crs.clear();
    m_lastError.clear();

    GDALDataset* dataset = static_cast<GDALDataset*>(
        GDALOpenEx(fileName.toUtf8().constData(),
                   GDAL_OF_READONLY | GDAL_OF_VECTOR,
                   nullptr, nullptr, nullptr));

    if (!dataset) {
        m_lastError = QString("Failed to open file: %1").arg(CPLGetLastErrorMsg());
        qWarning() << "[GdalReader]" << m_lastError;
        return false;
    }

    bool success = readVectorData(dataset);
    GDALClose(dataset);

    if (!success && m_lastError.isEmpty()) {
        m_lastError = "No points, lines or polygons found in file";
    }
    if (success) {
        qDebug() << "[GdalReader] Read" << m_scene.size() << "primitives from"
                 << QFileInfo(fileName).fileName() << "skipped:" << m_skipped;
    }
    return success;
}

bool GdalReader::readVectorData(GDALDataset* dataset)
{
    int layerCount = dataset->GetLayerCount();
    if (layerCount == 0) return false;

    for (int i = 0; i < layerCount; ++i) {
        OGRLayer* layer = dataset->GetLayer(i);
        if (!layer) continue;
        ++m_layerCount;

        // Get CRS
        OGRSpatialReference* srs = layer->GetSpatialRef();
        if (srs && m_crs.isEmpty()) {
            const char* authName = srs->GetAuthorityName(nullptr);
            const char* authCode = srs->GetAuthorityCode(nullptr);
            if (authName && authCode) {
                m_crs = QString("%1:%2").arg(authName).arg(authCode);
            }
        }

        layer->ResetReading();
        OGRFeature* feature;
        while ((feature = layer->GetNextFeature()) != nullptr) {
            const OGRGeometry* geometry = feature->GetGeometryRef();
            if (geometry && !geometry->IsEmpty()) {
                appendGeometry(geometry);
            } else {
                ++m_skipped;
            }
            OGRFeature::DestroyFeature(feature);
        }
    }

    return !m_scene.isEmpty();
}

void GdalReader::appendGeometry(const OGRGeometry* geometry)
{
    switch (wkbFlatten(geometry->getGeometryType())) {
        case wkbPoint: {
            const OGRPoint* point = geometry->toPoint();
            appendPart(PrimitiveKind::Point, QVector<QPointF>() << QPointF(point->getX(), point->getY()));
            break;
        }

        case wkbLineString:
            appendPart(PrimitiveKind::Line, curvePoints(geometry->toLineString()));
            break;

        case wkbPolygon: {
            const OGRPolygon* polygon = geometry->toPolygon();
            const OGRLinearRing* extRing = polygon->getExteriorRing();
            if (!extRing) {
                ++m_skipped;
                break;
            }
            QVector<QPointF> ring = curvePoints(extRing);
            // Scene polygons are implicitly closed
            if (ring.size() > 1 && ring.first() == ring.last()) ring.removeLast();
            appendPart(PrimitiveKind::Polygon, ring);
            m_skipped += polygon->getNumInteriorRings();
            break;
        }

        case wkbMultiPoint:
        case wkbMultiLineString:
        case wkbMultiPolygon:
        case wkbGeometryCollection: {
            const OGRGeometryCollection* collection = geometry->toGeometryCollection();
            for (int k = 0; k < collection->getNumGeometries(); ++k) {
                appendGeometry(collection->getGeometryRef(k));
            }
            break;
        }

        default:
            // Curves, surfaces and other types have no scene equivalent
            ++m_skipped;
            break;
    }
}

void GdalReader::appendPart(PrimitiveKind kind, const QVector<QPointF>& points)
{
    if (!isValidGeometry(kind, points)) {
        ++m_skipped;
        return;
    }
    m_scene.append(kind, points);
}

QString GdalReader::fileFilter()
{
    return "All Supported Files (*.shp *.geojson *.json *.gpkg *.kml *.gpx *.gml);;"
           "Shapefile (*.shp);;"
           "GeoJSON (*.geojson *.json);;"
           "GeoPackage (*.gpkg);;"
           "KML (*.kml);;"
           "GPS Exchange (*.gpx);;"
           "All Files (*)";
}

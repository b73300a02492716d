#include "gdal/geosbridge.h"
#include "geometry/primitive.h"

#include <geos_c.h>

#include <QDebug>
#include <QLineF>

// Static GEOS context
static GEOSContextHandle_t s_geosContext = nullptr;
static QString s_lastError;

// Error handlers
static void geosErrorHandler(const char* message, void* /*userdata*/) {
    s_lastError = QString::fromUtf8(message);
    qDebug() << "[GeosBridge] GEOS error:" << message;
}

static void geosNoticeHandler(const char* /*message*/, void* /*userdata*/) {
    // Ignore notices
}

namespace GeosBridge {

void initialize()
{
    if (!s_geosContext) {
        s_geosContext = GEOS_init_r();
        if (s_geosContext) {
            GEOSContext_setErrorMessageHandler_r(s_geosContext, geosErrorHandler, nullptr);
            GEOSContext_setNoticeMessageHandler_r(s_geosContext, geosNoticeHandler, nullptr);
        }
    }
}

void cleanup()
{
    if (s_geosContext) {
        GEOS_finish_r(s_geosContext);
        s_geosContext = nullptr;
    }
}

QString lastError()
{
    return s_lastError;
}

// Owns a GEOS geometry for the duration of a call
class ScopedGeometry {
public:
    explicit ScopedGeometry(GEOSGeometry* geom) : m_geom(geom) {}
    ~ScopedGeometry() {
        if (m_geom) GEOSGeom_destroy_r(s_geosContext, m_geom);
    }
    ScopedGeometry(const ScopedGeometry&) = delete;
    ScopedGeometry& operator=(const ScopedGeometry&) = delete;

    GEOSGeometry* get() const { return m_geom; }
    explicit operator bool() const { return m_geom != nullptr; }

private:
    GEOSGeometry* m_geom;
};

// Helper: Create coordinate sequence, optionally appending the closing vertex
static GEOSCoordSequence* createCoordSeq(const QVector<QPointF>& points, bool closeRing)
{
    bool needsClosing = closeRing && points.first() != points.last();
    unsigned int size = static_cast<unsigned int>(points.size()) + (needsClosing ? 1 : 0);

    GEOSCoordSequence* seq = GEOSCoordSeq_create_r(s_geosContext, size, 2);
    if (!seq) return nullptr;

    for (int i = 0; i < points.size(); ++i) {
        GEOSCoordSeq_setXY_r(s_geosContext, seq, static_cast<unsigned int>(i),
                             points[i].x(), points[i].y());
    }

    if (needsClosing) {
        GEOSCoordSeq_setXY_r(s_geosContext, seq, size - 1, points.first().x(), points.first().y());
    }

    return seq;
}

// Helper: Create GEOS polygon from points
static GEOSGeometry* createPolygon(const QVector<QPointF>& points)
{
    if (!s_geosContext || points.size() < 3) return nullptr;

    GEOSCoordSequence* seq = createCoordSeq(points, true);
    if (!seq) return nullptr;

    GEOSGeometry* ring = GEOSGeom_createLinearRing_r(s_geosContext, seq);
    if (!ring) {
        GEOSCoordSeq_destroy_r(s_geosContext, seq);
        return nullptr;
    }

    GEOSGeometry* polygon = GEOSGeom_createPolygon_r(s_geosContext, ring, nullptr, 0);
    if (!polygon) {
        GEOSGeom_destroy_r(s_geosContext, ring);
    }

    return polygon;
}

// Helper: Create GEOS linestring from points
static GEOSGeometry* createLineString(const QVector<QPointF>& points)
{
    if (!s_geosContext || points.size() < 2) return nullptr;

    GEOSCoordSequence* seq = createCoordSeq(points, false);
    if (!seq) return nullptr;

    GEOSGeometry* line = GEOSGeom_createLineString_r(s_geosContext, seq);
    if (!line) {
        GEOSCoordSeq_destroy_r(s_geosContext, seq);
    }

    return line;
}

double calculateLength(const QVector<QPointF>& points, bool closed)
{
    initialize();
    s_lastError.clear();

    if (points.size() < 2) {
        s_lastError = "Need at least 2 points for length calculation";
        return 0.0;
    }

    // A two point "polygon" is just its segment walked twice
    if (closed && points.size() < 3) {
        return 2.0 * QLineF(points.first(), points.last()).length();
    }

    ScopedGeometry geom(closed ? createPolygon(points) : createLineString(points));
    if (!geom) {
        if (s_lastError.isEmpty()) s_lastError = "Failed to create geometry for length";
        return 0.0;
    }

    double length = 0.0;
    if (GEOSLength_r(s_geosContext, geom.get(), &length) != 1) {
        if (s_lastError.isEmpty()) s_lastError = "Length calculation failed";
        return 0.0;
    }
    return length;
}

double calculateArea(const QVector<QPointF>& points)
{
    initialize();
    s_lastError.clear();

    if (points.size() < 3) {
        s_lastError = "Need at least 3 points for area calculation";
        return 0.0;
    }

    ScopedGeometry polygon(createPolygon(points));
    if (!polygon) {
        if (s_lastError.isEmpty()) s_lastError = "Failed to create polygon for area";
        return 0.0;
    }

    double area = 0.0;
    if (GEOSArea_r(s_geosContext, polygon.get(), &area) != 1) {
        if (s_lastError.isEmpty()) s_lastError = "Area calculation failed";
        return 0.0;
    }
    return area;
}

QPointF calculateCentroid(const QVector<QPointF>& points)
{
    initialize();
    s_lastError.clear();

    if (points.size() < 3) {
        // For less than 3 points, return average
        if (points.isEmpty()) return QPointF(0, 0);
        double sumX = 0, sumY = 0;
        for (const auto& p : points) {
            sumX += p.x();
            sumY += p.y();
        }
        return QPointF(sumX / points.size(), sumY / points.size());
    }

    ScopedGeometry polygon(createPolygon(points));
    if (!polygon) {
        s_lastError = "Failed to create polygon for centroid";
        return QPointF(0, 0);
    }

    ScopedGeometry centroid(GEOSGetCentroid_r(s_geosContext, polygon.get()));
    if (!centroid) {
        s_lastError = "Centroid calculation failed";
        return QPointF(0, 0);
    }

    double x = 0.0, y = 0.0;
    GEOSGeomGetX_r(s_geosContext, centroid.get(), &x);
    GEOSGeomGetY_r(s_geosContext, centroid.get(), &y);
    return QPointF(x, y);
}

bool isValid(const QVector<QPointF>& points)
{
    initialize();
    s_lastError.clear();

    if (points.size() < 3) {
        s_lastError = "Need at least 3 points";
        return false;
    }

    ScopedGeometry polygon(createPolygon(points));
    if (!polygon) {
        if (s_lastError.isEmpty()) s_lastError = "Failed to create polygon for validation";
        return false;
    }

    char valid = GEOSisValid_r(s_geosContext, polygon.get());

    if (valid == 0) {
        // Get the reason for invalidity
        char* reason = GEOSisValidReason_r(s_geosContext, polygon.get());
        if (reason) {
            s_lastError = QString::fromUtf8(reason);
            GEOSFree_r(s_geosContext, reason);
        }
    }

    return valid == 1;
}

bool isSimple(const QVector<QPointF>& points)
{
    initialize();
    s_lastError.clear();

    if (points.size() < 2) {
        s_lastError = "Need at least 2 points";
        return false;
    }

    ScopedGeometry line(createLineString(points));
    if (!line) {
        if (s_lastError.isEmpty()) s_lastError = "Failed to create line for simplicity check";
        return false;
    }

    char simple = GEOSisSimple_r(s_geosContext, line.get());
    if (simple == 0) {
        s_lastError = "Self-intersection";
    }
    return simple == 1;
}

QStringList checkScene(const Scene& scene)
{
    QStringList issues;

    for (const Primitive& primitive : scene.primitives) {
        if (primitive.kind == PrimitiveKind::Polygon) {
            if (!isValid(primitive.points)) {
                issues << QString("Polygon %1: %2").arg(primitive.id).arg(s_lastError);
            }
        } else if (primitive.kind == PrimitiveKind::Line) {
            if (!isSimple(primitive.points)) {
                issues << QString("Line %1: %2").arg(primitive.id).arg(s_lastError);
            }
        }
    }

    qDebug() << "[GeosBridge] Checked" << scene.size() << "primitives," << issues.size() << "issue(s)";
    return issues;
}

} // namespace GeosBridge

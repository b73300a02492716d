#ifndef GEOSBRIDGE_H
#define GEOSBRIDGE_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <QPointF>

struct Scene;

/**
 * @brief GeosBridge - GEOS utility functions for scene measurement
 *
 * Provides measurement and validity checks using the GEOS C API.
 */
namespace GeosBridge {

/**
 * @brief Initialize GEOS context (call once at startup)
 */
void initialize();

/**
 * @brief Cleanup GEOS context (call at shutdown)
 */
void cleanup();

/**
 * @brief Get last error message
 */
QString lastError();

/**
 * @brief Calculate the length of a line or the perimeter of a polygon
 * @param points Vertices
 * @param closed True if polygon (auto-close), false if open line
 * @return Length in linear units (0 on error)
 */
double calculateLength(const QVector<QPointF>& points, bool closed);

/**
 * @brief Calculate the area of a closed polygon
 * @param points Polygon vertices (will be auto-closed)
 * @return Area in square units (0 if not a polygon)
 */
double calculateArea(const QVector<QPointF>& points);

/**
 * @brief Calculate the centroid of a polygon
 *
 * Fewer than 3 points returns the vertex average.
 */
QPointF calculateCentroid(const QVector<QPointF>& points);

/**
 * @brief Check if a polygon is geometrically valid (no self-intersections)
 *
 * On failure lastError() holds the GEOS reason.
 */
bool isValid(const QVector<QPointF>& points);

/**
 * @brief Check if a line does not cross itself
 */
bool isSimple(const QVector<QPointF>& points);

/**
 * @brief Report every invalid polygon and self-intersecting line
 * @return One message per problem, empty if the scene is clean
 */
QStringList checkScene(const Scene& scene);

} // namespace GeosBridge

#endif // GEOSBRIDGE_H

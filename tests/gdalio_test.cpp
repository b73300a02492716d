#include "test_common.h"
#include "gdal/gdalreader.h"
#include "gdal/gdalwriter.h"
#include <QTemporaryDir>
#include <QFile>
#include <QFileInfo>

using namespace test_util;

class GdalIoTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        GdalReader::initialize();
    }

    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
    }

    QTemporaryDir dir;
    GdalWriter writer;
    GdalReader reader;
};

TEST_F(GdalIoTest, GeoJsonExportImportReproducesScene) {
    const Scene scene = mixedScene();
    const QString path = dir.filePath("scene.geojson");

    ASSERT_TRUE(writer.exportScene(scene, path, ExportFormat::GeoJSON)) << writer.lastError().toStdString();
    ASSERT_TRUE(reader.readFile(path)) << reader.lastError().toStdString();

    EXPECT_EQ(reader.scene(), scene);
    EXPECT_EQ(reader.layerCount(), 1);
    EXPECT_EQ(reader.skippedCount(), 0);
}

TEST_F(GdalIoTest, ExportReplacesExistingFile) {
    const QString path = dir.filePath("replace.geojson");
    ASSERT_TRUE(writer.exportScene(mixedScene(), path, ExportFormat::GeoJSON));

    Scene single;
    single.append(PrimitiveKind::Point, pts({ QPointF(-3, 4) }));
    ASSERT_TRUE(writer.exportScene(single, path, ExportFormat::GeoJSON)) << writer.lastError().toStdString();

    ASSERT_TRUE(reader.readFile(path));
    EXPECT_EQ(reader.scene(), single);
}

TEST_F(GdalIoTest, GeoPackageGetsOneLayerPerKind) {
    const QString path = dir.filePath("scene.gpkg");
    ASSERT_TRUE(writer.exportScene(mixedScene(), path, ExportFormat::GeoPackage, "EPSG:32633"))
        << writer.lastError().toStdString();

    ASSERT_TRUE(reader.readFile(path)) << reader.lastError().toStdString();
    EXPECT_EQ(reader.layerCount(), 3);
    EXPECT_EQ(reader.scene().count(PrimitiveKind::Point), 1);
    EXPECT_EQ(reader.scene().count(PrimitiveKind::Line), 1);
    EXPECT_EQ(reader.scene().count(PrimitiveKind::Polygon), 1);
    EXPECT_EQ(reader.crs(), QString("EPSG:32633"));
}

TEST_F(GdalIoTest, MixedSceneIsSplitIntoShapefiles) {
    const QString path = dir.filePath("survey.shp");
    ASSERT_TRUE(writer.exportScene(mixedScene(), path, ExportFormat::Shapefile))
        << writer.lastError().toStdString();

    EXPECT_TRUE(QFileInfo::exists(dir.filePath("survey_points.shp")));
    EXPECT_TRUE(QFileInfo::exists(dir.filePath("survey_lines.shp")));
    ASSERT_TRUE(QFileInfo::exists(dir.filePath("survey_polygons.shp")));

    ASSERT_TRUE(reader.readFile(dir.filePath("survey_polygons.shp")));
    ASSERT_EQ(reader.scene().size(), 1);
    // Shapefile rings may come back with the opposite winding
    const Primitive& polygon = reader.scene().primitives.first();
    EXPECT_EQ(polygon.kind, PrimitiveKind::Polygon);
    EXPECT_EQ(polygon.points.size(), 4);
    EXPECT_EQ(polygon.bounds(), QRectF(0, 0, 10, 10));
}

TEST_F(GdalIoTest, SingleKindShapefileUsesRequestedName) {
    Scene lines;
    lines.append(PrimitiveKind::Line, pts({ QPointF(0, 0), QPointF(1, 1) }));
    lines.append(PrimitiveKind::Line, pts({ QPointF(2, 2), QPointF(3, 5), QPointF(4, 4) }));

    const QString path = dir.filePath("roads.shp");
    ASSERT_TRUE(writer.exportScene(lines, path, ExportFormat::Shapefile)) << writer.lastError().toStdString();
    ASSERT_TRUE(reader.readFile(path));
    EXPECT_EQ(reader.scene(), lines);
}

TEST_F(GdalIoTest, EmptySceneIsNotExported) {
    EXPECT_FALSE(writer.exportScene(Scene(), dir.filePath("empty.geojson"), ExportFormat::GeoJSON));
    EXPECT_FALSE(writer.lastError().isEmpty());
}

TEST_F(GdalIoTest, UnreadableFileFails) {
    const QString path = dir.filePath("notes.txt");
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("this is not a vector dataset\n");
    file.close();

    EXPECT_FALSE(reader.readFile(path));
    EXPECT_FALSE(reader.lastError().isEmpty());
    EXPECT_TRUE(reader.scene().isEmpty());
}

TEST_F(GdalIoTest, MultiPartFeaturesSplitAndUnrepresentablePartsSkipped) {
    const QString path = dir.filePath("parts.geojson");
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(R"({"type": "FeatureCollection", "features": [
  {"type": "Feature", "properties": {}, "geometry": {"type": "MultiPolygon", "coordinates": [
    [[[0, 0], [10, 0], [10, 10], [0, 10], [0, 0]], [[2, 2], [4, 2], [4, 4], [2, 2]]],
    [[[20, 20], [30, 20], [30, 30], [20, 20]]]]}},
  {"type": "Feature", "properties": {}, "geometry": {"type": "MultiLineString", "coordinates": [
    [[0, 0], [1, 1]], [[5, 5], [6, 7], [8, 8]]]}},
  {"type": "Feature", "properties": {}, "geometry": {"type": "LineString", "coordinates": [[3, 3]]}}
]}
)");
    file.close();

    ASSERT_TRUE(reader.readFile(path)) << reader.lastError().toStdString();
    const Scene& scene = reader.scene();
    ASSERT_EQ(scene.size(), 4);

    // Closing vertex dropped, hole skipped
    EXPECT_EQ(scene.primitives.at(0).kind, PrimitiveKind::Polygon);
    EXPECT_EQ(scene.primitives.at(0).points,
              pts({ QPointF(0, 0), QPointF(10, 0), QPointF(10, 10), QPointF(0, 10) }));
    EXPECT_EQ(scene.primitives.at(1).kind, PrimitiveKind::Polygon);
    EXPECT_EQ(scene.primitives.at(1).points, pts({ QPointF(20, 20), QPointF(30, 20), QPointF(30, 30) }));

    EXPECT_EQ(scene.primitives.at(2).kind, PrimitiveKind::Line);
    EXPECT_EQ(scene.primitives.at(2).points, pts({ QPointF(0, 0), QPointF(1, 1) }));
    EXPECT_EQ(scene.primitives.at(3).kind, PrimitiveKind::Line);
    EXPECT_EQ(scene.primitives.at(3).points.size(), 3);

    // One interior ring plus the one-vertex line
    EXPECT_EQ(reader.skippedCount(), 2);
}

TEST(GdalWriterFormatTest, FormatFromPath) {
    ExportFormat format = ExportFormat::GeoJSON;
    EXPECT_TRUE(GdalWriter::formatFromPath("/tmp/a.SHP", &format));
    EXPECT_EQ(format, ExportFormat::Shapefile);
    EXPECT_TRUE(GdalWriter::formatFromPath("b.gpkg", &format));
    EXPECT_EQ(format, ExportFormat::GeoPackage);
    EXPECT_FALSE(GdalWriter::formatFromPath("c.txt", &format));
    EXPECT_EQ(format, ExportFormat::GeoPackage);

    EXPECT_TRUE(GdalWriter::formatFromFilter("KML (*.kml)", &format));
    EXPECT_EQ(format, ExportFormat::KML);
}

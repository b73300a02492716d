#include "test_common.h"
#include "io/mapdocument.h"
#include "geometry/geometrymodel.h"
#include <QTemporaryDir>
#include <QFile>
#include <QDir>

using namespace test_util;

class MapDocumentTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
    }

    QString writeFile(const QString& name, const QByteArray& contents) {
        const QString path = dir.filePath(name);
        QFile file(path);
        EXPECT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(contents);
        file.close();
        return path;
    }

    QByteArray readFile(const QString& path) {
        QFile file(path);
        EXPECT_TRUE(file.open(QIODevice::ReadOnly));
        return file.readAll();
    }

    QTemporaryDir dir;
    GeometryModel model;
    MapDocument document{&model};
};

TEST_F(MapDocumentTest, LoadReplacesScene) {
    const QString path = writeFile("scene.txt", "POINT 1.0 2.0\nLINE 0.0 0.0 5.0 5.0\n");
    QString loadedPath;
    QObject::connect(&document, &MapDocument::loaded, [&loadedPath](const QString& p) { loadedPath = p; });

    ASSERT_TRUE(document.load(path));
    EXPECT_EQ(model.count(), 2);
    EXPECT_FALSE(model.isModified());
    EXPECT_EQ(document.filePath(), path);
    EXPECT_EQ(document.displayName(), QString("scene.txt"));
    EXPECT_EQ(loadedPath, path);
}

TEST_F(MapDocumentTest, FailedLoadKeepsPreviousScene) {
    ASSERT_TRUE(document.load(writeFile("good.txt", "POLYGON 0 0 10 0 10 10\n")));
    const Scene before = model.scene();

    const QString bad = writeFile("bad.txt", "POINT 1 2\nPOINT one 2\n");
    EXPECT_FALSE(document.load(bad));
    EXPECT_EQ(document.lastError().code, GeoErrorCode::Format);
    EXPECT_EQ(document.lastError().line, 2);
    EXPECT_EQ(model.scene(), before);
    EXPECT_TRUE(document.filePath().endsWith("good.txt"));
}

TEST_F(MapDocumentTest, MissingFileIsFileError) {
    model.addPoint(QPointF(1, 1));
    EXPECT_FALSE(document.load(dir.filePath("does-not-exist.txt")));
    EXPECT_EQ(document.lastError().code, GeoErrorCode::FileIo);
    EXPECT_EQ(model.count(), 1);
}

TEST_F(MapDocumentTest, EmptyFileLoadsEmptyScene) {
    model.addPoint(QPointF(1, 1));
    ASSERT_TRUE(document.load(writeFile("empty.txt", "")));
    EXPECT_TRUE(model.isEmpty());
}

TEST_F(MapDocumentTest, LenientLoadReportsWarnings) {
    document.setParseMode(SceneCodec::ParseMode::Lenient);
    ASSERT_TRUE(document.load(writeFile("mixed.txt", "POINT 1 2\nLINE 0 0\nPOINT 3 4\n")));
    EXPECT_EQ(model.count(), 2);
    ASSERT_EQ(document.warnings().size(), 1);
    EXPECT_TRUE(document.warnings().first().startsWith("Line 2:"));
}

TEST_F(MapDocumentTest, SaveAsWritesRecordsAndClearsModified) {
    model.addPoint(QPointF(1, 2));
    model.addLine(pts({ QPointF(0, 0), QPointF(5, 5) }));
    ASSERT_TRUE(model.isModified());

    const QString path = dir.filePath("out.txt");
    ASSERT_TRUE(document.saveAs(path));
    EXPECT_EQ(readFile(path), QByteArray("POINT 1 2\nLINE 0 0 5 5\n"));
    EXPECT_FALSE(model.isModified());
    EXPECT_EQ(document.filePath(), path);
}

TEST_F(MapDocumentTest, SaveRoundTrip) {
    model.setScene(mixedScene());
    const QString path = dir.filePath("roundtrip.txt");
    ASSERT_TRUE(document.saveAs(path));

    GeometryModel other;
    MapDocument reopened(&other);
    ASSERT_TRUE(reopened.load(path));
    EXPECT_EQ(other.scene(), model.scene());
}

TEST_F(MapDocumentTest, SaveWithoutPathFails) {
    EXPECT_FALSE(document.save());
    EXPECT_EQ(document.lastError().code, GeoErrorCode::FileIo);
    EXPECT_EQ(document.lastError().message, QString("No file to save"));
}

TEST_F(MapDocumentTest, SaveToMissingDirectoryFails) {
    model.addPoint(QPointF(0, 0));
    EXPECT_FALSE(document.saveAs(dir.filePath("missing/sub/out.txt")));
    EXPECT_EQ(document.lastError().code, GeoErrorCode::FileIo);
    EXPECT_TRUE(model.isModified());
}

TEST_F(MapDocumentTest, NewDocumentClearsModelAndPath) {
    ASSERT_TRUE(document.load(writeFile("a.txt", "POINT 1 1\n")));
    document.newDocument();
    EXPECT_TRUE(model.isEmpty());
    EXPECT_FALSE(document.hasFilePath());
    EXPECT_EQ(document.displayName(), QString("Untitled"));
}

TEST_F(MapDocumentTest, LeadingByteOrderMarkIsIgnored) {
    const QString path = writeFile("bom.txt", "\xEF\xBB\xBFPOINT 1 2\nLINE 0 0 3 4\n");
    ASSERT_TRUE(document.load(path)) << document.lastError().toString().toStdString();
    EXPECT_EQ(model.count(), 2);
    EXPECT_EQ(model.scene().primitives.first(), Primitive(PrimitiveKind::Point, pts({ QPointF(1, 2) })));
}

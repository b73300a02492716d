#include "test_common.h"
#include "io/scenecodec.h"

using namespace test_util;

TEST(SceneCodecTest, ParsesTaggedRecords) {
    SceneCodec codec;
    Scene scene;
    ASSERT_TRUE(codec.parse("POINT 1.0 2.0\nLINE 0.0 0.0 5.0 5.0\n", &scene));

    ASSERT_EQ(scene.size(), 2);
    EXPECT_EQ(scene.primitives[0], Primitive(PrimitiveKind::Point, pts({ QPointF(1, 2) })));
    EXPECT_EQ(scene.primitives[1], Primitive(PrimitiveKind::Line, pts({ QPointF(0, 0), QPointF(5, 5) })));
    EXPECT_EQ(scene.primitives[0].id, 1);
    EXPECT_EQ(scene.primitives[1].id, 2);
}

TEST(SceneCodecTest, SerializesShortestNumbers) {
    SceneCodec codec;
    Scene scene;
    ASSERT_TRUE(codec.parse("POINT 1.0 2.0\nLINE 0.0 0.0 5.0 5.0\n", &scene));
    EXPECT_EQ(codec.serialize(scene), QString("POINT 1 2\nLINE 0 0 5 5\n"));
}

TEST(SceneCodecTest, RoundTripPreservesScene) {
    Scene scene = mixedScene();
    scene.append(PrimitiveKind::Point, pts({ QPointF(0.1, -1e-7) }));
    scene.append(PrimitiveKind::Line, pts({ QPointF(1.0 / 3.0, 2.0 / 3.0), QPointF(123456789.125, -0.5) }));

    SceneCodec codec;
    Scene parsed;
    ASSERT_TRUE(codec.parse(codec.serialize(scene), &parsed));
    EXPECT_EQ(parsed, scene);
}

TEST(SceneCodecTest, TagsAreCaseInsensitiveAndWhitespaceIsFlexible) {
    SceneCodec codec;
    Scene scene;
    ASSERT_TRUE(codec.parse("  polygon\t0 0   4 0 4 3  \r\nPoint 7 8\r\n", &scene));
    ASSERT_EQ(scene.size(), 2);
    EXPECT_EQ(scene.primitives[0].kind, PrimitiveKind::Polygon);
    EXPECT_EQ(scene.primitives[0].points.size(), 3);
    EXPECT_EQ(scene.primitives[1].kind, PrimitiveKind::Point);
}

TEST(SceneCodecTest, SkipsCommentsAndBlankLines) {
    SceneCodec codec;
    Scene scene;
    ASSERT_TRUE(codec.parse("# survey export\n\n   \nPOINT 1 1\n# end\n", &scene));
    EXPECT_EQ(scene.size(), 1);
}

TEST(SceneCodecTest, EmptyTextIsAnEmptyScene) {
    SceneCodec codec;
    Scene scene = mixedScene();
    ASSERT_TRUE(codec.parse("", &scene));
    EXPECT_TRUE(scene.isEmpty());
    EXPECT_EQ(codec.serialize(scene), QString());
}

TEST(SceneCodecTest, UntaggedRecordsAreClassifiedByCount) {
    SceneCodec codec;
    Scene scene;
    ASSERT_TRUE(codec.parse("1 2\n0 0 3 4\n0 0 1 0 1 1\n", &scene));
    ASSERT_EQ(scene.size(), 3);
    EXPECT_EQ(scene.primitives[0].kind, PrimitiveKind::Point);
    EXPECT_EQ(scene.primitives[1].kind, PrimitiveKind::Line);
    EXPECT_EQ(scene.primitives[2].kind, PrimitiveKind::Polygon);
}

TEST(SceneCodecTest, NonNumericCoordinateFailsWithLineNumber) {
    SceneCodec codec;
    Scene scene = mixedScene();
    const Scene before = scene;

    EXPECT_FALSE(codec.parse("POINT 1 2\nLINE 0 0 abc 5\n", &scene));
    EXPECT_EQ(codec.lastError().code, GeoErrorCode::Format);
    EXPECT_EQ(codec.lastError().line, 2);
    EXPECT_EQ(codec.lastError().toString(), QString("Line 2: Invalid coordinate 'abc'"));
    EXPECT_EQ(scene, before);
}

TEST(SceneCodecTest, RejectsMalformedRecords) {
    SceneCodec codec;
    Scene scene;

    EXPECT_FALSE(codec.parse("CIRCLE 0 0 5", &scene));
    EXPECT_EQ(codec.lastError().message, QString("Unknown record type 'CIRCLE'"));

    EXPECT_FALSE(codec.parse("LINE 0 0 1", &scene));
    EXPECT_EQ(codec.lastError().message, QString("Odd number of coordinates (3)"));

    EXPECT_FALSE(codec.parse("POINT 0 0 1 1", &scene));
    EXPECT_EQ(codec.lastError().message, QString("POINT takes exactly 1 coordinate pair, got 2"));

    EXPECT_FALSE(codec.parse("POLYGON 0 0 1 1", &scene));
    EXPECT_EQ(codec.lastError().message, QString("POLYGON needs at least 3 coordinate pairs, got 2"));

    EXPECT_FALSE(codec.parse("LINE 0 0 1,000 5", &scene));
    EXPECT_EQ(codec.lastError().code, GeoErrorCode::Format);

    EXPECT_FALSE(codec.parse("POINT inf 0", &scene));
    EXPECT_EQ(codec.lastError().code, GeoErrorCode::Format);
}

TEST(SceneCodecTest, LenientModeSkipsBadLinesWithWarnings) {
    SceneCodec codec(SceneCodec::ParseMode::Lenient);
    Scene scene;
    ASSERT_TRUE(codec.parse("POINT 1 2\nPOINT x y\nLINE 0 0 1 1\nPOLYGON 0 0\n", &scene));

    EXPECT_EQ(scene.size(), 2);
    ASSERT_EQ(codec.warnings().size(), 2);
    EXPECT_TRUE(codec.warnings()[0].startsWith("Line 2:"));
    EXPECT_TRUE(codec.warnings()[1].startsWith("Line 4:"));
    EXPECT_FALSE(codec.lastError().isError());
}

TEST(SceneCodecTest, FormatRecord) {
    Primitive polygon(PrimitiveKind::Polygon, pts({ QPointF(0, 0), QPointF(2.5, 0), QPointF(0, -1) }));
    EXPECT_EQ(SceneCodec::formatRecord(polygon), QString("POLYGON 0 0 2.5 0 0 -1"));
    EXPECT_EQ(SceneCodec::formatNumber(0.1), QString("0.1"));
}

#include "test_common.h"
#include "core/geoerror.h"

TEST(GeoErrorTest, DefaultIsNotAnError) {
    GeoError error;
    EXPECT_FALSE(error.isError());
    EXPECT_EQ(error.code, GeoErrorCode::None);
    EXPECT_TRUE(error.toString().isEmpty());
}

TEST(GeoErrorTest, FormatErrorNamesTheLine) {
    GeoError error(GeoErrorCode::Format, "Invalid coordinate 'abc'", 3);
    EXPECT_TRUE(error.isError());
    EXPECT_EQ(error.toString(), QString("Line 3: Invalid coordinate 'abc'"));
}

TEST(GeoErrorTest, OtherErrorsShowMessageOnly) {
    GeoError error(GeoErrorCode::NotFound, "No primitive with id 7");
    EXPECT_EQ(error.toString(), QString("No primitive with id 7"));

    error.clear();
    EXPECT_FALSE(error.isError());
}

TEST(GeoErrorTest, CodeNames) {
    EXPECT_EQ(geoErrorCodeName(GeoErrorCode::Format), QString("FormatError"));
    EXPECT_EQ(geoErrorCodeName(GeoErrorCode::InvalidGeometry), QString("InvalidGeometryError"));
    EXPECT_EQ(geoErrorCodeName(GeoErrorCode::NotFound), QString("NotFoundError"));
    EXPECT_EQ(geoErrorCodeName(GeoErrorCode::IndexOutOfRange), QString("IndexOutOfRangeError"));
    EXPECT_EQ(geoErrorCodeName(GeoErrorCode::FileIo), QString("FileError"));
}

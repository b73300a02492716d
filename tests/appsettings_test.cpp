#include "test_common.h"
#include "appsettings.h"
#include <QCoreApplication>
#include <QSettings>
#include <QTemporaryDir>

// Points QSettings at a throwaway INI location for the duration of a test
class AppSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        QCoreApplication::setOrganizationName("DesktopGIS-tests");
        QCoreApplication::setApplicationName("DesktopGIS-tests");
        QSettings::setDefaultFormat(QSettings::IniFormat);
        QSettings::setPath(QSettings::IniFormat, QSettings::UserScope, dir.path());
        QSettings().clear();
    }

    QTemporaryDir dir;
};

TEST_F(AppSettingsTest, Defaults) {
    EXPECT_TRUE(AppSettings::showGrid());
    EXPECT_DOUBLE_EQ(AppSettings::gridSpacing(), 20.0);
    EXPECT_EQ(AppSettings::backgroundColor(), QColor(Qt::white));
    EXPECT_DOUBLE_EQ(AppSettings::zoomStep(), 1.25);
    EXPECT_DOUBLE_EQ(AppSettings::minZoom(), 1e-4);
    EXPECT_DOUBLE_EQ(AppSettings::maxZoom(), 1e6);
    EXPECT_EQ(AppSettings::pickTolerance(), 6);
    EXPECT_TRUE(AppSettings::strictParsing());
    EXPECT_TRUE(AppSettings::recentFiles().isEmpty());
    EXPECT_EQ(AppSettings::statusTimeout(), 5000);
}

TEST_F(AppSettingsTest, InvalidValuesAreIgnored) {
    AppSettings::setZoomStep(0.9);
    EXPECT_DOUBLE_EQ(AppSettings::zoomStep(), 1.25);

    AppSettings::setGridSpacing(-5);
    EXPECT_DOUBLE_EQ(AppSettings::gridSpacing(), 20.0);

    AppSettings::setZoomLimits(10, 1);
    EXPECT_DOUBLE_EQ(AppSettings::minZoom(), 1e-4);

    AppSettings::setPickTolerance(500);
    EXPECT_EQ(AppSettings::pickTolerance(), 50);
}

TEST_F(AppSettingsTest, ValuesPersist) {
    AppSettings::setShowGrid(false);
    AppSettings::setBackgroundColor(QColor("#202020"));
    AppSettings::setStrictParsing(false);
    AppSettings::setZoomLimits(0.01, 100);

    EXPECT_FALSE(AppSettings::showGrid());
    EXPECT_EQ(AppSettings::backgroundColor(), QColor("#202020"));
    EXPECT_FALSE(AppSettings::strictParsing());
    EXPECT_DOUBLE_EQ(AppSettings::minZoom(), 0.01);
    EXPECT_DOUBLE_EQ(AppSettings::maxZoom(), 100.0);
}

TEST_F(AppSettingsTest, RecentFilesAreMostRecentFirstAndCapped) {
    for (int i = 0; i < 12; ++i) {
        AppSettings::addRecentFile(QString("/data/scene%1.txt").arg(i));
    }
    AppSettings::addRecentFile("/data/scene5.txt");

    const QStringList files = AppSettings::recentFiles();
    ASSERT_EQ(files.size(), 10);
    EXPECT_EQ(files.first(), QString("/data/scene5.txt"));
    EXPECT_EQ(files.at(1), QString("/data/scene11.txt"));
    EXPECT_EQ(files.count("/data/scene5.txt"), 1);

    AppSettings::clearRecentFiles();
    EXPECT_TRUE(AppSettings::recentFiles().isEmpty());
}

#include <QApplication>
#include <QCommandLineParser>
#include <QMessageBox>
#include <QFileInfo>
#include "app/mainwindow.h"
#include "gdal/gdalreader.h"
#include "gdal/geosbridge.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    app.setApplicationName("DesktopGIS");
    app.setOrganizationName("DesktopGIS");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Desktop GIS: view and edit points, lines and polygons");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("file", "Scene file to open");
    parser.process(app);

    // Register GDAL drivers and create the GEOS context once
    GdalReader::initialize();
    GeosBridge::initialize();

    int result = 0;
    try {
        MainWindow window;
        window.show();

        const QStringList args = parser.positionalArguments();
        if (!args.isEmpty()) {
            window.openFile(QFileInfo(args.first()).absoluteFilePath());
        }

        result = app.exec();
    } catch (const std::exception& e) {
        QMessageBox::critical(nullptr, "Fatal Error",
            QString("Application crashed: %1").arg(e.what()));
        result = 1;
    }

    GeosBridge::cleanup();
    return result;
}

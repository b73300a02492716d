#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QString>
#include <QStringList>
#include <QColor>
#include <QByteArray>

class AppSettings {
public:
    // Display
    static bool showGrid();
    static void setShowGrid(bool on);
    static double gridSpacing();
    static void setGridSpacing(double spacing);
    static QColor backgroundColor();
    static void setBackgroundColor(const QColor& color);

    // View
    static double zoomStep();
    static void setZoomStep(double step);
    static double minZoom();
    static double maxZoom();
    static void setZoomLimits(double minZoom, double maxZoom);

    // Editing
    static int pickTolerance();
    static void setPickTolerance(int pixels);

    // File parsing
    static bool strictParsing();
    static void setStrictParsing(bool strict);

    // Recent files, most recent first
    static QStringList recentFiles();
    static void setRecentFiles(const QStringList& files);
    static void addRecentFile(const QString& path, int maxCount = 10);
    static void clearRecentFiles();

    static QString lastDirectory();
    static void setLastDirectory(const QString& dir);

    static int statusTimeout();
    static void setStatusTimeout(int ms);

    static QByteArray windowGeometry();
    static void setWindowGeometry(const QByteArray& geometry);
};

#endif // APPSETTINGS_H

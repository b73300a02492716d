#include "appsettings.h"
#include <QSettings>
#include <QSet>
#include <QtMath>

static QString recentKey() { return QStringLiteral("ui/recentFiles"); }

bool AppSettings::showGrid()
{
    QSettings s;
    return s.value("display/showGrid", true).toBool();
}

void AppSettings::setShowGrid(bool on)
{
    QSettings s;
    s.setValue("display/showGrid", on);
}

double AppSettings::gridSpacing()
{
    QSettings s;
    double v = s.value("display/gridSpacing", 20.0).toDouble();
    if (!qIsFinite(v) || v <= 0.0) v = 20.0;
    return v;
}

void AppSettings::setGridSpacing(double spacing)
{
    if (!qIsFinite(spacing) || spacing <= 0.0) return;
    QSettings s;
    s.setValue("display/gridSpacing", spacing);
}

QColor AppSettings::backgroundColor()
{
    QSettings s;
    QColor c(s.value("display/backgroundColor", "#ffffff").toString());
    return c.isValid() ? c : QColor(Qt::white);
}

void AppSettings::setBackgroundColor(const QColor& color)
{
    QSettings s; s.setValue("display/backgroundColor", color.name());
}

double AppSettings::zoomStep()
{
    QSettings s;
    double v = s.value("view/zoomStep", 1.25).toDouble();
    if (!qIsFinite(v) || v <= 1.0) v = 1.25;
    return v;
}

void AppSettings::setZoomStep(double step)
{
    if (!qIsFinite(step) || step <= 1.0) return;
    QSettings s;
    s.setValue("view/zoomStep", step);
}

double AppSettings::minZoom()
{
    QSettings s;
    double v = s.value("view/minZoom", 1e-4).toDouble();
    if (!qIsFinite(v) || v <= 0.0) v = 1e-4;
    return v;
}

double AppSettings::maxZoom()
{
    QSettings s;
    double v = s.value("view/maxZoom", 1e6).toDouble();
    if (!qIsFinite(v) || v < minZoom()) v = 1e6;
    return v;
}

void AppSettings::setZoomLimits(double minZoom, double maxZoom)
{
    if (!qIsFinite(minZoom) || !qIsFinite(maxZoom)) return;
    if (minZoom <= 0.0 || maxZoom < minZoom) return;
    QSettings s;
    s.setValue("view/minZoom", minZoom);
    s.setValue("view/maxZoom", maxZoom);
}

int AppSettings::pickTolerance()
{
    QSettings s;
    int px = s.value("edit/pickTolerance", 6).toInt();
    if (px < 1) px = 1;
    if (px > 50) px = 50;
    return px;
}

void AppSettings::setPickTolerance(int pixels)
{
    QSettings s;
    int px = pixels;
    if (px < 1) px = 1;
    if (px > 50) px = 50;
    s.setValue("edit/pickTolerance", px);
}

bool AppSettings::strictParsing()
{
    QSettings s;
    return s.value("io/strictParsing", true).toBool();
}

void AppSettings::setStrictParsing(bool strict)
{
    QSettings s;
    s.setValue("io/strictParsing", strict);
}

QStringList AppSettings::recentFiles()
{
    QSettings s;
    QStringList list = s.value(recentKey()).toStringList();
    // De-duplicate and drop empties
    QStringList out;
    QSet<QString> seen;
    for (const QString& p : list) {
        const QString t = p.trimmed();
        if (t.isEmpty()) continue;
        if (seen.contains(t)) continue;
        seen.insert(t);
        out.append(t);
    }
    return out;
}

void AppSettings::setRecentFiles(const QStringList& files)
{
    QSettings s;
    s.setValue(recentKey(), files);
}

void AppSettings::addRecentFile(const QString& path, int maxCount)
{
    if (path.trimmed().isEmpty()) return;
    QSettings s;
    QStringList list = s.value(recentKey()).toStringList();
    list.removeAll(path);
    list.prepend(path);
    while (list.size() > maxCount) list.removeLast();
    s.setValue(recentKey(), list);
}

void AppSettings::clearRecentFiles()
{
    QSettings s;
    s.remove(recentKey());
}

QString AppSettings::lastDirectory()
{
    QSettings s;
    return s.value("ui/lastDirectory").toString();
}

void AppSettings::setLastDirectory(const QString& dir)
{
    QSettings s;
    s.setValue("ui/lastDirectory", dir);
}

int AppSettings::statusTimeout()
{
    QSettings s;
    int ms = s.value("ui/statusTimeout", 5000).toInt();
    if (ms < 0) ms = 0;
    return ms;
}

void AppSettings::setStatusTimeout(int ms)
{
    QSettings s;
    s.setValue("ui/statusTimeout", ms < 0 ? 0 : ms);
}

QByteArray AppSettings::windowGeometry()
{
    QSettings s;
    return s.value("ui/geometry").toByteArray();
}

void AppSettings::setWindowGeometry(const QByteArray& geometry)
{
    QSettings s;
    s.setValue("ui/geometry", geometry);
}

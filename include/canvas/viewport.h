#ifndef VIEWPORT_H
#define VIEWPORT_H

#include <QPointF>
#include <QSizeF>
#include <QRectF>
#include <QTransform>

// World <-> screen mapping of the map canvas:
//
//   screen = centre + zoom * (world + offset)
//
// where centre is the middle of the widget. Screen y grows downward and
// world y is not flipped.
class Viewport {
public:
    static constexpr double DefaultMinZoom = 1e-4;
    static constexpr double DefaultMaxZoom = 1e6;

    Viewport();

    double zoom() const { return m_zoom; }
    QPointF offset() const { return m_offset; }
    QSizeF size() const { return m_size; }
    double minZoom() const { return m_minZoom; }
    double maxZoom() const { return m_maxZoom; }

    void setSize(const QSizeF& size);
    void setZoomLimits(double minZoom, double maxZoom);
    void setZoom(double zoom);          // Clamped to the zoom limits
    void setOffset(const QPointF& offset);

    QPointF screenToWorld(const QPointF& screen) const;
    QPointF worldToScreen(const QPointF& world) const;

    // Pixels to world units at the current zoom.
    double screenToWorldDistance(double pixels) const { return pixels / m_zoom; }

    void panByScreen(const QPointF& deltaScreen);
    // Multiply zoom by factor, keeping the world point under anchor fixed.
    void zoomAt(double factor, const QPointF& anchorScreen);
    void centerOn(const QPointF& world);
    // Fit worldRect into the widget leaving marginPx on each side.
    void fitTo(const QRectF& worldRect, double marginPx);
    void reset();

private:
    void updateTransform();

    double m_zoom{1.0};
    QPointF m_offset{0, 0};
    QSizeF m_size{0, 0};
    double m_minZoom{DefaultMinZoom};
    double m_maxZoom{DefaultMaxZoom};
    QTransform m_worldToScreen;
    QTransform m_screenToWorld;
};

#endif // VIEWPORT_H

#include "canvas/viewport.h"
#include <QtMath>

Viewport::Viewport()
{
    updateTransform();
}

void Viewport::setSize(const QSizeF& size)
{
    m_size = size;
    updateTransform();
}

void Viewport::setZoomLimits(double minZoom, double maxZoom)
{
    if (!(minZoom > 0.0) || !(maxZoom >= minZoom)) return;
    m_minZoom = minZoom;
    m_maxZoom = maxZoom;
    setZoom(m_zoom);
}

void Viewport::setZoom(double zoom)
{
    if (!qIsFinite(zoom)) return;
    m_zoom = qBound(m_minZoom, zoom, m_maxZoom);
    updateTransform();
}

void Viewport::setOffset(const QPointF& offset)
{
    m_offset = offset;
    updateTransform();
}

QPointF Viewport::screenToWorld(const QPointF& screen) const
{
    return m_screenToWorld.map(screen);
}

QPointF Viewport::worldToScreen(const QPointF& world) const
{
    return m_worldToScreen.map(world);
}

void Viewport::panByScreen(const QPointF& deltaScreen)
{
    m_offset += deltaScreen / m_zoom;
    updateTransform();
}

void Viewport::zoomAt(double factor, const QPointF& anchorScreen)
{
    if (!(factor > 0.0)) return;

    QPointF anchorWorldBefore = screenToWorld(anchorScreen);
    setZoom(m_zoom * factor);

    // Shift so the anchor maps to the same world point as before
    QPointF anchorWorldAfter = screenToWorld(anchorScreen);
    m_offset += anchorWorldAfter - anchorWorldBefore;
    updateTransform();
}

void Viewport::centerOn(const QPointF& world)
{
    m_offset = -world;
    updateTransform();
}

void Viewport::fitTo(const QRectF& worldRect, double marginPx)
{
    double dataWidth = worldRect.width();
    double dataHeight = worldRect.height();

    if (dataWidth < 0.001) dataWidth = 1.0;
    if (dataHeight < 0.001) dataHeight = 1.0;

    double availableWidth = qMax(1.0, m_size.width() - 2 * marginPx);
    double availableHeight = qMax(1.0, m_size.height() - 2 * marginPx);

    m_zoom = qBound(m_minZoom, qMin(availableWidth / dataWidth, availableHeight / dataHeight), m_maxZoom);
    m_offset = -worldRect.center();
    updateTransform();
}

void Viewport::reset()
{
    m_zoom = qBound(m_minZoom, 1.0, m_maxZoom);
    m_offset = QPointF(0, 0);
    updateTransform();
}

void Viewport::updateTransform()
{
    m_worldToScreen = QTransform();
    m_worldToScreen.translate(m_size.width() / 2.0, m_size.height() / 2.0);
    m_worldToScreen.scale(m_zoom, m_zoom);
    m_worldToScreen.translate(m_offset.x(), m_offset.y());
    m_screenToWorld = m_worldToScreen.inverted();
}

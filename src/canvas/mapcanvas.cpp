#include "canvas/mapcanvas.h"
#include "canvas/viewportcontroller.h"
#include "geometry/geometrymodel.h"

#include <QPainter>
#include <QPolygonF>
#include <QWheelEvent>
#include <QMouseEvent>
#include <QKeyEvent>
#include <QtMath>
#include <cmath>

namespace {

const QColor kPointPen(Qt::red);
const QColor kPointFill(Qt::black);
const QColor kLineColor(Qt::blue);
const QColor kPolygonColor(Qt::green);
const QColor kPolygonFill(0, 255, 0, 100);
const QColor kSelectionColor(255, 140, 0);
const QColor kDraftColor(Qt::darkMagenta);

const double kPointRadius = 3.0;    // Pixels
const int kHandleSize = 6;

QPolygonF toScreen(const ViewportController* controller, const QVector<QPointF>& points)
{
    QPolygonF screen;
    screen.reserve(points.size());
    for (const auto& pt : points) {
        screen << controller->worldToScreen(pt);
    }
    return screen;
}

}

MapCanvas::MapCanvas(GeometryModel* model, ViewportController* controller, QWidget *parent)
    : QWidget(parent)
    , m_model(model)
    , m_controller(controller)
{
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setAttribute(Qt::WA_OpaquePaintEvent);

    auto repaint = [this]() { update(); };
    connect(m_model, &GeometryModel::primitiveAdded, this, repaint);
    connect(m_model, &GeometryModel::primitiveChanged, this, repaint);
    connect(m_model, &GeometryModel::primitiveRemoved, this, repaint);
    connect(m_model, &GeometryModel::sceneReset, this, repaint);
    connect(m_controller, &ViewportController::viewChanged, this, repaint);
    connect(m_controller, &ViewportController::selectionChanged, this, repaint);
    connect(m_controller, &ViewportController::draftChanged, this, repaint);
    connect(m_controller, &ViewportController::toolChanged, this, &MapCanvas::updateCursorShape);

    updateCursorShape();
}

void MapCanvas::setShowGrid(bool on)
{
    if (m_showGrid == on) return;
    m_showGrid = on;
    update();
}

void MapCanvas::setGridSpacing(double spacing)
{
    if (!qIsFinite(spacing) || spacing <= 0.0) return;
    m_gridSpacing = spacing;
    update();
}

void MapCanvas::setBackgroundColor(const QColor& color)
{
    if (!color.isValid()) return;
    m_backgroundColor = color;
    update();
}

QSize MapCanvas::sizeHint() const
{
    return QSize(800, 540);
}

void MapCanvas::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);

    // Background
    painter.fillRect(rect(), m_backgroundColor);

    // Grid
    if (m_showGrid) {
        drawGrid(painter);
    }
    drawOrigin(painter);

    // Polygons first so lines and points stay visible on top of the fill
    const Scene& scene = m_model->scene();
    for (PrimitiveKind kind : { PrimitiveKind::Polygon, PrimitiveKind::Line, PrimitiveKind::Point }) {
        for (const Primitive& primitive : scene.primitives) {
            if (primitive.kind == kind) drawPrimitive(painter, primitive);
        }
    }

    drawSelection(painter);
    drawDraft(painter);
}

void MapCanvas::drawGrid(QPainter& painter)
{
    QPen pen(m_gridColor, 1);
    pen.setCosmetic(true);
    painter.setPen(pen);

    const double zoom = m_controller->viewport().zoom();
    QPointF topLeft = m_controller->screenToWorld(QPointF(0, 0));
    QPointF bottomRight = m_controller->screenToWorld(QPointF(width(), height()));

    double minX = qMin(topLeft.x(), bottomRight.x());
    double maxX = qMax(topLeft.x(), bottomRight.x());
    double minY = qMin(topLeft.y(), bottomRight.y());
    double maxY = qMax(topLeft.y(), bottomRight.y());

    // Keep grid lines between 10 and 100 pixels apart
    double gridStep = m_gridSpacing;
    while (gridStep * zoom < 10.0) gridStep *= 2.0;
    while (gridStep * zoom > 100.0) gridStep /= 2.0;

    for (double x : gridLines(minX, maxX, gridStep)) {
        painter.drawLine(m_controller->worldToScreen(QPointF(x, minY)),
                         m_controller->worldToScreen(QPointF(x, maxY)));
    }

    for (double y : gridLines(minY, maxY, gridStep)) {
        painter.drawLine(m_controller->worldToScreen(QPointF(minX, y)),
                         m_controller->worldToScreen(QPointF(maxX, y)));
    }
}

QVector<double> MapCanvas::gridLines(double minValue, double maxValue, double step)
{
    QVector<double> lines;
    if (!qIsFinite(minValue) || !qIsFinite(maxValue) || !qIsFinite(step)) return lines;
    if (step <= 0.0 || maxValue < minValue) return lines;

    const double start = std::floor(minValue / step) * step;
    // Step below the double resolution at these coordinates
    if (start + step == start) return lines;

    const double count = std::floor((maxValue - start) / step);
    if (count > MaxGridLines) return lines;

    const int n = static_cast<int>(count);
    lines.reserve(n + 1);
    for (int i = 0; i <= n; ++i) {
        lines.append(start + i * step);
    }
    return lines;
}

void MapCanvas::drawOrigin(QPainter& painter)
{
    const QPointF origin = m_controller->worldToScreen(QPointF(0, 0));
    if (!rect().adjusted(-10, -10, 10, 10).contains(origin.toPoint())) return;

    QPen pen(Qt::gray, 1);
    pen.setCosmetic(true);
    painter.setPen(pen);
    painter.drawLine(origin + QPointF(-8, 0), origin + QPointF(8, 0));
    painter.drawLine(origin + QPointF(0, -8), origin + QPointF(0, 8));
}

void MapCanvas::drawPrimitive(QPainter& painter, const Primitive& primitive)
{
    switch (primitive.kind) {
        case PrimitiveKind::Point: {
            QPen pen(kPointPen, 1);
            pen.setCosmetic(true);
            painter.setPen(pen);
            painter.setBrush(kPointFill);
            painter.drawEllipse(m_controller->worldToScreen(primitive.position()), kPointRadius, kPointRadius);
            break;
        }

        case PrimitiveKind::Line: {
            QPen pen(kLineColor, 2);
            pen.setCosmetic(true);
            painter.setPen(pen);
            painter.setBrush(Qt::NoBrush);
            painter.drawPolyline(toScreen(m_controller, primitive.points));
            break;
        }

        case PrimitiveKind::Polygon: {
            QPen pen(kPolygonColor, 2);
            pen.setCosmetic(true);
            painter.setPen(pen);
            painter.setBrush(kPolygonFill);
            painter.drawPolygon(toScreen(m_controller, primitive.points));
            break;
        }
    }
}

void MapCanvas::drawSelection(QPainter& painter)
{
    const QVector<PrimitiveId>& selection = m_controller->selection();
    if (selection.isEmpty()) return;

    QPen selectionPen(kSelectionColor, 2);
    selectionPen.setCosmetic(true);
    selectionPen.setStyle(Qt::DashLine);

    QPen handlePen(kSelectionColor, 1);
    handlePen.setCosmetic(true);

    for (PrimitiveId id : selection) {
        const Primitive* primitive = m_model->primitive(id);
        if (!primitive) continue;

        QPolygonF screenPoly = toScreen(m_controller, primitive->points);

        painter.setPen(selectionPen);
        painter.setBrush(Qt::NoBrush);
        if (primitive->kind == PrimitiveKind::Point) {
            painter.drawEllipse(screenPoly.first(), kPointRadius + 4, kPointRadius + 4);
        } else {
            if (primitive->isClosed()) screenPoly << screenPoly.first();
            painter.drawPolyline(screenPoly);
        }

        // Vertex handles
        painter.setPen(handlePen);
        painter.setBrush(QColor(255, 140, 0, 100));
        for (const auto& pt : primitive->points) {
            QPointF sp = m_controller->worldToScreen(pt);
            painter.drawRect(QRectF(sp.x() - kHandleSize / 2.0, sp.y() - kHandleSize / 2.0,
                                    kHandleSize, kHandleSize));
        }
    }
}

void MapCanvas::drawDraft(QPainter& painter)
{
    const QVector<QPointF>& draft = m_controller->draftPoints();
    if (draft.isEmpty()) return;

    QPolygonF screenPoly = toScreen(m_controller, draft);

    // Rubber band to the cursor
    if (m_controller->hasCursor()) {
        screenPoly << m_controller->worldToScreen(m_controller->cursorWorld());
    }
    if (m_controller->tool() == EditTool::DrawPolygon && screenPoly.size() > 2) {
        screenPoly << screenPoly.first();
    }

    QPen pen(kDraftColor, 1);
    pen.setCosmetic(true);
    pen.setStyle(Qt::DashLine);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.drawPolyline(screenPoly);

    painter.setPen(QPen(kDraftColor, 1));
    painter.setBrush(kDraftColor);
    for (const auto& pt : draft) {
        painter.drawEllipse(m_controller->worldToScreen(pt), 2.5, 2.5);
    }
}

void MapCanvas::resizeEvent(QResizeEvent *event)
{
    QWidget::resizeEvent(event);
    m_controller->setViewportSize(QSizeF(size()));
}

void MapCanvas::wheelEvent(QWheelEvent *event)
{
    const int delta = event->angleDelta().y();
    if (delta == 0) {
        event->ignore();
        return;
    }
    m_controller->onWheel(delta, event->position());
    event->accept();
}

void MapCanvas::mousePressEvent(QMouseEvent *event)
{
    setFocus();
    m_controller->mousePress(event->position(), event->button(), event->modifiers());
    updateCursorShape();
}

void MapCanvas::mouseMoveEvent(QMouseEvent *event)
{
    m_controller->mouseMove(event->position(), event->buttons());
    if (m_controller->isDrawing()) update();
}

void MapCanvas::mouseReleaseEvent(QMouseEvent *event)
{
    m_controller->mouseRelease(event->position(), event->button());
    updateCursorShape();
}

void MapCanvas::mouseDoubleClickEvent(QMouseEvent *event)
{
    m_controller->mouseDoubleClick(event->position(), event->button());
}

void MapCanvas::keyPressEvent(QKeyEvent *event)
{
    if (!m_controller->keyPress(event->key(), event->modifiers())) {
        QWidget::keyPressEvent(event);
    }
}

void MapCanvas::leaveEvent(QEvent *event)
{
    m_controller->clearCursor();
    update();
    QWidget::leaveEvent(event);
}

void MapCanvas::updateCursorShape()
{
    if (m_controller->isPanning()) {
        setCursor(Qt::ClosedHandCursor);
        return;
    }

    switch (m_controller->tool()) {
        case EditTool::Select:      setCursor(Qt::ArrowCursor); break;
        case EditTool::Pan:         setCursor(Qt::OpenHandCursor); break;
        case EditTool::AddPoint:
        case EditTool::DrawLine:
        case EditTool::DrawPolygon: setCursor(Qt::CrossCursor); break;
    }
}

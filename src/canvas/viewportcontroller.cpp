#include "canvas/viewportcontroller.h"
#include "geometry/geometrymodel.h"
#include <QtMath>
#include <QDebug>

ViewportController::ViewportController(GeometryModel* model, QObject *parent)
    : QObject(parent)
    , m_model(model)
{
    connect(m_model, &GeometryModel::primitiveRemoved, this, &ViewportController::onPrimitiveRemoved);
    connect(m_model, &GeometryModel::sceneReset, this, &ViewportController::onSceneReset);
}

void ViewportController::setViewportSize(const QSizeF& size)
{
    m_viewport.setSize(size);
    notifyView();
}

void ViewportController::setZoomStep(double step)
{
    if (step > 1.0 && qIsFinite(step)) m_zoomStep = step;
}

void ViewportController::setZoomLimits(double minZoom, double maxZoom)
{
    m_viewport.setZoomLimits(minZoom, maxZoom);
    notifyView();
    emit zoomChanged(m_viewport.zoom());
}

void ViewportController::setPickTolerance(double pixels)
{
    if (pixels > 0.0) m_pickTolerance = pixels;
}

void ViewportController::onWheel(int delta, const QPointF& cursorScreen)
{
    if (delta == 0) return;

    // One notch (120) multiplies or divides by the zoom step
    double factor = qPow(m_zoomStep, delta / 120.0);
    m_viewport.zoomAt(factor, cursorScreen);
    notifyView();
    emit zoomChanged(m_viewport.zoom());
}

void ViewportController::onDrag(const QPointF& deltaScreen)
{
    if (deltaScreen.isNull()) return;
    m_viewport.panByScreen(deltaScreen);
    notifyView();
}

void ViewportController::zoomIn()
{
    QPointF centre(m_viewport.size().width() / 2.0, m_viewport.size().height() / 2.0);
    m_viewport.zoomAt(m_zoomStep, centre);
    notifyView();
    emit zoomChanged(m_viewport.zoom());
}

void ViewportController::zoomOut()
{
    QPointF centre(m_viewport.size().width() / 2.0, m_viewport.size().height() / 2.0);
    m_viewport.zoomAt(1.0 / m_zoomStep, centre);
    notifyView();
    emit zoomChanged(m_viewport.zoom());
}

void ViewportController::fitToScene()
{
    if (m_model->isEmpty()) {
        resetView();
        return;
    }
    m_viewport.fitTo(m_model->extent(), 50.0);
    notifyView();
    emit zoomChanged(m_viewport.zoom());
}

void ViewportController::resetView()
{
    m_viewport.reset();
    notifyView();
    emit zoomChanged(m_viewport.zoom());
}

void ViewportController::setTool(EditTool tool)
{
    if (m_tool == tool) return;
    if (isDrawing()) cancelDraft();
    m_drag = DragMode::None;
    m_tool = tool;
    emit toolChanged(m_tool);
}

bool ViewportController::finishDraft()
{
    if (!isDrawing()) return false;

    PrimitiveKind kind = (m_tool == EditTool::DrawLine) ? PrimitiveKind::Line : PrimitiveKind::Polygon;
    int minimum = minimumPointCount(kind);
    if (m_draft.size() < minimum) {
        emit statusMessage(QString("A %1 needs at least %2 points (%3 placed)")
                               .arg(primitiveKindName(kind)).arg(minimum).arg(m_draft.size()));
        return false;
    }

    PrimitiveId id = m_model->addPrimitive(kind, m_draft);
    if (id == InvalidPrimitiveId) {
        emit statusMessage(m_model->lastError().message);
        return false;
    }

    int vertexCount = m_draft.size();
    m_draft.clear();
    emit draftChanged();
    setSelection(QVector<PrimitiveId>() << id);
    emit statusMessage(QString("Added %1 with %2 points").arg(primitiveKindName(kind)).arg(vertexCount));
    return true;
}

void ViewportController::cancelDraft()
{
    if (m_draft.isEmpty()) return;
    m_draft.clear();
    emit draftChanged();
}

void ViewportController::mousePress(const QPointF& screen, Qt::MouseButton button,
                                    Qt::KeyboardModifiers modifiers)
{
    QPointF world = m_viewport.screenToWorld(screen);
    m_lastScreen = screen;
    m_lastWorld = world;
    m_dragMoved = false;

    if (button == Qt::MiddleButton || (button == Qt::LeftButton && m_tool == EditTool::Pan)) {
        m_drag = DragMode::Pan;
        return;
    }

    if (button == Qt::RightButton) {
        if (isDrawing()) finishDraft();
        return;
    }

    if (button != Qt::LeftButton) return;

    switch (m_tool) {
        case EditTool::Select:
            pressSelect(world, modifiers);
            break;

        case EditTool::AddPoint: {
            PrimitiveId id = m_model->addPoint(world);
            if (id == InvalidPrimitiveId) {
                emit statusMessage(m_model->lastError().message);
                break;
            }
            setSelection(QVector<PrimitiveId>() << id);
            emit statusMessage(QString("Added point at %1, %2")
                                   .arg(world.x(), 0, 'f', 3).arg(world.y(), 0, 'f', 3));
            break;
        }

        case EditTool::DrawLine:
        case EditTool::DrawPolygon:
            m_draft.append(world);
            emit draftChanged();
            break;

        case EditTool::Pan:
            break;
    }
}

void ViewportController::mouseMove(const QPointF& screen, Qt::MouseButtons buttons)
{
    QPointF world = m_viewport.screenToWorld(screen);
    m_cursorWorld = world;
    m_hasCursor = true;
    emit cursorWorldPosition(world);

    // Release happened outside the widget
    if (m_drag != DragMode::None && buttons == Qt::NoButton) {
        m_drag = DragMode::None;
    }

    switch (m_drag) {
        case DragMode::Pan:
            onDrag(screen - m_lastScreen);
            break;

        case DragMode::MoveVertex:
            if (m_selection.size() == 1 && m_model->movePoint(m_selection.first(), m_dragVertex, world)) {
                m_dragMoved = true;
            }
            break;

        case DragMode::MoveSelection: {
            QPointF delta = world - m_lastWorld;
            for (PrimitiveId id : m_selection) {
                if (m_model->translatePrimitive(id, delta)) m_dragMoved = true;
            }
            break;
        }

        case DragMode::None:
            // Rubber band follows the cursor
            if (isDrawing() && !m_draft.isEmpty()) emit draftChanged();
            break;
    }

    m_lastScreen = screen;
    m_lastWorld = m_viewport.screenToWorld(screen);
}

void ViewportController::mouseRelease(const QPointF& screen, Qt::MouseButton button)
{
    Q_UNUSED(screen);
    Q_UNUSED(button);

    if (m_dragMoved) {
        if (m_drag == DragMode::MoveVertex) {
            emit statusMessage(QString("Moved vertex %1").arg(m_dragVertex + 1));
        } else if (m_drag == DragMode::MoveSelection) {
            emit statusMessage(QString("Moved %1 primitive(s)").arg(m_selection.size()));
        }
    }
    m_drag = DragMode::None;
    m_dragVertex = -1;
    m_dragMoved = false;
}

void ViewportController::mouseDoubleClick(const QPointF& screen, Qt::MouseButton button)
{
    Q_UNUSED(screen);
    // The first click of the double-click already placed the last vertex
    if (button == Qt::LeftButton && isDrawing()) {
        finishDraft();
    }
}

bool ViewportController::keyPress(int key, Qt::KeyboardModifiers modifiers)
{
    Q_UNUSED(modifiers);

    switch (key) {
        case Qt::Key_Escape:
            if (isDrawing() && !m_draft.isEmpty()) {
                cancelDraft();
            } else if (!m_selection.isEmpty()) {
                clearSelection();
            } else if (m_tool != EditTool::Select) {
                setTool(EditTool::Select);
            }
            return true;

        case Qt::Key_Return:
        case Qt::Key_Enter:
            if (!isDrawing()) return false;
            finishDraft();
            return true;

        case Qt::Key_Backspace:
            if (!isDrawing() || m_draft.isEmpty()) return false;
            m_draft.removeLast();
            emit draftChanged();
            return true;

        case Qt::Key_Delete:
            deleteSelection();
            return true;

        default:
            return false;
    }
}

void ViewportController::select(PrimitiveId id)
{
    if (!m_model->contains(id)) return;
    setSelection(QVector<PrimitiveId>() << id);
}

void ViewportController::clearSelection()
{
    setSelection(QVector<PrimitiveId>());
}

int ViewportController::deleteSelection()
{
    if (m_selection.isEmpty()) return 0;

    // Removal signals shrink m_selection while we iterate
    const QVector<PrimitiveId> ids = m_selection;
    int removed = 0;
    for (PrimitiveId id : ids) {
        if (m_model->removePrimitive(id)) ++removed;
    }
    setSelection(QVector<PrimitiveId>());
    emit statusMessage(QString("Deleted %1 primitive(s)").arg(removed));
    return removed;
}

void ViewportController::clearCursor()
{
    m_hasCursor = false;
}

void ViewportController::onPrimitiveRemoved(PrimitiveId id)
{
    if (m_selection.removeAll(id) > 0) emit selectionChanged();
}

void ViewportController::onSceneReset()
{
    m_drag = DragMode::None;
    cancelDraft();
    clearSelection();
}

void ViewportController::pressSelect(const QPointF& world, Qt::KeyboardModifiers modifiers)
{
    double tolerance = m_viewport.screenToWorldDistance(m_pickTolerance);
    bool toggle = modifiers.testFlag(Qt::ControlModifier) || modifiers.testFlag(Qt::ShiftModifier);

    // Vertex grips of a single selected primitive take precedence
    if (!toggle && m_selection.size() == 1) {
        int vertex = m_model->hitTestVertex(m_selection.first(), world, tolerance);
        if (vertex >= 0) {
            m_dragVertex = vertex;
            m_drag = DragMode::MoveVertex;
            return;
        }
    }

    PrimitiveId hit = m_model->hitTest(world, tolerance);
    if (hit == InvalidPrimitiveId) {
        if (!toggle) clearSelection();
        m_drag = DragMode::Pan;
        return;
    }

    if (toggle) {
        QVector<PrimitiveId> ids = m_selection;
        if (ids.contains(hit)) {
            ids.removeAll(hit);
        } else {
            ids.append(hit);
        }
        setSelection(ids);
        return;
    }

    if (!isSelected(hit)) setSelection(QVector<PrimitiveId>() << hit);
    m_drag = DragMode::MoveSelection;
}

void ViewportController::setSelection(const QVector<PrimitiveId>& ids)
{
    if (m_selection == ids) return;
    m_selection = ids;
    emit selectionChanged();
}

void ViewportController::notifyView()
{
    emit viewChanged();
}

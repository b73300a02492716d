#ifndef VIEWPORTCONTROLLER_H
#define VIEWPORTCONTROLLER_H

#include <QObject>
#include <QPointF>
#include <QSizeF>
#include <QVector>
#include "canvas/viewport.h"
#include "geometry/primitive.h"

class GeometryModel;

// Editing tool state machine
enum class EditTool {
    Select,         // Click selects, drag moves selection or vertex, drag on empty space pans
    Pan,            // Left-drag pans
    AddPoint,       // Click adds a point
    DrawLine,       // Clicks append vertices, double-click/Enter finishes
    DrawPolygon     // Clicks append vertices, double-click/Enter finishes
};

// Turns mouse and keyboard input on the map canvas into viewport changes
// and model edits. Knows nothing about widgets, so every interaction can be
// driven directly from tests.
class ViewportController : public QObject {
    Q_OBJECT

public:
    explicit ViewportController(GeometryModel* model, QObject *parent = nullptr);

    GeometryModel* model() const { return m_model; }
    const Viewport& viewport() const { return m_viewport; }

    QPointF screenToWorld(const QPointF& screen) const { return m_viewport.screenToWorld(screen); }
    QPointF worldToScreen(const QPointF& world) const { return m_viewport.worldToScreen(world); }

    // View configuration
    void setViewportSize(const QSizeF& size);
    void setZoomStep(double step);
    double zoomStep() const { return m_zoomStep; }
    void setZoomLimits(double minZoom, double maxZoom);
    void setPickTolerance(double pixels);
    double pickTolerance() const { return m_pickTolerance; }

    // View changes
    void onWheel(int delta, const QPointF& cursorScreen);
    void onDrag(const QPointF& deltaScreen);
    void zoomIn();
    void zoomOut();
    void fitToScene();
    void resetView();

    // Tools
    EditTool tool() const { return m_tool; }
    void setTool(EditTool tool);
    bool isDrawing() const { return m_tool == EditTool::DrawLine || m_tool == EditTool::DrawPolygon; }
    const QVector<QPointF>& draftPoints() const { return m_draft; }
    bool finishDraft();
    void cancelDraft();

    // Raw input, in widget pixel coordinates
    void mousePress(const QPointF& screen, Qt::MouseButton button,
                    Qt::KeyboardModifiers modifiers = Qt::NoModifier);
    void mouseMove(const QPointF& screen, Qt::MouseButtons buttons);
    void mouseRelease(const QPointF& screen, Qt::MouseButton button);
    void mouseDoubleClick(const QPointF& screen, Qt::MouseButton button);
    bool keyPress(int key, Qt::KeyboardModifiers modifiers = Qt::NoModifier);

    bool isPanning() const { return m_drag == DragMode::Pan; }

    // Selection
    const QVector<PrimitiveId>& selection() const { return m_selection; }
    bool isSelected(PrimitiveId id) const { return m_selection.contains(id); }
    void select(PrimitiveId id);
    void clearSelection();
    int deleteSelection();

    QPointF cursorWorld() const { return m_cursorWorld; }
    bool hasCursor() const { return m_hasCursor; }
    void clearCursor();

signals:
    void viewChanged();
    void zoomChanged(double zoom);
    void cursorWorldPosition(const QPointF& pos);
    void selectionChanged();
    void draftChanged();
    void toolChanged(EditTool tool);
    void statusMessage(const QString& message);

private slots:
    void onPrimitiveRemoved(PrimitiveId id);
    void onSceneReset();

private:
    enum class DragMode {
        None,
        Pan,
        MoveVertex,
        MoveSelection
    };

    void pressSelect(const QPointF& world, Qt::KeyboardModifiers modifiers);
    void setSelection(const QVector<PrimitiveId>& ids);
    void notifyView();

    GeometryModel* m_model{nullptr};
    Viewport m_viewport;
    EditTool m_tool{EditTool::Select};
    double m_zoomStep{1.25};
    double m_pickTolerance{6.0};    // Pixels

    DragMode m_drag{DragMode::None};
    QPointF m_lastScreen;
    QPointF m_lastWorld;
    int m_dragVertex{-1};
    bool m_dragMoved{false};

    QVector<PrimitiveId> m_selection;
    QVector<QPointF> m_draft;
    QPointF m_cursorWorld;
    bool m_hasCursor{false};
};

#endif // VIEWPORTCONTROLLER_H

#ifndef MAPCANVAS_H
#define MAPCANVAS_H

#include <QWidget>
#include <QColor>
#include <QPointF>
#include <QVector>
#include "geometry/primitive.h"

class GeometryModel;
class ViewportController;
class QPainter;

// Paints the scene and forwards input to the ViewportController.
class MapCanvas : public QWidget {
    Q_OBJECT

public:
    explicit MapCanvas(GeometryModel* model, ViewportController* controller, QWidget *parent = nullptr);

    ViewportController* controller() const { return m_controller; }

    bool showGrid() const { return m_showGrid; }
    void setShowGrid(bool on);
    double gridSpacing() const { return m_gridSpacing; }
    void setGridSpacing(double spacing);
    QColor backgroundColor() const { return m_backgroundColor; }
    void setBackgroundColor(const QColor& color);

    QSize sizeHint() const override;

    // World positions of the grid lines covering [minValue, maxValue] at the
    // given step. Empty when the step cannot be resolved at these
    // coordinates or more than MaxGridLines lines would be drawn.
    static constexpr int MaxGridLines = 10000;
    static QVector<double> gridLines(double minValue, double maxValue, double step);

protected:
    void paintEvent(QPaintEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void mouseDoubleClickEvent(QMouseEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    void leaveEvent(QEvent *event) override;

private slots:
    void updateCursorShape();

private:
    void drawGrid(QPainter& painter);
    void drawOrigin(QPainter& painter);
    void drawPrimitive(QPainter& painter, const Primitive& primitive);
    void drawSelection(QPainter& painter);
    void drawDraft(QPainter& painter);

    GeometryModel* m_model{nullptr};
    ViewportController* m_controller{nullptr};

    bool m_showGrid{true};
    double m_gridSpacing{20.0};
    QColor m_backgroundColor{Qt::white};
    QColor m_gridColor{Qt::lightGray};
};

#endif // MAPCANVAS_H

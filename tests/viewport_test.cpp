#include "test_common.h"
#include "canvas/viewport.h"
#include <QtNumeric>

class ViewportTest : public ::testing::Test {
protected:
    void SetUp() override {
        viewport.setSize(QSizeF(800, 600));
    }

    Viewport viewport;
};

TEST_F(ViewportTest, IdentityViewMapsOriginToCentre) {
    EXPECT_POINT_NEAR(viewport.worldToScreen(QPointF(0, 0)), QPointF(400, 300), 1e-9);
    EXPECT_POINT_NEAR(viewport.worldToScreen(QPointF(10, 20)), QPointF(410, 320), 1e-9);
    EXPECT_POINT_NEAR(viewport.screenToWorld(QPointF(400, 300)), QPointF(0, 0), 1e-9);
}

TEST_F(ViewportTest, ScreenWorldRoundTrip) {
    const double zooms[] = { 1e-4, 0.37, 1.0, 2.5, 1e3, 1e6 };
    const QPointF offsets[] = { QPointF(0, 0), QPointF(-1234.5, 98.25), QPointF(1e5, -1e5) };
    const QPointF world(123.456, -789.012);

    for (double zoom : zooms) {
        for (const QPointF& offset : offsets) {
            viewport.setZoom(zoom);
            viewport.setOffset(offset);
            QPointF back = viewport.screenToWorld(viewport.worldToScreen(world));
            EXPECT_NEAR(back.x(), world.x(), 1e-6 * qMax(1.0, qAbs(world.x())));
            EXPECT_NEAR(back.y(), world.y(), 1e-6 * qMax(1.0, qAbs(world.y())));
        }
    }
}

TEST_F(ViewportTest, DragShiftsWorldUnderFixedScreenPoint) {
    const QPointF screen(250, 140);
    QPointF before = viewport.screenToWorld(screen);
    viewport.panByScreen(QPointF(10, 0));
    QPointF after = viewport.screenToWorld(screen);
    EXPECT_POINT_NEAR(after - before, QPointF(-10, 0), 1e-9);
}

TEST_F(ViewportTest, DragIsScaledByZoom) {
    viewport.setZoom(4.0);
    viewport.panByScreen(QPointF(8, -4));
    EXPECT_POINT_NEAR(viewport.offset(), QPointF(2, -1), 1e-12);
}

TEST_F(ViewportTest, ZoomAtKeepsAnchorFixed) {
    viewport.setOffset(QPointF(15, -30));
    const QPointF anchor(620, 75);
    QPointF before = viewport.screenToWorld(anchor);

    viewport.zoomAt(1.25, anchor);
    EXPECT_DOUBLE_EQ(viewport.zoom(), 1.25);
    EXPECT_POINT_NEAR(viewport.screenToWorld(anchor), before, 1e-9);

    viewport.zoomAt(0.8 * 0.8, anchor);
    EXPECT_POINT_NEAR(viewport.screenToWorld(anchor), before, 1e-9);
}

TEST_F(ViewportTest, ZoomIsClamped) {
    viewport.setZoom(1e-9);
    EXPECT_DOUBLE_EQ(viewport.zoom(), Viewport::DefaultMinZoom);
    viewport.setZoom(1e12);
    EXPECT_DOUBLE_EQ(viewport.zoom(), Viewport::DefaultMaxZoom);

    viewport.setZoomLimits(0.5, 2.0);
    EXPECT_DOUBLE_EQ(viewport.zoom(), 2.0);
    viewport.zoomAt(0.01, QPointF(0, 0));
    EXPECT_DOUBLE_EQ(viewport.zoom(), 0.5);
}

TEST_F(ViewportTest, NonFiniteZoomIsIgnored) {
    viewport.setZoom(3.0);
    viewport.setZoom(qInf());
    EXPECT_DOUBLE_EQ(viewport.zoom(), 3.0);
}

TEST_F(ViewportTest, FitToCentresRectWithMargin) {
    viewport.fitTo(QRectF(QPointF(0, 0), QPointF(100, 50)), 50.0);
    // Available area 700 x 500: width limits the zoom
    EXPECT_DOUBLE_EQ(viewport.zoom(), 7.0);
    EXPECT_POINT_NEAR(viewport.worldToScreen(QPointF(50, 25)), QPointF(400, 300), 1e-9);
    EXPECT_POINT_NEAR(viewport.worldToScreen(QPointF(0, 25)), QPointF(50, 300), 1e-9);
}

TEST_F(ViewportTest, FitToDegenerateRect) {
    viewport.fitTo(QRectF(QPointF(5, 5), QPointF(5, 5)), 50.0);
    EXPECT_DOUBLE_EQ(viewport.zoom(), 500.0);
    EXPECT_POINT_NEAR(viewport.worldToScreen(QPointF(5, 5)), QPointF(400, 300), 1e-9);
}

TEST_F(ViewportTest, ResetRestoresIdentity) {
    viewport.setZoom(8);
    viewport.setOffset(QPointF(3, 4));
    viewport.reset();
    EXPECT_DOUBLE_EQ(viewport.zoom(), 1.0);
    EXPECT_EQ(viewport.offset(), QPointF(0, 0));
}

TEST_F(ViewportTest, CenterOn) {
    viewport.setZoom(2.0);
    viewport.centerOn(QPointF(-40, 12));
    EXPECT_POINT_NEAR(viewport.worldToScreen(QPointF(-40, 12)), QPointF(400, 300), 1e-9);
}

#include "ViewportState.hpp"

#include <QTest>

namespace
{

// Draws and commits a rectangle on a 1000x1000 surface
void
drawRect(ViewportState &viewport, const QPointF &from, const QPointF &to)
{
    SelectionTracker &selection = viewport.selection();
    selection.beginDrag(from, QSizeF(1000, 1000));
    selection.updateDrag(to);
    selection.endDrag();
}

} // namespace

class ViewportStateTests : public QObject
{
    Q_OBJECT

private slots:
    void defaults()
    {
        ViewportState viewport;
        QCOMPARE(viewport.currentPage(), 1);
        QCOMPARE(viewport.pageCount(), 0);
        QCOMPARE(viewport.zoom(), 1.0);
        QVERIFY(!viewport.selectionMode());
        QVERIFY(!viewport.selection().hasRect());
    }

    void navigationClearsSelection()
    {
        ViewportState viewport;
        viewport.resetForDocument(5);
        QVERIFY(viewport.goToPage(3));
        viewport.setSelectionMode(true);
        drawRect(viewport, QPointF(10, 10), QPointF(80, 90));
        QVERIFY(viewport.selection().hasSignificantSelection());

        QVERIFY(viewport.nextPage());
        QCOMPARE(viewport.currentPage(), 4);
        QVERIFY(!viewport.selection().hasRect());
        // Crop mode survives page changes
        QVERIFY(viewport.selectionMode());

        QVERIFY(!viewport.goToPage(999));
        QCOMPARE(viewport.currentPage(), 4);
    }

    void outOfRangeNavigationIsNoOp()
    {
        ViewportState viewport;
        viewport.resetForDocument(2);
        viewport.setSelectionMode(true);
        drawRect(viewport, QPointF(0, 0), QPointF(50, 50));

        QVERIFY(!viewport.goToPage(0));
        QVERIFY(!viewport.prevPage());
        QVERIFY(!viewport.goToPage(3));
        QCOMPARE(viewport.currentPage(), 1);
        // Rejected navigation keeps the rectangle
        QVERIFY(viewport.selection().hasRect());

        QVERIFY(viewport.nextPage());
        QVERIFY(!viewport.nextPage());
        QCOMPARE(viewport.currentPage(), 2);
        QVERIFY(!viewport.canGoNext());
        QVERIFY(viewport.canGoPrev());
    }

    void zoomStepsAndClamps()
    {
        ViewportState viewport;
        viewport.zoomIn();
        QCOMPARE(viewport.zoom(), 1.25);

        for (int i = 0; i < 20; ++i)
            viewport.zoomIn();
        QCOMPARE(viewport.zoom(), 3.0);

        for (int i = 0; i < 20; ++i)
            viewport.zoomOut();
        QCOMPARE(viewport.zoom(), 0.5);

        viewport.setZoom(42.0);
        QCOMPARE(viewport.zoom(), 3.0);
        viewport.setZoom(-1.0);
        QCOMPARE(viewport.zoom(), 0.5);

        viewport.resetZoom();
        QCOMPARE(viewport.zoom(), 1.0);
    }

    void zoomClearsSelection()
    {
        ViewportState viewport;
        viewport.resetForDocument(1);
        viewport.setSelectionMode(true);
        drawRect(viewport, QPointF(0, 0), QPointF(50, 50));

        viewport.zoomIn();
        QVERIFY(!viewport.selection().hasRect());
        QVERIFY(viewport.selectionMode());
    }

    void toggleModeOffClearsSelection()
    {
        ViewportState viewport;
        viewport.resetForDocument(1);
        viewport.toggleSelectionMode();
        QVERIFY(viewport.selectionMode());
        drawRect(viewport, QPointF(0, 0), QPointF(50, 50));

        viewport.toggleSelectionMode();
        QVERIFY(!viewport.selectionMode());
        QVERIFY(!viewport.selection().hasRect());
    }

    void newDocumentResetsPageAndMode()
    {
        ViewportState viewport;
        viewport.resetForDocument(10);
        viewport.goToPage(7);
        viewport.setSelectionMode(true);
        drawRect(viewport, QPointF(0, 0), QPointF(50, 50));

        viewport.resetForDocument(3);
        QCOMPARE(viewport.currentPage(), 1);
        QCOMPARE(viewport.pageCount(), 3);
        QVERIFY(!viewport.selectionMode());
        QVERIFY(!viewport.selection().hasRect());
    }

    void newRasterDropsRectangleFromOldOne()
    {
        ViewportState viewport;
        viewport.resetForDocument(5);
        QVERIFY(!viewport.rasterCurrent());
        viewport.markRasterShown(1, 1.0);
        QVERIFY(viewport.rasterCurrent());

        // Drawn on page 1 while page 2 is still rendering
        viewport.setSelectionMode(true);
        QVERIFY(viewport.nextPage());
        QVERIFY(!viewport.rasterCurrent());
        drawRect(viewport, QPointF(100, 100), QPointF(300, 300));
        QVERIFY(viewport.selection().hasSignificantSelection());

        viewport.markRasterShown(2, 1.0);
        QVERIFY(viewport.rasterCurrent());
        QVERIFY(!viewport.selection().hasRect());
        QVERIFY(viewport.selectionMode());

        // Same page at another zoom is a different raster too
        viewport.zoomIn();
        drawRect(viewport, QPointF(100, 100), QPointF(300, 300));
        viewport.markRasterShown(2, viewport.zoom());
        QVERIFY(!viewport.selection().hasRect());
    }

    void rerenderOfSameRasterKeepsRectangle()
    {
        ViewportState viewport;
        viewport.resetForDocument(2);
        viewport.markRasterShown(1, 1.0);
        viewport.setSelectionMode(true);
        drawRect(viewport, QPointF(100, 100), QPointF(300, 300));

        viewport.markRasterShown(1, 1.0);
        QVERIFY(viewport.selection().hasSignificantSelection());

        viewport.resetForDocument(2);
        QVERIFY(!viewport.rasterCurrent());
    }

    void customZoomLimits()
    {
        ViewportState viewport(ViewportState::ZoomLimits{0.25, 8.0, 0.5});
        viewport.setZoom(6.0);
        QCOMPARE(viewport.zoom(), 6.0);
        for (int i = 0; i < 5; ++i)
            viewport.zoomIn();
        QCOMPARE(viewport.zoom(), 8.0);

        // Nonsense limits fall back to sane values
        viewport.setZoomLimits(ViewportState::ZoomLimits{0.0, -1.0, 0.0});
        QCOMPARE(viewport.zoomLimits().min, 0.5);
        QCOMPARE(viewport.zoomLimits().max, 0.5);
        QCOMPARE(viewport.zoomLimits().step, 0.25);
        QCOMPARE(viewport.zoom(), 0.5);
    }
};

QTEST_APPLESS_MAIN(ViewportStateTests)
#include "tst_viewportstate.moc"

#include "SelectionTracker.hpp"

#include <QTest>

class SelectionTrackerTests : public QObject
{
    Q_OBJECT

private slots:
    void disabledTrackerIgnoresPress()
    {
        SelectionTracker tracker;
        QVERIFY(!tracker.beginDrag(QPointF(5, 5), QSizeF(100, 100)));
        QCOMPARE(tracker.state(), SelectionTracker::State::Idle);
        QVERIFY(!tracker.hasRect());
    }

    void dragUpLeftIsNormalized()
    {
        SelectionTracker tracker;
        tracker.setEnabled(true);

        QVERIFY(tracker.beginDrag(QPointF(50, 50), QSizeF(200, 200)));
        QVERIFY(tracker.isDrawing());
        QCOMPARE(tracker.rect(), QRectF(50, 50, 0, 0));

        QVERIFY(tracker.updateDrag(QPointF(10, 10)));
        QCOMPARE(tracker.rect(), QRectF(10, 10, 40, 40));
        QCOMPARE(tracker.anchor(), QPointF(50, 50));

        QVERIFY(tracker.endDrag());
        QCOMPARE(tracker.state(), SelectionTracker::State::Committed);
        QCOMPARE(tracker.rect(), QRectF(10, 10, 40, 40));
    }

    void dragAcrossAnchorFlipsOnlyOneAxis()
    {
        SelectionTracker tracker;
        tracker.setEnabled(true);
        tracker.beginDrag(QPointF(30, 30), QSizeF(200, 200));
        tracker.updateDrag(QPointF(80, 5));
        QCOMPARE(tracker.rect(), QRectF(30, 5, 50, 25));
    }

    void pressOutsideSurfaceIsIgnored()
    {
        SelectionTracker tracker;
        tracker.setEnabled(true);
        QVERIFY(!tracker.beginDrag(QPointF(-1, 10), QSizeF(100, 100)));
        QVERIFY(!tracker.beginDrag(QPointF(10, 101), QSizeF(100, 100)));
        QCOMPARE(tracker.state(), SelectionTracker::State::Idle);

        // Edges count as on the surface
        QVERIFY(tracker.beginDrag(QPointF(100, 0), QSizeF(100, 100)));
    }

    void moveWithoutPressIsNoOp()
    {
        SelectionTracker tracker;
        tracker.setEnabled(true);
        QVERIFY(!tracker.updateDrag(QPointF(10, 10)));
        QVERIFY(!tracker.endDrag());
        QCOMPARE(tracker.state(), SelectionTracker::State::Idle);
    }

    void newPressReplacesCommittedRect()
    {
        SelectionTracker tracker;
        tracker.setEnabled(true);
        tracker.beginDrag(QPointF(0, 0), QSizeF(100, 100));
        tracker.updateDrag(QPointF(40, 40));
        tracker.endDrag();

        QVERIFY(tracker.beginDrag(QPointF(60, 60), QSizeF(100, 100)));
        QVERIFY(tracker.isDrawing());
        QCOMPARE(tracker.rect(), QRectF(60, 60, 0, 0));
    }

    void significanceThreshold_data()
    {
        QTest::addColumn<QRectF>("rect");
        QTest::addColumn<bool>("significant");

        QTest::newRow("10x10") << QRectF(0, 0, 10, 10) << false;
        QTest::newRow("11x11") << QRectF(0, 0, 11, 11) << true;
        QTest::newRow("wide but flat") << QRectF(0, 0, 300, 10) << false;
        QTest::newRow("tall but thin") << QRectF(0, 0, 10, 300) << false;
        QTest::newRow("fractional") << QRectF(0, 0, 10.5, 10.5) << true;
    }

    void significanceThreshold()
    {
        QFETCH(QRectF, rect);
        QFETCH(bool, significant);
        QCOMPARE(SelectionTracker::isSignificant(rect), significant);
    }

    void significantWhileDrawing()
    {
        SelectionTracker tracker;
        tracker.setEnabled(true);
        tracker.beginDrag(QPointF(0, 0), QSizeF(100, 100));
        tracker.updateDrag(QPointF(10, 10));
        QVERIFY(!tracker.hasSignificantSelection());
        tracker.updateDrag(QPointF(11, 11));
        QVERIFY(tracker.hasSignificantSelection());
    }

    void disablingClearsRect()
    {
        SelectionTracker tracker;
        tracker.setEnabled(true);
        tracker.beginDrag(QPointF(0, 0), QSizeF(100, 100));
        tracker.updateDrag(QPointF(50, 50));
        tracker.endDrag();

        tracker.setEnabled(false);
        QVERIFY(!tracker.hasRect());
        QVERIFY(!tracker.hasSignificantSelection());
        QCOMPARE(tracker.state(), SelectionTracker::State::Idle);
    }
};

QTEST_APPLESS_MAIN(SelectionTrackerTests)
#include "tst_selectiontracker.moc"

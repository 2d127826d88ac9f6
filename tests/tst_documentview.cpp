#include "Config.hpp"
#include "DocumentView.hpp"

#include <QList>
#include <QSignalSpy>
#include <QTest>

namespace
{

// Smallest well-formed PDF with `pages` blank 200x100 pages
QByteArray
blankPdf(int pages)
{
    QByteArray pdf("%PDF-1.4\n");
    QList<qsizetype> offsets;

    auto addObject = [&pdf, &offsets](const QByteArray &body)
    {
        offsets.append(pdf.size());
        pdf += QByteArray::number(offsets.size()) + " 0 obj\n" + body
               + "\nendobj\n";
    };

    QByteArray kids;
    for (int i = 0; i < pages; ++i)
        kids += QByteArray::number(3 + i) + " 0 R ";

    addObject("<< /Type /Catalog /Pages 2 0 R >>");
    addObject("<< /Type /Pages /Kids [" + kids + "] /Count "
              + QByteArray::number(pages) + " >>");
    for (int i = 0; i < pages; ++i)
        addObject("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 200 100] >>");

    const qsizetype xref = pdf.size();
    const QByteArray size = QByteArray::number(offsets.size() + 1);
    pdf += "xref\n0 " + size + "\n0000000000 65535 f \n";
    for (qsizetype offset : offsets)
        pdf += QByteArray::number(offset).rightJustified(10, '0')
               + " 00000 n \n";
    pdf += "trailer\n<< /Size " + size + " /Root 1 0 R >>\nstartxref\n"
           + QByteArray::number(xref) + "\n%%EOF\n";
    return pdf;
}

} // namespace

class DocumentViewTests : public QObject
{
    Q_OBJECT

private slots:
    void opensDocumentFromMemory()
    {
        DocumentView view(m_config);
        QSignalSpy finished(&view, &DocumentView::openFileFinished);

        view.OpenBytes(blankPdf(2), "two.pdf");
        QVERIFY(finished.wait(5000));

        QVERIFY(view.model()->success());
        QCOMPARE(view.fileName(), QString("two.pdf"));
        QCOMPARE(view.viewportState().pageCount(), 2);
        QCOMPARE(view.viewportState().currentPage(), 1);
        QCOMPARE(view.passphraseGate()->state(), PassphraseGate::State::Open);
    }

    void replacingDocumentUnloadsPrevious()
    {
        DocumentView view(m_config);
        QSignalSpy finished(&view, &DocumentView::openFileFinished);
        QSignalSpy started(&view, &DocumentView::openFileStarted);

        view.OpenBytes(blankPdf(2), "first.pdf");
        QVERIFY(finished.wait(5000));
        view.GotoNextPage();
        QCOMPARE(view.viewportState().currentPage(), 2);

        // Nothing of the first document may be used while the second opens
        view.OpenBytes(blankPdf(3), "second.pdf");
        QCOMPARE(started.count(), 2);
        QVERIFY(!view.model()->success());
        QCOMPARE(view.model()->numPages(), 0);
        QCOMPARE(view.viewportState().pageCount(), 0);
        QCOMPARE(view.viewportState().currentPage(), 1);
        QCOMPARE(view.fileName(), QString("second.pdf"));

        QVERIFY(finished.wait(5000));
        QVERIFY(view.model()->success());
        QCOMPARE(view.viewportState().pageCount(), 3);
    }

    void navigationReportsPage()
    {
        DocumentView view(m_config);
        QSignalSpy finished(&view, &DocumentView::openFileFinished);
        view.OpenBytes(blankPdf(3), "three.pdf");
        QVERIFY(finished.wait(5000));

        QSignalSpy changed(&view, &DocumentView::pageChanged);
        view.GotoPage(3);
        QCOMPARE(changed.count(), 1);
        QCOMPARE(changed.at(0).at(0).toInt(), 3);
        QCOMPARE(changed.at(0).at(1).toInt(), 3);

        // Out of range keeps the page
        view.GotoNextPage();
        QCOMPARE(view.viewportState().currentPage(), 3);
    }

    void closeFileUnloads()
    {
        DocumentView view(m_config);
        QSignalSpy finished(&view, &DocumentView::openFileFinished);
        view.OpenBytes(blankPdf(1), "one.pdf");
        QVERIFY(finished.wait(5000));

        view.CloseFile();
        QVERIFY(!view.model()->success());
        QVERIFY(view.model()->fileBytes().isEmpty());
        QCOMPARE(view.viewportState().pageCount(), 0);
        QCOMPARE(view.passphraseGate()->state(),
                 PassphraseGate::State::Closed);
    }

private:
    Config m_config;
};

QTEST_MAIN(DocumentViewTests)
#include "tst_documentview.moc"

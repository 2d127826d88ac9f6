#include "CropPipeline.hpp"
#include "ViewportState.hpp"

#include <QImageWriter>
#include <QTest>

namespace
{

// A 400x300 page raster rendered at DPR 2 and shown 200x150 at (20, 20)
QImage
pageRaster()
{
    QImage image(400, 300, QImage::Format_ARGB32);
    for (int y = 0; y < image.height(); ++y)
        for (int x = 0; x < image.width(); ++x)
            image.setPixel(x, y, qRgb(x % 256, y % 256, 128));
    image.setDevicePixelRatio(2.0);
    return image;
}

const RasterGeometry kGeometry{QSize(400, 300), QRectF(20, 20, 200, 150)};

// The view has received the raster for the current page and zoom
void
showCurrentPage(ViewportState &viewport)
{
    viewport.markRasterShown(viewport.currentPage(), viewport.zoom());
}

void
select(ViewportState &viewport, const QPointF &from, const QPointF &to)
{
    viewport.setSelectionMode(true);
    SelectionTracker &selection = viewport.selection();
    selection.beginDrag(from, QSizeF(200, 150));
    selection.updateDrag(to);
    selection.endDrag();
}

} // namespace

class CropPipelineTests : public QObject
{
    Q_OBJECT

private slots:
    void cropsCommittedSelection()
    {
        ViewportState viewport;
        viewport.resetForDocument(3);
        showCurrentPage(viewport);
        select(viewport, QPointF(60, 40), QPointF(10, 10));

        const QImage raster = pageRaster();
        CropPipeline pipeline;
        const auto result = pipeline.run(viewport, raster, kGeometry,
                                         RasterExtractor::Format::LosslessRGBA);

        QVERIFY(result.isCrop());
        QCOMPARE(result.reason, CropPipeline::FallbackReason::None);
        QCOMPARE(result.pixelRect, QRectF(20, 20, 100, 60));
        QCOMPARE(result.image.size(), QSize(100, 60));
        QCOMPARE(result.image.pixel(0, 0), raster.pixel(20, 20));
        QCOMPARE(result.image.pixel(99, 59), raster.pixel(119, 79));

        const QImage decoded = RasterExtractor::decode(result.bytes);
        QCOMPARE(decoded.size(), QSize(100, 60));
        QCOMPARE(decoded.pixel(50, 30), raster.pixel(70, 50));

        QCOMPARE(pipeline.suggestedFileName(result, 1),
                 QString("pdf-cropped-selection.png"));
    }

    void smallSelectionFallsBackToPage()
    {
        ViewportState viewport;
        viewport.resetForDocument(3);
        viewport.goToPage(2);
        showCurrentPage(viewport);
        select(viewport, QPointF(10, 10), QPointF(20, 20));

        CropPipeline pipeline;
        const auto result
            = pipeline.run(viewport, pageRaster(), kGeometry,
                           RasterExtractor::Format::LosslessRGBA);

        QVERIFY(!result.isCrop());
        QCOMPARE(result.reason,
                 CropPipeline::FallbackReason::SelectionTooSmall);
        QCOMPARE(result.image.size(), QSize(400, 300));
        QCOMPARE(result.image.devicePixelRatio(), 1.0);
        QVERIFY(!result.bytes.isEmpty());
        QCOMPARE(pipeline.suggestedFileName(result, viewport.currentPage()),
                 QString("page-2.png"));
    }

    void noSelectionFallsBackToPage()
    {
        ViewportState viewport;
        viewport.resetForDocument(1);
        showCurrentPage(viewport);

        CropPipeline pipeline;
        const auto result
            = pipeline.run(viewport, pageRaster(), kGeometry,
                           RasterExtractor::Format::LosslessRGBA);
        QCOMPARE(result.reason,
                 CropPipeline::FallbackReason::SelectionTooSmall);
    }

    void staleGeometryFallsBackToPage()
    {
        ViewportState viewport;
        viewport.resetForDocument(1);
        showCurrentPage(viewport);
        select(viewport, QPointF(10, 10), QPointF(60, 60));

        // The page is not on screen any more
        const RasterGeometry hidden{QSize(400, 300), QRectF()};

        CropPipeline pipeline;
        const auto result = pipeline.run(viewport, pageRaster(), hidden,
                                         RasterExtractor::Format::LosslessRGBA);
        QVERIFY(!result.isCrop());
        QCOMPARE(result.reason, CropPipeline::FallbackReason::GeometryMismatch);
        QCOMPARE(result.image.size(), QSize(400, 300));
    }

    void missingRasterReportsExtractionFailure()
    {
        ViewportState viewport;
        viewport.resetForDocument(1);
        showCurrentPage(viewport);
        select(viewport, QPointF(10, 10), QPointF(60, 60));

        CropPipeline pipeline;
        const auto result = pipeline.run(viewport, QImage(), kGeometry,
                                         RasterExtractor::Format::LosslessRGBA);
        QVERIFY(!result.isCrop());
        QCOMPARE(result.reason, CropPipeline::FallbackReason::ExtractionFailed);
        QVERIFY(result.bytes.isEmpty());
    }

    void selectionOverPreviousPageIsNotCropped()
    {
        ViewportState viewport;
        viewport.resetForDocument(5);
        viewport.goToPage(3);
        showCurrentPage(viewport);

        // Page 4 is requested, page 3 stays on screen until it arrives
        QVERIFY(viewport.nextPage());
        QVERIFY(!viewport.rasterCurrent());
        select(viewport, QPointF(10, 10), QPointF(110, 110));

        const QImage page3 = pageRaster();
        CropPipeline pipeline;
        auto result = pipeline.run(viewport, page3, kGeometry,
                                   RasterExtractor::Format::LosslessRGBA);
        QVERIFY(!result.isCrop());
        QCOMPARE(result.reason, CropPipeline::FallbackReason::RasterOutdated);
        QVERIFY(result.image.isNull());
        QVERIFY(result.bytes.isEmpty());

        // Page 4 lands and takes the stale rectangle with it
        viewport.markRasterShown(4, viewport.zoom());
        QVERIFY(!viewport.selection().hasRect());
        result = pipeline.run(viewport, pageRaster(), kGeometry,
                              RasterExtractor::Format::LosslessRGBA);
        QCOMPARE(result.reason,
                 CropPipeline::FallbackReason::SelectionTooSmall);
        QCOMPARE(pipeline.suggestedFileName(result, viewport.currentPage()),
                 QString("page-4.png"));
    }

    void jpegCropUsesConfiguredName()
    {
        if (!QImageWriter::supportedImageFormats().contains("jpeg"))
            QSKIP("Qt was built without the JPEG image plugin");

        ViewportState viewport;
        viewport.resetForDocument(1);
        showCurrentPage(viewport);
        select(viewport, QPointF(0, 0), QPointF(100, 75));

        CropPipeline pipeline;
        pipeline.setBaseFileName("figure");
        pipeline.setJpegQuality(80);
        const auto result = pipeline.run(viewport, pageRaster(), kGeometry,
                                         RasterExtractor::Format::OpaqueRGB);

        QVERIFY(result.isCrop());
        QCOMPARE(result.image.size(), QSize(200, 150));
        QVERIFY(result.bytes.startsWith("\xFF\xD8"));
        QCOMPARE(pipeline.suggestedFileName(result, 1), QString("figure.jpg"));
    }
};

QTEST_MAIN(CropPipelineTests)
#include "tst_croppipeline.moc"

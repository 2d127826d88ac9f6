#include "CropPipeline.hpp"

#include "ViewportState.hpp"

#include <QDebug>
#include <utility>

CropPipeline::Result
CropPipeline::run(const ViewportState &viewport, const QImage &raster,
                  const RasterGeometry &geometry,
                  RasterExtractor::Format format) const noexcept
{
    if (!viewport.rasterCurrent())
    {
        Result result;
        result.reason = FallbackReason::RasterOutdated;
        result.format = format;
        return result;
    }

    const SelectionTracker &selection = viewport.selection();
    if (!selection.hasSignificantSelection())
        return wholePage(raster, format, FallbackReason::SelectionTooSmall);

    const auto pixelRect
        = CoordinateMapper::mapToPixelSpace(selection.rect(), geometry);
    if (!pixelRect)
    {
        qWarning() << "CropPipeline::run(): selection" << selection.rect()
                   << "maps to nothing on" << geometry.nativeSize;
        return wholePage(raster, format, FallbackReason::GeometryMismatch);
    }

    QImage crop;
    const auto err = RasterExtractor::extract(raster, *pixelRect, crop);
    if (err != RasterExtractor::ExtractionError::None)
    {
        qWarning() << "CropPipeline::run(): extraction failed:"
                   << RasterExtractor::errorString(err);
        return wholePage(raster, format, FallbackReason::ExtractionFailed);
    }

    Result result;
    result.outcome   = Outcome::Cropped;
    result.pixelRect = *pixelRect;
    result.format    = format;
    result.bytes     = RasterExtractor::encode(crop, format, m_jpeg_quality);
    result.image     = std::move(crop);

#ifndef NDEBUG
    qDebug() << "CropPipeline::run(): cropped" << result.pixelRect << "from"
             << geometry.nativeSize << "into" << result.bytes.size()
             << "bytes";
#endif
    return result;
}

CropPipeline::Result
CropPipeline::wholePage(const QImage &raster, RasterExtractor::Format format,
                        FallbackReason reason) const noexcept
{
    Result result;
    result.outcome = Outcome::WholePage;
    result.reason  = reason;
    result.format  = format;
    if (!raster.isNull())
    {
        result.image = raster;
        result.image.setDevicePixelRatio(1.0);
        result.pixelRect = QRectF(QPointF(0, 0), QSizeF(raster.size()));
        result.bytes
            = RasterExtractor::encode(result.image, format, m_jpeg_quality);
    }
    return result;
}

QString
CropPipeline::suggestedFileName(const Result &result, int pageno) const noexcept
{
    const QString suffix = RasterExtractor::fileSuffix(result.format);
    if (result.isCrop())
        return QString("%1.%2").arg(m_base_file_name, suffix);
    return QString("page-%1.%2").arg(pageno).arg(suffix);
}

const char *
CropPipeline::reasonString(FallbackReason reason) noexcept
{
    switch (reason)
    {
        case FallbackReason::None:
            return "none";
        case FallbackReason::SelectionTooSmall:
            return "selection too small";
        case FallbackReason::RasterOutdated:
            return "page still rendering";
        case FallbackReason::GeometryMismatch:
            return "selection outside the page";
        case FallbackReason::ExtractionFailed:
            return "extraction failed";
    }
    return "unknown";
}

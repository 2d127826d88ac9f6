#pragma once

#include "CoordinateMapper.hpp"
#include "RasterExtractor.hpp"

#include <QByteArray>
#include <QImage>
#include <QRectF>
#include <QString>

class ViewportState;

// Turns the committed selection into encoded image bytes. Every failure
// degrades to the whole page instead of producing a broken crop, except a
// raster that still shows another page or zoom: that result is empty.
class CropPipeline
{
public:
    enum class Outcome
    {
        Cropped = 0,
        WholePage
    };

    enum class FallbackReason
    {
        None = 0,
        SelectionTooSmall,
        RasterOutdated,
        GeometryMismatch,
        ExtractionFailed
    };

    struct Result
    {
        Outcome outcome{Outcome::WholePage};
        FallbackReason reason{FallbackReason::None};
        QImage image;
        QByteArray bytes;
        QRectF pixelRect;
        RasterExtractor::Format format{RasterExtractor::Format::LosslessRGBA};

        inline bool isCrop() const noexcept
        {
            return outcome == Outcome::Cropped;
        }
    };

    CropPipeline() noexcept = default;

    inline void setJpegQuality(int quality) noexcept
    {
        m_jpeg_quality = quality;
    }

    inline void setBaseFileName(const QString &name) noexcept
    {
        m_base_file_name = name;
    }

    Result run(const ViewportState &viewport, const QImage &raster,
               const RasterGeometry &geometry,
               RasterExtractor::Format format) const noexcept;

    QString suggestedFileName(const Result &result, int pageno) const noexcept;

    static const char *reasonString(FallbackReason reason) noexcept;

private:
    Result wholePage(const QImage &raster, RasterExtractor::Format format,
                     FallbackReason reason) const noexcept;

    int m_jpeg_quality{90};
    QString m_base_file_name{"pdf-cropped-selection"};
};

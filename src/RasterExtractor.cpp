#include "RasterExtractor.hpp"

#include "CoordinateMapper.hpp"

#include <QBuffer>
#include <QDebug>
#include <QFileInfo>
#include <QPainter>
#include <utility>

namespace RasterExtractor
{

ExtractionError
extract(const QImage &source, const QRectF &pixelRect, QImage &out) noexcept
{
    if (source.isNull())
        return ExtractionError::NullSource;

    const QRect bounds
        = CoordinateMapper::toPixelBounds(pixelRect, source.size());
    if (bounds.width() <= 0 || bounds.height() <= 0)
        return ExtractionError::EmptyRegion;

    // QImage::copy is a plain memory copy of the region, no resampling
    QImage crop = source.copy(bounds);
    if (crop.isNull())
        return ExtractionError::EmptyRegion;

    // The crop is shown and saved at 1:1, the source DPR no longer applies
    crop.setDevicePixelRatio(1.0);
    out = std::move(crop);
    return ExtractionError::None;
}

QImage
flattenOnWhite(const QImage &image) noexcept
{
    if (image.isNull())
        return {};

    QImage flat(image.size(), QImage::Format_RGB32);
    flat.setDotsPerMeterX(image.dotsPerMeterX());
    flat.setDotsPerMeterY(image.dotsPerMeterY());
    flat.fill(Qt::white);

    QPainter painter(&flat);
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);
    painter.drawImage(QPoint(0, 0), image);
    painter.end();

    return flat;
}

QByteArray
encode(const QImage &image, Format format, int jpegQuality) noexcept
{
    QByteArray bytes;
    if (image.isNull())
        return bytes;

    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::WriteOnly))
        return {};

    bool ok = false;
    switch (format)
    {
        case Format::LosslessRGBA:
        {
            const QImage rgba = image.hasAlphaChannel()
                                    ? image.convertToFormat(QImage::Format_ARGB32)
                                    : image;
            ok = rgba.save(&buffer, "PNG");
        }
        break;

        case Format::OpaqueRGB:
            ok = flattenOnWhite(image).save(&buffer, "JPEG", jpegQuality);
            break;
    }

    if (!ok)
    {
        qWarning() << "RasterExtractor::encode(): failed to encode"
                   << image.size() << "as" << fileSuffix(format);
        return {};
    }

    return bytes;
}

QImage
decode(const QByteArray &bytes) noexcept
{
    QImage image;
    if (!image.loadFromData(bytes))
        qWarning() << "RasterExtractor::decode(): unreadable image data";
    return image;
}

Format
formatForFileName(const QString &fileName) noexcept
{
    if (fileName.endsWith(".jpg", Qt::CaseInsensitive)
        || fileName.endsWith(".jpeg", Qt::CaseInsensitive))
        return Format::OpaqueRGB;
    return Format::LosslessRGBA;
}

std::optional<Format>
formatOfBytes(const QByteArray &bytes) noexcept
{
    if (bytes.startsWith("\x89PNG\r\n\x1a\n"))
        return Format::LosslessRGBA;
    if (bytes.startsWith("\xFF\xD8\xFF"))
        return Format::OpaqueRGB;
    return std::nullopt;
}

QByteArray
encodeForFileName(const QByteArray &bytes, const QString &fileName,
                  int jpegQuality) noexcept
{
    const QString suffix = QFileInfo(fileName).suffix().toLower();
    if (suffix != "png" && suffix != "jpg" && suffix != "jpeg")
        return bytes;

    const std::optional<Format> current = formatOfBytes(bytes);
    const Format wanted                 = formatForFileName(fileName);
    if (!current || *current == wanted)
        return bytes;

    const QImage image = decode(bytes);
    if (image.isNull())
        return bytes;

    QByteArray out = encode(image, wanted, jpegQuality);
    if (out.isEmpty())
    {
        qWarning() << "RasterExtractor::encodeForFileName(): keeping"
                   << fileSuffix(*current) << "data for" << fileName;
        return bytes;
    }

#ifndef NDEBUG
    qDebug() << "RasterExtractor::encodeForFileName(): re-encoded"
             << fileSuffix(*current) << "as" << fileSuffix(wanted) << "for"
             << fileName;
#endif
    return out;
}

QString
fileSuffix(Format format) noexcept
{
    return format == Format::OpaqueRGB ? QStringLiteral("jpg")
                                       : QStringLiteral("png");
}

const char *
errorString(ExtractionError error) noexcept
{
    switch (error)
    {
        case ExtractionError::None:
            return "no error";
        case ExtractionError::NullSource:
            return "no raster to extract from";
        case ExtractionError::EmptyRegion:
            return "region is empty after rounding";
    }
    return "unknown error";
}

} // namespace RasterExtractor

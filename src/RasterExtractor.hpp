#pragma once

#include <QByteArray>
#include <QImage>
#include <QRectF>
#include <QString>
#include <optional>

namespace RasterExtractor
{

enum class ExtractionError
{
    None = 0,
    NullSource,
    EmptyRegion
};

enum class Format
{
    LosslessRGBA = 0, // PNG, alpha kept
    OpaqueRGB         // JPEG, composited onto white first
};

// Copies `pixelRect` (rounded with CoordinateMapper::toPixelBounds) out of
// `source` into `out` at native resolution. `out` is left untouched on error.
ExtractionError extract(const QImage &source, const QRectF &pixelRect,
                        QImage &out) noexcept;

// Alpha-blends every pixel onto opaque white
QImage flattenOnWhite(const QImage &image) noexcept;

// Returns an empty array if the image could not be encoded
QByteArray encode(const QImage &image, Format format,
                  int jpegQuality = 90) noexcept;

QImage decode(const QByteArray &bytes) noexcept;

Format formatForFileName(const QString &fileName) noexcept;

// Format of already encoded bytes, nullopt if they are neither PNG nor JPEG
std::optional<Format> formatOfBytes(const QByteArray &bytes) noexcept;

// Re-encodes image bytes when `fileName` carries the other image suffix.
// Bytes that already match, names without an image suffix and data that is
// not an image come back unchanged.
QByteArray encodeForFileName(const QByteArray &bytes, const QString &fileName,
                             int jpegQuality = 90) noexcept;
QString fileSuffix(Format format) noexcept;
const char *errorString(ExtractionError error) noexcept;

} // namespace RasterExtractor

#pragma once

#include <QPointF>
#include <QRect>
#include <QRectF>
#include <QSize>
#include <optional>

// Geometry of one rendered page: the raster's native pixel size and the
// on-screen box it currently occupies. Must be measured again for every
// extraction since zoom, scroll and re-render all change it.
struct RasterGeometry
{
    QSize nativeSize{};
    QRectF displayBounds{};

    inline bool isValid() const noexcept
    {
        return nativeSize.width() > 0 && nativeSize.height() > 0
               && displayBounds.width() > 0 && displayBounds.height() > 0;
    }
};

namespace CoordinateMapper
{

// Container (view) coordinates to coordinates relative to the raster
// surface's top-left corner. Selections are always stored in the latter.
QPointF toSurfacePoint(const QPointF &containerPoint,
                       const RasterGeometry &geometry) noexcept;

// Display-space rect to a pixel-space rect clipped to the native raster.
// Returns nullopt when nothing remains after clipping.
std::optional<QRectF> mapToPixelSpace(const QRectF &rect,
                                      const RasterGeometry &geometry) noexcept;

// Integer pixel bounds: origin floored, far edge ceiled, both clamped to
// `nativeSize`. May be empty.
QRect toPixelBounds(const QRectF &pixelRect, const QSize &nativeSize) noexcept;

} // namespace CoordinateMapper

#include "CoordinateMapper.hpp"

#include <QDebug>
#include <algorithm>
#include <cmath>

namespace CoordinateMapper
{

QPointF
toSurfacePoint(const QPointF &containerPoint,
               const RasterGeometry &geometry) noexcept
{
    return containerPoint - geometry.displayBounds.topLeft();
}

std::optional<QRectF>
mapToPixelSpace(const QRectF &rect, const RasterGeometry &geometry) noexcept
{
    if (!geometry.isValid())
    {
        qWarning() << "CoordinateMapper::mapToPixelSpace(): invalid geometry"
                   << geometry.nativeSize << geometry.displayBounds;
        return std::nullopt;
    }

    const double nativeW = geometry.nativeSize.width();
    const double nativeH = geometry.nativeSize.height();
    const double scaleX  = nativeW / geometry.displayBounds.width();
    const double scaleY  = nativeH / geometry.displayBounds.height();

    // A drag may leave the surface on the left or top, so the far edge is
    // clipped on its own rather than trusting width from a clamped origin.
    const double px = std::max(0.0, rect.x() * scaleX);
    const double py = std::max(0.0, rect.y() * scaleY);
    const double pw = std::min(rect.right() * scaleX, nativeW) - px;
    const double ph = std::min(rect.bottom() * scaleY, nativeH) - py;

    if (pw <= 0.0 || ph <= 0.0)
        return std::nullopt;

    return QRectF(px, py, pw, ph);
}

QRect
toPixelBounds(const QRectF &pixelRect, const QSize &nativeSize) noexcept
{
    const int x0 = std::clamp(static_cast<int>(std::floor(pixelRect.left())),
                              0, nativeSize.width());
    const int y0 = std::clamp(static_cast<int>(std::floor(pixelRect.top())), 0,
                              nativeSize.height());
    const int x1 = std::clamp(static_cast<int>(std::ceil(pixelRect.right())),
                              x0, nativeSize.width());
    const int y1 = std::clamp(static_cast<int>(std::ceil(pixelRect.bottom())),
                              y0, nativeSize.height());

    return QRect(x0, y0, x1 - x0, y1 - y0);
}

} // namespace CoordinateMapper

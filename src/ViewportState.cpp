#include "ViewportState.hpp"

#include <QDebug>
#include <algorithm>

ViewportState::ViewportState(const ZoomLimits &limits) noexcept
{
    setZoomLimits(limits);
}

void
ViewportState::setZoomLimits(const ZoomLimits &limits) noexcept
{
    m_limits = limits;
    if (m_limits.min <= 0.0)
        m_limits.min = 0.5;
    if (m_limits.max < m_limits.min)
        m_limits.max = m_limits.min;
    if (m_limits.step <= 0.0)
        m_limits.step = 0.25;

    const double z = clampZoom(m_zoom);
    if (z != m_zoom)
        setZoom(z);
}

// Called when a document is opened or replaced
void
ViewportState::resetForDocument(int pageCount) noexcept
{
    m_page_count   = std::max(pageCount, 0);
    m_current_page = 1;
    m_selection.setEnabled(false);
    clearShownRaster();
}

bool
ViewportState::goToPage(int pageno) noexcept
{
    if (pageno < 1 || pageno > m_page_count)
    {
#ifndef NDEBUG
        qDebug() << "ViewportState::goToPage(): ignoring out of range page"
                 << pageno << "of" << m_page_count;
#endif
        return false;
    }

    m_selection.clear();
    m_current_page = pageno;
    return true;
}

bool
ViewportState::nextPage() noexcept
{
    return goToPage(m_current_page + 1);
}

bool
ViewportState::prevPage() noexcept
{
    return goToPage(m_current_page - 1);
}

double
ViewportState::clampZoom(double zoom) const noexcept
{
    return std::clamp(zoom, m_limits.min, m_limits.max);
}

void
ViewportState::setZoom(double zoom) noexcept
{
    m_selection.clear();
    m_zoom = clampZoom(zoom);
}

void
ViewportState::zoomIn() noexcept
{
    setZoom(m_zoom + m_limits.step);
}

void
ViewportState::zoomOut() noexcept
{
    setZoom(m_zoom - m_limits.step);
}

void
ViewportState::resetZoom() noexcept
{
    setZoom(1.0);
}

void
ViewportState::setSelectionMode(bool enabled) noexcept
{
    m_selection.setEnabled(enabled);
}

void
ViewportState::toggleSelectionMode() noexcept
{
    setSelectionMode(!m_selection.enabled());
}

void
ViewportState::clearSelection() noexcept
{
    m_selection.clear();
}

// A rectangle drawn over a different page or zoom does not describe the new
// pixels, so it goes away when they replace the old ones.
void
ViewportState::markRasterShown(int pageno, double zoom) noexcept
{
    if (pageno != m_shown_page || zoom != m_shown_zoom)
    {
#ifndef NDEBUG
        if (m_selection.hasRect())
            qDebug() << "ViewportState::markRasterShown(): dropping rectangle"
                     << "drawn on page" << m_shown_page;
#endif
        m_selection.clear();
    }

    m_shown_page = pageno;
    m_shown_zoom = zoom;
}

void
ViewportState::clearShownRaster() noexcept
{
    m_shown_page = 0;
    m_shown_zoom = 0.0;
}

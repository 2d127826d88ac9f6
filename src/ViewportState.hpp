#pragma once

#include "SelectionTracker.hpp"

// Page, zoom and crop-rectangle state for one open document. Every mutation
// that invalidates the drawn rectangle clears it in the same call.
class ViewportState
{
public:
    struct ZoomLimits
    {
        double min{0.5};
        double max{3.0};
        double step{0.25};
    };

    ViewportState() noexcept = default;
    explicit ViewportState(const ZoomLimits &limits) noexcept;

    inline int currentPage() const noexcept
    {
        return m_current_page;
    }

    inline int pageCount() const noexcept
    {
        return m_page_count;
    }

    inline double zoom() const noexcept
    {
        return m_zoom;
    }

    inline const ZoomLimits &zoomLimits() const noexcept
    {
        return m_limits;
    }

    inline bool canGoNext() const noexcept
    {
        return m_current_page < m_page_count;
    }

    inline bool canGoPrev() const noexcept
    {
        return m_current_page > 1;
    }

    inline bool selectionMode() const noexcept
    {
        return m_selection.enabled();
    }

    inline SelectionTracker &selection() noexcept
    {
        return m_selection;
    }

    inline const SelectionTracker &selection() const noexcept
    {
        return m_selection;
    }

    // The raster on screen was rendered for the current page and zoom.
    // Drags and crops are only valid while this holds.
    inline bool rasterCurrent() const noexcept
    {
        return m_shown_page == m_current_page && m_shown_zoom == m_zoom;
    }

    void setZoomLimits(const ZoomLimits &limits) noexcept;
    void resetForDocument(int pageCount) noexcept;

    bool goToPage(int pageno) noexcept;
    bool nextPage() noexcept;
    bool prevPage() noexcept;

    void setZoom(double zoom) noexcept;
    void zoomIn() noexcept;
    void zoomOut() noexcept;
    void resetZoom() noexcept;

    void setSelectionMode(bool enabled) noexcept;
    void toggleSelectionMode() noexcept;
    void clearSelection() noexcept;

    void markRasterShown(int pageno, double zoom) noexcept;
    void clearShownRaster() noexcept;

private:
    double clampZoom(double zoom) const noexcept;

    ZoomLimits m_limits{};
    int m_current_page{1};
    int m_page_count{0};
    double m_zoom{1.0};
    int m_shown_page{0};
    double m_shown_zoom{0.0};
    SelectionTracker m_selection{};
};

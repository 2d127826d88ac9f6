#pragma once

#include <QPointF>
#include <QRectF>
#include <QSizeF>

// Tracks the single crop rectangle drawn by the user. All coordinates are in
// display space relative to the raster surface's own top-left corner.
class SelectionTracker
{
public:
    enum class State
    {
        Idle = 0,
        Drawing,
        Committed
    };

    // Rectangles at or below this size (display pixels) are accidental
    // clicks, not crops.
    static constexpr qreal SIGNIFICANT_SIZE = 10.0;

    SelectionTracker() noexcept = default;

    inline State state() const noexcept
    {
        return m_state;
    }

    inline bool isDrawing() const noexcept
    {
        return m_state == State::Drawing;
    }

    inline bool hasRect() const noexcept
    {
        return m_state != State::Idle;
    }

    // Valid only while hasRect() is true
    inline QRectF rect() const noexcept
    {
        return m_rect;
    }

    inline QPointF anchor() const noexcept
    {
        return m_anchor;
    }

    inline bool enabled() const noexcept
    {
        return m_enabled;
    }

    void setEnabled(bool enabled) noexcept;

    bool beginDrag(const QPointF &point, const QSizeF &surfaceSize) noexcept;
    bool updateDrag(const QPointF &point) noexcept;
    bool endDrag() noexcept;
    void clear() noexcept;

    [[nodiscard]] bool hasSignificantSelection() const noexcept;

    static bool isSignificant(const QRectF &rect) noexcept;

private:
    State m_state{State::Idle};
    bool m_enabled{false};
    QPointF m_anchor{};
    QRectF m_rect{};
};

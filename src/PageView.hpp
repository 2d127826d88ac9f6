#pragma once

#include "CoordinateMapper.hpp"

#include <QColor>
#include <QGraphicsScene>
#include <QGraphicsView>
#include <QMouseEvent>

class PageImageItem;
class ViewportState;

// Shows the current page raster and turns mouse drags into the viewport's
// crop rectangle. The rectangle is painted as an overlay in view
// coordinates, anchored to the page item's on-screen box.
class PageView : public QGraphicsView
{
    Q_OBJECT
public:
    explicit PageView(ViewportState &viewport, QWidget *parent = nullptr);

    void setPageImage(QImage &&image) noexcept;
    void clearPage() noexcept;
    const QImage &pageImage() const noexcept;

    [[nodiscard]] RasterGeometry rasterGeometry() const noexcept;

    inline void setSelectionColor(const QColor &color) noexcept
    {
        m_selection_color = color;
    }

    inline void setOverlayColor(const QColor &color) noexcept
    {
        m_overlay_color = color;
    }

    void updateCursorForMode() noexcept;
    void refreshOverlay() noexcept;

signals:
    void selectionChanged();
    void selectionCommitted();
    void zoomInRequested();
    void zoomOutRequested();

protected:
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void leaveEvent(QEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;
    void scrollContentsBy(int dx, int dy) override;
    void drawForeground(QPainter *painter, const QRectF &rect) override;

private:
    void finishDrag() noexcept;

    ViewportState &m_viewport;
    QGraphicsScene *m_scene{nullptr};
    PageImageItem *m_page_item{nullptr};

    QColor m_selection_color{0x3d, 0xae, 0xe9};
    QColor m_overlay_color{0, 0, 0, 0x66};
};

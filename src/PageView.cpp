#include "PageView.hpp"

#include "PageImageItem.hpp"
#include "ViewportState.hpp"

#include <QFontMetrics>
#include <QPainter>
#include <QPainterPath>
#include <QPen>
#include <QWheelEvent>
#include <utility>

namespace
{
// Gap left around the page inside the scene
constexpr qreal PAGE_MARGIN = 32.0;
} // namespace

PageView::PageView(ViewportState &viewport, QWidget *parent)
    : QGraphicsView(parent), m_viewport(viewport),
      m_scene(new QGraphicsScene(this)), m_page_item(new PageImageItem())
{
    setScene(m_scene);
    m_scene->addItem(m_page_item);

    setMouseTracking(true);
    setAlignment(Qt::AlignCenter);
    setResizeAnchor(QGraphicsView::AnchorViewCenter);
    setTransformationAnchor(QGraphicsView::AnchorViewCenter);
    setAcceptDrops(false);
    setContentsMargins(0, 0, 0, 0);
    setBackgroundBrush(palette().color(QPalette::Mid));

    // The overlay is drawn in view coordinates and moves with the page
    setViewportUpdateMode(QGraphicsView::FullViewportUpdate);
}

void
PageView::setPageImage(QImage &&image) noexcept
{
    m_page_item->setImage(std::move(image));
    const QRectF bounds = m_page_item->boundingRect();
    m_scene->setSceneRect(
        bounds.adjusted(-PAGE_MARGIN, -PAGE_MARGIN, PAGE_MARGIN, PAGE_MARGIN));
    refreshOverlay();
}

void
PageView::clearPage() noexcept
{
    m_page_item->clear();
    m_scene->setSceneRect(QRectF());
    refreshOverlay();
}

const QImage &
PageView::pageImage() const noexcept
{
    return m_page_item->image();
}

// Native pixel size of the raster plus where the page item sits inside the
// viewport right now, in viewport pixels.
RasterGeometry
PageView::rasterGeometry() const noexcept
{
    RasterGeometry geometry;
    if (m_page_item->image().isNull())
        return geometry;

    geometry.nativeSize = m_page_item->nativeSize();
    geometry.displayBounds
        = viewportTransform().mapRect(m_page_item->sceneBoundingRect());
    return geometry;
}

void
PageView::updateCursorForMode() noexcept
{
    if (m_viewport.selectionMode())
        viewport()->setCursor(Qt::CrossCursor);
    else
        viewport()->unsetCursor();
}

void
PageView::refreshOverlay() noexcept
{
    updateCursorForMode();
    viewport()->update();
}

void
PageView::mousePressEvent(QMouseEvent *event)
{
    // No drags on a raster that is about to be replaced
    if (event->button() != Qt::LeftButton || !m_viewport.selectionMode()
        || !m_viewport.rasterCurrent() || m_page_item->image().isNull())
    {
        QGraphicsView::mousePressEvent(event);
        return;
    }

    const RasterGeometry geometry = rasterGeometry();
    const QPointF p
        = CoordinateMapper::toSurfacePoint(event->position(), geometry);

    if (m_viewport.selection().beginDrag(p, geometry.displayBounds.size()))
    {
        emit selectionChanged();
        viewport()->update();
    }

    event->accept();
}

void
PageView::mouseMoveEvent(QMouseEvent *event)
{
    SelectionTracker &selection = m_viewport.selection();
    if (!selection.isDrawing())
    {
        QGraphicsView::mouseMoveEvent(event);
        return;
    }

    const QPointF p = CoordinateMapper::toSurfacePoint(event->position(),
                                                       rasterGeometry());
    if (selection.updateDrag(p))
    {
        emit selectionChanged();
        viewport()->update();
    }

    event->accept();
}

void
PageView::mouseReleaseEvent(QMouseEvent *event)
{
    if (!m_viewport.selection().isDrawing())
    {
        QGraphicsView::mouseReleaseEvent(event);
        return;
    }

    finishDrag();
    event->accept();
}

// Leaving the view ends the drag the same way a release does
void
PageView::leaveEvent(QEvent *event)
{
    if (m_viewport.selection().isDrawing())
        finishDrag();
    QGraphicsView::leaveEvent(event);
}

void
PageView::finishDrag() noexcept
{
    if (!m_viewport.selection().endDrag())
        return;

    emit selectionCommitted();
    viewport()->update();
}

void
PageView::wheelEvent(QWheelEvent *event)
{
    if (event->modifiers() & Qt::ControlModifier)
    {
        const int delta = event->angleDelta().y();
        if (delta > 0)
            emit zoomInRequested();
        else if (delta < 0)
            emit zoomOutRequested();
        event->accept();
        return;
    }

    QGraphicsView::wheelEvent(event);
}

void
PageView::scrollContentsBy(int dx, int dy)
{
    QGraphicsView::scrollContentsBy(dx, dy);
    viewport()->update();
}

void
PageView::drawForeground(QPainter *painter, const QRectF &rect)
{
    Q_UNUSED(rect);

    const SelectionTracker &selection = m_viewport.selection();
    if (!selection.hasRect() || m_page_item->image().isNull())
        return;

    const QRectF sel = selection.rect();
    if (sel.width() <= 0 || sel.height() <= 0)
        return;

    const QRectF page       = rasterGeometry().displayBounds;
    const QRectF onScreen   = sel.translated(page.topLeft());
    const QRectF visibleSel = onScreen.intersected(page);

    painter->save();
    painter->resetTransform();
    painter->setRenderHint(QPainter::Antialiasing, false);

    // Dim the page outside the selection
    QPainterPath dim;
    dim.addRect(page);
    QPainterPath hole;
    hole.addRect(visibleSel);
    painter->fillPath(dim.subtracted(hole), m_overlay_color);

    QColor fill = m_selection_color;
    fill.setAlpha(0x1a);
    painter->fillRect(onScreen, fill);
    painter->setPen(QPen(m_selection_color, 2));
    painter->setBrush(Qt::NoBrush);
    painter->drawRect(onScreen);

    // Size label above the selection
    const QString label = QString("%1 × %2 px")
                              .arg(qRound(sel.width()))
                              .arg(qRound(sel.height()));
    const QFontMetrics fm(painter->font());
    const QSize textSize = fm.size(Qt::TextSingleLine, label) + QSize(12, 6);
    QRectF labelRect(QPointF(0, 0), QSizeF(textSize));
    labelRect.moveCenter(QPointF(onScreen.center().x(),
                                 onScreen.top() - textSize.height() / 2.0 - 4));

    painter->setRenderHint(QPainter::Antialiasing, true);
    painter->setPen(Qt::NoPen);
    painter->setBrush(m_selection_color);
    painter->drawRoundedRect(labelRect, 3, 3);
    painter->setPen(Qt::white);
    painter->drawText(labelRect, Qt::AlignCenter, label);

    painter->restore();
}

#include "SelectionTracker.hpp"

#include <QDebug>
#include <algorithm>
#include <cmath>

void
SelectionTracker::setEnabled(bool enabled) noexcept
{
    m_enabled = enabled;
    if (!m_enabled)
        clear();
}

// Starts a new rectangle at `point`. The point must lie on the surface,
// otherwise the press is ignored and any previous rectangle is kept.
bool
SelectionTracker::beginDrag(const QPointF &point,
                            const QSizeF &surfaceSize) noexcept
{
    if (!m_enabled)
        return false;

    if (point.x() < 0 || point.y() < 0 || point.x() > surfaceSize.width()
        || point.y() > surfaceSize.height())
        return false;

    m_anchor = point;
    m_rect   = QRectF(point, QSizeF(0.0, 0.0));
    m_state  = State::Drawing;
    return true;
}

bool
SelectionTracker::updateDrag(const QPointF &point) noexcept
{
    if (m_state != State::Drawing)
        return false;

    const qreal x = std::min(m_anchor.x(), point.x());
    const qreal y = std::min(m_anchor.y(), point.y());
    const qreal w = std::abs(point.x() - m_anchor.x());
    const qreal h = std::abs(point.y() - m_anchor.y());

    m_rect = QRectF(x, y, w, h);
    return true;
}

bool
SelectionTracker::endDrag() noexcept
{
    if (m_state != State::Drawing)
        return false;

    m_state = State::Committed;
#ifndef NDEBUG
    qDebug() << "SelectionTracker::endDrag(): committed" << m_rect;
#endif
    return true;
}

void
SelectionTracker::clear() noexcept
{
    m_state  = State::Idle;
    m_anchor = QPointF();
    m_rect   = QRectF();
}

bool
SelectionTracker::hasSignificantSelection() const noexcept
{
    return hasRect() && isSignificant(m_rect);
}

bool
SelectionTracker::isSignificant(const QRectF &rect) noexcept
{
    return rect.width() > SIGNIFICANT_SIZE && rect.height() > SIGNIFICANT_SIZE;
}

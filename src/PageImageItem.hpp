#pragma once

#include <QGraphicsItem>
#include <QImage>
#include <QPainter>
#include <utility>

// The page raster on the scene. The item is laid out at the image's device
// independent size while nativeSize() stays the pixel grid crops come from.
class PageImageItem : public QGraphicsItem
{
public:
    using QGraphicsItem::QGraphicsItem;

    void setImage(QImage image)
    {
        prepareGeometryChange();
        m_image = std::move(image);
        update();
    }

    void clear()
    {
        setImage(QImage());
    }

    inline const QImage &image() const noexcept
    {
        return m_image;
    }

    inline QSize nativeSize() const noexcept
    {
        return m_image.size();
    }

    QRectF boundingRect() const override
    {
        return QRectF(QPointF(0, 0), m_image.deviceIndependentSize());
    }

    void paint(QPainter *painter, const QStyleOptionGraphicsItem *,
               QWidget *) override
    {
        if (!m_image.isNull())
            painter->drawImage(boundingRect(), m_image);
    }

private:
    QImage m_image;
};

#include "MessageBar.hpp"

#include <QHBoxLayout>

MessageBar::MessageBar(QWidget *parent) : QWidget(parent)
{
    QHBoxLayout *layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 0, 8, 0);
    layout->addWidget(m_label);
    setLayout(layout);
    setFixedHeight(0);

    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &MessageBar::showNext);
}

void
MessageBar::showMessage(const QString &msg, Level level, float sec) noexcept
{
    if (m_current && m_current->text == msg && m_queue.isEmpty())
        return;
    if (!m_queue.isEmpty() && m_queue.last().text == msg)
        return;

    m_queue.enqueue({.text = msg, .level = level, .duration = sec});
    if (!m_current)
        showNext();
}

void
MessageBar::clear() noexcept
{
    m_timer.stop();
    m_queue.clear();
    m_current.reset();
    m_label->clear();
    setFixedHeight(0);
}

void
MessageBar::showNext() noexcept
{
    if (m_queue.isEmpty())
    {
        clear();
        return;
    }

    m_current = m_queue.dequeue();

    m_label->setText(m_current->text);
    m_label->setStyleSheet(m_current->level == Level::Warning
                               ? QString("QLabel { color : #d64545; }")
                               : QString());
    setFixedHeight(30);
    m_timer.start(static_cast<int>(m_current->duration * 1000));
}

#pragma once

#include <QLabel>
#include <QQueue>
#include <QTimer>
#include <QWidget>
#include <optional>

// Strip under the page that shows short notices one after another
class MessageBar : public QWidget
{
    Q_OBJECT
public:
    enum class Level
    {
        Info = 0,
        Warning
    };

    explicit MessageBar(QWidget *parent = nullptr);

    // Repeats of the message on screen or at the back of the queue are
    // dropped.
    void showMessage(const QString &msg, Level level = Level::Info,
                     float sec = 3.0f) noexcept;

    // Drops the current and all queued messages
    void clear() noexcept;

private:
    struct Message
    {
        QString text;
        Level level;
        float duration;
    };

    void showNext() noexcept;

    QLabel *m_label{new QLabel(this)};
    QTimer m_timer;
    QQueue<Message> m_queue;
    std::optional<Message> m_current;
};

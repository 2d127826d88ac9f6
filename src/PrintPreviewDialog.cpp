#include "PrintPreviewDialog.hpp"

#include "OutputSinks.hpp"

#include <QHBoxLayout>
#include <QLabel>
#include <QPixmap>
#include <QPushButton>
#include <QScrollArea>
#include <QVBoxLayout>

PrintPreviewDialog::PrintPreviewDialog(const QImage &image,
                                       const QByteArray &bytes,
                                       const QString &suggestedName,
                                       PrintSink &printSink,
                                       DownloadSink &downloadSink,
                                       QWidget *parent)
    : QDialog(parent), m_image(image), m_bytes(bytes),
      m_suggested_name(suggestedName), m_print_sink(printSink),
      m_download_sink(downloadSink)
{
    setWindowTitle(tr("Print Preview"));
    setWindowFlags(windowFlags() & ~Qt::WindowContextHelpButtonHint);
    setMinimumSize(480, 360);

    QLabel *preview = new QLabel();
    preview->setAlignment(Qt::AlignCenter);

    // Capped at 800x500, never upscaled
    QPixmap pix = QPixmap::fromImage(m_image);
    if (pix.width() > 800 || pix.height() > 500)
        pix = pix.scaled(800, 500, Qt::KeepAspectRatio,
                         Qt::SmoothTransformation);
    preview->setPixmap(pix);

    QScrollArea *scroll = new QScrollArea();
    scroll->setWidget(preview);
    scroll->setWidgetResizable(true);

    QLabel *info = new QLabel(
        tr("%1 × %2 px").arg(m_image.width()).arg(m_image.height()));

    QPushButton *downloadButton = new QPushButton(tr("Download PNG"));
    QPushButton *printButton    = new QPushButton(tr("Print Now"));
    QPushButton *closeButton    = new QPushButton(tr("Close"));
    printButton->setDefault(true);

    QHBoxLayout *buttons = new QHBoxLayout();
    buttons->addWidget(info);
    buttons->addStretch(1);
    buttons->addWidget(closeButton);
    buttons->addWidget(downloadButton);
    buttons->addWidget(printButton);

    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->addWidget(scroll, 1);
    layout->addLayout(buttons);

    connect(closeButton, &QPushButton::clicked, this,
            &PrintPreviewDialog::reject);
    connect(downloadButton, &QPushButton::clicked, this,
            [this]() { m_download_sink.save(m_bytes, m_suggested_name); });
    connect(printButton, &QPushButton::clicked, this, [this]()
    {
        m_print_sink.printImage(m_image);
        accept();
    });
}

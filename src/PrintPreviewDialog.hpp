#pragma once

#include <QByteArray>
#include <QDialog>
#include <QImage>
#include <QString>

class PrintSink;
class DownloadSink;

// Shows a cropped region before it goes to the printer or to disk
class PrintPreviewDialog : public QDialog
{
    Q_OBJECT

public:
    PrintPreviewDialog(const QImage &image, const QByteArray &bytes,
                       const QString &suggestedName, PrintSink &printSink,
                       DownloadSink &downloadSink, QWidget *parent = nullptr);

private:
    QImage m_image;
    QByteArray m_bytes;
    QString m_suggested_name;
    PrintSink &m_print_sink;
    DownloadSink &m_download_sink;
};

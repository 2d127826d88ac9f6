#pragma once

#include <QByteArray>
#include <QImage>
#include <QPointer>
#include <QString>
#include <QWidget>

class Model;

// Receives finished output. Fire-and-forget: failures are reported by the
// sink itself.
class PrintSink
{
public:
    virtual ~PrintSink() = default;

    virtual void printImage(const QImage &image) noexcept = 0;

    // Print page `pageno` (0-based) as the document draws it, uncropped
    virtual void printPage(int pageno) noexcept = 0;
};

class DownloadSink
{
public:
    virtual ~DownloadSink() = default;

    virtual void save(const QByteArray &bytes,
                      const QString &suggestedName) noexcept = 0;
};

// Prints through the platform print dialog
class QtPrintSink : public PrintSink
{
public:
    QtPrintSink(QWidget *parent, Model *model) noexcept;

    void printImage(const QImage &image) noexcept override;
    void printPage(int pageno) noexcept override;

    // Resolution a whole page is rendered at for a printer reporting
    // `printerResolution` dpi. High resolution printers are capped so the
    // page fits in memory and renders in reasonable time.
    static int renderDpi(int printerResolution) noexcept;

private:
    QPointer<QWidget> m_parent;
    Model *m_model{nullptr};
};

// Asks for a destination and writes the bytes there
class FileDownloadSink : public DownloadSink
{
public:
    explicit FileDownloadSink(QWidget *parent) noexcept;

    // Images saved under a name with the other image suffix are re-encoded
    // to match it
    void save(const QByteArray &bytes,
              const QString &suggestedName) noexcept override;

    inline void setJpegQuality(int quality) noexcept
    {
        m_jpeg_quality = quality;
    }

private:
    QPointer<QWidget> m_parent;
    int m_jpeg_quality{90};
};

#include "OutputSinks.hpp"

#include "Model.hpp"
#include "RasterExtractor.hpp"

#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>
#include <QPainter>
#include <QPrintDialog>
#include <QPrinter>
#include <QSaveFile>
#include <QStandardPaths>
#include <algorithm>

namespace
{

void
paintImageOnPrinter(QPrinter &printer, const QImage &image) noexcept
{
    QPainter painter;
    if (!painter.begin(&printer))
    {
        qWarning() << "QtPrintSink: cannot start painting on the printer";
        return;
    }

    const QRect pageRect = painter.viewport();
    QSize size           = image.size();
    size.scale(pageRect.size(), Qt::KeepAspectRatio);

    // Top-centred, like a browser printing an image
    const QRect target(pageRect.x() + (pageRect.width() - size.width()) / 2,
                       pageRect.y(), size.width(), size.height());
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.drawImage(target, image);
    painter.end();
}

constexpr int MAX_PRINT_DPI = 300;

// Images can be saved as either type, the suggested one comes first
QString
filterForName(const QString &name) noexcept
{
    const QString suffix = QFileInfo(name).suffix().toLower();
    if (suffix == "png")
        return "PNG Image (*.png);;JPEG Image (*.jpg *.jpeg);;All Files (*)";
    if (suffix == "jpg" || suffix == "jpeg")
        return "JPEG Image (*.jpg *.jpeg);;PNG Image (*.png);;All Files (*)";
    if (suffix == "pdf")
        return "PDF Document (*.pdf);;All Files (*)";
    return "All Files (*)";
}

} // namespace

QtPrintSink::QtPrintSink(QWidget *parent, Model *model) noexcept
    : m_parent(parent), m_model(model)
{
}

void
QtPrintSink::printImage(const QImage &image) noexcept
{
    if (image.isNull())
        return;

    QPrinter printer(QPrinter::HighResolution);
    QPrintDialog dialog(&printer, m_parent);
    dialog.setWindowTitle(QObject::tr("Print Selection"));
    if (dialog.exec() != QDialog::Accepted)
        return;

    paintImageOnPrinter(printer, image);
}

void
QtPrintSink::printPage(int pageno) noexcept
{
    if (!m_model || !m_model->success())
        return;

    QPrinter printer(QPrinter::HighResolution);
    QPrintDialog dialog(&printer, m_parent);
    dialog.setWindowTitle(QObject::tr("Print Page"));
    if (dialog.exec() != QDialog::Accepted)
        return;

    // Render for the printer instead of reusing the screen raster
    Model::RenderJob job = m_model->createRenderJob(pageno, 1.0);
    job.dpi              = renderDpi(printer.resolution());
    job.dpr              = 1.0;

#ifndef NDEBUG
    qDebug() << "QtPrintSink::printPage(): rendering page" << pageno << "at"
             << job.dpi << "dpi for a" << printer.resolution()
             << "dpi printer";
#endif

    const Model::PageRenderResult result = m_model->renderPage(job);
    if (result.image.isNull())
    {
        qWarning() << "QtPrintSink::printPage(): failed to render page"
                   << pageno;
        QMessageBox::warning(m_parent, QObject::tr("Print Failed"),
                             QObject::tr("The page could not be rendered."));
        return;
    }

    paintImageOnPrinter(printer, result.image);
}

int
QtPrintSink::renderDpi(int printerResolution) noexcept
{
    if (printerResolution <= 0)
        return MAX_PRINT_DPI;
    return std::min(printerResolution, MAX_PRINT_DPI);
}

FileDownloadSink::FileDownloadSink(QWidget *parent) noexcept
    : m_parent(parent)
{
}

void
FileDownloadSink::save(const QByteArray &bytes,
                       const QString &suggestedName) noexcept
{
    if (bytes.isEmpty())
    {
        qWarning() << "FileDownloadSink::save(): nothing to save for"
                   << suggestedName;
        return;
    }

    const QDir dir(
        QStandardPaths::writableLocation(QStandardPaths::DownloadLocation));
    const QString fileName = QFileDialog::getSaveFileName(
        m_parent, QObject::tr("Save As"), dir.filePath(suggestedName),
        filterForName(suggestedName));
    if (fileName.isEmpty())
        return;

    const QByteArray out
        = RasterExtractor::encodeForFileName(bytes, fileName, m_jpeg_quality);

    QSaveFile file(fileName);
    if (!file.open(QIODevice::WriteOnly) || file.write(out) != out.size()
        || !file.commit())
    {
        qWarning() << "FileDownloadSink::save(): cannot write" << fileName
                   << file.errorString();
        QMessageBox::critical(m_parent, QObject::tr("Save Failed"),
                              QObject::tr("Could not write %1:\n%2")
                                  .arg(fileName, file.errorString()));
    }
}

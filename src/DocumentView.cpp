#include "DocumentView.hpp"

#include "Config.hpp"
#include "MessageBar.hpp"
#include "OutputSinks.hpp"
#include "PageView.hpp"
#include "PassphraseDialog.hpp"
#include "PrintPreviewDialog.hpp"
#include "utils.hpp"

#include <QFile>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QMessageBox>
#include <QVBoxLayout>
#include <qdebug.h>

DocumentView::DocumentView(const Config &config, QWidget *parent) noexcept
    : QWidget(parent), m_config(config),
      m_viewport(ViewportState::ZoomLimits{config.zoom.min, config.zoom.max,
                                           config.zoom.step})
{
#ifndef NDEBUG
    qDebug() << "DocumentView::DocumentView(): Initializing DocumentView";
#endif

    m_model = new Model(this);
    m_model->setDPI(m_config.rendering.dpi);
    m_model->setAntialiasing(m_config.rendering.antialiasing_bits);

    m_gate = new PassphraseGate(this);

    m_pipeline.setJpegQuality(m_config.exporting.jpeg_quality);
    m_pipeline.setBaseFileName(m_config.exporting.file_name);

    m_print_sink    = std::make_unique<QtPrintSink>(this, m_model);
    auto download_sink = std::make_unique<FileDownloadSink>(this);
    download_sink->setJpegQuality(m_config.exporting.jpeg_quality);
    m_download_sink = std::move(download_sink);

    initGui();
    initConnections();
    updateToolbar();
}

DocumentView::~DocumentView() noexcept
{
    // Drop the resolver first so nothing calls back into a dying model
    m_gate->reset();
    m_model->close();
}

void
DocumentView::setPrintSink(std::unique_ptr<PrintSink> sink) noexcept
{
    if (sink)
        m_print_sink = std::move(sink);
}

void
DocumentView::setDownloadSink(std::unique_ptr<DownloadSink> sink) noexcept
{
    if (sink)
        m_download_sink = std::move(sink);
}

void
DocumentView::initGui() noexcept
{
    m_view = new PageView(m_viewport, this);
    m_view->setSelectionColor(rgbaToQColor(m_config.colors.selection));
    m_view->setOverlayColor(rgbaToQColor(m_config.colors.overlay));
    if (m_config.colors.background != 0)
        m_view->setBackgroundBrush(rgbaToQColor(m_config.colors.background));

    m_message_bar = new MessageBar(this);

    auto makeToolButton = [this](const QString &text, const QString &tip)
    {
        QToolButton *button = new QToolButton(this);
        button->setText(text);
        button->setToolTip(tip);
        button->setAutoRaise(true);
        return button;
    };

    m_prev_button       = makeToolButton("<", tr("Previous page"));
    m_next_button       = makeToolButton(">", tr("Next page"));
    m_zoom_out_button   = makeToolButton("-", tr("Zoom out"));
    m_zoom_in_button    = makeToolButton("+", tr("Zoom in"));
    m_zoom_reset_button = makeToolButton("1:1", tr("Reset zoom"));

    m_page_label = new QLabel(this);
    m_page_label->setMinimumWidth(80);
    m_page_label->setAlignment(Qt::AlignCenter);

    m_zoom_label = new QLabel(this);
    m_zoom_label->setMinimumWidth(50);
    m_zoom_label->setAlignment(Qt::AlignCenter);

    m_crop_button = new QPushButton(tr("Crop Mode"), this);
    m_crop_button->setCheckable(true);
    m_clear_button    = new QPushButton(tr("Clear"), this);
    m_print_button    = new QPushButton(tr("Print Page"), this);
    m_save_button     = new QPushButton(tr("Save Page"), this);
    m_download_button = new QPushButton(tr("Download PDF"), this);

    QHBoxLayout *toolbar = new QHBoxLayout();
    toolbar->setContentsMargins(8, 4, 8, 4);
    toolbar->addWidget(m_prev_button);
    toolbar->addWidget(m_page_label);
    toolbar->addWidget(m_next_button);
    toolbar->addStretch(1);
    toolbar->addWidget(m_zoom_out_button);
    toolbar->addWidget(m_zoom_label);
    toolbar->addWidget(m_zoom_in_button);
    toolbar->addWidget(m_zoom_reset_button);
    toolbar->addStretch(1);
    toolbar->addWidget(m_crop_button);
    toolbar->addWidget(m_clear_button);
    toolbar->addWidget(m_save_button);
    toolbar->addWidget(m_print_button);
    toolbar->addWidget(m_download_button);

    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);
    layout->addLayout(toolbar);
    layout->addWidget(m_view, 1);
    layout->addWidget(m_message_bar);
    setLayout(layout);
}

void
DocumentView::initConnections() noexcept
{
    connect(m_model, &Model::openFileFinished, this,
            &DocumentView::handleOpenFileFinished);
    connect(m_model, &Model::openFileFailed, this,
            &DocumentView::handleOpenFileFailed);
    connect(m_model, &Model::passwordRequired, this,
            &DocumentView::handle_password_required);
    connect(m_model, &Model::wrongPassword, this,
            &DocumentView::handle_wrong_password);

    connect(m_gate, &PassphraseGate::requestChanged, this,
            &DocumentView::showPassphrasePrompt);

    connect(m_view, &PageView::selectionChanged, this,
            &DocumentView::updateToolbar);
    connect(m_view, &PageView::selectionCommitted, this,
            &DocumentView::updateToolbar);
    connect(m_view, &PageView::zoomInRequested, this, &DocumentView::ZoomIn);
    connect(m_view, &PageView::zoomOutRequested, this,
            &DocumentView::ZoomOut);

    connect(m_prev_button, &QToolButton::clicked, this,
            &DocumentView::GotoPrevPage);
    connect(m_next_button, &QToolButton::clicked, this,
            &DocumentView::GotoNextPage);
    connect(m_zoom_out_button, &QToolButton::clicked, this,
            &DocumentView::ZoomOut);
    connect(m_zoom_in_button, &QToolButton::clicked, this,
            &DocumentView::ZoomIn);
    connect(m_zoom_reset_button, &QToolButton::clicked, this,
            &DocumentView::ZoomReset);
    connect(m_crop_button, &QPushButton::clicked, this,
            &DocumentView::ToggleCropMode);
    connect(m_clear_button, &QPushButton::clicked, this,
            &DocumentView::ClearCrop);
    connect(m_print_button, &QPushButton::clicked, this,
            &DocumentView::PrintSelection);
    connect(m_save_button, &QPushButton::clicked, this,
            &DocumentView::SaveSelection);
    connect(m_download_button, &QPushButton::clicked, this,
            &DocumentView::DownloadDocument);
}

bool
DocumentView::OpenFile(const QString &filePath) noexcept
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly))
    {
        qWarning() << "DocumentView::OpenFile(): cannot read" << filePath
                   << file.errorString();
        QMessageBox::critical(this, tr("Open File"),
                              tr("Could not read %1:\n%2")
                                  .arg(filePath, file.errorString()));
        return false;
    }

    OpenBytes(file.readAll(), QFileInfo(filePath).fileName());
    return true;
}

// Starts a new document session. The previous document is unloaded right
// away and anything still pending for it (prompt, resolver, render) becomes
// stale.
void
DocumentView::OpenBytes(QByteArray bytes, const QString &fileName) noexcept
{
    dismissPassphrasePrompt();

    ++m_render_ticket;
    m_cancelled_by_user = false;
    m_model->close();
    m_message_bar->clear();
    m_view->clearPage();
    m_viewport.resetForDocument(0);

    const PassphraseGate::SessionId session = m_gate->beginSession();
    m_message_bar->showMessage(
        tr("Opening %1 (%2)").arg(fileName, formatFileSize(bytes.size())));
    m_model->openAsync(bytes, fileName, session);
    updateToolbar();
    emit openFileStarted(this);
}

void
DocumentView::CloseFile() noexcept
{
    dismissPassphrasePrompt();

    ++m_render_ticket;
    m_gate->reset();
    m_model->close();
    m_message_bar->clear();
    m_viewport.resetForDocument(0);
    m_view->clearPage();
    updateToolbar();
}

void
DocumentView::handleOpenFileFinished(Model::SessionId session) noexcept
{
    if (!m_gate->markOpened(session))
    {
#ifndef NDEBUG
        qDebug() << "DocumentView::handleOpenFileFinished(): stale session"
                 << session;
#endif
        return;
    }

    m_viewport.resetForDocument(m_model->numPages());
    m_viewport.setZoom(m_config.zoom.initial);
    m_viewport.setSelectionMode(m_config.behavior.start_in_crop_mode);

    renderCurrentPage();
    updateToolbar();
    emit openFileFinished(this);
}

void
DocumentView::handleOpenFileFailed(Model::SessionId session) noexcept
{
    if (session != m_gate->session())
        return;

    if (m_cancelled_by_user)
    {
        m_message_bar->showMessage(tr("Document is still locked"));
    }
    else
    {
        QMessageBox::critical(this, tr("Open File"),
                              tr("Could not open %1").arg(m_model->fileName()));
    }

    m_gate->reset();
    m_model->close();
    updateToolbar();
    emit openFileFailed(this);
}

// Handle password for password-protected files
void
DocumentView::handle_password_required(Model::SessionId session) noexcept
{
    m_gate->needsPassphrase(session, PassphraseGate::Reason::FirstRequest,
                            [this](const PassphraseGate::Answer &answer)
    {
        if (answer)
            m_model->submitPassword(*answer);
        else
            m_model->cancelOpen();
    });
}

// Handle wrong entered password
void
DocumentView::handle_wrong_password(Model::SessionId session) noexcept
{
    m_gate->needsPassphrase(session,
                            PassphraseGate::Reason::PriorAttemptRejected,
                            [this](const PassphraseGate::Answer &answer)
    {
        if (answer)
            m_model->submitPassword(*answer);
        else
            m_model->cancelOpen();
    });
}

void
DocumentView::showPassphrasePrompt(
    const PassphraseGate::Request &request) noexcept
{
    if (!m_passphrase_dialog)
    {
        m_passphrase_dialog = new PassphraseDialog(this);
        m_passphrase_dialog->setAttribute(Qt::WA_DeleteOnClose);

        const PassphraseGate::SessionId session = m_gate->session();
        connect(m_passphrase_dialog, &QDialog::accepted, this,
                [this, session]()
        {
            if (session == m_gate->session())
                m_gate->submit(m_passphrase_dialog->passphrase());
        });
        connect(m_passphrase_dialog, &QDialog::rejected, this,
                [this, session]()
        {
            if (session != m_gate->session())
                return;
            // The model reports the failure from inside cancel()
            m_cancelled_by_user = true;
            m_gate->cancel();
        });
    }

    m_passphrase_dialog->setRequest(request);
    m_passphrase_dialog->open();
}

// The dialog belongs to the old session, its signals must not reach the gate
void
DocumentView::dismissPassphrasePrompt() noexcept
{
    if (!m_passphrase_dialog)
        return;

    m_passphrase_dialog->disconnect(this);
    m_passphrase_dialog->deleteLater();
    m_passphrase_dialog = nullptr;
}

void
DocumentView::renderCurrentPage() noexcept
{
    if (!m_model->success())
        return;

    const int pageno  = m_viewport.currentPage();
    const double zoom = m_viewport.zoom();

    m_model->setDPR(devicePixelRatioF());
    Model::RenderJob job = m_model->createRenderJob(pageno - 1, zoom);
    job.ticket           = ++m_render_ticket;

    m_model->requestPageRender(job, [this, pageno, zoom](
                                        Model::PageRenderResult result)
    {
        // A newer page or zoom was requested in the meantime
        if (result.ticket != m_render_ticket)
            return;

        if (result.image.isNull())
        {
            m_message_bar->showMessage(
                tr("Failed to render page %1").arg(result.pageno + 1),
                MessageBar::Level::Warning);
            return;
        }

        m_viewport.markRasterShown(pageno, zoom);
        m_view->setPageImage(std::move(result.image));
        updateToolbar();
    });
}

void
DocumentView::afterViewportChange(bool rerender) noexcept
{
    if (rerender)
        renderCurrentPage();
    m_view->refreshOverlay();
    updateToolbar();
}

void
DocumentView::GotoPage(int pageno) noexcept
{
    afterViewportChange(m_viewport.goToPage(pageno));
    emit pageChanged(m_viewport.currentPage(), m_viewport.pageCount());
}

void
DocumentView::GotoNextPage() noexcept
{
    GotoPage(m_viewport.currentPage() + 1);
}

void
DocumentView::GotoPrevPage() noexcept
{
    GotoPage(m_viewport.currentPage() - 1);
}

void
DocumentView::ZoomIn() noexcept
{
    m_viewport.zoomIn();
    afterViewportChange(true);
}

void
DocumentView::ZoomOut() noexcept
{
    m_viewport.zoomOut();
    afterViewportChange(true);
}

void
DocumentView::ZoomReset() noexcept
{
    m_viewport.resetZoom();
    afterViewportChange(true);
}

// Toggle crop (region selection) mode
void
DocumentView::ToggleCropMode() noexcept
{
    m_viewport.toggleSelectionMode();
    afterViewportChange(false);
}

void
DocumentView::ClearCrop() noexcept
{
    m_viewport.setSelectionMode(false);
    afterViewportChange(false);
}

CropPipeline::Result
DocumentView::runPipeline(RasterExtractor::Format format) noexcept
{
    const CropPipeline::Result result = m_pipeline.run(
        m_viewport, m_view->pageImage(), m_view->rasterGeometry(), format);

    if (!result.isCrop()
        && result.reason != CropPipeline::FallbackReason::SelectionTooSmall
        && result.reason != CropPipeline::FallbackReason::RasterOutdated)
    {
        m_message_bar->showMessage(
            tr("Using the whole page: %1")
                .arg(CropPipeline::reasonString(result.reason)),
            MessageBar::Level::Warning);
    }
    return result;
}

void
DocumentView::PrintSelection() noexcept
{
    if (!m_model->success())
        return;

    const CropPipeline::Result result
        = runPipeline(RasterExtractor::Format::LosslessRGBA);

    if (!result.isCrop())
    {
        m_print_sink->printPage(m_viewport.currentPage() - 1);
        return;
    }

    PrintPreviewDialog preview(
        result.image, result.bytes,
        m_pipeline.suggestedFileName(result, m_viewport.currentPage()),
        *m_print_sink, *m_download_sink, this);
    preview.exec();
}

void
DocumentView::SaveSelection() noexcept
{
    if (!m_model->success())
        return;

    const CropPipeline::Result result
        = runPipeline(m_config.exporting.default_format);
    if (result.reason == CropPipeline::FallbackReason::RasterOutdated)
    {
        m_message_bar->showMessage(
            tr("Page %1 is still rendering").arg(m_viewport.currentPage()));
        return;
    }

    if (result.bytes.isEmpty())
    {
        m_message_bar->showMessage(tr("Nothing to save yet"));
        return;
    }

    m_download_sink->save(
        result.bytes,
        m_pipeline.suggestedFileName(result, m_viewport.currentPage()));
}

// Save the opened document bytes unchanged
void
DocumentView::DownloadDocument() noexcept
{
    if (!m_model->success())
        return;

    QString name = m_model->fileName();
    if (name.isEmpty())
        name = "document.pdf";
    m_download_sink->save(m_model->fileBytes(), name);
}

void
DocumentView::updateToolbar() noexcept
{
    const bool loaded      = m_model->success();
    const bool significant = m_viewport.selection().hasSignificantSelection();

    m_prev_button->setEnabled(loaded && m_viewport.canGoPrev());
    m_next_button->setEnabled(loaded && m_viewport.canGoNext());
    m_page_label->setText(loaded ? QString("%1 / %2")
                                       .arg(m_viewport.currentPage())
                                       .arg(m_viewport.pageCount())
                                 : QString("- / -"));

    const double zoom = m_viewport.zoom();
    const auto &limits = m_viewport.zoomLimits();
    m_zoom_in_button->setEnabled(loaded && zoom < limits.max);
    m_zoom_out_button->setEnabled(loaded && zoom > limits.min);
    m_zoom_reset_button->setEnabled(loaded);
    m_zoom_label->setText(QString("%1%").arg(qRound(zoom * 100)));

    m_crop_button->setEnabled(loaded);
    m_crop_button->setChecked(m_viewport.selectionMode());
    m_crop_button->setText(m_viewport.selectionMode() ? tr("Cropping")
                                                      : tr("Crop Mode"));
    m_clear_button->setVisible(significant);

    m_print_button->setEnabled(loaded);
    m_print_button->setText(significant ? tr("Print Selection")
                                        : tr("Print Page"));
    m_save_button->setEnabled(loaded);
    m_save_button->setText(significant ? tr("Save Selection")
                                       : tr("Save Page"));
    m_download_button->setEnabled(loaded);
}

#pragma once

#include "CropPipeline.hpp"
#include "Model.hpp"
#include "PassphraseGate.hpp"
#include "ViewportState.hpp"

#include <QLabel>
#include <QPointer>
#include <QPushButton>
#include <QToolButton>
#include <QWidget>
#include <memory>

struct Config;
class DownloadSink;
class MessageBar;
class PageView;
class PassphraseDialog;
class PrintSink;

// One open document: toolbar, page view and the crop/print actions
class DocumentView : public QWidget
{
    Q_OBJECT
public:
    explicit DocumentView(const Config &config,
                          QWidget *parent = nullptr) noexcept;
    ~DocumentView() noexcept;

    inline Model *model() const noexcept
    {
        return m_model;
    }

    inline const ViewportState &viewportState() const noexcept
    {
        return m_viewport;
    }

    inline PassphraseGate *passphraseGate() const noexcept
    {
        return m_gate;
    }

    inline QString fileName() const noexcept
    {
        return m_model->fileName();
    }

    // Replace the sinks (used by tests and headless callers)
    void setPrintSink(std::unique_ptr<PrintSink> sink) noexcept;
    void setDownloadSink(std::unique_ptr<DownloadSink> sink) noexcept;

    bool OpenFile(const QString &filePath) noexcept;
    void OpenBytes(QByteArray bytes, const QString &fileName) noexcept;
    void CloseFile() noexcept;

    void GotoPage(int pageno) noexcept;
    void GotoNextPage() noexcept;
    void GotoPrevPage() noexcept;
    void ZoomIn() noexcept;
    void ZoomOut() noexcept;
    void ZoomReset() noexcept;
    void ToggleCropMode() noexcept;
    void ClearCrop() noexcept;
    void PrintSelection() noexcept;
    void SaveSelection() noexcept;
    void DownloadDocument() noexcept;

signals:
    void openFileStarted(DocumentView *view);
    void openFileFinished(DocumentView *view);
    void openFileFailed(DocumentView *view);
    void pageChanged(int pageno, int pageCount);

private:
    void initGui() noexcept;
    void initConnections() noexcept;
    void updateToolbar() noexcept;
    void renderCurrentPage() noexcept;
    void afterViewportChange(bool rerender) noexcept;
    CropPipeline::Result runPipeline(RasterExtractor::Format format) noexcept;

    void handleOpenFileFinished(Model::SessionId session) noexcept;
    void handleOpenFileFailed(Model::SessionId session) noexcept;
    void handle_password_required(Model::SessionId session) noexcept;
    void handle_wrong_password(Model::SessionId session) noexcept;
    void showPassphrasePrompt(const PassphraseGate::Request &request) noexcept;
    void dismissPassphrasePrompt() noexcept;

    const Config &m_config;
    Model *m_model{nullptr};
    PassphraseGate *m_gate{nullptr};
    ViewportState m_viewport;
    CropPipeline m_pipeline;

    std::unique_ptr<PrintSink> m_print_sink;
    std::unique_ptr<DownloadSink> m_download_sink;

    PageView *m_view{nullptr};
    MessageBar *m_message_bar{nullptr};
    QPointer<PassphraseDialog> m_passphrase_dialog;

    QToolButton *m_prev_button{nullptr};
    QToolButton *m_next_button{nullptr};
    QLabel *m_page_label{nullptr};
    QToolButton *m_zoom_out_button{nullptr};
    QToolButton *m_zoom_in_button{nullptr};
    QToolButton *m_zoom_reset_button{nullptr};
    QLabel *m_zoom_label{nullptr};
    QPushButton *m_crop_button{nullptr};
    QPushButton *m_clear_button{nullptr};
    QPushButton *m_print_button{nullptr};
    QPushButton *m_save_button{nullptr};
    QPushButton *m_download_button{nullptr};

    quint64 m_render_ticket{0};
    bool m_cancelled_by_user{false};
};

#pragma once

// Wrapper for MuPDF Model

#include <QByteArray>
#include <QFuture>
#include <QImage>
#include <QObject>
#include <QString>
#include <functional>
#include <mutex>

extern "C"
{
#include <mupdf/fitz.h>
}

class Model : public QObject
{
    Q_OBJECT
public:
    using SessionId = quint64;

    Model(QObject *parent = nullptr) noexcept;
    ~Model() noexcept;

    struct RenderJob
    {
        int pageno{0}; // 0-based
        double zoom{1.0};
        double dpi{72.0};
        double dpr{1.0};
        quint64 ticket{0};
        fz_colorspace *colorspace{nullptr};

        // Scale handed to fz_scale: logical zoom at the target DPI and DPR
        inline double physicalScale() const noexcept
        {
            return zoom * (dpi / 72.0) * dpr;
        }
    };

    struct PageRenderResult
    {
        QImage image;
        int pageno{-1};
        quint64 ticket{0};
    };

    // structure to carry the "Life Support" for the image memory
    struct RenderPayload
    {
        fz_context *ctx;
        fz_pixmap *pix;
    };

    inline fz_context *cloneContext() const noexcept
    {
        return fz_clone_context(m_ctx);
    }

    inline int numPages() const noexcept
    {
        return m_page_count;
    }

    inline bool success() const noexcept
    {
        return m_success;
    }

    inline QString fileName() const noexcept
    {
        return m_file_name;
    }

    inline const QByteArray &fileBytes() const noexcept
    {
        return m_bytes;
    }

    inline void setDPR(float dpr) noexcept
    {
        m_dpr = dpr;
    }

    inline void setDPI(float dpi) noexcept
    {
        m_dpi = dpi;
    }

    inline void setAntialiasing(int bits) noexcept
    {
        m_aa_bits = bits;
    }

    RenderJob createRenderJob(int pageno, double zoom) const noexcept;
    void requestPageRender(
        const RenderJob &job,
        const std::function<void(PageRenderResult)> &callback) noexcept;
    PageRenderResult renderPage(const RenderJob &job) noexcept;

    void openAsync(const QByteArray &bytes, const QString &fileName,
                   SessionId session) noexcept;
    void submitPassword(const QString &password) noexcept;
    void cancelOpen() noexcept;
    void close() noexcept;

signals:
    void passwordRequired(Model::SessionId session);
    void wrongPassword(Model::SessionId session);
    void openFileFinished(Model::SessionId session);
    void openFileFailed(Model::SessionId session);

private:
    // A document parked while it waits for a passphrase
    struct PendingOpen
    {
        fz_context *ctx{nullptr};
        fz_document *doc{nullptr};
        SessionId session{0};

        inline void clear() noexcept
        {
            ctx     = nullptr;
            doc     = nullptr;
            session = 0;
        }
    };

    inline void waitForRenders() noexcept
    {
        if (m_render_future.isRunning())
            m_render_future.waitForFinished();
    }

    void initMuPDF() noexcept;
    void cleanup() noexcept;
    void dropPending() noexcept;
    bool discardIfStale(fz_context *ctx, fz_document *doc,
                        SessionId session) noexcept;
    void continueOpen(fz_context *ctx, fz_document *doc,
                      SessionId session) noexcept;

    fz_context *m_ctx{nullptr};
    fz_document *m_doc{nullptr};
    fz_colorspace *m_colorspace{nullptr};
    fz_locks_context m_fz_locks;

    QByteArray m_bytes;
    QString m_file_name;
    int m_page_count{0};
    float m_dpr{1.0f}, m_dpi{72.0f};
    int m_aa_bits{8};
    bool m_success{false};

    PendingOpen m_pending{};
    SessionId m_session{0};
    std::mutex m_doc_mutex;
    QFuture<PageRenderResult> m_render_future;
};

#include "Model.hpp"

#include <QDebug>
#include <QFutureWatcher>
#include <QtConcurrent/QtConcurrent>
#include <array>

static std::array<std::mutex, FZ_LOCK_MAX> mupdf_mutexes;

// This is called by Qt when the last copy of the QImage is destroyed
static void
imageCleanupHandler(void *info) noexcept
{
    Model::RenderPayload *payload = static_cast<Model::RenderPayload *>(info);
    if (payload)
    {
        // Drop the pixmap first, then the context
        fz_drop_pixmap(payload->ctx, payload->pix);
        fz_drop_context(payload->ctx);
        delete payload;
    }
}

static void
mupdf_lock_mutex(void *user, int lock)
{
    auto *m = static_cast<std::mutex *>(user);
    m[lock].lock();
}

static void
mupdf_unlock_mutex(void *user, int lock)
{
    auto *m = static_cast<std::mutex *>(user);
    m[lock].unlock();
}

Model::Model(QObject *parent) noexcept : QObject(parent)
{
    initMuPDF();
}

Model::~Model() noexcept
{
    waitForRenders();
    dropPending();
    cleanup();
    fz_drop_context(m_ctx);
}

void
Model::initMuPDF() noexcept
{
    // initialize each mutex
    m_fz_locks.user   = mupdf_mutexes.data();
    m_fz_locks.lock   = mupdf_lock_mutex;
    m_fz_locks.unlock = mupdf_unlock_mutex;
    m_ctx             = fz_new_context(nullptr, &m_fz_locks, FZ_STORE_DEFAULT);
    if (!m_ctx)
    {
        qCritical() << "Model::initMuPDF(): cannot create MuPDF context";
        return;
    }
    fz_register_document_handlers(m_ctx);
    m_colorspace = fz_device_rgb(m_ctx);
}

void
Model::cleanup() noexcept
{
    m_render_future.cancel();

    {
        std::lock_guard<std::mutex> lock(m_doc_mutex);
        fz_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }

    m_page_count = 0;
    m_success    = false;
}

void
Model::dropPending() noexcept
{
    if (m_pending.ctx)
    {
        fz_drop_document(m_pending.ctx, m_pending.doc);
        fz_drop_context(m_pending.ctx);
    }
    m_pending.clear();
}

// A newer openAsync() has started since this document was requested
bool
Model::discardIfStale(fz_context *ctx, fz_document *doc,
                      SessionId session) noexcept
{
    if (session == m_session)
        return false;

#ifndef NDEBUG
    qDebug() << "Model::discardIfStale(): dropping document of session"
             << session;
#endif
    fz_drop_document(ctx, doc);
    fz_drop_context(ctx);
    return true;
}

// Opens the document from memory on a worker thread. Exactly one of
// passwordRequired, openFileFinished or openFileFailed follows, tagged with
// `session`.
void
Model::openAsync(const QByteArray &bytes, const QString &fileName,
                 SessionId session) noexcept
{
    dropPending();
    m_session   = session;
    m_bytes     = bytes;
    m_file_name = fileName;

    fz_context *bg_ctx = m_ctx ? cloneContext() : nullptr;
    if (!bg_ctx)
    {
        QMetaObject::invokeMethod(this, [this, session]
        { emit openFileFailed(session); }, Qt::QueuedConnection);
        return;
    }

    const QByteArray magic = fileName.isEmpty()
                                 ? QByteArrayLiteral("application/pdf")
                                 : fileName.toUtf8();

    auto _ = QtConcurrent::run([this, bytes, magic, bg_ctx, session]
    {
        struct Guard
        {
            fz_context *ctx;
            fz_document *doc{nullptr};
            bool committed{false};
            ~Guard()
            {
                if (!committed)
                {
                    if (doc)
                        fz_drop_document(ctx, doc);
                    fz_drop_context(ctx);
                }
            }
        } g{bg_ctx};

        fz_buffer *buf{nullptr};
        fz_stream *stm{nullptr};
        fz_document *doc{nullptr};
        fz_var(buf);
        fz_var(stm);
        fz_var(doc);

        fz_try(bg_ctx)
        {
            buf = fz_new_buffer_from_copied_data(
                bg_ctx, reinterpret_cast<const unsigned char *>(bytes.constData()),
                static_cast<size_t>(bytes.size()));
            stm = fz_open_buffer(bg_ctx, buf);
            doc = fz_open_document_with_stream(bg_ctx, magic.constData(), stm);
        }
        fz_always(bg_ctx)
        {
            fz_drop_stream(bg_ctx, stm);
            fz_drop_buffer(bg_ctx, buf);
        }
        fz_catch(bg_ctx)
        {
            qWarning() << "Model::openAsync(): cannot open document:"
                       << fz_caught_message(bg_ctx);
            doc = nullptr;
        }

        if (!doc)
        {
            QMetaObject::invokeMethod(this, [this, session]
            { emit openFileFailed(session); }, Qt::QueuedConnection);
            return;
        }
        g.doc = doc;

        // --- encrypted? park and stop ---
        if (fz_needs_password(bg_ctx, doc))
        {
            g.committed = true;
            QMetaObject::invokeMethod(this, [this, bg_ctx, doc, session]
            {
                if (discardIfStale(bg_ctx, doc, session))
                    return;
                dropPending();
                m_pending = {bg_ctx, doc, session};
                emit passwordRequired(session);
            }, Qt::QueuedConnection);
            return;
        }

        g.committed = true;
        continueOpen(bg_ctx, doc, session);
    });
}

void
Model::submitPassword(const QString &password) noexcept
{
    auto ctx           = m_pending.ctx;
    auto doc           = m_pending.doc;
    const auto session = m_pending.session;
    m_pending.clear();

    if (!ctx || !doc)
    {
        qWarning() << "Model::submitPassword(): no document waiting for a "
                      "password";
        return;
    }

    auto _ = QtConcurrent::run([this, password, ctx, doc, session]
    {
        if (!fz_authenticate_password(ctx, doc, password.toUtf8().constData()))
        {
            // Wrong password, put it back so the user can retry
            QMetaObject::invokeMethod(this, [this, ctx, doc, session]
            {
                if (discardIfStale(ctx, doc, session))
                    return;
                dropPending();
                m_pending = {ctx, doc, session};
                emit wrongPassword(session);
            }, Qt::QueuedConnection);
            return;
        }

        continueOpen(ctx, doc, session);
    });
}

void
Model::continueOpen(fz_context *ctx, fz_document *doc,
                    SessionId session) noexcept
{
    int page_count = 0;
    bool ok        = true;

    fz_try(ctx)
    {
        page_count = fz_count_pages(ctx, doc);
    }
    fz_catch(ctx)
    {
        qWarning() << "Model::continueOpen(): cannot count pages:"
                   << fz_caught_message(ctx);
        ok = false;
    }

    if (!ok)
    {
        fz_drop_document(ctx, doc);
        fz_drop_context(ctx);
        QMetaObject::invokeMethod(this, [this, session]
        { emit openFileFailed(session); }, Qt::QueuedConnection);
        return;
    }

    QMetaObject::invokeMethod(this, [this, ctx, doc, page_count, session]
    {
        if (discardIfStale(ctx, doc, session))
            return;

        waitForRenders();
        cleanup();

        fz_drop_context(m_ctx);

        m_ctx        = ctx;
        m_colorspace = fz_device_rgb(m_ctx);
        {
            std::lock_guard<std::mutex> lock(m_doc_mutex);
            m_doc = doc;
        }
        m_page_count = page_count;
        m_success    = true;

        emit openFileFinished(session);
    }, Qt::QueuedConnection);
}

// User gave up on the password prompt
void
Model::cancelOpen() noexcept
{
    const SessionId session = m_pending.session;
    dropPending();
    cleanup();

    emit openFileFailed(session);
}

void
Model::close() noexcept
{
    waitForRenders();
    dropPending();
    m_session = 0;
    m_bytes.clear();
    m_file_name.clear();
    cleanup();
}

Model::RenderJob
Model::createRenderJob(int pageno, double zoom) const noexcept
{
    RenderJob job;
    job.pageno     = pageno;
    job.zoom       = zoom;
    job.dpi        = m_dpi;
    job.dpr        = m_dpr;
    job.colorspace = m_colorspace;
    return job;
}

// Renders on a worker and hands the image back on the GUI thread through
// `callback` once the pixels are ready.
void
Model::requestPageRender(
    const RenderJob &job,
    const std::function<void(PageRenderResult)> &callback) noexcept
{
    m_render_future
        = QtConcurrent::run([this, job]() -> PageRenderResult
    { return renderPage(job); });

    auto watcher = new QFutureWatcher<PageRenderResult>(this);
    connect(watcher, &QFutureWatcher<PageRenderResult>::finished, this,
            [watcher, callback]()
    {
        PageRenderResult result
            = watcher->isCanceled() ? PageRenderResult{} : watcher->result();
        watcher->deleteLater();

        if (callback)
            callback(std::move(result));
    });

    watcher->setFuture(m_render_future);
}

Model::PageRenderResult
Model::renderPage(const RenderJob &job) noexcept
{
    PageRenderResult result;
    result.pageno = job.pageno;
    result.ticket = job.ticket;

    fz_context *ctx = cloneContext();
    if (!ctx)
        return result;

    fz_page *page{nullptr};
    fz_pixmap *pix{nullptr};
    fz_device *dev{nullptr};
    fz_var(page);
    fz_var(pix);
    fz_var(dev);

    bool ok = false;

    // Held outside fz_try: a MuPDF error longjmps past destructors
    std::lock_guard<std::mutex> lock(m_doc_mutex);

    fz_try(ctx)
    {
        if (!m_doc)
            fz_throw(ctx, FZ_ERROR_GENERIC, "No document loaded");

        fz_set_aa_level(ctx, m_aa_bits);

        page                 = fz_load_page(ctx, m_doc, job.pageno);
        const fz_rect bounds = fz_bound_page(ctx, page);
        const float scale    = static_cast<float>(job.physicalScale());
        fz_matrix transform  = fz_scale(scale, scale);
        fz_irect bbox = fz_round_rect(fz_transform_rect(bounds, transform));

        pix = fz_new_pixmap_with_bbox(ctx, job.colorspace, bbox, nullptr, 0);
        fz_clear_pixmap_with_value(ctx, pix, 255);

        dev = fz_new_draw_device(ctx, fz_identity, pix);
        fz_run_page(ctx, page, dev, transform, nullptr);
        fz_close_device(ctx, dev);
        ok = true;
    }
    fz_always(ctx)
    {
        fz_drop_device(ctx, dev);
        fz_drop_page(ctx, page);
    }
    fz_catch(ctx)
    {
        qWarning() << "Model::renderPage(): page" << job.pageno
                   << "failed:" << fz_caught_message(ctx);
    }

    if (!ok)
    {
        fz_drop_pixmap(ctx, pix);
        fz_drop_context(ctx);
        return result;
    }

    const int width        = fz_pixmap_width(ctx, pix);
    const int height       = fz_pixmap_height(ctx, pix);
    const int n            = fz_pixmap_components(ctx, pix);
    const int stride       = fz_pixmap_stride(ctx, pix);
    unsigned char *samples = fz_pixmap_samples(ctx, pix);

    QImage::Format fmt;
    switch (n)
    {
        case 1:
            fmt = QImage::Format_Grayscale8;
            break;
        case 3:
            fmt = QImage::Format_RGB888;
            break;
        case 4:
            fmt = QImage::Format_RGBA8888;
            break;

        default:
            qWarning() << "Unsupported pixmap component count:" << n;
            fz_drop_pixmap(ctx, pix);
            fz_drop_context(ctx);
            return result;
    }

    RenderPayload *payload = new RenderPayload{ctx, pix};

    QImage image = QImage(samples, width, height, stride, fmt,
                          imageCleanupHandler, payload);
    image.setDotsPerMeterX(static_cast<int>((job.dpi * 1000) / 25.4));
    image.setDotsPerMeterY(static_cast<int>((job.dpi * 1000) / 25.4));
    image.setDevicePixelRatio(job.dpr);
    result.image = image;
    return result;
}

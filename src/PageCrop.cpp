#include "PageCrop.hpp"

#include "DocumentView.hpp"
#include "utils.hpp"

#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFile>
#include <QFileDialog>
#include <QFileInfo>
#include <QKeySequence>
#include <QMenuBar>
#include <QMessageBox>
#include <QMimeData>
#include <QStandardPaths>
#include <QUrl>
#include <algorithm>
#include <toml++/toml.hpp>

namespace
{

static inline void
set_title_format_if_present(toml::node_view<toml::node> n,
                            QString &title_format)
{
    if (auto v = n.value<std::string>())
    {
        QString window_title = QString::fromStdString(*v);
        window_title.replace("{}", "%1");
        title_format = window_title;
    }
}

template <typename T>
static inline void
set(toml::node_view<toml::node> node, T &target)
{
    if (auto v = node.value<T>())
        target = *v;
}

static inline void
set(toml::node_view<toml::node> n, QString &dst)
{
    if (auto v = n.value<std::string>())
        dst = QString::fromStdString(*v);
}

static inline void
set_color(toml::node_view<toml::node> n, uint32_t &dst)
{
    if (auto s = n.value<std::string>())
    {
        uint32_t tmp = dst;
        if (parseHexColor(*s, tmp))
            dst = tmp;
        else
            qWarning() << "initConfig(): invalid color" << s->c_str();
    }
}

static inline void
set_format(toml::node_view<toml::node> n, RasterExtractor::Format &dst)
{
    if (auto s = n.value<std::string>())
    {
        if (*s == "png")
            dst = RasterExtractor::Format::LosslessRGBA;
        else if (*s == "jpeg" || *s == "jpg")
            dst = RasterExtractor::Format::OpaqueRGB;
        else
            qWarning() << "initConfig(): unknown export format" << s->c_str();
    }
}

} // namespace

PageCrop::PageCrop() noexcept
{
    setAttribute(Qt::WA_NativeWindow, true); // Needed for DPI updates
    setAcceptDrops(true);
}

// On-demand construction (after the command line has been read)
void
PageCrop::construct() noexcept
{
    initConfig();
    initGui();
    initConnections();
    updateUiEnabledState();
    updateWindowTitle();
    setMinimumSize(400, 300);

    const auto [width, height] = m_config.window.initial_size;
    if (width > 0 && height > 0)
        resize(width, height);
    else
        resize(1000, 800);
    show();
}

// Initialize the config related stuff
void
PageCrop::initConfig() noexcept
{
    m_config_dir = QDir(
        QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation));

    // If config file path is not set, use the default one
    if (m_config_file_path.isEmpty())
        m_config_file_path = m_config_dir.filePath("config.toml");

    if (!QFile::exists(m_config_file_path))
    {
#ifndef NDEBUG
        qDebug() << "PageCrop::initConfig(): no config at"
                 << m_config_file_path;
#endif
        return;
    }

    toml::table toml;

    try
    {
        toml = toml::parse_file(m_config_file_path.toStdString());
    }
    catch (std::exception &e)
    {
        QMessageBox::critical(
            this, "Error in configuration file",
            QString("There are one or more error(s) in your config "
                    "file:\n%1\n\nLoading default config.")
                .arg(e.what()));
        return;
    }

    if (auto window = toml["window"])
    {
        set(window["menubar"], m_config.window.menubar);
        set_title_format_if_present(window["title_format"],
                                    m_config.window.title_format);

        if (auto size = window["initial_size"].as_array())
        {
            if (size->size() == 2)
            {
                const int w = size->at(0).value_or(-1);
                const int h = size->at(1).value_or(-1);
                m_config.window.initial_size = {w, h};
            }
        }
    }

    if (auto zoom = toml["zoom"])
    {
        set(zoom["min"], m_config.zoom.min);
        set(zoom["max"], m_config.zoom.max);
        set(zoom["step"], m_config.zoom.step);
        set(zoom["initial"], m_config.zoom.initial);
    }

    if (auto rendering = toml["rendering"])
    {
        set(rendering["dpi"], m_config.rendering.dpi);
        if (auto aa = rendering["antialiasing"].value<bool>())
            m_config.rendering.antialiasing_bits = *aa ? 8 : 0;
    }

    if (auto exporting = toml["export"])
    {
        set(exporting["jpeg_quality"], m_config.exporting.jpeg_quality);
        set(exporting["file_name"], m_config.exporting.file_name);
        set_format(exporting["default_format"],
                   m_config.exporting.default_format);
        m_config.exporting.jpeg_quality
            = std::clamp(m_config.exporting.jpeg_quality, 0, 100);
    }

    if (auto colors = toml["colors"])
    {
        set_color(colors["selection"], m_config.colors.selection);
        set_color(colors["overlay"], m_config.colors.overlay);
        set_color(colors["background"], m_config.colors.background);
    }

    if (auto behavior = toml["behavior"])
        set(behavior["start_in_crop_mode"], m_config.behavior.start_in_crop_mode);
}

void
PageCrop::initGui() noexcept
{
    m_doc = new DocumentView(m_config, this);
    setCentralWidget(m_doc);

    initMenubar();
    menuBar()->setVisible(m_config.window.menubar);
}

// Initialize the menubar related stuff
void
PageCrop::initMenubar() noexcept
{
    // --- File Menu ---
    QMenu *fileMenu = menuBar()->addMenu("&File");

    QAction *openAction = fileMenu->addAction("Open File", this,
                                              [this]() { OpenFile(); });
    openAction->setShortcut(QKeySequence::Open);

    m_actionCloseFile = fileMenu->addAction("Close File", this,
                                            &PageCrop::CloseFile);
    m_actionCloseFile->setShortcut(QKeySequence::Close);

    fileMenu->addSeparator();

    m_actionSave = fileMenu->addAction("Save Selection", m_doc,
                                       &DocumentView::SaveSelection);
    m_actionSave->setShortcut(QKeySequence::Save);

    m_actionPrint = fileMenu->addAction("Print Selection", m_doc,
                                        &DocumentView::PrintSelection);
    m_actionPrint->setShortcut(QKeySequence::Print);

    m_actionDownload = fileMenu->addAction("Download PDF", m_doc,
                                           &DocumentView::DownloadDocument);

    fileMenu->addSeparator();
    QAction *quitAction
        = fileMenu->addAction("Quit", this, &QMainWindow::close);
    quitAction->setShortcut(QKeySequence::Quit);

    // --- View Menu ---
    QMenu *viewMenu = menuBar()->addMenu("&View");

    m_actionPrevPage = viewMenu->addAction("Previous Page", m_doc,
                                           &DocumentView::GotoPrevPage);
    m_actionPrevPage->setShortcut(QKeySequence(Qt::Key_PageUp));

    m_actionNextPage = viewMenu->addAction("Next Page", m_doc,
                                           &DocumentView::GotoNextPage);
    m_actionNextPage->setShortcut(QKeySequence(Qt::Key_PageDown));

    viewMenu->addSeparator();

    m_actionZoomIn
        = viewMenu->addAction("Zoom In", m_doc, &DocumentView::ZoomIn);
    m_actionZoomIn->setShortcut(QKeySequence::ZoomIn);

    m_actionZoomOut
        = viewMenu->addAction("Zoom Out", m_doc, &DocumentView::ZoomOut);
    m_actionZoomOut->setShortcut(QKeySequence::ZoomOut);

    m_actionZoomReset
        = viewMenu->addAction("Reset Zoom", m_doc, &DocumentView::ZoomReset);
    m_actionZoomReset->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_0));

    viewMenu->addSeparator();

    m_actionCropMode = viewMenu->addAction("Crop Mode", m_doc,
                                           &DocumentView::ToggleCropMode);
    m_actionCropMode->setShortcut(QKeySequence(Qt::Key_C));

    m_actionClearCrop = viewMenu->addAction("Clear Selection", m_doc,
                                            &DocumentView::ClearCrop);
    m_actionClearCrop->setShortcut(QKeySequence(Qt::Key_Escape));

    // --- Help Menu ---
    QMenu *helpMenu = menuBar()->addMenu("&Help");
    helpMenu->addAction("About", this, &PageCrop::ShowAbout);
}

void
PageCrop::initConnections() noexcept
{
    connect(m_doc, &DocumentView::openFileFinished, this, [this]()
    {
        // --page applies to the first document only
        if (m_config.behavior.startpage_override > 0)
        {
            m_doc->GotoPage(m_config.behavior.startpage_override);
            m_config.behavior.startpage_override = -1;
        }
        updateUiEnabledState();
        updateWindowTitle();
    });

    connect(m_doc, &DocumentView::openFileStarted, this, [this]()
    {
        updateUiEnabledState();
        updateWindowTitle();
    });

    connect(m_doc, &DocumentView::openFileFailed, this, [this]()
    {
        updateUiEnabledState();
        updateWindowTitle();
    });
}

// Updates the UI elements checking if valid
// file is open or not
void
PageCrop::updateUiEnabledState() noexcept
{
    const bool hasOpenedFile = m_doc && m_doc->model()->success();

    m_actionCloseFile->setEnabled(hasOpenedFile);
    m_actionPrint->setEnabled(hasOpenedFile);
    m_actionSave->setEnabled(hasOpenedFile);
    m_actionDownload->setEnabled(hasOpenedFile);
    m_actionNextPage->setEnabled(hasOpenedFile);
    m_actionPrevPage->setEnabled(hasOpenedFile);
    m_actionZoomIn->setEnabled(hasOpenedFile);
    m_actionZoomOut->setEnabled(hasOpenedFile);
    m_actionZoomReset->setEnabled(hasOpenedFile);
    m_actionCropMode->setEnabled(hasOpenedFile);
    m_actionClearCrop->setEnabled(hasOpenedFile);
}

void
PageCrop::updateWindowTitle() noexcept
{
    const QString name = m_doc ? m_doc->fileName() : QString();
    if (name.isEmpty())
        setWindowTitle("pagecrop");
    else
        setWindowTitle(m_config.window.title_format.arg(name));
}

void
PageCrop::OpenFile(const QString &filePath) noexcept
{
    QString path = filePath;
    if (path.isEmpty())
    {
        path = QFileDialog::getOpenFileName(
            this, "Open File", QString(),
            "Documents (*.pdf *.xps *.epub *.cbz);;All Files (*)");
        if (path.isEmpty())
            return;
    }

    if (!QFile::exists(path))
    {
        QMessageBox::warning(this, "Open File",
                             QString("File %1 does not exist").arg(path));
        return;
    }

    m_doc->OpenFile(path);
    updateWindowTitle();
}

void
PageCrop::CloseFile() noexcept
{
    m_doc->CloseFile();
    updateUiEnabledState();
    updateWindowTitle();
}

void
PageCrop::ShowAbout() noexcept
{
    QMessageBox::about(
        this, "About pagecrop",
        QString("pagecrop %1\n\nCrop a region of a PDF page and print or save "
                "it as a pixel-exact image.")
            .arg(APP_VERSION));
}

// Reads the arguments passed with `pagecrop` from the
// commandline
void
PageCrop::Read_args_parser(argparse::ArgumentParser &argparser) noexcept
{
    if (argparser.is_used("config"))
    {
        m_config_file_path
            = QString::fromStdString(argparser.get<std::string>("--config"));
    }

    // Command line overrides are applied on top of config.toml
    construct();

    if (argparser.is_used("page"))
        m_config.behavior.startpage_override = argparser.get<int>("--page");

    if (argparser.is_used("zoom"))
        m_config.zoom.initial = argparser.get<double>("--zoom");

    if (argparser.get<bool>("--crop-mode"))
        m_config.behavior.start_in_crop_mode = true;

    if (argparser.is_used("file"))
        OpenFile(QString::fromStdString(argparser.get<std::string>("file")));
}

void
PageCrop::dragEnterEvent(QDragEnterEvent *e)
{
    if (e->mimeData()->hasUrls())
        e->acceptProposedAction();
}

void
PageCrop::dropEvent(QDropEvent *e)
{
    const QList<QUrl> urls = e->mimeData()->urls();
    for (const QUrl &url : urls)
    {
        if (url.isLocalFile())
        {
            OpenFile(url.toLocalFile());
            e->acceptProposedAction();
            return;
        }
    }
    e->ignore();
}

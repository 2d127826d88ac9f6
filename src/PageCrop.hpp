#pragma once

#include "Config.hpp"

#include <QAction>
#include <QDir>
#include <QMainWindow>
#include <argparse/argparse.hpp>

class DocumentView;

class PageCrop : public QMainWindow
{
    Q_OBJECT

public:
    PageCrop() noexcept;

    void Read_args_parser(argparse::ArgumentParser &argparser) noexcept;

    void OpenFile(const QString &filePath = QString()) noexcept;
    void CloseFile() noexcept;
    void ShowAbout() noexcept;

    inline const Config &config() const noexcept
    {
        return m_config;
    }

protected:
    void dragEnterEvent(QDragEnterEvent *e) override;
    void dropEvent(QDropEvent *e) override;

private:
    void construct() noexcept;
    void initConfig() noexcept;
    void initGui() noexcept;
    void initMenubar() noexcept;
    void initConnections() noexcept;
    void updateUiEnabledState() noexcept;
    void updateWindowTitle() noexcept;

    Config m_config;
    QDir m_config_dir;
    QString m_config_file_path;

    DocumentView *m_doc{nullptr};

    QAction *m_actionCloseFile{nullptr};
    QAction *m_actionPrint{nullptr};
    QAction *m_actionSave{nullptr};
    QAction *m_actionDownload{nullptr};
    QAction *m_actionNextPage{nullptr};
    QAction *m_actionPrevPage{nullptr};
    QAction *m_actionZoomIn{nullptr};
    QAction *m_actionZoomOut{nullptr};
    QAction *m_actionZoomReset{nullptr};
    QAction *m_actionCropMode{nullptr};
    QAction *m_actionClearCrop{nullptr};
};

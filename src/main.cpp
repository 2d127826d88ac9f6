#include "PageCrop.hpp"

#include <QApplication>
#include <QDebug>
#include <argparse/argparse.hpp>

void
init_args(argparse::ArgumentParser &program)
{
    program.add_argument("-p", "--page")
        .help("Page number to go to")
        .scan<'i', int>()
        .default_value(-1)
        .metavar("PAGE_NUMBER");

    program.add_argument("-z", "--zoom")
        .help("Initial zoom factor (1.0 = 100%)")
        .scan<'g', double>()
        .default_value(1.0)
        .metavar("ZOOM");

    program.add_argument("-c", "--config")
        .help("Path to config.toml file")
        .nargs(1)
        .metavar("CONFIG_PATH");

    program.add_argument("--crop-mode")
        .help("Start with crop mode enabled")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("file")
        .help("Document to open")
        .nargs(argparse::nargs_pattern::optional)
        .metavar("FILE_PATH");
}

int
main(int argc, char *argv[])
{
    argparse::ArgumentParser program("pagecrop", APP_VERSION,
                                     argparse::default_arguments::all);
    init_args(program);
    try
    {
        program.parse_args(argc, argv);
    }
    catch (const std::exception &e)
    {
        qWarning() << e.what();
        return 1;
    }

    QGuiApplication::setHighDpiScaleFactorRoundingPolicy(
        Qt::HighDpiScaleFactorRoundingPolicy::PassThrough);
    QApplication app(argc, argv);
    app.setApplicationName("pagecrop");
    app.setApplicationVersion(APP_VERSION);

    PageCrop window;
    window.Read_args_parser(program);
    return app.exec();
}

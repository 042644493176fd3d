#include <QApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include "mainwindow.h"
#include "services/panepreferences.h"
#include "utils/logging.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    app.setApplicationName("poolxfer");
    app.setApplicationVersion(POOLXFER_VERSION);
    app.setOrganizationName("poolxfer");
    app.setOrganizationDomain("example.com");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Copies audio files into a sampler pool folder");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    QCommandLineOption poolOption(
        QStringList() << "p" << "pool",
        "Use <dir> as the pool folder", "dir");
    parser.addOption(poolOption);

    parser.addPositionalArgument("pool", "Pool folder (same as --pool)", "[pool]");

    parser.process(app);

    // Set verbose logging flag
    poolxfer::verboseLogging = parser.isSet(verboseOption);

    if (poolxfer::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    PanePreferences preferences;
    preferences.loadSettings();

    QString poolArg = parser.value(poolOption);
    if (poolArg.isEmpty() && !parser.positionalArguments().isEmpty()) {
        poolArg = parser.positionalArguments().first();
    }
    if (!poolArg.isEmpty()) {
        QFileInfo poolInfo(poolArg);
        if (poolInfo.isDir()) {
            preferences.setPoolRoot(poolInfo.absoluteFilePath());
        } else {
            qWarning() << "Pool folder does not exist, keeping" << preferences.poolRoot()
                       << ":" << poolArg;
        }
    }

    MainWindow window(&preferences);
    window.start();
    window.show();

    return app.exec();
}

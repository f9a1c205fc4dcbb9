#include <QGuiApplication>
#include <QCoreApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QQuickStyle>
#include <QStandardPaths>
#include <QDir>

import reel.core.downloadcontroller;
import reel.core.downloadjob;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Reel"));
    QCoreApplication::setApplicationName(QStringLiteral("Reel"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));
    QQuickStyle::setStyle("Basic");

    // Leftovers of a previous run that was killed mid-download
    QString tempRoot = QStandardPaths::writableLocation(QStandardPaths::TempLocation);
    if (tempRoot.isEmpty()) tempRoot = QDir::tempPath();
    DownloadJob::removeStaleTemporaryDirs(tempRoot);

    DownloadController controller;

    // Set up QML engine
    QQmlApplicationEngine engine;

    engine.rootContext()->setContextProperty("downloader", &controller);

    // Handle QML loading errors
    QObject::connect(
        &engine,
        &QQmlApplicationEngine::objectCreationFailed,
        &app,
        []() { QCoreApplication::exit(-1); },
        Qt::QueuedConnection);
    engine.loadFromModule("Reel", "Main");

    if (engine.rootObjects().isEmpty())
        return -1;

    return app.exec();
}

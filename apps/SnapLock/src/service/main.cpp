#include <QGuiApplication>
#include <QCommandLineParser>
#include <QTextStream>

#include "logger/logger.h"
#include "SnapLockService.h"
#include "../services/CameraCaptureService.h"

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    QGuiApplication::setApplicationName("SnapLock");
    QGuiApplication::setApplicationVersion("1.0.0");
    QGuiApplication::setQuitOnLastWindowClosed(false);

    // Setup command line parser
    QCommandLineParser parser;
    parser.setApplicationDescription("SnapLock: photograph and lock on activity after arming");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption armOption("arm", "Arm immediately after start-up");
    QCommandLineOption cameraOption("camera", "Camera index to capture from", "id");
    QCommandLineOption savePathOption("save-path", "Directory for captured photos", "dir");
    QCommandLineOption captureOnlyOption("capture-only", "Capture a photo without locking the screen");
    QCommandLineOption exitOnLockOption("exit-on-lock", "Exit after the trigger response");
    QCommandLineOption shortcutOption("shortcut", "Global shortcut that arms and disarms", "combo");
    QCommandLineOption listCamerasOption("list-cameras", "List available cameras and exit");
    QCommandLineOption logFileOption("logfile", "Specify log file path", "path");
    QCommandLineOption logLevelOption("loglevel", "Set log level (debug, info, warning, error)", "level", "info");

    parser.addOption(armOption);
    parser.addOption(cameraOption);
    parser.addOption(savePathOption);
    parser.addOption(captureOnlyOption);
    parser.addOption(exitOnLockOption);
    parser.addOption(shortcutOption);
    parser.addOption(listCamerasOption);
    parser.addOption(logFileOption);
    parser.addOption(logLevelOption);

    parser.process(app);

    if (parser.isSet(listCamerasOption)) {
        QTextStream out(stdout);
        const QStringList cameras = CameraCaptureService::availableCameras();
        if (cameras.isEmpty()) {
            out << "No cameras found" << Qt::endl;
            return 1;
        }
        for (const QString& camera : cameras) {
            out << camera << Qt::endl;
        }
        return 0;
    }

    LOG_INFO("SnapLock starting...");

    SnapLockService service;

    QObject::connect(&service, &SnapLockService::notificationRequested,
                     [](const QString& title, const QString& body) {
        LOG_INFO(QString("Notification: %1 - %2").arg(title, body));
    });
    QObject::connect(&service, &SnapLockService::exitRequested,
                     &app, &QCoreApplication::exit, Qt::QueuedConnection);

    if (!service.initialize()) {
        LOG_ERROR("Failed to initialize service");
        return 1;
    }

    // Command line logging overrides the saved log settings
    if (parser.isSet(logFileOption)) {
        if (!Logger::instance()->setLogFile(parser.value(logFileOption))) {
            LOG_ERROR("Cannot open log file " + parser.value(logFileOption));
            return 1;
        }
    }

    if (parser.isSet(logLevelOption)) {
        QString logLevel = parser.value(logLevelOption).toLower();
        if (logLevel == "debug") {
            Logger::instance()->setLogLevel(Logger::Debug);
        } else if (logLevel == "info") {
            Logger::instance()->setLogLevel(Logger::Info);
        } else if (logLevel == "warning") {
            Logger::instance()->setLogLevel(Logger::Warning);
        } else if (logLevel == "error") {
            Logger::instance()->setLogLevel(Logger::Error);
        } else {
            LOG_WARNING("Unknown log level " + logLevel + ", keeping the configured one");
        }
    }

    // Command line settings are saved like any other settings change
    if (parser.isSet(cameraOption)) {
        bool ok = false;
        int cameraId = parser.value(cameraOption).toInt(&ok);
        if (!ok || !service.setCameraId(cameraId)) {
            LOG_ERROR("Invalid camera id: " + parser.value(cameraOption));
            return 1;
        }
    }

    if (parser.isSet(savePathOption) && !service.setSavePath(parser.value(savePathOption))) {
        LOG_ERROR("Cannot use save path " + parser.value(savePathOption));
        return 1;
    }

    if (parser.isSet(captureOnlyOption) && !service.setPostTriggerAction(PostTriggerAction::CaptureOnly)) {
        LOG_WARNING("Capture only setting could not be applied");
    }

    if (parser.isSet(exitOnLockOption) && !service.setExitOnLock(true)) {
        LOG_WARNING("Exit on lock setting could not be applied");
    }

    if (!service.start()) {
        LOG_ERROR("Failed to start service");
        return 1;
    }

    if (parser.isSet(shortcutOption)) {
        ErrorCode result = service.setShortcut(parser.value(shortcutOption));
        if (result != ErrorCode::None) {
            LOG_WARNING(QString("Keeping shortcut %1 (%2)")
                            .arg(service.currentShortcut(), errorCodeToString(result)));
        }
    }

    if (parser.isSet(armOption) && service.arm() != ErrorCode::None) {
        LOG_ERROR("Failed to arm");
    }

    LOG_INFO(QString("Press %1 to arm or disarm").arg(service.currentShortcut()));

    // Install event handler to gracefully shutdown the service
    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        LOG_INFO("Application shutting down...");
        service.stop();
    });

    return app.exec();
}

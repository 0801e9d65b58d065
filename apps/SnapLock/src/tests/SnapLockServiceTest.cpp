#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QSettings>

#include "service/SnapLockService.h"
#include "logger/logger.h"
#include "TestDoubles.h"

class SnapLockServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());
        qputenv("SNAPLOCK_CONFIG_DIR", m_tempDir->path().toUtf8());
    }

    void init() {
        QFile::remove(configPath());

        m_watcher = new FakeInputWatcher();
        m_capture = new FakeCaptureService();
        m_lock = new FakeLockService();
        m_service = new SnapLockService();
        QVERIFY(m_service->initialize(m_watcher, m_capture, m_lock));
        QVERIFY(m_service->start());

        MonitoringController* controller = m_service->monitoringController();
        controller->setPreparationDelay(20);
        controller->setCaptureTimeout(200);
        controller->setLockTimeout(200);
    }

    void cleanup() {
        // Owns the watcher and both services
        delete m_service;
    }

    void testStartRegistersConfiguredShortcut() {
        QCOMPARE(m_service->currentShortcut(), QString("Alt+L"));
        QCOMPARE(m_watcher->activeHotkeyBinding().toString(), QString("Alt+L"));
        QVERIFY(m_service->isRunning());
        QCOMPARE(m_service->monitoringState(), MonitoringController::Idle);
    }

    void testArmWithCameraPersistsIt() {
        QSignalSpy statusSpy(m_service, &SnapLockService::monitoringStatusChanged);

        QCOMPARE(m_service->arm(2), ErrorCode::None);
        QCOMPARE(m_service->configManager()->cameraId(), 2);
        QCOMPARE(readSetting("CameraId").toInt(), 2);

        QTRY_COMPARE(m_service->monitoringState(), MonitoringController::Active);
        QCOMPARE(statusSpy.count(), 2);

        QCOMPARE(m_service->arm(1), ErrorCode::InvalidState);
        QCOMPARE(m_service->configManager()->cameraId(), 2);

        QCOMPARE(m_service->disarm(), ErrorCode::None);
        QCOMPARE(m_service->monitoringState(), MonitoringController::Idle);
    }

    void testSettingsArePersistedAndApplied() {
        QVERIFY(m_service->setSavePath(m_tempDir->path()));
        QVERIFY(m_service->setExitOnLock(true));
        QVERIFY(m_service->setPostTriggerAction(PostTriggerAction::CaptureOnly));
        QVERIFY(m_service->setEnableNotifications(false));

        MonitoringController* controller = m_service->monitoringController();
        QCOMPARE(controller->savePath(), m_tempDir->path());
        QCOMPARE(controller->exitOnLock(), true);
        QCOMPARE(controller->postTriggerAction(), PostTriggerAction::CaptureOnly);
        QCOMPARE(controller->notificationsEnabled(), false);

        QCOMPARE(readSetting("SavePath").toString(), m_tempDir->path());
        QCOMPARE(readSetting("ExitOnLock").toBool(), true);
        QCOMPARE(readSetting("PostTriggerAction").toString(), QString("CaptureOnly"));
        QCOMPARE(readSetting("EnableNotifications").toBool(), false);
    }

    void testRejectedSettingKeepsOldValue() {
        QVERIFY(!m_service->setCameraId(-1));
        QCOMPARE(m_service->configManager()->cameraId(), 0);
        QCOMPARE(m_service->monitoringController()->cameraId(), 0);
    }

    void testSettingChangeCancelsCountdown() {
        m_service->monitoringController()->setPreparationDelay(200);
        QCOMPARE(m_service->arm(), ErrorCode::None);
        QCOMPARE(m_service->monitoringState(), MonitoringController::Preparing);

        QVERIFY(m_service->setCameraId(4));
        QCOMPARE(m_service->monitoringState(), MonitoringController::Idle);
    }

    void testLogSettings() {
        QVERIFY(m_service->setSavePath(m_tempDir->path()));
        QVERIFY(m_service->setShowDebugLogs(true));
        QVERIFY(m_service->setSaveLogsToFile(true));

        QCOMPARE(Logger::instance()->getLogLevel(), Logger::Debug);
        QCOMPARE(Logger::instance()->getLogFilePath(),
                 QDir(m_tempDir->path()).filePath("snaplock_debug.log"));
        QVERIFY(Logger::instance()->isFileOutputEnabled());

        QVERIFY(m_service->setSaveLogsToFile(false));
        QVERIFY(m_service->setShowDebugLogs(false));
        QVERIFY(!Logger::instance()->isFileOutputEnabled());
        QCOMPARE(Logger::instance()->getLogLevel(), Logger::Info);
    }

    void testLogEntriesForwarded() {
        QSignalSpy logSpy(m_service, &SnapLockService::logEntry);

        LOG_INFO("forwarded entry");

        QVERIFY(logSpy.count() >= 1);
        QCOMPARE(logSpy.last().at(2).toString(), QString("forwarded entry"));
    }

    void testHotkeyTogglesMonitoring() {
        m_watcher->pressHotkey();
        QCOMPARE(m_service->monitoringState(), MonitoringController::Preparing);

        QTRY_COMPARE(m_service->monitoringState(), MonitoringController::Active);

        // Inside the debounce window nothing happens
        m_watcher->pressHotkey();
        QCOMPARE(m_service->monitoringState(), MonitoringController::Active);

        QTest::qWait(SnapLockTimings::ShortcutDebounceMs + 50);
        m_watcher->pressHotkey();
        QCOMPARE(m_service->monitoringState(), MonitoringController::Idle);
    }

    void testShortcutKeysDoNotTrigger() {
        QCOMPARE(m_service->setShortcut("Ctrl+Alt+K"), ErrorCode::None);
        QCOMPARE(readSetting("Shortcut").toString(), QString("Ctrl+Alt+K"));

        QCOMPARE(m_service->arm(), ErrorCode::None);
        QTRY_COMPARE(m_service->monitoringState(), MonitoringController::Active);

        m_watcher->sendKey("Ctrl");
        m_watcher->sendKey("Alt");
        m_watcher->sendKey("K");
        QTest::qWait(20);
        QVERIFY(m_capture->requests.isEmpty());

        m_watcher->sendKey("Shift");
        QTRY_COMPARE(m_capture->requests.size(), 1);
    }

    void testShortcutCaptureThroughService() {
        QCOMPARE(m_service->startShortcutCapture(), ErrorCode::None);
        QCOMPARE(m_watcher->activeHotkey(), InvalidHotkeyHandle);

        KeyEvent event;
        event.modifiers = ShortcutBinding::Alt | ShortcutBinding::Shift;
        event.key = "s";
        QCOMPARE(m_service->feedShortcutKey(event), ErrorCode::None);

        QCOMPARE(m_service->currentShortcut(), QString("Alt+Shift+S"));
        QCOMPARE(m_service->configManager()->shortcut(), QString("Alt+Shift+S"));

        QCOMPARE(m_service->startShortcutCapture(), ErrorCode::None);
        QCOMPARE(m_service->cancelShortcutCapture(), ErrorCode::None);
        QCOMPARE(m_watcher->activeHotkeyBinding().toString(), QString("Alt+Shift+S"));
    }

    void testEndToEndExitOnLock() {
        QSignalSpy exitSpy(m_service, &SnapLockService::exitRequested);
        QSignalSpy statusSpy(m_service, &SnapLockService::monitoringStatusChanged);
        QVERIFY(m_service->setSavePath("/tmp/out"));
        QVERIFY(m_service->setExitOnLock(true));

        QCOMPARE(m_service->arm(2), ErrorCode::None);
        QTRY_COMPARE(m_service->monitoringState(), MonitoringController::Active);

        m_watcher->sendMouse();
        QTRY_COMPARE(exitSpy.count(), 1);

        QCOMPARE(m_capture->requests.size(), 1);
        QCOMPARE(m_capture->requests.first().cameraId, 2);
        QCOMPARE(m_capture->requests.first().savePath, QString("/tmp/out"));
        QCOMPARE(m_lock->requests.size(), 1);
        QCOMPARE(statusSpy.count(), 2);
    }

    void testErrorsForwarded() {
        QSignalSpy errorSpy(m_service, &SnapLockService::errorOccurred);
        m_capture->mode = FakeCaptureService::Fail;

        QCOMPARE(m_service->arm(), ErrorCode::None);
        QTRY_COMPARE(m_service->monitoringState(), MonitoringController::Active);
        m_watcher->sendKey("A");

        QTRY_COMPARE(m_service->monitoringState(), MonitoringController::Idle);
        QCOMPARE(errorSpy.count(), 1);
        QCOMPARE(errorSpy.at(0).at(0).toInt(), int(ErrorCode::CaptureFailure));
        QCOMPARE(m_lock->requests.size(), 1);
    }

    void testStopReleasesEverything() {
        QCOMPARE(m_service->arm(), ErrorCode::None);
        QTRY_COMPARE(m_service->monitoringState(), MonitoringController::Active);

        QVERIFY(m_service->stop());
        QCOMPARE(m_service->monitoringState(), MonitoringController::Idle);
        QCOMPARE(m_watcher->activeHotkey(), InvalidHotkeyHandle);
        QVERIFY(!m_watcher->isRunning());
        QVERIFY(!m_service->isRunning());
    }

private:
    QString configPath() const {
        return QDir(m_tempDir->path()).filePath("snaplock_config.ini");
    }

    QVariant readSetting(const QString& key) const {
        QSettings settings(configPath(), QSettings::IniFormat);
        return settings.value(key);
    }

    FakeInputWatcher* m_watcher;
    FakeCaptureService* m_capture;
    FakeLockService* m_lock;
    SnapLockService* m_service;
    QScopedPointer<QTemporaryDir> m_tempDir;
};

QTEST_MAIN(SnapLockServiceTest)
#include "SnapLockServiceTest.moc"

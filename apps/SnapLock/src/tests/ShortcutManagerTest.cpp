#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "core/ShortcutManager.h"
#include "managers/ConfigManager.h"
#include "TestDoubles.h"

class ShortcutManagerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());
        qputenv("SNAPLOCK_CONFIG_DIR", m_tempDir->path().toUtf8());
    }

    void init() {
        QFile::remove(QDir(m_tempDir->path()).filePath("snaplock_config.ini"));

        m_watcher = new FakeInputWatcher();
        QVERIFY(m_watcher->start());
        m_manager = new ShortcutManager(m_watcher);
    }

    void cleanup() {
        delete m_manager;
        delete m_watcher;
    }

    void testRegisterConfiguredShortcut() {
        QSignalSpy changedSpy(m_manager, &ShortcutManager::shortcutChanged);

        QCOMPARE(m_manager->registerInitialShortcut("Alt+L"), ErrorCode::None);
        QCOMPARE(m_manager->currentShortcutText(), QString("Alt+L"));
        QVERIFY(m_manager->currentHandle() != InvalidHotkeyHandle);
        QCOMPARE(m_watcher->activeHotkeyBinding().toString(), QString("Alt+L"));
        QCOMPARE(changedSpy.count(), 1);
    }

    void testFallbackWhenConfiguredIsTaken() {
        ConfigManager config;
        QVERIFY(config.initialize());
        m_manager->setConfigManager(&config);

        m_watcher->refused << "Alt+L" << "Ctrl+Alt+L";

        QCOMPARE(m_manager->registerInitialShortcut("Alt+L"), ErrorCode::None);
        QCOMPARE(m_manager->currentShortcutText(), QString("Ctrl+Shift+L"));
        QCOMPARE(config.shortcut(), QString("Ctrl+Shift+L"));
    }

    void testNoShortcutAvailable() {
        QSignalSpy errorSpy(m_manager, &ShortcutManager::errorOccurred);
        m_watcher->refused << "Alt+L" << ShortcutManager::fallbackShortcuts();

        QCOMPARE(m_manager->registerInitialShortcut("Alt+L"), ErrorCode::HotkeyRegistrationFailure);
        QCOMPARE(m_manager->currentHandle(), InvalidHotkeyHandle);
        QCOMPARE(errorSpy.count(), 1);
    }

    void testInvalidConfiguredShortcutUsesDefault() {
        QCOMPARE(m_manager->registerInitialShortcut("Ctrl+Shift"), ErrorCode::None);
        QCOMPARE(m_manager->currentShortcutText(), QString("Alt+L"));
    }

    void testCaptureNewShortcut() {
        QSignalSpy progressSpy(m_manager, &ShortcutManager::captureProgress);
        QSignalSpy changedSpy(m_manager, &ShortcutManager::shortcutChanged);
        QCOMPARE(m_manager->registerInitialShortcut("Alt+L"), ErrorCode::None);
        changedSpy.clear();

        QCOMPARE(m_manager->startCapture(), ErrorCode::None);
        QCOMPARE(m_manager->state(), ShortcutManager::Capturing);
        QCOMPARE(m_manager->currentHandle(), InvalidHotkeyHandle);
        QCOMPARE(m_watcher->activeGrabs(), 0);

        KeyEvent ctrl;
        ctrl.key = "Control";
        QCOMPARE(m_manager->feedKeyEvent(ctrl), ErrorCode::None);
        QCOMPARE(progressSpy.last().at(0).toString(), QString("Ctrl+..."));

        KeyEvent k;
        k.modifiers = ShortcutBinding::Ctrl | ShortcutBinding::Shift;
        k.key = "k";
        QCOMPARE(m_manager->feedKeyEvent(k), ErrorCode::None);

        QCOMPARE(m_manager->state(), ShortcutManager::Idle);
        QCOMPARE(m_manager->currentShortcutText(), QString("Ctrl+Shift+K"));
        QCOMPARE(m_watcher->activeHotkeyBinding().toString(), QString("Ctrl+Shift+K"));
        QCOMPARE(changedSpy.count(), 1);
        QCOMPARE(changedSpy.at(0).at(0).toString(), QString("Ctrl+Shift+K"));
        QVERIFY(m_watcher->maxActiveGrabs() <= 1);
    }

    void testCancelRestoresPrevious() {
        QCOMPARE(m_manager->registerInitialShortcut("Alt+L"), ErrorCode::None);

        QCOMPARE(m_manager->startCapture(), ErrorCode::None);
        KeyEvent shift;
        shift.key = "Shift";
        QCOMPARE(m_manager->feedKeyEvent(shift), ErrorCode::None);

        QCOMPARE(m_manager->cancelCapture(), ErrorCode::None);
        QCOMPARE(m_manager->state(), ShortcutManager::Idle);
        QCOMPARE(m_manager->currentShortcutText(), QString("Alt+L"));
        QCOMPARE(m_watcher->activeHotkeyBinding().toString(), QString("Alt+L"));
        QCOMPARE(m_watcher->activeGrabs(), 1);
    }

    void testEscapeCancels() {
        QCOMPARE(m_manager->registerInitialShortcut("Alt+L"), ErrorCode::None);
        QCOMPARE(m_manager->startCapture(), ErrorCode::None);

        KeyEvent escape;
        escape.key = "Esc";
        QCOMPARE(m_manager->feedKeyEvent(escape), ErrorCode::None);
        QCOMPARE(m_manager->state(), ShortcutManager::Idle);
        QCOMPARE(m_manager->currentShortcutText(), QString("Alt+L"));
    }

    void testInvalidCandidateKeepsCapturing() {
        QSignalSpy errorSpy(m_manager, &ShortcutManager::errorOccurred);
        QCOMPARE(m_manager->registerInitialShortcut("Alt+L"), ErrorCode::None);
        QCOMPARE(m_manager->startCapture(), ErrorCode::None);

        KeyEvent bare;
        bare.key = "L";
        QCOMPARE(m_manager->feedKeyEvent(bare), ErrorCode::InvalidShortcut);
        QCOMPARE(m_manager->state(), ShortcutManager::Capturing);
        QCOMPARE(errorSpy.count(), 1);
        QCOMPARE(errorSpy.at(0).at(0).toInt(), int(ErrorCode::InvalidShortcut));

        // The session is still usable
        KeyEvent valid;
        valid.modifiers = ShortcutBinding::Alt;
        valid.key = "P";
        QCOMPARE(m_manager->feedKeyEvent(valid), ErrorCode::None);
        QCOMPARE(m_manager->currentShortcutText(), QString("Alt+P"));
    }

    void testRefusedCandidateKeepsCapturing() {
        QCOMPARE(m_manager->registerInitialShortcut("Alt+L"), ErrorCode::None);
        m_watcher->refused << "Ctrl+Alt+Delete";
        QCOMPARE(m_manager->startCapture(), ErrorCode::None);

        KeyEvent taken;
        taken.modifiers = ShortcutBinding::Ctrl | ShortcutBinding::Alt;
        taken.key = "Delete";
        QCOMPARE(m_manager->feedKeyEvent(taken), ErrorCode::HotkeyRegistrationFailure);
        QCOMPARE(m_manager->state(), ShortcutManager::Capturing);
        QCOMPARE(m_manager->currentShortcutText(), QString("Alt+L"));
        QCOMPARE(m_watcher->activeGrabs(), 0);

        QCOMPARE(m_manager->cancelCapture(), ErrorCode::None);
        QCOMPARE(m_watcher->activeHotkeyBinding().toString(), QString("Alt+L"));
    }

    void testCaptureStateErrors() {
        KeyEvent k;
        k.modifiers = ShortcutBinding::Alt;
        k.key = "K";
        QCOMPARE(m_manager->feedKeyEvent(k), ErrorCode::InvalidState);
        QCOMPARE(m_manager->cancelCapture(), ErrorCode::InvalidState);

        QCOMPARE(m_manager->startCapture(), ErrorCode::None);
        QCOMPARE(m_manager->startCapture(), ErrorCode::InvalidState);
        QCOMPARE(m_manager->setShortcut("Alt+K"), ErrorCode::InvalidState);
    }

    void testHotkeyDebounce() {
        QSignalSpy activatedSpy(m_manager, &ShortcutManager::hotkeyActivated);
        QCOMPARE(m_manager->registerInitialShortcut("Alt+L"), ErrorCode::None);

        m_watcher->pressHotkey();
        m_watcher->pressHotkey();
        QCOMPARE(activatedSpy.count(), 1);

        QTest::qWait(SnapLockTimings::ShortcutDebounceMs + 50);
        m_watcher->pressHotkey();
        QCOMPARE(activatedSpy.count(), 2);
    }

    void testHotkeyIgnoredWhileCapturing() {
        QSignalSpy activatedSpy(m_manager, &ShortcutManager::hotkeyActivated);
        QCOMPARE(m_manager->registerInitialShortcut("Alt+L"), ErrorCode::None);
        const HotkeyHandle handle = m_manager->currentHandle();

        QCOMPARE(m_manager->startCapture(), ErrorCode::None);
        m_watcher->pressHandle(handle);
        QCOMPARE(activatedSpy.count(), 0);
    }

    void testSetShortcut() {
        ConfigManager config;
        QVERIFY(config.initialize());
        m_manager->setConfigManager(&config);
        QCOMPARE(m_manager->registerInitialShortcut("Alt+L"), ErrorCode::None);

        QCOMPARE(m_manager->setShortcut("Ctrl+Alt+J"), ErrorCode::None);
        QCOMPARE(m_manager->currentShortcutText(), QString("Ctrl+Alt+J"));
        QCOMPARE(config.shortcut(), QString("Ctrl+Alt+J"));

        ConfigManager reloaded;
        QVERIFY(reloaded.initialize());
        QVERIFY(reloaded.loadLocalConfig());
        QCOMPARE(reloaded.shortcut(), QString("Ctrl+Alt+J"));

        QCOMPARE(m_manager->setShortcut("Ctrl"), ErrorCode::InvalidShortcut);
        QCOMPARE(m_manager->currentShortcutText(), QString("Ctrl+Alt+J"));
    }

    void testSetShortcutRefusedKeepsPrevious() {
        QCOMPARE(m_manager->registerInitialShortcut("Alt+L"), ErrorCode::None);
        m_watcher->refused << "Meta+L";

        QCOMPARE(m_manager->setShortcut("Meta+L"), ErrorCode::HotkeyRegistrationFailure);
        QCOMPARE(m_manager->currentShortcutText(), QString("Alt+L"));
        QCOMPARE(m_watcher->activeHotkeyBinding().toString(), QString("Alt+L"));
        QVERIFY(m_watcher->maxActiveGrabs() <= 1);
    }

    void testReleaseShortcut() {
        QCOMPARE(m_manager->registerInitialShortcut("Alt+L"), ErrorCode::None);
        m_manager->releaseShortcut();
        QCOMPARE(m_manager->currentHandle(), InvalidHotkeyHandle);
        QCOMPARE(m_watcher->activeGrabs(), 0);
    }

private:
    FakeInputWatcher* m_watcher;
    ShortcutManager* m_manager;
    QScopedPointer<QTemporaryDir> m_tempDir;
};

QTEST_MAIN(ShortcutManagerTest)
#include "ShortcutManagerTest.moc"

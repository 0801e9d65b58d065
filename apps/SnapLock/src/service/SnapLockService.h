#ifndef SNAPLOCKSERVICE_H
#define SNAPLOCKSERVICE_H

#include <QObject>
#include <functional>
#include "../core/CoreTypes.h"
#include "../core/Draft.h"
#include "../core/MonitoringController.h"
#include "../core/ShortcutManager.h"
#include "../managers/ConfigManager.h"

class InputWatcher;
class CaptureService;
class LockService;

class SnapLockService : public QObject
{
    Q_OBJECT
public:
    explicit SnapLockService(QObject *parent = nullptr);
    ~SnapLockService();

    // Creates the platform services
    bool initialize();
    // Takes ownership of the given services
    bool initialize(InputWatcher* watcher, CaptureService* captureService, LockService* lockService);
    bool start();
    bool stop();
    bool isRunning() const;

    // Monitoring
    ErrorCode arm(int cameraId);
    ErrorCode arm();
    ErrorCode disarm();
    MonitoringController::State monitoringState() const;

    // Settings, persisted before they take effect. False leaves the old value.
    bool setCameraId(int cameraId);
    bool setSavePath(const QString& savePath);
    bool setExitOnLock(bool exitOnLock);
    bool setPostTriggerAction(PostTriggerAction action);
    bool setShowDebugLogs(bool show);
    bool setSaveLogsToFile(bool save);
    bool setEnableNotifications(bool enable);

    // Global shortcut
    ErrorCode startShortcutCapture();
    ErrorCode cancelShortcutCapture();
    ErrorCode feedShortcutKey(const KeyEvent& event);
    ErrorCode setShortcut(const QString& shortcut);
    QString currentShortcut() const;

    ConfigManager* configManager() const;
    MonitoringController* monitoringController() const;
    ShortcutManager* shortcutManager() const;

signals:
    void monitoringStatusChanged(int state);
    void logEntry(const QString& timestamp, const QString& level,
                  const QString& message, const QString& target);
    void errorOccurred(int code, const QString& message);
    void notificationRequested(const QString& title, const QString& body);
    void exitRequested(int exitCode);

private slots:
    void onStateChanged(int newState, int oldState);
    void onHotkeyActivated();
    void onShortcutChanged(const QString& shortcut);

private:
    bool loadConfig();
    void applySettingsToController();
    void setupSignalHandlers();

    template <typename T>
    bool commitSetting(Draft<T>& draft, const T& value, const QString& name,
                       const std::function<void(const T&)>& store,
                       const std::function<T()>& load);

    InputWatcher* m_inputWatcher;
    CaptureService* m_captureService;
    LockService* m_lockService;
    ConfigManager* m_configManager;
    ShortcutManager* m_shortcutManager;
    MonitoringController* m_controller;
    bool m_initialized;
    bool m_isRunning;

    // Settings
    Draft<int> m_cameraId;
    Draft<QString> m_savePath;
    Draft<bool> m_exitOnLock;
    Draft<PostTriggerAction> m_postTriggerAction;
    Draft<bool> m_showDebugLogs;
    Draft<bool> m_saveLogsToFile;
    Draft<bool> m_enableNotifications;
};

#endif // SNAPLOCKSERVICE_H

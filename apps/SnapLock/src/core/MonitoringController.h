#ifndef MONITORINGCONTROLLER_H
#define MONITORINGCONTROLLER_H

#include <QObject>
#include <QTimer>
#include <QDateTime>
#include <QElapsedTimer>
#include "CoreTypes.h"

class InputWatcher;
class CaptureService;
class LockService;

/**
 * Arming/trigger state machine.
 *
 * Idle -> Preparing (countdown) -> Active -> Idle. While Active the first
 * qualifying input event unsubscribes from the InputWatcher and runs the
 * response pipeline once: capture, then lock unless the action is
 * CaptureOnly, then either exit or return to Idle. Every transition runs as
 * a slot on the owning thread, so racing requests are serialized by the
 * event loop.
 */
class MonitoringController : public QObject
{
    Q_OBJECT
public:
    enum State {
        Idle = 0,
        Preparing = 1,
        Active = 2
    };
    Q_ENUM(State)

    MonitoringController(InputWatcher* watcher, CaptureService* captureService,
                         LockService* lockService, QObject *parent = nullptr);
    ~MonitoringController();

    ErrorCode arm(int cameraId);
    ErrorCode arm();
    ErrorCode disarm();
    // Hotkey behaviour: arm from Idle, disarm otherwise
    ErrorCode toggle();

    State currentState() const;
    // Null outside Preparing
    QDateTime preparingDeadline() const;
    bool isPipelineRunning() const;
    quint64 currentCycle() const;

    // Changing a setting while Preparing cancels the countdown
    void setCameraId(int cameraId);
    int cameraId() const;
    void setSavePath(const QString& savePath);
    QString savePath() const;
    void setExitOnLock(bool exitOnLock);
    bool exitOnLock() const;
    void setPostTriggerAction(PostTriggerAction action);
    PostTriggerAction postTriggerAction() const;
    void setNotificationsEnabled(bool enabled);
    bool notificationsEnabled() const;

    // Keys of this binding never count as activity
    void setIgnoredShortcut(const ShortcutBinding& binding);

    void setPreparationDelay(int msecs);
    void setCaptureTimeout(int msecs);
    void setLockTimeout(int msecs);

    static QString stateName(State state);

signals:
    // Using int for better signal/slot compatibility
    void stateChanged(int newState, int oldState);
    void triggered(quint64 cycle);
    void exitRequested(int exitCode);
    void notificationRequested(const QString& title, const QString& body);
    void errorOccurred(int code, const QString& message);

private slots:
    void handleCountdownFinished();
    void handleInputEvent(const InputEvent& event);
    void handleListenerFailed(const QString& reason);
    void handleCaptureFinished(quint64 requestId, const QString& filePath);
    void handleCaptureFailed(quint64 requestId, const QString& error);
    void handleCaptureTimeout();
    void handleLockFinished(quint64 requestId, bool success, const QString& error);
    void handleLockTimeout();

private:
    enum PipelineStep {
        NoPipeline,
        Capturing,
        Locking,
        Exiting
    };

    void transitionToState(State newState);
    void cancelPreparation(const QString& reason);
    bool isShortcutKey(const QString& key) const;
    void startPipeline();
    void continueAfterCapture();
    void finishPipeline();
    void notify(const QString& title, const QString& body);
    ErrorCode reportError(ErrorCode code, const QString& message);

    InputWatcher* m_watcher;
    CaptureService* m_captureService;
    LockService* m_lockService;

    State m_state;
    PipelineStep m_step;
    quint64 m_cycle;
    QDateTime m_deadline;

    QTimer m_countdownTimer;
    QTimer m_captureTimer;
    QTimer m_lockTimer;
    QElapsedTimer m_lastToggle;

    int m_cameraId;
    QString m_savePath;
    bool m_exitOnLock;
    PostTriggerAction m_postTriggerAction;
    bool m_notificationsEnabled;
    ShortcutBinding m_ignoredShortcut;
};

#endif // MONITORINGCONTROLLER_H

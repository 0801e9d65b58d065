#include "MonitoringController.h"
#include "../monitors/InputWatcher.h"
#include "../services/CaptureService.h"
#include "../services/LockService.h"
#include "logger/logger.h"

MonitoringController::MonitoringController(InputWatcher* watcher, CaptureService* captureService,
                                           LockService* lockService, QObject *parent)
    : QObject(parent)
    , m_watcher(watcher)
    , m_captureService(captureService)
    , m_lockService(lockService)
    , m_state(Idle)
    , m_step(NoPipeline)
    , m_cycle(0)
    , m_cameraId(0)
    , m_exitOnLock(false)
    , m_postTriggerAction(PostTriggerAction::CaptureAndLock)
    , m_notificationsEnabled(true)
{
    m_countdownTimer.setSingleShot(true);
    m_countdownTimer.setInterval(SnapLockTimings::PreparationDelayMs);
    m_captureTimer.setSingleShot(true);
    m_captureTimer.setInterval(SnapLockTimings::CaptureTimeoutMs);
    m_lockTimer.setSingleShot(true);
    m_lockTimer.setInterval(SnapLockTimings::LockTimeoutMs);

    connect(&m_countdownTimer, &QTimer::timeout, this, &MonitoringController::handleCountdownFinished);
    connect(&m_captureTimer, &QTimer::timeout, this, &MonitoringController::handleCaptureTimeout);
    connect(&m_lockTimer, &QTimer::timeout, this, &MonitoringController::handleLockTimeout);

    connect(m_watcher, &InputWatcher::inputEvent, this, &MonitoringController::handleInputEvent);
    connect(m_watcher, &InputWatcher::listenerFailed, this, &MonitoringController::handleListenerFailed);
    connect(m_captureService, &CaptureService::captureFinished, this, &MonitoringController::handleCaptureFinished);
    connect(m_captureService, &CaptureService::captureFailed, this, &MonitoringController::handleCaptureFailed);
    connect(m_lockService, &LockService::lockFinished, this, &MonitoringController::handleLockFinished);
}

MonitoringController::~MonitoringController()
{
}

ErrorCode MonitoringController::arm(int cameraId)
{
    if (m_state != Idle) {
        return reportError(ErrorCode::InvalidState,
                           QString("Cannot arm while %1").arg(stateName(m_state)));
    }

    setCameraId(cameraId);
    return arm();
}

ErrorCode MonitoringController::arm()
{
    if (m_state != Idle) {
        return reportError(ErrorCode::InvalidState,
                           QString("Cannot arm while %1").arg(stateName(m_state)));
    }

    ++m_cycle;
    m_deadline = QDateTime::currentDateTime().addMSecs(m_countdownTimer.interval());
    m_countdownTimer.start();

    LOG_INFO(QString("Arming cycle %1 with camera %2, active in %3 ms")
                 .arg(m_cycle).arg(m_cameraId).arg(m_countdownTimer.interval()));
    transitionToState(Preparing);
    return ErrorCode::None;
}

ErrorCode MonitoringController::disarm()
{
    if (m_step != NoPipeline) {
        return reportError(ErrorCode::InvalidState, "Cannot disarm while the trigger response is running");
    }

    switch (m_state) {
        case Idle:
            return reportError(ErrorCode::InvalidState, "Cannot disarm while Idle");
        case Preparing:
            cancelPreparation("disarmed");
            return ErrorCode::None;
        case Active:
            m_watcher->unsubscribe();
            LOG_INFO(QString("Cycle %1 disarmed").arg(m_cycle));
            transitionToState(Idle);
            notify("SnapLock disarmed", "Activity monitoring stopped");
            return ErrorCode::None;
    }
    return ErrorCode::InvalidState;
}

ErrorCode MonitoringController::toggle()
{
    m_lastToggle.restart();
    if (m_state == Idle) {
        return arm();
    }
    return disarm();
}

MonitoringController::State MonitoringController::currentState() const
{
    return m_state;
}

QDateTime MonitoringController::preparingDeadline() const
{
    return m_deadline;
}

bool MonitoringController::isPipelineRunning() const
{
    return m_step != NoPipeline;
}

quint64 MonitoringController::currentCycle() const
{
    return m_cycle;
}

void MonitoringController::setCameraId(int cameraId)
{
    if (m_cameraId == cameraId) {
        return;
    }
    m_cameraId = cameraId;
    cancelPreparation("camera changed");
}

int MonitoringController::cameraId() const
{
    return m_cameraId;
}

void MonitoringController::setSavePath(const QString& savePath)
{
    if (m_savePath == savePath) {
        return;
    }
    m_savePath = savePath;
    cancelPreparation("save path changed");
}

QString MonitoringController::savePath() const
{
    return m_savePath;
}

void MonitoringController::setExitOnLock(bool exitOnLock)
{
    if (m_exitOnLock == exitOnLock) {
        return;
    }
    m_exitOnLock = exitOnLock;
    cancelPreparation("exit-on-lock changed");
}

bool MonitoringController::exitOnLock() const
{
    return m_exitOnLock;
}

void MonitoringController::setPostTriggerAction(PostTriggerAction action)
{
    if (m_postTriggerAction == action) {
        return;
    }
    m_postTriggerAction = action;
    cancelPreparation("post-trigger action changed");
}

PostTriggerAction MonitoringController::postTriggerAction() const
{
    return m_postTriggerAction;
}

void MonitoringController::setNotificationsEnabled(bool enabled)
{
    m_notificationsEnabled = enabled;
}

bool MonitoringController::notificationsEnabled() const
{
    return m_notificationsEnabled;
}

void MonitoringController::setIgnoredShortcut(const ShortcutBinding& binding)
{
    m_ignoredShortcut = binding;
}

void MonitoringController::setPreparationDelay(int msecs)
{
    m_countdownTimer.setInterval(msecs);
}

void MonitoringController::setCaptureTimeout(int msecs)
{
    m_captureTimer.setInterval(msecs);
}

void MonitoringController::setLockTimeout(int msecs)
{
    m_lockTimer.setInterval(msecs);
}

QString MonitoringController::stateName(State state)
{
    switch (state) {
        case Idle:      return "Idle";
        case Preparing: return "Preparing";
        case Active:    return "Active";
    }
    return "Unknown";
}

void MonitoringController::handleCountdownFinished()
{
    // A cancelled countdown can not fire, this only guards a late queued timeout
    if (m_state != Preparing) {
        return;
    }

    m_deadline = QDateTime();

    if (!m_watcher->subscribe()) {
        transitionToState(Idle);
        reportError(ErrorCode::ListenerFailure, "Input listener is not available, monitoring not started");
        return;
    }

    LOG_INFO(QString("Cycle %1 active, watching for activity").arg(m_cycle));
    transitionToState(Active);
    notify("SnapLock armed", "Any keyboard or mouse activity will trigger the response");
}

void MonitoringController::handleInputEvent(const InputEvent& event)
{
    if (m_state != Active || m_step != NoPipeline) {
        return;
    }

    if (m_lastToggle.isValid() && m_lastToggle.elapsed() < SnapLockTimings::EventIgnoreWindowMs) {
        LOG_DEBUG(QString("Ignoring event inside ignore window (%1 ms left)")
                      .arg(SnapLockTimings::EventIgnoreWindowMs - m_lastToggle.elapsed()));
        return;
    }

    if (event.source == InputEvent::Keyboard && isShortcutKey(event.key)) {
        LOG_DEBUG("Ignoring shortcut key " + event.key);
        return;
    }

    // Nothing else is delivered for this cycle once unsubscribed
    m_watcher->unsubscribe();

    LOG_INFO(QString("Cycle %1 triggered by %2 activity")
                 .arg(m_cycle)
                 .arg(event.source == InputEvent::Keyboard ? "keyboard" : "mouse"));
    emit triggered(m_cycle);
    notify("SnapLock triggered", "Activity detected while the workstation was armed");

    startPipeline();
}

void MonitoringController::handleListenerFailed(const QString& reason)
{
    if (m_state != Active || m_step != NoPipeline) {
        return;
    }

    transitionToState(Idle);
    reportError(ErrorCode::ListenerFailure, "Monitoring stopped: " + reason);
}

void MonitoringController::startPipeline()
{
    CaptureRequest request;
    request.requestId = m_cycle;
    request.cameraId = m_cameraId;
    request.savePath = m_savePath;

    // Completion may be reported before capture() returns
    m_step = Capturing;
    m_captureTimer.start();
    m_captureService->capture(request);
}

void MonitoringController::handleCaptureFinished(quint64 requestId, const QString& filePath)
{
    if (m_step != Capturing || requestId != m_cycle) {
        LOG_DEBUG(QString("Ignoring stale capture result %1").arg(requestId));
        return;
    }

    m_captureTimer.stop();
    LOG_INFO("Photo captured: " + filePath);
    continueAfterCapture();
}

void MonitoringController::handleCaptureFailed(quint64 requestId, const QString& error)
{
    if (m_step != Capturing || requestId != m_cycle) {
        LOG_DEBUG(QString("Ignoring stale capture failure %1").arg(requestId));
        return;
    }

    m_captureTimer.stop();
    reportError(ErrorCode::CaptureFailure, error);
    continueAfterCapture();
}

void MonitoringController::handleCaptureTimeout()
{
    if (m_step != Capturing) {
        return;
    }

    m_captureService->abort(m_cycle);
    reportError(ErrorCode::CaptureFailure,
                QString("Capture timed out after %1 ms").arg(m_captureTimer.interval()));
    continueAfterCapture();
}

void MonitoringController::continueAfterCapture()
{
    if (m_postTriggerAction == PostTriggerAction::CaptureOnly) {
        LOG_INFO("Capture only, screen is not locked");
        finishPipeline();
        return;
    }

    m_step = Locking;
    m_lockTimer.start();
    m_lockService->lock(m_cycle);
}

void MonitoringController::handleLockFinished(quint64 requestId, bool success, const QString& error)
{
    if (m_step != Locking || requestId != m_cycle) {
        LOG_DEBUG(QString("Ignoring stale lock result %1").arg(requestId));
        return;
    }

    m_lockTimer.stop();
    if (success) {
        LOG_INFO("Screen locked");
    } else {
        reportError(ErrorCode::LockFailure, error);
    }
    finishPipeline();
}

void MonitoringController::handleLockTimeout()
{
    if (m_step != Locking) {
        return;
    }

    m_lockService->abort(m_cycle);
    reportError(ErrorCode::LockFailure,
                QString("Lock did not complete within %1 ms").arg(m_lockTimer.interval()));
    finishPipeline();
}

void MonitoringController::finishPipeline()
{
    if (m_exitOnLock) {
        m_step = Exiting;
        LOG_INFO("Exit on lock enabled, requesting shutdown");
        emit exitRequested(0);
        return;
    }

    m_step = NoPipeline;
    LOG_INFO(QString("Cycle %1 complete").arg(m_cycle));
    transitionToState(Idle);
}

void MonitoringController::transitionToState(State newState)
{
    if (m_state == newState) {
        return;
    }

    State oldState = m_state;
    m_state = newState;
    if (newState != Preparing) {
        m_deadline = QDateTime();
    }

    LOG_DEBUG(QString("Monitoring state %1 -> %2").arg(stateName(oldState), stateName(newState)));
    emit stateChanged(newState, oldState);
}

void MonitoringController::cancelPreparation(const QString& reason)
{
    if (m_state != Preparing) {
        return;
    }

    m_countdownTimer.stop();
    LOG_INFO(QString("Countdown of cycle %1 cancelled: %2").arg(m_cycle).arg(reason));
    transitionToState(Idle);
}

bool MonitoringController::isShortcutKey(const QString& key) const
{
    if (m_ignoredShortcut.key.isEmpty()) {
        return false;
    }

    const QString normalized = ShortcutCodec::normalizeKey(key);
    if (normalized == m_ignoredShortcut.key) {
        return true;
    }

    ShortcutBinding::Modifier modifier = ShortcutCodec::modifierFromToken(normalized);
    return modifier != ShortcutBinding::NoModifier && m_ignoredShortcut.modifiers.testFlag(modifier);
}

void MonitoringController::notify(const QString& title, const QString& body)
{
    if (m_notificationsEnabled) {
        emit notificationRequested(title, body);
    }
}

ErrorCode MonitoringController::reportError(ErrorCode code, const QString& message)
{
    LOG_WARNING(QString("%1: %2").arg(errorCodeToString(code), message));
    emit errorOccurred(static_cast<int>(code), message);
    return code;
}

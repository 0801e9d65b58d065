#include "SnapLockService.h"
#include "../monitors/InputWatcher.h"
#include "../services/CameraCaptureService.h"
#include "../services/ProcessLockService.h"
#include "logger/logger.h"
#include <QCoreApplication>
#include <csignal>

#if defined(Q_OS_WIN)
#include "../monitors/win/WinInputWatcher.h"
#elif defined(Q_OS_LINUX)
#include "../monitors/linux/X11InputWatcher.h"
#endif

// Signal handler for graceful shutdown
void signalHandler(int signal)
{
    LOG_INFO(QString("Received signal: %1").arg(signal));
    QCoreApplication::quit();
}

SnapLockService::SnapLockService(QObject *parent)
    : QObject(parent)
    , m_inputWatcher(nullptr)
    , m_captureService(nullptr)
    , m_lockService(nullptr)
    , m_configManager(nullptr)
    , m_shortcutManager(nullptr)
    , m_controller(nullptr)
    , m_initialized(false)
    , m_isRunning(false)
    , m_cameraId(0)
    , m_exitOnLock(false)
    , m_postTriggerAction(PostTriggerAction::CaptureAndLock)
    , m_showDebugLogs(false)
    , m_saveLogsToFile(false)
    , m_enableNotifications(true)
{
    setupSignalHandlers();

    connect(Logger::instance(), &Logger::entryLogged, this, &SnapLockService::logEntry);
}

SnapLockService::~SnapLockService()
{
    if (m_isRunning) {
        stop();
    }
}

bool SnapLockService::initialize()
{
    InputWatcher* watcher = nullptr;
#if defined(Q_OS_WIN)
    watcher = new WinInputWatcher();
#elif defined(Q_OS_LINUX)
    watcher = new X11InputWatcher();
#endif

    if (!watcher) {
        LOG_ERROR("Global input monitoring is not supported on this platform");
        return false;
    }

    return initialize(watcher, new CameraCaptureService(), new ProcessLockService());
}

bool SnapLockService::initialize(InputWatcher* watcher, CaptureService* captureService, LockService* lockService)
{
    if (m_initialized) {
        LOG_WARNING("SnapLockService already initialized");
        return true;
    }

    LOG_INFO("Initializing SnapLockService");

    m_inputWatcher = watcher;
    m_captureService = captureService;
    m_lockService = lockService;
    m_inputWatcher->setParent(this);
    m_captureService->setParent(this);
    m_lockService->setParent(this);

    m_configManager = new ConfigManager(this);
    if (!m_configManager->initialize()) {
        LOG_ERROR("Failed to initialize ConfigManager");
        return false;
    }

    if (!loadConfig()) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    if (!m_inputWatcher->initialize()) {
        LOG_ERROR("Failed to initialize input watcher");
        return false;
    }

    m_shortcutManager = new ShortcutManager(m_inputWatcher, this);
    m_shortcutManager->setConfigManager(m_configManager);

    m_controller = new MonitoringController(m_inputWatcher, m_captureService, m_lockService, this);
    applySettingsToController();

    connect(m_controller, &MonitoringController::stateChanged,
            this, &SnapLockService::onStateChanged);
    connect(m_controller, &MonitoringController::errorOccurred,
            this, &SnapLockService::errorOccurred);
    connect(m_controller, &MonitoringController::notificationRequested,
            this, &SnapLockService::notificationRequested);
    connect(m_controller, &MonitoringController::exitRequested,
            this, &SnapLockService::exitRequested);

    connect(m_shortcutManager, &ShortcutManager::hotkeyActivated,
            this, &SnapLockService::onHotkeyActivated);
    connect(m_shortcutManager, &ShortcutManager::shortcutChanged,
            this, &SnapLockService::onShortcutChanged);
    connect(m_shortcutManager, &ShortcutManager::errorOccurred,
            this, &SnapLockService::errorOccurred);

    m_initialized = true;
    LOG_INFO("SnapLockService initialized successfully");
    return true;
}

bool SnapLockService::start()
{
    if (m_isRunning) {
        LOG_WARNING("SnapLockService is already running");
        return true;
    }

    if (!m_initialized) {
        LOG_ERROR("SnapLockService not initialized");
        return false;
    }

    LOG_INFO("Starting SnapLockService");

    if (!m_inputWatcher->start()) {
        LOG_ERROR("Failed to start input watcher");
        return false;
    }

    // A missing hotkey is reported but arm() keeps working
    m_shortcutManager->registerInitialShortcut(m_configManager->shortcut());

    m_isRunning = true;
    LOG_INFO(QString("SnapLockService started successfully (shortcut: %1)").arg(currentShortcut()));
    return true;
}

bool SnapLockService::stop()
{
    if (!m_isRunning) {
        LOG_WARNING("SnapLockService is not running");
        return true;
    }

    LOG_INFO("Stopping SnapLockService");

    if (m_controller->currentState() != MonitoringController::Idle && !m_controller->isPipelineRunning()) {
        m_controller->disarm();
    }

    if (m_shortcutManager->state() == ShortcutManager::Capturing) {
        m_shortcutManager->cancelCapture();
    }
    m_shortcutManager->releaseShortcut();
    m_inputWatcher->stop();

    m_isRunning = false;
    LOG_INFO("SnapLockService stopped successfully");
    return true;
}

bool SnapLockService::isRunning() const
{
    return m_isRunning;
}

ErrorCode SnapLockService::arm(int cameraId)
{
    if (m_controller->currentState() != MonitoringController::Idle) {
        return m_controller->arm(cameraId);
    }

    // The camera used for arming becomes the configured one
    if (!setCameraId(cameraId)) {
        LOG_WARNING(QString("Camera %1 could not be saved, arming with it anyway").arg(cameraId));
    }
    return m_controller->arm(cameraId);
}

ErrorCode SnapLockService::arm()
{
    return m_controller->arm();
}

ErrorCode SnapLockService::disarm()
{
    return m_controller->disarm();
}

MonitoringController::State SnapLockService::monitoringState() const
{
    return m_controller->currentState();
}

template <typename T>
bool SnapLockService::commitSetting(Draft<T>& draft, const T& value, const QString& name,
                                    const std::function<void(const T&)>& store,
                                    const std::function<T()>& load)
{
    draft.setCandidate(value);
    if (!draft.isDirty()) {
        return true;
    }

    const T previous = draft.original();
    bool committed = draft.commit([&](const T& candidate) {
        store(candidate);
        if (!(load() == candidate)) {
            LOG_WARNING(name + " rejected by configuration");
            return false;
        }
        if (!m_configManager->saveLocalConfig()) {
            store(previous);
            return false;
        }
        return true;
    });

    if (!committed) {
        LOG_WARNING(name + " unchanged, configuration could not be saved");
    }
    return committed;
}

bool SnapLockService::setCameraId(int cameraId)
{
    bool ok = commitSetting<int>(m_cameraId, cameraId, "Camera id",
        [this](const int& value) { m_configManager->setCameraId(value); },
        [this]() { return m_configManager->cameraId(); });
    if (ok) {
        m_controller->setCameraId(m_cameraId.original());
    }
    return ok;
}

bool SnapLockService::setSavePath(const QString& savePath)
{
    bool ok = commitSetting<QString>(m_savePath, savePath, "Save path",
        [this](const QString& value) { m_configManager->setSavePath(value); },
        [this]() { return m_configManager->savePath(); });
    if (ok) {
        m_controller->setSavePath(m_savePath.original());
        if (m_saveLogsToFile.original()) {
            // The log file lives under the save path
            m_configManager->applyLogSettings();
        }
    }
    return ok;
}

bool SnapLockService::setExitOnLock(bool exitOnLock)
{
    bool ok = commitSetting<bool>(m_exitOnLock, exitOnLock, "Exit on lock",
        [this](const bool& value) { m_configManager->setExitOnLock(value); },
        [this]() { return m_configManager->exitOnLock(); });
    if (ok) {
        m_controller->setExitOnLock(m_exitOnLock.original());
    }
    return ok;
}

bool SnapLockService::setPostTriggerAction(PostTriggerAction action)
{
    bool ok = commitSetting<PostTriggerAction>(m_postTriggerAction, action, "Post-trigger action",
        [this](const PostTriggerAction& value) { m_configManager->setPostTriggerAction(value); },
        [this]() { return m_configManager->postTriggerAction(); });
    if (ok) {
        m_controller->setPostTriggerAction(m_postTriggerAction.original());
    }
    return ok;
}

bool SnapLockService::setShowDebugLogs(bool show)
{
    bool ok = commitSetting<bool>(m_showDebugLogs, show, "Show debug logs",
        [this](const bool& value) { m_configManager->setShowDebugLogs(value); },
        [this]() { return m_configManager->showDebugLogs(); });
    if (ok) {
        m_configManager->applyLogSettings();
    }
    return ok;
}

bool SnapLockService::setSaveLogsToFile(bool save)
{
    bool ok = commitSetting<bool>(m_saveLogsToFile, save, "Save logs to file",
        [this](const bool& value) { m_configManager->setSaveLogsToFile(value); },
        [this]() { return m_configManager->saveLogsToFile(); });
    if (ok) {
        m_configManager->applyLogSettings();
    }
    return ok;
}

bool SnapLockService::setEnableNotifications(bool enable)
{
    bool ok = commitSetting<bool>(m_enableNotifications, enable, "Notifications",
        [this](const bool& value) { m_configManager->setEnableNotifications(value); },
        [this]() { return m_configManager->enableNotifications(); });
    if (ok) {
        m_controller->setNotificationsEnabled(m_enableNotifications.original());
    }
    return ok;
}

ErrorCode SnapLockService::startShortcutCapture()
{
    return m_shortcutManager->startCapture();
}

ErrorCode SnapLockService::cancelShortcutCapture()
{
    return m_shortcutManager->cancelCapture();
}

ErrorCode SnapLockService::feedShortcutKey(const KeyEvent& event)
{
    return m_shortcutManager->feedKeyEvent(event);
}

ErrorCode SnapLockService::setShortcut(const QString& shortcut)
{
    return m_shortcutManager->setShortcut(shortcut);
}

QString SnapLockService::currentShortcut() const
{
    return m_shortcutManager->currentShortcutText();
}

ConfigManager* SnapLockService::configManager() const
{
    return m_configManager;
}

MonitoringController* SnapLockService::monitoringController() const
{
    return m_controller;
}

ShortcutManager* SnapLockService::shortcutManager() const
{
    return m_shortcutManager;
}

void SnapLockService::onStateChanged(int newState, int oldState)
{
    LOG_INFO(QString("Monitoring status changed: %1 -> %2")
                 .arg(MonitoringController::stateName(static_cast<MonitoringController::State>(oldState)),
                      MonitoringController::stateName(static_cast<MonitoringController::State>(newState))));
    emit monitoringStatusChanged(newState);
}

void SnapLockService::onHotkeyActivated()
{
    // Errors are reported through the controller's errorOccurred
    m_controller->toggle();
}

void SnapLockService::onShortcutChanged(const QString& shortcut)
{
    ShortcutBinding binding;
    if (ShortcutCodec::parse(shortcut, binding)) {
        m_controller->setIgnoredShortcut(binding);
    }
}

bool SnapLockService::loadConfig()
{
    LOG_INFO("Loading configuration");

    if (!m_configManager) {
        LOG_ERROR("Config manager not initialized");
        return false;
    }

    if (!m_configManager->loadLocalConfig()) {
        LOG_WARNING("Failed to load configuration file, using defaults");
    }

    m_cameraId.reset(m_configManager->cameraId());
    m_savePath.reset(m_configManager->savePath());
    m_exitOnLock.reset(m_configManager->exitOnLock());
    m_postTriggerAction.reset(m_configManager->postTriggerAction());
    m_showDebugLogs.reset(m_configManager->showDebugLogs());
    m_saveLogsToFile.reset(m_configManager->saveLogsToFile());
    m_enableNotifications.reset(m_configManager->enableNotifications());

    LOG_INFO(QString("Loaded configuration: camera %1, action %2, exit on lock: %3, save path: %4")
                .arg(m_cameraId.original())
                .arg(postTriggerActionToString(m_postTriggerAction.original()))
                .arg(m_exitOnLock.original() ? "Yes" : "No")
                .arg(m_configManager->effectiveSavePath()));

    return true;
}

void SnapLockService::applySettingsToController()
{
    m_controller->setCameraId(m_cameraId.original());
    m_controller->setSavePath(m_savePath.original());
    m_controller->setExitOnLock(m_exitOnLock.original());
    m_controller->setPostTriggerAction(m_postTriggerAction.original());
    m_controller->setNotificationsEnabled(m_enableNotifications.original());
}

void SnapLockService::setupSignalHandlers()
{
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifndef _WIN32
    std::signal(SIGHUP, signalHandler);
#endif
}

#include "ConfigManager.h"
#include "logger/logger.h"
#include <QDir>
#include <QStandardPaths>
#include <QFileInfo>
#include <QFile>

const QString ConfigManager::DefaultShortcut = "Alt+L";

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
    , m_settings(nullptr)
    , m_initialized(false)
{
    loadDefaults();
}

ConfigManager::~ConfigManager()
{
    delete m_settings;
}

bool ConfigManager::initialize()
{
    if (m_initialized) {
        LOG_WARNING("ConfigManager already initialized");
        return true;
    }

    LOG_INFO("Initializing ConfigManager");

    QString configPath = configFilePath();
    LOG_INFO("Config file path: " + configPath);

    // Ensure the directory exists
    QFileInfo fileInfo(configPath);
    QDir dir = fileInfo.dir();
    if (!dir.exists()) {
        LOG_INFO("Creating config directory: " + dir.path());
        if (!dir.mkpath(".")) {
            LOG_ERROR("Failed to create config directory");
            return false;
        }
    }

    m_settings = new QSettings(configPath, QSettings::IniFormat);

    if (m_settings->status() != QSettings::NoError) {
        LOG_ERROR("Error initializing QSettings: " + QString::number(m_settings->status()));
        return false;
    }

    m_initialized = true;
    return true;
}

void ConfigManager::loadDefaults()
{
    m_shortcut = DefaultShortcut;
    m_savePath = "";                // desktop
    m_exitOnLock = false;
    m_postTriggerAction = PostTriggerAction::CaptureAndLock;
    m_cameraId = 0;
    m_showDebugLogs = false;
    m_saveLogsToFile = false;
    m_enableNotifications = true;
}

QString ConfigManager::configFilePath() const
{
    QString configDir = qEnvironmentVariable("SNAPLOCK_CONFIG_DIR");
    if (configDir.isEmpty()) {
        configDir = QDir::tempPath();
    }
    return QDir(configDir).filePath("snaplock_config.ini");
}

bool ConfigManager::configFileExists() const
{
    if (!m_settings) {
        LOG_ERROR("Settings object not initialized");
        return false;
    }

    QString path = m_settings->fileName();
    if (!QFile::exists(path)) {
        return false;
    }

    // An empty file counts as missing
    return QFileInfo(path).size() > 0;
}

bool ConfigManager::loadLocalConfig()
{
    LOG_INFO("Loading local configuration");

    if (!m_initialized) {
        LOG_ERROR("ConfigManager not initialized");
        return false;
    }

    if (configFileExists()) {
        LOG_INFO("Configuration file found: " + m_settings->fileName());
        LOG_DEBUG("Config contains " + QString::number(m_settings->allKeys().size()) + " keys");
    } else {
        LOG_INFO("Configuration file not found, will use defaults");
        applyLogSettings();
        return saveLocalConfig();
    }

    {
        QMutexLocker locker(&m_mutex);

        m_settings->sync();
        m_shortcut = m_settings->value("Shortcut", m_shortcut).toString();
        m_savePath = m_settings->value("SavePath", m_savePath).toString();
        m_exitOnLock = m_settings->value("ExitOnLock", m_exitOnLock).toBool();
        const QString action = m_settings->value("PostTriggerAction",
                                                 postTriggerActionToString(m_postTriggerAction)).toString();
        m_cameraId = m_settings->value("CameraId", m_cameraId).toInt();
        m_showDebugLogs = m_settings->value("ShowDebugLogs", m_showDebugLogs).toBool();
        m_saveLogsToFile = m_settings->value("SaveLogsToFile", m_saveLogsToFile).toBool();
        m_enableNotifications = m_settings->value("EnableNotifications", m_enableNotifications).toBool();

        // Validate and correct settings
        if (!ShortcutCodec::validate(m_shortcut)) {
            LOG_WARNING("Invalid Shortcut corrected from '" + m_shortcut + "' to " + DefaultShortcut);
            m_shortcut = DefaultShortcut;
        } else {
            ShortcutBinding binding;
            ShortcutCodec::parse(m_shortcut, binding);
            m_shortcut = binding.toString();
        }

        bool actionOk = false;
        m_postTriggerAction = postTriggerActionFromString(action, &actionOk);
        if (!actionOk) {
            LOG_WARNING("Invalid PostTriggerAction corrected from '" + action + "' to CaptureAndLock");
        }

        if (m_cameraId < 0) {
            LOG_WARNING("Invalid CameraId corrected from " + QString::number(m_cameraId) + " to 0");
            m_cameraId = 0;
        }
    }

    applyLogSettings();

    LOG_INFO("Local configuration loaded successfully");
    return true;
}

bool ConfigManager::saveLocalConfig()
{
    if (!m_initialized) {
        LOG_ERROR("ConfigManager not initialized");
        return false;
    }

    if (!m_settings) {
        LOG_ERROR("Settings object not initialized");
        return false;
    }

    LOG_DEBUG("Saving configuration to: " + m_settings->fileName());

    {
        QMutexLocker locker(&m_mutex);

        m_settings->setValue("Shortcut", m_shortcut);
        m_settings->setValue("SavePath", m_savePath);
        m_settings->setValue("ExitOnLock", m_exitOnLock);
        m_settings->setValue("PostTriggerAction", postTriggerActionToString(m_postTriggerAction));
        m_settings->setValue("CameraId", m_cameraId);
        m_settings->setValue("ShowDebugLogs", m_showDebugLogs);
        m_settings->setValue("SaveLogsToFile", m_saveLogsToFile);
        m_settings->setValue("EnableNotifications", m_enableNotifications);

        // Ensure settings are written to disk
        m_settings->sync();
    }

    QSettings::Status status = m_settings->status();
    if (status != QSettings::NoError) {
        LOG_ERROR("Failed to save configuration, error code: " + QString::number(status));
        return false;
    }

    LOG_DEBUG("Configuration saved successfully");
    return true;
}

void ConfigManager::applyLogSettings()
{
    bool debugLogs = false;
    bool logsToFile = false;
    {
        QMutexLocker locker(&m_mutex);
        debugLogs = m_showDebugLogs;
        logsToFile = m_saveLogsToFile;
    }

    Logger::instance()->setLogLevel(debugLogs ? Logger::Debug : Logger::Info);

    if (logsToFile) {
        QString logPath = QDir(effectiveSavePath()).filePath("snaplock_debug.log");
        if (!Logger::instance()->setLogFile(logPath)) {
            LOG_WARNING("Cannot write log file " + logPath);
        }
    } else if (Logger::instance()->isFileOutputEnabled()) {
        Logger::instance()->disableFileOutput();
    }
}

QString ConfigManager::shortcut() const
{
    QMutexLocker locker(&m_mutex);
    return m_shortcut;
}

QString ConfigManager::savePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_savePath;
}

bool ConfigManager::exitOnLock() const
{
    QMutexLocker locker(&m_mutex);
    return m_exitOnLock;
}

PostTriggerAction ConfigManager::postTriggerAction() const
{
    QMutexLocker locker(&m_mutex);
    return m_postTriggerAction;
}

int ConfigManager::cameraId() const
{
    QMutexLocker locker(&m_mutex);
    return m_cameraId;
}

bool ConfigManager::showDebugLogs() const
{
    QMutexLocker locker(&m_mutex);
    return m_showDebugLogs;
}

bool ConfigManager::saveLogsToFile() const
{
    QMutexLocker locker(&m_mutex);
    return m_saveLogsToFile;
}

bool ConfigManager::enableNotifications() const
{
    QMutexLocker locker(&m_mutex);
    return m_enableNotifications;
}

QString ConfigManager::effectiveSavePath() const
{
    QString path = savePath();
    if (path.isEmpty()) {
        return QStandardPaths::writableLocation(QStandardPaths::DesktopLocation);
    }
    return path;
}

void ConfigManager::setShortcut(const QString &shortcut)
{
    ShortcutBinding binding;
    if (!ShortcutCodec::parse(shortcut, binding)) {
        LOG_WARNING("Rejected invalid shortcut: " + shortcut);
        return;
    }

    const QString normalized = binding.toString();
    {
        QMutexLocker locker(&m_mutex);
        if (m_shortcut == normalized) {
            return;
        }
        m_shortcut = normalized;
    }
    emit configChanged();
}

void ConfigManager::setSavePath(const QString &path)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_savePath == path) {
            return;
        }
        m_savePath = path;
    }
    emit configChanged();
}

void ConfigManager::setExitOnLock(bool exitOnLock)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_exitOnLock == exitOnLock) {
            return;
        }
        m_exitOnLock = exitOnLock;
    }
    emit configChanged();
}

void ConfigManager::setPostTriggerAction(PostTriggerAction action)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_postTriggerAction == action) {
            return;
        }
        m_postTriggerAction = action;
    }
    emit configChanged();
}

void ConfigManager::setCameraId(int cameraId)
{
    if (cameraId < 0) {
        LOG_WARNING("Rejected negative camera id " + QString::number(cameraId));
        return;
    }

    {
        QMutexLocker locker(&m_mutex);
        if (m_cameraId == cameraId) {
            return;
        }
        m_cameraId = cameraId;
    }
    emit configChanged();
}

void ConfigManager::setShowDebugLogs(bool show)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_showDebugLogs == show) {
            return;
        }
        m_showDebugLogs = show;
    }
    emit configChanged();
}

void ConfigManager::setSaveLogsToFile(bool save)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_saveLogsToFile == save) {
            return;
        }
        m_saveLogsToFile = save;
    }
    emit configChanged();
}

void ConfigManager::setEnableNotifications(bool enable)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_enableNotifications == enable) {
            return;
        }
        m_enableNotifications = enable;
    }
    emit configChanged();
}

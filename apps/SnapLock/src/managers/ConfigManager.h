#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QString>
#include <QSettings>
#include <QMutex>
#include "../core/CoreTypes.h"

class ConfigManager : public QObject
{
    Q_OBJECT
public:
    explicit ConfigManager(QObject *parent = nullptr);
    ~ConfigManager();

    bool initialize();

    // Getters
    QString shortcut() const;
    QString savePath() const;
    bool exitOnLock() const;
    PostTriggerAction postTriggerAction() const;
    int cameraId() const;
    bool showDebugLogs() const;
    bool saveLogsToFile() const;
    bool enableNotifications() const;

    // Save path with the empty default resolved to the desktop
    QString effectiveSavePath() const;

    // Setters, invalid values are rejected and leave the setting unchanged
    void setShortcut(const QString &shortcut);
    void setSavePath(const QString &path);
    void setExitOnLock(bool exitOnLock);
    void setPostTriggerAction(PostTriggerAction action);
    void setCameraId(int cameraId);
    void setShowDebugLogs(bool show);
    void setSaveLogsToFile(bool save);
    void setEnableNotifications(bool enable);

    // Configuration operations
    bool loadLocalConfig();
    bool saveLocalConfig();

    // Pushes ShowDebugLogs / SaveLogsToFile to the Logger
    void applyLogSettings();

    QString configFilePath() const;

    static const QString DefaultShortcut;

signals:
    void configChanged();

private:
    // Helper methods
    void loadDefaults();
    bool configFileExists() const;

    QSettings* m_settings;
    mutable QMutex m_mutex;

    QString m_shortcut;
    QString m_savePath;
    bool m_exitOnLock;
    PostTriggerAction m_postTriggerAction;
    int m_cameraId;
    bool m_showDebugLogs;
    bool m_saveLogsToFile;
    bool m_enableNotifications;
    bool m_initialized;
};

#endif // CONFIGMANAGER_H

#ifndef SHORTCUTMANAGER_H
#define SHORTCUTMANAGER_H

#include <QObject>
#include <QElapsedTimer>
#include "CoreTypes.h"
#include "Draft.h"

class InputWatcher;
class ConfigManager;

/**
 * Owns the global hotkey and the interactive rebinding session.
 *
 * At most one hotkey handle is registered with the InputWatcher at any time.
 * While capturing, none is: keys typed to choose a new binding must not fire
 * the old one. Leaving the capture state always re-registers a binding,
 * either the new one or the one that was active before.
 */
class ShortcutManager : public QObject
{
    Q_OBJECT
public:
    enum State {
        Idle,
        Capturing
    };
    Q_ENUM(State)

    explicit ShortcutManager(InputWatcher* watcher, QObject *parent = nullptr);
    ~ShortcutManager();

    // Optional, new bindings are persisted through it when set
    void setConfigManager(ConfigManager* configManager);

    // Registers text, or the first fallback the OS accepts
    ErrorCode registerInitialShortcut(const QString& text);
    void releaseShortcut();

    ErrorCode startCapture();
    ErrorCode feedKeyEvent(const KeyEvent& event);
    ErrorCode cancelCapture();

    // Rebinds without a capture session
    ErrorCode setShortcut(const QString& text);

    ShortcutBinding currentShortcut() const;
    QString currentShortcutText() const;
    HotkeyHandle currentHandle() const;
    State state() const;

    static QStringList fallbackShortcuts();

signals:
    void stateChanged(int state);
    void shortcutChanged(const QString& shortcut);
    void hotkeyActivated();
    void captureProgress(const QString& partial);
    void errorOccurred(int code, const QString& message);

private slots:
    void handleHotkeyPressed(int handle);

private:
    void setState(State state);
    bool registerCandidate();
    void restorePrevious();
    void persist(const ShortcutBinding& binding);
    ErrorCode reportError(ErrorCode code, const QString& message);

    InputWatcher* m_watcher;
    ConfigManager* m_configManager;
    State m_state;
    Draft<ShortcutBinding> m_binding;
    HotkeyHandle m_handle;
    ShortcutBinding::Modifiers m_accumulated;
    QElapsedTimer m_lastActivation;
};

#endif // SHORTCUTMANAGER_H

#ifndef INPUTWATCHER_H
#define INPUTWATCHER_H

#include <QObject>
#include "../core/CoreTypes.h"

/**
 * Process-wide listener for keyboard/mouse activity plus the one global
 * hotkey the application owns.
 *
 * Platform subclasses hand raw activity to publishInputEvent() and
 * publishHotkey() through queued calls, whether their listener runs on a
 * worker thread (X11) or inside OS hook callbacks (Windows). Subscription
 * state is only read on this object's thread, so once unsubscribe()
 * returns no further inputEvent() is emitted.
 */
class InputWatcher : public QObject
{
    Q_OBJECT
public:
    explicit InputWatcher(QObject *parent = nullptr);
    virtual ~InputWatcher();

    virtual bool initialize() = 0;
    virtual bool start() = 0;
    virtual bool stop() = 0;
    virtual bool isRunning() const = 0;

    // Fails when the listener is not running
    bool subscribe();
    void unsubscribe();
    bool isSubscribed() const;

    // Registering the binding that is already active returns its handle.
    // A different binding while one is active is refused: the caller has
    // to unregister first.
    HotkeyHandle registerHotkey(const ShortcutBinding& binding);
    // Unknown or already released handles are ignored
    bool unregisterHotkey(HotkeyHandle handle);

    HotkeyHandle activeHotkey() const;
    ShortcutBinding activeHotkeyBinding() const;

signals:
    void inputEvent(const InputEvent& event);
    void hotkeyPressed(int handle);
    void listenerFailed(const QString& reason);

protected slots:
    void publishInputEvent(const InputEvent& event);
    void publishHotkey(int handle);
    void publishListenerFailure(const QString& reason);

protected:
    virtual bool grabHotkey(HotkeyHandle handle, const ShortcutBinding& binding) = 0;
    virtual void releaseHotkey(HotkeyHandle handle) = 0;
    // Called when subscription starts or ends so listeners can stop
    // producing activity nobody reads
    virtual void watchActivity(bool enabled);

private:
    bool m_subscribed;
    HotkeyHandle m_activeHandle;
    ShortcutBinding m_activeBinding;
    HotkeyHandle m_nextHandle;
};

#endif // INPUTWATCHER_H

#ifndef X11INPUTWATCHER_H
#define X11INPUTWATCHER_H

#include "../InputWatcher.h"
#include <QThread>
#include <QTimer>
#include <QHash>

struct _XDisplay;

// Lives on the listener thread and owns the X connection used there.
// Activity comes from XInput2 raw events, which report every key, button,
// wheel and motion event whatever window has focus.
class X11EventPoller : public QObject
{
    Q_OBJECT
public:
    enum Activity {
        NoActivity,
        KeyActivity,
        PointerActivity
    };

    explicit X11EventPoller(QObject *parent = nullptr);
    ~X11EventPoller() override;

    bool open();
    void close();

    // Raw events are only selected while watching
    void setWatching(bool watching);
    bool isWatching() const;

    bool grab(int handle, const QString& keyName, int modifiers);
    void release(int handle);

    static Activity activityForRawEvent(int evtype);
    // NoSymbol (0) when the key has no keysym
    static unsigned long keysymForKey(const QString& keyName);

signals:
    void keyActivity(const QString& key);
    void pointerActivity();
    void hotkeyActivated(int handle);

private slots:
    void poll();

private:
    struct Grab {
        int keycode;
        unsigned int mask;
    };

    QString keyNameForKeycode(int keycode) const;
    static unsigned int cleanMask(unsigned int mask);
    static unsigned int maskForModifiers(int modifiers);
    void ungrab(const Grab& grab);

    _XDisplay* m_display;
    unsigned long m_root;
    int m_xiOpcode;
    bool m_watching;
    QTimer* m_pollTimer;
    QHash<int, Grab> m_grabs;
};

class X11InputWatcher : public InputWatcher
{
    Q_OBJECT
public:
    explicit X11InputWatcher(QObject *parent = nullptr);
    ~X11InputWatcher() override;

    bool initialize() override;
    bool start() override;
    bool stop() override;
    bool isRunning() const override;

protected:
    bool grabHotkey(HotkeyHandle handle, const ShortcutBinding& binding) override;
    void releaseHotkey(HotkeyHandle handle) override;
    void watchActivity(bool enabled) override;

private:
    QThread m_thread;
    X11EventPoller* m_poller;
    bool m_isRunning;
};

#endif // X11INPUTWATCHER_H

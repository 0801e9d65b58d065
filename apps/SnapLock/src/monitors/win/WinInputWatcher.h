// WinInputWatcher.h
#ifndef WININPUTWATCHER_H
#define WININPUTWATCHER_H

#include "../InputWatcher.h"
#include <QAbstractNativeEventFilter>
#include <Windows.h>

class WinInputWatcher : public InputWatcher, public QAbstractNativeEventFilter
{
    Q_OBJECT
public:
    explicit WinInputWatcher(QObject *parent = nullptr);
    ~WinInputWatcher() override;

    bool initialize() override;
    bool start() override;
    bool stop() override;
    bool isRunning() const override;

    bool nativeEventFilter(const QByteArray &eventType, void *message, qintptr *result) override;

    // Hook messages that count as user activity, releases included
    static bool isKeyboardActivityMessage(WPARAM message);
    static bool isMouseActivityMessage(WPARAM message);
    static UINT virtualKeyForKeyName(const QString& keyName);

protected:
    bool grabHotkey(HotkeyHandle handle, const ShortcutBinding& binding) override;
    void releaseHotkey(HotkeyHandle handle) override;
    void watchActivity(bool enabled) override;

private:
    static LRESULT CALLBACK LowLevelKeyboardProc(int nCode, WPARAM wParam, LPARAM lParam);
    static LRESULT CALLBACK LowLevelMouseProc(int nCode, WPARAM wParam, LPARAM lParam);

    static QString keyNameForVirtualKey(DWORD vkCode);

    static WinInputWatcher* s_instance;
    HHOOK m_keyboardHook;
    HHOOK m_mouseHook;
    bool m_isRunning;
    bool m_watching;
};

#endif // WININPUTWATCHER_H

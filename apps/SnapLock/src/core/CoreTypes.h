#ifndef CORETYPES_H
#define CORETYPES_H

#include <QString>
#include <QMetaType>
#include "ShortcutCodec.h"

// Default timings, the controller ones can be overridden for tests
namespace SnapLockTimings {
    constexpr int PreparationDelayMs = 2000;     // countdown between arm and Active
    constexpr int ShortcutDebounceMs = 500;      // hotkey presses closer than this are ignored
    constexpr int EventIgnoreWindowMs = 500;     // activity right after a toggle is not a trigger
    constexpr int CaptureTimeoutMs = 5000;
    constexpr int LockTimeoutMs = 5000;
    // Total time the lock commands may take, kill included
    constexpr int LockCommandBudgetMs = 4000;
}

static_assert(SnapLockTimings::LockCommandBudgetMs < SnapLockTimings::LockTimeoutMs,
              "lock commands must give up before the controller does");

enum class ErrorCode {
    None = 0,
    InvalidState,               // illegal transition, nothing changed
    InvalidShortcut,            // candidate failed ShortcutCodec::validate
    CaptureFailure,             // camera unavailable or write failed
    LockFailure,                // lock command failed or timed out
    HotkeyRegistrationFailure,  // OS refused the global hotkey
    ListenerFailure             // input listener could not watch for activity
};

QString errorCodeToString(ErrorCode code);

enum class PostTriggerAction {
    CaptureAndLock = 0,
    CaptureOnly = 1
};

QString postTriggerActionToString(PostTriggerAction action);
// Unknown text yields CaptureAndLock and sets *ok to false
PostTriggerAction postTriggerActionFromString(const QString& text, bool* ok = nullptr);

struct CaptureRequest
{
    quint64 requestId = 0;
    int cameraId = 0;
    QString savePath;   // directory, empty for the desktop
};

// Key press as seen by the shortcut capture dialog
struct KeyEvent
{
    ShortcutBinding::Modifiers modifiers;
    QString key;    // may itself be a modifier name while only modifiers are held
};

// Any keyboard or mouse activity seen by the InputWatcher
struct InputEvent
{
    enum Source {
        Keyboard,
        Mouse
    };

    Source source = Keyboard;
    QString key;            // normalized key name for keyboard events
    qint64 timestamp = 0;   // ms since epoch

    static InputEvent keyboard(const QString& key);
    static InputEvent mouse();
};

using HotkeyHandle = int;
constexpr HotkeyHandle InvalidHotkeyHandle = 0;

Q_DECLARE_METATYPE(CaptureRequest)
Q_DECLARE_METATYPE(KeyEvent)
Q_DECLARE_METATYPE(InputEvent)

#endif // CORETYPES_H

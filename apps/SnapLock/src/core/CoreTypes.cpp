#include "CoreTypes.h"
#include <QDateTime>

QString errorCodeToString(ErrorCode code)
{
    switch (code) {
        case ErrorCode::None:                      return "None";
        case ErrorCode::InvalidState:              return "InvalidState";
        case ErrorCode::InvalidShortcut:           return "InvalidShortcut";
        case ErrorCode::CaptureFailure:            return "CaptureFailure";
        case ErrorCode::LockFailure:               return "LockFailure";
        case ErrorCode::HotkeyRegistrationFailure: return "HotkeyRegistrationFailure";
        case ErrorCode::ListenerFailure:           return "ListenerFailure";
    }
    return "Unknown";
}

QString postTriggerActionToString(PostTriggerAction action)
{
    switch (action) {
        case PostTriggerAction::CaptureAndLock: return "CaptureAndLock";
        case PostTriggerAction::CaptureOnly:    return "CaptureOnly";
    }
    return "CaptureAndLock";
}

PostTriggerAction postTriggerActionFromString(const QString& text, bool* ok)
{
    const QString value = text.trimmed();
    if (ok) {
        *ok = true;
    }
    if (value.compare("CaptureOnly", Qt::CaseInsensitive) == 0) {
        return PostTriggerAction::CaptureOnly;
    }
    if (value.compare("CaptureAndLock", Qt::CaseInsensitive) == 0) {
        return PostTriggerAction::CaptureAndLock;
    }
    if (ok) {
        *ok = false;
    }
    return PostTriggerAction::CaptureAndLock;
}

InputEvent InputEvent::keyboard(const QString& key)
{
    InputEvent event;
    event.source = Keyboard;
    event.key = key;
    event.timestamp = QDateTime::currentMSecsSinceEpoch();
    return event;
}

InputEvent InputEvent::mouse()
{
    InputEvent event;
    event.source = Mouse;
    event.timestamp = QDateTime::currentMSecsSinceEpoch();
    return event;
}

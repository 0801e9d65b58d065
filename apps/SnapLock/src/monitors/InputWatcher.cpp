#include "InputWatcher.h"
#include "logger/logger.h"

InputWatcher::InputWatcher(QObject *parent)
    : QObject(parent)
    , m_subscribed(false)
    , m_activeHandle(InvalidHotkeyHandle)
    , m_nextHandle(1)
{
    qRegisterMetaType<InputEvent>("InputEvent");
    qRegisterMetaType<ShortcutBinding>("ShortcutBinding");
}

InputWatcher::~InputWatcher()
{
}

bool InputWatcher::subscribe()
{
    if (!isRunning()) {
        LOG_ERROR("Cannot subscribe, input listener is not running");
        return false;
    }

    if (!m_subscribed) {
        m_subscribed = true;
        watchActivity(true);
        LOG_DEBUG("Input events subscribed");
    }
    return true;
}

void InputWatcher::unsubscribe()
{
    if (m_subscribed) {
        m_subscribed = false;
        watchActivity(false);
        LOG_DEBUG("Input events unsubscribed");
    }
}

bool InputWatcher::isSubscribed() const
{
    return m_subscribed;
}

HotkeyHandle InputWatcher::registerHotkey(const ShortcutBinding& binding)
{
    if (!binding.isValid()) {
        LOG_ERROR(QString("Refusing to register invalid hotkey: %1").arg(binding.toString()));
        return InvalidHotkeyHandle;
    }

    if (m_activeHandle != InvalidHotkeyHandle) {
        if (m_activeBinding == binding) {
            return m_activeHandle;
        }
        LOG_ERROR(QString("Hotkey %1 is still registered, cannot register %2")
                      .arg(m_activeBinding.toString(), binding.toString()));
        return InvalidHotkeyHandle;
    }

    HotkeyHandle handle = m_nextHandle++;
    if (!grabHotkey(handle, binding)) {
        LOG_WARNING(QString("Failed to register global hotkey: %1").arg(binding.toString()));
        return InvalidHotkeyHandle;
    }

    m_activeHandle = handle;
    m_activeBinding = binding;
    LOG_INFO(QString("Global hotkey registered: %1 (handle %2)").arg(binding.toString()).arg(handle));
    return handle;
}

bool InputWatcher::unregisterHotkey(HotkeyHandle handle)
{
    if (handle == InvalidHotkeyHandle || handle != m_activeHandle) {
        return false;
    }

    releaseHotkey(handle);
    LOG_INFO(QString("Global hotkey unregistered: %1 (handle %2)").arg(m_activeBinding.toString()).arg(handle));

    m_activeHandle = InvalidHotkeyHandle;
    m_activeBinding = ShortcutBinding();
    return true;
}

HotkeyHandle InputWatcher::activeHotkey() const
{
    return m_activeHandle;
}

ShortcutBinding InputWatcher::activeHotkeyBinding() const
{
    return m_activeBinding;
}

void InputWatcher::watchActivity(bool enabled)
{
    Q_UNUSED(enabled);
}

void InputWatcher::publishInputEvent(const InputEvent& event)
{
    if (m_subscribed) {
        emit inputEvent(event);
    }
}

void InputWatcher::publishHotkey(int handle)
{
    // A press can still be queued from a grab that has since been released
    if (handle != InvalidHotkeyHandle && handle == m_activeHandle) {
        emit hotkeyPressed(handle);
    }
}

void InputWatcher::publishListenerFailure(const QString& reason)
{
    LOG_ERROR(QString("Input listener failed: %1").arg(reason));
    if (m_subscribed) {
        m_subscribed = false;
        watchActivity(false);
    }
    emit listenerFailed(reason);
}

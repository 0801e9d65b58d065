#include "WinInputWatcher.h"
#include "logger/logger.h"
#include <QCoreApplication>
#include <QHash>

WinInputWatcher* WinInputWatcher::s_instance = nullptr;

namespace {

const QHash<QString, UINT>& namedVirtualKeys()
{
    static const QHash<QString, UINT> keys = {
        { "Space", VK_SPACE },
        { "Enter", VK_RETURN },
        { "Escape", VK_ESCAPE },
        { "Tab", VK_TAB },
        { "Backspace", VK_BACK },
        { "Delete", VK_DELETE },
        { "Insert", VK_INSERT },
        { "Home", VK_HOME },
        { "End", VK_END },
        { "PageUp", VK_PRIOR },
        { "PageDown", VK_NEXT },
        { "Left", VK_LEFT },
        { "Right", VK_RIGHT },
        { "Up", VK_UP },
        { "Down", VK_DOWN }
    };
    return keys;
}

} // namespace

WinInputWatcher::WinInputWatcher(QObject *parent)
    : InputWatcher(parent)
    , m_keyboardHook(NULL)
    , m_mouseHook(NULL)
    , m_isRunning(false)
    , m_watching(false)
{
    s_instance = this;
}

WinInputWatcher::~WinInputWatcher()
{
    if (m_isRunning) {
        stop();
    }

    s_instance = nullptr;
}

bool WinInputWatcher::initialize()
{
    LOG_INFO("Initializing WinInputWatcher");
    return true;
}

bool WinInputWatcher::start()
{
    if (m_isRunning) {
        LOG_WARNING("WinInputWatcher is already running");
        return true;
    }

    LOG_INFO("Starting WinInputWatcher");

    // Hook procedures run on this thread while its event loop pumps messages
    m_keyboardHook = SetWindowsHookEx(WH_KEYBOARD_LL, LowLevelKeyboardProc,
                                     GetModuleHandle(NULL), 0);
    if (!m_keyboardHook) {
        LOG_ERROR(QString("Failed to set keyboard hook, error code: %1")
                     .arg(GetLastError()));
        return false;
    }

    m_mouseHook = SetWindowsHookEx(WH_MOUSE_LL, LowLevelMouseProc,
                                  GetModuleHandle(NULL), 0);
    if (!m_mouseHook) {
        LOG_ERROR(QString("Failed to set mouse hook, error code: %1")
                     .arg(GetLastError()));
        UnhookWindowsHookEx(m_keyboardHook);
        m_keyboardHook = NULL;
        return false;
    }

    // WM_HOTKEY is posted to the thread queue and only reaches us as a native event
    QCoreApplication::instance()->installNativeEventFilter(this);
    m_isRunning = true;

    LOG_INFO("WinInputWatcher started successfully");
    return true;
}

bool WinInputWatcher::stop()
{
    if (!m_isRunning) {
        LOG_WARNING("WinInputWatcher is not running");
        return true;
    }

    LOG_INFO("Stopping WinInputWatcher");

    unsubscribe();
    unregisterHotkey(activeHotkey());

    if (QCoreApplication::instance()) {
        QCoreApplication::instance()->removeNativeEventFilter(this);
    }

    if (m_keyboardHook) {
        UnhookWindowsHookEx(m_keyboardHook);
        m_keyboardHook = NULL;
    }

    if (m_mouseHook) {
        UnhookWindowsHookEx(m_mouseHook);
        m_mouseHook = NULL;
    }

    m_isRunning = false;
    LOG_INFO("WinInputWatcher stopped successfully");
    return true;
}

bool WinInputWatcher::isRunning() const
{
    return m_isRunning;
}

bool WinInputWatcher::nativeEventFilter(const QByteArray &eventType, void *message, qintptr *result)
{
    Q_UNUSED(result);

    if (eventType != "windows_generic_MSG") {
        return false;
    }

    MSG* msg = static_cast<MSG*>(message);
    if (msg->message == WM_HOTKEY && msg->hwnd == NULL) {
        const int handle = static_cast<int>(msg->wParam);
        QMetaObject::invokeMethod(this, [this, handle]() {
            publishHotkey(handle);
        }, Qt::QueuedConnection);
        return true;
    }
    return false;
}

bool WinInputWatcher::grabHotkey(HotkeyHandle handle, const ShortcutBinding& binding)
{
    UINT vk = virtualKeyForKeyName(binding.key);
    if (vk == 0) {
        LOG_ERROR(QString("No virtual key for %1").arg(binding.key));
        return false;
    }

    UINT modifiers = MOD_NOREPEAT;
    if (binding.modifiers.testFlag(ShortcutBinding::Ctrl)) {
        modifiers |= MOD_CONTROL;
    }
    if (binding.modifiers.testFlag(ShortcutBinding::Alt)) {
        modifiers |= MOD_ALT;
    }
    if (binding.modifiers.testFlag(ShortcutBinding::Shift)) {
        modifiers |= MOD_SHIFT;
    }
    if (binding.modifiers.testFlag(ShortcutBinding::Meta)) {
        modifiers |= MOD_WIN;
    }

    if (!RegisterHotKey(NULL, handle, modifiers, vk)) {
        LOG_WARNING(QString("RegisterHotKey failed for %1, error code: %2")
                       .arg(binding.toString()).arg(GetLastError()));
        return false;
    }
    return true;
}

void WinInputWatcher::releaseHotkey(HotkeyHandle handle)
{
    if (!UnregisterHotKey(NULL, handle)) {
        LOG_WARNING(QString("UnregisterHotKey failed for handle %1, error code: %2")
                       .arg(handle).arg(GetLastError()));
    }
}

LRESULT CALLBACK WinInputWatcher::LowLevelKeyboardProc(int nCode, WPARAM wParam, LPARAM lParam)
{
    if (nCode >= 0 && isKeyboardActivityMessage(wParam)) {
        // Hooks run on the watcher's thread, m_watching can be read here
        if (s_instance && s_instance->m_watching) {
            KBDLLHOOKSTRUCT* keyStruct = (KBDLLHOOKSTRUCT*)lParam;
            const QString key = keyNameForVirtualKey(keyStruct->vkCode);
            WinInputWatcher* watcher = s_instance;
            QMetaObject::invokeMethod(watcher, [watcher, key]() {
                watcher->publishInputEvent(InputEvent::keyboard(key));
            }, Qt::QueuedConnection);
        }
    }
    return CallNextHookEx(NULL, nCode, wParam, lParam);
}

LRESULT CALLBACK WinInputWatcher::LowLevelMouseProc(int nCode, WPARAM wParam, LPARAM lParam)
{
    Q_UNUSED(lParam);

    if (nCode >= 0 && s_instance && s_instance->m_watching) {
        if (isMouseActivityMessage(wParam)) {
            WinInputWatcher* watcher = s_instance;
            QMetaObject::invokeMethod(watcher, [watcher]() {
                watcher->publishInputEvent(InputEvent::mouse());
            }, Qt::QueuedConnection);
        }
    }
    return CallNextHookEx(NULL, nCode, wParam, lParam);
}

void WinInputWatcher::watchActivity(bool enabled)
{
    m_watching = enabled;
}

bool WinInputWatcher::isKeyboardActivityMessage(WPARAM message)
{
    return message == WM_KEYDOWN || message == WM_SYSKEYDOWN ||
           message == WM_KEYUP || message == WM_SYSKEYUP;
}

bool WinInputWatcher::isMouseActivityMessage(WPARAM message)
{
    // Moves, every button down/up/double click, vertical and horizontal wheel
    return message >= WM_MOUSEFIRST && message <= WM_MOUSELAST;
}

QString WinInputWatcher::keyNameForVirtualKey(DWORD vkCode)
{
    switch (vkCode) {
        case VK_CONTROL: case VK_LCONTROL: case VK_RCONTROL:
            return "Ctrl";
        case VK_MENU: case VK_LMENU: case VK_RMENU:
            return "Alt";
        case VK_SHIFT: case VK_LSHIFT: case VK_RSHIFT:
            return "Shift";
        case VK_LWIN: case VK_RWIN:
            return "Meta";
        default:
            break;
    }

    if ((vkCode >= 'A' && vkCode <= 'Z') || (vkCode >= '0' && vkCode <= '9')) {
        return QString(QChar(static_cast<char>(vkCode)));
    }
    if (vkCode >= VK_F1 && vkCode <= VK_F24) {
        return QString("F%1").arg(vkCode - VK_F1 + 1);
    }

    const QHash<QString, UINT>& named = namedVirtualKeys();
    for (auto it = named.constBegin(); it != named.constEnd(); ++it) {
        if (it.value() == vkCode) {
            return it.key();
        }
    }
    return QString("VK%1").arg(vkCode);
}

UINT WinInputWatcher::virtualKeyForKeyName(const QString& keyName)
{
    if (keyName.size() == 1) {
        const QChar c = keyName.at(0).toUpper();
        if ((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
            return static_cast<UINT>(c.unicode());
        }
        // Punctuation depends on the keyboard layout
        const SHORT scan = VkKeyScanW(c.unicode());
        return scan == -1 ? 0 : static_cast<UINT>(LOBYTE(scan));
    }

    if (keyName.startsWith('F')) {
        bool ok = false;
        int number = keyName.mid(1).toInt(&ok);
        if (ok && number >= 1 && number <= 24) {
            return VK_F1 + number - 1;
        }
    }

    return namedVirtualKeys().value(keyName, 0);
}

#include "X11InputWatcher.h"
#include "logger/logger.h"

// Xlib defines macros (None, KeyPress, Bool) that clash with Qt, keep it last
#include <X11/Xlib.h>
#include <X11/XKBlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/XInput2.h>

namespace {

int s_grabErrorCode = 0;

int grabErrorHandler(Display*, XErrorEvent* event)
{
    s_grabErrorCode = event->error_code;
    return 0;
}

constexpr int PollIntervalMs = 25;

} // namespace

X11EventPoller::X11EventPoller(QObject *parent)
    : QObject(parent)
    , m_display(nullptr)
    , m_root(0)
    , m_xiOpcode(0)
    , m_watching(false)
    , m_pollTimer(nullptr)
{
}

X11EventPoller::~X11EventPoller()
{
    close();
}

bool X11EventPoller::open()
{
    if (m_display) {
        return true;
    }

    m_display = XOpenDisplay(nullptr);
    if (!m_display) {
        LOG_ERROR("Failed to open X display");
        return false;
    }

    int firstEvent = 0;
    int firstError = 0;
    if (!XQueryExtension(m_display, "XInputExtension", &m_xiOpcode, &firstEvent, &firstError)) {
        LOG_ERROR("X server has no XInput extension, activity can not be watched");
        XCloseDisplay(m_display);
        m_display = nullptr;
        return false;
    }

    int major = 2;
    int minor = 0;
    if (XIQueryVersion(m_display, &major, &minor) != Success) {
        LOG_ERROR(QString("XInput2 is required, server offers %1.%2").arg(major).arg(minor));
        XCloseDisplay(m_display);
        m_display = nullptr;
        return false;
    }

    m_root = DefaultRootWindow(m_display);
    XSelectInput(m_display, m_root, KeyPressMask);
    m_watching = false;

    // Created here so the timer belongs to the listener thread
    m_pollTimer = new QTimer(this);
    connect(m_pollTimer, &QTimer::timeout, this, &X11EventPoller::poll);
    m_pollTimer->start(PollIntervalMs);

    LOG_INFO(QString("X11 listener connected to %1 (XInput %2.%3)")
                 .arg(DisplayString(m_display)).arg(major).arg(minor));
    return true;
}

void X11EventPoller::close()
{
    if (m_pollTimer) {
        m_pollTimer->stop();
        delete m_pollTimer;
        m_pollTimer = nullptr;
    }

    if (m_display) {
        setWatching(false);
        for (const Grab& grab : qAsConst(m_grabs)) {
            ungrab(grab);
        }
        m_grabs.clear();
        XCloseDisplay(m_display);
        m_display = nullptr;
    }
}

void X11EventPoller::setWatching(bool watching)
{
    if (!m_display || m_watching == watching) {
        return;
    }

    unsigned char bits[XIMaskLen(XI_LASTEVENT)] = { 0 };
    if (watching) {
        XISetMask(bits, XI_RawKeyPress);
        XISetMask(bits, XI_RawKeyRelease);
        XISetMask(bits, XI_RawButtonPress);
        XISetMask(bits, XI_RawButtonRelease);
        XISetMask(bits, XI_RawMotion);
    }

    // An all-zero mask removes the selection
    XIEventMask mask;
    mask.deviceid = XIAllMasterDevices;
    mask.mask_len = sizeof(bits);
    mask.mask = bits;
    XISelectEvents(m_display, m_root, &mask, 1);
    XFlush(m_display);

    m_watching = watching;
    LOG_DEBUG(watching ? "Raw input events selected" : "Raw input events released");
}

bool X11EventPoller::isWatching() const
{
    return m_watching;
}

bool X11EventPoller::grab(int handle, const QString& keyName, int modifiers)
{
    if (!m_display) {
        return false;
    }

    KeySym keysym = keysymForKey(keyName);
    if (keysym == NoSymbol) {
        LOG_ERROR(QString("No X keysym for key %1").arg(keyName));
        return false;
    }

    int keycode = XKeysymToKeycode(m_display, keysym);
    if (keycode == 0) {
        LOG_ERROR(QString("Key %1 is not on the current keyboard map").arg(keyName));
        return false;
    }

    Grab grab { keycode, maskForModifiers(modifiers) };

    // Grab once per lock-key combination so CapsLock/NumLock do not matter.
    // BadAccess means another client already owns the combination.
    s_grabErrorCode = 0;
    XErrorHandler previousHandler = XSetErrorHandler(grabErrorHandler);
    const unsigned int lockMasks[] = { 0, LockMask, Mod2Mask, LockMask | Mod2Mask };
    for (unsigned int lockMask : lockMasks) {
        XGrabKey(m_display, keycode, grab.mask | lockMask, m_root, True, GrabModeAsync, GrabModeAsync);
    }
    XSync(m_display, False);
    XSetErrorHandler(previousHandler);

    if (s_grabErrorCode != 0) {
        LOG_WARNING(QString("X server refused grab of %1, error code %2").arg(keyName).arg(s_grabErrorCode));
        ungrab(grab);
        XSync(m_display, False);
        return false;
    }

    m_grabs.insert(handle, grab);
    return true;
}

void X11EventPoller::release(int handle)
{
    auto it = m_grabs.find(handle);
    if (it == m_grabs.end()) {
        return;
    }

    if (m_display) {
        ungrab(it.value());
        XSync(m_display, False);
    }
    m_grabs.erase(it);
}

void X11EventPoller::ungrab(const Grab& grab)
{
    const unsigned int lockMasks[] = { 0, LockMask, Mod2Mask, LockMask | Mod2Mask };
    for (unsigned int lockMask : lockMasks) {
        XUngrabKey(m_display, grab.keycode, grab.mask | lockMask, m_root);
    }
}

void X11EventPoller::poll()
{
    if (!m_display) {
        return;
    }

    // Pointer events are folded into one notification per poll
    bool pointerActive = false;

    while (XPending(m_display) > 0) {
        XEvent event;
        XNextEvent(m_display, &event);

        // Grabbed hotkeys arrive as core key events
        if (event.type == KeyPress) {
            const unsigned int state = cleanMask(event.xkey.state);
            for (auto it = m_grabs.constBegin(); it != m_grabs.constEnd(); ++it) {
                if (it.value().keycode == static_cast<int>(event.xkey.keycode) && it.value().mask == state) {
                    emit hotkeyActivated(it.key());
                }
            }
            continue;
        }

        if (event.xcookie.type != GenericEvent || event.xcookie.extension != m_xiOpcode) {
            continue;
        }
        if (!XGetEventData(m_display, &event.xcookie)) {
            continue;
        }

        // Events queued before the selection was removed are dropped here
        if (m_watching) {
            switch (activityForRawEvent(event.xcookie.evtype)) {
                case KeyActivity: {
                    const XIRawEvent* raw = static_cast<const XIRawEvent*>(event.xcookie.data);
                    emit keyActivity(keyNameForKeycode(raw->detail));
                    break;
                }
                case PointerActivity:
                    pointerActive = true;
                    break;
                case NoActivity:
                    break;
            }
        }
        XFreeEventData(m_display, &event.xcookie);
    }

    if (pointerActive) {
        emit pointerActivity();
    }
}

X11EventPoller::Activity X11EventPoller::activityForRawEvent(int evtype)
{
    switch (evtype) {
        case XI_RawKeyPress:
        case XI_RawKeyRelease:
            return KeyActivity;
        // Wheel notches are button 4-7 press/release pairs
        case XI_RawButtonPress:
        case XI_RawButtonRelease:
        case XI_RawMotion:
            return PointerActivity;
        default:
            return NoActivity;
    }
}

QString X11EventPoller::keyNameForKeycode(int keycode) const
{
    KeySym keysym = XkbKeycodeToKeysym(m_display, static_cast<KeyCode>(keycode), 0, 0);
    const char* name = keysym != NoSymbol ? XKeysymToString(keysym) : nullptr;
    if (!name) {
        return QString("Keycode%1").arg(keycode);
    }

    const QString keysymName = QString::fromLatin1(name);
    if (keysymName.startsWith("Control_")) {
        return "Ctrl";
    }
    if (keysymName.startsWith("Alt_") || keysymName.startsWith("Meta_") || keysymName == "ISO_Level3_Shift") {
        return "Alt";
    }
    if (keysymName.startsWith("Shift_")) {
        return "Shift";
    }
    if (keysymName.startsWith("Super_") || keysymName.startsWith("Hyper_")) {
        return "Meta";
    }
    return ShortcutCodec::normalizeKey(keysymName);
}

unsigned int X11EventPoller::cleanMask(unsigned int mask)
{
    return mask & (ShiftMask | ControlMask | Mod1Mask | Mod4Mask);
}

unsigned int X11EventPoller::maskForModifiers(int modifiers)
{
    ShortcutBinding::Modifiers flags(modifiers);
    unsigned int mask = 0;
    if (flags.testFlag(ShortcutBinding::Ctrl)) {
        mask |= ControlMask;
    }
    if (flags.testFlag(ShortcutBinding::Alt)) {
        mask |= Mod1Mask;
    }
    if (flags.testFlag(ShortcutBinding::Shift)) {
        mask |= ShiftMask;
    }
    if (flags.testFlag(ShortcutBinding::Meta)) {
        mask |= Mod4Mask;
    }
    return mask;
}

unsigned long X11EventPoller::keysymForKey(const QString& keyName)
{
    // Latin-1 keysyms are the character's code point, letters in lower case
    if (keyName.size() == 1 && keyName.at(0).unicode() < 0x100) {
        return keyName.at(0).toLower().unicode();
    }

    static const QHash<QString, QString> keysyms = {
        { "Space", "space" },
        { "Enter", "Return" },
        { "Backspace", "BackSpace" },
        { "PageUp", "Prior" },
        { "PageDown", "Next" }
    };
    const QString name = keysyms.value(keyName, keyName);
    return XStringToKeysym(name.toLatin1().constData());
}

X11InputWatcher::X11InputWatcher(QObject *parent)
    : InputWatcher(parent)
    , m_poller(nullptr)
    , m_isRunning(false)
{
    m_thread.setObjectName("X11InputListener");
}

X11InputWatcher::~X11InputWatcher()
{
    if (m_isRunning) {
        stop();
    }
    delete m_poller;
}

bool X11InputWatcher::initialize()
{
    LOG_INFO("Initializing X11InputWatcher");

    if (!XInitThreads()) {
        LOG_ERROR("XInitThreads failed");
        return false;
    }

    if (qEnvironmentVariableIsEmpty("DISPLAY")) {
        LOG_ERROR("DISPLAY is not set, global input monitoring needs an X11 session");
        return false;
    }

    return true;
}

bool X11InputWatcher::start()
{
    if (m_isRunning) {
        LOG_WARNING("X11InputWatcher is already running");
        return true;
    }

    LOG_INFO("Starting X11InputWatcher");

    m_poller = new X11EventPoller();
    m_poller->moveToThread(&m_thread);

    connect(m_poller, &X11EventPoller::keyActivity, this, [this](const QString& key) {
        publishInputEvent(InputEvent::keyboard(key));
    });
    connect(m_poller, &X11EventPoller::pointerActivity, this, [this]() {
        publishInputEvent(InputEvent::mouse());
    });
    connect(m_poller, &X11EventPoller::hotkeyActivated, this, &X11InputWatcher::publishHotkey);

    m_thread.start();

    bool opened = false;
    QMetaObject::invokeMethod(m_poller, [this, &opened]() {
        opened = m_poller->open();
    }, Qt::BlockingQueuedConnection);

    if (!opened) {
        LOG_ERROR("Failed to start X11 listener thread");
        m_thread.quit();
        m_thread.wait();
        delete m_poller;
        m_poller = nullptr;
        return false;
    }

    m_isRunning = true;
    LOG_INFO("X11InputWatcher started successfully");
    return true;
}

bool X11InputWatcher::stop()
{
    if (!m_isRunning) {
        LOG_WARNING("X11InputWatcher is not running");
        return true;
    }

    LOG_INFO("Stopping X11InputWatcher");

    unsubscribe();
    unregisterHotkey(activeHotkey());

    QMetaObject::invokeMethod(m_poller, [this]() {
        m_poller->close();
    }, Qt::BlockingQueuedConnection);
    m_thread.quit();
    m_thread.wait();

    delete m_poller;
    m_poller = nullptr;
    m_isRunning = false;

    LOG_INFO("X11InputWatcher stopped successfully");
    return true;
}

bool X11InputWatcher::isRunning() const
{
    return m_isRunning;
}

bool X11InputWatcher::grabHotkey(HotkeyHandle handle, const ShortcutBinding& binding)
{
    if (!m_isRunning) {
        LOG_ERROR("Cannot grab hotkey, X11 listener is not running");
        return false;
    }

    bool grabbed = false;
    const QString key = binding.key;
    const int modifiers = static_cast<int>(binding.modifiers);
    QMetaObject::invokeMethod(m_poller, [this, &grabbed, handle, key, modifiers]() {
        grabbed = m_poller->grab(handle, key, modifiers);
    }, Qt::BlockingQueuedConnection);
    return grabbed;
}

void X11InputWatcher::releaseHotkey(HotkeyHandle handle)
{
    if (!m_isRunning) {
        return;
    }

    QMetaObject::invokeMethod(m_poller, [this, handle]() {
        m_poller->release(handle);
    }, Qt::BlockingQueuedConnection);
}

void X11InputWatcher::watchActivity(bool enabled)
{
    if (!m_isRunning) {
        return;
    }

    // Dropped with the poller if it is gone before the call runs
    X11EventPoller* poller = m_poller;
    QMetaObject::invokeMethod(poller, [poller, enabled]() {
        poller->setWatching(enabled);
    }, Qt::QueuedConnection);
}

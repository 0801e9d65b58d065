#include "ShortcutManager.h"
#include "../monitors/InputWatcher.h"
#include "../managers/ConfigManager.h"
#include "logger/logger.h"

ShortcutManager::ShortcutManager(InputWatcher* watcher, QObject *parent)
    : QObject(parent)
    , m_watcher(watcher)
    , m_configManager(nullptr)
    , m_state(Idle)
    , m_handle(InvalidHotkeyHandle)
{
    ShortcutBinding defaultBinding;
    ShortcutCodec::parse("Alt+L", defaultBinding);
    m_binding.reset(defaultBinding);

    connect(m_watcher, &InputWatcher::hotkeyPressed, this, &ShortcutManager::handleHotkeyPressed);
}

ShortcutManager::~ShortcutManager()
{
}

void ShortcutManager::setConfigManager(ConfigManager* configManager)
{
    m_configManager = configManager;
}

QStringList ShortcutManager::fallbackShortcuts()
{
    return { "Ctrl+Alt+L", "Ctrl+Shift+L", "Alt+Shift+L", "Ctrl+Alt+S" };
}

ErrorCode ShortcutManager::registerInitialShortcut(const QString& text)
{
    ShortcutBinding configured;
    if (!ShortcutCodec::parse(text, configured)) {
        LOG_WARNING(QString("Configured shortcut '%1' is invalid, using Alt+L").arg(text));
        ShortcutCodec::parse("Alt+L", configured);
    }

    releaseShortcut();

    QList<ShortcutBinding> candidates { configured };
    for (const QString& fallback : fallbackShortcuts()) {
        ShortcutBinding binding;
        ShortcutCodec::parse(fallback, binding);
        if (!candidates.contains(binding)) {
            candidates << binding;
        }
    }

    for (const ShortcutBinding& candidate : candidates) {
        HotkeyHandle handle = m_watcher->registerHotkey(candidate);
        if (handle == InvalidHotkeyHandle) {
            continue;
        }

        m_handle = handle;
        m_binding.reset(candidate);
        if (candidate != configured) {
            LOG_WARNING(QString("Shortcut %1 is taken, using %2 instead")
                            .arg(configured.toString(), candidate.toString()));
            persist(candidate);
        }
        emit shortcutChanged(candidate.toString());
        return ErrorCode::None;
    }

    m_binding.reset(configured);
    emit shortcutChanged(configured.toString());
    return reportError(ErrorCode::HotkeyRegistrationFailure,
                       QString("Could not register %1 or any fallback shortcut, use arm instead")
                           .arg(configured.toString()));
}

void ShortcutManager::releaseShortcut()
{
    if (m_handle != InvalidHotkeyHandle) {
        m_watcher->unregisterHotkey(m_handle);
        m_handle = InvalidHotkeyHandle;
    }
}

ErrorCode ShortcutManager::startCapture()
{
    if (m_state == Capturing) {
        return reportError(ErrorCode::InvalidState, "Shortcut capture is already running");
    }

    releaseShortcut();
    m_accumulated = ShortcutBinding::NoModifier;
    setState(Capturing);
    emit captureProgress(QString());

    LOG_INFO("Shortcut capture started");
    return ErrorCode::None;
}

ErrorCode ShortcutManager::feedKeyEvent(const KeyEvent& event)
{
    if (m_state != Capturing) {
        return reportError(ErrorCode::InvalidState, "No shortcut capture is running");
    }

    const QString key = ShortcutCodec::normalizeKey(event.key);

    if (key == "Escape" && event.modifiers == ShortcutBinding::NoModifier
        && m_accumulated == ShortcutBinding::NoModifier) {
        return cancelCapture();
    }

    m_accumulated |= event.modifiers;

    if (key.isEmpty() || ShortcutCodec::isModifierToken(key)) {
        m_accumulated |= ShortcutCodec::modifierFromToken(key);
        emit captureProgress(ShortcutCodec::modifierNames(m_accumulated).join(ShortcutCodec::Separator)
                             + ShortcutCodec::Separator + "...");
        return ErrorCode::None;
    }

    ShortcutBinding candidate;
    candidate.modifiers = m_accumulated;
    candidate.key = key;

    if (!ShortcutCodec::validate(ShortcutCodec::serialize(candidate))) {
        m_accumulated = ShortcutBinding::NoModifier;
        emit captureProgress(QString());
        return reportError(ErrorCode::InvalidShortcut,
                           QString("'%1' is not a valid shortcut, hold at least one modifier")
                               .arg(ShortcutCodec::serialize(candidate)));
    }

    m_binding.setCandidate(candidate);
    if (!registerCandidate()) {
        m_accumulated = ShortcutBinding::NoModifier;
        emit captureProgress(QString());
        return reportError(ErrorCode::HotkeyRegistrationFailure,
                           QString("Shortcut %1 is already in use").arg(candidate.toString()));
    }

    persist(candidate);
    m_accumulated = ShortcutBinding::NoModifier;
    setState(Idle);

    LOG_INFO("Shortcut changed to " + candidate.toString());
    emit shortcutChanged(candidate.toString());
    return ErrorCode::None;
}

ErrorCode ShortcutManager::cancelCapture()
{
    if (m_state != Capturing) {
        return ErrorCode::InvalidState;
    }

    m_binding.rollback();
    m_accumulated = ShortcutBinding::NoModifier;
    restorePrevious();
    setState(Idle);

    LOG_INFO("Shortcut capture cancelled, keeping " + m_binding.original().toString());
    if (m_handle == InvalidHotkeyHandle) {
        return ErrorCode::HotkeyRegistrationFailure;
    }
    return ErrorCode::None;
}

ErrorCode ShortcutManager::setShortcut(const QString& text)
{
    if (m_state == Capturing) {
        return reportError(ErrorCode::InvalidState, "Cannot set a shortcut while capturing one");
    }

    ShortcutBinding binding;
    if (!ShortcutCodec::parse(text, binding)) {
        return reportError(ErrorCode::InvalidShortcut, QString("'%1' is not a valid shortcut").arg(text));
    }

    if (binding == m_binding.original() && m_handle != InvalidHotkeyHandle) {
        return ErrorCode::None;
    }

    releaseShortcut();
    m_binding.setCandidate(binding);
    if (!registerCandidate()) {
        restorePrevious();
        return reportError(ErrorCode::HotkeyRegistrationFailure,
                           QString("Shortcut %1 is already in use").arg(binding.toString()));
    }

    persist(binding);
    LOG_INFO("Shortcut changed to " + binding.toString());
    emit shortcutChanged(binding.toString());
    return ErrorCode::None;
}

ShortcutBinding ShortcutManager::currentShortcut() const
{
    return m_binding.original();
}

QString ShortcutManager::currentShortcutText() const
{
    return ShortcutCodec::serialize(m_binding.original());
}

HotkeyHandle ShortcutManager::currentHandle() const
{
    return m_handle;
}

ShortcutManager::State ShortcutManager::state() const
{
    return m_state;
}

void ShortcutManager::handleHotkeyPressed(int handle)
{
    if (handle != m_handle || m_state == Capturing) {
        return;
    }

    if (m_lastActivation.isValid() && m_lastActivation.elapsed() < SnapLockTimings::ShortcutDebounceMs) {
        LOG_DEBUG("Hotkey press ignored (debounce)");
        return;
    }
    m_lastActivation.restart();

    LOG_DEBUG("Hotkey activated: " + m_binding.original().toString());
    emit hotkeyActivated();
}

void ShortcutManager::setState(State state)
{
    if (m_state != state) {
        m_state = state;
        emit stateChanged(state);
    }
}

bool ShortcutManager::registerCandidate()
{
    return m_binding.commit([this](const ShortcutBinding& binding) {
        HotkeyHandle handle = m_watcher->registerHotkey(binding);
        if (handle == InvalidHotkeyHandle) {
            return false;
        }
        m_handle = handle;
        return true;
    });
}

void ShortcutManager::restorePrevious()
{
    const ShortcutBinding previous = m_binding.original();
    m_handle = m_watcher->registerHotkey(previous);
    if (m_handle == InvalidHotkeyHandle) {
        reportError(ErrorCode::HotkeyRegistrationFailure,
                    QString("Could not re-register shortcut %1").arg(previous.toString()));
    }
}

void ShortcutManager::persist(const ShortcutBinding& binding)
{
    if (!m_configManager) {
        return;
    }

    m_configManager->setShortcut(binding.toString());
    if (!m_configManager->saveLocalConfig()) {
        LOG_WARNING("Shortcut " + binding.toString() + " is active but could not be saved");
    }
}

ErrorCode ShortcutManager::reportError(ErrorCode code, const QString& message)
{
    LOG_WARNING(QString("%1: %2").arg(errorCodeToString(code), message));
    emit errorOccurred(static_cast<int>(code), message);
    return code;
}

#include <QtTest/QtTest>
#include <QSignalSpy>

#include "monitors/linux/X11InputWatcher.h"

// After Qt, XI2.h only brings constants
#include <X11/extensions/XI2.h>

class X11InputWatcherTest : public QObject
{
    Q_OBJECT

private slots:
    void testRawKeyEventsAreKeyActivity() {
        QCOMPARE(X11EventPoller::activityForRawEvent(XI_RawKeyPress), X11EventPoller::KeyActivity);
        QCOMPARE(X11EventPoller::activityForRawEvent(XI_RawKeyRelease), X11EventPoller::KeyActivity);
    }

    void testRawPointerEventsArePointerActivity() {
        // Wheel scrolls arrive as button 4-7 presses and releases
        QCOMPARE(X11EventPoller::activityForRawEvent(XI_RawButtonPress), X11EventPoller::PointerActivity);
        QCOMPARE(X11EventPoller::activityForRawEvent(XI_RawButtonRelease), X11EventPoller::PointerActivity);
        QCOMPARE(X11EventPoller::activityForRawEvent(XI_RawMotion), X11EventPoller::PointerActivity);
    }

    void testOtherEventsAreIgnored() {
        QCOMPARE(X11EventPoller::activityForRawEvent(XI_HierarchyChanged), X11EventPoller::NoActivity);
        QCOMPARE(X11EventPoller::activityForRawEvent(XI_FocusIn), X11EventPoller::NoActivity);
    }

    void testPunctuationKeysyms() {
        QCOMPARE(X11EventPoller::keysymForKey(","), 0x2cUL);
        QCOMPARE(X11EventPoller::keysymForKey("/"), 0x2fUL);
        QCOMPARE(X11EventPoller::keysymForKey(";"), 0x3bUL);
        QCOMPARE(X11EventPoller::keysymForKey("`"), 0x60UL);
    }

    void testLetterAndDigitKeysyms() {
        QCOMPARE(X11EventPoller::keysymForKey("L"), 0x6cUL);
        QCOMPARE(X11EventPoller::keysymForKey("5"), 0x35UL);
    }

    void testNamedKeysyms() {
        QCOMPARE(X11EventPoller::keysymForKey("Space"), 0x20UL);
        QCOMPARE(X11EventPoller::keysymForKey("Enter"), 0xff0dUL);
        QCOMPARE(X11EventPoller::keysymForKey("F5"), 0xffc2UL);
        QCOMPARE(X11EventPoller::keysymForKey("PageUp"), 0xff55UL);
        QCOMPARE(X11EventPoller::keysymForKey("NoSuchKey"), 0UL);
    }

    void testLiveListenerGrabsPunctuationShortcut() {
        if (qEnvironmentVariableIsEmpty("DISPLAY")) {
            QSKIP("No X display");
        }

        X11InputWatcher watcher;
        QVERIFY(watcher.initialize());
        if (!watcher.start()) {
            QSKIP("X server without XInput2");
        }

        ShortcutBinding binding;
        binding.modifiers = ShortcutBinding::Ctrl | ShortcutBinding::Alt | ShortcutBinding::Shift;
        binding.key = ",";
        const HotkeyHandle handle = watcher.registerHotkey(binding);
        QVERIFY(handle != InvalidHotkeyHandle);
        QVERIFY(watcher.unregisterHotkey(handle));

        QVERIFY(watcher.subscribe());
        watcher.unsubscribe();
        QVERIFY(watcher.stop());
    }
};

QTEST_MAIN(X11InputWatcherTest)
#include "X11InputWatcherTest.moc"

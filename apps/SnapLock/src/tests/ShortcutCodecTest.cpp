#include <QtTest/QtTest>

#include "core/ShortcutCodec.h"

class ShortcutCodecTest : public QObject
{
    Q_OBJECT

private slots:
    void testValidate_data() {
        QTest::addColumn<QString>("text");
        QTest::addColumn<bool>("valid");

        QTest::newRow("alt l") << "Alt+L" << true;
        QTest::newRow("ctrl alt l") << "Ctrl+Alt+L" << true;
        QTest::newRow("all modifiers") << "Ctrl+Alt+Shift+Meta+F5" << true;
        QTest::newRow("modifiers only") << "Ctrl+Shift" << false;
        QTest::newRow("no modifier") << "L" << false;
        QTest::newRow("empty") << "" << false;
        QTest::newRow("trailing separator") << "Ctrl+" << false;
        QTest::newRow("unknown modifier") << "Hyper+L" << false;
        QTest::newRow("key in the middle") << "Ctrl+L+Alt" << false;
        QTest::newRow("lower case") << "ctrl+alt+l" << true;
    }

    void testValidate() {
        QFETCH(QString, text);
        QFETCH(bool, valid);

        QCOMPARE(ShortcutCodec::validate(text), valid);
    }

    void testParseNormalizesKeyAndOrder() {
        ShortcutBinding binding;
        QVERIFY(ShortcutCodec::parse("shift+control+x", binding));

        QCOMPARE(binding.modifiers, ShortcutBinding::Modifiers(ShortcutBinding::Ctrl | ShortcutBinding::Shift));
        QCOMPARE(binding.key, QString("X"));
        QCOMPARE(ShortcutCodec::serialize(binding), QString("Ctrl+Shift+X"));
    }

    void testModifierAliases() {
        ShortcutBinding binding;
        QVERIFY(ShortcutCodec::parse("Cmd+Option+K", binding));
        QCOMPARE(binding.toString(), QString("Alt+Meta+K"));

        QVERIFY(ShortcutCodec::parse("Win+E", binding));
        QCOMPARE(binding.toString(), QString("Meta+E"));
    }

    void testDuplicateModifiersCollapse() {
        ShortcutBinding binding;
        QVERIFY(ShortcutCodec::parse("Ctrl+Control+L", binding));
        QCOMPARE(binding.toString(), QString("Ctrl+L"));
    }

    void testSpaceKey() {
        ShortcutBinding binding;
        QVERIFY(ShortcutCodec::parse("Ctrl+ ", binding));
        QCOMPARE(binding.key, QString("Space"));

        QVERIFY(ShortcutCodec::parse("Alt+space", binding));
        QCOMPARE(binding.toString(), QString("Alt+Space"));
    }

    void testParseFailureKeepsBinding() {
        ShortcutBinding binding;
        QVERIFY(ShortcutCodec::parse("Alt+L", binding));

        QVERIFY(!ShortcutCodec::parse("Ctrl+Shift", binding));
        QCOMPARE(binding.toString(), QString("Alt+L"));
    }

    void testBindingEquality() {
        ShortcutBinding first;
        ShortcutBinding second;
        QVERIFY(ShortcutCodec::parse("Alt+Ctrl+L", first));
        QVERIFY(ShortcutCodec::parse("Ctrl+Alt+l", second));
        QVERIFY(first == second);

        QVERIFY(ShortcutCodec::parse("Ctrl+Alt+K", second));
        QVERIFY(first != second);
    }

    void testNormalizeKey_data() {
        QTest::addColumn<QString>("input");
        QTest::addColumn<QString>("expected");

        QTest::newRow("letter") << "a" << "A";
        QTest::newRow("digit") << "7" << "7";
        QTest::newRow("esc") << "Esc" << "Escape";
        QTest::newRow("return") << "Return" << "Enter";
        QTest::newRow("arrow") << "ArrowUp" << "Up";
        QTest::newRow("function key") << "f12" << "F12";
        QTest::newRow("browser key code") << "KeyL" << "L";
        QTest::newRow("browser digit code") << "Digit5" << "5";
        QTest::newRow("x11 page") << "Prior" << "PageUp";
        QTest::newRow("unknown kept") << "Pause" << "Pause";
    }

    void testNormalizeKey() {
        QFETCH(QString, input);
        QFETCH(QString, expected);

        QCOMPARE(ShortcutCodec::normalizeKey(input), expected);
    }

    void testIsValidBinding() {
        ShortcutBinding binding;
        binding.key = "L";
        QVERIFY(!binding.isValid());

        binding.modifiers = ShortcutBinding::Alt;
        QVERIFY(binding.isValid());

        binding.key = "Shift";
        QVERIFY(!binding.isValid());
    }
};

QTEST_MAIN(ShortcutCodecTest)
#include "ShortcutCodecTest.moc"

#ifndef SHORTCUTCODEC_H
#define SHORTCUTCODEC_H

#include <QString>
#include <QStringList>
#include <QFlags>
#include <QMetaType>

struct ShortcutBinding
{
    enum Modifier {
        NoModifier = 0x0,
        Ctrl = 0x1,
        Alt = 0x2,
        Shift = 0x4,
        Meta = 0x8
    };
    Q_DECLARE_FLAGS(Modifiers, Modifier)

    Modifiers modifiers;
    QString key;    // main key, never a modifier

    bool isValid() const;
    QString toString() const;

    bool operator==(const ShortcutBinding& other) const;
    bool operator!=(const ShortcutBinding& other) const { return !(*this == other); }
};

Q_DECLARE_OPERATORS_FOR_FLAGS(ShortcutBinding::Modifiers)
Q_DECLARE_METATYPE(ShortcutBinding)

/**
 * Text form of a global shortcut: modifiers and main key joined by '+',
 * e.g. "Ctrl+Alt+L". Modifiers compare as a set and are always written in
 * the order Ctrl, Alt, Shift, Meta.
 */
class ShortcutCodec
{
public:
    static const QChar Separator;

    // True iff text splits into >= 2 tokens, all but the last are modifiers
    // and the last is a non-empty non-modifier.
    static bool validate(const QString& text);

    // Returns false and leaves binding untouched when text is not valid.
    static bool parse(const QString& text, ShortcutBinding& binding);

    static QString serialize(const ShortcutBinding& binding);

    // Maps a modifier token ("Ctrl", "Control", "Cmd", ...) to its flag,
    // NoModifier if the token is not a modifier.
    static ShortcutBinding::Modifier modifierFromToken(const QString& token);
    static bool isModifierToken(const QString& token);

    // Single printable characters are upper-cased, " " becomes "Space",
    // common aliases ("Esc", "Return", "ArrowUp") get one spelling.
    static QString normalizeKey(const QString& key);

    static QStringList modifierNames(ShortcutBinding::Modifiers modifiers);
};

#endif // SHORTCUTCODEC_H

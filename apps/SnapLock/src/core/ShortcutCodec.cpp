#include "ShortcutCodec.h"
#include <QHash>

const QChar ShortcutCodec::Separator = QLatin1Char('+');

bool ShortcutBinding::isValid() const
{
    return modifiers != NoModifier
        && !key.isEmpty()
        && !ShortcutCodec::isModifierToken(key);
}

QString ShortcutBinding::toString() const
{
    return ShortcutCodec::serialize(*this);
}

bool ShortcutBinding::operator==(const ShortcutBinding& other) const
{
    return modifiers == other.modifiers && key == other.key;
}

bool ShortcutCodec::validate(const QString& text)
{
    ShortcutBinding binding;
    return parse(text, binding);
}

bool ShortcutCodec::parse(const QString& text, ShortcutBinding& binding)
{
    const QStringList tokens = text.split(Separator);
    if (tokens.size() < 2) {
        return false;
    }

    ShortcutBinding::Modifiers modifiers;
    for (int i = 0; i < tokens.size() - 1; ++i) {
        ShortcutBinding::Modifier modifier = modifierFromToken(tokens.at(i).trimmed());
        if (modifier == ShortcutBinding::NoModifier) {
            return false;
        }
        modifiers |= modifier;
    }

    // The last token is taken as typed so " " can still mean Space
    const QString& lastToken = tokens.last();
    if (lastToken.isEmpty() || isModifierToken(lastToken.trimmed())) {
        return false;
    }

    QString key = normalizeKey(lastToken.trimmed().isEmpty() ? lastToken : lastToken.trimmed());
    if (key.isEmpty()) {
        return false;
    }

    binding.modifiers = modifiers;
    binding.key = key;
    return true;
}

QString ShortcutCodec::serialize(const ShortcutBinding& binding)
{
    QStringList parts = modifierNames(binding.modifiers);
    parts.append(binding.key);
    return parts.join(Separator);
}

ShortcutBinding::Modifier ShortcutCodec::modifierFromToken(const QString& token)
{
    static const QHash<QString, ShortcutBinding::Modifier> modifiers = {
        { "ctrl", ShortcutBinding::Ctrl },
        { "control", ShortcutBinding::Ctrl },
        { "alt", ShortcutBinding::Alt },
        { "option", ShortcutBinding::Alt },
        { "shift", ShortcutBinding::Shift },
        { "meta", ShortcutBinding::Meta },
        { "cmd", ShortcutBinding::Meta },
        { "command", ShortcutBinding::Meta },
        { "super", ShortcutBinding::Meta },
        { "win", ShortcutBinding::Meta }
    };
    return modifiers.value(token.toLower(), ShortcutBinding::NoModifier);
}

bool ShortcutCodec::isModifierToken(const QString& token)
{
    return modifierFromToken(token) != ShortcutBinding::NoModifier;
}

QString ShortcutCodec::normalizeKey(const QString& key)
{
    if (key == QLatin1String(" ")) {
        return QStringLiteral("Space");
    }

    QString trimmed = key.trimmed();
    if (trimmed.isEmpty()) {
        return QString();
    }

    if (trimmed.size() == 1) {
        return trimmed.toUpper();
    }

    static const QHash<QString, QString> aliases = {
        { "space", "Space" },
        { "spacebar", "Space" },
        { "esc", "Escape" },
        { "escape", "Escape" },
        { "return", "Enter" },
        { "enter", "Enter" },
        { "tab", "Tab" },
        { "backspace", "Backspace" },
        { "delete", "Delete" },
        { "del", "Delete" },
        { "insert", "Insert" },
        { "home", "Home" },
        { "end", "End" },
        { "pageup", "PageUp" },
        { "prior", "PageUp" },
        { "pagedown", "PageDown" },
        { "next", "PageDown" },
        { "arrowup", "Up" },
        { "up", "Up" },
        { "arrowdown", "Down" },
        { "down", "Down" },
        { "arrowleft", "Left" },
        { "left", "Left" },
        { "arrowright", "Right" },
        { "right", "Right" }
    };
    const QString lower = trimmed.toLower();
    auto it = aliases.constFind(lower);
    if (it != aliases.constEnd()) {
        return it.value();
    }

    // Function keys: f1 -> F1
    if (lower.size() <= 3 && lower.startsWith('f')) {
        bool ok = false;
        int number = lower.mid(1).toInt(&ok);
        if (ok && number >= 1 && number <= 24) {
            return QString("F%1").arg(number);
        }
    }

    // Browser-style codes: KeyL -> L, Digit5 -> 5
    if (trimmed.size() == 4 && trimmed.startsWith(QLatin1String("Key"))) {
        return trimmed.right(1).toUpper();
    }
    if (trimmed.size() == 6 && trimmed.startsWith(QLatin1String("Digit"))) {
        return trimmed.right(1);
    }

    return trimmed;
}

QStringList ShortcutCodec::modifierNames(ShortcutBinding::Modifiers modifiers)
{
    QStringList names;
    if (modifiers.testFlag(ShortcutBinding::Ctrl)) {
        names << "Ctrl";
    }
    if (modifiers.testFlag(ShortcutBinding::Alt)) {
        names << "Alt";
    }
    if (modifiers.testFlag(ShortcutBinding::Shift)) {
        names << "Shift";
    }
    if (modifiers.testFlag(ShortcutBinding::Meta)) {
        names << "Meta";
    }
    return names;
}

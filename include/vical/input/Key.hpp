#pragma once

#include <QChar>

namespace vical {
namespace input {

enum class KeyCode
{
    Character,
    Left,
    Right,
    Up,
    Down,
    Enter,
    Escape,
    Backspace,
    Resize,
    Unknown,
};

// One keystroke, independent of the terminal library that produced it.
struct Key
{
    KeyCode code = KeyCode::Unknown;
    QChar text;

    static Key character(QChar ch);
    static Key special(KeyCode code);

    bool is(QChar ch) const;
    bool isDigit() const;
    bool isPrintable() const;
};

// Ctrl-R as delivered by the terminal in raw mode.
constexpr ushort CTRL_R = 0x12;

} // namespace input
} // namespace vical

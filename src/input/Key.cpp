#include "vical/input/Key.hpp"

namespace vical {
namespace input {

Key Key::character(QChar ch)
{
    Key key;
    key.code = KeyCode::Character;
    key.text = ch;
    return key;
}

Key Key::special(KeyCode code)
{
    Key key;
    key.code = code;
    return key;
}

bool Key::is(QChar ch) const
{
    return code == KeyCode::Character && text == ch;
}

bool Key::isDigit() const
{
    return code == KeyCode::Character && text >= QLatin1Char('0') && text <= QLatin1Char('9');
}

bool Key::isPrintable() const
{
    return code == KeyCode::Character && text.isPrint();
}

} // namespace input
} // namespace vical

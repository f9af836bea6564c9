#include "vical/data/Subcalendar.hpp"

namespace vical {
namespace data {

namespace {
struct ColorName
{
    SubcalendarColor color;
    const char *name;
};

constexpr ColorName COLOR_NAMES[] = {
    { SubcalendarColor::Red, "red" },
    { SubcalendarColor::Green, "green" },
    { SubcalendarColor::Yellow, "yellow" },
    { SubcalendarColor::Blue, "blue" },
    { SubcalendarColor::Magenta, "magenta" },
    { SubcalendarColor::Cyan, "cyan" },
    { SubcalendarColor::White, "white" },
};
} // namespace

bool operator==(const Subcalendar &lhs, const Subcalendar &rhs)
{
    return lhs.id == rhs.id && lhs.name == rhs.name && lhs.color == rhs.color
        && lhs.visible == rhs.visible;
}

bool operator!=(const Subcalendar &lhs, const Subcalendar &rhs)
{
    return !(lhs == rhs);
}

QString colorToString(SubcalendarColor color)
{
    for (const auto &entry : COLOR_NAMES) {
        if (entry.color == color) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QStringLiteral("blue");
}

std::optional<SubcalendarColor> colorFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    for (const auto &entry : COLOR_NAMES) {
        if (normalized == QLatin1String(entry.name)) {
            return entry.color;
        }
    }
    return std::nullopt;
}

QStringList colorNames()
{
    QStringList names;
    for (const auto &entry : COLOR_NAMES) {
        names << QString::fromLatin1(entry.name);
    }
    return names;
}

SubcalendarColor nextColor(SubcalendarColor color)
{
    constexpr int count = static_cast<int>(sizeof(COLOR_NAMES) / sizeof(COLOR_NAMES[0]));
    for (int i = 0; i < count; ++i) {
        if (COLOR_NAMES[i].color == color) {
            return COLOR_NAMES[(i + 1) % count].color;
        }
    }
    return COLOR_NAMES[0].color;
}

} // namespace data
} // namespace vical

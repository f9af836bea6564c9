#pragma once

#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <optional>

namespace vical {
namespace data {

using SubcalendarId = qint64;

enum class SubcalendarColor
{
    Red,
    Green,
    Yellow,
    Blue,
    Magenta,
    Cyan,
    White,
};

struct Subcalendar
{
    SubcalendarId id = 0;
    QString name;
    SubcalendarColor color = SubcalendarColor::Blue;
    bool visible = true;
};

bool operator==(const Subcalendar &lhs, const Subcalendar &rhs);
bool operator!=(const Subcalendar &lhs, const Subcalendar &rhs);

QString colorToString(SubcalendarColor color);
std::optional<SubcalendarColor> colorFromString(const QString &value);
QStringList colorNames();

// Palette order, wrapping around.
SubcalendarColor nextColor(SubcalendarColor color);

} // namespace data
} // namespace vical

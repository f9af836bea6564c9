#include "vical/core/DateSpec.hpp"

#include <QRegularExpression>

namespace vical {
namespace core {

namespace {

std::optional<QDate> validDate(int year, int month, int day)
{
    if (year < 1 || year > 9999 || !QDate::isValid(year, month, day)) {
        return std::nullopt;
    }
    return QDate(year, month, day);
}

std::optional<QDate> monthAndDay(int first, int second, int year, DateOrder order)
{
    if (order == DateOrder::DayMonthYear) {
        return validDate(year, second, first);
    }
    return validDate(year, first, second);
}

} // namespace

std::optional<QDate> parseDateSpec(const QString &spec, const QDate &reference, DateOrder order)
{
    const QString trimmed = spec.trimmed();

    static const QRegularExpression isoPattern(QStringLiteral("^(\\d{4})-(\\d{2})-(\\d{2})$"));
    const QRegularExpressionMatch iso = isoPattern.match(trimmed);
    if (iso.hasMatch()) {
        return validDate(iso.captured(1).toInt(), iso.captured(2).toInt(), iso.captured(3).toInt());
    }

    static const QRegularExpression digitPattern(QStringLiteral("^\\d+$"));
    if (!digitPattern.match(trimmed).hasMatch() || !reference.isValid()) {
        return std::nullopt;
    }

    const auto part = [&trimmed](int position, int length) {
        return trimmed.mid(position, length).toInt();
    };

    switch (trimmed.size()) {
    case 1:
    case 2:
        return validDate(reference.year(), reference.month(), trimmed.toInt());
    case 4:
        return monthAndDay(part(0, 2), part(2, 2), reference.year(), order);
    case 6:
        return validDate(part(2, 4), part(0, 2), 1);
    case 8:
        return monthAndDay(part(0, 2), part(2, 2), part(4, 4), order);
    default:
        return std::nullopt;
    }
}

} // namespace core
} // namespace vical

#pragma once

#include <QString>
#include <Qt>

class QSettings;

namespace vical {
namespace core {

enum class DateOrder
{
    MonthDayYear,
    DayMonthYear,
};

struct Settings
{
    Qt::DayOfWeek weekStart = Qt::Sunday;
    DateOrder dateOrder = DateOrder::MonthDayYear;
    int undoLimit = 50;
    QString storeFile;
    bool dimCompleted = true;

    static Settings fromQSettings(const QSettings &settings);
    void writeTo(QSettings &settings) const;
};

} // namespace core
} // namespace vical

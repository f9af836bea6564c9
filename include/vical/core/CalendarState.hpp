#pragma once

#include <QDate>
#include <Qt>
#include <optional>

#include "vical/data/Subcalendar.hpp"

namespace vical {
namespace core {

// Cursor and view position on the month grid. The cursor is always a valid
// date between 0001-01-01 and 9999-12-31, and the displayed month always
// follows the cursor.
class CalendarState
{
public:
    explicit CalendarState(const QDate &today = QDate::currentDate());

    QDate cursorDate() const;
    int displayedYear() const;
    int displayedMonth() const;

    void setCursorDate(const QDate &date);
    void moveDays(qint64 days);
    // Day of month is clamped to the last valid day of the target month.
    void moveMonths(int months);
    void jumpToMonthStart();
    void jumpToMonthEnd();
    void jumpToWeekStart(Qt::DayOfWeek weekStart);
    void jumpToWeekEnd(Qt::DayOfWeek weekStart);

    data::SubcalendarId activeSubcalendarId() const;
    void setActiveSubcalendarId(data::SubcalendarId id);

    int selectedTaskIndex() const;
    void setSelectedTaskIndex(int index);

    std::optional<data::SubcalendarColor> colorFilter() const;
    void setColorFilter(std::optional<data::SubcalendarColor> color);

    static QDate minimumDate();
    static QDate maximumDate();
    // First cell of the six-week grid that shows the given month.
    static QDate gridStart(int year, int month, Qt::DayOfWeek weekStart);
    static constexpr int GRID_DAYS = 42;

private:
    QDate m_cursorDate;
    int m_displayedYear = 0;
    int m_displayedMonth = 0;
    data::SubcalendarId m_activeSubcalendarId = 0;
    int m_selectedTaskIndex = 0;
    std::optional<data::SubcalendarColor> m_colorFilter;
};

} // namespace core
} // namespace vical

#include "vical/core/CalendarState.hpp"

#include <QtGlobal>

namespace vical {
namespace core {

CalendarState::CalendarState(const QDate &today)
{
    setCursorDate(today.isValid() ? today : QDate::currentDate());
}

QDate CalendarState::cursorDate() const
{
    return m_cursorDate;
}

int CalendarState::displayedYear() const
{
    return m_displayedYear;
}

int CalendarState::displayedMonth() const
{
    return m_displayedMonth;
}

void CalendarState::setCursorDate(const QDate &date)
{
    if (!date.isValid()) {
        return;
    }
    QDate clamped = date;
    if (clamped < minimumDate()) {
        clamped = minimumDate();
    } else if (clamped > maximumDate()) {
        clamped = maximumDate();
    }
    if (clamped != m_cursorDate) {
        m_selectedTaskIndex = 0;
    }
    m_cursorDate = clamped;
    m_displayedYear = clamped.year();
    m_displayedMonth = clamped.month();
}

void CalendarState::moveDays(qint64 days)
{
    const qint64 target = qBound(minimumDate().toJulianDay(), m_cursorDate.toJulianDay() + days,
                                 maximumDate().toJulianDay());
    setCursorDate(QDate::fromJulianDay(target));
}

void CalendarState::moveMonths(int months)
{
    const qint64 monthIndex = qint64(m_cursorDate.year()) * 12 + (m_cursorDate.month() - 1) + months;
    const qint64 minIndex = qint64(minimumDate().year()) * 12;
    const qint64 maxIndex = qint64(maximumDate().year()) * 12 + 11;
    const qint64 clampedIndex = qBound(minIndex, monthIndex, maxIndex);

    const int year = static_cast<int>(clampedIndex / 12);
    const int month = static_cast<int>(clampedIndex % 12) + 1;
    const int lastDay = QDate(year, month, 1).daysInMonth();
    setCursorDate(QDate(year, month, qMin(m_cursorDate.day(), lastDay)));
}

void CalendarState::jumpToMonthStart()
{
    setCursorDate(QDate(m_cursorDate.year(), m_cursorDate.month(), 1));
}

void CalendarState::jumpToMonthEnd()
{
    setCursorDate(QDate(m_cursorDate.year(), m_cursorDate.month(), m_cursorDate.daysInMonth()));
}

void CalendarState::jumpToWeekStart(Qt::DayOfWeek weekStart)
{
    const int delta = (m_cursorDate.dayOfWeek() - weekStart + 7) % 7;
    moveDays(-delta);
}

void CalendarState::jumpToWeekEnd(Qt::DayOfWeek weekStart)
{
    const int delta = (m_cursorDate.dayOfWeek() - weekStart + 7) % 7;
    moveDays(6 - delta);
}

data::SubcalendarId CalendarState::activeSubcalendarId() const
{
    return m_activeSubcalendarId;
}

void CalendarState::setActiveSubcalendarId(data::SubcalendarId id)
{
    m_activeSubcalendarId = id;
}

int CalendarState::selectedTaskIndex() const
{
    return m_selectedTaskIndex;
}

void CalendarState::setSelectedTaskIndex(int index)
{
    m_selectedTaskIndex = qMax(0, index);
}

std::optional<data::SubcalendarColor> CalendarState::colorFilter() const
{
    return m_colorFilter;
}

void CalendarState::setColorFilter(std::optional<data::SubcalendarColor> color)
{
    m_colorFilter = color;
    m_selectedTaskIndex = 0;
}

QDate CalendarState::minimumDate()
{
    return QDate(1, 1, 1);
}

QDate CalendarState::maximumDate()
{
    return QDate(9999, 12, 31);
}

QDate CalendarState::gridStart(int year, int month, Qt::DayOfWeek weekStart)
{
    const QDate first(year, month, 1);
    const int offset = (first.dayOfWeek() - weekStart + 7) % 7;
    return first.addDays(-offset);
}

} // namespace core
} // namespace vical

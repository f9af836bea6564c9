#pragma once

#include <QDate>
#include <QString>
#include <Qt>
#include <optional>
#include <vector>

#include "vical/data/Subcalendar.hpp"
#include "vical/data/Task.hpp"
#include "vical/input/Mode.hpp"

namespace vical {
namespace core {

struct StatusMessage
{
    QString text;
    bool isError = false;

    bool isEmpty() const { return text.isEmpty(); }
};

// Everything a renderer needs for one frame. Holds copies, never references
// into the model.
struct ViewSnapshot
{
    QDate cursorDate;
    int displayedYear = 0;
    int displayedMonth = 0;
    Qt::DayOfWeek weekStart = Qt::Sunday;
    data::SubcalendarId activeSubcalendarId = 0;
    // Set even when the active subcalendar is hidden.
    std::optional<data::Subcalendar> activeSubcalendar;
    int selectedTaskIndex = 0;
    std::optional<data::SubcalendarColor> colorFilter;

    // Visible subcalendars in creation order.
    std::vector<data::Subcalendar> subcalendars;
    QDate gridStart;
    // Visible tasks of the 6x7 grid, by date, subcalendar order and id.
    std::vector<data::Task> gridTasks;
    std::vector<data::Task> cursorTasks;

    input::Mode mode = input::Mode::Normal;
    QString pendingBuffer;
    StatusMessage status;

    std::optional<data::Subcalendar> subcalendar(data::SubcalendarId id) const;
    std::vector<data::Task> tasksOn(const QDate &date) const;
};

} // namespace core
} // namespace vical

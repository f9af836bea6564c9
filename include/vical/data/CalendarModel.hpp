#pragma once

#include <QDate>
#include <QHash>
#include <QMap>
#include <QSet>
#include <QString>
#include <optional>
#include <vector>

#include "vical/data/Subcalendar.hpp"
#include "vical/data/Task.hpp"

namespace vical {
namespace data {

// Restricts task queries to what the calendar view shows.
struct TaskFilter
{
    bool visibleOnly = true;
    std::optional<SubcalendarColor> color;
};

class CalendarModel
{
public:
    CalendarModel();

    static CalendarModel withDefaultSubcalendar();

    const std::vector<Subcalendar> &subcalendars() const;
    std::optional<Subcalendar> findSubcalendar(SubcalendarId id) const;
    std::optional<Subcalendar> findSubcalendarByName(const QString &name) const;
    int subcalendarIndex(SubcalendarId id) const;

    Subcalendar addSubcalendar(const QString &name, SubcalendarColor color);
    bool updateSubcalendar(const Subcalendar &subcalendar);
    // Removes the subcalendar and every task it owns.
    bool removeSubcalendar(SubcalendarId id, int *removedTasks = nullptr);

    std::vector<Task> tasks() const;
    std::optional<Task> findTask(TaskId id) const;
    std::vector<Task> tasksOwnedBy(SubcalendarId id) const;
    std::vector<Task> tasksOn(const QDate &date, const TaskFilter &filter = TaskFilter()) const;
    std::vector<Task> tasksBetween(const QDate &from, const QDate &to,
                                   const TaskFilter &filter = TaskFilter()) const;
    int taskCount() const;

    // Returns std::nullopt when the owner does not exist or the title is blank.
    std::optional<Task> addTask(Task task);
    bool updateTask(const Task &task);
    bool removeTask(TaskId id);
    bool toggleTaskCompleted(TaskId id);

    SubcalendarId nextSubcalendarId() const;
    TaskId nextTaskId() const;
    // Counters only move forward; lower values are ignored.
    void advanceIdCounters(SubcalendarId nextSubcalendarId, TaskId nextTaskId);

    // Loading path: inserts entities with their stored ids.
    bool insertSubcalendar(const Subcalendar &subcalendar);
    bool insertTask(const Task &task);

    void restore(const CalendarModel &snapshot);

    bool operator==(const CalendarModel &other) const;
    bool operator!=(const CalendarModel &other) const;

private:
    bool accepts(const Task &task, const TaskFilter &filter) const;
    void sortForDisplay(std::vector<Task> &tasks) const;

    std::vector<Subcalendar> m_subcalendars;
    QMap<TaskId, Task> m_tasks;
    QHash<SubcalendarId, QSet<TaskId>> m_tasksByOwner;
    SubcalendarId m_nextSubcalendarId = 1;
    TaskId m_nextTaskId = 1;
};

} // namespace data
} // namespace vical

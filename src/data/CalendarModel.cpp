#include "vical/data/CalendarModel.hpp"

#include <algorithm>

namespace vical {
namespace data {

CalendarModel::CalendarModel() = default;

CalendarModel CalendarModel::withDefaultSubcalendar()
{
    CalendarModel model;
    model.addSubcalendar(QStringLiteral("Default"), SubcalendarColor::Blue);
    return model;
}

const std::vector<Subcalendar> &CalendarModel::subcalendars() const
{
    return m_subcalendars;
}

std::optional<Subcalendar> CalendarModel::findSubcalendar(SubcalendarId id) const
{
    const int index = subcalendarIndex(id);
    if (index < 0) {
        return std::nullopt;
    }
    return m_subcalendars[static_cast<size_t>(index)];
}

std::optional<Subcalendar> CalendarModel::findSubcalendarByName(const QString &name) const
{
    for (const auto &subcalendar : m_subcalendars) {
        if (subcalendar.name == name) {
            return subcalendar;
        }
    }
    return std::nullopt;
}

int CalendarModel::subcalendarIndex(SubcalendarId id) const
{
    for (size_t i = 0; i < m_subcalendars.size(); ++i) {
        if (m_subcalendars[i].id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

Subcalendar CalendarModel::addSubcalendar(const QString &name, SubcalendarColor color)
{
    Subcalendar subcalendar;
    subcalendar.id = m_nextSubcalendarId++;
    subcalendar.name = name;
    subcalendar.color = color;
    subcalendar.visible = true;
    m_subcalendars.push_back(subcalendar);
    m_tasksByOwner.insert(subcalendar.id, {});
    return subcalendar;
}

bool CalendarModel::updateSubcalendar(const Subcalendar &subcalendar)
{
    const int index = subcalendarIndex(subcalendar.id);
    if (index < 0) {
        return false;
    }
    m_subcalendars[static_cast<size_t>(index)] = subcalendar;
    return true;
}

bool CalendarModel::removeSubcalendar(SubcalendarId id, int *removedTasks)
{
    const int index = subcalendarIndex(id);
    if (index < 0) {
        return false;
    }
    const QSet<TaskId> owned = m_tasksByOwner.take(id);
    for (const TaskId taskId : owned) {
        m_tasks.remove(taskId);
    }
    m_subcalendars.erase(m_subcalendars.begin() + index);
    if (removedTasks) {
        *removedTasks = owned.size();
    }
    return true;
}

std::vector<Task> CalendarModel::tasks() const
{
    std::vector<Task> result;
    result.reserve(static_cast<size_t>(m_tasks.size()));
    for (const auto &task : m_tasks) {
        result.push_back(task);
    }
    return result;
}

std::optional<Task> CalendarModel::findTask(TaskId id) const
{
    const auto it = m_tasks.constFind(id);
    if (it == m_tasks.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

std::vector<Task> CalendarModel::tasksOwnedBy(SubcalendarId id) const
{
    std::vector<Task> result;
    const QSet<TaskId> owned = m_tasksByOwner.value(id);
    result.reserve(static_cast<size_t>(owned.size()));
    for (const TaskId taskId : owned) {
        result.push_back(m_tasks.value(taskId));
    }
    std::sort(result.begin(), result.end(), [](const Task &lhs, const Task &rhs) {
        return lhs.id < rhs.id;
    });
    return result;
}

std::vector<Task> CalendarModel::tasksOn(const QDate &date, const TaskFilter &filter) const
{
    return tasksBetween(date, date, filter);
}

std::vector<Task> CalendarModel::tasksBetween(const QDate &from, const QDate &to,
                                              const TaskFilter &filter) const
{
    std::vector<Task> result;
    if (!from.isValid() || !to.isValid() || to < from) {
        return result;
    }
    for (const auto &task : m_tasks) {
        if (task.date < from || task.date > to) {
            continue;
        }
        if (accepts(task, filter)) {
            result.push_back(task);
        }
    }
    sortForDisplay(result);
    return result;
}

int CalendarModel::taskCount() const
{
    return m_tasks.size();
}

std::optional<Task> CalendarModel::addTask(Task task)
{
    if (subcalendarIndex(task.subcalendarId) < 0 || isBlankTitle(task.title)
        || !task.date.isValid()) {
        return std::nullopt;
    }
    task.id = m_nextTaskId++;
    m_tasks.insert(task.id, task);
    m_tasksByOwner[task.subcalendarId].insert(task.id);
    return task;
}

bool CalendarModel::updateTask(const Task &task)
{
    const auto it = m_tasks.find(task.id);
    if (it == m_tasks.end()) {
        return false;
    }
    if (subcalendarIndex(task.subcalendarId) < 0 || isBlankTitle(task.title)
        || !task.date.isValid()) {
        return false;
    }
    if (it->subcalendarId != task.subcalendarId) {
        m_tasksByOwner[it->subcalendarId].remove(task.id);
        m_tasksByOwner[task.subcalendarId].insert(task.id);
    }
    *it = task;
    return true;
}

bool CalendarModel::removeTask(TaskId id)
{
    const auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return false;
    }
    m_tasksByOwner[it->subcalendarId].remove(id);
    m_tasks.erase(it);
    return true;
}

bool CalendarModel::toggleTaskCompleted(TaskId id)
{
    const auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return false;
    }
    it->completed = !it->completed;
    return true;
}

SubcalendarId CalendarModel::nextSubcalendarId() const
{
    return m_nextSubcalendarId;
}

TaskId CalendarModel::nextTaskId() const
{
    return m_nextTaskId;
}

void CalendarModel::advanceIdCounters(SubcalendarId nextSubcalendarId, TaskId nextTaskId)
{
    m_nextSubcalendarId = std::max(m_nextSubcalendarId, nextSubcalendarId);
    m_nextTaskId = std::max(m_nextTaskId, nextTaskId);
}

bool CalendarModel::insertSubcalendar(const Subcalendar &subcalendar)
{
    if (subcalendar.id <= 0 || subcalendarIndex(subcalendar.id) >= 0) {
        return false;
    }
    m_subcalendars.push_back(subcalendar);
    m_tasksByOwner.insert(subcalendar.id, {});
    m_nextSubcalendarId = std::max(m_nextSubcalendarId, subcalendar.id + 1);
    return true;
}

bool CalendarModel::insertTask(const Task &task)
{
    if (task.id <= 0 || m_tasks.contains(task.id) || subcalendarIndex(task.subcalendarId) < 0
        || isBlankTitle(task.title) || !task.date.isValid()) {
        return false;
    }
    m_tasks.insert(task.id, task);
    m_tasksByOwner[task.subcalendarId].insert(task.id);
    m_nextTaskId = std::max(m_nextTaskId, task.id + 1);
    return true;
}

void CalendarModel::restore(const CalendarModel &snapshot)
{
    const SubcalendarId nextSubcalendarId = std::max(m_nextSubcalendarId, snapshot.m_nextSubcalendarId);
    const TaskId nextTaskId = std::max(m_nextTaskId, snapshot.m_nextTaskId);
    m_subcalendars = snapshot.m_subcalendars;
    m_tasks = snapshot.m_tasks;
    m_tasksByOwner = snapshot.m_tasksByOwner;
    m_nextSubcalendarId = nextSubcalendarId;
    m_nextTaskId = nextTaskId;
}

bool CalendarModel::operator==(const CalendarModel &other) const
{
    return m_subcalendars == other.m_subcalendars && m_tasks == other.m_tasks
        && m_nextSubcalendarId == other.m_nextSubcalendarId && m_nextTaskId == other.m_nextTaskId;
}

bool CalendarModel::operator!=(const CalendarModel &other) const
{
    return !(*this == other);
}

bool CalendarModel::accepts(const Task &task, const TaskFilter &filter) const
{
    if (!filter.visibleOnly && !filter.color) {
        return true;
    }
    const int index = subcalendarIndex(task.subcalendarId);
    if (index < 0) {
        return false;
    }
    const Subcalendar &owner = m_subcalendars[static_cast<size_t>(index)];
    if (filter.visibleOnly && !owner.visible) {
        return false;
    }
    if (filter.color && owner.color != *filter.color) {
        return false;
    }
    return true;
}

void CalendarModel::sortForDisplay(std::vector<Task> &tasks) const
{
    std::stable_sort(tasks.begin(), tasks.end(), [this](const Task &lhs, const Task &rhs) {
        if (lhs.date != rhs.date) {
            return lhs.date < rhs.date;
        }
        const int lhsOwner = subcalendarIndex(lhs.subcalendarId);
        const int rhsOwner = subcalendarIndex(rhs.subcalendarId);
        if (lhsOwner != rhsOwner) {
            return lhsOwner < rhsOwner;
        }
        return lhs.id < rhs.id;
    });
}

} // namespace data
} // namespace vical

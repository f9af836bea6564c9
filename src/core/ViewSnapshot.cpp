#include "vical/core/ViewSnapshot.hpp"

#include <algorithm>
#include <iterator>

namespace vical {
namespace core {

std::optional<data::Subcalendar> ViewSnapshot::subcalendar(data::SubcalendarId id) const
{
    const auto it = std::find_if(subcalendars.cbegin(), subcalendars.cend(),
                                 [id](const data::Subcalendar &entry) { return entry.id == id; });
    if (it == subcalendars.cend()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<data::Task> ViewSnapshot::tasksOn(const QDate &date) const
{
    std::vector<data::Task> result;
    std::copy_if(gridTasks.cbegin(), gridTasks.cend(), std::back_inserter(result),
                 [&date](const data::Task &task) { return task.date == date; });
    return result;
}

} // namespace core
} // namespace vical

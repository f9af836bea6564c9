#include "vical/data/Task.hpp"

namespace vical {
namespace data {

bool operator==(const Task &lhs, const Task &rhs)
{
    return lhs.id == rhs.id && lhs.subcalendarId == rhs.subcalendarId && lhs.date == rhs.date
        && lhs.title == rhs.title && lhs.completed == rhs.completed;
}

bool operator!=(const Task &lhs, const Task &rhs)
{
    return !(lhs == rhs);
}

bool isBlankTitle(const QString &title)
{
    return title.trimmed().isEmpty();
}

} // namespace data
} // namespace vical

#include "vical/data/InMemoryCalendarStore.hpp"

namespace vical {
namespace data {

InMemoryCalendarStore::InMemoryCalendarStore() = default;

InMemoryCalendarStore::InMemoryCalendarStore(CalendarModel stored)
    : m_stored(std::move(stored))
{
}

InMemoryCalendarStore::~InMemoryCalendarStore() = default;

LoadResult InMemoryCalendarStore::load() const
{
    LoadResult result;
    if (!m_stored) {
        result.status = LoadStatus::NotFound;
        result.model = CalendarModel::withDefaultSubcalendar();
        return result;
    }
    result.status = LoadStatus::Loaded;
    result.model = *m_stored;
    return result;
}

bool InMemoryCalendarStore::save(const CalendarModel &model, QString *errorMessage)
{
    if (m_failWrites) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Simulated write failure");
        }
        return false;
    }
    m_stored = model;
    ++m_saveCount;
    return true;
}

QString InMemoryCalendarStore::location() const
{
    return QStringLiteral(":memory:");
}

const std::optional<CalendarModel> &InMemoryCalendarStore::stored() const
{
    return m_stored;
}

int InMemoryCalendarStore::saveCount() const
{
    return m_saveCount;
}

void InMemoryCalendarStore::setFailWrites(bool fail)
{
    m_failWrites = fail;
}

} // namespace data
} // namespace vical

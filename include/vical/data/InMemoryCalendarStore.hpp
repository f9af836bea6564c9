#pragma once

#include <optional>

#include "vical/data/CalendarStore.hpp"

namespace vical {
namespace data {

class InMemoryCalendarStore : public CalendarStore
{
public:
    InMemoryCalendarStore();
    explicit InMemoryCalendarStore(CalendarModel stored);
    ~InMemoryCalendarStore() override;

    LoadResult load() const override;
    bool save(const CalendarModel &model, QString *errorMessage = nullptr) override;
    QString location() const override;

    const std::optional<CalendarModel> &stored() const;
    int saveCount() const;
    void setFailWrites(bool fail);

private:
    std::optional<CalendarModel> m_stored;
    int m_saveCount = 0;
    bool m_failWrites = false;
};

} // namespace data
} // namespace vical

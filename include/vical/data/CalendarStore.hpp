#pragma once

#include <QString>

#include "vical/data/CalendarModel.hpp"

namespace vical {
namespace data {

enum class LoadStatus
{
    Loaded,
    NotFound,
    Corrupt,
};

struct LoadResult
{
    LoadStatus status = LoadStatus::NotFound;
    CalendarModel model;
    QString errorMessage;
};

class CalendarStore
{
public:
    virtual ~CalendarStore() = default;

    // NotFound carries a fresh model holding the default subcalendar.
    virtual LoadResult load() const = 0;
    // Replaces the stored model as a whole. On failure the previous store is left intact.
    virtual bool save(const CalendarModel &model, QString *errorMessage = nullptr) = 0;
    virtual QString location() const = 0;
};

} // namespace data
} // namespace vical

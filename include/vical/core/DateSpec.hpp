#pragma once

#include <QDate>
#include <QString>
#include <optional>

#include "vical/core/Settings.hpp"

namespace vical {
namespace core {

/*
 * Accepts an ISO date (yyyy-MM-dd) or a run of digits:
 *   1-2 digits  day of the reference month
 *   4 digits    MMDD or DDMM in the reference year
 *   6 digits    MMYYYY, first day of the month
 *   8 digits    MMDDYYYY or DDMMYYYY
 * The digit order of the 4 and 8 digit forms follows |order|.
 */
std::optional<QDate> parseDateSpec(const QString &spec, const QDate &reference, DateOrder order);

} // namespace core
} // namespace vical

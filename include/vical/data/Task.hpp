#pragma once

#include <QDate>
#include <QString>
#include <QtGlobal>

#include "vical/data/Subcalendar.hpp"

namespace vical {
namespace data {

using TaskId = qint64;

struct Task
{
    TaskId id = 0;
    SubcalendarId subcalendarId = 0;
    QDate date;
    QString title;
    bool completed = false;
};

bool operator==(const Task &lhs, const Task &rhs);
bool operator!=(const Task &lhs, const Task &rhs);

// Titles consisting only of whitespace count as blank.
bool isBlankTitle(const QString &title);

} // namespace data
} // namespace vical

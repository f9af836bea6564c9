#include "vical/core/Settings.hpp"

#include <QSettings>
#include <QtGlobal>

#include "vical/core/Logging.hpp"

namespace vical {
namespace core {

namespace {
constexpr int MIN_UNDO_LIMIT = 1;
constexpr int MAX_UNDO_LIMIT = 1000;
} // namespace

Settings Settings::fromQSettings(const QSettings &settings)
{
    Settings result;

    const QString weekStart = settings.value(QStringLiteral("calendar/weekStart"), QStringLiteral("sunday"))
                                  .toString()
                                  .toLower();
    if (weekStart == QLatin1String("monday")) {
        result.weekStart = Qt::Monday;
    } else if (weekStart != QLatin1String("sunday")) {
        qCWarning(lcApp) << "Unknown calendar/weekStart" << weekStart << "- using sunday";
    }

    const QString dateOrder = settings.value(QStringLiteral("input/dateOrder"), QStringLiteral("mdy"))
                                  .toString()
                                  .toLower();
    if (dateOrder == QLatin1String("dmy")) {
        result.dateOrder = DateOrder::DayMonthYear;
    } else if (dateOrder != QLatin1String("mdy")) {
        qCWarning(lcApp) << "Unknown input/dateOrder" << dateOrder << "- using mdy";
    }

    result.undoLimit = qBound(MIN_UNDO_LIMIT,
                              settings.value(QStringLiteral("core/undoLimit"), result.undoLimit).toInt(),
                              MAX_UNDO_LIMIT);
    result.storeFile = settings.value(QStringLiteral("storage/file")).toString();
    result.dimCompleted = settings.value(QStringLiteral("ui/dimCompleted"), result.dimCompleted).toBool();
    return result;
}

void Settings::writeTo(QSettings &settings) const
{
    settings.setValue(QStringLiteral("calendar/weekStart"),
                      weekStart == Qt::Monday ? QStringLiteral("monday") : QStringLiteral("sunday"));
    settings.setValue(QStringLiteral("input/dateOrder"),
                      dateOrder == DateOrder::DayMonthYear ? QStringLiteral("dmy") : QStringLiteral("mdy"));
    settings.setValue(QStringLiteral("core/undoLimit"), undoLimit);
    settings.setValue(QStringLiteral("storage/file"), storeFile);
    settings.setValue(QStringLiteral("ui/dimCompleted"), dimCompleted);
}

} // namespace core
} // namespace vical

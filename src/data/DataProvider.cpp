#include "vical/data/DataProvider.hpp"

#include "vical/data/JsonCalendarStore.hpp"

#include <QDir>
#include <QStandardPaths>

namespace vical {
namespace data {

DataProvider::DataProvider(const QString &filePath)
    : m_filePath(filePath.isEmpty() ? defaultStoreFilePath() : QDir::cleanPath(filePath))
    , m_calendarStore(std::make_unique<JsonCalendarStore>(m_filePath))
{
}

DataProvider::~DataProvider() = default;

CalendarStore &DataProvider::calendarStore()
{
    return *m_calendarStore;
}

QString DataProvider::storeFilePath() const
{
    return m_filePath;
}

QString DataProvider::defaultStoreFilePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/vical");
    }
    return QDir(storageFolder).filePath(QStringLiteral("vical.json"));
}

} // namespace data
} // namespace vical

#pragma once

#include <memory>
#include <QString>

namespace vical {
namespace data {

class CalendarStore;

class DataProvider
{
public:
    // An empty path selects the per-user default location.
    explicit DataProvider(const QString &filePath = QString());
    ~DataProvider();

    CalendarStore &calendarStore();
    QString storeFilePath() const;

    static QString defaultStoreFilePath();

private:
    QString m_filePath;
    std::unique_ptr<CalendarStore> m_calendarStore;
};

} // namespace data
} // namespace vical

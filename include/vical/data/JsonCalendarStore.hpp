#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <optional>

#include "vical/data/CalendarStore.hpp"

namespace vical {
namespace data {

class JsonCalendarStore : public CalendarStore
{
public:
    explicit JsonCalendarStore(QString filePath);
    ~JsonCalendarStore() override = default;

    LoadResult load() const override;
    bool save(const CalendarModel &model, QString *errorMessage = nullptr) override;
    QString location() const override;

    static QByteArray encode(const CalendarModel &model);
    static std::optional<CalendarModel> decode(const QByteArray &data, QString *errorMessage);

private:
    static QJsonObject subcalendarToJson(const Subcalendar &subcalendar);
    static QJsonObject taskToJson(const Task &task);

    QString m_filePath;
};

} // namespace data
} // namespace vical

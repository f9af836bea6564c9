#pragma once

#include <QString>
#include <memory>

#include "vical/core/Settings.hpp"
#include "vical/data/CalendarStore.hpp"

namespace vical {
namespace data {
class DataProvider;
class CalendarModel;
}

namespace core {

class UndoStack;

class AppContext
{
public:
    explicit AppContext(const Settings &settings);
    ~AppContext();

    // Replaces the model with the stored one. On Corrupt the model is left
    // empty and |errorMessage| names the problem.
    data::LoadStatus loadModel(QString *errorMessage = nullptr);

    const Settings &settings() const;
    data::CalendarStore &calendarStore();
    data::CalendarModel &model();
    UndoStack &undoStack();
    QString storeFilePath() const;

private:
    Settings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<data::CalendarModel> m_model;
    std::unique_ptr<UndoStack> m_undoStack;
};

} // namespace core
} // namespace vical

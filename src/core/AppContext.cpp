#include "vical/core/AppContext.hpp"

#include "vical/data/CalendarModel.hpp"
#include "vical/data/DataProvider.hpp"

#include "vical/core/UndoStack.hpp"

namespace vical {
namespace core {

AppContext::AppContext(const Settings &settings)
    : m_settings(settings)
    , m_dataProvider(std::make_unique<data::DataProvider>(settings.storeFile))
    , m_model(std::make_unique<data::CalendarModel>())
    , m_undoStack(std::make_unique<UndoStack>(static_cast<std::size_t>(settings.undoLimit)))
{
}

AppContext::~AppContext() = default;

data::LoadStatus AppContext::loadModel(QString *errorMessage)
{
    data::LoadResult result = m_dataProvider->calendarStore().load();
    if (result.status == data::LoadStatus::Corrupt) {
        if (errorMessage) {
            *errorMessage = result.errorMessage;
        }
        return result.status;
    }
    *m_model = std::move(result.model);
    m_undoStack->clear();
    return result.status;
}

const Settings &AppContext::settings() const
{
    return m_settings;
}

data::CalendarStore &AppContext::calendarStore()
{
    return m_dataProvider->calendarStore();
}

data::CalendarModel &AppContext::model()
{
    return *m_model;
}

UndoStack &AppContext::undoStack()
{
    return *m_undoStack;
}

QString AppContext::storeFilePath() const
{
    return m_dataProvider->storeFilePath();
}

} // namespace core
} // namespace vical

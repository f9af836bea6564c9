#include "vical/core/ModelSnapshotCommand.hpp"

namespace vical {
namespace core {

ModelSnapshotCommand::ModelSnapshotCommand(data::CalendarModel &model, data::CalendarModel before,
                                           data::CalendarModel after, QString text)
    : m_model(model)
    , m_before(std::move(before))
    , m_after(std::move(after))
    , m_text(std::move(text))
{
}

void ModelSnapshotCommand::redo()
{
    m_model.restore(m_after);
}

void ModelSnapshotCommand::undo()
{
    m_model.restore(m_before);
}

QString ModelSnapshotCommand::text() const
{
    return m_text;
}

} // namespace core
} // namespace vical

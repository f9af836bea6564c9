#pragma once

#include <QString>

#include "vical/core/UndoCommand.hpp"
#include "vical/data/CalendarModel.hpp"

namespace vical {
namespace core {

// Records a committed mutation as the model state before and after it.
class ModelSnapshotCommand : public UndoCommand
{
public:
    ModelSnapshotCommand(data::CalendarModel &model, data::CalendarModel before,
                         data::CalendarModel after, QString text);

    void redo() override;
    void undo() override;
    QString text() const override;

private:
    data::CalendarModel &m_model;
    data::CalendarModel m_before;
    data::CalendarModel m_after;
    QString m_text;
};

} // namespace core
} // namespace vical

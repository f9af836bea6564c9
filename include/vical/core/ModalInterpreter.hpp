#pragma once

#include <QDate>
#include <QString>
#include <functional>
#include <optional>
#include <vector>

#include "vical/core/CalendarState.hpp"
#include "vical/core/Settings.hpp"
#include "vical/core/ViewSnapshot.hpp"
#include "vical/data/CalendarModel.hpp"
#include "vical/input/Action.hpp"
#include "vical/input/Key.hpp"
#include "vical/input/Mode.hpp"

namespace vical {
namespace data {
class CalendarStore;
}

namespace core {

class UndoStack;

/*
 * Modal state machine between the keyboard and the model. Each mode owns its
 * own buffer and entering a mode clears it. Every committed mutation is
 * written through the store before feed() returns; a failed write rolls the
 * model back to the state the store still holds.
 */
class ModalInterpreter
{
public:
    ModalInterpreter(data::CalendarModel &model, data::CalendarStore &store, UndoStack &undoStack,
                     const Settings &settings, const QDate &today = QDate::currentDate());

    void feed(const input::Key &key);
    // The key source is gone; ends the session like ZQ.
    void inputClosed();

    input::Mode mode() const;
    QString pendingBuffer() const;
    const CalendarState &state() const;
    const StatusMessage &status() const;

    bool shutdownRequested() const;
    int exitCode() const;
    bool lastWriteFailed() const;

    ViewSnapshot snapshot() const;
    std::vector<data::Task> cursorTasks() const;
    std::optional<data::Task> taskAtCursor() const;
    // Last task yanked or deleted.
    const std::optional<data::Task> &registerTask() const;

    // Writes the model as it is. Used for the first save of a new store.
    bool flush();

private:
    void dispatch(const input::Action &action);

    void apply(const input::MoveCursor &action);
    void apply(const input::JumpToMonthStart &action);
    void apply(const input::JumpToMonthEnd &action);
    void apply(const input::JumpToWeekStart &action);
    void apply(const input::JumpToWeekEnd &action);
    void apply(const input::ChangeMonth &action);
    void apply(const input::GotoDate &action);
    void apply(const input::GotoToday &action);
    void apply(const input::CycleSubcalendar &action);
    void apply(const input::SelectTask &action);
    void apply(const input::EnterInsert &action);
    void apply(const input::EnterCommandLine &action);
    void apply(const input::ToggleCompleted &action);
    void apply(const input::DeleteTask &action);
    void apply(const input::YankTask &action);
    void apply(const input::PasteTask &action);
    void apply(const input::ToggleVisibility &action);
    void apply(const input::CycleColorFilter &action);
    void apply(const input::Undo &action);
    void apply(const input::Redo &action);
    void apply(const input::Write &action);
    void apply(const input::Quit &action);
    void apply(const input::WriteQuit &action);
    void apply(const input::CancelPending &action);
    void apply(const input::CommitInsert &action);
    void apply(const input::CancelInput &action);
    void apply(const input::SubmitCommandLine &action);
    void apply(const input::CreateSubcalendar &action);
    void apply(const input::RenameSubcalendar &action);
    void apply(const input::DeleteSubcalendar &action);
    void apply(const input::SetSubcalendarColor &action);
    void apply(const input::CreateTask &action);
    void apply(const input::SetTaskTitle &action);
    void apply(const input::SetTaskDate &action);
    void apply(const input::SetTaskCompleted &action);
    void apply(const input::MoveTaskToSubcalendar &action);

    void enterMode(input::Mode mode);
    void setBuffer(const QString &buffer);
    void setStatus(const QString &text);
    void setError(const QString &text);

    // Saves the mutated model and records it for undo, or restores |before|.
    bool commit(data::CalendarModel before, const QString &description);
    bool createTask(const data::Task &task, const QString &description);
    bool addTaskAtCursor(const QString &title);
    bool updateTaskAtCursor(const QString &description,
                            const std::function<void(data::Task &)> &change);

    std::optional<data::Subcalendar> resolveSubcalendar(const QString &name);
    bool subcalendarNameTaken(const QString &name, data::SubcalendarId except) const;
    data::TaskFilter viewFilter() const;
    void ensureActiveSubcalendar();
    void clampSelection();

    data::CalendarModel &m_model;
    data::CalendarStore &m_store;
    UndoStack &m_undoStack;
    Settings m_settings;
    QDate m_today;

    CalendarState m_state;
    input::Mode m_mode = input::Mode::Normal;
    QString m_normalBuffer;
    QString m_insertBuffer;
    QString m_commandBuffer;
    std::optional<data::TaskId> m_editingTaskId;
    std::optional<data::Task> m_register;

    StatusMessage m_status;
    bool m_shutdownRequested = false;
    bool m_lastWriteFailed = false;
    int m_exitCode = 0;
};

} // namespace core
} // namespace vical

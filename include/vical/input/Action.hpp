#pragma once

#include <QDate>
#include <QString>
#include <optional>
#include <variant>

#include "vical/data/Subcalendar.hpp"

namespace vical {
namespace input {

enum class Direction
{
    Left,
    Right,
    Up,
    Down,
};

// Motions
struct MoveCursor
{
    Direction direction = Direction::Right;
    int steps = 1;
};
struct JumpToMonthStart {};
struct JumpToMonthEnd {};
struct JumpToWeekStart {};
struct JumpToWeekEnd {};
struct ChangeMonth
{
    int months = 1;
};
// Digits typed as a count before "gg", or the argument of ":goto".
struct GotoDate
{
    QString spec;
};
struct GotoToday {};
struct CycleSubcalendar
{
    int steps = 1;
};
struct SelectTask
{
    int steps = 1;
};

// Normal mode commands
struct EnterInsert
{
    bool editSelected = false;
};
struct EnterCommandLine {};
struct ToggleCompleted {};
struct DeleteTask {};
struct YankTask {};
// Without |intoActive| the copy goes back to the subcalendar it came from.
struct PasteTask
{
    bool intoActive = false;
};
// An empty name targets the active subcalendar.
struct ToggleVisibility
{
    QString subcalendar;
};
struct CycleColorFilter {};
struct Undo {};
struct Redo {};
struct Write {};
struct Quit
{
    bool force = false;
};
struct WriteQuit {};
struct CancelPending {};

// Text entry
struct CommitInsert
{
    QString text;
};
struct CancelInput {};
struct SubmitCommandLine
{
    QString line;
};

// Structured command line
struct CreateSubcalendar
{
    QString name;
    std::optional<data::SubcalendarColor> color;
};
struct RenameSubcalendar
{
    QString name;
    QString newName;
};
struct DeleteSubcalendar
{
    QString name;
};
struct SetSubcalendarColor
{
    QString name;
    data::SubcalendarColor color = data::SubcalendarColor::Blue;
};
struct CreateTask
{
    QString title;
};
struct SetTaskTitle
{
    QString title;
};
struct SetTaskDate
{
    QDate date;
};
struct SetTaskCompleted
{
    bool completed = false;
};
struct MoveTaskToSubcalendar
{
    QString subcalendar;
};

using Action = std::variant<MoveCursor,
                            JumpToMonthStart,
                            JumpToMonthEnd,
                            JumpToWeekStart,
                            JumpToWeekEnd,
                            ChangeMonth,
                            GotoDate,
                            GotoToday,
                            CycleSubcalendar,
                            SelectTask,
                            EnterInsert,
                            EnterCommandLine,
                            ToggleCompleted,
                            DeleteTask,
                            YankTask,
                            PasteTask,
                            ToggleVisibility,
                            CycleColorFilter,
                            Undo,
                            Redo,
                            Write,
                            Quit,
                            WriteQuit,
                            CancelPending,
                            CommitInsert,
                            CancelInput,
                            SubmitCommandLine,
                            CreateSubcalendar,
                            RenameSubcalendar,
                            DeleteSubcalendar,
                            SetSubcalendarColor,
                            CreateTask,
                            SetTaskTitle,
                            SetTaskDate,
                            SetTaskCompleted,
                            MoveTaskToSubcalendar>;

} // namespace input
} // namespace vical

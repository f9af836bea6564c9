#include "vical/core/ModalInterpreter.hpp"

#include "vical/core/DateSpec.hpp"
#include "vical/core/Logging.hpp"
#include "vical/core/ModelSnapshotCommand.hpp"
#include "vical/core/UndoStack.hpp"
#include "vical/data/CalendarStore.hpp"
#include "vical/input/CommandGrammar.hpp"

#include <QtGlobal>
#include <memory>

namespace vical {
namespace core {

using input::Mode;

ModalInterpreter::ModalInterpreter(data::CalendarModel &model, data::CalendarStore &store,
                                   UndoStack &undoStack, const Settings &settings, const QDate &today)
    : m_model(model)
    , m_store(store)
    , m_undoStack(undoStack)
    , m_settings(settings)
    , m_today(today.isValid() ? today : QDate::currentDate())
    , m_state(m_today)
{
    ensureActiveSubcalendar();
}

void ModalInterpreter::feed(const input::Key &key)
{
    if (m_shutdownRequested || key.code == input::KeyCode::Resize) {
        return;
    }
    m_status = StatusMessage();

    const input::GrammarResult result = input::resolve(m_mode, pendingBuffer(), key);

    if (const auto *resolved = std::get_if<input::Resolved>(&result)) {
        if (m_mode == Mode::Normal) {
            m_normalBuffer.clear();
        }
        dispatch(resolved->action);
    } else if (const auto *pending = std::get_if<input::Pending>(&result)) {
        setBuffer(pending->buffer);
    } else if (const auto *invalid = std::get_if<input::Invalid>(&result)) {
        if (m_mode == Mode::Normal) {
            qCDebug(lcInput) << "Unknown key sequence" << invalid->sequence;
            m_normalBuffer.clear();
            setError(QStringLiteral("Unknown key sequence: %1").arg(invalid->sequence));
        } else {
            // Text already typed is kept.
            setError(QStringLiteral("Key not allowed here: %1").arg(input::keyDisplayText(key)));
        }
    }

    ensureActiveSubcalendar();
    clampSelection();
}

void ModalInterpreter::inputClosed()
{
    if (m_shutdownRequested) {
        return;
    }
    qCInfo(lcInput) << "Input closed in" << input::modeName(m_mode) << "mode";
    dispatch(input::Quit{ true });
}

Mode ModalInterpreter::mode() const
{
    return m_mode;
}

QString ModalInterpreter::pendingBuffer() const
{
    switch (m_mode) {
    case Mode::Insert:
        return m_insertBuffer;
    case Mode::CommandLine:
        return m_commandBuffer;
    case Mode::Normal:
    default:
        return m_normalBuffer;
    }
}

const CalendarState &ModalInterpreter::state() const
{
    return m_state;
}

const StatusMessage &ModalInterpreter::status() const
{
    return m_status;
}

bool ModalInterpreter::shutdownRequested() const
{
    return m_shutdownRequested;
}

int ModalInterpreter::exitCode() const
{
    return m_exitCode;
}

bool ModalInterpreter::lastWriteFailed() const
{
    return m_lastWriteFailed;
}

ViewSnapshot ModalInterpreter::snapshot() const
{
    ViewSnapshot view;
    view.cursorDate = m_state.cursorDate();
    view.displayedYear = m_state.displayedYear();
    view.displayedMonth = m_state.displayedMonth();
    view.weekStart = m_settings.weekStart;
    view.activeSubcalendarId = m_state.activeSubcalendarId();
    view.activeSubcalendar = m_model.findSubcalendar(m_state.activeSubcalendarId());
    view.selectedTaskIndex = m_state.selectedTaskIndex();
    view.colorFilter = m_state.colorFilter();

    for (const auto &subcalendar : m_model.subcalendars()) {
        if (subcalendar.visible) {
            view.subcalendars.push_back(subcalendar);
        }
    }

    view.gridStart = CalendarState::gridStart(view.displayedYear, view.displayedMonth, m_settings.weekStart);
    const QDate gridEnd = view.gridStart.addDays(CalendarState::GRID_DAYS - 1);
    view.gridTasks = m_model.tasksBetween(view.gridStart, gridEnd, viewFilter());
    view.cursorTasks = cursorTasks();

    view.mode = m_mode;
    view.pendingBuffer = pendingBuffer();
    view.status = m_status;
    return view;
}

std::vector<data::Task> ModalInterpreter::cursorTasks() const
{
    return m_model.tasksOn(m_state.cursorDate(), viewFilter());
}

const std::optional<data::Task> &ModalInterpreter::registerTask() const
{
    return m_register;
}

std::optional<data::Task> ModalInterpreter::taskAtCursor() const
{
    const std::vector<data::Task> tasks = cursorTasks();
    if (tasks.empty()) {
        return std::nullopt;
    }
    const int index = qBound(0, m_state.selectedTaskIndex(), static_cast<int>(tasks.size()) - 1);
    return tasks.at(static_cast<std::size_t>(index));
}

bool ModalInterpreter::flush()
{
    QString errorMessage;
    if (!m_store.save(m_model, &errorMessage)) {
        m_lastWriteFailed = true;
        setError(QStringLiteral("Write failed: %1").arg(errorMessage));
        return false;
    }
    m_lastWriteFailed = false;
    return true;
}

void ModalInterpreter::dispatch(const input::Action &action)
{
    std::visit([this](const auto &alternative) { apply(alternative); }, action);
}

// Motions

void ModalInterpreter::apply(const input::MoveCursor &action)
{
    switch (action.direction) {
    case input::Direction::Left:
        m_state.moveDays(-qint64(action.steps));
        break;
    case input::Direction::Right:
        m_state.moveDays(action.steps);
        break;
    case input::Direction::Up:
        m_state.moveDays(-qint64(action.steps) * 7);
        break;
    case input::Direction::Down:
        m_state.moveDays(qint64(action.steps) * 7);
        break;
    }
}

void ModalInterpreter::apply(const input::JumpToMonthStart &)
{
    m_state.jumpToMonthStart();
}

void ModalInterpreter::apply(const input::JumpToMonthEnd &)
{
    m_state.jumpToMonthEnd();
}

void ModalInterpreter::apply(const input::JumpToWeekStart &)
{
    m_state.jumpToWeekStart(m_settings.weekStart);
}

void ModalInterpreter::apply(const input::JumpToWeekEnd &)
{
    m_state.jumpToWeekEnd(m_settings.weekStart);
}

void ModalInterpreter::apply(const input::ChangeMonth &action)
{
    m_state.moveMonths(action.months);
}

void ModalInterpreter::apply(const input::GotoDate &action)
{
    const std::optional<QDate> date = parseDateSpec(action.spec, m_state.cursorDate(), m_settings.dateOrder);
    if (!date) {
        setError(QStringLiteral("Invalid date: %1").arg(action.spec));
        return;
    }
    m_state.setCursorDate(*date);
}

void ModalInterpreter::apply(const input::GotoToday &)
{
    m_state.setCursorDate(m_today);
}

void ModalInterpreter::apply(const input::CycleSubcalendar &action)
{
    const auto &subcalendars = m_model.subcalendars();
    if (subcalendars.empty()) {
        setError(QStringLiteral("No subcalendars"));
        return;
    }
    const int count = static_cast<int>(subcalendars.size());
    const int current = qMax(0, m_model.subcalendarIndex(m_state.activeSubcalendarId()));
    const int next = ((current + action.steps) % count + count) % count;
    const data::Subcalendar &subcalendar = subcalendars.at(static_cast<std::size_t>(next));
    m_state.setActiveSubcalendarId(subcalendar.id);
    setStatus(QStringLiteral("Active subcalendar: %1").arg(subcalendar.name));
}

void ModalInterpreter::apply(const input::SelectTask &action)
{
    const int count = static_cast<int>(cursorTasks().size());
    if (count == 0) {
        setError(QStringLiteral("No tasks on %1").arg(m_state.cursorDate().toString(Qt::ISODate)));
        return;
    }
    m_state.setSelectedTaskIndex(qBound(0, m_state.selectedTaskIndex() + action.steps, count - 1));
}

// Normal mode commands

void ModalInterpreter::apply(const input::EnterInsert &action)
{
    if (action.editSelected) {
        const std::optional<data::Task> task = taskAtCursor();
        if (!task) {
            setError(QStringLiteral("No task at cursor"));
            return;
        }
        enterMode(Mode::Insert);
        m_editingTaskId = task->id;
        return;
    }
    if (!m_model.findSubcalendar(m_state.activeSubcalendarId())) {
        setError(QStringLiteral("No subcalendar to add tasks to; create one with :new-subcalendar"));
        return;
    }
    enterMode(Mode::Insert);
}

void ModalInterpreter::apply(const input::EnterCommandLine &)
{
    enterMode(Mode::CommandLine);
}

void ModalInterpreter::apply(const input::ToggleCompleted &)
{
    updateTaskAtCursor(QStringLiteral("toggle completed"),
                       [](data::Task &task) { task.completed = !task.completed; });
}

void ModalInterpreter::apply(const input::DeleteTask &)
{
    const std::optional<data::Task> task = taskAtCursor();
    if (!task) {
        setError(QStringLiteral("No task at cursor"));
        return;
    }
    data::CalendarModel before = m_model;
    m_model.removeTask(task->id);
    if (commit(std::move(before), QStringLiteral("delete task"))) {
        m_register = task;
        setStatus(QStringLiteral("Deleted \"%1\"").arg(task->title));
    }
}

void ModalInterpreter::apply(const input::YankTask &)
{
    const std::optional<data::Task> task = taskAtCursor();
    if (!task) {
        setError(QStringLiteral("No task at cursor"));
        return;
    }
    m_register = task;
    setStatus(QStringLiteral("Yanked \"%1\"").arg(task->title));
}

void ModalInterpreter::apply(const input::PasteTask &action)
{
    if (!m_register) {
        setError(QStringLiteral("Nothing to paste"));
        return;
    }

    data::Task task = *m_register;
    task.id = 0;
    task.date = m_state.cursorDate();
    if (action.intoActive || !m_model.findSubcalendar(task.subcalendarId)) {
        task.subcalendarId = m_state.activeSubcalendarId();
    }
    if (!createTask(task, QStringLiteral("paste task"))) {
        return;
    }
    setStatus(QStringLiteral("Pasted \"%1\" into %2").arg(task.title, m_model.findSubcalendar(task.subcalendarId)->name));
}

void ModalInterpreter::apply(const input::ToggleVisibility &action)
{
    std::optional<data::Subcalendar> subcalendar = resolveSubcalendar(action.subcalendar);
    if (!subcalendar) {
        return;
    }
    data::CalendarModel before = m_model;
    subcalendar->visible = !subcalendar->visible;
    m_model.updateSubcalendar(*subcalendar);
    if (commit(std::move(before), QStringLiteral("toggle visibility"))) {
        setStatus(QStringLiteral("%1 is now %2")
                      .arg(subcalendar->name,
                           subcalendar->visible ? QStringLiteral("shown") : QStringLiteral("hidden")));
    }
}

void ModalInterpreter::apply(const input::CycleColorFilter &)
{
    const std::optional<data::SubcalendarColor> current = m_state.colorFilter();
    std::optional<data::SubcalendarColor> next;
    if (!current) {
        next = data::SubcalendarColor::Red;
    } else if (*current != data::SubcalendarColor::White) {
        next = data::nextColor(*current);
    }
    m_state.setColorFilter(next);
    if (next) {
        setStatus(QStringLiteral("Color filter: %1").arg(data::colorToString(*next)));
    } else {
        setStatus(QStringLiteral("Color filter off"));
    }
}

void ModalInterpreter::apply(const input::Undo &)
{
    if (!m_undoStack.canUndo()) {
        setError(QStringLiteral("Already at oldest change"));
        return;
    }
    const QString text = m_undoStack.undo();
    QString errorMessage;
    if (!m_store.save(m_model, &errorMessage)) {
        m_undoStack.redo();
        m_lastWriteFailed = true;
        setError(QStringLiteral("Write failed, undo reverted: %1").arg(errorMessage));
        return;
    }
    m_lastWriteFailed = false;
    setStatus(QStringLiteral("Undo: %1").arg(text));
}

void ModalInterpreter::apply(const input::Redo &)
{
    if (!m_undoStack.canRedo()) {
        setError(QStringLiteral("Already at newest change"));
        return;
    }
    const QString text = m_undoStack.redo();
    QString errorMessage;
    if (!m_store.save(m_model, &errorMessage)) {
        m_undoStack.undo();
        m_lastWriteFailed = true;
        setError(QStringLiteral("Write failed, redo reverted: %1").arg(errorMessage));
        return;
    }
    m_lastWriteFailed = false;
    setStatus(QStringLiteral("Redo: %1").arg(text));
}

void ModalInterpreter::apply(const input::Write &)
{
    if (flush()) {
        setStatus(QStringLiteral("Written %1").arg(m_store.location()));
    }
}

void ModalInterpreter::apply(const input::Quit &action)
{
    if (action.force) {
        m_shutdownRequested = true;
        m_exitCode = m_lastWriteFailed ? 1 : 0;
        return;
    }
    if (m_lastWriteFailed) {
        setError(QStringLiteral("Last write failed; use :w to retry or :q! to quit anyway"));
        return;
    }
    m_shutdownRequested = true;
    m_exitCode = 0;
}

void ModalInterpreter::apply(const input::WriteQuit &)
{
    if (flush()) {
        m_shutdownRequested = true;
        m_exitCode = 0;
    }
}

void ModalInterpreter::apply(const input::CancelPending &)
{
    m_normalBuffer.clear();
}

// Text entry

void ModalInterpreter::apply(const input::CommitInsert &action)
{
    const std::optional<data::TaskId> editingTaskId = m_editingTaskId;
    enterMode(Mode::Normal);

    if (data::isBlankTitle(action.text)) {
        setError(QStringLiteral("Task title cannot be blank"));
        return;
    }

    if (!editingTaskId) {
        addTaskAtCursor(action.text);
        return;
    }

    std::optional<data::Task> task = m_model.findTask(*editingTaskId);
    if (!task) {
        setError(QStringLiteral("Task no longer exists"));
        return;
    }
    data::CalendarModel before = m_model;
    task->title = action.text;
    m_model.updateTask(*task);
    if (commit(std::move(before), QStringLiteral("edit task"))) {
        setStatus(QStringLiteral("Renamed to \"%1\"").arg(action.text));
    }
}

void ModalInterpreter::apply(const input::CancelInput &)
{
    enterMode(Mode::Normal);
}

void ModalInterpreter::apply(const input::SubmitCommandLine &action)
{
    enterMode(Mode::Normal);

    const input::CommandLineResult result = input::parseCommandLine(action.line);
    if (const auto *error = std::get_if<input::CommandLineError>(&result)) {
        qCDebug(lcInput) << "Malformed command line" << action.line;
        setError(error->message);
        return;
    }
    dispatch(std::get<input::Action>(result));
}

// Structured command line

void ModalInterpreter::apply(const input::CreateSubcalendar &action)
{
    const QString name = action.name.trimmed();
    if (name.isEmpty()) {
        setError(QStringLiteral("Subcalendar name cannot be blank"));
        return;
    }
    if (subcalendarNameTaken(name, 0)) {
        setError(QStringLiteral("Subcalendar already exists: %1").arg(name));
        return;
    }

    data::SubcalendarColor color = data::SubcalendarColor::Blue;
    if (action.color) {
        color = *action.color;
    } else if (!m_model.subcalendars().empty()) {
        color = data::nextColor(m_model.subcalendars().back().color);
    }

    data::CalendarModel before = m_model;
    const data::Subcalendar created = m_model.addSubcalendar(name, color);
    if (commit(std::move(before), QStringLiteral("create subcalendar"))) {
        m_state.setActiveSubcalendarId(created.id);
        setStatus(QStringLiteral("Created subcalendar %1").arg(name));
    }
}

void ModalInterpreter::apply(const input::RenameSubcalendar &action)
{
    std::optional<data::Subcalendar> subcalendar = resolveSubcalendar(action.name);
    if (!subcalendar) {
        return;
    }
    const QString newName = action.newName.trimmed();
    if (newName.isEmpty()) {
        setError(QStringLiteral("Subcalendar name cannot be blank"));
        return;
    }
    if (subcalendarNameTaken(newName, subcalendar->id)) {
        setError(QStringLiteral("Subcalendar already exists: %1").arg(newName));
        return;
    }

    data::CalendarModel before = m_model;
    const QString oldName = subcalendar->name;
    subcalendar->name = newName;
    m_model.updateSubcalendar(*subcalendar);
    if (commit(std::move(before), QStringLiteral("rename subcalendar"))) {
        setStatus(QStringLiteral("Renamed %1 to %2").arg(oldName, newName));
    }
}

void ModalInterpreter::apply(const input::DeleteSubcalendar &action)
{
    const std::optional<data::Subcalendar> subcalendar = resolveSubcalendar(action.name);
    if (!subcalendar) {
        return;
    }
    data::CalendarModel before = m_model;
    int removedTasks = 0;
    m_model.removeSubcalendar(subcalendar->id, &removedTasks);
    if (commit(std::move(before), QStringLiteral("delete subcalendar"))) {
        setStatus(QStringLiteral("Deleted subcalendar %1 and %2 task(s)")
                      .arg(subcalendar->name)
                      .arg(removedTasks));
    }
}

void ModalInterpreter::apply(const input::SetSubcalendarColor &action)
{
    std::optional<data::Subcalendar> subcalendar = resolveSubcalendar(action.name);
    if (!subcalendar) {
        return;
    }
    data::CalendarModel before = m_model;
    subcalendar->color = action.color;
    m_model.updateSubcalendar(*subcalendar);
    if (commit(std::move(before), QStringLiteral("set color"))) {
        setStatus(QStringLiteral("%1 is now %2").arg(subcalendar->name, data::colorToString(action.color)));
    }
}

void ModalInterpreter::apply(const input::CreateTask &action)
{
    if (data::isBlankTitle(action.title)) {
        setError(QStringLiteral("Task title cannot be blank"));
        return;
    }
    addTaskAtCursor(action.title);
}

void ModalInterpreter::apply(const input::SetTaskTitle &action)
{
    if (data::isBlankTitle(action.title)) {
        setError(QStringLiteral("Task title cannot be blank"));
        return;
    }
    updateTaskAtCursor(QStringLiteral("edit task"), [&action](data::Task &task) { task.title = action.title; });
}

void ModalInterpreter::apply(const input::SetTaskDate &action)
{
    updateTaskAtCursor(QStringLiteral("move task"), [&action](data::Task &task) { task.date = action.date; });
}

void ModalInterpreter::apply(const input::SetTaskCompleted &action)
{
    updateTaskAtCursor(QStringLiteral("set completed"),
                       [&action](data::Task &task) { task.completed = action.completed; });
}

void ModalInterpreter::apply(const input::MoveTaskToSubcalendar &action)
{
    if (!taskAtCursor()) {
        setError(QStringLiteral("No task at cursor"));
        return;
    }
    const std::optional<data::Subcalendar> owner = m_model.findSubcalendarByName(action.subcalendar.trimmed());
    if (!owner) {
        setError(QStringLiteral("No such subcalendar: %1").arg(action.subcalendar));
        return;
    }
    updateTaskAtCursor(QStringLiteral("move task"), [&owner](data::Task &task) { task.subcalendarId = owner->id; });
}

// Helpers

void ModalInterpreter::enterMode(Mode mode)
{
    m_mode = mode;
    m_normalBuffer.clear();
    m_insertBuffer.clear();
    m_commandBuffer.clear();
    m_editingTaskId.reset();
}

void ModalInterpreter::setBuffer(const QString &buffer)
{
    switch (m_mode) {
    case Mode::Insert:
        m_insertBuffer = buffer;
        break;
    case Mode::CommandLine:
        m_commandBuffer = buffer;
        break;
    case Mode::Normal:
        m_normalBuffer = buffer;
        break;
    }
}

void ModalInterpreter::setStatus(const QString &text)
{
    m_status = StatusMessage{ text, false };
}

void ModalInterpreter::setError(const QString &text)
{
    m_status = StatusMessage{ text, true };
}

bool ModalInterpreter::commit(data::CalendarModel before, const QString &description)
{
    QString errorMessage;
    if (!m_store.save(m_model, &errorMessage)) {
        qCWarning(lcApp).noquote() << "Rolling back" << description << "after failed write:" << errorMessage;
        m_model.restore(before);
        m_lastWriteFailed = true;
        setError(QStringLiteral("Write failed, %1 not applied: %2").arg(description, errorMessage));
        return false;
    }
    m_lastWriteFailed = false;

    data::CalendarModel after = m_model;
    m_undoStack.push(std::make_unique<ModelSnapshotCommand>(m_model, std::move(before), std::move(after),
                                                            description));
    qCDebug(lcApp) << "Committed" << description;
    return true;
}

bool ModalInterpreter::createTask(const data::Task &task, const QString &description)
{
    if (!m_model.findSubcalendar(task.subcalendarId)) {
        setError(QStringLiteral("No subcalendar to add the task to"));
        return false;
    }

    data::CalendarModel before = m_model;
    const std::optional<data::Task> created = m_model.addTask(task);
    if (!created) {
        setError(QStringLiteral("Cannot add task \"%1\"").arg(task.title));
        return false;
    }
    if (!commit(std::move(before), description)) {
        return false;
    }

    const std::vector<data::Task> tasks = cursorTasks();
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        if (tasks[i].id == created->id) {
            m_state.setSelectedTaskIndex(static_cast<int>(i));
            break;
        }
    }
    return true;
}

bool ModalInterpreter::addTaskAtCursor(const QString &title)
{
    data::Task task;
    task.subcalendarId = m_state.activeSubcalendarId();
    task.date = m_state.cursorDate();
    task.title = title;
    if (!createTask(task, QStringLiteral("add task"))) {
        return false;
    }
    setStatus(QStringLiteral("Added \"%1\" to %2").arg(title, m_model.findSubcalendar(task.subcalendarId)->name));
    return true;
}

bool ModalInterpreter::updateTaskAtCursor(const QString &description,
                                          const std::function<void(data::Task &)> &change)
{
    std::optional<data::Task> task = taskAtCursor();
    if (!task) {
        setError(QStringLiteral("No task at cursor"));
        return false;
    }

    data::CalendarModel before = m_model;
    change(*task);
    if (!m_model.updateTask(*task)) {
        setError(QStringLiteral("Task references a missing subcalendar"));
        return false;
    }
    if (!commit(std::move(before), description)) {
        return false;
    }
    setStatus(QStringLiteral("Task updated"));
    return true;
}

std::optional<data::Subcalendar> ModalInterpreter::resolveSubcalendar(const QString &name)
{
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty()) {
        std::optional<data::Subcalendar> active = m_model.findSubcalendar(m_state.activeSubcalendarId());
        if (!active) {
            setError(QStringLiteral("No active subcalendar"));
        }
        return active;
    }

    std::optional<data::Subcalendar> subcalendar = m_model.findSubcalendarByName(trimmed);
    if (!subcalendar) {
        setError(QStringLiteral("No such subcalendar: %1").arg(trimmed));
    }
    return subcalendar;
}

bool ModalInterpreter::subcalendarNameTaken(const QString &name, data::SubcalendarId except) const
{
    for (const auto &subcalendar : m_model.subcalendars()) {
        if (subcalendar.id != except && subcalendar.name == name) {
            return true;
        }
    }
    return false;
}

data::TaskFilter ModalInterpreter::viewFilter() const
{
    data::TaskFilter filter;
    filter.visibleOnly = true;
    filter.color = m_state.colorFilter();
    return filter;
}

void ModalInterpreter::ensureActiveSubcalendar()
{
    if (m_model.findSubcalendar(m_state.activeSubcalendarId())) {
        return;
    }
    const auto &subcalendars = m_model.subcalendars();
    m_state.setActiveSubcalendarId(subcalendars.empty() ? 0 : subcalendars.front().id);
}

void ModalInterpreter::clampSelection()
{
    const int count = static_cast<int>(cursorTasks().size());
    if (m_state.selectedTaskIndex() >= count) {
        m_state.setSelectedTaskIndex(count - 1);
    }
}

} // namespace core
} // namespace vical

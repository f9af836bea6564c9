#include "vical/ui/TerminalView.hpp"

#include <QLocale>
#include <QMap>
#include <clocale>
#include <ncurses.h>
#include <string>

namespace vical {
namespace ui {

namespace {
constexpr int CELL_WIDTH = 10;
constexpr int GRID_TOP = 2;
constexpr int WEEK_ROWS = 6;
constexpr int LEGEND_COLUMN = 7 * CELL_WIDTH + 3;
constexpr int ERROR_PAIR = 8;
constexpr int ESCAPE_KEY = 27;
constexpr int ESCAPE_DELAY_MS = 25;
// get_wch() blocks, so a run of errors means stdin is gone.
constexpr int MAX_READ_ERRORS = 8;

int colorPair(data::SubcalendarColor color)
{
    return static_cast<int>(color) + 1;
}

short cursesColor(data::SubcalendarColor color)
{
    switch (color) {
    case data::SubcalendarColor::Red:
        return COLOR_RED;
    case data::SubcalendarColor::Green:
        return COLOR_GREEN;
    case data::SubcalendarColor::Yellow:
        return COLOR_YELLOW;
    case data::SubcalendarColor::Blue:
        return COLOR_BLUE;
    case data::SubcalendarColor::Magenta:
        return COLOR_MAGENTA;
    case data::SubcalendarColor::Cyan:
        return COLOR_CYAN;
    case data::SubcalendarColor::White:
    default:
        return COLOR_WHITE;
    }
}

input::Key translateKeyCode(wint_t code)
{
    switch (code) {
    case KEY_LEFT:
        return input::Key::special(input::KeyCode::Left);
    case KEY_RIGHT:
        return input::Key::special(input::KeyCode::Right);
    case KEY_UP:
        return input::Key::special(input::KeyCode::Up);
    case KEY_DOWN:
        return input::Key::special(input::KeyCode::Down);
    case KEY_ENTER:
        return input::Key::special(input::KeyCode::Enter);
    case KEY_BACKSPACE:
        return input::Key::special(input::KeyCode::Backspace);
    case KEY_RESIZE:
        return input::Key::special(input::KeyCode::Resize);
    default:
        return input::Key::special(input::KeyCode::Unknown);
    }
}
} // namespace

TerminalView::TerminalView(bool dimCompleted)
    : m_dimCompleted(dimCompleted)
{
    std::setlocale(LC_ALL, "");
    initscr();
    raw();
    noecho();
    keypad(stdscr, TRUE);
    set_escdelay(ESCAPE_DELAY_MS);
    curs_set(0);

    m_hasColors = has_colors();
    if (m_hasColors) {
        start_color();
        use_default_colors();
        for (data::SubcalendarColor color : { data::SubcalendarColor::Red, data::SubcalendarColor::Green,
                                              data::SubcalendarColor::Yellow, data::SubcalendarColor::Blue,
                                              data::SubcalendarColor::Magenta, data::SubcalendarColor::Cyan,
                                              data::SubcalendarColor::White }) {
            init_pair(static_cast<short>(colorPair(color)), cursesColor(color), -1);
        }
        init_pair(ERROR_PAIR, COLOR_RED, -1);
    }
}

TerminalView::~TerminalView()
{
    endwin();
}

std::optional<input::Key> TerminalView::readKey()
{
    wint_t code = 0;
    int kind = get_wch(&code);
    for (int errors = 1; kind == ERR; ++errors) {
        if (errors >= MAX_READ_ERRORS) {
            return std::nullopt;
        }
        kind = get_wch(&code);
    }
    if (kind == KEY_CODE_YES) {
        return translateKeyCode(code);
    }

    switch (code) {
    case ESCAPE_KEY:
        return input::Key::special(input::KeyCode::Escape);
    case L'\n':
    case L'\r':
        return input::Key::special(input::KeyCode::Enter);
    case 127:
    case 8:
        return input::Key::special(input::KeyCode::Backspace);
    default:
        break;
    }
    if (code > 0xFFFF) {
        return input::Key::special(input::KeyCode::Unknown);
    }
    return input::Key::character(QChar(static_cast<ushort>(code)));
}

void TerminalView::render(const core::ViewSnapshot &view)
{
    erase();
    drawTitle(view);
    drawGrid(view);
    drawLegend(view);
    drawTaskList(view);
    drawStatusLine(view);
    refresh();
}

void TerminalView::drawTitle(const core::ViewSnapshot &view)
{
    const QLocale locale;
    const QString title = QStringLiteral("%1 %2")
                        .arg(locale.standaloneMonthName(view.displayedMonth))
                        .arg(view.displayedYear);
    attron(A_BOLD);
    print(0, 1, title);
    attroff(A_BOLD);

    if (view.colorFilter) {
        print(0, LEGEND_COLUMN, QStringLiteral("filter: %1").arg(data::colorToString(*view.colorFilter)));
    }

    for (int column = 0; column < 7; ++column) {
        const int day = (view.weekStart - 1 + column) % 7 + 1;
        print(1, column * CELL_WIDTH + 1, locale.dayName(day, QLocale::ShortFormat), CELL_WIDTH - 1);
    }
}

void TerminalView::drawGrid(const core::ViewSnapshot &view)
{
    const QDate today = QDate::currentDate();
    for (int cell = 0; cell < 7 * WEEK_ROWS; ++cell) {
        const QDate date = view.gridStart.addDays(cell);
        const int row = GRID_TOP + cell / 7;
        const int column = (cell % 7) * CELL_WIDTH + 1;

        int attributes = A_NORMAL;
        if (date.month() != view.displayedMonth) {
            attributes |= A_DIM;
        }
        if (date == today) {
            attributes |= A_BOLD;
        }
        if (date == view.cursorDate) {
            attributes |= A_REVERSE;
        }
        attron(attributes);
        print(row, column, QStringLiteral("%1").arg(date.day(), 2));
        attroff(attributes);

        // Open task count per subcalendar, in the subcalendar's color.
        QMap<data::SubcalendarId, int> openBySubcalendar;
        for (const auto &task : view.tasksOn(date)) {
            if (!task.completed) {
                ++openBySubcalendar[task.subcalendarId];
            }
        }
        int offset = 3;
        for (const auto &subcalendar : view.subcalendars) {
            const int open = openBySubcalendar.value(subcalendar.id);
            if (open == 0 || offset >= CELL_WIDTH - 1) {
                continue;
            }
            const QString count = QString::number(open);
            if (m_hasColors) {
                attron(COLOR_PAIR(colorPair(subcalendar.color)));
            }
            print(row, column + offset, count, CELL_WIDTH - 1 - offset);
            if (m_hasColors) {
                attroff(COLOR_PAIR(colorPair(subcalendar.color)));
            }
            offset += count.size() + 1;
        }
    }
}

void TerminalView::drawLegend(const core::ViewSnapshot &view)
{
    int row = GRID_TOP;
    if (view.activeSubcalendar) {
        print(row++, LEGEND_COLUMN, QStringLiteral("active: %1").arg(view.activeSubcalendar->name));
    }
    for (const auto &subcalendar : view.subcalendars) {
        const bool active = subcalendar.id == view.activeSubcalendarId;
        if (m_hasColors) {
            attron(COLOR_PAIR(colorPair(subcalendar.color)));
        }
        print(row++, LEGEND_COLUMN, QStringLiteral("%1 %2").arg(active ? QLatin1Char('*') : QLatin1Char(' ')).arg(subcalendar.name));
        if (m_hasColors) {
            attroff(COLOR_PAIR(colorPair(subcalendar.color)));
        }
    }
}

void TerminalView::drawTaskList(const core::ViewSnapshot &view)
{
    int row = GRID_TOP + WEEK_ROWS + 1;
    attron(A_BOLD);
    print(row++, 1, view.cursorDate.toString(Qt::ISODate));
    attroff(A_BOLD);

    if (view.cursorTasks.empty()) {
        attron(A_DIM);
        print(row, 3, QStringLiteral("no tasks"));
        attroff(A_DIM);
        return;
    }

    const int lastRow = LINES - 2;
    for (std::size_t i = 0; i < view.cursorTasks.size() && row <= lastRow; ++i, ++row) {
        const data::Task &task = view.cursorTasks[i];
        const std::optional<data::Subcalendar> owner = view.subcalendar(task.subcalendarId);
        const bool selected = static_cast<int>(i) == view.selectedTaskIndex;

        print(row, 1, selected ? QStringLiteral(">") : QStringLiteral(" "));
        int attributes = A_NORMAL;
        if (task.completed && m_dimCompleted) {
            attributes |= A_DIM;
        }
        if (owner && m_hasColors) {
            attributes |= COLOR_PAIR(colorPair(owner->color));
        }
        attron(attributes);
        print(row, 3, QStringLiteral("[%1] %2").arg(task.completed ? QLatin1Char('x') : QLatin1Char(' ')).arg(task.title),
              COLS - 4);
        attroff(attributes);
    }
}

void TerminalView::drawStatusLine(const core::ViewSnapshot &view)
{
    const int row = LINES - 1;
    switch (view.mode) {
    case input::Mode::CommandLine:
        print(row, 0, QLatin1Char(':') + view.pendingBuffer);
        // Text modes keep the typed text on the last row, so messages go above it.
        drawStatusMessage(row - 1, view.status);
        return;
    case input::Mode::Insert:
        attron(A_BOLD);
        print(row, 0, QStringLiteral("-- %1 --").arg(input::modeName(view.mode)));
        attroff(A_BOLD);
        print(row, 12, view.pendingBuffer);
        drawStatusMessage(row - 1, view.status);
        return;
    case input::Mode::Normal:
        break;
    }

    drawStatusMessage(row, view.status, COLS - 12);
    if (!view.pendingBuffer.isEmpty()) {
        print(row, COLS - 10, view.pendingBuffer, 9);
    }
}

void TerminalView::drawStatusMessage(int row, const core::StatusMessage &status, int maxWidth)
{
    if (status.isEmpty()) {
        return;
    }
    const int attributes = status.isError && m_hasColors ? COLOR_PAIR(ERROR_PAIR) : A_NORMAL;
    move(row, 0);
    clrtoeol();
    attron(attributes);
    print(row, 0, status.text, maxWidth);
    attroff(attributes);
}

void TerminalView::print(int row, int column, const QString &text, int maxWidth)
{
    if (row < 0 || row >= LINES || column < 0 || column >= COLS) {
        return;
    }
    const int width = maxWidth < 0 ? COLS - column : qMin(maxWidth, COLS - column);
    const std::wstring wide = text.left(width).toStdWString();
    mvaddnwstr(row, column, wide.c_str(), static_cast<int>(wide.size()));
}

} // namespace ui
} // namespace vical

#include "vical/input/CommandGrammar.hpp"

#include <QDate>

namespace vical {
namespace input {

namespace {
constexpr auto ISO_DATE_FORMAT = "yyyy-MM-dd";

struct NormalBuffer
{
    QString count;
    QString prefix;
};

NormalBuffer splitNormalBuffer(const QString &pending)
{
    NormalBuffer buffer;
    int i = 0;
    while (i < pending.size() && pending.at(i).isDigit()) {
        ++i;
    }
    buffer.count = pending.left(i);
    buffer.prefix = pending.mid(i);
    return buffer;
}

bool isPrefix(QChar ch)
{
    return ch == QLatin1Char('g') || ch == QLatin1Char('c') || ch == QLatin1Char('d')
        || ch == QLatin1Char('z') || ch == QLatin1Char('Z');
}

GrammarResult invalid(const QString &pending, const Key &key)
{
    return Invalid{ pending + keyDisplayText(key) };
}

GrammarResult resolveSpecial(const QString &pending, const Key &key, int count)
{
    switch (key.code) {
    case KeyCode::Left:
        return Resolved{ MoveCursor{ Direction::Left, count } };
    case KeyCode::Right:
        return Resolved{ MoveCursor{ Direction::Right, count } };
    case KeyCode::Up:
        return Resolved{ MoveCursor{ Direction::Up, count } };
    case KeyCode::Down:
        return Resolved{ MoveCursor{ Direction::Down, count } };
    default:
        return invalid(pending, key);
    }
}

GrammarResult resolvePrefixed(const QString &pending, const NormalBuffer &buffer, const Key &key, int count)
{
    if (key.code != KeyCode::Character) {
        return invalid(pending, key);
    }
    const QChar prefix = buffer.prefix.at(0);
    const char ch = key.text.toLatin1();

    if (prefix == QLatin1Char('g')) {
        switch (ch) {
        case 'g':
            if (buffer.count.isEmpty()) {
                return Resolved{ JumpToMonthStart{} };
            }
            return Resolved{ GotoDate{ buffer.count } };
        case 't':
            return Resolved{ GotoToday{} };
        case '0':
            return Resolved{ JumpToWeekStart{} };
        case '$':
            return Resolved{ JumpToWeekEnd{} };
        case 'j':
            return Resolved{ SelectTask{ count } };
        case 'k':
            return Resolved{ SelectTask{ -count } };
        default:
            break;
        }
    } else if (prefix == QLatin1Char('c')) {
        if (ch == 'c') {
            return Resolved{ EnterInsert{ true } };
        }
    } else if (prefix == QLatin1Char('d')) {
        if (ch == 'd') {
            return Resolved{ DeleteTask{} };
        }
    } else if (prefix == QLatin1Char('z')) {
        if (ch == 'c') {
            return Resolved{ ToggleVisibility{} };
        }
        if (ch == 'f') {
            return Resolved{ CycleColorFilter{} };
        }
    } else if (prefix == QLatin1Char('Z')) {
        if (ch == 'Z') {
            return Resolved{ WriteQuit{} };
        }
        if (ch == 'Q') {
            return Resolved{ Quit{ true } };
        }
    }
    return invalid(pending, key);
}

GrammarResult resolveNormal(const QString &pending, const Key &key)
{
    if (key.code == KeyCode::Escape) {
        return Resolved{ CancelPending{} };
    }

    const NormalBuffer buffer = splitNormalBuffer(pending);
    const int count = buffer.count.isEmpty() ? 1 : buffer.count.toInt();

    if (!buffer.prefix.isEmpty()) {
        return resolvePrefixed(pending, buffer, key, count);
    }

    if (key.isDigit() && !(key.is(QLatin1Char('0')) && buffer.count.isEmpty())) {
        if (buffer.count.size() >= MAX_COUNT_DIGITS) {
            return invalid(pending, key);
        }
        return Pending{ pending + key.text };
    }

    if (key.code != KeyCode::Character) {
        return resolveSpecial(pending, key, count);
    }

    if (isPrefix(key.text)) {
        return Pending{ pending + key.text };
    }
    if (key.text.unicode() == CTRL_R) {
        return Resolved{ Redo{} };
    }

    switch (key.text.toLatin1()) {
    case 'h':
        return Resolved{ MoveCursor{ Direction::Left, count } };
    case 'l':
        return Resolved{ MoveCursor{ Direction::Right, count } };
    case 'k':
        return Resolved{ MoveCursor{ Direction::Up, count } };
    case 'j':
        return Resolved{ MoveCursor{ Direction::Down, count } };
    case '0':
        return Resolved{ JumpToMonthStart{} };
    case '$':
        return Resolved{ JumpToMonthEnd{} };
    case '}':
        return Resolved{ ChangeMonth{ count } };
    case '{':
        return Resolved{ ChangeMonth{ -count } };
    case ']':
        return Resolved{ CycleSubcalendar{ count } };
    case '[':
        return Resolved{ CycleSubcalendar{ -count } };
    case 'i':
    case 'T':
        return Resolved{ EnterInsert{ false } };
    case ':':
        return Resolved{ EnterCommandLine{} };
    case ' ':
        return Resolved{ ToggleCompleted{} };
    case 'y':
        return Resolved{ YankTask{} };
    case 'p':
        return Resolved{ PasteTask{ false } };
    case 'P':
        return Resolved{ PasteTask{ true } };
    case 'u':
        return Resolved{ Undo{} };
    case 'U':
        return Resolved{ Redo{} };
    default:
        return invalid(pending, key);
    }
}

GrammarResult resolveText(Mode mode, const QString &pending, const Key &key)
{
    switch (key.code) {
    case KeyCode::Escape:
        return Resolved{ CancelInput{} };
    case KeyCode::Enter:
        if (mode == Mode::Insert) {
            return Resolved{ CommitInsert{ pending } };
        }
        return Resolved{ SubmitCommandLine{ pending } };
    case KeyCode::Backspace:
        if (pending.isEmpty() && mode == Mode::CommandLine) {
            return Resolved{ CancelInput{} };
        }
        return Pending{ pending.left(pending.size() - 1) };
    case KeyCode::Character:
        if (key.isPrintable()) {
            return Pending{ pending + key.text };
        }
        return invalid(pending, key);
    default:
        return invalid(pending, key);
    }
}

CommandLineResult commandError(const QString &message)
{
    return CommandLineError{ message };
}

CommandLineResult wrongArguments(const QString &usage)
{
    return commandError(QStringLiteral("Usage: %1").arg(usage));
}

std::optional<data::SubcalendarColor> parseColorArgument(const QString &value, QString *message)
{
    const auto color = data::colorFromString(value);
    if (!color) {
        *message = QStringLiteral("Unknown color '%1' (expected %2)")
                       .arg(value, data::colorNames().join(QStringLiteral(", ")));
    }
    return color;
}

std::optional<bool> parseBool(const QString &value)
{
    const QString normalized = value.toLower();
    if (normalized == QLatin1String("true") || normalized == QLatin1String("yes")
        || normalized == QLatin1String("1")) {
        return true;
    }
    if (normalized == QLatin1String("false") || normalized == QLatin1String("no")
        || normalized == QLatin1String("0")) {
        return false;
    }
    return std::nullopt;
}

CommandLineResult parseSetTask(const QStringList &args)
{
    const QString usage = QStringLiteral("set-task title|date|completed|subcalendar VALUE");
    if (args.size() < 2) {
        return wrongArguments(usage);
    }
    const QString field = args.at(0).toLower();
    const QString value = args.mid(1).join(QLatin1Char(' '));

    if (field == QLatin1String("title")) {
        return Action(SetTaskTitle{ value });
    }
    if (field == QLatin1String("date")) {
        const QDate date = QDate::fromString(value, QLatin1String(ISO_DATE_FORMAT));
        if (!date.isValid() || value.size() != 10) {
            return commandError(QStringLiteral("Invalid date '%1' (expected YYYY-MM-DD)").arg(value));
        }
        return Action(SetTaskDate{ date });
    }
    if (field == QLatin1String("completed")) {
        const auto completed = parseBool(value);
        if (!completed) {
            return commandError(QStringLiteral("Invalid value '%1' for completed (expected true or false)").arg(value));
        }
        return Action(SetTaskCompleted{ *completed });
    }
    if (field == QLatin1String("subcalendar")) {
        return Action(MoveTaskToSubcalendar{ value });
    }
    return commandError(QStringLiteral("Unknown task field '%1'").arg(args.at(0)));
}
} // namespace

GrammarResult resolve(Mode mode, const QString &pending, const Key &key)
{
    if (mode == Mode::Normal) {
        return resolveNormal(pending, key);
    }
    return resolveText(mode, pending, key);
}

CommandLineResult parseCommandLine(const QString &line)
{
    QStringList tokens;
    if (!tokenizeCommandLine(line, &tokens)) {
        return commandError(QStringLiteral("Unterminated quote"));
    }
    if (tokens.isEmpty()) {
        return Action(CancelInput{});
    }

    const QString name = tokens.takeFirst();
    const QStringList &args = tokens;
    const auto noArguments = [&](Action action) -> CommandLineResult {
        if (!args.isEmpty()) {
            return commandError(QStringLiteral("Trailing characters: %1").arg(args.join(QLatin1Char(' '))));
        }
        return action;
    };

    if (name == QLatin1String("q") || name == QLatin1String("quit")) {
        return noArguments(Quit{ false });
    }
    if (name == QLatin1String("q!") || name == QLatin1String("quit!")) {
        return noArguments(Quit{ true });
    }
    if (name == QLatin1String("w") || name == QLatin1String("write")) {
        return noArguments(Write{});
    }
    if (name == QLatin1String("wq") || name == QLatin1String("x")) {
        return noArguments(WriteQuit{});
    }
    if (name == QLatin1String("undo")) {
        return noArguments(Undo{});
    }
    if (name == QLatin1String("redo")) {
        return noArguments(Redo{});
    }
    if (name == QLatin1String("today")) {
        return noArguments(GotoToday{});
    }
    if (name == QLatin1String("complete")) {
        return noArguments(ToggleCompleted{});
    }
    if (name == QLatin1String("delete")) {
        return noArguments(DeleteTask{});
    }

    if (name == QLatin1String("new-subcalendar") || name == QLatin1String("newcal")) {
        if (args.isEmpty() || args.size() > 2) {
            return wrongArguments(QStringLiteral("new-subcalendar NAME [COLOR]"));
        }
        CreateSubcalendar action;
        action.name = args.at(0);
        if (args.size() == 2) {
            QString message;
            action.color = parseColorArgument(args.at(1), &message);
            if (!action.color) {
                return commandError(message);
            }
        }
        return Action(action);
    }
    if (name == QLatin1String("rename-subcalendar") || name == QLatin1String("renamecal")) {
        if (args.size() == 1) {
            return Action(RenameSubcalendar{ QString(), args.at(0) });
        }
        if (args.size() == 2) {
            return Action(RenameSubcalendar{ args.at(0), args.at(1) });
        }
        return wrongArguments(QStringLiteral("rename-subcalendar [NAME] NEW-NAME"));
    }
    if (name == QLatin1String("delete-subcalendar") || name == QLatin1String("delcal")) {
        if (args.size() > 1) {
            return wrongArguments(QStringLiteral("delete-subcalendar [NAME]"));
        }
        return Action(DeleteSubcalendar{ args.value(0) });
    }
    if (name == QLatin1String("color") || name == QLatin1String("set-color")) {
        if (args.isEmpty() || args.size() > 2) {
            return wrongArguments(QStringLiteral("color [NAME] COLOR"));
        }
        QString message;
        const auto color = parseColorArgument(args.last(), &message);
        if (!color) {
            return commandError(message);
        }
        return Action(SetSubcalendarColor{ args.size() == 2 ? args.at(0) : QString(), *color });
    }
    if (name == QLatin1String("hide") || name == QLatin1String("toggle-subcalendar")) {
        if (args.size() > 1) {
            return wrongArguments(QStringLiteral("hide [NAME]"));
        }
        return Action(ToggleVisibility{ args.value(0) });
    }
    if (name == QLatin1String("new-task") || name == QLatin1String("newtask")) {
        if (args.isEmpty()) {
            return wrongArguments(QStringLiteral("new-task TITLE"));
        }
        return Action(CreateTask{ args.join(QLatin1Char(' ')) });
    }
    if (name == QLatin1String("set-task") || name == QLatin1String("set")) {
        return parseSetTask(args);
    }
    if (name == QLatin1String("rename")) {
        if (args.isEmpty()) {
            return wrongArguments(QStringLiteral("rename TITLE"));
        }
        return Action(SetTaskTitle{ args.join(QLatin1Char(' ')) });
    }
    if (name == QLatin1String("goto")) {
        if (args.size() != 1) {
            return wrongArguments(QStringLiteral("goto DATE"));
        }
        return Action(GotoDate{ args.at(0) });
    }

    return commandError(QStringLiteral("Not an editor command: %1").arg(name));
}

bool tokenizeCommandLine(const QString &line, QStringList *tokens)
{
    tokens->clear();
    QString current;
    bool inToken = false;
    bool quoted = false;

    for (const QChar ch : line) {
        if (quoted) {
            if (ch == QLatin1Char('"')) {
                quoted = false;
            } else {
                current += ch;
            }
            continue;
        }
        if (ch == QLatin1Char('"')) {
            quoted = true;
            inToken = true;
        } else if (ch.isSpace()) {
            if (inToken) {
                tokens->append(current);
                current.clear();
                inToken = false;
            }
        } else {
            current += ch;
            inToken = true;
        }
    }
    if (quoted) {
        return false;
    }
    if (inToken) {
        tokens->append(current);
    }
    return true;
}

QString keyDisplayText(const Key &key)
{
    switch (key.code) {
    case KeyCode::Character:
        if (key.text.unicode() == CTRL_R) {
            return QStringLiteral("<C-r>");
        }
        if (key.text == QLatin1Char(' ')) {
            return QStringLiteral("<Space>");
        }
        if (!key.text.isPrint()) {
            return QStringLiteral("<0x%1>").arg(key.text.unicode(), 2, 16, QLatin1Char('0'));
        }
        return QString(key.text);
    case KeyCode::Left:
        return QStringLiteral("<Left>");
    case KeyCode::Right:
        return QStringLiteral("<Right>");
    case KeyCode::Up:
        return QStringLiteral("<Up>");
    case KeyCode::Down:
        return QStringLiteral("<Down>");
    case KeyCode::Enter:
        return QStringLiteral("<CR>");
    case KeyCode::Escape:
        return QStringLiteral("<Esc>");
    case KeyCode::Backspace:
        return QStringLiteral("<BS>");
    case KeyCode::Resize:
        return QStringLiteral("<Resize>");
    case KeyCode::Unknown:
    default:
        return QStringLiteral("<?>");
    }
}

} // namespace input
} // namespace vical

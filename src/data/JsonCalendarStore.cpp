#include "vical/data/JsonCalendarStore.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>
#include <cmath>

#include "vical/core/Logging.hpp"

namespace vical {
namespace data {

namespace {
constexpr int FORMAT_VERSION = 1;
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
// Largest integer a JSON number carries without loss. The id counters may
// reach it, so stored entity ids stay one below.
constexpr double MAX_COUNTER = 9007199254740991.0;
constexpr double MAX_ID = MAX_COUNTER - 1.0;

void setError(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

bool readId(const QJsonValue &value, qint64 *out, double max = MAX_ID)
{
    if (!value.isDouble()) {
        return false;
    }
    const double number = value.toDouble();
    if (number < 1.0 || number > max || std::floor(number) != number) {
        return false;
    }
    *out = static_cast<qint64>(number);
    return true;
}

QDate parseDate(const QJsonValue &value)
{
    if (!value.isString()) {
        return {};
    }
    const QString text = value.toString();
    if (text.size() != 10) {
        return {};
    }
    return QDate::fromString(text, QLatin1String(DATE_FORMAT));
}

std::optional<Subcalendar> subcalendarFromJson(const QJsonValue &value, int index, QString *errorMessage)
{
    const auto fail = [&](const QString &what) -> std::optional<Subcalendar> {
        setError(errorMessage, QStringLiteral("subcalendars[%1]: %2").arg(index).arg(what));
        return std::nullopt;
    };

    if (!value.isObject()) {
        return fail(QStringLiteral("expected an object"));
    }
    const QJsonObject object = value.toObject();

    Subcalendar subcalendar;
    if (!readId(object.value(QStringLiteral("id")), &subcalendar.id)) {
        return fail(QStringLiteral("missing or invalid \"id\""));
    }
    const QJsonValue name = object.value(QStringLiteral("name"));
    if (!name.isString()) {
        return fail(QStringLiteral("missing or invalid \"name\""));
    }
    subcalendar.name = name.toString();
    const auto color = colorFromString(object.value(QStringLiteral("color")).toString());
    if (!color) {
        return fail(QStringLiteral("unknown \"color\""));
    }
    subcalendar.color = *color;
    const QJsonValue visible = object.value(QStringLiteral("visible"));
    if (!visible.isBool()) {
        return fail(QStringLiteral("missing or invalid \"visible\""));
    }
    subcalendar.visible = visible.toBool();
    return subcalendar;
}

std::optional<Task> taskFromJson(const QJsonValue &value, int index, QString *errorMessage)
{
    const auto fail = [&](const QString &what) -> std::optional<Task> {
        setError(errorMessage, QStringLiteral("tasks[%1]: %2").arg(index).arg(what));
        return std::nullopt;
    };

    if (!value.isObject()) {
        return fail(QStringLiteral("expected an object"));
    }
    const QJsonObject object = value.toObject();

    Task task;
    if (!readId(object.value(QStringLiteral("id")), &task.id)) {
        return fail(QStringLiteral("missing or invalid \"id\""));
    }
    if (!readId(object.value(QStringLiteral("subcalendar_id")), &task.subcalendarId)) {
        return fail(QStringLiteral("missing or invalid \"subcalendar_id\""));
    }
    task.date = parseDate(object.value(QStringLiteral("date")));
    if (!task.date.isValid()) {
        return fail(QStringLiteral("missing or invalid \"date\""));
    }
    const QJsonValue title = object.value(QStringLiteral("title"));
    if (!title.isString() || isBlankTitle(title.toString())) {
        return fail(QStringLiteral("missing or blank \"title\""));
    }
    task.title = title.toString();
    const QJsonValue completed = object.value(QStringLiteral("completed"));
    if (!completed.isBool()) {
        return fail(QStringLiteral("missing or invalid \"completed\""));
    }
    task.completed = completed.toBool();
    return task;
}
} // namespace

JsonCalendarStore::JsonCalendarStore(QString filePath)
    : m_filePath(std::move(filePath))
{
}

LoadResult JsonCalendarStore::load() const
{
    LoadResult result;

    QFile file(m_filePath);
    if (!file.exists()) {
        qCInfo(lcStore) << "No store at" << m_filePath << "- starting with the default subcalendar";
        result.status = LoadStatus::NotFound;
        result.model = CalendarModel::withDefaultSubcalendar();
        return result;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        result.status = LoadStatus::Corrupt;
        result.errorMessage = QStringLiteral("Cannot read %1: %2").arg(m_filePath, file.errorString());
        qCCritical(lcStore).noquote() << result.errorMessage;
        return result;
    }

    QString error;
    auto model = decode(file.readAll(), &error);
    if (!model) {
        result.status = LoadStatus::Corrupt;
        result.errorMessage = QStringLiteral("%1 is corrupt: %2").arg(m_filePath, error);
        qCCritical(lcStore).noquote() << result.errorMessage;
        return result;
    }

    result.status = LoadStatus::Loaded;
    result.model = std::move(*model);
    qCInfo(lcStore) << "Loaded" << result.model.subcalendars().size() << "subcalendars and"
                    << result.model.taskCount() << "tasks from" << m_filePath;
    return result;
}

bool JsonCalendarStore::save(const CalendarModel &model, QString *errorMessage)
{
    if (m_filePath.isEmpty()) {
        setError(errorMessage, QStringLiteral("No store file configured"));
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        setError(errorMessage, QStringLiteral("Cannot create directory %1").arg(dir.path()));
        qCWarning(lcStore) << "Cannot create directory" << dir.path();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(errorMessage, QStringLiteral("Cannot write %1: %2").arg(m_filePath, file.errorString()));
        qCWarning(lcStore) << "Cannot open" << m_filePath << "for writing:" << file.errorString();
        return false;
    }

    const QByteArray data = encode(model);
    if (file.write(data) != data.size()) {
        setError(errorMessage, QStringLiteral("Cannot write %1: %2").arg(m_filePath, file.errorString()));
        qCWarning(lcStore) << "Short write to" << m_filePath << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        setError(errorMessage, QStringLiteral("Cannot write %1: %2").arg(m_filePath, file.errorString()));
        qCWarning(lcStore) << "Commit of" << m_filePath << "failed:" << file.errorString();
        return false;
    }

    qCDebug(lcStore) << "Saved" << model.taskCount() << "tasks to" << m_filePath;
    return true;
}

QString JsonCalendarStore::location() const
{
    return m_filePath;
}

QByteArray JsonCalendarStore::encode(const CalendarModel &model)
{
    QJsonArray subcalendars;
    for (const Subcalendar &subcalendar : model.subcalendars()) {
        subcalendars.append(subcalendarToJson(subcalendar));
    }

    QJsonArray tasks;
    for (const Task &task : model.tasks()) {
        tasks.append(taskToJson(task));
    }

    QJsonObject nextIds;
    nextIds.insert(QStringLiteral("subcalendar"), static_cast<double>(model.nextSubcalendarId()));
    nextIds.insert(QStringLiteral("task"), static_cast<double>(model.nextTaskId()));

    QJsonObject root;
    root.insert(QStringLiteral("version"), FORMAT_VERSION);
    root.insert(QStringLiteral("next_ids"), nextIds);
    root.insert(QStringLiteral("subcalendars"), subcalendars);
    root.insert(QStringLiteral("tasks"), tasks);
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

std::optional<CalendarModel> JsonCalendarStore::decode(const QByteArray &data, QString *errorMessage)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorMessage, QStringLiteral("invalid JSON at offset %1: %2")
                                   .arg(parseError.offset)
                                   .arg(parseError.errorString()));
        return std::nullopt;
    }
    if (!document.isObject()) {
        setError(errorMessage, QStringLiteral("expected a JSON object at the top level"));
        return std::nullopt;
    }
    const QJsonObject root = document.object();

    const QJsonValue version = root.value(QStringLiteral("version"));
    if (!version.isUndefined() && version.toInt(-1) != FORMAT_VERSION) {
        setError(errorMessage, QStringLiteral("unsupported format version"));
        return std::nullopt;
    }

    const QJsonValue subcalendars = root.value(QStringLiteral("subcalendars"));
    const QJsonValue tasks = root.value(QStringLiteral("tasks"));
    if (!subcalendars.isArray() || !tasks.isArray()) {
        setError(errorMessage, QStringLiteral("\"subcalendars\" and \"tasks\" must be arrays"));
        return std::nullopt;
    }

    CalendarModel model;
    const QJsonArray subcalendarArray = subcalendars.toArray();
    for (int i = 0; i < subcalendarArray.size(); ++i) {
        const auto subcalendar = subcalendarFromJson(subcalendarArray.at(i), i, errorMessage);
        if (!subcalendar) {
            return std::nullopt;
        }
        if (!model.insertSubcalendar(*subcalendar)) {
            setError(errorMessage, QStringLiteral("subcalendars[%1]: duplicate id %2").arg(i).arg(subcalendar->id));
            return std::nullopt;
        }
    }

    const QJsonArray taskArray = tasks.toArray();
    for (int i = 0; i < taskArray.size(); ++i) {
        const auto task = taskFromJson(taskArray.at(i), i, errorMessage);
        if (!task) {
            return std::nullopt;
        }
        if (!model.findSubcalendar(task->subcalendarId)) {
            setError(errorMessage, QStringLiteral("tasks[%1]: subcalendar %2 does not exist")
                                       .arg(i)
                                       .arg(task->subcalendarId));
            return std::nullopt;
        }
        if (!model.insertTask(*task)) {
            setError(errorMessage, QStringLiteral("tasks[%1]: duplicate id %2").arg(i).arg(task->id));
            return std::nullopt;
        }
    }

    const QJsonValue nextIds = root.value(QStringLiteral("next_ids"));
    if (nextIds.isObject()) {
        const QJsonObject counters = nextIds.toObject();
        qint64 nextSubcalendar = 0;
        qint64 nextTask = 0;
        if (!readId(counters.value(QStringLiteral("subcalendar")), &nextSubcalendar, MAX_COUNTER)
            || !readId(counters.value(QStringLiteral("task")), &nextTask, MAX_COUNTER)) {
            setError(errorMessage, QStringLiteral("invalid \"next_ids\""));
            return std::nullopt;
        }
        model.advanceIdCounters(nextSubcalendar, nextTask);
    } else if (!nextIds.isUndefined()) {
        setError(errorMessage, QStringLiteral("\"next_ids\" must be an object"));
        return std::nullopt;
    }

    return model;
}

QJsonObject JsonCalendarStore::subcalendarToJson(const Subcalendar &subcalendar)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), static_cast<double>(subcalendar.id));
    object.insert(QStringLiteral("name"), subcalendar.name);
    object.insert(QStringLiteral("color"), colorToString(subcalendar.color));
    object.insert(QStringLiteral("visible"), subcalendar.visible);
    return object;
}

QJsonObject JsonCalendarStore::taskToJson(const Task &task)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), static_cast<double>(task.id));
    object.insert(QStringLiteral("subcalendar_id"), static_cast<double>(task.subcalendarId));
    object.insert(QStringLiteral("date"), task.date.toString(QLatin1String(DATE_FORMAT)));
    object.insert(QStringLiteral("title"), task.title);
    object.insert(QStringLiteral("completed"), task.completed);
    return object;
}

} // namespace data
} // namespace vical

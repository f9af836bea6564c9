#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "vical/data/DataProvider.hpp"
#include "vical/data/JsonCalendarStore.hpp"

using namespace vical::data;

namespace {

CalendarModel sampleModel()
{
    CalendarModel model = CalendarModel::withDefaultSubcalendar();
    const SubcalendarId defaultId = model.subcalendars().front().id;
    Subcalendar work = model.addSubcalendar(QStringLiteral("Work stuff"), SubcalendarColor::Magenta);
    work.visible = false;
    model.updateSubcalendar(work);

    Task task;
    task.subcalendarId = defaultId;
    task.date = QDate(2026, 10, 19);
    task.title = QStringLiteral("Buy milk");
    model.addTask(task);

    task.subcalendarId = work.id;
    task.date = QDate(1, 1, 1);
    task.title = QStringLiteral("Ancient \"quoted\" report");
    const auto added = model.addTask(task);
    model.toggleTaskCompleted(added->id);
    model.removeTask(model.addTask(task)->id);
    return model;
}

void writeFile(const QString &path, const QByteArray &data)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    QCOMPARE(file.write(data), data.size());
}

QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

} // namespace

class JsonCalendarStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void missingFileIsNotFound();
    void saveThenLoadRestoresModel();
    void saveCreatesParentDirectories();
    void loadsStoreWithoutOptionalFields();
    void rejectsCorruptStore_data();
    void rejectsCorruptStore();
    void largestIdSurvivesSaveAndLoad();
    void corruptFileIsLeftUntouched();
    void failedSaveKeepsPreviousFile();
    void dataProviderUsesGivenPath();
};

void JsonCalendarStoreTest::missingFileIsNotFound()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    JsonCalendarStore store(dir.filePath(QStringLiteral("vical.json")));

    const LoadResult result = store.load();
    QCOMPARE(result.status, LoadStatus::NotFound);
    QVERIFY(result.model == CalendarModel::withDefaultSubcalendar());
}

void JsonCalendarStoreTest::saveThenLoadRestoresModel()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    JsonCalendarStore store(dir.filePath(QStringLiteral("vical.json")));
    const CalendarModel model = sampleModel();

    QString error;
    QVERIFY2(store.save(model, &error), qPrintable(error));

    const LoadResult result = store.load();
    QCOMPARE(result.status, LoadStatus::Loaded);
    QVERIFY(result.model == model);
    // The deleted task's id stays consumed.
    QCOMPARE(result.model.nextTaskId(), model.nextTaskId());
}

void JsonCalendarStoreTest::saveCreatesParentDirectories()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/deeper/vical.json"));
    JsonCalendarStore store(path);

    QVERIFY(store.save(CalendarModel::withDefaultSubcalendar()));
    QVERIFY(QFile::exists(path));
}

void JsonCalendarStoreTest::loadsStoreWithoutOptionalFields()
{
    const QByteArray data = R"({
        "subcalendars": [ { "id": 4, "name": "Default", "color": "green", "visible": true } ],
        "tasks": [ { "id": 9, "subcalendar_id": 4, "date": "2026-10-19", "title": "Buy milk", "completed": true } ]
    })";

    QString error;
    const auto model = JsonCalendarStore::decode(data, &error);
    QVERIFY2(model.has_value(), qPrintable(error));
    QCOMPARE(model->subcalendars().front().color, SubcalendarColor::Green);
    QVERIFY(model->findTask(9)->completed);
    QCOMPARE(model->nextSubcalendarId(), SubcalendarId(5));
    QCOMPARE(model->nextTaskId(), TaskId(10));
}

void JsonCalendarStoreTest::rejectsCorruptStore_data()
{
    QTest::addColumn<QByteArray>("data");

    const QByteArray subcalendar = R"({ "id": 1, "name": "Default", "color": "blue", "visible": true })";
    const auto withTask = [&subcalendar](const QByteArray &task) {
        return QByteArray(R"({ "subcalendars": [ )") + subcalendar + R"( ], "tasks": [ )" + task + " ] }";
    };

    QTest::newRow("not json") << QByteArray("{ \"subcalendars\": [");
    QTest::newRow("array root") << QByteArray("[]");
    QTest::newRow("missing tasks") << QByteArray(R"({ "subcalendars": [] })");
    QTest::newRow("future version") << QByteArray(R"({ "version": 2, "subcalendars": [], "tasks": [] })");
    QTest::newRow("unknown color")
        << QByteArray(R"({ "subcalendars": [ { "id": 1, "name": "A", "color": "mauve", "visible": true } ], "tasks": [] })");
    QTest::newRow("duplicate subcalendar id")
        << (QByteArray(R"({ "subcalendars": [ )") + subcalendar + ", " + subcalendar + R"( ], "tasks": [] })");
    QTest::newRow("fractional id")
        << withTask(R"({ "id": 1.5, "subcalendar_id": 1, "date": "2026-10-19", "title": "x", "completed": false })");
    QTest::newRow("invalid date")
        << withTask(R"({ "id": 1, "subcalendar_id": 1, "date": "2026-02-30", "title": "x", "completed": false })");
    QTest::newRow("loose date")
        << withTask(R"({ "id": 1, "subcalendar_id": 1, "date": "2026-1-5", "title": "x", "completed": false })");
    QTest::newRow("blank title")
        << withTask(R"({ "id": 1, "subcalendar_id": 1, "date": "2026-10-19", "title": "  ", "completed": false })");
    QTest::newRow("completed as string")
        << withTask(R"({ "id": 1, "subcalendar_id": 1, "date": "2026-10-19", "title": "x", "completed": "no" })");
    QTest::newRow("dangling subcalendar")
        << withTask(R"({ "id": 1, "subcalendar_id": 7, "date": "2026-10-19", "title": "x", "completed": false })");
    QTest::newRow("id beyond counter range")
        << withTask(R"({ "id": 9007199254740991, "subcalendar_id": 1, "date": "2026-10-19", "title": "x", "completed": false })");
    QTest::newRow("duplicate task id")
        << withTask(R"({ "id": 1, "subcalendar_id": 1, "date": "2026-10-19", "title": "x", "completed": false },
                       { "id": 1, "subcalendar_id": 1, "date": "2026-10-20", "title": "y", "completed": false })");
}

void JsonCalendarStoreTest::rejectsCorruptStore()
{
    QFETCH(QByteArray, data);

    QString error;
    QVERIFY(!JsonCalendarStore::decode(data, &error).has_value());
    QVERIFY(!error.isEmpty());
}

void JsonCalendarStoreTest::largestIdSurvivesSaveAndLoad()
{
    const QByteArray data = R"({ "subcalendars": [ { "id": 1, "name": "Default", "color": "blue", "visible": true } ],
                                 "tasks": [ { "id": 9007199254740990, "subcalendar_id": 1, "date": "2026-10-19",
                                              "title": "x", "completed": false } ] })";
    QString error;
    const std::optional<CalendarModel> loaded = JsonCalendarStore::decode(data, &error);
    QVERIFY2(loaded.has_value(), qPrintable(error));
    QCOMPARE(loaded->nextTaskId(), TaskId(9007199254740991LL));

    const std::optional<CalendarModel> reloaded = JsonCalendarStore::decode(JsonCalendarStore::encode(*loaded), &error);
    QVERIFY2(reloaded.has_value(), qPrintable(error));
    QCOMPARE(reloaded->nextTaskId(), TaskId(9007199254740991LL));
    QCOMPARE(reloaded->taskCount(), 1);
}

void JsonCalendarStoreTest::corruptFileIsLeftUntouched()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("vical.json"));
    const QByteArray garbage("{ this is not a calendar");
    writeFile(path, garbage);

    JsonCalendarStore store(path);
    const LoadResult result = store.load();
    QCOMPARE(result.status, LoadStatus::Corrupt);
    QVERIFY(result.errorMessage.contains(path));
    QCOMPARE(readFile(path), garbage);
}

void JsonCalendarStoreTest::failedSaveKeepsPreviousFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    // A directory where the file should be makes the atomic write fail.
    const QString path = dir.filePath(QStringLiteral("blocked"));
    QVERIFY(QDir(dir.path()).mkdir(QStringLiteral("blocked")));

    JsonCalendarStore store(path);
    QString error;
    QVERIFY(!store.save(sampleModel(), &error));
    QVERIFY(!error.isEmpty());
    QVERIFY(QFileInfo(path).isDir());
}

void JsonCalendarStoreTest::dataProviderUsesGivenPath()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("sub/../vical.json"));
    DataProvider provider(path);

    QCOMPARE(provider.storeFilePath(), dir.filePath(QStringLiteral("vical.json")));
    QCOMPARE(provider.calendarStore().location(), provider.storeFilePath());
    QVERIFY(provider.calendarStore().save(sampleModel()));
    QCOMPARE(provider.calendarStore().load().status, LoadStatus::Loaded);
    QVERIFY(DataProvider::defaultStoreFilePath().endsWith(QStringLiteral("vical.json")));
}

QTEST_MAIN(JsonCalendarStoreTest)
#include "JsonCalendarStoreTest.moc"

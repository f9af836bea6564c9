#include <QtTest/QtTest>

#include <QSettings>
#include <QTemporaryDir>

#include "vical/core/Settings.hpp"

using vical::core::DateOrder;
using vical::core::Settings;

class SettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void defaultsWhenEmpty();
    void readsStoredValues();
    void unknownValuesFallBack();
    void writeThenRead();
};

void SettingsTest::defaultsWhenEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QSettings settings(dir.filePath(QStringLiteral("vical.ini")), QSettings::IniFormat);

    const Settings result = Settings::fromQSettings(settings);
    QCOMPARE(result.weekStart, Qt::Sunday);
    QCOMPARE(result.dateOrder, DateOrder::MonthDayYear);
    QCOMPARE(result.undoLimit, 50);
    QVERIFY(result.storeFile.isEmpty());
    QVERIFY(result.dimCompleted);
}

void SettingsTest::readsStoredValues()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("vical.ini")), QSettings::IniFormat);
    settings.setValue(QStringLiteral("calendar/weekStart"), QStringLiteral("Monday"));
    settings.setValue(QStringLiteral("input/dateOrder"), QStringLiteral("dmy"));
    settings.setValue(QStringLiteral("core/undoLimit"), 7);
    settings.setValue(QStringLiteral("storage/file"), QStringLiteral("/tmp/elsewhere.json"));
    settings.setValue(QStringLiteral("ui/dimCompleted"), false);

    const Settings result = Settings::fromQSettings(settings);
    QCOMPARE(result.weekStart, Qt::Monday);
    QCOMPARE(result.dateOrder, DateOrder::DayMonthYear);
    QCOMPARE(result.undoLimit, 7);
    QCOMPARE(result.storeFile, QStringLiteral("/tmp/elsewhere.json"));
    QVERIFY(!result.dimCompleted);
}

void SettingsTest::unknownValuesFallBack()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("vical.ini")), QSettings::IniFormat);
    settings.setValue(QStringLiteral("calendar/weekStart"), QStringLiteral("friday"));
    settings.setValue(QStringLiteral("input/dateOrder"), QStringLiteral("ymd"));
    settings.setValue(QStringLiteral("core/undoLimit"), 100000);

    const Settings result = Settings::fromQSettings(settings);
    QCOMPARE(result.weekStart, Qt::Sunday);
    QCOMPARE(result.dateOrder, DateOrder::MonthDayYear);
    QCOMPARE(result.undoLimit, 1000);

    settings.setValue(QStringLiteral("core/undoLimit"), 0);
    QCOMPARE(Settings::fromQSettings(settings).undoLimit, 1);
}

void SettingsTest::writeThenRead()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("vical.ini")), QSettings::IniFormat);

    Settings written;
    written.weekStart = Qt::Monday;
    written.dateOrder = DateOrder::DayMonthYear;
    written.undoLimit = 12;
    written.dimCompleted = false;
    written.writeTo(settings);

    const Settings read = Settings::fromQSettings(settings);
    QCOMPARE(read.weekStart, written.weekStart);
    QCOMPARE(read.dateOrder, written.dateOrder);
    QCOMPARE(read.undoLimit, written.undoLimit);
    QCOMPARE(read.dimCompleted, written.dimCompleted);
}

QTEST_MAIN(SettingsTest)
#include "SettingsTest.moc"

#include <QtTest/QtTest>

#include <QRandomGenerator>

#include "vical/core/CalendarState.hpp"
#include "vical/core/DateSpec.hpp"

using vical::core::CalendarState;
using vical::core::DateOrder;

class CalendarStateTest : public QObject
{
    Q_OBJECT

private slots:
    void startsOnToday();
    void dayMotionsCrossMonths();
    void monthMotionClampsDay();
    void weekMotionsRespectWeekStart();
    void cursorIsClampedToSupportedRange();
    void randomMotionsKeepCursorValid();
    void changingDateResetsSelection();
    void gridStartsOnWeekStart();
    void parsesDateSpecs_data();
    void parsesDateSpecs();
};

void CalendarStateTest::startsOnToday()
{
    const CalendarState state(QDate(2026, 10, 19));
    QCOMPARE(state.cursorDate(), QDate(2026, 10, 19));
    QCOMPARE(state.displayedYear(), 2026);
    QCOMPARE(state.displayedMonth(), 10);
    QCOMPARE(state.selectedTaskIndex(), 0);
    QVERIFY(!state.colorFilter().has_value());
}

void CalendarStateTest::dayMotionsCrossMonths()
{
    CalendarState state(QDate(2026, 10, 31));
    state.moveDays(1);
    QCOMPARE(state.cursorDate(), QDate(2026, 11, 1));
    QCOMPARE(state.displayedMonth(), 11);

    state.moveDays(-7 * 5);
    QCOMPARE(state.cursorDate(), QDate(2026, 9, 27));
    QCOMPARE(state.displayedMonth(), 9);
}

void CalendarStateTest::monthMotionClampsDay()
{
    CalendarState state(QDate(2024, 1, 31));
    state.moveMonths(1);
    QCOMPARE(state.cursorDate(), QDate(2024, 2, 29));
    state.moveMonths(12);
    QCOMPARE(state.cursorDate(), QDate(2025, 2, 28));
    state.moveMonths(-14);
    QCOMPARE(state.cursorDate(), QDate(2023, 12, 28));
    QCOMPARE(state.displayedYear(), 2023);
    QCOMPARE(state.displayedMonth(), 12);

    state.jumpToMonthEnd();
    QCOMPARE(state.cursorDate(), QDate(2023, 12, 31));
    state.jumpToMonthStart();
    QCOMPARE(state.cursorDate(), QDate(2023, 12, 1));
}

void CalendarStateTest::weekMotionsRespectWeekStart()
{
    // 2026-10-21 is a Wednesday.
    CalendarState state(QDate(2026, 10, 21));
    state.jumpToWeekStart(Qt::Sunday);
    QCOMPARE(state.cursorDate(), QDate(2026, 10, 18));
    state.jumpToWeekEnd(Qt::Sunday);
    QCOMPARE(state.cursorDate(), QDate(2026, 10, 24));

    state.setCursorDate(QDate(2026, 10, 21));
    state.jumpToWeekStart(Qt::Monday);
    QCOMPARE(state.cursorDate(), QDate(2026, 10, 19));
    state.jumpToWeekEnd(Qt::Monday);
    QCOMPARE(state.cursorDate(), QDate(2026, 10, 25));
}

void CalendarStateTest::cursorIsClampedToSupportedRange()
{
    CalendarState state(QDate(1, 1, 3));
    state.moveDays(-10);
    QCOMPARE(state.cursorDate(), CalendarState::minimumDate());
    state.moveMonths(-1);
    QCOMPARE(state.cursorDate(), CalendarState::minimumDate());

    state.setCursorDate(QDate(9999, 12, 30));
    state.moveDays(100);
    QCOMPARE(state.cursorDate(), CalendarState::maximumDate());
    state.moveMonths(5);
    QCOMPARE(state.cursorDate(), CalendarState::maximumDate());

    state.setCursorDate(QDate());
    QCOMPARE(state.cursorDate(), CalendarState::maximumDate());
}

void CalendarStateTest::randomMotionsKeepCursorValid()
{
    QRandomGenerator random(20261019);
    CalendarState state(QDate(2026, 10, 19));
    for (int i = 0; i < 5000; ++i) {
        switch (random.bounded(6)) {
        case 0:
            state.moveDays(random.bounded(-2000000, 2000000));
            break;
        case 1:
            state.moveMonths(random.bounded(-40000, 40000));
            break;
        case 2:
            state.jumpToMonthEnd();
            break;
        case 3:
            state.jumpToWeekStart(Qt::Monday);
            break;
        case 4:
            state.jumpToWeekEnd(Qt::Sunday);
            break;
        default:
            state.jumpToMonthStart();
            break;
        }
        QVERIFY(state.cursorDate().isValid());
        QVERIFY(state.cursorDate() >= CalendarState::minimumDate());
        QVERIFY(state.cursorDate() <= CalendarState::maximumDate());
        QCOMPARE(state.displayedMonth(), state.cursorDate().month());
    }
}

void CalendarStateTest::changingDateResetsSelection()
{
    CalendarState state(QDate(2026, 10, 19));
    state.setSelectedTaskIndex(2);
    state.setCursorDate(QDate(2026, 10, 19));
    QCOMPARE(state.selectedTaskIndex(), 2);
    state.moveDays(1);
    QCOMPARE(state.selectedTaskIndex(), 0);

    state.setSelectedTaskIndex(-3);
    QCOMPARE(state.selectedTaskIndex(), 0);
}

void CalendarStateTest::gridStartsOnWeekStart()
{
    // October 2026 starts on a Thursday.
    QCOMPARE(CalendarState::gridStart(2026, 10, Qt::Sunday), QDate(2026, 9, 27));
    QCOMPARE(CalendarState::gridStart(2026, 10, Qt::Monday), QDate(2026, 9, 28));
    // February 2026 starts on a Sunday.
    QCOMPARE(CalendarState::gridStart(2026, 2, Qt::Sunday), QDate(2026, 2, 1));
}

void CalendarStateTest::parsesDateSpecs_data()
{
    QTest::addColumn<QString>("spec");
    QTest::addColumn<int>("order");
    QTest::addColumn<QDate>("expected");

    const int mdy = static_cast<int>(DateOrder::MonthDayYear);
    const int dmy = static_cast<int>(DateOrder::DayMonthYear);

    QTest::newRow("iso") << QStringLiteral("2027-03-04") << mdy << QDate(2027, 3, 4);
    QTest::newRow("day") << QStringLiteral("5") << mdy << QDate(2026, 10, 5);
    QTest::newRow("two digit day") << QStringLiteral("31") << mdy << QDate(2026, 10, 31);
    QTest::newRow("mmdd") << QStringLiteral("1225") << mdy << QDate(2026, 12, 25);
    QTest::newRow("ddmm") << QStringLiteral("2512") << dmy << QDate(2026, 12, 25);
    QTest::newRow("mmyyyy") << QStringLiteral("022028") << mdy << QDate(2028, 2, 1);
    QTest::newRow("mmddyyyy") << QStringLiteral("07041999") << mdy << QDate(1999, 7, 4);
    QTest::newRow("ddmmyyyy") << QStringLiteral("04071999") << dmy << QDate(1999, 7, 4);
    QTest::newRow("day out of month") << QStringLiteral("32") << mdy << QDate();
    QTest::newRow("feb 30") << QStringLiteral("0230") << mdy << QDate();
    QTest::newRow("year zero") << QStringLiteral("01010000") << mdy << QDate();
    QTest::newRow("three digits") << QStringLiteral("123") << mdy << QDate();
    QTest::newRow("letters") << QStringLiteral("tomorrow") << mdy << QDate();
    QTest::newRow("loose iso") << QStringLiteral("2026-1-5") << mdy << QDate();
}

void CalendarStateTest::parsesDateSpecs()
{
    QFETCH(QString, spec);
    QFETCH(int, order);
    QFETCH(QDate, expected);

    const auto parsed = vical::core::parseDateSpec(spec, QDate(2026, 10, 19), static_cast<DateOrder>(order));
    if (!expected.isValid()) {
        QVERIFY(!parsed.has_value());
        return;
    }
    QVERIFY(parsed.has_value());
    QCOMPARE(*parsed, expected);
}

QTEST_MAIN(CalendarStateTest)
#include "CalendarStateTest.moc"

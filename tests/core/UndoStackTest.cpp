#include <QtTest/QtTest>

#include "vical/core/ModelSnapshotCommand.hpp"
#include "vical/core/UndoCommand.hpp"
#include "vical/core/UndoStack.hpp"

namespace {

class CounterCommand : public vical::core::UndoCommand
{
public:
    CounterCommand(int delta, int &value)
        : m_delta(delta)
        , m_value(value)
    {
    }

    void redo() override { m_value += m_delta; }
    void undo() override { m_value -= m_delta; }
    QString text() const override { return QStringLiteral("add %1").arg(m_delta); }

private:
    int m_delta;
    int &m_value;
};

} // namespace

class UndoStackTest : public QObject
{
    Q_OBJECT

private slots:
    void pushUndoRedo();
    void respectsLimit();
    void pushDropsRedoBranch();
    void emptyStackReturnsNoText();
    void snapshotCommandRestoresModel();
};

void UndoStackTest::pushUndoRedo()
{
    vical::core::UndoStack stack;
    int value = 0;
    stack.push(std::make_unique<CounterCommand>(5, value));
    QCOMPARE(value, 5);
    QVERIFY(stack.canUndo());

    QCOMPARE(stack.undo(), QStringLiteral("add 5"));
    QCOMPARE(value, 0);
    QVERIFY(stack.canRedo());

    QCOMPARE(stack.redo(), QStringLiteral("add 5"));
    QCOMPARE(value, 5);
}

void UndoStackTest::respectsLimit()
{
    vical::core::UndoStack stack(2);
    int value = 0;
    stack.push(std::make_unique<CounterCommand>(1, value));
    stack.push(std::make_unique<CounterCommand>(1, value));
    stack.push(std::make_unique<CounterCommand>(1, value)); // first cmd dropped
    QCOMPARE(stack.count(), static_cast<std::size_t>(2));

    stack.undo();
    stack.undo();
    QVERIFY(!stack.canUndo());
    QCOMPARE(value, 1);
}

void UndoStackTest::pushDropsRedoBranch()
{
    vical::core::UndoStack stack;
    int value = 0;
    stack.push(std::make_unique<CounterCommand>(1, value));
    stack.push(std::make_unique<CounterCommand>(10, value));
    stack.undo();
    QVERIFY(stack.canRedo());

    stack.push(std::make_unique<CounterCommand>(100, value));
    QVERIFY(!stack.canRedo());
    QCOMPARE(stack.count(), static_cast<std::size_t>(2));
    QCOMPARE(value, 101);
}

void UndoStackTest::emptyStackReturnsNoText()
{
    vical::core::UndoStack stack;
    QVERIFY(stack.undo().isEmpty());
    QVERIFY(stack.redo().isEmpty());
}

void UndoStackTest::snapshotCommandRestoresModel()
{
    using vical::data::CalendarModel;

    CalendarModel model = CalendarModel::withDefaultSubcalendar();
    const CalendarModel before = model;
    model.addSubcalendar(QStringLiteral("Work"), vical::data::SubcalendarColor::Red);
    const CalendarModel after = model;

    vical::core::UndoStack stack;
    stack.push(std::make_unique<vical::core::ModelSnapshotCommand>(model, before, after,
                                                                   QStringLiteral("create subcalendar")));
    QCOMPARE(model.subcalendars().size(), static_cast<std::size_t>(2));

    QCOMPARE(stack.undo(), QStringLiteral("create subcalendar"));
    QCOMPARE(model.subcalendars().size(), static_cast<std::size_t>(1));
    // Undo keeps the id counter so the undone id is not handed out again.
    QCOMPARE(model.nextSubcalendarId(), after.nextSubcalendarId());

    stack.redo();
    QVERIFY(model.findSubcalendarByName(QStringLiteral("Work")).has_value());
}

QTEST_MAIN(UndoStackTest)
#include "UndoStackTest.moc"

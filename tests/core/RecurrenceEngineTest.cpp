#include <QtTest/QtTest>

#include "pawpal/core/RecurrenceEngine.hpp"

using namespace pawpal;

class RecurrenceEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void successorKeepsMetadata();
    void nonRecurringHasNoSuccessor();
    void cloneDropsWalk();
};

void RecurrenceEngineTest::successorKeepsMetadata()
{
    data::Task task;
    task.id = "task_0007";
    task.description = "Feed Buddy";
    task.dueDate = QDateTime(QDate(2024, 3, 11), QTime(8, 0));
    task.priority = data::Priority::Low;
    task.completed = true;
    task.userId = "user_001";
    task.petId = "pet_001";
    task.recurrence = data::Recurrence::Weekly;

    core::RecurrenceEngine engine;
    const auto next = engine.nextTask(task);
    QVERIFY(next.has_value());
    QVERIFY(next->id.isEmpty());
    QCOMPARE(next->description, task.description);
    QCOMPARE(next->priority, data::Priority::Low);
    QCOMPARE(next->userId, task.userId);
    QCOMPARE(next->petId, task.petId);
    QCOMPARE(next->recurrence, data::Recurrence::Weekly);
    QCOMPARE(next->dueDate, QDateTime(QDate(2024, 3, 18), QTime(8, 0)));
    QVERIFY(!next->completed);
}

void RecurrenceEngineTest::nonRecurringHasNoSuccessor()
{
    data::Task task;
    task.description = "Vet visit";
    task.dueDate = QDateTime(QDate(2024, 3, 11), QTime(8, 0));

    core::RecurrenceEngine engine;
    QVERIFY(!engine.nextTask(task).has_value());
}

void RecurrenceEngineTest::cloneDropsWalk()
{
    data::Task task;
    task.description = "Walk Buddy";
    task.dueDate = QDateTime(QDate(2024, 3, 11), QTime(8, 0));
    task.recurrence = data::Recurrence::Daily;
    data::Walk walk;
    walk.id = "walk_0001";
    walk.schedule(task.dueDate, 30);
    task.walk = walk;

    core::RecurrenceEngine engine;
    const auto next = engine.nextTask(task);
    QVERIFY(next.has_value());
    QVERIFY(!next->walk.has_value());
    QCOMPARE(next->dueDate, QDateTime(QDate(2024, 3, 12), QTime(8, 0)));
}

QTEST_GUILESS_MAIN(RecurrenceEngineTest)
#include "RecurrenceEngineTest.moc"

#include <QtTest/QtTest>

#include "pawpal/data/InMemoryTaskRepository.hpp"
#include "pawpal/data/ValidationError.hpp"

using namespace pawpal::data;

class TaskRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void addAndFetch();
    void generatesMonotonicIds();
    void rejectsDuplicateIds();
    void update();
};

void TaskRepositoryTest::addAndFetch()
{
    InMemoryTaskRepository repo;
    Task first;
    first.description = "Feed";
    first.priority = Priority::High;
    Task second;
    second.description = "Brush";
    repo.addTask(first);
    const auto stored = repo.addTask(second);

    QVERIFY(!stored.id.isEmpty());
    QCOMPARE(repo.count(), 2);

    const auto list = repo.fetchTasks();
    QCOMPARE(list.size(), static_cast<size_t>(2));
    QCOMPARE(list.front().description, QStringLiteral("Feed"));
    QCOMPARE(list.back().description, QStringLiteral("Brush"));

    const auto fetched = repo.findById(stored.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->description, QStringLiteral("Brush"));
    QVERIFY(!repo.findById("missing").has_value());
}

void TaskRepositoryTest::generatesMonotonicIds()
{
    InMemoryTaskRepository repo;
    Task taken;
    taken.id = "task_0002";
    repo.addTask(taken);

    QCOMPARE(repo.addTask(Task{}).id, QStringLiteral("task_0001"));
    QCOMPARE(repo.addTask(Task{}).id, QStringLiteral("task_0003"));
}

void TaskRepositoryTest::rejectsDuplicateIds()
{
    InMemoryTaskRepository repo;
    Task task;
    task.id = "task_a";
    repo.addTask(task);
    QVERIFY_EXCEPTION_THROWN(repo.addTask(task), ValidationError);
    QCOMPARE(repo.count(), 1);
}

void TaskRepositoryTest::update()
{
    InMemoryTaskRepository repo;
    Task task;
    task.description = "Initial";
    const auto stored = repo.addTask(task);

    Task toUpdate = stored;
    toUpdate.description = "Updated";
    QVERIFY(repo.updateTask(toUpdate));
    QCOMPARE(repo.findById(stored.id)->description, QStringLiteral("Updated"));

    Task unknown;
    unknown.id = "nope";
    QVERIFY(!repo.updateTask(unknown));
}

QTEST_GUILESS_MAIN(TaskRepositoryTest)
#include "TaskRepositoryTest.moc"

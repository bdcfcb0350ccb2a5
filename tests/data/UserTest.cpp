#include <QtTest/QtTest>

#include "pawpal/data/User.hpp"
#include "pawpal/data/ValidationError.hpp"

using namespace pawpal::data;

namespace {

Pet makePet(const QString &id, const QString &name)
{
    Pet pet;
    pet.id = id;
    pet.name = name;
    pet.breed = "Golden Retriever";
    pet.age = 3;
    return pet;
}

Task walkTask(const QString &petId, const QDateTime &start, int minutes)
{
    Task task;
    task.description = "Walk";
    task.dueDate = start;
    task.petId = petId;
    Walk walk;
    walk.schedule(start, minutes);
    task.walk = walk;
    return task;
}

} // namespace

class UserTest : public QObject
{
    Q_OBJECT

private slots:
    void addPetSetsOwner();
    void addPetValidates();
    void appendTaskRegistersEverywhere();
    void appendTaskValidates();
    void scheduledWalksSkipCompleted();
    void todaysTasks();
    void petDetails();
};

void UserTest::addPetSetsOwner()
{
    User user("user_001", "Malik", "malik@pawpal.com");
    user.addPet(makePet("pet_001", "Buddy"));
    QCOMPARE(user.pets().size(), static_cast<size_t>(1));
    QCOMPARE(user.pets().front().ownerId, QStringLiteral("user_001"));
    QVERIFY(user.findPet("pet_001"));
    QVERIFY(!user.findPet("pet_404"));
}

void UserTest::addPetValidates()
{
    User user("user_001", "Malik", "malik@pawpal.com");
    user.addPet(makePet("pet_001", "Buddy"));
    QVERIFY_EXCEPTION_THROWN(user.addPet(makePet("pet_001", "Other")), ValidationError);
    QVERIFY_EXCEPTION_THROWN(user.addPet(makePet("", "Nameless")), ValidationError);
    QVERIFY_EXCEPTION_THROWN(user.addPet(makePet("pet_002", " ")), ValidationError);
    QCOMPARE(user.pets().size(), static_cast<size_t>(1));
}

void UserTest::appendTaskRegistersEverywhere()
{
    User user("user_001", "Malik", "malik@pawpal.com");
    user.addPet(makePet("pet_001", "Buddy"));
    user.addPet(makePet("pet_002", "Whiskers"));

    const auto walk = user.appendTask(walkTask("pet_001", QDateTime(QDate(2024, 3, 11), QTime(8, 0)), 30));
    Task chore;
    chore.description = "Clean litter";
    chore.dueDate = QDateTime(QDate(2024, 3, 11), QTime(9, 0));
    chore.petId = "pet_002";
    const auto stored = user.appendTask(chore);

    QCOMPARE(stored.userId, QStringLiteral("user_001"));
    QVERIFY(walk.id != stored.id);
    QCOMPARE(user.taskCount(), 2);
    QCOMPARE(user.tasksForPet("pet_001").size(), static_cast<size_t>(1));
    QCOMPARE(user.tasksForPet("pet_002").front().description, QStringLiteral("Clean litter"));
    QCOMPARE(user.findPet("pet_002")->taskIds.size(), 1);

    QCOMPARE(user.walkCount(), 1);
    QCOMPARE(user.walks().front().id, walk.walk->id);
    QCOMPARE(user.walks().front().petId, QStringLiteral("pet_001"));
}

void UserTest::appendTaskValidates()
{
    User user("user_001", "Malik", "malik@pawpal.com");
    user.addPet(makePet("pet_001", "Buddy"));

    QVERIFY_EXCEPTION_THROWN(user.appendTask(walkTask("pet_404", QDateTime(QDate(2024, 3, 11), QTime(8, 0)), 30)),
                             ValidationError);
    QVERIFY_EXCEPTION_THROWN(user.appendTask(walkTask("pet_001", QDateTime(QDate(2024, 3, 11), QTime(8, 0)), 0)),
                             ValidationError);
    QVERIFY_EXCEPTION_THROWN(user.appendTask(walkTask("pet_001", QDateTime(), 30)), ValidationError);
    QVERIFY_EXCEPTION_THROWN(user.appendTask(walkTask("", QDateTime(QDate(2024, 3, 11), QTime(8, 0)), 30)),
                             ValidationError);

    Task blank;
    blank.dueDate = QDateTime(QDate(2024, 3, 11), QTime(8, 0));
    QVERIFY_EXCEPTION_THROWN(user.appendTask(blank), ValidationError);

    QCOMPARE(user.taskCount(), 0);
    QCOMPARE(user.walkCount(), 0);
}

void UserTest::scheduledWalksSkipCompleted()
{
    User user("user_001", "Malik", "malik@pawpal.com");
    user.addPet(makePet("pet_001", "Buddy"));
    auto done = user.appendTask(walkTask("pet_001", QDateTime(QDate(2024, 3, 11), QTime(7, 0)), 30));
    user.appendTask(walkTask("pet_001", QDateTime(QDate(2024, 3, 11), QTime(12, 0)), 45));

    done.markComplete();
    QVERIFY(user.updateTask(done));

    const auto walks = user.scheduledWalks("pet_001");
    QCOMPARE(walks.size(), static_cast<size_t>(1));
    QCOMPARE(walks.front().durationMinutes, 45);
    // The history keeps the finished walk.
    QCOMPARE(user.walks().size(), static_cast<size_t>(2));
    QCOMPARE(user.walks().front().status, WalkStatus::Completed);
}

void UserTest::todaysTasks()
{
    User user("user_001", "Malik", "malik@pawpal.com");
    const QDate today(2024, 3, 11);

    Task morning;
    morning.description = "Morning";
    morning.dueDate = QDateTime(today, QTime(8, 0));
    Task tomorrow;
    tomorrow.description = "Tomorrow";
    tomorrow.dueDate = QDateTime(today.addDays(1), QTime(8, 0));
    Task finished;
    finished.description = "Finished";
    finished.dueDate = QDateTime(today, QTime(9, 0));
    finished.completed = true;

    user.appendTask(morning);
    user.appendTask(tomorrow);
    user.appendTask(finished);

    const auto tasks = user.todaysTasks(today);
    QCOMPARE(tasks.size(), static_cast<size_t>(1));
    QCOMPARE(tasks.front().description, QStringLiteral("Morning"));
    QCOMPARE(user.todaysTasks(today.addDays(1)).size(), static_cast<size_t>(1));
}

void UserTest::petDetails()
{
    QCOMPARE(makePet("pet_001", "Buddy").details(), QStringLiteral("Buddy (Golden Retriever, 3 years old)"));
}

QTEST_GUILESS_MAIN(UserTest)
#include "UserTest.moc"

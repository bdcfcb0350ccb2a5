#include <QtTest/QtTest>

#include "pawpal/app/DemoHousehold.hpp"
#include "pawpal/app/ScheduleReport.hpp"
#include "pawpal/core/Clock.hpp"
#include "pawpal/core/Scheduler.hpp"
#include "pawpal/data/User.hpp"
#include "pawpal/data/ValidationError.hpp"

using namespace pawpal;

class ScheduleReportTest : public QObject
{
    Q_OBJECT

private slots:
    void demoHouseholdSchedule();
    void conflictDemo();
    void recurringDemo();
    void unknownSection();
};

namespace {
const QDate Today(2024, 3, 11);
}

void ScheduleReportTest::demoHouseholdSchedule()
{
    core::FixedClock clock(QDateTime(Today, QTime(7, 0)));
    data::User user("user_001", "Malik", "malik@pawpal.com");
    core::Scheduler scheduler(user, clock);
    app::seedDemoHousehold(scheduler, Today, 30);

    QCOMPARE(user.pets().size(), static_cast<size_t>(2));
    QCOMPARE(user.walkCount(), 2);

    app::ScheduleReport report(scheduler);
    const auto lines = report.todaysSchedule();
    QVERIFY(lines.contains(QStringLiteral("BUDDY")));
    QVERIFY(lines.contains(QStringLiteral("WHISKERS")));
    QVERIFY(lines.contains(QStringLiteral("GENERAL")));
    QVERIFY(lines.contains(QStringLiteral("[ ] 08:00 - [Buddy] Walk Buddy (high)")));
    QVERIFY(lines.contains(QStringLiteral("[ ] 10:30 - Call the vet (low)")));
    // The finished dinner task is not part of today's pending schedule.
    QVERIFY(!lines.join('\n').contains(QStringLiteral("Feed Buddy dinner")));
    QCOMPARE(lines.last(), QStringLiteral("Total tasks today: 4"));

    const auto summary = report.summary();
    QVERIFY(summary.contains(QStringLiteral("Pets: 2")));
    QVERIFY(summary.contains(QStringLiteral("  Buddy (Golden Retriever, 3 years old)")));
    QVERIFY(summary.contains(QStringLiteral("Scheduled walks: 2")));

    const auto filters = report.filters();
    QVERIFY(filters.contains(QStringLiteral("  [x] 18:00 - [Buddy] Feed Buddy dinner (high)")));
}

void ScheduleReportTest::conflictDemo()
{
    core::FixedClock clock(QDateTime(Today, QTime(7, 0)));
    data::User user("user_001", "Malik", "malik@pawpal.com");
    core::Scheduler scheduler(user, clock);
    app::seedDemoHousehold(scheduler, Today, 30);

    app::ScheduleReport report(scheduler);
    const QString text = report.section(QStringLiteral("conflicts")).join('\n');
    QCOMPARE(text.count(QStringLiteral("scheduled as")), 2);
    QVERIFY(text.contains(QStringLiteral("scheduled as walk_0003 until 09:30 (scheduled)")));
    QVERIFY(text.contains(QStringLiteral("scheduled as walk_0004 until 09:50 (scheduled)")));
    QCOMPARE(text.count(QStringLiteral("rejected:")), 1);
    QVERIFY(text.contains(QStringLiteral("No conflicts detected in the entire schedule.")));
    QCOMPARE(user.walkCount(), 4);
}

void ScheduleReportTest::recurringDemo()
{
    core::FixedClock clock(QDateTime(Today, QTime(7, 0)));
    data::User user("user_001", "Malik", "malik@pawpal.com");
    core::Scheduler scheduler(user, clock);
    app::seedDemoHousehold(scheduler, Today, 30);

    app::ScheduleReport report(scheduler);
    const QString text = report.recurringDemo().join('\n');
    QVERIFY(text.contains(QStringLiteral("Created Feed Buddy (breakfast) due 2024-03-11 08:00, repeats daily")));
    QVERIFY(text.contains(QStringLiteral("due 2024-03-12 08:00 (1 day ahead)")));
}

void ScheduleReportTest::unknownSection()
{
    core::FixedClock clock(QDateTime(Today, QTime(7, 0)));
    data::User user("user_001", "Malik", "malik@pawpal.com");
    core::Scheduler scheduler(user, clock);
    app::ScheduleReport report(scheduler);
    QVERIFY_EXCEPTION_THROWN(report.section(QStringLiteral("weather")), data::ValidationError);
    QVERIFY(report.section(QStringLiteral("schedule")).contains(QStringLiteral("No tasks scheduled for today.")));
}

QTEST_GUILESS_MAIN(ScheduleReportTest)
#include "ScheduleReportTest.moc"

#include "pawpal/app/ScheduleReport.hpp"

#include <QDateTime>
#include <QTime>

#include "pawpal/core/Scheduler.hpp"
#include "pawpal/data/Task.hpp"
#include "pawpal/data/User.hpp"
#include "pawpal/data/ValidationError.hpp"
#include "pawpal/data/Walk.hpp"

namespace pawpal {
namespace app {

namespace {
constexpr int BannerWidth = 60;
constexpr auto CLOCK_FORMAT = "hh:mm";
constexpr auto DAY_FORMAT = "yyyy-MM-dd hh:mm";

QString clockTime(const QDateTime &time)
{
    return time.toString(QString::fromLatin1(CLOCK_FORMAT));
}

QString dayTime(const QDateTime &time)
{
    return time.toString(QString::fromLatin1(DAY_FORMAT));
}
} // namespace

ScheduleReport::ScheduleReport(core::Scheduler &scheduler)
    : m_scheduler(scheduler)
{
}

QStringList ScheduleReport::sectionNames()
{
    return {QStringLiteral("schedule"),
            QStringLiteral("filters"),
            QStringLiteral("conflicts"),
            QStringLiteral("recurring"),
            QStringLiteral("summary")};
}

QStringList ScheduleReport::section(const QString &name)
{
    if (name == QLatin1String("schedule")) {
        return todaysSchedule();
    }
    if (name == QLatin1String("filters")) {
        return filters();
    }
    if (name == QLatin1String("conflicts")) {
        return conflictDemo();
    }
    if (name == QLatin1String("recurring")) {
        return recurringDemo();
    }
    if (name == QLatin1String("summary")) {
        return summary();
    }
    throw data::ValidationError(QStringLiteral("Unknown section '%1'").arg(name));
}

QString ScheduleReport::banner(const QString &title)
{
    const QString rule(BannerWidth, QLatin1Char('='));
    const int padding = qMax(0, (BannerWidth - title.size()) / 2);
    return rule + QLatin1Char('\n') + QString(padding, QLatin1Char(' ')) + title + QLatin1Char('\n') + rule;
}

QString ScheduleReport::taskLine(const data::Task &task, const data::User &user)
{
    QString line = QStringLiteral("%1 %2 - ")
                       .arg(task.completed ? QStringLiteral("[x]") : QStringLiteral("[ ]"), clockTime(task.dueDate));
    if (const data::Pet *pet = user.findPet(task.petId)) {
        line += QStringLiteral("[%1] ").arg(pet->name);
    }
    line += QStringLiteral("%1 (%2)").arg(task.description, data::priorityToString(task.priority));
    if (task.isRecurring()) {
        line += QStringLiteral(" repeats %1").arg(data::recurrenceToString(task.recurrence));
    }
    return line;
}

QStringList ScheduleReport::todaysSchedule() const
{
    const auto &user = m_scheduler.user();
    QStringList lines;
    lines << banner(QStringLiteral("TODAY'S SCHEDULE FOR %1").arg(user.name().toUpper()));

    const auto groups = m_scheduler.organizedTodaysTasks();
    if (groups.empty()) {
        lines << QStringLiteral("No tasks scheduled for today.");
    }
    for (const auto &group : groups) {
        lines << QString() << group.label.toUpper() << QString(BannerWidth, QLatin1Char('-'));
        for (const auto &task : group.tasks) {
            lines << taskLine(task, user);
        }
    }
    lines << QString(BannerWidth, QLatin1Char('='));
    lines << QStringLiteral("Total tasks today: %1").arg(static_cast<int>(user.todaysTasks(m_scheduler.clock().today()).size()));
    return lines;
}

QStringList ScheduleReport::filters() const
{
    const auto &user = m_scheduler.user();
    QStringList lines;
    lines << banner(QStringLiteral("FILTERING"));

    for (const auto &pet : user.pets()) {
        lines << QString() << QStringLiteral("Tasks for %1:").arg(pet.name);
        for (const auto &task : core::Scheduler::sortTasksByTime(m_scheduler.tasksByPetName(pet.name))) {
            lines << QStringLiteral("  ") + taskLine(task, user);
        }
    }

    lines << QString() << QStringLiteral("Pending tasks by priority:");
    for (const auto &task : core::Scheduler::sortTasksByPriority(m_scheduler.pendingTasks())) {
        lines << QStringLiteral("  ") + taskLine(task, user);
    }

    lines << QString() << QStringLiteral("Completed tasks:");
    const auto completed = m_scheduler.completedTasks();
    if (completed.empty()) {
        lines << QStringLiteral("  No completed tasks yet.");
    }
    for (const auto &task : completed) {
        lines << QStringLiteral("  ") + taskLine(task, user);
    }
    return lines;
}

QStringList ScheduleReport::summary() const
{
    const auto stats = m_scheduler.summary();
    const auto &user = m_scheduler.user();
    QStringList lines;
    lines << banner(QStringLiteral("SUMMARY"));
    lines << QStringLiteral("Owner: %1 <%2>").arg(user.name(), user.email());
    lines << QStringLiteral("Pets: %1").arg(stats.petCount);
    for (const auto &pet : user.pets()) {
        lines << QStringLiteral("  %1").arg(pet.details());
    }
    lines << QStringLiteral("Today's tasks: %1").arg(stats.todaysTaskCount);
    lines << QStringLiteral("Pending tasks: %1").arg(stats.pendingCount);
    lines << QStringLiteral("Scheduled walks: %1").arg(stats.walkCount);
    return lines;
}

QStringList ScheduleReport::conflictDemo()
{
    QStringList lines;
    lines << banner(QStringLiteral("CONFLICT DETECTION"));

    const auto &pets = m_scheduler.user().pets();
    if (pets.empty()) {
        lines << QStringLiteral("No pets to schedule.");
        return lines;
    }
    const QString petId = pets.front().id;
    const QDate day = m_scheduler.clock().today();

    struct Attempt
    {
        QTime time;
        int minutes;
    };
    const Attempt attempts[] = {{QTime(9, 0), 30}, {QTime(9, 15), 30}, {QTime(9, 30), 20}};
    for (const auto &attempt : attempts) {
        const QDateTime start(day, attempt.time);
        lines << QString() << QStringLiteral("Walk %1 at %2 for %3 minutes:")
                                  .arg(pets.front().name, clockTime(start))
                                  .arg(attempt.minutes);
        const auto result = m_scheduler.scheduleWalk(petId, start, attempt.minutes);
        if (result.scheduled()) {
            lines << QStringLiteral("  scheduled as %1 until %2 (%3)")
                         .arg(result.walk->id,
                              clockTime(result.walk->end()),
                              data::walkStatusToString(result.walk->status));
        } else {
            for (const auto &reason : result.reasons) {
                lines << QStringLiteral("  rejected: ") + reason;
            }
        }
    }

    lines << QString() << QStringLiteral("Schedule-wide check:");
    const auto conflicts = m_scheduler.checkAllConflicts();
    if (conflicts.isEmpty()) {
        lines << QStringLiteral("  No conflicts detected in the entire schedule.");
    }
    for (const auto &conflict : conflicts) {
        lines << QStringLiteral("  ") + conflict;
    }
    return lines;
}

QStringList ScheduleReport::recurringDemo()
{
    QStringList lines;
    lines << banner(QStringLiteral("RECURRING TASKS"));

    const auto &pets = m_scheduler.user().pets();
    if (pets.empty()) {
        lines << QStringLiteral("No pets to care for.");
        return lines;
    }
    const auto &pet = pets.front();
    const QDate today = m_scheduler.clock().today();

    const auto task = m_scheduler.createRecurringTask(pet.id,
                                                      QStringLiteral("Feed %1 (breakfast)").arg(pet.name),
                                                      QDateTime(today, QTime(8, 0)),
                                                      data::Priority::High,
                                                      data::Recurrence::Daily);
    lines << QStringLiteral("Created %1 due %2, repeats %3")
                 .arg(task.description, dayTime(task.dueDate), data::recurrenceToString(task.recurrence));

    const auto next = m_scheduler.completeTask(task.id);
    if (next) {
        const qint64 days = today.daysTo(next->dueDate.date());
        lines << QStringLiteral("Completed it; next occurrence %1 due %2 (%3 %4 ahead)")
                     .arg(next->id, dayTime(next->dueDate))
                     .arg(days)
                     .arg(days == 1 ? QStringLiteral("day") : QStringLiteral("days"));
    } else {
        lines << QStringLiteral("Completed it; no next occurrence.");
    }
    return lines;
}

} // namespace app
} // namespace pawpal

#pragma once

#include <QDate>
#include <QString>
#include <QStringList>

namespace pawpal {
namespace core {
class Scheduler;
}
namespace data {
struct Task;
class User;
}

namespace app {

// Plain-text views over a scheduler, one list of lines per section.
class ScheduleReport
{
public:
    explicit ScheduleReport(core::Scheduler &scheduler);

    static QStringList sectionNames();

    QStringList section(const QString &name);

    QStringList todaysSchedule() const;
    QStringList filters() const;
    QStringList summary() const;
    // The two demo sections below add walks and tasks to the schedule.
    QStringList conflictDemo();
    QStringList recurringDemo();

    static QString taskLine(const data::Task &task, const data::User &user);

private:
    static QString banner(const QString &title);

    core::Scheduler &m_scheduler;
};

} // namespace app
} // namespace pawpal

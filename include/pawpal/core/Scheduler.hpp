#pragma once

#include <optional>
#include <vector>

#include <QDateTime>
#include <QString>
#include <QStringList>

#include "pawpal/core/Clock.hpp"
#include "pawpal/core/ConflictDetector.hpp"
#include "pawpal/core/RecurrenceEngine.hpp"
#include "pawpal/data/Task.hpp"
#include "pawpal/data/Walk.hpp"

namespace pawpal {
namespace data {
struct Pet;
class User;
}

namespace core {

struct ScheduleResult
{
    std::optional<data::Walk> walk;
    QString taskId;
    // Conflict reasons when the walk was rejected.
    QStringList reasons;

    bool scheduled() const { return walk.has_value(); }
};

struct TaskGroup
{
    QString label;
    std::vector<data::Task> tasks;
};

struct ScheduleSummary
{
    int petCount = 0;
    int todaysTaskCount = 0;
    int walkCount = 0;
    int pendingCount = 0;
};

class Scheduler
{
public:
    explicit Scheduler(data::User &user, const Clock &clock = systemClock());

    data::User &user();
    const data::User &user() const;
    const Clock &clock() const;

    void setGeneralGroupLabel(const QString &label);
    const QString &generalGroupLabel() const;

    // Rejects, without creating anything, when the window overlaps an
    // active walk of the same pet.
    ScheduleResult scheduleWalk(const QString &petId, const QDateTime &time, int durationMinutes);
    ConflictCheck checkWalk(const QString &petId, const QDateTime &time, int durationMinutes) const;

    // Returns the successor when the task recurs.
    std::optional<data::Task> completeTask(const QString &taskId);

    data::Task createRecurringTask(const QString &petId,
                                   const QString &description,
                                   const QDateTime &startTime,
                                   data::Priority priority,
                                   data::Recurrence recurrence);

    // Returns the clones created for overdue recurring tasks.
    std::vector<data::Task> rescheduleMissedTasks();

    std::vector<data::Task> tasksByPet(const QString &petId) const;
    std::vector<data::Task> tasksByPriority(data::Priority priority) const;
    std::vector<data::Task> tasksByPetName(const QString &petName) const;
    std::vector<data::Task> tasksByStatus(bool completed) const;
    std::vector<data::Task> pendingTasks() const;
    std::vector<data::Task> completedTasks() const;

    static std::vector<data::Task> sortTasksByTime(std::vector<data::Task> tasks);
    static std::vector<data::Task> sortTasksByPriority(std::vector<data::Task> tasks);

    std::vector<TaskGroup> organizedTodaysTasks() const;
    QStringList checkAllConflicts() const;
    ScheduleSummary summary() const;

private:
    const data::Pet &requirePet(const QString &petId) const;
    const data::Pet &requireWalkRequest(const QString &petId, const QDateTime &time, int durationMinutes) const;
    void store(const data::Task &task);

    data::User &m_user;
    const Clock &m_clock;
    ConflictDetector m_detector;
    RecurrenceEngine m_recurrence;
    QString m_generalGroupLabel;
};

} // namespace core
} // namespace pawpal

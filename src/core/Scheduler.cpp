#include "pawpal/core/Scheduler.hpp"

#include <algorithm>
#include <iterator>

#include "pawpal/Logging.hpp"
#include "pawpal/data/Pet.hpp"
#include "pawpal/data/User.hpp"
#include "pawpal/data/ValidationError.hpp"

namespace pawpal {
namespace core {

namespace {
template<typename Predicate>
std::vector<data::Task> filterTasks(const data::User &user, Predicate predicate)
{
    std::vector<data::Task> result;
    for (auto &task : user.tasks()) {
        if (predicate(task)) {
            result.push_back(std::move(task));
        }
    }
    return result;
}
} // namespace

Scheduler::Scheduler(data::User &user, const Clock &clock)
    : m_user(user)
    , m_clock(clock)
    , m_generalGroupLabel(QStringLiteral("General"))
{
}

data::User &Scheduler::user()
{
    return m_user;
}

const data::User &Scheduler::user() const
{
    return m_user;
}

const Clock &Scheduler::clock() const
{
    return m_clock;
}

void Scheduler::setGeneralGroupLabel(const QString &label)
{
    if (label.trimmed().isEmpty()) {
        return;
    }
    m_generalGroupLabel = label;
}

const QString &Scheduler::generalGroupLabel() const
{
    return m_generalGroupLabel;
}

const data::Pet &Scheduler::requirePet(const QString &petId) const
{
    const data::Pet *pet = m_user.findPet(petId);
    if (!pet) {
        throw data::ValidationError(QStringLiteral("Unknown pet '%1'").arg(petId));
    }
    return *pet;
}

const data::Pet &Scheduler::requireWalkRequest(const QString &petId, const QDateTime &time, int durationMinutes) const
{
    const data::Pet &pet = requirePet(petId);
    if (!time.isValid()) {
        throw data::ValidationError(QStringLiteral("Walk for %1 needs a valid start time").arg(pet.name));
    }
    if (durationMinutes <= 0) {
        throw data::ValidationError(QStringLiteral("Walk duration must be positive, got %1").arg(durationMinutes));
    }
    return pet;
}

void Scheduler::store(const data::Task &task)
{
    if (!m_user.updateTask(task)) {
        throw data::ValidationError(QStringLiteral("Unknown task '%1'").arg(task.id));
    }
}

ScheduleResult Scheduler::scheduleWalk(const QString &petId, const QDateTime &time, int durationMinutes)
{
    const data::Pet &pet = requireWalkRequest(petId, time, durationMinutes);

    ScheduleResult result;
    const ConflictCheck check = m_detector.hasConflict(m_user, petId, time, durationMinutes);
    if (check.conflict) {
        for (const auto &reason : check.reasons) {
            qCWarning(lcScheduler).noquote() << reason;
        }
        result.reasons = check.reasons;
        return result;
    }

    data::Walk walk;
    walk.petId = petId;
    walk.schedule(time, durationMinutes);

    data::Task task;
    task.description = QStringLiteral("Walk %1").arg(pet.name);
    task.dueDate = time;
    task.priority = data::Priority::High;
    task.petId = petId;
    task.walk = walk;

    const data::Task stored = m_user.appendTask(std::move(task));
    qCInfo(lcScheduler).noquote() << QStringLiteral("Scheduled %1 (%2 minutes) at %3")
                                         .arg(stored.description)
                                         .arg(durationMinutes)
                                         .arg(time.toString(Qt::ISODate));
    result.walk = stored.walk;
    result.taskId = stored.id;
    return result;
}

ConflictCheck Scheduler::checkWalk(const QString &petId, const QDateTime &time, int durationMinutes) const
{
    requireWalkRequest(petId, time, durationMinutes);
    return m_detector.hasConflict(m_user, petId, time, durationMinutes);
}

std::optional<data::Task> Scheduler::completeTask(const QString &taskId)
{
    auto task = m_user.findTask(taskId);
    if (!task) {
        throw data::ValidationError(QStringLiteral("Unknown task '%1'").arg(taskId));
    }
    if (task->completed) {
        return std::nullopt;
    }

    task->markComplete();
    store(*task);
    qCInfo(lcScheduler).noquote() << QStringLiteral("Completed %1 (%2)").arg(task->description, task->id);

    auto next = m_recurrence.nextTask(*task);
    if (!next) {
        return std::nullopt;
    }
    const data::Task stored = m_user.appendTask(std::move(*next));
    qCInfo(lcScheduler).noquote() << QStringLiteral("Next %1 occurrence of %2 due %3")
                                         .arg(data::recurrenceToString(stored.recurrence),
                                              stored.description,
                                              stored.dueDate.toString(Qt::ISODate));
    return stored;
}

data::Task Scheduler::createRecurringTask(const QString &petId,
                                          const QString &description,
                                          const QDateTime &startTime,
                                          data::Priority priority,
                                          data::Recurrence recurrence)
{
    requirePet(petId);

    data::Task task;
    task.description = description;
    task.dueDate = startTime;
    task.priority = priority;
    task.petId = petId;
    task.recurrence = recurrence;
    return m_user.appendTask(std::move(task));
}

std::vector<data::Task> Scheduler::rescheduleMissedTasks()
{
    const QDateTime now = m_clock.now();
    std::vector<data::Task> created;

    // Tasks appended during the pass are due in the future relative to
    // their source, so the snapshot is enough.
    for (auto &task : m_user.tasks()) {
        if (task.completed || !(task.dueDate < now)) {
            continue;
        }
        const auto next = task.nextOccurrence();
        if (!next) {
            continue;
        }

        const QDateTime missed = task.dueDate;
        task.dueDate = *next;
        if (task.walk) {
            task.walk->schedule(*next, task.walk->durationMinutes);
        }
        // Completing the task moves the walk just rescheduled straight on to Completed.
        task.markComplete();
        store(task);

        created.push_back(m_user.appendTask(m_recurrence.cloneAt(task, *next)));
        qCInfo(lcScheduler).noquote() << QStringLiteral("Rescheduled missed %1 from %2 to %3")
                                             .arg(task.description,
                                                  missed.toString(Qt::ISODate),
                                                  next->toString(Qt::ISODate));
    }
    return created;
}

std::vector<data::Task> Scheduler::tasksByPet(const QString &petId) const
{
    return filterTasks(m_user, [&petId](const data::Task &task) { return task.petId == petId; });
}

std::vector<data::Task> Scheduler::tasksByPriority(data::Priority priority) const
{
    return filterTasks(m_user, [priority](const data::Task &task) { return task.priority == priority; });
}

std::vector<data::Task> Scheduler::tasksByPetName(const QString &petName) const
{
    QStringList petIds;
    for (const auto &pet : m_user.pets()) {
        if (pet.name.compare(petName, Qt::CaseInsensitive) == 0) {
            petIds << pet.id;
        }
    }
    if (petIds.isEmpty()) {
        return {};
    }
    return filterTasks(m_user, [&petIds](const data::Task &task) {
        return task.hasPet() && petIds.contains(task.petId);
    });
}

std::vector<data::Task> Scheduler::tasksByStatus(bool completed) const
{
    return filterTasks(m_user, [completed](const data::Task &task) { return task.completed == completed; });
}

std::vector<data::Task> Scheduler::pendingTasks() const
{
    return tasksByStatus(false);
}

std::vector<data::Task> Scheduler::completedTasks() const
{
    return tasksByStatus(true);
}

std::vector<data::Task> Scheduler::sortTasksByTime(std::vector<data::Task> tasks)
{
    std::stable_sort(tasks.begin(), tasks.end(), [](const data::Task &lhs, const data::Task &rhs) {
        return lhs.dueDate < rhs.dueDate;
    });
    return tasks;
}

std::vector<data::Task> Scheduler::sortTasksByPriority(std::vector<data::Task> tasks)
{
    std::stable_sort(tasks.begin(), tasks.end(), [](const data::Task &lhs, const data::Task &rhs) {
        const int lhsRank = data::priorityRank(lhs.priority);
        const int rhsRank = data::priorityRank(rhs.priority);
        if (lhsRank == rhsRank) {
            return lhs.dueDate < rhs.dueDate;
        }
        return lhsRank < rhsRank;
    });
    return tasks;
}

std::vector<TaskGroup> Scheduler::organizedTodaysTasks() const
{
    std::vector<TaskGroup> groups;
    for (auto &task : m_user.todaysTasks(m_clock.today())) {
        QString label = m_generalGroupLabel;
        if (const data::Pet *pet = m_user.findPet(task.petId)) {
            label = pet->name;
        }
        auto it = std::find_if(groups.begin(), groups.end(), [&label](const TaskGroup &group) {
            return group.label == label;
        });
        if (it == groups.end()) {
            groups.push_back(TaskGroup{label, {}});
            it = std::prev(groups.end());
        }
        it->tasks.push_back(std::move(task));
    }
    for (auto &group : groups) {
        group.tasks = sortTasksByPriority(std::move(group.tasks));
    }
    return groups;
}

QStringList Scheduler::checkAllConflicts() const
{
    return m_detector.checkAll(m_user);
}

ScheduleSummary Scheduler::summary() const
{
    ScheduleSummary summary;
    summary.petCount = static_cast<int>(m_user.pets().size());
    summary.todaysTaskCount = static_cast<int>(m_user.todaysTasks(m_clock.today()).size());
    summary.walkCount = m_user.walkCount();
    summary.pendingCount = static_cast<int>(pendingTasks().size());
    return summary;
}

} // namespace core
} // namespace pawpal

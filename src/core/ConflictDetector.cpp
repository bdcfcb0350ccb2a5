#include "pawpal/core/ConflictDetector.hpp"

#include "pawpal/Logging.hpp"
#include "pawpal/data/User.hpp"
#include "pawpal/data/ValidationError.hpp"

namespace pawpal {
namespace core {

namespace {
constexpr auto TIME_FORMAT = "yyyy-MM-dd hh:mm";

QString formatTime(const QDateTime &time)
{
    return time.toString(QString::fromLatin1(TIME_FORMAT));
}

QDateTime windowEnd(const QDateTime &start, int minutes)
{
    return start.addSecs(static_cast<qint64>(minutes) * 60);
}

std::vector<data::Task> activeWalkTasks(const data::User &user, const QString &petId)
{
    std::vector<data::Task> result;
    for (auto &task : user.tasksForPet(petId)) {
        if (!task.completed && task.walk) {
            result.push_back(std::move(task));
        }
    }
    return result;
}
} // namespace

QString WalkConflict::reason() const
{
    return QStringLiteral("Conflict: %1 already has '%2' at %3 for %4 minutes")
        .arg(petName, description, formatTime(existingStart))
        .arg(existingDurationMinutes);
}

bool ConflictDetector::windowsOverlap(const QDateTime &startA, int minutesA, const QDateTime &startB, int minutesB)
{
    return startA < windowEnd(startB, minutesB) && windowEnd(startA, minutesA) > startB;
}

ConflictCheck ConflictDetector::hasConflict(const data::User &user,
                                            const QString &petId,
                                            const QDateTime &proposedStart,
                                            int durationMinutes) const
{
    const data::Pet *pet = user.findPet(petId);
    if (!pet) {
        throw data::ValidationError(QStringLiteral("Unknown pet '%1'").arg(petId));
    }

    ConflictCheck check;

    const auto candidates = activeWalkTasks(user, petId);
    qCDebug(lcConflicts) << "Scanning" << candidates.size() << "active walks of" << pet->name;
    for (const auto &task : candidates) {
        // The task's due date is the walk start as far as conflicts go.
        if (!windowsOverlap(proposedStart, durationMinutes, task.dueDate, task.walk->durationMinutes)) {
            continue;
        }
        WalkConflict conflict;
        conflict.petName = pet->name;
        conflict.taskId = task.id;
        conflict.description = task.description;
        conflict.existingStart = task.dueDate;
        conflict.existingDurationMinutes = task.walk->durationMinutes;
        check.reasons << conflict.reason();
        check.conflicts.push_back(std::move(conflict));
    }

    check.conflict = !check.conflicts.empty();
    if (!check.conflict) {
        check.message = QStringLiteral("No conflicts: %1 is free from %2 to %3")
                            .arg(pet->name,
                                 formatTime(proposedStart),
                                 formatTime(windowEnd(proposedStart, durationMinutes)));
    }
    return check;
}

QStringList ConflictDetector::checkAll(const data::User &user) const
{
    QStringList report;
    for (const auto &pet : user.pets()) {
        const auto tasks = activeWalkTasks(user, pet.id);
        for (size_t i = 0; i < tasks.size(); ++i) {
            for (size_t j = i + 1; j < tasks.size(); ++j) {
                const auto &first = tasks[i];
                const auto &second = tasks[j];
                if (!windowsOverlap(first.dueDate, first.walk->durationMinutes,
                                    second.dueDate, second.walk->durationMinutes)) {
                    continue;
                }
                report << QStringLiteral("Conflict for %1: '%2' at %3 (%4 min) overlaps '%5' at %6 (%7 min)")
                              .arg(pet.name, first.description, formatTime(first.dueDate))
                              .arg(first.walk->durationMinutes)
                              .arg(second.description, formatTime(second.dueDate))
                              .arg(second.walk->durationMinutes);
            }
        }
    }
    return report;
}

} // namespace core
} // namespace pawpal

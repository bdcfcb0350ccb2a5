#include "pawpal/data/Task.hpp"

namespace pawpal {
namespace data {

int priorityRank(Priority priority)
{
    switch (priority) {
    case Priority::High:
        return 0;
    case Priority::Medium:
        return 1;
    case Priority::Low:
        return 2;
    case Priority::Unknown:
        break;
    }
    return 3;
}

Priority priorityFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("high")) {
        return Priority::High;
    }
    if (normalized == QLatin1String("medium")) {
        return Priority::Medium;
    }
    if (normalized == QLatin1String("low")) {
        return Priority::Low;
    }
    return Priority::Unknown;
}

QString priorityToString(Priority priority)
{
    switch (priority) {
    case Priority::High:
        return QStringLiteral("high");
    case Priority::Medium:
        return QStringLiteral("medium");
    case Priority::Low:
        return QStringLiteral("low");
    case Priority::Unknown:
        break;
    }
    return QStringLiteral("unknown");
}

std::optional<Recurrence> recurrenceFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized.isEmpty() || normalized == QLatin1String("none")) {
        return Recurrence::None;
    }
    if (normalized == QLatin1String("daily")) {
        return Recurrence::Daily;
    }
    if (normalized == QLatin1String("weekly")) {
        return Recurrence::Weekly;
    }
    return std::nullopt;
}

QString recurrenceToString(Recurrence recurrence)
{
    switch (recurrence) {
    case Recurrence::Daily:
        return QStringLiteral("daily");
    case Recurrence::Weekly:
        return QStringLiteral("weekly");
    case Recurrence::None:
        break;
    }
    return QString();
}

void Task::markComplete()
{
    completed = true;
    if (walk) {
        walk->complete();
    }
}

bool Task::hasPet() const
{
    return !petId.isEmpty();
}

bool Task::isRecurring() const
{
    return recurrence != Recurrence::None;
}

bool Task::isForToday(const QDate &today) const
{
    return dueDate.isValid() && dueDate.date() == today;
}

std::optional<QDateTime> Task::nextOccurrence() const
{
    switch (recurrence) {
    case Recurrence::Daily:
        return dueDate.addDays(1);
    case Recurrence::Weekly:
        return dueDate.addDays(7);
    case Recurrence::None:
        break;
    }
    return std::nullopt;
}

} // namespace data
} // namespace pawpal

#pragma once

#include <optional>

#include <QDate>
#include <QDateTime>
#include <QString>

#include "pawpal/data/Walk.hpp"

namespace pawpal {
namespace data {

enum class Priority
{
    High,
    Medium,
    Low,
    Unknown,
};

enum class Recurrence
{
    None,
    Daily,
    Weekly,
};

// High sorts first; anything unrecognised sinks below Low.
int priorityRank(Priority priority);
Priority priorityFromString(const QString &value);
QString priorityToString(Priority priority);

std::optional<Recurrence> recurrenceFromString(const QString &value);
QString recurrenceToString(Recurrence recurrence);

struct Task
{
    QString id;
    QString description;
    QDateTime dueDate;
    Priority priority = Priority::Medium;
    bool completed = false;
    std::optional<Walk> walk;
    QString userId;
    QString petId;
    Recurrence recurrence = Recurrence::None;

    void markComplete();
    bool hasPet() const;
    bool isRecurring() const;
    bool isForToday(const QDate &today) const;
    std::optional<QDateTime> nextOccurrence() const;
};

} // namespace data
} // namespace pawpal

#include "pawpal/core/RecurrenceEngine.hpp"

namespace pawpal {
namespace core {

std::optional<data::Task> RecurrenceEngine::nextTask(const data::Task &task) const
{
    const auto next = task.nextOccurrence();
    if (!next) {
        return std::nullopt;
    }
    return cloneAt(task, *next);
}

data::Task RecurrenceEngine::cloneAt(const data::Task &task, const QDateTime &dueDate) const
{
    data::Task clone;
    clone.description = task.description;
    clone.dueDate = dueDate;
    clone.priority = task.priority;
    clone.completed = false;
    clone.userId = task.userId;
    clone.petId = task.petId;
    clone.recurrence = task.recurrence;
    return clone;
}

} // namespace core
} // namespace pawpal

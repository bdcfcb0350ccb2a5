#pragma once

#include <optional>

#include <QDateTime>

#include "pawpal/data/Task.hpp"

namespace pawpal {
namespace core {

class RecurrenceEngine
{
public:
    // Successor of a recurring task, due one period later. The id is left
    // empty for the arena to assign and the walk is never carried over.
    std::optional<data::Task> nextTask(const data::Task &task) const;

    // Pending copy of the task due at the given time, without id or walk.
    data::Task cloneAt(const data::Task &task, const QDateTime &dueDate) const;
};

} // namespace core
} // namespace pawpal

#pragma once

#include <optional>
#include <vector>

#include "pawpal/data/Task.hpp"

namespace pawpal {
namespace data {

class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    // Tasks in insertion order.
    virtual std::vector<Task> fetchTasks() const = 0;
    virtual std::optional<Task> findById(const QString &id) const = 0;
    virtual bool contains(const QString &id) const = 0;
    virtual Task addTask(Task task) = 0;
    virtual bool updateTask(const Task &task) = 0;
    virtual int count() const = 0;
};

} // namespace data
} // namespace pawpal

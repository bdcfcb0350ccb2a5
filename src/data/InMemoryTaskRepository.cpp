#include "pawpal/data/InMemoryTaskRepository.hpp"

#include "pawpal/data/ValidationError.hpp"

namespace pawpal {
namespace data {

InMemoryTaskRepository::InMemoryTaskRepository() = default;
InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::vector<Task> InMemoryTaskRepository::fetchTasks() const
{
    std::vector<Task> tasks;
    tasks.reserve(static_cast<size_t>(m_order.size()));
    for (const auto &id : m_order) {
        tasks.push_back(m_items.value(id));
    }
    return tasks;
}

std::optional<Task> InMemoryTaskRepository::findById(const QString &id) const
{
    if (m_items.contains(id)) {
        return m_items.value(id);
    }
    return std::nullopt;
}

bool InMemoryTaskRepository::contains(const QString &id) const
{
    return m_items.contains(id);
}

Task InMemoryTaskRepository::addTask(Task task)
{
    if (task.id.isEmpty()) {
        task.id = nextId();
    } else if (m_items.contains(task.id)) {
        throw ValidationError(QStringLiteral("Duplicate task id '%1'").arg(task.id));
    }
    m_items.insert(task.id, task);
    m_order.append(task.id);
    return task;
}

bool InMemoryTaskRepository::updateTask(const Task &task)
{
    if (!m_items.contains(task.id)) {
        return false;
    }
    m_items.insert(task.id, task);
    return true;
}

int InMemoryTaskRepository::count() const
{
    return m_order.size();
}

QString InMemoryTaskRepository::nextId()
{
    QString id;
    do {
        id = QStringLiteral("task_%1").arg(++m_sequence, 4, 10, QLatin1Char('0'));
    } while (m_items.contains(id));
    return id;
}

} // namespace data
} // namespace pawpal

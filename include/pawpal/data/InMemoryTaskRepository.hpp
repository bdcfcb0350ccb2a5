#pragma once

#include <QHash>
#include <QVector>

#include "pawpal/data/TaskRepository.hpp"

namespace pawpal {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    ~InMemoryTaskRepository() override;

    std::vector<Task> fetchTasks() const override;
    std::optional<Task> findById(const QString &id) const override;
    bool contains(const QString &id) const override;
    Task addTask(Task task) override;
    bool updateTask(const Task &task) override;
    int count() const override;

private:
    QString nextId();

    QHash<QString, Task> m_items;
    QVector<QString> m_order;
    int m_sequence = 0;
};

} // namespace data
} // namespace pawpal

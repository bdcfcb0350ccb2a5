#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <QDate>
#include <QHash>
#include <QString>
#include <QVector>

#include "pawpal/data/Pet.hpp"
#include "pawpal/data/Task.hpp"
#include "pawpal/data/Walk.hpp"

namespace pawpal {
namespace data {

class TaskRepository;

// The single owner of a household. Tasks live once in the task arena;
// the user and each pet keep ordered id lists into it.
class User
{
public:
    User(QString id, QString name, QString email);
    User(QString id, QString name, QString email, std::unique_ptr<TaskRepository> tasks);
    ~User();

    User(const User &) = delete;
    User &operator=(const User &) = delete;

    const QString &id() const;
    const QString &name() const;
    const QString &email() const;

    void addPet(Pet pet);
    const std::vector<Pet> &pets() const;
    const Pet *findPet(const QString &petId) const;

    Task appendTask(Task task);
    bool updateTask(const Task &task);
    std::optional<Task> findTask(const QString &taskId) const;

    std::vector<Task> tasks() const;
    std::vector<Task> tasksForPet(const QString &petId) const;
    std::vector<Walk> walks() const;
    std::vector<Walk> scheduledWalks(const QString &petId) const;
    std::vector<Task> todaysTasks(const QDate &today) const;

    int taskCount() const;
    int walkCount() const;

private:
    Pet *mutablePet(const QString &petId);
    QString nextWalkId();
    void validate(const Task &task) const;

    QString m_id;
    QString m_name;
    QString m_email;
    std::vector<Pet> m_pets;
    QVector<QString> m_taskIds;
    QVector<QString> m_walkIds;
    QHash<QString, QString> m_walkTasks;
    std::unique_ptr<TaskRepository> m_tasks;
    int m_walkSequence = 0;
};

} // namespace data
} // namespace pawpal

#include "pawpal/data/User.hpp"

#include <utility>

#include "pawpal/Logging.hpp"
#include "pawpal/data/InMemoryTaskRepository.hpp"
#include "pawpal/data/TaskRepository.hpp"
#include "pawpal/data/ValidationError.hpp"

namespace pawpal {
namespace data {

User::User(QString id, QString name, QString email)
    : User(std::move(id), std::move(name), std::move(email), std::make_unique<InMemoryTaskRepository>())
{
}

User::User(QString id, QString name, QString email, std::unique_ptr<TaskRepository> tasks)
    : m_id(std::move(id))
    , m_name(std::move(name))
    , m_email(std::move(email))
    , m_tasks(std::move(tasks))
{
    if (m_id.trimmed().isEmpty()) {
        throw ValidationError(QStringLiteral("User id must not be empty"));
    }
    if (!m_tasks) {
        m_tasks = std::make_unique<InMemoryTaskRepository>();
    }
}

User::~User() = default;

const QString &User::id() const
{
    return m_id;
}

const QString &User::name() const
{
    return m_name;
}

const QString &User::email() const
{
    return m_email;
}

void User::addPet(Pet pet)
{
    if (pet.id.trimmed().isEmpty()) {
        throw ValidationError(QStringLiteral("Pet id must not be empty"));
    }
    if (pet.name.trimmed().isEmpty()) {
        throw ValidationError(QStringLiteral("Pet '%1' needs a name").arg(pet.id));
    }
    if (pet.age < 0) {
        throw ValidationError(QStringLiteral("Pet '%1' has a negative age").arg(pet.name));
    }
    if (findPet(pet.id)) {
        throw ValidationError(QStringLiteral("Duplicate pet id '%1'").arg(pet.id));
    }
    pet.ownerId = m_id;
    qCDebug(lcData) << "Added pet" << pet.id << pet.name;
    m_pets.push_back(std::move(pet));
}

const std::vector<Pet> &User::pets() const
{
    return m_pets;
}

const Pet *User::findPet(const QString &petId) const
{
    for (const auto &pet : m_pets) {
        if (pet.id == petId) {
            return &pet;
        }
    }
    return nullptr;
}

Pet *User::mutablePet(const QString &petId)
{
    for (auto &pet : m_pets) {
        if (pet.id == petId) {
            return &pet;
        }
    }
    return nullptr;
}

Task User::appendTask(Task task)
{
    validate(task);

    task.userId = m_id;
    if (task.walk) {
        if (task.walk->id.isEmpty()) {
            task.walk->id = nextWalkId();
        }
        task.walk->petId = task.petId;
    }

    const Task stored = m_tasks->addTask(std::move(task));
    m_taskIds.append(stored.id);
    if (auto *pet = mutablePet(stored.petId)) {
        pet->taskIds.append(stored.id);
    }
    if (stored.walk) {
        m_walkIds.append(stored.walk->id);
        m_walkTasks.insert(stored.walk->id, stored.id);
    }
    qCDebug(lcData) << "Registered task" << stored.id << stored.description;
    return stored;
}

bool User::updateTask(const Task &task)
{
    const auto existing = m_tasks->findById(task.id);
    if (!existing) {
        return false;
    }
    // Pet and walk membership are fixed once a task is registered.
    if (existing->petId != task.petId) {
        throw ValidationError(QStringLiteral("Task '%1' cannot move to another pet").arg(task.id));
    }
    const QString existingWalk = existing->walk ? existing->walk->id : QString();
    const QString updatedWalk = task.walk ? task.walk->id : QString();
    if (existingWalk != updatedWalk) {
        throw ValidationError(QStringLiteral("Task '%1' cannot swap its walk").arg(task.id));
    }
    return m_tasks->updateTask(task);
}

std::optional<Task> User::findTask(const QString &taskId) const
{
    return m_tasks->findById(taskId);
}

std::vector<Task> User::tasks() const
{
    std::vector<Task> result;
    result.reserve(static_cast<size_t>(m_taskIds.size()));
    for (const auto &id : m_taskIds) {
        if (auto task = m_tasks->findById(id)) {
            result.push_back(std::move(*task));
        }
    }
    return result;
}

std::vector<Task> User::tasksForPet(const QString &petId) const
{
    std::vector<Task> result;
    const Pet *pet = findPet(petId);
    if (!pet) {
        return result;
    }
    result.reserve(static_cast<size_t>(pet->taskIds.size()));
    for (const auto &id : pet->taskIds) {
        if (auto task = m_tasks->findById(id)) {
            result.push_back(std::move(*task));
        }
    }
    return result;
}

std::vector<Walk> User::walks() const
{
    std::vector<Walk> result;
    result.reserve(static_cast<size_t>(m_walkIds.size()));
    for (const auto &walkId : m_walkIds) {
        const auto task = m_tasks->findById(m_walkTasks.value(walkId));
        if (task && task->walk) {
            result.push_back(*task->walk);
        }
    }
    return result;
}

std::vector<Walk> User::scheduledWalks(const QString &petId) const
{
    std::vector<Walk> result;
    for (const auto &task : tasksForPet(petId)) {
        if (task.walk && !task.completed) {
            result.push_back(*task.walk);
        }
    }
    return result;
}

std::vector<Task> User::todaysTasks(const QDate &today) const
{
    std::vector<Task> result;
    for (auto &task : tasks()) {
        if (task.isForToday(today) && !task.completed) {
            result.push_back(std::move(task));
        }
    }
    return result;
}

int User::taskCount() const
{
    return m_taskIds.size();
}

int User::walkCount() const
{
    return m_walkIds.size();
}

QString User::nextWalkId()
{
    QString id;
    do {
        id = QStringLiteral("walk_%1").arg(++m_walkSequence, 4, 10, QLatin1Char('0'));
    } while (m_walkTasks.contains(id));
    return id;
}

void User::validate(const Task &task) const
{
    if (task.description.trimmed().isEmpty()) {
        throw ValidationError(QStringLiteral("Task description must not be empty"));
    }
    if (!task.dueDate.isValid()) {
        throw ValidationError(QStringLiteral("Task '%1' has no valid due date").arg(task.description));
    }
    if (task.hasPet() && !findPet(task.petId)) {
        throw ValidationError(QStringLiteral("Unknown pet '%1'").arg(task.petId));
    }
    if (!task.id.isEmpty() && m_tasks->contains(task.id)) {
        throw ValidationError(QStringLiteral("Duplicate task id '%1'").arg(task.id));
    }
    if (task.walk) {
        if (!task.hasPet()) {
            throw ValidationError(QStringLiteral("Walk task '%1' has no pet").arg(task.description));
        }
        if (task.walk->durationMinutes <= 0) {
            throw ValidationError(QStringLiteral("Walk duration must be positive, got %1")
                                      .arg(task.walk->durationMinutes));
        }
        if (!task.walk->id.isEmpty() && m_walkTasks.contains(task.walk->id)) {
            throw ValidationError(QStringLiteral("Duplicate walk id '%1'").arg(task.walk->id));
        }
    }
}

} // namespace data
} // namespace pawpal

#include "pawpal/app/DemoHousehold.hpp"

#include <QDateTime>
#include <QTime>

#include "pawpal/core/Scheduler.hpp"
#include "pawpal/data/Pet.hpp"
#include "pawpal/data/Task.hpp"
#include "pawpal/data/User.hpp"

namespace pawpal {
namespace app {

void seedDemoHousehold(core::Scheduler &scheduler, const QDate &day, int walkMinutes)
{
    auto &user = scheduler.user();
    if (!user.pets().empty()) {
        return;
    }

    data::Pet dog;
    dog.id = QStringLiteral("pet_001");
    dog.name = QStringLiteral("Buddy");
    dog.breed = QStringLiteral("Golden Retriever");
    dog.age = 3;

    data::Pet cat;
    cat.id = QStringLiteral("pet_002");
    cat.name = QStringLiteral("Whiskers");
    cat.breed = QStringLiteral("Siamese");
    cat.age = 2;

    user.addPet(dog);
    user.addPet(cat);

    data::Task dinner;
    dinner.description = QStringLiteral("Feed Buddy dinner");
    dinner.dueDate = QDateTime(day, QTime(18, 0));
    dinner.priority = data::Priority::High;
    dinner.petId = dog.id;
    const auto storedDinner = user.appendTask(std::move(dinner));

    scheduler.scheduleWalk(dog.id, QDateTime(day, QTime(8, 0)), walkMinutes);
    scheduler.scheduleWalk(cat.id, QDateTime(day, QTime(14, 0)), 15);

    data::Task play;
    play.description = QStringLiteral("Play with Whiskers");
    play.dueDate = QDateTime(day, QTime(12, 0));
    play.priority = data::Priority::Medium;
    play.petId = cat.id;
    user.appendTask(std::move(play));

    data::Task vet;
    vet.description = QStringLiteral("Call the vet");
    vet.dueDate = QDateTime(day, QTime(10, 30));
    vet.priority = data::Priority::Low;
    user.appendTask(std::move(vet));

    scheduler.completeTask(storedDinner.id);
}

} // namespace app
} // namespace pawpal

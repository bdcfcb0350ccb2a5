#pragma once

#include <QDate>

namespace pawpal {
namespace core {
class Scheduler;
}

namespace app {

// Seeds two pets with a mix of walks, chores and one finished task on the
// given day. Tasks are added out of chronological order on purpose.
void seedDemoHousehold(core::Scheduler &scheduler, const QDate &day, int walkMinutes);

} // namespace app
} // namespace pawpal

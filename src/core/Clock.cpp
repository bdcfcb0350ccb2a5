#include "pawpal/core/Clock.hpp"

#include <utility>

namespace pawpal {
namespace core {

QDate Clock::today() const
{
    return now().date();
}

QDateTime SystemClock::now() const
{
    return QDateTime::currentDateTime();
}

FixedClock::FixedClock(QDateTime now)
    : m_now(std::move(now))
{
}

QDateTime FixedClock::now() const
{
    return m_now;
}

void FixedClock::setNow(const QDateTime &now)
{
    m_now = now;
}

const Clock &systemClock()
{
    static const SystemClock clock;
    return clock;
}

} // namespace core
} // namespace pawpal

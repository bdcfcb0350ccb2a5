#include "pawpal/core/AppContext.hpp"

#include "pawpal/core/Clock.hpp"
#include "pawpal/core/Scheduler.hpp"
#include "pawpal/core/Settings.hpp"
#include "pawpal/data/User.hpp"

namespace pawpal {
namespace core {

AppContext::AppContext(std::unique_ptr<Settings> settings,
                       std::unique_ptr<Clock> clock,
                       const OwnerOverrides &overrides)
    : m_settings(std::move(settings))
    , m_clock(std::move(clock))
{
    if (!m_settings) {
        m_settings = std::make_unique<Settings>();
    }
    if (!m_clock) {
        m_clock = std::make_unique<SystemClock>();
    }

    const QString name = overrides.name.isEmpty() ? m_settings->ownerName() : overrides.name;
    const QString email = overrides.email.isEmpty() ? m_settings->ownerEmail() : overrides.email;
    m_user = std::make_unique<data::User>(m_settings->ownerId(), name, email);
    m_scheduler = std::make_unique<Scheduler>(*m_user, *m_clock);
    m_scheduler->setGeneralGroupLabel(m_settings->generalGroupLabel());
}

AppContext::~AppContext() = default;

Settings &AppContext::settings()
{
    return *m_settings;
}

const Clock &AppContext::clock() const
{
    return *m_clock;
}

data::User &AppContext::user()
{
    return *m_user;
}

Scheduler &AppContext::scheduler()
{
    return *m_scheduler;
}

} // namespace core
} // namespace pawpal

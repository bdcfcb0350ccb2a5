#pragma once

#include <memory>

#include <QString>

namespace pawpal {
namespace data {
class User;
}

namespace core {

class Clock;
class Scheduler;
class Settings;

// Owner details given on the command line take precedence over settings.
struct OwnerOverrides
{
    QString name;
    QString email;
};

class AppContext
{
public:
    AppContext(std::unique_ptr<Settings> settings,
               std::unique_ptr<Clock> clock,
               const OwnerOverrides &overrides = {});
    ~AppContext();

    Settings &settings();
    const Clock &clock() const;
    data::User &user();
    Scheduler &scheduler();

private:
    std::unique_ptr<Settings> m_settings;
    std::unique_ptr<Clock> m_clock;
    std::unique_ptr<data::User> m_user;
    std::unique_ptr<Scheduler> m_scheduler;
};

} // namespace core
} // namespace pawpal

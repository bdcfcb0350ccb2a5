#include "pawpal/core/Settings.hpp"

#include <QSettings>

#include "pawpal/data/ValidationError.hpp"

namespace pawpal {
namespace core {

namespace {
const auto OwnerIdKey = QStringLiteral("owner/id");
const auto OwnerNameKey = QStringLiteral("owner/name");
const auto OwnerEmailKey = QStringLiteral("owner/email");
const auto WalkDurationKey = QStringLiteral("walks/defaultDurationMinutes");
const auto GeneralLabelKey = QStringLiteral("schedule/generalGroupLabel");

constexpr int DefaultWalkDurationMinutes = 30;
} // namespace

Settings::Settings()
    : m_settings(std::make_unique<QSettings>())
{
}

Settings::Settings(const QString &filePath)
    : m_settings(std::make_unique<QSettings>(filePath, QSettings::IniFormat))
{
}

Settings::~Settings() = default;

QString Settings::ownerId() const
{
    return m_settings->value(OwnerIdKey, QStringLiteral("user_001")).toString();
}

QString Settings::ownerName() const
{
    return m_settings->value(OwnerNameKey, QStringLiteral("Owner")).toString();
}

QString Settings::ownerEmail() const
{
    return m_settings->value(OwnerEmailKey).toString();
}

int Settings::defaultWalkDurationMinutes() const
{
    bool ok = false;
    const int minutes = m_settings->value(WalkDurationKey, DefaultWalkDurationMinutes).toInt(&ok);
    if (!ok || minutes <= 0) {
        return DefaultWalkDurationMinutes;
    }
    return minutes;
}

QString Settings::generalGroupLabel() const
{
    const QString label = m_settings->value(GeneralLabelKey).toString().trimmed();
    return label.isEmpty() ? QStringLiteral("General") : label;
}

void Settings::setOwnerId(const QString &id)
{
    m_settings->setValue(OwnerIdKey, id);
}

void Settings::setOwnerName(const QString &name)
{
    m_settings->setValue(OwnerNameKey, name);
}

void Settings::setOwnerEmail(const QString &email)
{
    m_settings->setValue(OwnerEmailKey, email);
}

void Settings::setDefaultWalkDurationMinutes(int minutes)
{
    if (minutes <= 0) {
        throw data::ValidationError(QStringLiteral("Walk duration must be positive, got %1").arg(minutes));
    }
    m_settings->setValue(WalkDurationKey, minutes);
}

void Settings::setGeneralGroupLabel(const QString &label)
{
    m_settings->setValue(GeneralLabelKey, label);
}

void Settings::sync()
{
    m_settings->sync();
}

} // namespace core
} // namespace pawpal

#pragma once

#include <memory>

#include <QString>

class QSettings;

namespace pawpal {
namespace core {

class Settings
{
public:
    // Uses the application-wide QSettings location.
    Settings();
    // Uses an INI file at the given path.
    explicit Settings(const QString &filePath);
    ~Settings();

    QString ownerId() const;
    QString ownerName() const;
    QString ownerEmail() const;
    int defaultWalkDurationMinutes() const;
    QString generalGroupLabel() const;

    void setOwnerId(const QString &id);
    void setOwnerName(const QString &name);
    void setOwnerEmail(const QString &email);
    void setDefaultWalkDurationMinutes(int minutes);
    void setGeneralGroupLabel(const QString &label);

    void sync();

private:
    std::unique_ptr<QSettings> m_settings;
};

} // namespace core
} // namespace pawpal

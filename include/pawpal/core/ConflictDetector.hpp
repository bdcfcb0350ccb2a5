#pragma once

#include <vector>

#include <QDateTime>
#include <QString>
#include <QStringList>

namespace pawpal {
namespace data {
class User;
}

namespace core {

struct WalkConflict
{
    QString petName;
    QString taskId;
    QString description;
    QDateTime existingStart;
    int existingDurationMinutes = 0;

    QString reason() const;
};

struct ConflictCheck
{
    bool conflict = false;
    std::vector<WalkConflict> conflicts;
    QStringList reasons;
    // Confirmation text when nothing overlaps.
    QString message;
};

// Half-open interval overlap between walk windows of the same pet.
// Only active (not completed) walk-bearing tasks take part.
class ConflictDetector
{
public:
    static bool windowsOverlap(const QDateTime &startA, int minutesA, const QDateTime &startB, int minutesB);

    ConflictCheck hasConflict(const data::User &user,
                              const QString &petId,
                              const QDateTime &proposedStart,
                              int durationMinutes) const;

    QStringList checkAll(const data::User &user) const;
};

} // namespace core
} // namespace pawpal

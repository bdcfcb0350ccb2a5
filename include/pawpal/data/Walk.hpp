#pragma once

#include <QDateTime>
#include <QString>

namespace pawpal {
namespace data {

enum class WalkStatus
{
    Scheduled,
    Cancelled,
    Completed,
};

QString walkStatusToString(WalkStatus status);

struct Walk
{
    QString id;
    QString petId;
    QDateTime scheduledTime;
    int durationMinutes = 0;
    WalkStatus status = WalkStatus::Scheduled;

    // Exclusive end of the [scheduledTime, end) window.
    QDateTime end() const;

    void schedule(const QDateTime &time, int minutes);
    void cancel();
    void complete();
};

} // namespace data
} // namespace pawpal

#include "pawpal/data/Walk.hpp"

namespace pawpal {
namespace data {

QString walkStatusToString(WalkStatus status)
{
    switch (status) {
    case WalkStatus::Scheduled:
        return QStringLiteral("scheduled");
    case WalkStatus::Cancelled:
        return QStringLiteral("cancelled");
    case WalkStatus::Completed:
        return QStringLiteral("completed");
    }
    return QString();
}

QDateTime Walk::end() const
{
    return scheduledTime.addSecs(static_cast<qint64>(durationMinutes) * 60);
}

void Walk::schedule(const QDateTime &time, int minutes)
{
    scheduledTime = time;
    durationMinutes = minutes;
    status = WalkStatus::Scheduled;
}

void Walk::cancel()
{
    status = WalkStatus::Cancelled;
}

void Walk::complete()
{
    status = WalkStatus::Completed;
}

} // namespace data
} // namespace pawpal

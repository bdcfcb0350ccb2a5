#pragma once

#include <QDate>
#include <QDateTime>

namespace pawpal {
namespace core {

class Clock
{
public:
    virtual ~Clock() = default;

    virtual QDateTime now() const = 0;
    QDate today() const;
};

class SystemClock : public Clock
{
public:
    QDateTime now() const override;
};

class FixedClock : public Clock
{
public:
    explicit FixedClock(QDateTime now);

    QDateTime now() const override;
    void setNow(const QDateTime &now);

private:
    QDateTime m_now;
};

const Clock &systemClock();

} // namespace core
} // namespace pawpal

#pragma once

#include <QString>
#include <QVector>

namespace pawpal {
namespace data {

struct Pet
{
    QString id;
    QString name;
    QString breed;
    int age = 0;
    QString ownerId;
    // Ordered ids into the owner's task arena.
    QVector<QString> taskIds;

    QString details() const;
};

} // namespace data
} // namespace pawpal

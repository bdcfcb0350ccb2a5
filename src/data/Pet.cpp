#include "pawpal/data/Pet.hpp"

namespace pawpal {
namespace data {

QString Pet::details() const
{
    if (breed.isEmpty()) {
        return QStringLiteral("%1 (%2 years old)").arg(name).arg(age);
    }
    return QStringLiteral("%1 (%2, %3 years old)").arg(name, breed).arg(age);
}

} // namespace data
} // namespace pawpal

#pragma once

#include <stdexcept>

#include <QString>

namespace pawpal {
namespace data {

// Raised for malformed input: empty identities, unknown references,
// duplicate ids, invalid timestamps or non-positive durations.
class ValidationError : public std::invalid_argument
{
public:
    explicit ValidationError(const QString &message)
        : std::invalid_argument(message.toStdString())
    {
    }
};

} // namespace data
} // namespace pawpal

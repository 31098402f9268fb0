#ifndef FERRY_LOCATION_ERRORCODE_HPP_
#define FERRY_LOCATION_ERRORCODE_HPP_

#include <ostream>

namespace ferry::location
{
enum class ErrorCode
{
    OK,
    INVALID_ARGUMENT,
    CORRUPT_CHECKPOINT,
    PRECONDITION_FAILED,
    NOT_READY,
    UNREACHABLE_OR_CHANGED,
    LOCATION_IN_USE
};

const char *to_string(ErrorCode error);

inline std::ostream &operator<<(std::ostream &os, ErrorCode error)
{
    return os << to_string(error);
}
}  // namespace ferry::location

#endif  // FERRY_LOCATION_ERRORCODE_HPP_

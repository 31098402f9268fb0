#include "errorcode.hpp"

namespace ferry::location
{
const char *to_string(ErrorCode error)
{
    switch (error)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::CORRUPT_CHECKPOINT: return "CORRUPT_CHECKPOINT";
        case ErrorCode::PRECONDITION_FAILED: return "PRECONDITION_FAILED";
        case ErrorCode::NOT_READY: return "NOT_READY";
        case ErrorCode::UNREACHABLE_OR_CHANGED: return "UNREACHABLE_OR_CHANGED";
        case ErrorCode::LOCATION_IN_USE: return "LOCATION_IN_USE";
        default: return "INVALID_ERROR_CODE";
    }
}
}  // namespace ferry::location

#include "resourcestate.hpp"

namespace ferry::location
{
const char *to_string(ProbeStatus status)
{
    switch (status)
    {
        case ProbeStatus::OK: return "OK";
        case ProbeStatus::NOT_FOUND: return "NOT_FOUND";
        case ProbeStatus::ACCESS_DENIED: return "ACCESS_DENIED";
        case ProbeStatus::UNREACHABLE: return "UNREACHABLE";
        default: return "INVALID_PROBE_STATUS";
    }
}
}  // namespace ferry::location

#ifndef FERRY_LOCATION_RESOURCESTATE_HPP_
#define FERRY_LOCATION_RESOURCESTATE_HPP_

#include <string>

namespace ferry::location
{
enum class ProbeStatus
{
    OK,
    NOT_FOUND,  // nothing can exist at the address: parent missing or occupied by another type
    ACCESS_DENIED,
    UNREACHABLE
};

const char *to_string(ProbeStatus status);

// Result of one metadata probe. exists/fingerprint are meaningful only when status is OK.
struct ResourceState
{
    ProbeStatus status {ProbeStatus::UNREACHABLE};
    bool        exists {false};
    std::string fingerprint;
};
}  // namespace ferry::location

#endif  // FERRY_LOCATION_RESOURCESTATE_HPP_

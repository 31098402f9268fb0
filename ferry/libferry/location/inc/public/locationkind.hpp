#ifndef FERRY_LOCATION_LOCATIONKIND_HPP_
#define FERRY_LOCATION_LOCATIONKIND_HPP_

#include <ostream>
#include <string>

namespace ferry::location
{
enum class LocationKind
{
    CLOUD_BLOB,
    CLOUD_BLOB_DIRECTORY,
    CLOUD_FILE,
    CLOUD_FILE_DIRECTORY,
    LOCAL_FILE,
    LOCAL_DIRECTORY,
    STREAM,
    URI
};

// Stable names, part of the checkpoint format
const char *to_string(LocationKind kind);
bool        from_string(const std::string &str, LocationKind &kind);

// Only single-resource kinds carry a fingerprint that a condition can be evaluated against
bool supports_access_condition(LocationKind kind);

inline std::ostream &operator<<(std::ostream &os, LocationKind kind)
{
    return os << to_string(kind);
}
}  // namespace ferry::location

#endif  // FERRY_LOCATION_LOCATIONKIND_HPP_

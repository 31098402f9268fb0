#include "locationkind.hpp"

#include <glog/logging.h>

namespace ferry::location
{
namespace
{
constexpr LocationKind all_kinds[] {LocationKind::CLOUD_BLOB, LocationKind::CLOUD_BLOB_DIRECTORY,
    LocationKind::CLOUD_FILE, LocationKind::CLOUD_FILE_DIRECTORY, LocationKind::LOCAL_FILE,
    LocationKind::LOCAL_DIRECTORY, LocationKind::STREAM, LocationKind::URI};
}  // namespace

const char *to_string(LocationKind kind)
{
    switch (kind)
    {
        case LocationKind::CLOUD_BLOB: return "cloud_blob";
        case LocationKind::CLOUD_BLOB_DIRECTORY: return "cloud_blob_directory";
        case LocationKind::CLOUD_FILE: return "cloud_file";
        case LocationKind::CLOUD_FILE_DIRECTORY: return "cloud_file_directory";
        case LocationKind::LOCAL_FILE: return "local_file";
        case LocationKind::LOCAL_DIRECTORY: return "local_directory";
        case LocationKind::STREAM: return "stream";
        case LocationKind::URI: return "uri";
        default: return "invalid_kind";
    }
}

bool from_string(const std::string &str, LocationKind &kind)
{
    for (LocationKind k : all_kinds)
    {
        if (str == to_string(k))
        {
            kind = k;
            return true;
        }
    }
    return false;
}

bool supports_access_condition(LocationKind kind)
{
    switch (kind)
    {
        case LocationKind::CLOUD_BLOB:
        case LocationKind::CLOUD_FILE:
        case LocationKind::LOCAL_FILE:
        case LocationKind::URI: return true;
        case LocationKind::CLOUD_BLOB_DIRECTORY:
        case LocationKind::CLOUD_FILE_DIRECTORY:
        case LocationKind::LOCAL_DIRECTORY:
        case LocationKind::STREAM: return false;
    }

    LOG(FATAL) << "Unhandled location kind " << int(kind);
    return false;
}
}  // namespace ferry::location

#ifndef FERRY_LOCATION_RESOURCEREF_HPP_
#define FERRY_LOCATION_RESOURCEREF_HPP_

#include <string>
#include <variant>

#include "locationkind.hpp"

namespace ferry::location
{
enum class BlobType
{
    BLOCK,
    PAGE,
    APPEND
};

const char *to_string(BlobType blob_type);
bool        from_string(const std::string &str, BlobType &blob_type);

struct CloudBlobRef
{
    static constexpr LocationKind kind = LocationKind::CLOUD_BLOB;

    std::string endpoint;
    std::string container;
    std::string blob_name;
    BlobType    blob_type {BlobType::BLOCK};
    std::string snapshot;

    bool operator==(const CloudBlobRef &rhs) const
    {
        return endpoint == rhs.endpoint && container == rhs.container &&
               blob_name == rhs.blob_name && blob_type == rhs.blob_type &&
               snapshot == rhs.snapshot;
    }
};

struct CloudBlobDirectoryRef
{
    static constexpr LocationKind kind = LocationKind::CLOUD_BLOB_DIRECTORY;

    std::string endpoint;
    std::string container;
    std::string prefix;

    bool operator==(const CloudBlobDirectoryRef &rhs) const
    {
        return endpoint == rhs.endpoint && container == rhs.container && prefix == rhs.prefix;
    }
};

struct CloudFileRef
{
    static constexpr LocationKind kind = LocationKind::CLOUD_FILE;

    std::string endpoint;
    std::string share;
    std::string file_path;

    bool operator==(const CloudFileRef &rhs) const
    {
        return endpoint == rhs.endpoint && share == rhs.share && file_path == rhs.file_path;
    }
};

struct CloudFileDirectoryRef
{
    static constexpr LocationKind kind = LocationKind::CLOUD_FILE_DIRECTORY;

    std::string endpoint;
    std::string share;
    std::string directory_path;

    bool operator==(const CloudFileDirectoryRef &rhs) const
    {
        return endpoint == rhs.endpoint && share == rhs.share &&
               directory_path == rhs.directory_path;
    }
};

struct LocalFileRef
{
    static constexpr LocationKind kind = LocationKind::LOCAL_FILE;

    std::string path;

    bool operator==(const LocalFileRef &rhs) const
    {
        return path == rhs.path;
    }
};

struct LocalDirectoryRef
{
    static constexpr LocationKind kind = LocationKind::LOCAL_DIRECTORY;

    std::string path;

    bool operator==(const LocalDirectoryRef &rhs) const
    {
        return path == rhs.path;
    }
};

// The stream object itself lives with the copy engine; only its id is persisted
struct StreamRef
{
    static constexpr LocationKind kind = LocationKind::STREAM;

    std::string stream_id;

    bool operator==(const StreamRef &rhs) const
    {
        return stream_id == rhs.stream_id;
    }
};

// Absolute URI stripped of its query; a shared access signature travels as a credential
struct UriRef
{
    static constexpr LocationKind kind = LocationKind::URI;

    std::string uri;

    bool operator==(const UriRef &rhs) const
    {
        return uri == rhs.uri;
    }
};

using ResourceRef = std::variant<CloudBlobRef, CloudBlobDirectoryRef, CloudFileRef,
    CloudFileDirectoryRef, LocalFileRef, LocalDirectoryRef, StreamRef, UriRef>;

[[nodiscard]] LocationKind kind_of(const ResourceRef &resource);

/// True when every field the kind requires is present and no endpoint or URI carries a query
/// string.
[[nodiscard]] bool is_complete(const ResourceRef &resource);

/// Stable, human-readable address of the resource. Never contains credentials.
[[nodiscard]] std::string canonical_identifier(const ResourceRef &resource);

/// Splits "https://host/path?sig=..." into the bare URI and the SAS token. Returns false when
/// the URI has no query or the remaining URI is not absolute.
bool parse_sas_uri(const std::string &sas_uri, UriRef &resource, std::string &sas_token);
}  // namespace ferry::location

#endif  // FERRY_LOCATION_RESOURCEREF_HPP_

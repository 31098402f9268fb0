#include "resourceref.hpp"

#include <filesystem>
#include <type_traits>
#include <utility>

namespace ferry::location
{
namespace
{
constexpr char const *scheme_separator = "://";

bool has_query(const std::string &str)
{
    return str.find('?') != std::string::npos;
}

bool is_absolute_uri(const std::string &str)
{
    auto pos = str.find(scheme_separator);
    return pos != std::string::npos && pos != 0 &&
           str.size() > pos + std::char_traits<char>::length(scheme_separator);
}

bool is_valid_endpoint(const std::string &endpoint)
{
    return is_absolute_uri(endpoint) && !has_query(endpoint);
}

std::string trim_slashes(const std::string &str)
{
    auto b = str.find_first_not_of('/');
    if (b == std::string::npos)
    {
        return "";
    }
    auto e = str.find_last_not_of('/');
    return str.substr(b, e - b + 1);
}

// Endpoint and container separators are normalised; whatever follows is kept as given
std::string container_url(const std::string &endpoint, const std::string &container)
{
    std::string out = endpoint;
    while (!out.empty() && out.back() == '/')
    {
        out.pop_back();
    }
    out += '/';
    out += trim_slashes(container);
    return out;
}

// Blob names are opaque keys: "a", "/a" and "a/" are three different blobs
std::string append_verbatim(std::string url, const std::string &name)
{
    if (!name.empty())
    {
        url += '/';
        url += name;
    }
    return url;
}

// File shares are hierarchical, so leading and trailing separators carry no meaning
std::string append_path(std::string url, const std::string &path)
{
    return append_verbatim(std::move(url), trim_slashes(path));
}

bool is_complete_ref(const CloudBlobRef &r)
{
    return is_valid_endpoint(r.endpoint) && !trim_slashes(r.container).empty() &&
           !r.blob_name.empty();
}

bool is_complete_ref(const CloudBlobDirectoryRef &r)
{
    return is_valid_endpoint(r.endpoint) && !trim_slashes(r.container).empty();
}

bool is_complete_ref(const CloudFileRef &r)
{
    return is_valid_endpoint(r.endpoint) && !trim_slashes(r.share).empty() &&
           !trim_slashes(r.file_path).empty();
}

bool is_complete_ref(const CloudFileDirectoryRef &r)
{
    return is_valid_endpoint(r.endpoint) && !trim_slashes(r.share).empty();
}

bool is_complete_ref(const LocalFileRef &r)
{
    return !r.path.empty();
}

bool is_complete_ref(const LocalDirectoryRef &r)
{
    return !r.path.empty();
}

bool is_complete_ref(const StreamRef &r)
{
    return !r.stream_id.empty();
}

bool is_complete_ref(const UriRef &r)
{
    return is_absolute_uri(r.uri) && !has_query(r.uri);
}

std::string identifier_of(const CloudBlobRef &r)
{
    auto id = append_verbatim(container_url(r.endpoint, r.container), r.blob_name);
    if (!r.snapshot.empty())
    {
        id += "?snapshot=" + r.snapshot;
    }
    return id;
}

std::string identifier_of(const CloudBlobDirectoryRef &r)
{
    return append_verbatim(container_url(r.endpoint, r.container), r.prefix);
}

std::string identifier_of(const CloudFileRef &r)
{
    return append_path(container_url(r.endpoint, r.share), r.file_path);
}

std::string identifier_of(const CloudFileDirectoryRef &r)
{
    return append_path(container_url(r.endpoint, r.share), r.directory_path);
}

std::string identifier_of(const LocalFileRef &r)
{
    return std::filesystem::path {r.path}.lexically_normal().generic_string();
}

std::string identifier_of(const LocalDirectoryRef &r)
{
    return std::filesystem::path {r.path}.lexically_normal().generic_string();
}

std::string identifier_of(const StreamRef &r)
{
    return "stream://" + r.stream_id;
}

std::string identifier_of(const UriRef &r)
{
    return r.uri;
}
}  // namespace

const char *to_string(BlobType blob_type)
{
    switch (blob_type)
    {
        case BlobType::BLOCK: return "block";
        case BlobType::PAGE: return "page";
        case BlobType::APPEND: return "append";
        default: return "invalid_blob_type";
    }
}

bool from_string(const std::string &str, BlobType &blob_type)
{
    for (auto t : {BlobType::BLOCK, BlobType::PAGE, BlobType::APPEND})
    {
        if (str == to_string(t))
        {
            blob_type = t;
            return true;
        }
    }
    return false;
}

LocationKind kind_of(const ResourceRef &resource)
{
    return std::visit([](const auto &r) { return std::decay_t<decltype(r)>::kind; }, resource);
}

bool is_complete(const ResourceRef &resource)
{
    return std::visit([](const auto &r) { return is_complete_ref(r); }, resource);
}

std::string canonical_identifier(const ResourceRef &resource)
{
    return std::visit([](const auto &r) { return identifier_of(r); }, resource);
}

bool parse_sas_uri(const std::string &sas_uri, UriRef &resource, std::string &sas_token)
{
    auto pos = sas_uri.find('?');
    if (pos == std::string::npos || pos + 1 == sas_uri.size())
    {
        return false;
    }

    UriRef parsed {sas_uri.substr(0, pos)};
    if (!is_complete_ref(parsed))
    {
        return false;
    }

    resource  = std::move(parsed);
    sas_token = sas_uri.substr(pos + 1);
    return true;
}
}  // namespace ferry::location

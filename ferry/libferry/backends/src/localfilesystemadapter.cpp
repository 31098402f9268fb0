#include "localfilesystemadapter.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include <glog/logging.h>

#include "base64encoder.hpp"
#include "config.hpp"
#include "sha3hasher.hpp"

namespace ferry::backends
{
namespace
{
using location::ProbeStatus;
using location::ResourceState;

bool parent_directory_exists(const std::filesystem::path &path)
{
    auto parent = path.parent_path();
    if (parent.empty())
    {
        return true;
    }
    std::error_code ec;
    return std::filesystem::is_directory(parent, ec);
}

ResourceState missing_resource(const std::filesystem::path &path)
{
    if (parent_directory_exists(path))
    {
        return {ProbeStatus::OK, false, ""};
    }
    return {ProbeStatus::NOT_FOUND, false, ""};
}
}  // namespace

LocalFileSystemAdapter::LocalFileSystemAdapter(std::unique_ptr<crypto::SHA3Hasher> sha3,
    std::unique_ptr<crypto::Base64Encoder> b64, const config::Config &cfg)
    : sha3_ {std::move(sha3)}
    , b64_ {std::move(b64)}
    , content_fingerprint_ {cfg.get_bool(config::ConfigKey::LOCAL_CONTENT_FINGERPRINT)}
{}

LocalFileSystemAdapter::~LocalFileSystemAdapter() = default;

ResourceState LocalFileSystemAdapter::probe(const location::ResourceRef &resource,
    const location::CredentialHandle & /*credentials*/, const location::RequestOptions & /*options*/)
{
    if (auto file = std::get_if<location::LocalFileRef>(&resource))
    {
        return probe_file(file->path);
    }
    if (auto directory = std::get_if<location::LocalDirectoryRef>(&resource))
    {
        return probe_directory(directory->path);
    }

    LOG(ERROR) << "Local file system adapter cannot probe " << location::kind_of(resource)
               << " resources";
    return {ProbeStatus::UNREACHABLE, false, ""};
}

ResourceState LocalFileSystemAdapter::probe_file(const std::string &path) const
{
    std::error_code ec;
    auto            status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found)
    {
        return missing_resource(path);
    }
    if (ec)
    {
        LOG(ERROR) << "Cannot stat " << path << ": " << ec.message();
        return {ProbeStatus::UNREACHABLE, false, ""};
    }
    if (!std::filesystem::is_regular_file(status))
    {
        LOG(WARNING) << path << " exists but is not a regular file";
        return {ProbeStatus::NOT_FOUND, false, ""};
    }

    std::ifstream fs {path, std::ios::in | std::ios::binary};
    if (!fs)
    {
        return {ProbeStatus::ACCESS_DENIED, true, ""};
    }

    if (content_fingerprint_)
    {
        return {ProbeStatus::OK, true, content_fingerprint(fs)};
    }

    auto fingerprint = metadata_fingerprint(path);
    if (fingerprint.empty())
    {
        return {ProbeStatus::UNREACHABLE, true, ""};
    }
    return {ProbeStatus::OK, true, fingerprint};
}

ResourceState LocalFileSystemAdapter::probe_directory(const std::string &path) const
{
    std::error_code ec;
    auto            status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found)
    {
        return missing_resource(path);
    }
    if (ec)
    {
        LOG(ERROR) << "Cannot stat " << path << ": " << ec.message();
        return {ProbeStatus::UNREACHABLE, false, ""};
    }
    if (!std::filesystem::is_directory(status))
    {
        LOG(WARNING) << path << " exists but is not a directory";
        return {ProbeStatus::NOT_FOUND, false, ""};
    }

    std::filesystem::directory_iterator it {path, ec};
    if (ec)
    {
        return {ProbeStatus::ACCESS_DENIED, true, ""};
    }
    return {ProbeStatus::OK, true, ""};
}

std::string LocalFileSystemAdapter::metadata_fingerprint(const std::string &path) const
{
    std::error_code ec;

    auto size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot read size of " << path << ": " << ec.message();
        return "";
    }

    auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot read modification time of " << path << ": " << ec.message();
        return "";
    }

    std::ostringstream ss;
    ss << size << ':' << mtime.time_since_epoch().count();
    const std::string stamp = ss.str();

    auto digest = sha3_->hash_256(reinterpret_cast<const uint8_t *>(stamp.data()), stamp.size());
    return b64_->encode(digest.data(), digest.size());
}

std::string LocalFileSystemAdapter::content_fingerprint(std::istream &is) const
{
    auto digest = sha3_->hash_256(is);
    return b64_->encode(digest.data(), digest.size());
}
}  // namespace ferry::backends

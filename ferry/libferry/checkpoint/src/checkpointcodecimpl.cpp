#include "checkpointcodecimpl.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>
#include <string>
#include <utility>

#include <glog/logging.h>

#include "accesscondition.hpp"
#include "checkpointschema.hpp"
#include "config.hpp"
#include "resourceref.hpp"
#include "transferjobrecord.hpp"
#include "transferlocation.hpp"

namespace ferry::checkpoint
{
namespace
{
using location::ErrorCode;
using location::LocationKind;
using nlohmann::json;

CheckpointCodecImpl::Encoding encoding_from_config(const config::Config &cfg)
{
    auto name = cfg.get_string(config::ConfigKey::CHECKPOINT_ENCODING);
    if (name == to_string(CheckpointCodecImpl::Encoding::JSON))
    {
        return CheckpointCodecImpl::Encoding::JSON;
    }
    if (name != to_string(CheckpointCodecImpl::Encoding::CBOR))
    {
        LOG(WARNING) << "Unknown checkpoint encoding \"" << name << "\", using "
                     << to_string(CheckpointCodecImpl::Encoding::CBOR);
    }
    return CheckpointCodecImpl::Encoding::CBOR;
}

bool read_string(const json &obj, const char *name, std::string &out)
{
    auto it = obj.find(name);
    if (it == obj.end() || !it->is_string())
    {
        LOG(WARNING) << "Checkpoint field \"" << name << "\" is missing or not a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool read_optional_string(const json &obj, const char *name, std::string &out)
{
    if (obj.find(name) == obj.end())
    {
        return true;
    }
    return read_string(obj, name, out);
}

bool read_bool(const json &obj, const char *name, bool &out)
{
    auto it = obj.find(name);
    if (it == obj.end() || !it->is_boolean())
    {
        LOG(WARNING) << "Checkpoint field \"" << name << "\" is missing or not a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool to_unsigned(const json &value, uint64_t &out)
{
    if (value.is_number_unsigned())
    {
        out = value.get<uint64_t>();
        return true;
    }
    if (value.is_number_integer() && value.get<int64_t>() >= 0)
    {
        out = static_cast<uint64_t>(value.get<int64_t>());
        return true;
    }
    return false;
}

bool read_unsigned(const json &obj, const char *name, uint64_t &out)
{
    auto it = obj.find(name);
    if (it == obj.end() || !to_unsigned(*it, out))
    {
        LOG(WARNING) << "Checkpoint field \"" << name
                     << "\" is missing or not a non-negative integer";
        return false;
    }
    return true;
}

bool read_optional_unsigned(const json &obj, const char *name, uint64_t &out)
{
    if (obj.find(name) == obj.end())
    {
        return true;
    }
    return read_unsigned(obj, name, out);
}

bool read_object(const json &obj, const char *name, const json *&out)
{
    auto it = obj.find(name);
    if (it == obj.end() || !it->is_object())
    {
        LOG(WARNING) << "Checkpoint field \"" << name << "\" is missing or not an object";
        return false;
    }
    out = &*it;
    return true;
}

bool read_version(const json &root)
{
    uint64_t version = 0;
    if (!read_unsigned(root, schema::version, version) || version == 0)
    {
        LOG(WARNING) << "Checkpoint record has no valid version";
        return false;
    }
    if (version > schema::current_version)
    {
        LOG(INFO) << "Checkpoint record version " << version << " is newer than "
                  << schema::current_version << ", unknown fields are ignored";
    }
    return true;
}

struct ResourceEncoder
{
    json operator()(const location::CloudBlobRef &r) const
    {
        json j               = json::object();
        j[schema::endpoint]  = r.endpoint;
        j[schema::container] = r.container;
        j[schema::blob_name] = r.blob_name;
        j[schema::blob_type] = location::to_string(r.blob_type);
        j[schema::snapshot]  = r.snapshot;
        return j;
    }

    json operator()(const location::CloudBlobDirectoryRef &r) const
    {
        json j               = json::object();
        j[schema::endpoint]  = r.endpoint;
        j[schema::container] = r.container;
        j[schema::prefix]    = r.prefix;
        return j;
    }

    json operator()(const location::CloudFileRef &r) const
    {
        json j               = json::object();
        j[schema::endpoint]  = r.endpoint;
        j[schema::share]     = r.share;
        j[schema::file_path] = r.file_path;
        return j;
    }

    json operator()(const location::CloudFileDirectoryRef &r) const
    {
        json j                    = json::object();
        j[schema::endpoint]       = r.endpoint;
        j[schema::share]          = r.share;
        j[schema::directory_path] = r.directory_path;
        return j;
    }

    json operator()(const location::LocalFileRef &r) const
    {
        json j          = json::object();
        j[schema::path] = r.path;
        return j;
    }

    json operator()(const location::LocalDirectoryRef &r) const
    {
        json j          = json::object();
        j[schema::path] = r.path;
        return j;
    }

    json operator()(const location::StreamRef &r) const
    {
        json j               = json::object();
        j[schema::stream_id] = r.stream_id;
        return j;
    }

    json operator()(const location::UriRef &r) const
    {
        json j         = json::object();
        j[schema::uri] = r.uri;
        return j;
    }
};

bool decode_resource(LocationKind kind, const json &j, location::ResourceRef &resource)
{
    switch (kind)
    {
        case LocationKind::CLOUD_BLOB:
        {
            location::CloudBlobRef r;
            std::string            blob_type {location::to_string(r.blob_type)};
            if (!read_string(j, schema::endpoint, r.endpoint) ||
                !read_string(j, schema::container, r.container) ||
                !read_string(j, schema::blob_name, r.blob_name) ||
                !read_optional_string(j, schema::blob_type, blob_type) ||
                !read_optional_string(j, schema::snapshot, r.snapshot))
            {
                return false;
            }
            if (!location::from_string(blob_type, r.blob_type))
            {
                LOG(WARNING) << "Unknown blob type \"" << blob_type << "\"";
                return false;
            }
            resource = std::move(r);
            return true;
        }
        case LocationKind::CLOUD_BLOB_DIRECTORY:
        {
            location::CloudBlobDirectoryRef r;
            if (!read_string(j, schema::endpoint, r.endpoint) ||
                !read_string(j, schema::container, r.container) ||
                !read_optional_string(j, schema::prefix, r.prefix))
            {
                return false;
            }
            resource = std::move(r);
            return true;
        }
        case LocationKind::CLOUD_FILE:
        {
            location::CloudFileRef r;
            if (!read_string(j, schema::endpoint, r.endpoint) ||
                !read_string(j, schema::share, r.share) ||
                !read_string(j, schema::file_path, r.file_path))
            {
                return false;
            }
            resource = std::move(r);
            return true;
        }
        case LocationKind::CLOUD_FILE_DIRECTORY:
        {
            location::CloudFileDirectoryRef r;
            if (!read_string(j, schema::endpoint, r.endpoint) ||
                !read_string(j, schema::share, r.share) ||
                !read_optional_string(j, schema::directory_path, r.directory_path))
            {
                return false;
            }
            resource = std::move(r);
            return true;
        }
        case LocationKind::LOCAL_FILE:
        {
            location::LocalFileRef r;
            if (!read_string(j, schema::path, r.path))
            {
                return false;
            }
            resource = std::move(r);
            return true;
        }
        case LocationKind::LOCAL_DIRECTORY:
        {
            location::LocalDirectoryRef r;
            if (!read_string(j, schema::path, r.path))
            {
                return false;
            }
            resource = std::move(r);
            return true;
        }
        case LocationKind::STREAM:
        {
            location::StreamRef r;
            if (!read_string(j, schema::stream_id, r.stream_id))
            {
                return false;
            }
            resource = std::move(r);
            return true;
        }
        case LocationKind::URI:
        {
            location::UriRef r;
            if (!read_string(j, schema::uri, r.uri))
            {
                return false;
            }
            resource = std::move(r);
            return true;
        }
        default:
        {
            LOG(FATAL) << "Unhandled location kind " << kind;
            return false;
        }
    }
}

location::AccessCondition make_condition(location::AccessCondition::Type type, std::string fp)
{
    using Type = location::AccessCondition::Type;

    switch (type)
    {
        case Type::NONE: return location::AccessCondition::none();
        case Type::IF_MATCH: return location::AccessCondition::if_match(std::move(fp));
        case Type::IF_NONE_MATCH: return location::AccessCondition::if_none_match(std::move(fp));
        case Type::IF_NOT_EXISTS: return location::AccessCondition::if_not_exists();
        case Type::IF_EXISTS: return location::AccessCondition::if_exists();
        default:
        {
            LOG(FATAL) << "Unhandled access condition type " << static_cast<int>(type);
            return location::AccessCondition::none();
        }
    }
}

bool decode_access_condition(const json &j, location::AccessCondition &condition)
{
    std::string type_name;
    std::string fp;
    if (!read_string(j, schema::condition_type, type_name) ||
        !read_optional_string(j, schema::fingerprint, fp))
    {
        return false;
    }

    location::AccessCondition::Type type;
    if (!location::from_string(type_name, type))
    {
        LOG(WARNING) << "Unknown access condition type \"" << type_name << "\"";
        return false;
    }

    condition = make_condition(type, std::move(fp));
    return true;
}

bool decode_request_options(const json &root, location::RequestOptions &options)
{
    auto it = root.find(schema::request_options);
    if (it == root.end())
    {
        return true;
    }
    if (!it->is_object())
    {
        LOG(WARNING) << "Checkpoint field \"" << schema::request_options << "\" is not an object";
        return false;
    }

    uint64_t server_timeout         = options.server_timeout.count();
    uint64_t maximum_execution_time = options.maximum_execution_time.count();
    uint64_t retry_count            = options.retry_count;
    uint64_t retry_interval         = options.retry_interval.count();

    if (!read_optional_unsigned(*it, schema::server_timeout, server_timeout) ||
        !read_optional_unsigned(*it, schema::maximum_execution_time, maximum_execution_time) ||
        !read_optional_unsigned(*it, schema::retry_count, retry_count) ||
        !read_optional_unsigned(*it, schema::retry_interval, retry_interval))
    {
        return false;
    }

    if (retry_count > std::numeric_limits<uint32_t>::max())
    {
        LOG(WARNING) << "Checkpoint retry count " << retry_count << " is out of range";
        return false;
    }

    options.server_timeout         = std::chrono::seconds(server_timeout);
    options.maximum_execution_time = std::chrono::seconds(maximum_execution_time);
    options.retry_count            = static_cast<uint32_t>(retry_count);
    options.retry_interval         = std::chrono::milliseconds(retry_interval);
    return true;
}

bool decode_progress(const json &root, TransferProgress &progress)
{
    auto it = root.find(schema::progress);
    if (it == root.end())
    {
        return true;
    }
    if (!it->is_object())
    {
        LOG(WARNING) << "Checkpoint field \"" << schema::progress << "\" is not an object";
        return false;
    }

    if (!read_optional_unsigned(*it, schema::bytes_transferred, progress.bytes_transferred) ||
        !read_optional_unsigned(*it, schema::total_bytes, progress.total_bytes))
    {
        return false;
    }

    auto chunks_it = it->find(schema::completed_chunks);
    if (chunks_it == it->end())
    {
        return true;
    }
    if (!chunks_it->is_array())
    {
        LOG(WARNING) << "Checkpoint field \"" << schema::completed_chunks << "\" is not an array";
        return false;
    }
    for (const auto &chunk : *chunks_it)
    {
        uint64_t offset = 0;
        if (!to_unsigned(chunk, offset))
        {
            LOG(WARNING) << "Checkpoint chunk offset is not a non-negative integer";
            return false;
        }
        progress.completed_chunks.push_back(offset);
    }
    return true;
}
}  // namespace

CheckpointCodecImpl::CheckpointCodecImpl(const config::Config &cfg)
    : request_options_provider_ {cfg}
    , encoding_ {encoding_from_config(cfg)}
{}

CheckpointCodecImpl::Encoding CheckpointCodecImpl::encoding() const
{
    return encoding_;
}

ErrorCode CheckpointCodecImpl::encode(const location::TransferLocation &location, Bytes &bytes) const
{
    return serialize(location_to_json(location), bytes);
}

ErrorCode CheckpointCodecImpl::encode(const TransferJobRecord &job, Bytes &bytes) const
{
    if (!job.source || !job.destination)
    {
        LOG(WARNING) << "Job " << job.job_id << " cannot be checkpointed without both locations";
        return ErrorCode::INVALID_ARGUMENT;
    }

    json root               = json::object();
    root[schema::version]   = schema::current_version;
    root[schema::job_id]    = job.job_id;
    root[schema::overwrite] = job.overwrite;
    root[schema::status]    = to_string(job.status);

    auto &progress                      = root[schema::progress];
    progress[schema::bytes_transferred] = job.progress.bytes_transferred;
    progress[schema::total_bytes]       = job.progress.total_bytes;
    progress[schema::completed_chunks]  = job.progress.completed_chunks;

    root[schema::source]      = location_to_json(*job.source);
    root[schema::destination] = location_to_json(*job.destination);

    return serialize(root, bytes);
}

ErrorCode CheckpointCodecImpl::decode(
    const Bytes &bytes, std::shared_ptr<location::TransferLocation> &location) const
{
    auto root = parse(bytes);
    if (root.is_discarded())
    {
        return ErrorCode::CORRUPT_CHECKPOINT;
    }
    return location_from_json(root, location);
}

ErrorCode CheckpointCodecImpl::decode(const Bytes &bytes, TransferJobRecord &job) const
{
    auto root = parse(bytes);
    if (root.is_discarded())
    {
        return ErrorCode::CORRUPT_CHECKPOINT;
    }
    if (!root.is_object() || !read_version(root))
    {
        return ErrorCode::CORRUPT_CHECKPOINT;
    }

    TransferJobRecord decoded;
    std::string       status;
    if (!read_string(root, schema::job_id, decoded.job_id) ||
        !read_string(root, schema::status, status))
    {
        return ErrorCode::CORRUPT_CHECKPOINT;
    }
    if (decoded.job_id.empty())
    {
        LOG(WARNING) << "Checkpoint job record has an empty job id";
        return ErrorCode::CORRUPT_CHECKPOINT;
    }
    if (!from_string(status, decoded.status))
    {
        LOG(WARNING) << "Unknown job status \"" << status << "\"";
        return ErrorCode::CORRUPT_CHECKPOINT;
    }
    if (root.find(schema::overwrite) != root.end() &&
        !read_bool(root, schema::overwrite, decoded.overwrite))
    {
        return ErrorCode::CORRUPT_CHECKPOINT;
    }
    if (!decode_progress(root, decoded.progress))
    {
        return ErrorCode::CORRUPT_CHECKPOINT;
    }

    const json *source      = nullptr;
    const json *destination = nullptr;
    if (!read_object(root, schema::source, source) ||
        !read_object(root, schema::destination, destination))
    {
        return ErrorCode::CORRUPT_CHECKPOINT;
    }
    if (auto err = location_from_json(*source, decoded.source); err != ErrorCode::OK)
    {
        return err;
    }
    if (auto err = location_from_json(*destination, decoded.destination); err != ErrorCode::OK)
    {
        return err;
    }

    job = std::move(decoded);
    return ErrorCode::OK;
}

ErrorCode CheckpointCodecImpl::serialize(const json &root, Bytes &bytes) const
{
    if (encoding_ == Encoding::CBOR)
    {
        bytes = json::to_cbor(root);
        return ErrorCode::OK;
    }

    std::string text;
    try
    {
        text = root.dump(4);
    }
    catch (const json::type_error &e)
    {
        // JSON text requires UTF-8, local paths may hold arbitrary bytes
        LOG(ERROR) << "Cannot write JSON checkpoint record: " << e.what();
        return ErrorCode::INVALID_ARGUMENT;
    }

    bytes.assign(text.begin(), text.end());
    return ErrorCode::OK;
}

json CheckpointCodecImpl::parse(const Bytes &bytes) const
{
    auto first = std::find_if(
        bytes.begin(), bytes.end(), [](uint8_t b) { return !std::isspace(b); });
    if (first == bytes.end())
    {
        LOG(WARNING) << "Checkpoint record is empty";
        return json(json::value_t::discarded);
    }

    // A CBOR map never starts with '{', so the first significant byte tells the encodings apart
    auto root = *first == '{' ? json::parse(bytes.begin(), bytes.end(), nullptr, false) :
                                json::from_cbor(bytes, true, false);
    if (root.is_discarded())
    {
        LOG(WARNING) << "Checkpoint record is neither valid JSON nor valid CBOR";
    }
    return root;
}

json CheckpointCodecImpl::location_to_json(const location::TransferLocation &location) const
{
    auto snapshot = location.snapshot();

    json root              = json::object();
    root[schema::version]  = schema::current_version;
    root[schema::kind]     = location::to_string(location.type());
    root[schema::resource] = std::visit(ResourceEncoder {}, snapshot.resource);

    auto &condition                   = root[schema::access_condition];
    condition[schema::condition_type] = location::to_string(snapshot.access_condition.type());
    condition[schema::fingerprint]    = snapshot.access_condition.fingerprint();

    root[schema::condition_checked] = snapshot.condition_checked;
    root[schema::fingerprint]       = snapshot.fingerprint;

    const auto &options                    = snapshot.request_options;
    auto &      json_options               = root[schema::request_options];
    json_options[schema::server_timeout]   = static_cast<uint64_t>(options.server_timeout.count());
    json_options[schema::maximum_execution_time] =
        static_cast<uint64_t>(options.maximum_execution_time.count());
    json_options[schema::retry_count]    = options.retry_count;
    json_options[schema::retry_interval] = static_cast<uint64_t>(options.retry_interval.count());

    return root;
}

ErrorCode CheckpointCodecImpl::location_from_json(
    const json &root, std::shared_ptr<location::TransferLocation> &location) const
{
    if (!root.is_object())
    {
        LOG(WARNING) << "Checkpoint location record is not an object";
        return ErrorCode::CORRUPT_CHECKPOINT;
    }
    if (!read_version(root))
    {
        return ErrorCode::CORRUPT_CHECKPOINT;
    }

    std::string kind_name;
    if (!read_string(root, schema::kind, kind_name))
    {
        return ErrorCode::CORRUPT_CHECKPOINT;
    }
    LocationKind kind;
    if (!location::from_string(kind_name, kind))
    {
        LOG(WARNING) << "Unknown location kind \"" << kind_name << "\"";
        return ErrorCode::CORRUPT_CHECKPOINT;
    }

    location::TransferLocation::Snapshot snapshot;
    snapshot.request_options = request_options_provider_.defaults_for(kind);

    const json *resource  = nullptr;
    const json *condition = nullptr;
    if (!read_object(root, schema::resource, resource) ||
        !decode_resource(kind, *resource, snapshot.resource) ||
        !read_object(root, schema::access_condition, condition) ||
        !decode_access_condition(*condition, snapshot.access_condition) ||
        !read_bool(root, schema::condition_checked, snapshot.condition_checked) ||
        !read_string(root, schema::fingerprint, snapshot.fingerprint) ||
        !decode_request_options(root, snapshot.request_options))
    {
        return ErrorCode::CORRUPT_CHECKPOINT;
    }

    return location::TransferLocation::restore(std::move(snapshot), location);
}

const char *to_string(CheckpointCodecImpl::Encoding encoding)
{
    switch (encoding)
    {
        case CheckpointCodecImpl::Encoding::CBOR: return "cbor";
        case CheckpointCodecImpl::Encoding::JSON: return "json";
        default: return "INVALID_ENCODING";
    }
}
}  // namespace ferry::checkpoint

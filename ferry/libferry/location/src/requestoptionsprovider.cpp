#include "requestoptionsprovider.hpp"

#include <glog/logging.h>

#include "config.hpp"

namespace ferry::location
{
namespace
{
RequestOptions read_options(const config::Config &cfg, config::ConfigKey server_timeout_key,
    config::ConfigKey maximum_execution_time_key, config::ConfigKey retry_count_key,
    config::ConfigKey retry_interval_key)
{
    RequestOptions options;
    options.server_timeout         = cfg.get_seconds(server_timeout_key);
    options.maximum_execution_time = cfg.get_seconds(maximum_execution_time_key);
    options.retry_count            = uint32_t(cfg.get_integer(retry_count_key));
    options.retry_interval         = cfg.get_milliseconds(retry_interval_key);
    return options;
}
}  // namespace

RequestOptionsProvider::RequestOptionsProvider(const config::Config &cfg)
    : blob_options_ {read_options(cfg, config::ConfigKey::BLOB_SERVER_TIMEOUT,
          config::ConfigKey::BLOB_MAXIMUM_EXECUTION_TIME, config::ConfigKey::BLOB_RETRY_COUNT,
          config::ConfigKey::BLOB_RETRY_INTERVAL)}
    , file_options_ {read_options(cfg, config::ConfigKey::FILE_SERVER_TIMEOUT,
          config::ConfigKey::FILE_MAXIMUM_EXECUTION_TIME, config::ConfigKey::FILE_RETRY_COUNT,
          config::ConfigKey::FILE_RETRY_INTERVAL)}
    , local_options_ {}
{}

RequestOptions RequestOptionsProvider::defaults_for(LocationKind kind) const
{
    switch (kind)
    {
        case LocationKind::CLOUD_BLOB:
        case LocationKind::CLOUD_BLOB_DIRECTORY:
        case LocationKind::URI: return blob_options_;
        case LocationKind::CLOUD_FILE:
        case LocationKind::CLOUD_FILE_DIRECTORY: return file_options_;
        case LocationKind::LOCAL_FILE:
        case LocationKind::LOCAL_DIRECTORY:
        case LocationKind::STREAM: return local_options_;
    }

    LOG(FATAL) << "Unhandled location kind " << int(kind);
    return local_options_;
}
}  // namespace ferry::location

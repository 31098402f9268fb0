#include "defaultconfigvalues.hpp"

#include <string>

#include <glog/logging.h>

namespace ferry::config
{
DefaultConfigValues::DefaultConfigValues()
    : default_values_ {/* BLOB_SERVER_TIMEOUT */ 300LL /* = 5 minutes */,
          /* BLOB_MAXIMUM_EXECUTION_TIME */ 900LL /* = 15 minutes */,
          /* BLOB_RETRY_COUNT */ 3LL, /* BLOB_RETRY_INTERVAL */ 3000LL /* ms */,
          /* FILE_SERVER_TIMEOUT */ 300LL /* = 5 minutes */,
          /* FILE_MAXIMUM_EXECUTION_TIME */ 900LL /* = 15 minutes */,
          /* FILE_RETRY_COUNT */ 3LL, /* FILE_RETRY_INTERVAL */ 3000LL /* ms */,
          /* CHECKPOINT_ENCODING */ std::string {"cbor"},
          /* LOCAL_CONTENT_FINGERPRINT */ false}
{}

std::any DefaultConfigValues::get(const ConfigKey &key) const
{
    if (key < ConfigKey::FIRST_KEY || key >= ConfigKey::KEY_COUNT)
    {
        LOG(ERROR) << "Invalid key " << key;
        return {};
    }
    return default_values_[key];
}
}  // namespace ferry::config

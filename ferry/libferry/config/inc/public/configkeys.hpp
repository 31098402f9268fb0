#ifndef FERRY_CONFIG_CONFIGKEYS_HPP_
#define FERRY_CONFIG_CONFIGKEYS_HPP_

#include <string>

namespace ferry::config
{
class ConfigKey
{
public:
    enum EnumType
    {
        FIRST_KEY = 0,

        BLOB_SERVER_TIMEOUT = FIRST_KEY,
        BLOB_MAXIMUM_EXECUTION_TIME,
        BLOB_RETRY_COUNT,
        BLOB_RETRY_INTERVAL,
        FILE_SERVER_TIMEOUT,
        FILE_MAXIMUM_EXECUTION_TIME,
        FILE_RETRY_COUNT,
        FILE_RETRY_INTERVAL,
        CHECKPOINT_ENCODING,
        LOCAL_CONTENT_FINGERPRINT,

        KEY_COUNT
    };

    ConfigKey(EnumType k)
        : key_ {k}
    {}

    [[nodiscard]] std::string to_string() const
    {
        if (key_ >= 0 && key_ < KEY_COUNT)
        {
            return string_vals[key_];
        }
        return "";
    }

    [[nodiscard]] EnumType to_enum_type() const
    {
        return key_;
    }

    operator EnumType() const
    {
        return to_enum_type();
    }

    explicit operator std::string() const
    {
        return to_string();
    }

private:
    EnumType key_;

    static constexpr char const *string_vals[] {"blob_server_timeout",
        "blob_maximum_execution_time", "blob_retry_count", "blob_retry_interval",
        "file_server_timeout", "file_maximum_execution_time", "file_retry_count",
        "file_retry_interval", "checkpoint_encoding", "local_content_fingerprint"};
};
}  // namespace ferry::config

#endif  // FERRY_CONFIG_CONFIGKEYS_HPP_

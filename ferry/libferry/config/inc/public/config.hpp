#ifndef FERRY_CONFIG_CONFIG_HPP_
#define FERRY_CONFIG_CONFIG_HPP_

#include <any>
#include <array>
#include <chrono>
#include <memory>
#include <typeinfo>

#include <glog/logging.h>

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace ferry::config
{
class ConfigLoader;

/// Typed view over the values produced by a ConfigLoader.
///
/// Keys missing from the loaded configuration, or loaded with the wrong type, are served by the
/// fallback provider. A key the fallback provider cannot serve either is a fatal error.
class Config
{
public:
    explicit Config(const ConfigLoader &             config_loader,
        std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider = nullptr);

    [[nodiscard]] std::string get_string(ConfigKey key) const
    {
        return lookup<std::string>(key);
    }

    [[nodiscard]] long long get_integer(ConfigKey key) const
    {
        return lookup<long long>(key);
    }

    [[nodiscard]] bool get_bool(ConfigKey key) const
    {
        return lookup<bool>(key);
    }

    [[nodiscard]] std::chrono::seconds get_seconds(ConfigKey key) const
    {
        return std::chrono::seconds {get_integer(key)};
    }

    [[nodiscard]] std::chrono::milliseconds get_milliseconds(ConfigKey key) const
    {
        return std::chrono::milliseconds {get_integer(key)};
    }

private:
    template<typename T>
    [[nodiscard]] T lookup(ConfigKey key) const
    {
        if (key < 0 || key >= ConfigKey::KEY_COUNT)
        {
            LOG(FATAL) << "Config key out of range: " << int(key);
        }

        const std::any &loaded = loaded_values_[key];
        if (!loaded.has_value())
        {
            LOG(INFO) << key.to_string() << " not configured, using default";
            return from_fallback<T>(key);
        }

        if (const T *value = std::any_cast<T>(&loaded))
        {
            return *value;
        }

        LOG(ERROR) << key.to_string() << " is configured as " << loaded.type().name()
                   << " but read as " << typeid(T).name() << ", using default";
        return from_fallback<T>(key);
    }

    template<typename T>
    [[nodiscard]] T from_fallback(ConfigKey key) const
    {
        if (!fallback_value_provider_)
        {
            LOG(FATAL) << "No default available for " << key.to_string();
        }

        std::any fallback = fallback_value_provider_->get(key);
        if (!fallback.has_value())
        {
            LOG(FATAL) << "Default value of " << key.to_string() << " is missing";
        }

        const T *value = std::any_cast<T>(&fallback);
        if (!value)
        {
            LOG(FATAL) << "Default value of " << key.to_string() << " has type "
                       << fallback.type().name() << ", expected " << typeid(T).name();
        }

        return *value;
    }

    std::array<std::any, ConfigKey::KEY_COUNT> loaded_values_;

    // shared so Config stays copyable
    const std::shared_ptr<FallbackConfigValueProvider> fallback_value_provider_;
};
}  // namespace ferry::config

#endif  // FERRY_CONFIG_CONFIG_HPP_

#include "config.hpp"

#include "configloader.hpp"

namespace ferry::config
{
namespace
{
bool find_key(const std::string &name, ConfigKey &key)
{
    for (int k = ConfigKey::FIRST_KEY; k != ConfigKey::KEY_COUNT; ++k)
    {
        ConfigKey candidate {ConfigKey::EnumType(k)};
        if (candidate.to_string() == name)
        {
            key = candidate;
            return true;
        }
    }
    return false;
}
}  // namespace

Config::Config(const ConfigLoader &              config_loader,
    std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider)
    : fallback_value_provider_ {std::move(fallback_value_provider)}
{
    for (auto &[name, value] : config_loader.load())
    {
        ConfigKey key {ConfigKey::FIRST_KEY};
        if (!find_key(name, key))
        {
            LOG(WARNING) << "Ignoring unknown configuration key " << name;
            continue;
        }

        // Every integer setting is a duration or a count
        if (const long long *number = std::any_cast<long long>(&value); number && *number < 0)
        {
            LOG(WARNING) << "Ignoring negative value " << *number << " of " << name;
            continue;
        }

        loaded_values_[key] = std::move(value);
    }
}
}  // namespace ferry::config

#ifndef FERRY_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
#define FERRY_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_

#include <any>

namespace ferry::config
{
// Forward declarations
class ConfigKey;

class FallbackConfigValueProvider
{
public:
    virtual ~FallbackConfigValueProvider() = default;

    [[nodiscard]] virtual std::any get(const ConfigKey &key) const = 0;
};
}  // namespace ferry::config

#endif  // FERRY_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_

#ifndef FERRY_CONFIG_DEFAULTCONFIGVALUES_HPP_
#define FERRY_CONFIG_DEFAULTCONFIGVALUES_HPP_

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace ferry::config
{
class DefaultConfigValues : public FallbackConfigValueProvider
{
public:
    DefaultConfigValues();
    [[nodiscard]] std::any get(const ConfigKey &key) const override;

private:
    const std::any default_values_[ConfigKey::KEY_COUNT];
};
}  // namespace ferry::config

#endif  // FERRY_CONFIG_DEFAULTCONFIGVALUES_HPP_

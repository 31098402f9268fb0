#ifndef FERRY_CONFIG_CONFIGLOADER_HPP_
#define FERRY_CONFIG_CONFIGLOADER_HPP_

#include <any>
#include <map>
#include <string>

namespace ferry::config
{
class ConfigLoader
{
public:
    virtual ~ConfigLoader() = default;

    [[nodiscard]] virtual std::map<std::string, std::any> load() const = 0;
};
}  // namespace ferry::config

#endif  // FERRY_CONFIG_CONFIGLOADER_HPP_

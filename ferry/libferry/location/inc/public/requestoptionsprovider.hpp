#ifndef FERRY_LOCATION_REQUESTOPTIONSPROVIDER_HPP_
#define FERRY_LOCATION_REQUESTOPTIONSPROVIDER_HPP_

#include "locationkind.hpp"
#include "requestoptions.hpp"

namespace ferry::config
{
// Forward declarations
class Config;
}  // namespace ferry::config

namespace ferry::location
{
class RequestOptionsProvider
{
public:
    explicit RequestOptionsProvider(const config::Config &cfg);

    [[nodiscard]] RequestOptions defaults_for(LocationKind kind) const;

private:
    const RequestOptions blob_options_;
    const RequestOptions file_options_;
    const RequestOptions local_options_;
};
}  // namespace ferry::location

#endif  // FERRY_LOCATION_REQUESTOPTIONSPROVIDER_HPP_

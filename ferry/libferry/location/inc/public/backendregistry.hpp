#ifndef FERRY_LOCATION_BACKENDREGISTRY_HPP_
#define FERRY_LOCATION_BACKENDREGISTRY_HPP_

#include <map>
#include <memory>
#include <mutex>

#include "locationkind.hpp"

namespace ferry::location
{
// Forward declarations
class BackendAdapter;

class BackendRegistry
{
public:
    bool register_adapter(LocationKind kind, std::shared_ptr<BackendAdapter> adapter);
    bool unregister_adapter(LocationKind kind);

    [[nodiscard]] std::shared_ptr<BackendAdapter> adapter(LocationKind kind) const;

private:
    std::map<LocationKind, std::shared_ptr<BackendAdapter>> adapters_;
    mutable std::mutex                                       mutex_;
};
}  // namespace ferry::location

#endif  // FERRY_LOCATION_BACKENDREGISTRY_HPP_

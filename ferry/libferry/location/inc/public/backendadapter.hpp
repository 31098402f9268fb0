#ifndef FERRY_LOCATION_BACKENDADAPTER_HPP_
#define FERRY_LOCATION_BACKENDADAPTER_HPP_

#include "requestoptions.hpp"
#include "resourceref.hpp"
#include "resourcestate.hpp"

namespace ferry::location
{
// Forward declarations
class CredentialHandle;

/// Contract a storage backend satisfies for the endpoint layer: a single metadata probe
/// reporting reachability, existence and the current fingerprint of a resource. Called without
/// any location lock held; implementations must be safe to call concurrently.
class BackendAdapter
{
public:
    virtual ~BackendAdapter() = default;

    [[nodiscard]] virtual ResourceState probe(const ResourceRef &resource,
        const CredentialHandle &credentials, const RequestOptions &options) = 0;
};
}  // namespace ferry::location

#endif  // FERRY_LOCATION_BACKENDADAPTER_HPP_

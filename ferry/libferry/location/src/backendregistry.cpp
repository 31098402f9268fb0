#include "backendregistry.hpp"

#include <utility>

#include <glog/logging.h>

#include "backendadapter.hpp"

namespace ferry::location
{
bool BackendRegistry::register_adapter(LocationKind kind, std::shared_ptr<BackendAdapter> adapter)
{
    if (!adapter)
    {
        LOG(WARNING) << "Refusing to register a null adapter for " << kind;
        return false;
    }

    std::lock_guard lock {mutex_};
    return adapters_.try_emplace(kind, std::move(adapter)).second;
}

bool BackendRegistry::unregister_adapter(LocationKind kind)
{
    std::lock_guard lock {mutex_};
    return adapters_.erase(kind) != 0;
}

std::shared_ptr<BackendAdapter> BackendRegistry::adapter(LocationKind kind) const
{
    std::lock_guard lock {mutex_};

    auto it = adapters_.find(kind);
    if (it == adapters_.end())
    {
        return nullptr;
    }
    return it->second;
}
}  // namespace ferry::location

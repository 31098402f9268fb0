#include "activelocationregistry.hpp"

namespace ferry::resume
{
bool ActiveLocationRegistry::acquire(
    const std::string &canonical_identifier, const std::string &job_id)
{
    std::lock_guard lock {mutex_};

    return owners_.try_emplace(canonical_identifier, job_id).second;
}

bool ActiveLocationRegistry::release(
    const std::string &canonical_identifier, const std::string &job_id)
{
    std::lock_guard lock {mutex_};

    auto it = owners_.find(canonical_identifier);
    if (it == owners_.end() || it->second != job_id)
    {
        return false;
    }
    owners_.erase(it);
    return true;
}

bool ActiveLocationRegistry::contains(const std::string &canonical_identifier) const
{
    std::lock_guard lock {mutex_};
    return owners_.count(canonical_identifier) != 0;
}

std::string ActiveLocationRegistry::owner(const std::string &canonical_identifier) const
{
    std::lock_guard lock {mutex_};

    auto it = owners_.find(canonical_identifier);
    if (it == owners_.end())
    {
        return "";
    }
    return it->second;
}

size_t ActiveLocationRegistry::size() const
{
    std::lock_guard lock {mutex_};
    return owners_.size();
}
}  // namespace ferry::resume

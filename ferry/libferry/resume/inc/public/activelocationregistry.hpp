#ifndef FERRY_RESUME_ACTIVELOCATIONREGISTRY_HPP_
#define FERRY_RESUME_ACTIVELOCATIONREGISTRY_HPP_

#include <map>
#include <mutex>
#include <string>

namespace ferry::resume
{
/// Tracks which job currently owns each canonical identifier so that two jobs never transfer
/// the same resource at once.
class ActiveLocationRegistry
{
public:
    // False when the identifier is already held, by any job
    bool acquire(const std::string &canonical_identifier, const std::string &job_id);

    // Only the owning job can release
    bool release(const std::string &canonical_identifier, const std::string &job_id);

    [[nodiscard]] bool        contains(const std::string &canonical_identifier) const;
    [[nodiscard]] std::string owner(const std::string &canonical_identifier) const;
    [[nodiscard]] size_t      size() const;

private:
    std::map<std::string, std::string> owners_;
    mutable std::mutex                 mutex_;
};
}  // namespace ferry::resume

#endif  // FERRY_RESUME_ACTIVELOCATIONREGISTRY_HPP_

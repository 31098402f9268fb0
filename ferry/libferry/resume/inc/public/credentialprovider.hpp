#ifndef FERRY_RESUME_CREDENTIALPROVIDER_HPP_
#define FERRY_RESUME_CREDENTIALPROVIDER_HPP_

#include <memory>
#include <string>

#include "locationkind.hpp"

namespace ferry::location
{
// Forward declarations
class CredentialHandle;
}  // namespace ferry::location

namespace ferry::resume
{
/// Supplied by the embedding application. Returns nullptr when no credentials are available for
/// the location.
class CredentialProvider
{
public:
    virtual ~CredentialProvider() = default;

    virtual std::shared_ptr<const location::CredentialHandle> get_credentials(
        location::LocationKind kind, const std::string &canonical_identifier) = 0;
};
}  // namespace ferry::resume

#endif  // FERRY_RESUME_CREDENTIALPROVIDER_HPP_

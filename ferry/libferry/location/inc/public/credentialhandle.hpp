#ifndef FERRY_LOCATION_CREDENTIALHANDLE_HPP_
#define FERRY_LOCATION_CREDENTIALHANDLE_HPP_

#include <memory>
#include <string>

namespace ferry::location
{
/// Immutable authorization material for one backend resource. Locations hold it through a
/// shared_ptr so that swapping never invalidates a handle an in-flight operation already owns.
/// Never serialized.
class CredentialHandle
{
public:
    enum class Type
    {
        ANONYMOUS,
        ACCOUNT_KEY,
        SAS_TOKEN,
        BEARER_TOKEN
    };

    CredentialHandle(Type type, std::string secret, std::string account_name = {});

    static std::shared_ptr<const CredentialHandle> anonymous();

    [[nodiscard]] Type               type() const;
    [[nodiscard]] const std::string &secret() const;
    [[nodiscard]] const std::string &account_name() const;
    [[nodiscard]] bool               is_valid() const;

private:
    const Type        type_;
    const std::string secret_;
    const std::string account_name_;
};

const char *to_string(CredentialHandle::Type type);
}  // namespace ferry::location

#endif  // FERRY_LOCATION_CREDENTIALHANDLE_HPP_

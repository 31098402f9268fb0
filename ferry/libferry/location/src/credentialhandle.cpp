#include "credentialhandle.hpp"

#include <utility>

namespace ferry::location
{
CredentialHandle::CredentialHandle(Type type, std::string secret, std::string account_name)
    : type_ {type}
    , secret_ {std::move(secret)}
    , account_name_ {std::move(account_name)}
{}

std::shared_ptr<const CredentialHandle> CredentialHandle::anonymous()
{
    static const auto anonymous_handle =
        std::make_shared<const CredentialHandle>(Type::ANONYMOUS, "");
    return anonymous_handle;
}

CredentialHandle::Type CredentialHandle::type() const
{
    return type_;
}

const std::string &CredentialHandle::secret() const
{
    return secret_;
}

const std::string &CredentialHandle::account_name() const
{
    return account_name_;
}

bool CredentialHandle::is_valid() const
{
    return type_ == Type::ANONYMOUS || !secret_.empty();
}

const char *to_string(CredentialHandle::Type type)
{
    switch (type)
    {
        case CredentialHandle::Type::ANONYMOUS: return "ANONYMOUS";
        case CredentialHandle::Type::ACCOUNT_KEY: return "ACCOUNT_KEY";
        case CredentialHandle::Type::SAS_TOKEN: return "SAS_TOKEN";
        case CredentialHandle::Type::BEARER_TOKEN: return "BEARER_TOKEN";
        default: return "INVALID_CREDENTIAL_TYPE";
    }
}
}  // namespace ferry::location

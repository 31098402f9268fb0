#ifndef FERRY_TEST_CREDENTIALPROVIDER_MOCK_HPP_
#define FERRY_TEST_CREDENTIALPROVIDER_MOCK_HPP_

#include <gmock/gmock.h>

#include "credentialhandle.hpp"
#include "credentialprovider.hpp"

using namespace ::ferry::resume;

class CredentialProviderMock : public CredentialProvider
{
public:
    MOCK_METHOD(std::shared_ptr<const ::ferry::location::CredentialHandle>, get_credentials,
        (::ferry::location::LocationKind, const std::string &), (override));
};

#endif  // FERRY_TEST_CREDENTIALPROVIDER_MOCK_HPP_

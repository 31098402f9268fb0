#ifndef FERRY_CRYPTO_BASE64ENCODERIMPL_HPP_
#define FERRY_CRYPTO_BASE64ENCODERIMPL_HPP_

#include "base64encoder.hpp"

namespace ferry::crypto
{
class Base64EncoderImpl : public Base64Encoder
{
public:
    std::string encode(const Byte *data, size_t len) override;
};
}  // namespace ferry::crypto

#endif  // FERRY_CRYPTO_BASE64ENCODERIMPL_HPP_

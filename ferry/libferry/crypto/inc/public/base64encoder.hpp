#ifndef FERRY_CRYPTO_BASE64ENCODER_HPP_
#define FERRY_CRYPTO_BASE64ENCODER_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace ferry::crypto
{
class Base64Encoder
{
public:
    using Byte = uint8_t;

    virtual ~Base64Encoder() = default;

    virtual std::string encode(const Byte *data, size_t len) = 0;
};
}  // namespace ferry::crypto

#endif  // FERRY_CRYPTO_BASE64ENCODER_HPP_

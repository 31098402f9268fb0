#ifndef FERRY_CRYPTO_SHA3HASHER_HPP_
#define FERRY_CRYPTO_SHA3HASHER_HPP_

#include <cstddef>
#include <cstdint>
#include <istream>
#include <vector>

namespace ferry::crypto
{
class SHA3Hasher
{
public:
    using Byte        = uint8_t;
    using InputStream = std::istream;

    virtual ~SHA3Hasher() = default;

    virtual std::vector<Byte> hash_256(const Byte *data, size_t len) = 0;
    virtual std::vector<Byte> hash_256(InputStream &is)              = 0;
};
}  // namespace ferry::crypto

#endif  // FERRY_CRYPTO_SHA3HASHER_HPP_

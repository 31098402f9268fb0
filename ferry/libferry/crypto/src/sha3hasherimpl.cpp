#include "sha3hasherimpl.hpp"

#include <algorithm>
#include <iterator>

namespace ferry::crypto
{
std::vector<SHA3Hasher::Byte> SHA3HasherImpl::hash_256(const Byte *data, size_t len)
{
    return digest(EVP_sha3_256(), data, data + len, std::min(len, DEFAULT_BUFFER_SIZE));
}

std::vector<SHA3Hasher::Byte> SHA3HasherImpl::hash_256(InputStream &is)
{
    return digest(
        EVP_sha3_256(), std::istreambuf_iterator<char> {is}, std::istreambuf_iterator<char> {});
}
}  // namespace ferry::crypto

#ifndef FERRY_CRYPTO_SHA3HASHERIMPL_HPP_
#define FERRY_CRYPTO_SHA3HASHERIMPL_HPP_

#include <algorithm>

#include <glog/logging.h>
#include <openssl/evp.h>

#include "sha3hasher.hpp"

namespace ferry::crypto
{
class SHA3HasherImpl : public SHA3Hasher
{
public:
    std::vector<Byte> hash_256(const Byte *data, size_t len) override;
    std::vector<Byte> hash_256(InputStream &is) override;

private:
    // Feeds [data_begin, data_end) through the digest in chunks of at most buffer_size bytes
    template<typename InputIt>
    static std::vector<Byte> digest(const EVP_MD *algorithm, InputIt data_begin, InputIt data_end,
        size_t buffer_size = DEFAULT_BUFFER_SIZE)
    {
        std::vector<Byte> buffer(std::max(buffer_size, size_t(1)));

        auto ctx = EVP_MD_CTX_new();
        if (!ctx)
        {
            LOG(FATAL) << "EVP_MD_CTX_new failed";
        }

        if (!EVP_DigestInit_ex(ctx, algorithm, nullptr))
        {
            LOG(FATAL) << "EVP_DigestInit_ex failed";
        }

        for (auto it = data_begin; it != data_end;)
        {
            size_t cnt = 0;
            while (cnt != buffer.size() && it != data_end)
            {
                buffer[cnt++] = Byte(*it++);
            }

            if (!EVP_DigestUpdate(ctx, buffer.data(), cnt))
            {
                LOG(FATAL) << "EVP_DigestUpdate failed";
            }
        }

        std::vector<Byte> out(size_t(EVP_MD_size(algorithm)));
        if (!EVP_DigestFinal_ex(ctx, out.data(), nullptr))
        {
            LOG(FATAL) << "EVP_DigestFinal_ex failed";
        }

        EVP_MD_CTX_free(ctx);

        return out;
    }

    static constexpr size_t DEFAULT_BUFFER_SIZE = 32 * 1024;  // 32 KiB
};
}  // namespace ferry::crypto

#endif  // FERRY_CRYPTO_SHA3HASHERIMPL_HPP_

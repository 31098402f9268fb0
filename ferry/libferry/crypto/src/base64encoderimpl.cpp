#include "base64encoderimpl.hpp"

#include <glog/logging.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

namespace ferry::crypto
{
std::string Base64EncoderImpl::encode(const Byte *data, size_t len)
{
    if (len == 0)
    {
        return "";
    }

    BIO *b64 = BIO_new(BIO_f_base64());
    if (!b64)
    {
        LOG(FATAL) << "BIO_new failed";
    }

    BIO *bmem = BIO_new(BIO_s_mem());
    if (!bmem)
    {
        LOG(FATAL) << "BIO_new failed";
    }
    bmem = BIO_push(b64, bmem);

    BIO_set_flags(bmem, BIO_FLAGS_BASE64_NO_NL);
    BIO_set_close(bmem, BIO_CLOSE);

    size_t written;
    if (!BIO_write_ex(b64, data, len, &written) || len != written)
    {
        LOG(FATAL) << "BIO_write_ex failed";
    }

    if (BIO_flush(b64) != 1)
    {
        LOG(FATAL) << "BIO_flush failed";
    }

    BUF_MEM *bptr;
    BIO_get_mem_ptr(bmem, &bptr);
    std::string out(bptr->data, bptr->length);

    BIO_free_all(bmem);
    return out;
}
}  // namespace ferry::crypto

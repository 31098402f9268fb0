#ifndef FERRY_BACKENDS_LOCALFILESYSTEMADAPTER_HPP_
#define FERRY_BACKENDS_LOCALFILESYSTEMADAPTER_HPP_

#include <memory>
#include <string>

#include "backendadapter.hpp"

namespace ferry::config
{
// Forward declarations
class Config;
}  // namespace ferry::config

namespace ferry::crypto
{
// Forward declarations
class Base64Encoder;
class SHA3Hasher;
}  // namespace ferry::crypto

namespace ferry::backends
{
/// Probes LOCAL_FILE and LOCAL_DIRECTORY resources. A file fingerprint is the base64 SHA3-256
/// digest of its size and modification time, or of its whole content when
/// local_content_fingerprint is enabled. Directories have no fingerprint.
class LocalFileSystemAdapter : public location::BackendAdapter
{
public:
    LocalFileSystemAdapter(std::unique_ptr<crypto::SHA3Hasher> sha3,
        std::unique_ptr<crypto::Base64Encoder> b64, const config::Config &cfg);
    ~LocalFileSystemAdapter() override;

    [[nodiscard]] location::ResourceState probe(const location::ResourceRef &resource,
        const location::CredentialHandle &credentials,
        const location::RequestOptions &   options) override;

private:
    [[nodiscard]] location::ResourceState probe_file(const std::string &path) const;
    [[nodiscard]] location::ResourceState probe_directory(const std::string &path) const;
    [[nodiscard]] std::string             metadata_fingerprint(const std::string &path) const;
    [[nodiscard]] std::string             content_fingerprint(std::istream &is) const;

    const std::unique_ptr<crypto::SHA3Hasher>    sha3_;
    const std::unique_ptr<crypto::Base64Encoder> b64_;
    const bool                                   content_fingerprint_;
};
}  // namespace ferry::backends

#endif  // FERRY_BACKENDS_LOCALFILESYSTEMADAPTER_HPP_

#ifndef FERRY_CHECKPOINT_CHECKPOINTCODECIMPL_HPP_
#define FERRY_CHECKPOINT_CHECKPOINTCODECIMPL_HPP_

#include <nlohmann/json.hpp>

#include "checkpointcodec.hpp"
#include "requestoptionsprovider.hpp"

namespace ferry::config
{
// Forward declarations
class Config;
}  // namespace ferry::config

namespace ferry::checkpoint
{
class CheckpointCodecImpl : public CheckpointCodec
{
public:
    enum class Encoding
    {
        CBOR,
        JSON
    };

    // Encoding and request option defaults are taken from the configuration
    explicit CheckpointCodecImpl(const config::Config &cfg);

    [[nodiscard]] Encoding encoding() const;

    [[nodiscard]] location::ErrorCode encode(
        const location::TransferLocation &location, Bytes &bytes) const override;
    [[nodiscard]] location::ErrorCode encode(
        const TransferJobRecord &job, Bytes &bytes) const override;

    [[nodiscard]] location::ErrorCode decode(const Bytes &bytes,
        std::shared_ptr<location::TransferLocation> &     location) const override;
    [[nodiscard]] location::ErrorCode decode(
        const Bytes &bytes, TransferJobRecord &job) const override;

private:
    [[nodiscard]] location::ErrorCode serialize(const nlohmann::json &root, Bytes &bytes) const;
    [[nodiscard]] nlohmann::json      parse(const Bytes &bytes) const;

    [[nodiscard]] nlohmann::json      location_to_json(const location::TransferLocation &location) const;
    [[nodiscard]] location::ErrorCode location_from_json(const nlohmann::json &root,
        std::shared_ptr<location::TransferLocation> &location) const;

    const location::RequestOptionsProvider request_options_provider_;
    const Encoding                         encoding_;
};

const char *to_string(CheckpointCodecImpl::Encoding encoding);
}  // namespace ferry::checkpoint

#endif  // FERRY_CHECKPOINT_CHECKPOINTCODECIMPL_HPP_

#ifndef FERRY_CHECKPOINT_CHECKPOINTCODEC_HPP_
#define FERRY_CHECKPOINT_CHECKPOINTCODEC_HPP_

#include <cstdint>
#include <memory>
#include <vector>

#include "errorcode.hpp"

namespace ferry::location
{
// Forward declarations
class TransferLocation;
}  // namespace ferry::location

namespace ferry::checkpoint
{
// Forward declarations
struct TransferJobRecord;

/// Converts locations and jobs to and from versioned checkpoint records. Credentials are never
/// written; decoded locations are awaiting credentials.
class CheckpointCodec
{
public:
    using Bytes = std::vector<uint8_t>;

    virtual ~CheckpointCodec() = default;

    // INVALID_ARGUMENT when the location cannot be represented in the configured encoding
    virtual location::ErrorCode encode(
        const location::TransferLocation &location, Bytes &bytes) const = 0;

    // INVALID_ARGUMENT when the job lacks a source or a destination, or cannot be represented
    virtual location::ErrorCode encode(const TransferJobRecord &job, Bytes &bytes) const = 0;

    virtual location::ErrorCode decode(
        const Bytes &bytes, std::shared_ptr<location::TransferLocation> &location) const = 0;
    virtual location::ErrorCode decode(const Bytes &bytes, TransferJobRecord &job) const = 0;
};
}  // namespace ferry::checkpoint

#endif  // FERRY_CHECKPOINT_CHECKPOINTCODEC_HPP_

#ifndef FERRY_RESUME_RESUMECOORDINATOR_HPP_
#define FERRY_RESUME_RESUMECOORDINATOR_HPP_

#include <cstdint>
#include <memory>
#include <vector>

#include "errorcode.hpp"

namespace ferry::location
{
// Forward declarations
class BackendRegistry;
class TransferLocation;
}  // namespace ferry::location

namespace ferry::checkpoint
{
// Forward declarations
class CheckpointCodec;
struct TransferJobRecord;
}  // namespace ferry::checkpoint

namespace ferry::resume
{
// Forward declarations
class ActiveLocationRegistry;
class CredentialProvider;

/// Brings jobs to the point where chunk copying may begin, either freshly planned (start) or
/// reloaded from a checkpoint (resume). A job holds both of its canonical identifiers from a
/// successful start or resume until release().
class ResumeCoordinator
{
public:
    ResumeCoordinator(std::shared_ptr<const checkpoint::CheckpointCodec> codec,
        std::shared_ptr<CredentialProvider>                           credential_provider,
        std::shared_ptr<const location::BackendRegistry>              backends,
        std::shared_ptr<ActiveLocationRegistry>                       active_locations);

    /// Decodes the job, reclaims its locations, rehydrates their credentials and admits it.
    /// Jobs already finished or skipped are decoded but neither reclaimed nor admitted.
    [[nodiscard]] location::ErrorCode resume(
        const std::vector<uint8_t> &bytes, checkpoint::TransferJobRecord &job);

    [[nodiscard]] location::ErrorCode start(const checkpoint::TransferJobRecord &job);

    // Validates both locations, the source must exist, then enforces their access conditions
    [[nodiscard]] location::ErrorCode admit(const checkpoint::TransferJobRecord &job) const;

    // Only for a job whose start() or resume() succeeded
    void release(const checkpoint::TransferJobRecord &job);

private:
    [[nodiscard]] location::ErrorCode acquire(const checkpoint::TransferJobRecord &job);
    [[nodiscard]] location::ErrorCode rehydrate(location::TransferLocation &location);

    const std::shared_ptr<const checkpoint::CheckpointCodec> codec_;
    const std::shared_ptr<CredentialProvider>                credential_provider_;
    const std::shared_ptr<const location::BackendRegistry>   backends_;
    const std::shared_ptr<ActiveLocationRegistry>            active_locations_;
};
}  // namespace ferry::resume

#endif  // FERRY_RESUME_RESUMECOORDINATOR_HPP_

#include "resumecoordinator.hpp"

#include <utility>

#include <glog/logging.h>

#include "activelocationregistry.hpp"
#include "backendregistry.hpp"
#include "checkpointcodec.hpp"
#include "credentialhandle.hpp"
#include "credentialprovider.hpp"
#include "transferjobrecord.hpp"
#include "transferlocation.hpp"

namespace ferry::resume
{
using location::ErrorCode;

ResumeCoordinator::ResumeCoordinator(std::shared_ptr<const checkpoint::CheckpointCodec> codec,
    std::shared_ptr<CredentialProvider>                                    credential_provider,
    std::shared_ptr<const location::BackendRegistry>                       backends,
    std::shared_ptr<ActiveLocationRegistry>                                active_locations)
    : codec_ {std::move(codec)}
    , credential_provider_ {std::move(credential_provider)}
    , backends_ {std::move(backends)}
    , active_locations_ {std::move(active_locations)}
{}

ErrorCode ResumeCoordinator::resume(
    const std::vector<uint8_t> &bytes, checkpoint::TransferJobRecord &job)
{
    checkpoint::TransferJobRecord decoded;
    if (auto err = codec_->decode(bytes, decoded); err != ErrorCode::OK)
    {
        LOG(WARNING) << "Cannot resume job from checkpoint: " << err;
        return err;
    }

    if (checkpoint::is_terminal(decoded.status))
    {
        LOG(INFO) << "Job " << decoded.job_id << " is " << to_string(decoded.status)
                  << ", nothing to resume";
        job = std::move(decoded);
        return ErrorCode::OK;
    }

    if (auto err = acquire(decoded); err != ErrorCode::OK)
    {
        return err;
    }

    auto err = rehydrate(*decoded.source);
    if (err == ErrorCode::OK)
    {
        err = rehydrate(*decoded.destination);
    }
    if (err == ErrorCode::OK)
    {
        err = admit(decoded);
    }
    if (err != ErrorCode::OK)
    {
        LOG(WARNING) << "Resuming job " << decoded.job_id << " failed: " << err;
        release(decoded);
        return err;
    }

    LOG(INFO) << "Job " << decoded.job_id << " resumed ("
              << decoded.progress.completed_chunks.size() << " chunks already transferred)";
    job = std::move(decoded);
    return ErrorCode::OK;
}

ErrorCode ResumeCoordinator::start(const checkpoint::TransferJobRecord &job)
{
    if (auto err = acquire(job); err != ErrorCode::OK)
    {
        return err;
    }

    if (auto err = admit(job); err != ErrorCode::OK)
    {
        LOG(WARNING) << "Starting job " << job.job_id << " failed: " << err;
        release(job);
        return err;
    }

    LOG(INFO) << "Job " << job.job_id << " started";
    return ErrorCode::OK;
}

ErrorCode ResumeCoordinator::admit(const checkpoint::TransferJobRecord &job) const
{
    if (!job.source || !job.destination)
    {
        LOG(WARNING) << "Job " << job.job_id << " lacks a source or a destination";
        return ErrorCode::INVALID_ARGUMENT;
    }

    using Existence = location::TransferLocation::Existence;
    if (auto err = job.source->validate(*backends_, Existence::MUST_EXIST); err != ErrorCode::OK)
    {
        return err;
    }
    if (auto err = job.destination->validate(*backends_, Existence::MAY_BE_MISSING);
        err != ErrorCode::OK)
    {
        return err;
    }

    for (const auto &location : {job.source, job.destination})
    {
        if (auto err = location->enforce_access_condition(*backends_); err != ErrorCode::OK)
        {
            return err;
        }
    }

    return ErrorCode::OK;
}

void ResumeCoordinator::release(const checkpoint::TransferJobRecord &job)
{
    for (const auto &location : {job.source, job.destination})
    {
        if (location)
        {
            active_locations_->release(location->canonical_identifier(), job.job_id);
        }
    }
}

ErrorCode ResumeCoordinator::acquire(const checkpoint::TransferJobRecord &job)
{
    if (job.job_id.empty() || !job.source || !job.destination)
    {
        LOG(WARNING) << "Job \"" << job.job_id << "\" lacks an id, a source or a destination";
        return ErrorCode::INVALID_ARGUMENT;
    }

    const auto &source_id      = job.source->canonical_identifier();
    const auto &destination_id = job.destination->canonical_identifier();

    if (source_id == destination_id)
    {
        LOG(WARNING) << "Job " << job.job_id << " copies " << source_id << " onto itself";
        return ErrorCode::INVALID_ARGUMENT;
    }

    if (!active_locations_->acquire(source_id, job.job_id))
    {
        LOG(WARNING) << source_id << " is in use by job " << active_locations_->owner(source_id);
        return ErrorCode::LOCATION_IN_USE;
    }

    if (!active_locations_->acquire(destination_id, job.job_id))
    {
        LOG(WARNING) << destination_id << " is in use by job "
                     << active_locations_->owner(destination_id);
        active_locations_->release(source_id, job.job_id);
        return ErrorCode::LOCATION_IN_USE;
    }

    return ErrorCode::OK;
}

ErrorCode ResumeCoordinator::rehydrate(location::TransferLocation &location)
{
    auto credentials =
        credential_provider_->get_credentials(location.type(), location.canonical_identifier());
    if (!credentials)
    {
        LOG(WARNING) << "No credentials available for " << location.canonical_identifier();
        return ErrorCode::NOT_READY;
    }
    return location.update_credentials(std::move(credentials));
}
}  // namespace ferry::resume

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "activelocationregistry.hpp"
#include "backendregistry.hpp"
#include "checkpointcodecimpl.hpp"
#include "credentialhandle.hpp"
#include "resumecoordinator.hpp"
#include "transferjobrecord.hpp"
#include "transferlocation.hpp"

#include "backendadapter_mock.hpp"
#include "credentialprovider_mock.hpp"
#include "testutils.hpp"

using namespace ::testing;
using namespace ::ferry::checkpoint;
using namespace ::ferry::location;
using namespace ::ferry::resume;

namespace
{
class ResumeCoordinatorTest : public Test
{
protected:
    void SetUp() override
    {
        codec_               = std::make_shared<CheckpointCodecImpl>(testutils::make_config());
        credential_provider_ = std::make_shared<NiceMock<CredentialProviderMock>>();
        local_adapter_       = std::make_shared<NiceMock<BackendAdapterMock>>();
        blob_adapter_        = std::make_shared<NiceMock<BackendAdapterMock>>();
        backends_            = std::make_shared<BackendRegistry>();
        active_locations_    = std::make_shared<ActiveLocationRegistry>();

        ASSERT_TRUE(backends_->register_adapter(LocationKind::LOCAL_FILE, local_adapter_));
        ASSERT_TRUE(backends_->register_adapter(LocationKind::CLOUD_BLOB, blob_adapter_));

        ON_CALL(*credential_provider_, get_credentials(_, _))
            .WillByDefault(Return(testutils::make_sas_token("sig=fresh")));
        ON_CALL(*local_adapter_, probe(_, _, _))
            .WillByDefault(Return(ResourceState {ProbeStatus::OK, true, "src-fp"}));
        ON_CALL(*blob_adapter_, probe(_, _, _))
            .WillByDefault(Return(ResourceState {ProbeStatus::OK, false, ""}));

        coordinator_ = std::make_unique<ResumeCoordinator>(
            codec_, credential_provider_, backends_, active_locations_);
    }

    TransferJobRecord make_job(const std::string &job_id, const std::string &blob_name = "f.bin")
    {
        TransferJobRecord job;
        job.job_id = job_id;
        job.status = JobStatus::NOT_STARTED;
        EXPECT_EQ(TransferLocation::create(LocalFileRef {source_path_},
                      CredentialHandle::anonymous(), {}, job.source),
            ErrorCode::OK);
        EXPECT_EQ(TransferLocation::create(
                      CloudBlobRef {"https://acct.blob.core.windows.net", "c", blob_name},
                      testutils::make_sas_token(), {}, job.destination),
            ErrorCode::OK);
        return job;
    }

    CheckpointCodec::Bytes checkpoint(const TransferJobRecord &job)
    {
        CheckpointCodec::Bytes bytes;
        EXPECT_EQ(codec_->encode(job, bytes), ErrorCode::OK);
        return bytes;
    }

    const std::string source_path_ = "/var/data/f.bin";
    const std::string destination_id_ = "https://acct.blob.core.windows.net/c/f.bin";

    std::shared_ptr<CheckpointCodecImpl>              codec_;
    std::shared_ptr<NiceMock<CredentialProviderMock>> credential_provider_;
    std::shared_ptr<NiceMock<BackendAdapterMock>>     local_adapter_;
    std::shared_ptr<NiceMock<BackendAdapterMock>>     blob_adapter_;
    std::shared_ptr<BackendRegistry>                  backends_;
    std::shared_ptr<ActiveLocationRegistry>           active_locations_;
    std::unique_ptr<ResumeCoordinator>                coordinator_;
};
}  // namespace

TEST_F(ResumeCoordinatorTest, Start)
{
    auto job = make_job("job-1");
    ASSERT_EQ(job.destination->set_access_condition(AccessCondition::if_not_exists()),
        ErrorCode::OK);

    EXPECT_EQ(coordinator_->start(job), ErrorCode::OK);
    EXPECT_EQ(active_locations_->owner(source_path_), "job-1");
    EXPECT_EQ(active_locations_->owner(destination_id_), "job-1");
    EXPECT_TRUE(job.destination->condition_checked());
    EXPECT_TRUE(job.source->condition_checked());

    coordinator_->release(job);
    EXPECT_EQ(active_locations_->size(), 0u);
}

TEST_F(ResumeCoordinatorTest, Start_LocationInUse)
{
    auto first  = make_job("job-1");
    auto second = make_job("job-2", "other.bin");

    ASSERT_EQ(coordinator_->start(first), ErrorCode::OK);

    // Same source, different destination
    EXPECT_EQ(coordinator_->start(second), ErrorCode::LOCATION_IN_USE);
    EXPECT_EQ(active_locations_->owner(source_path_), "job-1");
    EXPECT_FALSE(active_locations_->contains("https://acct.blob.core.windows.net/c/other.bin"));

    coordinator_->release(first);
    EXPECT_EQ(coordinator_->start(second), ErrorCode::OK);
}

TEST_F(ResumeCoordinatorTest, Start_MissingSource)
{
    auto job = make_job("job-1");

    ON_CALL(*local_adapter_, probe(_, _, _))
        .WillByDefault(Return(ResourceState {ProbeStatus::OK, false, ""}));

    EXPECT_EQ(coordinator_->start(job), ErrorCode::UNREACHABLE_OR_CHANGED);
    EXPECT_FALSE(job.source->condition_checked());
    EXPECT_EQ(active_locations_->size(), 0u);
}

TEST_F(ResumeCoordinatorTest, Start_SourceIsDestination)
{
    auto job = make_job("job-1");
    ASSERT_EQ(TransferLocation::create(LocalFileRef {"/var/data/./f.bin"},
                  CredentialHandle::anonymous(), {}, job.destination),
        ErrorCode::OK);

    EXPECT_EQ(coordinator_->start(job), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(active_locations_->size(), 0u);
}

TEST_F(ResumeCoordinatorTest, Start_PreconditionFailedReleasesLocations)
{
    auto job = make_job("job-1");
    ASSERT_EQ(job.destination->set_access_condition(AccessCondition::if_exists()), ErrorCode::OK);

    EXPECT_EQ(coordinator_->start(job), ErrorCode::PRECONDITION_FAILED);
    EXPECT_EQ(active_locations_->size(), 0u);
    EXPECT_FALSE(job.destination->condition_checked());
}

TEST_F(ResumeCoordinatorTest, Resume)
{
    auto bytes = checkpoint(make_job("job-1"));

    EXPECT_CALL(*credential_provider_, get_credentials(LocationKind::LOCAL_FILE, source_path_));
    EXPECT_CALL(*credential_provider_, get_credentials(LocationKind::CLOUD_BLOB, destination_id_));

    TransferJobRecord job;
    ASSERT_EQ(coordinator_->resume(bytes, job), ErrorCode::OK);
    EXPECT_EQ(job.job_id, "job-1");
    EXPECT_EQ(job.source->phase(), TransferLocation::Phase::READY);
    EXPECT_EQ(job.destination->phase(), TransferLocation::Phase::READY);
    EXPECT_EQ(active_locations_->owner(source_path_), "job-1");
    EXPECT_EQ(active_locations_->owner(destination_id_), "job-1");

    std::shared_ptr<const CredentialHandle> credentials;
    ASSERT_EQ(job.destination->credentials(credentials), ErrorCode::OK);
    EXPECT_EQ(credentials->secret(), "sig=fresh");
}

TEST_F(ResumeCoordinatorTest, Resume_CheckedConditionIsNotReevaluated)
{
    auto job = make_job("job-1");
    ASSERT_EQ(job.destination->set_access_condition(AccessCondition::if_not_exists()),
        ErrorCode::OK);
    ASSERT_EQ(coordinator_->start(job), ErrorCode::OK);
    ASSERT_EQ(job.destination->record_fingerprint("dst-fp"), ErrorCode::OK);

    job.status = JobStatus::TRANSFERRING;
    job.progress.completed_chunks = {0};
    auto bytes = checkpoint(job);
    coordinator_->release(job);

    // The destination now exists; if_not_exists would fail if it were evaluated again
    ON_CALL(*blob_adapter_, probe(_, _, _))
        .WillByDefault(Return(ResourceState {ProbeStatus::OK, true, "dst-fp"}));
    EXPECT_CALL(*blob_adapter_, probe(_, _, _)).Times(1);

    TransferJobRecord resumed;
    EXPECT_EQ(coordinator_->resume(bytes, resumed), ErrorCode::OK);
    EXPECT_TRUE(resumed.destination->condition_checked());
    EXPECT_EQ(resumed.progress.completed_chunks, std::vector<uint64_t> {0});
}

TEST_F(ResumeCoordinatorTest, Resume_ChangedSource)
{
    auto job = make_job("job-1");
    ASSERT_EQ(coordinator_->start(job), ErrorCode::OK);
    auto bytes = checkpoint(job);
    coordinator_->release(job);

    ON_CALL(*local_adapter_, probe(_, _, _))
        .WillByDefault(Return(ResourceState {ProbeStatus::OK, true, "edited"}));

    TransferJobRecord resumed;
    EXPECT_EQ(coordinator_->resume(bytes, resumed), ErrorCode::UNREACHABLE_OR_CHANGED);
    EXPECT_EQ(active_locations_->size(), 0u);
    EXPECT_EQ(resumed.source, nullptr);
}

TEST_F(ResumeCoordinatorTest, Resume_NoCredentials)
{
    auto bytes = checkpoint(make_job("job-1"));

    ON_CALL(*credential_provider_, get_credentials(LocationKind::CLOUD_BLOB, _))
        .WillByDefault(Return(nullptr));
    EXPECT_CALL(*local_adapter_, probe(_, _, _)).Times(0);
    EXPECT_CALL(*blob_adapter_, probe(_, _, _)).Times(0);

    TransferJobRecord job;
    EXPECT_EQ(coordinator_->resume(bytes, job), ErrorCode::NOT_READY);
    EXPECT_EQ(active_locations_->size(), 0u);
}

TEST_F(ResumeCoordinatorTest, Resume_LocationInUse)
{
    auto bytes = checkpoint(make_job("job-1"));
    ASSERT_TRUE(active_locations_->acquire(destination_id_, "job-9"));

    EXPECT_CALL(*credential_provider_, get_credentials(_, _)).Times(0);

    TransferJobRecord job;
    EXPECT_EQ(coordinator_->resume(bytes, job), ErrorCode::LOCATION_IN_USE);
    EXPECT_FALSE(active_locations_->contains(source_path_));
    EXPECT_EQ(active_locations_->owner(destination_id_), "job-9");
}

TEST_F(ResumeCoordinatorTest, Resume_SameCheckpointTwice)
{
    auto bytes = checkpoint(make_job("job-1"));

    TransferJobRecord first;
    ASSERT_EQ(coordinator_->resume(bytes, first), ErrorCode::OK);

    TransferJobRecord second;
    EXPECT_EQ(coordinator_->resume(bytes, second), ErrorCode::LOCATION_IN_USE);
    EXPECT_EQ(second.source, nullptr);

    // A later attempt failing for another reason leaves the running instance's hold alone
    ON_CALL(*blob_adapter_, probe(_, _, _))
        .WillByDefault(Return(ResourceState {ProbeStatus::UNREACHABLE, false, ""}));
    EXPECT_EQ(coordinator_->resume(bytes, second), ErrorCode::LOCATION_IN_USE);
    EXPECT_EQ(active_locations_->owner(source_path_), "job-1");
    EXPECT_EQ(active_locations_->owner(destination_id_), "job-1");
    EXPECT_EQ(active_locations_->size(), 2u);

    coordinator_->release(first);
    EXPECT_EQ(active_locations_->size(), 0u);
}

TEST_F(ResumeCoordinatorTest, Resume_CorruptCheckpoint)
{
    EXPECT_CALL(*credential_provider_, get_credentials(_, _)).Times(0);

    TransferJobRecord job;
    EXPECT_EQ(coordinator_->resume({'{', '}'}, job), ErrorCode::CORRUPT_CHECKPOINT);
    EXPECT_EQ(active_locations_->size(), 0u);
}

TEST_F(ResumeCoordinatorTest, Resume_FinishedJob)
{
    auto finished   = make_job("job-1");
    finished.status = JobStatus::FINISHED;
    auto bytes      = checkpoint(finished);

    EXPECT_CALL(*credential_provider_, get_credentials(_, _)).Times(0);

    TransferJobRecord job;
    EXPECT_EQ(coordinator_->resume(bytes, job), ErrorCode::OK);
    EXPECT_EQ(job.status, JobStatus::FINISHED);
    EXPECT_EQ(job.source->phase(), TransferLocation::Phase::AWAITING_CREDENTIALS);
    EXPECT_EQ(active_locations_->size(), 0u);
}

TEST_F(ResumeCoordinatorTest, Admit_IncompleteJob)
{
    auto job        = make_job("job-1");
    job.destination = nullptr;
    EXPECT_EQ(coordinator_->admit(job), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(coordinator_->start(job), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(active_locations_->size(), 0u);
}

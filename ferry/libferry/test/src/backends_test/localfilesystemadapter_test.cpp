#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>

#include "base64encoderimpl.hpp"
#include "configkeys.hpp"
#include "credentialhandle.hpp"
#include "localfilesystemadapter.hpp"
#include "sha3hasherimpl.hpp"

#include "testutils.hpp"

using namespace ::testing;
using namespace ::ferry::backends;
using namespace ::ferry::location;
using ::ferry::config::ConfigKey;

namespace
{
class LocalFileSystemAdapterTest : public Test
{
protected:
    std::unique_ptr<LocalFileSystemAdapter> make_adapter(bool content_fingerprint = false)
    {
        return std::make_unique<LocalFileSystemAdapter>(
            std::make_unique<ferry::crypto::SHA3HasherImpl>(),
            std::make_unique<ferry::crypto::Base64EncoderImpl>(),
            testutils::make_config(
                {{ConfigKey(ConfigKey::LOCAL_CONTENT_FINGERPRINT).to_string(),
                    content_fingerprint}}));
    }

    ResourceState probe_file(LocalFileSystemAdapter &adapter, const std::filesystem::path &path)
    {
        return adapter.probe(LocalFileRef {path.string()}, *CredentialHandle::anonymous(), {});
    }

    ResourceState probe_directory(
        LocalFileSystemAdapter &adapter, const std::filesystem::path &path)
    {
        return adapter.probe(LocalDirectoryRef {path.string()}, *CredentialHandle::anonymous(), {});
    }

    testutils::TemporaryDirectory dir_;
};
}  // namespace

TEST_F(LocalFileSystemAdapterTest, ExistingFile)
{
    auto adapter = make_adapter();
    auto path    = dir_.write_file("data.bin", "some content");

    auto state = probe_file(*adapter, path);
    EXPECT_EQ(state.status, ProbeStatus::OK);
    EXPECT_TRUE(state.exists);
    EXPECT_FALSE(state.fingerprint.empty());

    // Stable while the file is untouched
    EXPECT_EQ(probe_file(*adapter, path).fingerprint, state.fingerprint);
}

TEST_F(LocalFileSystemAdapterTest, FingerprintChangesWithFile)
{
    auto adapter = make_adapter();
    auto path    = dir_.write_file("data.bin", "some content");
    auto before  = probe_file(*adapter, path).fingerprint;

    dir_.write_file("data.bin", "some longer content");
    std::filesystem::last_write_time(
        path, std::filesystem::last_write_time(path) + std::chrono::seconds(5));

    EXPECT_NE(probe_file(*adapter, path).fingerprint, before);
}

TEST_F(LocalFileSystemAdapterTest, ContentFingerprint)
{
    auto adapter = make_adapter(true);
    auto first   = dir_.write_file("first.bin", "identical");
    auto second  = dir_.write_file("second.bin", "identical");
    auto third   = dir_.write_file("third.bin", "different");

    auto fp = probe_file(*adapter, first).fingerprint;
    EXPECT_FALSE(fp.empty());
    EXPECT_EQ(probe_file(*adapter, second).fingerprint, fp);
    EXPECT_NE(probe_file(*adapter, third).fingerprint, fp);

    // base64 of a SHA3-256 digest
    EXPECT_EQ(fp.size(), 44u);
}

TEST_F(LocalFileSystemAdapterTest, MissingFileInExistingDirectory)
{
    auto adapter = make_adapter();

    auto state = probe_file(*adapter, dir_.path() / "absent.bin");
    EXPECT_EQ(state.status, ProbeStatus::OK);
    EXPECT_FALSE(state.exists);
    EXPECT_TRUE(state.fingerprint.empty());
}

TEST_F(LocalFileSystemAdapterTest, MissingParentDirectory)
{
    auto adapter = make_adapter();

    EXPECT_EQ(probe_file(*adapter, dir_.path() / "absent" / "file.bin").status,
        ProbeStatus::NOT_FOUND);
    EXPECT_EQ(probe_directory(*adapter, dir_.path() / "absent" / "dir").status,
        ProbeStatus::NOT_FOUND);
}

TEST_F(LocalFileSystemAdapterTest, TypeMismatch)
{
    auto adapter = make_adapter();
    auto file    = dir_.write_file("data.bin", "x");

    EXPECT_EQ(probe_file(*adapter, dir_.path()).status, ProbeStatus::NOT_FOUND);
    EXPECT_EQ(probe_directory(*adapter, file).status, ProbeStatus::NOT_FOUND);
}

TEST_F(LocalFileSystemAdapterTest, Directory)
{
    auto adapter = make_adapter();

    auto state = probe_directory(*adapter, dir_.path());
    EXPECT_EQ(state.status, ProbeStatus::OK);
    EXPECT_TRUE(state.exists);
    EXPECT_TRUE(state.fingerprint.empty());

    auto missing = probe_directory(*adapter, dir_.path() / "not_yet");
    EXPECT_EQ(missing.status, ProbeStatus::OK);
    EXPECT_FALSE(missing.exists);
}

TEST_F(LocalFileSystemAdapterTest, ForeignKind)
{
    auto adapter = make_adapter();

    auto state = adapter->probe(StreamRef {"stdin"}, *CredentialHandle::anonymous(), {});
    EXPECT_EQ(state.status, ProbeStatus::UNREACHABLE);
}

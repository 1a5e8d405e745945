#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <memory>
#include <variant>

#include "strongbox/crypto/providers/NativeProviderFactory.hpp"
#include "strongbox/snapshot/SnapshotContainer.hpp"
#include "test_utils/SnapshotFixtures.hpp"
#include "test_utils/TestUtils.hpp"

using strongbox::core::StateError;
using strongbox::snapshot::SnapshotContainer;

namespace
{

class SnapshotContainerTest : public ::testing::Test
{
protected:
    std::unique_ptr<strongbox::crypto::ICryptoProvider> m_crypto{
        strongbox::crypto::providers::makeNativeCryptoProvider()
    };
    strongbox::test_utils::TempDir m_dir{ "snapshot_container_" };
    strongbox::security::SecureBuffer m_key{ strongbox::test_utils::filledKey(0x10U) };
    strongbox::security::SecureBuffer m_otherKey{ strongbox::test_utils::filledKey(0x20U) };
    strongbox::core::ClientId m_alice{ strongbox::test_utils::clientNamed("alice") };
    strongbox::core::ClientId m_bob{ strongbox::test_utils::clientNamed("bob") };

    void SetUp() override
    {
        ASSERT_FALSE(m_dir.path().empty());
    }

    [[nodiscard]] SnapshotContainer readBack(const std::filesystem::path& path,
                                             const strongbox::security::SecureBuffer& key)
    {
        auto read{ SnapshotContainer::readFromSnapshot(*m_crypto, path, key) };
        EXPECT_FALSE(strongbox::core::isError(read));
        if (strongbox::core::isError(read))
        {
            return SnapshotContainer{ *m_crypto };
        }
        return std::move(std::get<SnapshotContainer>(read));
    }
};

} // namespace

TEST_F(SnapshotContainerTest, StagedDataIsKeyedByClient)
{
    SnapshotContainer container{ *m_crypto };
    EXPECT_TRUE(container.empty());

    container.addData(m_alice, strongbox::test_utils::sampleClient(*m_crypto, "alice", "one"));
    container.addData(m_alice, strongbox::test_utils::sampleClient(*m_crypto, "alice", "two"));
    EXPECT_TRUE(container.hasData(m_alice));
    EXPECT_EQ(container.clientIds().size(), 1U);

    const auto state{ container.getState(m_alice) };
    ASSERT_FALSE(strongbox::core::isError(state));
    EXPECT_EQ(strongbox::test_utils::readSampleSecret(*m_crypto, m_alice,
                                                      std::get<strongbox::core::ClientSnapshot>(state)),
              "two");

    const auto missing{ container.getState(m_bob) };
    ASSERT_TRUE(strongbox::core::isError(missing));
    EXPECT_EQ(std::get<StateError>(missing), StateError::NotExisting);
}

TEST_F(SnapshotContainerTest, WriteClearsStagingAndLeavesNoTempFile)
{
    const auto path{ m_dir.path() / "nested" / "backup.snapshot" };
    SnapshotContainer container{ *m_crypto };
    container.addData(m_alice, strongbox::test_utils::sampleClient(*m_crypto, "alice", "pw"));

    ASSERT_FALSE(strongbox::core::isError(container.writeToSnapshot(path, m_key)));
    EXPECT_TRUE(container.empty());
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::path{ path.string() + ".tmp" }));

    const auto perms{ std::filesystem::status(path).permissions() };
    EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
              std::filesystem::perms::none);

    auto loaded{ readBack(path, m_key) };
    ASSERT_TRUE(loaded.hasData(m_alice));
    EXPECT_EQ(strongbox::test_utils::readSampleSecret(
                  *m_crypto, m_alice, std::get<strongbox::core::ClientSnapshot>(loaded.getState(m_alice))),
              "pw");
}

TEST_F(SnapshotContainerTest, FileIsNotPlaintext)
{
    const auto path{ m_dir.path() / "plain.snapshot" };
    SnapshotContainer container{ *m_crypto };
    container.addData(m_alice, strongbox::test_utils::sampleClient(*m_crypto, "alice", "findme-in-file"));
    ASSERT_FALSE(strongbox::core::isError(container.writeToSnapshot(path, m_key)));

    std::ifstream in{ path, std::ios::binary };
    const std::string raw{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
    EXPECT_EQ(raw.find("findme-in-file"), std::string::npos);
    EXPECT_EQ(raw.find("alice"), std::string::npos);
}

TEST_F(SnapshotContainerTest, WrongPasswordIsBadPasswordOrCorrupt)
{
    const auto path{ m_dir.path() / "backup.snapshot" };
    SnapshotContainer container{ *m_crypto };
    container.addData(m_alice, strongbox::test_utils::sampleClient(*m_crypto, "alice", "pw"));
    ASSERT_FALSE(strongbox::core::isError(container.writeToSnapshot(path, m_key)));

    const auto read{ SnapshotContainer::readFromSnapshot(*m_crypto, path, m_otherKey) };
    ASSERT_TRUE(strongbox::core::isError(read));
    EXPECT_EQ(std::get<StateError>(read), StateError::BadPasswordOrCorrupt);
}

TEST_F(SnapshotContainerTest, MissingFileIsIoFailure)
{
    const auto read{ SnapshotContainer::readFromSnapshot(*m_crypto, m_dir.path() / "absent.snapshot", m_key) };
    ASSERT_TRUE(strongbox::core::isError(read));
    EXPECT_EQ(std::get<StateError>(read), StateError::IoFailure);
}

TEST_F(SnapshotContainerTest, FailedWriteKeepsStagedState)
{
    const auto blocker{ m_dir.path() / "file" };
    {
        std::ofstream out{ blocker };
        out << "x";
    }
    SnapshotContainer container{ *m_crypto };
    container.addData(m_alice, strongbox::test_utils::sampleClient(*m_crypto, "alice", "pw"));

    const auto result{ container.writeToSnapshot(blocker / "sub" / "backup.snapshot", m_key) };
    ASSERT_TRUE(strongbox::core::isError(result));
    EXPECT_EQ(std::get<StateError>(result), StateError::IoFailure);
    EXPECT_TRUE(container.hasData(m_alice));
}

TEST_F(SnapshotContainerTest, SynchronizeMergesIntoTargetAndKeepsOtherClients)
{
    const auto source{ m_dir.path() / "source.snapshot" };
    const auto target{ m_dir.path() / "target.snapshot" };

    SnapshotContainer sourceData{ *m_crypto };
    sourceData.addData(m_alice, strongbox::test_utils::sampleClient(*m_crypto, "alice", "from-source"));
    ASSERT_FALSE(strongbox::core::isError(sourceData.writeToSnapshot(source, m_key)));

    SnapshotContainer targetData{ *m_crypto };
    targetData.addData(m_alice, strongbox::test_utils::sampleClient(*m_crypto, "alice", "stale"));
    targetData.addData(m_bob, strongbox::test_utils::sampleClient(*m_crypto, "bob", "bob-only"));
    ASSERT_FALSE(strongbox::core::isError(targetData.writeToSnapshot(target, m_otherKey)));

    SnapshotContainer driver{ *m_crypto };
    ASSERT_FALSE(strongbox::core::isError(driver.synchronize(m_alice, source, m_key, target, m_otherKey)));

    auto merged{ readBack(target, m_otherKey) };
    EXPECT_EQ(merged.clientIds().size(), 2U);
    EXPECT_EQ(strongbox::test_utils::readSampleSecret(
                  *m_crypto, m_alice, std::get<strongbox::core::ClientSnapshot>(merged.getState(m_alice))),
              "from-source");
    EXPECT_EQ(strongbox::test_utils::readSampleSecret(
                  *m_crypto, m_bob, std::get<strongbox::core::ClientSnapshot>(merged.getState(m_bob))),
              "bob-only");
}

TEST_F(SnapshotContainerTest, SynchronizeFromStagingCreatesMissingTarget)
{
    const auto target{ m_dir.path() / "fresh.snapshot" };
    SnapshotContainer container{ *m_crypto };
    container.addData(m_alice, strongbox::test_utils::sampleClient(*m_crypto, "alice", "staged"));

    ASSERT_FALSE(strongbox::core::isError(container.synchronize(m_alice, std::nullopt, {}, target, m_key)));
    EXPECT_TRUE(container.hasData(m_alice));

    auto written{ readBack(target, m_key) };
    ASSERT_TRUE(written.hasData(m_alice));
}

TEST_F(SnapshotContainerTest, SynchronizeWithoutSourceDataRewritesTarget)
{
    const auto target{ m_dir.path() / "target.snapshot" };
    SnapshotContainer targetData{ *m_crypto };
    targetData.addData(m_bob, strongbox::test_utils::sampleClient(*m_crypto, "bob", "keep"));
    ASSERT_FALSE(strongbox::core::isError(targetData.writeToSnapshot(target, m_key)));

    SnapshotContainer empty{ *m_crypto };
    ASSERT_FALSE(strongbox::core::isError(empty.synchronize(m_alice, std::nullopt, {}, target, m_key)));

    auto result{ readBack(target, m_key) };
    EXPECT_FALSE(result.hasData(m_alice));
    EXPECT_TRUE(result.hasData(m_bob));
}

TEST_F(SnapshotContainerTest, SynchronizeWithWrongTargetKeyFails)
{
    const auto target{ m_dir.path() / "target.snapshot" };
    SnapshotContainer targetData{ *m_crypto };
    targetData.addData(m_bob, strongbox::test_utils::sampleClient(*m_crypto, "bob", "keep"));
    ASSERT_FALSE(strongbox::core::isError(targetData.writeToSnapshot(target, m_key)));

    SnapshotContainer container{ *m_crypto };
    container.addData(m_alice, strongbox::test_utils::sampleClient(*m_crypto, "alice", "x"));
    const auto result{ container.synchronize(m_alice, std::nullopt, {}, target, m_otherKey) };
    ASSERT_TRUE(strongbox::core::isError(result));
    EXPECT_EQ(std::get<StateError>(result), StateError::BadPasswordOrCorrupt);

    auto unchanged{ readBack(target, m_key) };
    EXPECT_FALSE(unchanged.hasData(m_alice));
}

TEST_F(SnapshotContainerTest, SynchronizeLiveStateStagesNothing)
{
    const auto target{ m_dir.path() / "mirror.snapshot" };
    SnapshotContainer targetData{ *m_crypto };
    targetData.addData(m_bob, strongbox::test_utils::sampleClient(*m_crypto, "bob", "keep"));
    ASSERT_FALSE(strongbox::core::isError(targetData.writeToSnapshot(target, m_key)));

    SnapshotContainer container{ *m_crypto };
    auto live{ strongbox::test_utils::sampleClient(*m_crypto, "alice", "live") };
    ASSERT_FALSE(strongbox::core::isError(container.synchronize(m_alice, std::move(live), target, m_key)));
    EXPECT_TRUE(container.empty());

    auto merged{ readBack(target, m_key) };
    ASSERT_TRUE(merged.hasData(m_alice));
    EXPECT_TRUE(merged.hasData(m_bob));
    EXPECT_EQ(strongbox::test_utils::readSampleSecret(
                  *m_crypto, m_alice, std::get<strongbox::core::ClientSnapshot>(merged.getState(m_alice))),
              "live");
}

TEST_F(SnapshotContainerTest, LeftoverTempFileDoesNotWidenPermissions)
{
    const auto path{ m_dir.path() / "backup.snapshot" };
    const std::filesystem::path leftover{ path.string() + ".tmp" };
    {
        std::ofstream stale{ leftover, std::ios::binary };
        stale << "stale bytes from an interrupted write";
    }
    std::filesystem::permissions(leftover,
                                 std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
                                     std::filesystem::perms::others_read,
                                 std::filesystem::perm_options::replace);

    SnapshotContainer container{ *m_crypto };
    container.addData(m_alice, strongbox::test_utils::sampleClient(*m_crypto, "alice", "pw"));
    ASSERT_FALSE(strongbox::core::isError(container.writeToSnapshot(path, m_key)));

    EXPECT_FALSE(std::filesystem::exists(leftover));
    EXPECT_EQ(std::filesystem::status(path).permissions(),
              std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
    EXPECT_TRUE(readBack(path, m_key).hasData(m_alice));
}

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "strongbox/crypto/providers/NativeProviderFactory.hpp"
#include "strongbox/snapshot/SnapshotCodec.hpp"
#include "test_utils/SnapshotFixtures.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{

class SnapshotCodecTest : public ::testing::Test
{
protected:
    std::unique_ptr<strongbox::crypto::ICryptoProvider> m_crypto{
        strongbox::crypto::providers::makeNativeCryptoProvider()
    };
    strongbox::security::SecureBuffer m_key{ strongbox::test_utils::filledKey(0x42U) };
    strongbox::core::SnapshotState m_state{};

    void SetUp() override
    {
        m_state.emplace(strongbox::test_utils::clientNamed("alice"),
                        strongbox::test_utils::sampleClient(*m_crypto, "alice", "a-secret"));
        m_state.emplace(strongbox::test_utils::clientNamed("bob"),
                        strongbox::test_utils::sampleClient(*m_crypto, "bob", "b-secret"));
    }
};

} // namespace

TEST_F(SnapshotCodecTest, BodyDecodesToTheSameState)
{
    const auto body{ strongbox::snapshot::encodeState(m_state) };
    EXPECT_EQ(strongbox::snapshot::decodeState(body), m_state);
    EXPECT_EQ(strongbox::snapshot::encodeState(m_state), body);
}

TEST_F(SnapshotCodecTest, EmptyStateEncodesToMagicAndCount)
{
    const auto body{ strongbox::snapshot::encodeState({}) };
    EXPECT_EQ(body.size(), strongbox::snapshot::g_kSnapshotStateMagic.size() + 4U);
    EXPECT_TRUE(strongbox::snapshot::decodeState(body).empty());
}

TEST_F(SnapshotCodecTest, DecodeRejectsMalformedBodies)
{
    auto body{ strongbox::snapshot::encodeState(m_state) };

    auto truncated{ body };
    truncated.pop_back();
    EXPECT_THROW((void)strongbox::snapshot::decodeState(truncated), std::runtime_error);

    auto trailing{ body };
    trailing.push_back(0U);
    EXPECT_THROW((void)strongbox::snapshot::decodeState(trailing), std::runtime_error);

    body[0] ^= 0xFFU;
    EXPECT_THROW((void)strongbox::snapshot::decodeState(body), std::runtime_error);
}

TEST_F(SnapshotCodecTest, SealedImageOpensUnderTheSameKey)
{
    const auto image{ strongbox::snapshot::sealSnapshot(*m_crypto, m_key, m_state) };
    EXPECT_EQ(image.size(),
              strongbox::snapshot::g_snapshotEnvelopeBytes + strongbox::snapshot::encodeState(m_state).size());

    const auto opened{ strongbox::snapshot::openSnapshot(*m_crypto, m_key, image) };
    EXPECT_EQ(opened, m_state);

    const auto alice{ strongbox::test_utils::clientNamed("alice") };
    EXPECT_EQ(strongbox::test_utils::readSampleSecret(*m_crypto, alice, opened.at(alice)), "a-secret");
}

TEST_F(SnapshotCodecTest, WrongKeyOrTamperingFailsToOpen)
{
    auto image{ strongbox::snapshot::sealSnapshot(*m_crypto, m_key, m_state) };

    EXPECT_THROW((void)strongbox::snapshot::openSnapshot(*m_crypto, strongbox::test_utils::filledKey(0x43U), image),
                 std::runtime_error);

    image.back() ^= 0x01U;
    EXPECT_THROW((void)strongbox::snapshot::openSnapshot(*m_crypto, m_key, image), std::runtime_error);
}

TEST_F(SnapshotCodecTest, ImageHeaderIsChecked)
{
    auto image{ strongbox::snapshot::sealSnapshot(*m_crypto, m_key, m_state) };

    const std::vector<std::uint8_t> tooShort(image.begin(), image.begin() + 10);
    EXPECT_THROW((void)strongbox::snapshot::openSnapshot(*m_crypto, m_key, tooShort), std::runtime_error);

    auto badVersion{ image };
    badVersion[strongbox::snapshot::g_kSnapshotFileMagic.size()] = 2U;
    EXPECT_THROW((void)strongbox::snapshot::openSnapshot(*m_crypto, m_key, badVersion), std::runtime_error);

    image[0] = 'X';
    EXPECT_THROW((void)strongbox::snapshot::openSnapshot(*m_crypto, m_key, image), std::runtime_error);
}

TEST_F(SnapshotCodecTest, WrongKeySizeIsInvalidArgument)
{
    const std::vector<std::uint8_t> shortKey(16U, 0U);
    EXPECT_THROW((void)strongbox::snapshot::sealSnapshot(*m_crypto, shortKey, m_state), std::invalid_argument);
    EXPECT_THROW((void)strongbox::snapshot::openSnapshot(*m_crypto, shortKey, {}), std::invalid_argument);
}

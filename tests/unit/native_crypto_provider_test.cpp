#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string_view>

#include "strongbox/crypto/providers/NativeProviderFactory.hpp"

namespace
{

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

std::array<std::uint8_t, strongbox::crypto::g_aeadKeyBytes> sequentialKey(std::uint8_t base)
{
    std::array<std::uint8_t, strongbox::crypto::g_aeadKeyBytes> key{};
    for (std::size_t i{}; i < key.size(); ++i)
    {
        key[i] = static_cast<std::uint8_t>(base + i);
    }
    return key;
}

class NativeCryptoProviderTest : public ::testing::Test
{
protected:
    std::unique_ptr<strongbox::crypto::ICryptoProvider> m_crypto{
        strongbox::crypto::providers::makeNativeCryptoProvider()
    };
};

} // namespace

TEST_F(NativeCryptoProviderTest, AeadRoundTrip)
{
    const auto key{ sequentialKey(0U) };
    const auto box = m_crypto->aeadEncrypt(key, asBytes("secret-data"), asBytes("header"));
    EXPECT_EQ(box.cipherText.size(), std::string_view{ "secret-data" }.size());

    const auto plain = m_crypto->aeadDecrypt(key, box, asBytes("header"));
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ((std::string_view{ reinterpret_cast<const char*>(plain->data()), plain->size() }), "secret-data");
}

TEST_F(NativeCryptoProviderTest, EmptyPlaintextStillAuthenticates)
{
    const auto key{ sequentialKey(7U) };
    const auto box = m_crypto->aeadEncrypt(key, {}, asBytes("check"));
    EXPECT_TRUE(box.cipherText.empty());
    EXPECT_TRUE(m_crypto->aeadDecrypt(key, box, asBytes("check")).has_value());
    EXPECT_FALSE(m_crypto->aeadDecrypt(sequentialKey(8U), box, asBytes("check")).has_value());
}

TEST_F(NativeCryptoProviderTest, TamperedTagOrAadFails)
{
    const auto key{ sequentialKey(0xA0U) };
    auto box = m_crypto->aeadEncrypt(key, asBytes("secret-data"), asBytes("header"));

    EXPECT_FALSE(m_crypto->aeadDecrypt(key, box, asBytes("other")).has_value());
    box.tag[0] ^= 0x01U;
    EXPECT_FALSE(m_crypto->aeadDecrypt(key, box, asBytes("header")).has_value());
}

TEST_F(NativeCryptoProviderTest, FreshNoncePerEncryption)
{
    const auto key{ sequentialKey(1U) };
    const auto a = m_crypto->aeadEncrypt(key, asBytes("same"), {});
    const auto b = m_crypto->aeadEncrypt(key, asBytes("same"), {});
    EXPECT_NE(a.nonce, b.nonce);
    EXPECT_NE(a, b);
}

TEST_F(NativeCryptoProviderTest, RejectsWrongKeySize)
{
    const std::array<std::uint8_t, strongbox::crypto::g_aeadKeyBytes - 1U> key{};
    EXPECT_THROW((void)m_crypto->aeadEncrypt(key, asBytes("x"), {}), std::invalid_argument);
    EXPECT_THROW((void)m_crypto->aeadDecrypt(key, strongbox::crypto::AeadBox{}, {}), std::invalid_argument);
}

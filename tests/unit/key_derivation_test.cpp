#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string_view>

#include "strongbox/crypto/KeyDerivation.hpp"
#include "strongbox/security/SecureEquals.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{

using Salt = std::array<std::byte, strongbox::crypto::g_argon2SaltBytes>;

constexpr std::string_view g_kPassword{ "correct horse battery staple" };

std::span<const std::byte> asBytes(std::string_view s)
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

Salt saltWith(std::byte first)
{
    Salt salt{};
    salt[0] = first;
    return salt;
}

} // namespace

TEST(KeyDerivation, RejectsEmptyPassword)
{
    const Salt salt{};
    EXPECT_THROW((void)strongbox::crypto::deriveKeyArgon2id(std::span<const std::byte>{}, salt,
                                                            strongbox::test_utils::fastArgon2idParams()),
                 std::invalid_argument);
}

TEST(KeyDerivation, RejectsWrongSaltSize)
{
    const std::array<std::byte, strongbox::crypto::g_argon2SaltBytes - 1U> salt{};
    EXPECT_THROW((void)strongbox::crypto::deriveKeyArgon2id(asBytes(g_kPassword), salt,
                                                            strongbox::test_utils::fastArgon2idParams()),
                 std::invalid_argument);
}

TEST(KeyDerivation, RejectsParametersOutsideTheSafeRange)
{
    const Salt salt{};
    const auto derive = [&](strongbox::crypto::Argon2idParams params)
    { return strongbox::crypto::deriveKeyArgon2id(asBytes(g_kPassword), salt, params); };

    EXPECT_THROW((void)derive({ .iterations = 0U, .memoryKiB = 8U }), std::invalid_argument);
    EXPECT_THROW((void)derive({ .iterations = 1U, .memoryKiB = 7U }), std::invalid_argument);
    EXPECT_THROW((void)derive({ .iterations = 11U, .memoryKiB = 8U }), std::invalid_argument);
    EXPECT_THROW((void)derive({ .iterations = 1U, .memoryKiB = 1024U * 1024U + 1U }), std::invalid_argument);
}

TEST(KeyDerivation, IsDeterministicAndSaltSensitive)
{
    const auto params{ strongbox::test_utils::fastArgon2idParams() };
    const auto a = strongbox::crypto::deriveKeyArgon2id(asBytes(g_kPassword), saltWith(std::byte{ 1 }), params);
    const auto b = strongbox::crypto::deriveKeyArgon2id(asBytes(g_kPassword), saltWith(std::byte{ 1 }), params);
    const auto c = strongbox::crypto::deriveKeyArgon2id(asBytes(g_kPassword), saltWith(std::byte{ 2 }), params);

    ASSERT_EQ(a.size(), strongbox::crypto::g_kDerivedKeyBytes);
    EXPECT_TRUE(strongbox::security::secureEquals(a, b));
    EXPECT_FALSE(strongbox::security::secureEquals(a, c));
}

TEST(KeyDerivation, CostParametersChangeTheKey)
{
    const Salt salt{};
    const auto a = strongbox::crypto::deriveKeyArgon2id(asBytes(g_kPassword), salt, { .iterations = 1U, .memoryKiB = 16U });
    const auto b = strongbox::crypto::deriveKeyArgon2id(asBytes(g_kPassword), salt, { .iterations = 2U, .memoryKiB = 16U });
    EXPECT_FALSE(strongbox::security::secureEquals(a, b));
}

TEST(KeyDerivation, DefaultCostDerivesFullKey)
{
    if (!strongbox::test_utils::getEnv("SBX_RUN_SLOW_TESTS").has_value())
    {
        GTEST_SKIP() << "Set SBX_RUN_SLOW_TESTS=1 to run slow KDF tests.";
    }

    const auto key = strongbox::crypto::deriveKeyArgon2id(asBytes(g_kPassword), saltWith(std::byte{ 0x30 }),
                                                          { .iterations = 3U, .memoryKiB = 64U * 1024U });
    EXPECT_EQ(key.size(), strongbox::crypto::g_kDerivedKeyBytes);
}

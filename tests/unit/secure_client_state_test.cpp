#include <gtest/gtest.h>

#include <memory>
#include <span>
#include <string_view>
#include <variant>

#include "strongbox/core/SecureClientState.hpp"
#include "strongbox/crypto/providers/NativeProviderFactory.hpp"
#include "strongbox/security/SecureString.hpp"

using strongbox::core::bytesFrom;
using strongbox::core::StateError;

namespace
{

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

class SecureClientStateTest : public ::testing::Test
{
protected:
    std::unique_ptr<strongbox::crypto::ICryptoProvider> m_crypto{
        strongbox::crypto::providers::makeNativeCryptoProvider()
    };
    strongbox::core::ClientId m_clientId{ strongbox::core::deriveClientId(bytesFrom("alice")) };
    strongbox::core::SecureClientState m_state{ *m_crypto, m_clientId };
    strongbox::core::VaultId m_vault{ strongbox::core::deriveVaultId(bytesFrom("passwords")) };
};

} // namespace

TEST_F(SecureClientStateTest, GetOrCreateKeyIsStable)
{
    const auto first{ m_state.getOrCreateKey(m_vault) };
    const auto second{ m_state.getOrCreateKey(m_vault) };
    ASSERT_FALSE(strongbox::core::isError(first));
    ASSERT_FALSE(strongbox::core::isError(second));
    EXPECT_EQ(std::get<strongbox::core::VaultKey>(first), std::get<strongbox::core::VaultKey>(second));
    EXPECT_TRUE(m_state.vaultExists(m_vault));
}

TEST_F(SecureClientStateTest, GetKeyForUnknownVaultIsNotExisting)
{
    const auto key{ m_state.getKey(m_vault) };
    ASSERT_TRUE(strongbox::core::isError(key));
    EXPECT_EQ(std::get<StateError>(key), StateError::NotExisting);

    ASSERT_FALSE(strongbox::core::isError(m_state.getOrCreateKey(m_vault)));
    EXPECT_FALSE(strongbox::core::isError(m_state.getKey(m_vault)));
    EXPECT_FALSE(strongbox::core::isError(m_state.getKey(m_vault)));
}

TEST_F(SecureClientStateTest, AddNewVaultIsIdempotentAndClearCacheForgetsMembership)
{
    m_state.addNewVault(m_vault);
    m_state.addNewVault(m_vault);
    EXPECT_EQ(m_state.vaults().size(), 1U);

    m_state.clearCache();
    EXPECT_FALSE(m_state.vaultExists(m_vault));
}

TEST_F(SecureClientStateTest, WriteAndReadSecretByCounter)
{
    const auto location{ strongbox::core::counterLocation("passwords", 0U) };
    ASSERT_FALSE(strongbox::core::isError(m_state.writeSecret(location, asBytes("s3cret"))));

    const auto read{ m_state.readSecret(location) };
    ASSERT_FALSE(strongbox::core::isError(read));
    EXPECT_EQ(strongbox::security::asStringView(std::get<strongbox::security::SecureBuffer>(read)), "s3cret");

    const auto ids{ m_state.listRecordIds(m_vault) };
    ASSERT_EQ(ids.size(), 1U);
    EXPECT_EQ(m_state.getIndexFromRecordId(bytesFrom("passwords"), ids.front(), 8U), 0U);
}

TEST_F(SecureClientStateTest, SecretsInDifferentVaultsAreIndependent)
{
    const auto a{ strongbox::core::genericLocation("vault-a", "record") };
    const auto b{ strongbox::core::genericLocation("vault-b", "record") };
    ASSERT_FALSE(strongbox::core::isError(m_state.writeSecret(a, asBytes("alpha"))));
    ASSERT_FALSE(strongbox::core::isError(m_state.writeSecret(b, asBytes("beta"))));

    const auto readA{ m_state.readSecret(a) };
    ASSERT_FALSE(strongbox::core::isError(readA));
    EXPECT_EQ(strongbox::security::asStringView(std::get<strongbox::security::SecureBuffer>(readA)), "alpha");
    EXPECT_EQ(m_state.vaults().size(), 2U);
}

TEST_F(SecureClientStateTest, ReadOrRevokeOutsideMembershipIsNotExisting)
{
    const auto location{ strongbox::core::genericLocation("passwords", "mail") };
    const auto read{ m_state.readSecret(location) };
    ASSERT_TRUE(strongbox::core::isError(read));
    EXPECT_EQ(std::get<StateError>(read), StateError::NotExisting);

    ASSERT_FALSE(strongbox::core::isError(m_state.writeSecret(location, asBytes("x"))));
    m_state.clearCache();
    const auto revoke{ m_state.revokeSecret(location) };
    ASSERT_TRUE(strongbox::core::isError(revoke));
    EXPECT_EQ(std::get<StateError>(revoke), StateError::NotExisting);
}

TEST_F(SecureClientStateTest, RevokeSecretRemovesRecord)
{
    const auto location{ strongbox::core::genericLocation("passwords", "mail") };
    ASSERT_FALSE(strongbox::core::isError(m_state.writeSecret(location, asBytes("x"))));
    ASSERT_FALSE(strongbox::core::isError(m_state.revokeSecret(location)));

    const auto read{ m_state.readSecret(location) };
    ASSERT_TRUE(strongbox::core::isError(read));
    EXPECT_EQ(std::get<StateError>(read), StateError::NotExisting);
}

TEST_F(SecureClientStateTest, StoreReturnsPreviousValue)
{
    EXPECT_FALSE(m_state.writeToStore(bytesFrom("k"), bytesFrom("v1")).has_value());
    EXPECT_EQ(m_state.writeToStore(bytesFrom("k"), bytesFrom("v2")), bytesFrom("v1"));
    EXPECT_EQ(m_state.readFromStore(bytesFrom("k")), bytesFrom("v2"));
    EXPECT_TRUE(m_state.storeKeyExists(bytesFrom("k")));

    m_state.deleteFromStore(bytesFrom("k"));
    EXPECT_FALSE(m_state.storeKeyExists(bytesFrom("k")));
}

TEST_F(SecureClientStateTest, ReloadDataReplacesEverything)
{
    ASSERT_FALSE(strongbox::core::isError(
        m_state.writeSecret(strongbox::core::counterLocation("passwords", 1U), asBytes("kept"))));
    (void)m_state.writeToStore(bytesFrom("note"), bytesFrom("hello"));
    const auto snapshot{ m_state.exportSnapshot() };

    strongbox::core::SecureClientState fresh{ *m_crypto, strongbox::core::deriveClientId(bytesFrom("tmp")) };
    ASSERT_FALSE(strongbox::core::isError(
        fresh.writeSecret(strongbox::core::genericLocation("junk", "r"), asBytes("gone"))));

    ASSERT_FALSE(strongbox::core::isError(fresh.reloadData(m_clientId, snapshot)));
    EXPECT_EQ(fresh.clientId(), m_clientId);
    EXPECT_EQ(fresh.vaults(), std::set{ m_vault });
    EXPECT_EQ(fresh.readFromStore(bytesFrom("note")), bytesFrom("hello"));
    EXPECT_EQ(fresh.exportSnapshot(), snapshot);

    const auto read{ fresh.readSecret(strongbox::core::counterLocation("passwords", 1U)) };
    ASSERT_FALSE(strongbox::core::isError(read));
    EXPECT_EQ(strongbox::security::asStringView(std::get<strongbox::security::SecureBuffer>(read)), "kept");
}

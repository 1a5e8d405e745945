#ifndef INCLUDE_STRONGBOX_CORE_SECURECLIENTSTATE_HPP
#define INCLUDE_STRONGBOX_CORE_SECURECLIENTSTATE_HPP

#include "strongbox/core/AddressDerivation.hpp"
#include "strongbox/core/ClientSnapshot.hpp"
#include "strongbox/core/IClientStateOwner.hpp"
#include "strongbox/core/Ids.hpp"
#include "strongbox/core/KeyStore.hpp"
#include "strongbox/core/Location.hpp"
#include "strongbox/core/StateError.hpp"
#include "strongbox/crypto/ICryptoProvider.hpp"
#include "strongbox/security/SecureBuffer.hpp"
#include "strongbox/store/EphemeralStore.hpp"
#include "strongbox/vault/DbView.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace strongbox::core
{

// Per-client aggregate: vault keys, encrypted records, vault membership and the ephemeral cache.
// Not thread safe; one owner drives it.
class SecureClientState final : public IClientStateOwner
{
public:
    SecureClientState(strongbox::crypto::ICryptoProvider& crypto, ClientId clientId);

    // Keys

    // Creates the key and an empty vault on first use.
    [[nodiscard]] StateResult<VaultKey> getOrCreateKey(const VaultId& vaultId);

    [[nodiscard]] StateResult<VaultKey> getKey(const VaultId& vaultId);

    // Membership

    void addNewVault(const VaultId& vaultId);
    [[nodiscard]] bool vaultExists(const VaultId& vaultId) const noexcept;
    void clearCache() noexcept;
    void rebuildCache(ClientId clientId, std::set<VaultId> vaults, strongbox::store::EphemeralStore store);

    [[nodiscard]] const std::set<VaultId>& vaults() const noexcept
    {
        return m_vaults;
    }

    // Store

    std::optional<Bytes> writeToStore(Bytes key, Bytes value,
                                      std::optional<std::chrono::milliseconds> lifetime = std::nullopt);
    [[nodiscard]] std::optional<Bytes> readFromStore(const Bytes& key) const;
    void deleteFromStore(const Bytes& key);
    [[nodiscard]] bool storeKeyExists(const Bytes& key) const;

    [[nodiscard]] const strongbox::store::EphemeralStore& store() const noexcept
    {
        return m_store;
    }

    // Addressing

    [[nodiscard]] std::uint64_t getIndexFromRecordId(std::span<const std::uint8_t> vaultPath,
                                                     const RecordId& recordId,
                                                     std::uint64_t cap = g_kIndexScanCap) const;

    [[nodiscard]] static std::pair<VaultId, RecordId> resolveLocation(const Location& location);

    // Secrets

    [[nodiscard]] StateResult<std::monostate> writeSecret(const Location& location, std::span<const std::byte> secret);
    [[nodiscard]] StateResult<strongbox::security::SecureBuffer> readSecret(const Location& location);
    [[nodiscard]] StateResult<std::monostate> revokeSecret(const Location& location);
    [[nodiscard]] std::vector<RecordId> listRecordIds(const VaultId& vaultId) const;

    // Snapshot

    [[nodiscard]] ClientSnapshot exportSnapshot() const;

    // Replaces keys, records and cache; membership becomes the set of vaults with a key.
    [[nodiscard]] StateResult<std::monostate> reloadData(const ClientId& clientId, ClientSnapshot data) override;

    [[nodiscard]] const ClientId& clientId() const noexcept
    {
        return m_clientId;
    }
    [[nodiscard]] std::string clientIdString() const
    {
        return m_clientId.toString();
    }

private:
    // Key for an existing member vault; NotExisting otherwise.
    [[nodiscard]] StateResult<VaultKey> memberKey(const VaultId& vaultId);

    strongbox::crypto::ICryptoProvider* m_crypto{ nullptr };
    ClientId m_clientId;
    KeyStore m_keystore;
    strongbox::vault::DbView m_db;
    std::set<VaultId> m_vaults;
    strongbox::store::EphemeralStore m_store;
};

} // namespace strongbox::core

#endif // INCLUDE_STRONGBOX_CORE_SECURECLIENTSTATE_HPP

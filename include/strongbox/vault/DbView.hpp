#ifndef INCLUDE_STRONGBOX_VAULT_DBVIEW_HPP
#define INCLUDE_STRONGBOX_VAULT_DBVIEW_HPP

#include "strongbox/core/Ids.hpp"
#include "strongbox/core/StateError.hpp"
#include "strongbox/crypto/ICryptoProvider.hpp"
#include "strongbox/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <variant>
#include <vector>

namespace strongbox::vault
{

using strongbox::core::RecordId;
using strongbox::core::StateError;
using strongbox::core::StateResult;
using strongbox::core::VaultId;

struct EncryptedVault final
{
    // Empty plaintext sealed under the vault key; opening it proves the key is the vault's.
    strongbox::crypto::AeadBox keyCheck;
    std::map<RecordId, strongbox::crypto::AeadBox> records;

    friend bool operator==(const EncryptedVault&, const EncryptedVault&) = default;
};

// Encrypted vault/record view. Holds ciphertext only; every operation takes the vault key.
// Record boxes are bound to (vault id, record id) through associated data.
class DbView final
{
public:
    // Creates an empty vault. Re-initializing an existing vault with its own key is a no-op.
    [[nodiscard]] StateResult<std::monostate> initVault(strongbox::crypto::ICryptoProvider& crypto,
                                                        std::span<const std::uint8_t> key, const VaultId& vaultId);

    // Upsert.
    [[nodiscard]] StateResult<std::monostate> writeRecord(strongbox::crypto::ICryptoProvider& crypto,
                                                          std::span<const std::uint8_t> key, const VaultId& vaultId,
                                                          const RecordId& recordId, std::span<const std::byte> data);

    [[nodiscard]] StateResult<strongbox::security::SecureBuffer>
    readRecord(strongbox::crypto::ICryptoProvider& crypto, std::span<const std::uint8_t> key, const VaultId& vaultId,
               const RecordId& recordId) const;

    [[nodiscard]] StateResult<std::monostate> revokeRecord(strongbox::crypto::ICryptoProvider& crypto,
                                                           std::span<const std::uint8_t> key, const VaultId& vaultId,
                                                           const RecordId& recordId);

    [[nodiscard]] bool vaultExists(const VaultId& vaultId) const noexcept;
    [[nodiscard]] bool containsRecord(const VaultId& vaultId, const RecordId& recordId) const noexcept;
    [[nodiscard]] std::vector<RecordId> listRecordIds(const VaultId& vaultId) const;
    [[nodiscard]] std::vector<VaultId> vaultIds() const;

    [[nodiscard]] const std::map<VaultId, EncryptedVault>& vaults() const noexcept
    {
        return m_vaults;
    }

    // Snapshot decode.
    void restoreVault(const VaultId& vaultId, EncryptedVault vault);

    void clear() noexcept
    {
        m_vaults.clear();
    }

    friend bool operator==(const DbView&, const DbView&) = default;

private:
    [[nodiscard]] StateResult<const EncryptedVault*> openVault(strongbox::crypto::ICryptoProvider& crypto,
                                                               std::span<const std::uint8_t> key,
                                                               const VaultId& vaultId) const;

    std::map<VaultId, EncryptedVault> m_vaults;
};

} // namespace strongbox::vault

#endif // INCLUDE_STRONGBOX_VAULT_DBVIEW_HPP

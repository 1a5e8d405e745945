#ifndef INCLUDE_STRONGBOX_CORE_KEYSTORE_HPP
#define INCLUDE_STRONGBOX_CORE_KEYSTORE_HPP

#include "strongbox/core/Ids.hpp"
#include "strongbox/core/StateError.hpp"
#include "strongbox/crypto/ICryptoProvider.hpp"
#include "strongbox/security/SecureBuffer.hpp"
#include <cstddef>
#include <map>
#include <optional>

namespace strongbox::core
{

constexpr std::size_t g_vaultKeyBytes{ strongbox::crypto::g_aeadKeyBytes };

using VaultKey = strongbox::security::SecureBuffer;
using KeyMap = std::map<VaultId, VaultKey>;

// One symmetric key per vault. Lookups require the vault id; the only bulk access is the
// snapshot export/rebuild pair.
class KeyStore final
{
public:
    explicit KeyStore(strongbox::crypto::ICryptoProvider& crypto) noexcept;

    // Generates and stores a fresh key. Replaces an existing key, which orphans that vault's
    // ciphertext: callers check vaultExists() first.
    [[nodiscard]] StateResult<VaultKey> createKey(const VaultId& vaultId);

    [[nodiscard]] std::optional<VaultKey> getKey(const VaultId& vaultId) const;

    // Upsert, last write wins.
    void insertKey(const VaultId& vaultId, VaultKey key);

    [[nodiscard]] bool vaultExists(const VaultId& vaultId) const noexcept;

    bool removeKey(const VaultId& vaultId) noexcept;

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_keys.size();
    }

    [[nodiscard]] KeyMap exportKeys() const;

    void rebuild(KeyMap keys) noexcept;

private:
    strongbox::crypto::ICryptoProvider* m_crypto{ nullptr };
    KeyMap m_keys;
};

} // namespace strongbox::core

#endif // INCLUDE_STRONGBOX_CORE_KEYSTORE_HPP

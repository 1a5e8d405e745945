#include "strongbox/core/KeyStore.hpp"
#include "strongbox/log/Registry.hpp"

namespace strongbox::core
{

KeyStore::KeyStore(strongbox::crypto::ICryptoProvider& crypto) noexcept : m_crypto(&crypto)
{
}

[[nodiscard]] StateResult<VaultKey> KeyStore::createKey(const VaultId& vaultId)
{
    VaultKey key{};
    key.resize(g_vaultKeyBytes);
    if (!m_crypto->randomBytes(std::span<std::uint8_t>{ key }))
    {
        strongbox::security::secureRelease(key);
        strongbox::log::Registry::crypto()->error("key generation failed for vault {}", vaultId.shortString());
        return StateError::RandomFailed;
    }

    insertKey(vaultId, key);
    return key;
}

[[nodiscard]] std::optional<VaultKey> KeyStore::getKey(const VaultId& vaultId) const
{
    const auto it{ m_keys.find(vaultId) };
    if (it == m_keys.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void KeyStore::insertKey(const VaultId& vaultId, VaultKey key)
{
    auto [it, inserted]{ m_keys.try_emplace(vaultId) };
    if (!inserted)
    {
        strongbox::security::secureRelease(it->second);
    }
    it->second = std::move(key);
}

[[nodiscard]] bool KeyStore::vaultExists(const VaultId& vaultId) const noexcept
{
    return m_keys.contains(vaultId);
}

bool KeyStore::removeKey(const VaultId& vaultId) noexcept
{
    const auto it{ m_keys.find(vaultId) };
    if (it == m_keys.end())
    {
        return false;
    }
    strongbox::security::secureRelease(it->second);
    m_keys.erase(it);
    return true;
}

[[nodiscard]] KeyMap KeyStore::exportKeys() const
{
    return m_keys;
}

void KeyStore::rebuild(KeyMap keys) noexcept
{
    for (auto& [id, key] : m_keys)
    {
        strongbox::security::secureRelease(key);
    }
    m_keys = std::move(keys);
}

} // namespace strongbox::core

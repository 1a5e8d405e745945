#include "strongbox/core/SecureClientState.hpp"
#include "strongbox/log/Registry.hpp"

namespace strongbox::core
{

SecureClientState::SecureClientState(strongbox::crypto::ICryptoProvider& crypto, ClientId clientId)
    : m_crypto(&crypto), m_clientId(clientId), m_keystore(crypto)
{
}

[[nodiscard]] StateResult<VaultKey> SecureClientState::getOrCreateKey(const VaultId& vaultId)
{
    if (m_keystore.vaultExists(vaultId))
    {
        auto key{ m_keystore.getKey(vaultId) };
        if (!key)
        {
            strongbox::log::Registry::client()->error("key store lists vault {} but has no key for it",
                                                      vaultId.shortString());
            return StateError::InternalInvariantViolation;
        }
        return std::move(*key);
    }

    auto created{ m_keystore.createKey(vaultId) };
    if (std::holds_alternative<StateError>(created))
    {
        return std::get<StateError>(created);
    }
    auto& key{ std::get<VaultKey>(created) };

    const auto init{ m_db.initVault(*m_crypto, key, vaultId) };
    if (std::holds_alternative<StateError>(init))
    {
        (void)m_keystore.removeKey(vaultId);
        return std::get<StateError>(init);
    }

    addNewVault(vaultId);
    strongbox::log::Registry::client()->debug("client {} created vault {}", m_clientId.shortString(),
                                              vaultId.shortString());
    return std::move(key);
}

[[nodiscard]] StateResult<VaultKey> SecureClientState::getKey(const VaultId& vaultId)
{
    auto key{ m_keystore.getKey(vaultId) };
    if (!key)
    {
        return StateError::NotExisting;
    }
    // Reinsert so the store keeps the key that was just handed out.
    m_keystore.insertKey(vaultId, *key);
    return std::move(*key);
}

void SecureClientState::addNewVault(const VaultId& vaultId)
{
    m_vaults.insert(vaultId);
}

[[nodiscard]] bool SecureClientState::vaultExists(const VaultId& vaultId) const noexcept
{
    return m_vaults.contains(vaultId);
}

void SecureClientState::clearCache() noexcept
{
    m_vaults.clear();
}

void SecureClientState::rebuildCache(ClientId clientId, std::set<VaultId> vaults,
                                     strongbox::store::EphemeralStore store)
{
    m_clientId = clientId;
    m_vaults = std::move(vaults);
    m_store = std::move(store);
}

std::optional<Bytes> SecureClientState::writeToStore(Bytes key, Bytes value,
                                                     std::optional<std::chrono::milliseconds> lifetime)
{
    return m_store.insert(std::move(key), std::move(value), lifetime);
}

[[nodiscard]] std::optional<Bytes> SecureClientState::readFromStore(const Bytes& key) const
{
    return m_store.get(key);
}

void SecureClientState::deleteFromStore(const Bytes& key)
{
    (void)m_store.remove(key);
}

[[nodiscard]] bool SecureClientState::storeKeyExists(const Bytes& key) const
{
    return m_store.containsKey(key);
}

[[nodiscard]] std::uint64_t SecureClientState::getIndexFromRecordId(std::span<const std::uint8_t> vaultPath,
                                                                    const RecordId& recordId,
                                                                    std::uint64_t cap) const
{
    return indexOf(vaultPath, recordId, cap);
}

[[nodiscard]] std::pair<VaultId, RecordId> SecureClientState::resolveLocation(const Location& location)
{
    return strongbox::core::resolveLocation(location);
}

[[nodiscard]] StateResult<VaultKey> SecureClientState::memberKey(const VaultId& vaultId)
{
    if (!vaultExists(vaultId))
    {
        return StateError::NotExisting;
    }
    return getKey(vaultId);
}

[[nodiscard]] StateResult<std::monostate> SecureClientState::writeSecret(const Location& location,
                                                                         std::span<const std::byte> secret)
{
    const auto [vaultId, recordId]{ resolveLocation(location) };

    auto key{ getOrCreateKey(vaultId) };
    if (std::holds_alternative<StateError>(key))
    {
        return std::get<StateError>(key);
    }
    auto& vaultKey{ std::get<VaultKey>(key) };
    addNewVault(vaultId);

    auto result{ m_db.writeRecord(*m_crypto, vaultKey, vaultId, recordId, secret) };
    strongbox::security::secureRelease(vaultKey);
    return result;
}

[[nodiscard]] StateResult<strongbox::security::SecureBuffer> SecureClientState::readSecret(const Location& location)
{
    const auto [vaultId, recordId]{ resolveLocation(location) };

    auto key{ memberKey(vaultId) };
    if (std::holds_alternative<StateError>(key))
    {
        return std::get<StateError>(key);
    }
    auto& vaultKey{ std::get<VaultKey>(key) };

    auto result{ m_db.readRecord(*m_crypto, vaultKey, vaultId, recordId) };
    strongbox::security::secureRelease(vaultKey);
    return result;
}

[[nodiscard]] StateResult<std::monostate> SecureClientState::revokeSecret(const Location& location)
{
    const auto [vaultId, recordId]{ resolveLocation(location) };

    auto key{ memberKey(vaultId) };
    if (std::holds_alternative<StateError>(key))
    {
        return std::get<StateError>(key);
    }
    auto& vaultKey{ std::get<VaultKey>(key) };

    auto result{ m_db.revokeRecord(*m_crypto, vaultKey, vaultId, recordId) };
    strongbox::security::secureRelease(vaultKey);
    return result;
}

[[nodiscard]] std::vector<RecordId> SecureClientState::listRecordIds(const VaultId& vaultId) const
{
    if (!vaultExists(vaultId))
    {
        return {};
    }
    return m_db.listRecordIds(vaultId);
}

[[nodiscard]] ClientSnapshot SecureClientState::exportSnapshot() const
{
    return ClientSnapshot{ m_keystore.exportKeys(), m_db, m_store };
}

[[nodiscard]] StateResult<std::monostate> SecureClientState::reloadData(const ClientId& clientId, ClientSnapshot data)
{
    std::set<VaultId> vaults{};
    for (const auto& [vaultId, key] : data.keys)
    {
        vaults.insert(vaultId);
    }

    m_keystore.rebuild(std::move(data.keys));
    m_db = std::move(data.db);
    rebuildCache(clientId, std::move(vaults), std::move(data.store));

    strongbox::log::Registry::client()->info("client {} reloaded with {} vault(s)", clientId.shortString(),
                                             m_vaults.size());
    return std::monostate{};
}

} // namespace strongbox::core

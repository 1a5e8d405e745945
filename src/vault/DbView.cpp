#include "strongbox/vault/DbView.hpp"
#include "strongbox/log/Registry.hpp"

#include <exception>
#include <string_view>

namespace strongbox::vault
{

namespace
{

constexpr std::string_view kKeyCheckDomain{ "SBXVLT1" };
constexpr std::string_view kRecordDomain{ "SBXREC1" };

std::vector<std::byte> keyCheckAad(const VaultId& vaultId)
{
    std::vector<std::byte> aad{};
    aad.reserve(kKeyCheckDomain.size() + strongbox::core::g_idBytes);
    for (const char c : kKeyCheckDomain)
    {
        aad.push_back(static_cast<std::byte>(c));
    }
    for (const auto b : vaultId.bytes())
    {
        aad.push_back(static_cast<std::byte>(b));
    }
    return aad;
}

std::vector<std::byte> recordAad(const VaultId& vaultId, const RecordId& recordId)
{
    std::vector<std::byte> aad{};
    aad.reserve(kRecordDomain.size() + 2U * strongbox::core::g_idBytes);
    for (const char c : kRecordDomain)
    {
        aad.push_back(static_cast<std::byte>(c));
    }
    for (const auto b : vaultId.bytes())
    {
        aad.push_back(static_cast<std::byte>(b));
    }
    for (const auto b : recordId.bytes())
    {
        aad.push_back(static_cast<std::byte>(b));
    }
    return aad;
}

} // namespace

StateResult<const EncryptedVault*> DbView::openVault(strongbox::crypto::ICryptoProvider& crypto,
                                                     std::span<const std::uint8_t> key, const VaultId& vaultId) const
{
    const auto it{ m_vaults.find(vaultId) };
    if (it == m_vaults.end())
    {
        return StateError::NotExisting;
    }

    try
    {
        auto opened{ crypto.aeadDecrypt(key, it->second.keyCheck, keyCheckAad(vaultId)) };
        if (!opened)
        {
            strongbox::log::Registry::client()->warn("key does not open vault {}", vaultId.shortString());
            return StateError::WrongVaultKey;
        }
    }
    catch (const std::exception& e)
    {
        strongbox::log::Registry::crypto()->error("vault key check failed: {}", e.what());
        return StateError::CryptoError;
    }
    return &it->second;
}

[[nodiscard]] StateResult<std::monostate> DbView::initVault(strongbox::crypto::ICryptoProvider& crypto,
                                                            std::span<const std::uint8_t> key, const VaultId& vaultId)
{
    if (m_vaults.contains(vaultId))
    {
        const auto existing{ openVault(crypto, key, vaultId) };
        if (std::holds_alternative<StateError>(existing))
        {
            return std::get<StateError>(existing);
        }
        return std::monostate{};
    }

    EncryptedVault vault{};
    try
    {
        vault.keyCheck = crypto.aeadEncrypt(key, {}, keyCheckAad(vaultId));
    }
    catch (const std::exception& e)
    {
        strongbox::log::Registry::crypto()->error("vault init failed: {}", e.what());
        return StateError::CryptoError;
    }

    m_vaults.emplace(vaultId, std::move(vault));
    return std::monostate{};
}

[[nodiscard]] StateResult<std::monostate> DbView::writeRecord(strongbox::crypto::ICryptoProvider& crypto,
                                                              std::span<const std::uint8_t> key, const VaultId& vaultId,
                                                              const RecordId& recordId, std::span<const std::byte> data)
{
    const auto opened{ openVault(crypto, key, vaultId) };
    if (std::holds_alternative<StateError>(opened))
    {
        return std::get<StateError>(opened);
    }

    strongbox::crypto::AeadBox box{};
    try
    {
        box = crypto.aeadEncrypt(key, data, recordAad(vaultId, recordId));
    }
    catch (const std::exception& e)
    {
        strongbox::log::Registry::crypto()->error("record encryption failed: {}", e.what());
        return StateError::CryptoError;
    }

    m_vaults.at(vaultId).records.insert_or_assign(recordId, std::move(box));
    return std::monostate{};
}

[[nodiscard]] StateResult<strongbox::security::SecureBuffer>
DbView::readRecord(strongbox::crypto::ICryptoProvider& crypto, std::span<const std::uint8_t> key,
                   const VaultId& vaultId, const RecordId& recordId) const
{
    const auto opened{ openVault(crypto, key, vaultId) };
    if (std::holds_alternative<StateError>(opened))
    {
        return std::get<StateError>(opened);
    }

    const auto& records{ std::get<const EncryptedVault*>(opened)->records };
    const auto it{ records.find(recordId) };
    if (it == records.end())
    {
        return StateError::NotExisting;
    }

    try
    {
        auto plain{ crypto.aeadDecrypt(key, it->second, recordAad(vaultId, recordId)) };
        if (!plain)
        {
            // The vault key opened the check box, so the record itself was tampered with.
            strongbox::log::Registry::crypto()->error("record {} failed authentication", recordId.shortString());
            return StateError::CryptoError;
        }
        return std::move(*plain);
    }
    catch (const std::exception& e)
    {
        strongbox::log::Registry::crypto()->error("record decryption failed: {}", e.what());
        return StateError::CryptoError;
    }
}

[[nodiscard]] StateResult<std::monostate> DbView::revokeRecord(strongbox::crypto::ICryptoProvider& crypto,
                                                               std::span<const std::uint8_t> key,
                                                               const VaultId& vaultId, const RecordId& recordId)
{
    const auto opened{ openVault(crypto, key, vaultId) };
    if (std::holds_alternative<StateError>(opened))
    {
        return std::get<StateError>(opened);
    }

    if (m_vaults.at(vaultId).records.erase(recordId) == 0U)
    {
        return StateError::NotExisting;
    }
    return std::monostate{};
}

[[nodiscard]] bool DbView::vaultExists(const VaultId& vaultId) const noexcept
{
    return m_vaults.contains(vaultId);
}

[[nodiscard]] bool DbView::containsRecord(const VaultId& vaultId, const RecordId& recordId) const noexcept
{
    const auto it{ m_vaults.find(vaultId) };
    return it != m_vaults.end() && it->second.records.contains(recordId);
}

[[nodiscard]] std::vector<RecordId> DbView::listRecordIds(const VaultId& vaultId) const
{
    std::vector<RecordId> out{};
    const auto it{ m_vaults.find(vaultId) };
    if (it == m_vaults.end())
    {
        return out;
    }
    out.reserve(it->second.records.size());
    for (const auto& [id, box] : it->second.records)
    {
        out.push_back(id);
    }
    return out;
}

[[nodiscard]] std::vector<VaultId> DbView::vaultIds() const
{
    std::vector<VaultId> out{};
    out.reserve(m_vaults.size());
    for (const auto& [id, vault] : m_vaults)
    {
        out.push_back(id);
    }
    return out;
}

void DbView::restoreVault(const VaultId& vaultId, EncryptedVault vault)
{
    m_vaults.insert_or_assign(vaultId, std::move(vault));
}

} // namespace strongbox::vault

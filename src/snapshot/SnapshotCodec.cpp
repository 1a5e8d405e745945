#include "strongbox/snapshot/SnapshotCodec.hpp"

#include "LittleEndian.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace strongbox::snapshot
{
namespace
{

using strongbox::core::ClientId;
using strongbox::core::ClientSnapshot;
using strongbox::core::RecordId;
using strongbox::core::VaultId;
using strongbox::snapshot::detail::ByteReader;
using strongbox::snapshot::detail::ByteWriter;
using strongbox::store::EphemeralStore;

void putMagic(ByteWriter& w, std::string_view magic)
{
    for (const char c : magic)
    {
        w.putU8(static_cast<std::uint8_t>(c));
    }
}

[[nodiscard]] bool magicMatches(std::span<const std::uint8_t> bytes, std::string_view magic) noexcept
{
    return bytes.size() == magic.size() &&
           std::equal(bytes.begin(), bytes.end(), magic.begin(),
                      [](std::uint8_t b, char c) { return b == static_cast<std::uint8_t>(c); });
}

template <class Id> void putId(ByteWriter& w, const Id& id)
{
    w.putRaw(id.asSpan());
}

template <class Id> [[nodiscard]] Id getId(ByteReader& r)
{
    const auto id{ Id::fromSpan(r.getRaw(strongbox::core::g_idBytes)) };
    if (!id)
    {
        throw std::runtime_error("snapshot id has the wrong width");
    }
    return *id;
}

void putBox(ByteWriter& w, const strongbox::crypto::AeadBox& box)
{
    w.putRaw(box.nonce);
    w.putRaw(box.tag);
    w.putBlob(box.cipherText);
}

[[nodiscard]] strongbox::crypto::AeadBox getBox(ByteReader& r)
{
    strongbox::crypto::AeadBox box{};
    const auto nonce{ r.getRaw(box.nonce.size()) };
    std::copy(nonce.begin(), nonce.end(), box.nonce.begin());
    const auto tag{ r.getRaw(box.tag.size()) };
    std::copy(tag.begin(), tag.end(), box.tag.begin());
    const auto ct{ r.getBlob() };
    box.cipherText.assign(ct.begin(), ct.end());
    return box;
}

void putClient(ByteWriter& w, const ClientSnapshot& client)
{
    w.putU32(ByteWriter::checkedCount(client.keys.size()));
    for (const auto& [vaultId, key] : client.keys)
    {
        putId(w, vaultId);
        w.putBlob(key);
    }

    const auto& vaults{ client.db.vaults() };
    w.putU32(ByteWriter::checkedCount(vaults.size()));
    for (const auto& [vaultId, vault] : vaults)
    {
        putId(w, vaultId);
        putBox(w, vault.keyCheck);
        w.putU32(ByteWriter::checkedCount(vault.records.size()));
        for (const auto& [recordId, box] : vault.records)
        {
            putId(w, recordId);
            putBox(w, box);
        }
    }

    const auto& entries{ client.store.entries() };
    w.putU32(ByteWriter::checkedCount(entries.size()));
    for (const auto& [key, entry] : entries)
    {
        w.putBlob(key);
        w.putBlob(entry.value);
        if (entry.expiresAt.has_value())
        {
            const auto ms{ std::chrono::duration_cast<std::chrono::milliseconds>(entry.expiresAt->time_since_epoch()) };
            w.putU8(1U);
            w.putU64(static_cast<std::uint64_t>(ms.count()));
        }
        else
        {
            w.putU8(0U);
            w.putU64(0U);
        }
    }
}

[[nodiscard]] ClientSnapshot getClient(ByteReader& r)
{
    ClientSnapshot client{};

    const std::uint32_t keyCount{ r.getU32() };
    for (std::uint32_t i{}; i < keyCount; ++i)
    {
        const auto vaultId{ getId<VaultId>(r) };
        const auto key{ r.getBlob() };
        if (key.size() != strongbox::core::g_vaultKeyBytes)
        {
            throw std::runtime_error("snapshot vault key has the wrong size");
        }
        if (!client.keys.emplace(vaultId, strongbox::security::secureBufferFrom(key)).second)
        {
            throw std::runtime_error("duplicate vault key in snapshot");
        }
    }

    const std::uint32_t vaultCount{ r.getU32() };
    for (std::uint32_t i{}; i < vaultCount; ++i)
    {
        const auto vaultId{ getId<VaultId>(r) };
        if (client.db.vaultExists(vaultId))
        {
            throw std::runtime_error("duplicate vault in snapshot");
        }

        strongbox::vault::EncryptedVault vault{};
        vault.keyCheck = getBox(r);
        const std::uint32_t recordCount{ r.getU32() };
        for (std::uint32_t j{}; j < recordCount; ++j)
        {
            const auto recordId{ getId<RecordId>(r) };
            if (!vault.records.emplace(recordId, getBox(r)).second)
            {
                throw std::runtime_error("duplicate record in snapshot");
            }
        }
        client.db.restoreVault(vaultId, std::move(vault));
    }

    const std::uint32_t entryCount{ r.getU32() };
    for (std::uint32_t i{}; i < entryCount; ++i)
    {
        const auto key{ r.getBlob() };
        const auto value{ r.getBlob() };
        const std::uint8_t hasExpiry{ r.getU8() };
        const std::uint64_t expiryMs{ r.getU64() };
        if (hasExpiry > 1U)
        {
            throw std::runtime_error("bad expiry flag in snapshot");
        }

        EphemeralStore::Entry entry{ strongbox::core::Bytes(value.begin(), value.end()), std::nullopt };
        if (hasExpiry == 1U)
        {
            entry.expiresAt = EphemeralStore::TimePoint{ std::chrono::duration_cast<EphemeralStore::Clock::duration>(
                std::chrono::milliseconds{ static_cast<std::int64_t>(expiryMs) }) };
        }
        strongbox::core::Bytes entryKey(key.begin(), key.end());
        if (client.store.entries().contains(entryKey))
        {
            throw std::runtime_error("duplicate store entry in snapshot");
        }
        client.store.restore(std::move(entryKey), std::move(entry));
    }

    return client;
}

[[nodiscard]] std::vector<std::byte> envelopeAad()
{
    strongbox::security::SecureBuffer header{};
    ByteWriter w{ header };
    putMagic(w, g_kSnapshotFileMagic);
    w.putU32(g_kSnapshotVersion);

    std::vector<std::byte> out{};
    out.reserve(header.size());
    for (const auto b : header)
    {
        out.push_back(static_cast<std::byte>(b));
    }
    return out;
}

} // namespace

[[nodiscard]] strongbox::security::SecureBuffer encodeState(const strongbox::core::SnapshotState& state)
{
    strongbox::security::SecureBuffer out{};
    ByteWriter w{ out };

    putMagic(w, g_kSnapshotStateMagic);
    w.putU32(ByteWriter::checkedCount(state.size()));
    for (const auto& [clientId, client] : state)
    {
        putId(w, clientId);
        putClient(w, client);
    }
    return out;
}

[[nodiscard]] strongbox::core::SnapshotState decodeState(std::span<const std::uint8_t> bytes)
{
    ByteReader r{ bytes };
    if (!magicMatches(r.getRaw(g_kSnapshotStateMagic.size()), g_kSnapshotStateMagic))
    {
        throw std::runtime_error("snapshot body has a bad magic");
    }

    strongbox::core::SnapshotState state{};
    const std::uint32_t clientCount{ r.getU32() };
    for (std::uint32_t i{}; i < clientCount; ++i)
    {
        const auto clientId{ getId<ClientId>(r) };
        auto client{ getClient(r) };
        if (!state.emplace(clientId, std::move(client)).second)
        {
            throw std::runtime_error("duplicate client in snapshot");
        }
    }

    if (r.remaining() != 0U)
    {
        throw std::runtime_error("trailing bytes after snapshot body");
    }
    return state;
}

[[nodiscard]] std::vector<std::uint8_t> sealSnapshot(strongbox::crypto::ICryptoProvider& crypto,
                                                     std::span<const std::uint8_t> key,
                                                     const strongbox::core::SnapshotState& state)
{
    if (key.size() != g_snapshotKeyBytes)
    {
        throw std::invalid_argument("sealSnapshot: invalid key size");
    }

    const auto plain{ encodeState(state) };
    const auto aad{ envelopeAad() };
    const auto box{ crypto.aeadEncrypt(key, strongbox::security::asBytes(plain), aad) };

    std::vector<std::uint8_t> image{};
    image.reserve(g_snapshotEnvelopeBytes + box.cipherText.size());
    for (const auto b : aad)
    {
        image.push_back(std::to_integer<std::uint8_t>(b));
    }
    image.insert(image.end(), box.nonce.begin(), box.nonce.end());
    image.insert(image.end(), box.tag.begin(), box.tag.end());
    image.insert(image.end(), box.cipherText.begin(), box.cipherText.end());
    return image;
}

[[nodiscard]] strongbox::core::SnapshotState openSnapshot(strongbox::crypto::ICryptoProvider& crypto,
                                                          std::span<const std::uint8_t> key,
                                                          std::span<const std::uint8_t> image)
{
    if (key.size() != g_snapshotKeyBytes)
    {
        throw std::invalid_argument("openSnapshot: invalid key size");
    }
    if (image.size() < g_snapshotEnvelopeBytes)
    {
        throw std::runtime_error("snapshot file is truncated");
    }

    ByteReader r{ image };
    if (!magicMatches(r.getRaw(g_kSnapshotFileMagic.size()), g_kSnapshotFileMagic))
    {
        throw std::runtime_error("not a snapshot file");
    }
    if (r.getU32() != g_kSnapshotVersion)
    {
        throw std::runtime_error("unsupported snapshot version");
    }

    strongbox::crypto::AeadBox box{};
    const auto nonce{ r.getRaw(box.nonce.size()) };
    std::copy(nonce.begin(), nonce.end(), box.nonce.begin());
    const auto tag{ r.getRaw(box.tag.size()) };
    std::copy(tag.begin(), tag.end(), box.tag.begin());
    const auto ct{ r.getRaw(r.remaining()) };
    box.cipherText.assign(ct.begin(), ct.end());

    auto plain{ crypto.aeadDecrypt(key, box, envelopeAad()) };
    if (!plain)
    {
        throw std::runtime_error("snapshot failed authentication");
    }

    auto state{ decodeState(strongbox::security::asSpan(*plain)) };
    strongbox::security::secureRelease(*plain);
    return state;
}

} // namespace strongbox::snapshot

#include "strongbox/core/AddressDerivation.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iterator>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <stdexcept>
#include <variant>

namespace strongbox::core
{
namespace
{

constexpr std::size_t g_kHmacSha512Bytes{ 64U };

using EvpMacPtr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using EvpMacCtxPtr = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

[[nodiscard]] EVP_MAC* hmac()
{
    static const EvpMacPtr mac{ EVP_MAC_fetch(nullptr, "HMAC", nullptr), &EVP_MAC_free };
    if (!mac)
    {
        throw std::runtime_error("deriveId: OpenSSL HMAC not available");
    }
    return mac.get();
}

[[nodiscard]] IdBytes deriveIdBytes(std::span<const std::uint8_t> data, std::span<const std::uint8_t> path)
{
    EvpMacCtxPtr ctx{ EVP_MAC_CTX_new(hmac()), &EVP_MAC_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("deriveId: EVP_MAC_CTX_new failed");
    }

    char digest[]{ "SHA512" };
    OSSL_PARAM params[]{
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0),
        OSSL_PARAM_construct_end(),
    };

    // A null key pointer means "keep the previous key" to OpenSSL; an empty key must still be set.
    static constexpr std::uint8_t kEmptyKey{ 0U };
    const std::uint8_t* keyPtr{ data.empty() ? &kEmptyKey : data.data() };
    if (EVP_MAC_init(ctx.get(), keyPtr, data.size(), params) != 1)
    {
        throw std::runtime_error("deriveId: EVP_MAC_init failed");
    }
    if (!path.empty() && EVP_MAC_update(ctx.get(), path.data(), path.size()) != 1)
    {
        throw std::runtime_error("deriveId: EVP_MAC_update failed");
    }

    std::array<std::uint8_t, g_kHmacSha512Bytes> full{};
    std::size_t written{ 0U };
    if (EVP_MAC_final(ctx.get(), full.data(), &written, full.size()) != 1 || written != full.size())
    {
        throw std::runtime_error("deriveId: EVP_MAC_final failed");
    }

    IdBytes out{};
    std::copy_n(full.begin(), out.size(), out.begin());
    return out;
}

[[nodiscard]] std::span<const std::uint8_t> asU8(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

[[nodiscard]] RecordId recordIdFromCounterPath(const std::string& path)
{
    return RecordId{ deriveIdBytes(asU8(path), asU8(path)) };
}

void appendCounterSuffix(std::string& path, std::uint64_t counter)
{
    if (counter == 0U)
    {
        path.append(g_kFirstRecordMarker);
        return;
    }
    fmt::format_to(std::back_inserter(path), "{}", counter);
}

} // namespace

[[nodiscard]] std::string counterPathPrefix(std::span<const std::uint8_t> vaultPath)
{
    return fmt::format("[{}]", fmt::join(vaultPath, ", "));
}

[[nodiscard]] VaultId deriveVaultId(std::span<const std::uint8_t> vaultPath)
{
    return VaultId{ deriveIdBytes(vaultPath, vaultPath) };
}

[[nodiscard]] ClientId deriveClientId(std::span<const std::uint8_t> clientPath)
{
    return ClientId{ deriveIdBytes(clientPath, clientPath) };
}

[[nodiscard]] RecordId deriveGenericRecordId(const VaultId& vaultId, std::span<const std::uint8_t> recordPath)
{
    return RecordId{ deriveIdBytes(vaultId.asSpan(), recordPath) };
}

[[nodiscard]] RecordId deriveRecordId(std::span<const std::uint8_t> vaultPath, std::uint64_t counter)
{
    std::string path{ counterPathPrefix(vaultPath) };
    appendCounterSuffix(path, counter);
    return recordIdFromCounterPath(path);
}

[[nodiscard]] std::pair<VaultId, RecordId> resolveLocation(const Location& location)
{
    if (const auto* generic{ std::get_if<GenericLocation>(&location) }; generic != nullptr)
    {
        const auto vaultId{ deriveVaultId(generic->vaultPath) };
        return { vaultId, deriveGenericRecordId(vaultId, generic->recordPath) };
    }

    const auto& counter{ std::get<CounterLocation>(location) };
    return { deriveVaultId(counter.vaultPath), deriveRecordId(counter.vaultPath, counter.counter) };
}

[[nodiscard]] std::uint64_t indexOf(std::span<const std::uint8_t> vaultPath, const RecordId& target,
                                    std::uint64_t cap)
{
    const std::string prefix{ counterPathPrefix(vaultPath) };
    std::string path{};
    path.reserve(prefix.size() + g_kFirstRecordMarker.size());

    for (std::uint64_t counter{ 0U }; counter < cap; ++counter)
    {
        path.assign(prefix);
        appendCounterSuffix(path, counter);
        if (recordIdFromCounterPath(path) == target)
        {
            return counter;
        }
    }
    return cap;
}

} // namespace strongbox::core

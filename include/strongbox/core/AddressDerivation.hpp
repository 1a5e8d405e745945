#ifndef INCLUDE_STRONGBOX_CORE_ADDRESSDERIVATION_HPP
#define INCLUDE_STRONGBOX_CORE_ADDRESSDERIVATION_HPP

#include "strongbox/core/Ids.hpp"
#include "strongbox/core/Location.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <utility>

namespace strongbox::core
{

// Upper bound for the counter scan in indexOf. Returned as-is when no counter below it matches.
constexpr std::uint64_t g_kIndexScanCap{ 32'000'000U };

// Marker used in place of a decimal suffix for counter 0.
constexpr std::string_view g_kFirstRecordMarker{ "first_record" };

// All ids are HMAC-SHA-512(key = data, message = path) truncated to g_idBytes.
// Derivation only throws if the OpenSSL HMAC implementation cannot be loaded.

[[nodiscard]] VaultId deriveVaultId(std::span<const std::uint8_t> vaultPath);

[[nodiscard]] ClientId deriveClientId(std::span<const std::uint8_t> clientPath);

[[nodiscard]] RecordId deriveGenericRecordId(const VaultId& vaultId, std::span<const std::uint8_t> recordPath);

// Record id for a counter-addressed record: derived from "<debug(vaultPath)><suffix>", where
// debug() renders the bytes as "[b0, b1, ...]" and the suffix is g_kFirstRecordMarker for counter 0
// and the decimal counter otherwise.
[[nodiscard]] RecordId deriveRecordId(std::span<const std::uint8_t> vaultPath, std::uint64_t counter);

[[nodiscard]] std::pair<VaultId, RecordId> resolveLocation(const Location& location);

// Recovers the counter that produced `target` by deriving ids for 0, 1, 2, ... in order.
// This is a linear scan over a one-way function; it stays tractable because vaults hold far fewer
// records than the cap. Returns `cap` when nothing below it matches.
[[nodiscard]] std::uint64_t indexOf(std::span<const std::uint8_t> vaultPath, const RecordId& target,
                                    std::uint64_t cap = g_kIndexScanCap);

[[nodiscard]] std::string counterPathPrefix(std::span<const std::uint8_t> vaultPath);

} // namespace strongbox::core

#endif // INCLUDE_STRONGBOX_CORE_ADDRESSDERIVATION_HPP

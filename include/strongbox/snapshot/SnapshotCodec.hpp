#ifndef INCLUDE_STRONGBOX_SNAPSHOT_SNAPSHOTCODEC_HPP
#define INCLUDE_STRONGBOX_SNAPSHOT_SNAPSHOTCODEC_HPP

#include "strongbox/core/ClientSnapshot.hpp"
#include "strongbox/crypto/ICryptoProvider.hpp"
#include "strongbox/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace strongbox::snapshot
{

constexpr std::string_view g_kSnapshotFileMagic{ "SBXSNAP1" };
constexpr std::string_view g_kSnapshotStateMagic{ "SBXSTAT1" };
constexpr std::uint32_t g_kSnapshotVersion{ 1U };
constexpr std::size_t g_snapshotKeyBytes{ strongbox::crypto::g_aeadKeyBytes };

// magic + version + nonce + tag
constexpr std::size_t g_snapshotEnvelopeBytes{ 8U + 4U + strongbox::crypto::g_aeadOverheadBytes };

// Plaintext body. Clients, vaults, records and store entries are written in key order, so equal
// states encode to equal bytes.
// Throws std::length_error if a count does not fit in a u32.
[[nodiscard]] strongbox::security::SecureBuffer encodeState(const strongbox::core::SnapshotState& state);

// Throws std::runtime_error on a bad magic, truncation, duplicates, bad key sizes or trailing bytes.
[[nodiscard]] strongbox::core::SnapshotState decodeState(std::span<const std::uint8_t> bytes);

// Encrypted file image: envelope header, then the AEAD ciphertext of encodeState().
// Throws std::invalid_argument on a wrong key size, std::runtime_error on a crypto backend failure.
[[nodiscard]] std::vector<std::uint8_t> sealSnapshot(strongbox::crypto::ICryptoProvider& crypto,
                                                     std::span<const std::uint8_t> key,
                                                     const strongbox::core::SnapshotState& state);

// Throws std::runtime_error when the image is malformed or does not authenticate under `key`,
// std::invalid_argument on a wrong key size.
[[nodiscard]] strongbox::core::SnapshotState openSnapshot(strongbox::crypto::ICryptoProvider& crypto,
                                                          std::span<const std::uint8_t> key,
                                                          std::span<const std::uint8_t> image);

} // namespace strongbox::snapshot

#endif // INCLUDE_STRONGBOX_SNAPSHOT_SNAPSHOTCODEC_HPP

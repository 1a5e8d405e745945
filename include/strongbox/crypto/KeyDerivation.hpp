#ifndef INCLUDE_STRONGBOX_CRYPTO_KEYDERIVATION_HPP
#define INCLUDE_STRONGBOX_CRYPTO_KEYDERIVATION_HPP

#include "strongbox/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace strongbox::crypto
{

constexpr std::size_t g_argon2SaltBytes{ 16 };
constexpr std::size_t g_kDerivedKeyBytes{ 32 };

struct Argon2idParams final
{
    std::uint32_t iterations;
    std::uint32_t memoryKiB;
};

// Argon2id (v1.3, one lane) through Monocypher. Throws std::invalid_argument on unsafe parameters.
[[nodiscard]] strongbox::security::SecureBuffer
deriveKeyArgon2id(std::span<const std::byte> password, std::span<const std::byte> salt, Argon2idParams params);

} // namespace strongbox::crypto

#endif // INCLUDE_STRONGBOX_CRYPTO_KEYDERIVATION_HPP

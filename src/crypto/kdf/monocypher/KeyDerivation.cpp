#include "strongbox/crypto/KeyDerivation.hpp"

#include "strongbox/security/ZeroAllocator.hpp"
#include "monocypher.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace strongbox::crypto
{
namespace
{

constexpr std::uint32_t g_kMinMemoryKiB{ 8U };
constexpr std::uint32_t g_kMaxMemoryKiB{ 1024U * 1024U };
constexpr std::uint32_t g_kMaxIterations{ 10U };

// One Argon2 block is 1 KiB of 64-bit words.
constexpr std::size_t g_kWordsPerBlock{ 1024U / sizeof(std::uint64_t) };

using WorkArea = std::vector<std::uint64_t, strongbox::security::ZeroAllocator<std::uint64_t>>;

void validateInputs(std::span<const std::byte> password, std::span<const std::byte> salt, Argon2idParams params)
{
    if (password.empty() || password.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("argon2id: password length out of range");
    }
    if (salt.size() != g_argon2SaltBytes)
    {
        throw std::invalid_argument("argon2id: salt must be " + std::to_string(g_argon2SaltBytes) + " bytes");
    }
    if (params.iterations < 1U || params.iterations > g_kMaxIterations)
    {
        throw std::invalid_argument("argon2id: iterations " + std::to_string(params.iterations) +
                                    " outside [1, " + std::to_string(g_kMaxIterations) + "]");
    }
    if (params.memoryKiB < g_kMinMemoryKiB || params.memoryKiB > g_kMaxMemoryKiB)
    {
        throw std::invalid_argument("argon2id: memory " + std::to_string(params.memoryKiB) + " KiB outside [" +
                                    std::to_string(g_kMinMemoryKiB) + ", " + std::to_string(g_kMaxMemoryKiB) + "]");
    }
}

} // namespace

[[nodiscard]] strongbox::security::SecureBuffer
deriveKeyArgon2id(std::span<const std::byte> password, std::span<const std::byte> salt, Argon2idParams params)
{
    validateInputs(password, salt, params);

    WorkArea work(static_cast<std::size_t>(params.memoryKiB) * g_kWordsPerBlock);
    strongbox::security::SecureBuffer derived(g_kDerivedKeyBytes);

    crypto_argon2_config config{};
    config.algorithm = CRYPTO_ARGON2_ID;
    config.nb_blocks = params.memoryKiB;
    config.nb_passes = params.iterations;
    config.nb_lanes = 1U;

    crypto_argon2_inputs inputs{};
    inputs.pass = reinterpret_cast<const std::uint8_t*>(password.data());
    inputs.pass_size = static_cast<std::uint32_t>(password.size());
    inputs.salt = reinterpret_cast<const std::uint8_t*>(salt.data());
    inputs.salt_size = static_cast<std::uint32_t>(salt.size());

    crypto_argon2(derived.data(), static_cast<std::uint32_t>(derived.size()), work.data(), config, inputs,
                  crypto_argon2_no_extras);
    return derived;
}

} // namespace strongbox::crypto

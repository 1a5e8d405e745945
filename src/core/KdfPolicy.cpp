#include "strongbox/core/KdfPolicy.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>

namespace strongbox::core
{
namespace
{

// Changing any of these makes existing snapshot files unreadable.
constexpr std::string_view g_kSnapshotSalt{ "strongbox-snap-1" };
constexpr std::uint32_t g_kSnapshotPasses{ 3U };
constexpr std::uint32_t g_kSnapshotMemoryKiB{ 64U * 1024U };

static_assert(g_kSnapshotSalt.size() == strongbox::crypto::g_argon2SaltBytes);

} // namespace

[[nodiscard]] strongbox::crypto::Argon2idParams defaultArgon2idParams() noexcept
{
    return { .iterations = g_kSnapshotPasses, .memoryKiB = g_kSnapshotMemoryKiB };
}

[[nodiscard]] strongbox::security::SecureBuffer deriveSnapshotKey(std::span<const std::byte> password,
                                                                  strongbox::crypto::Argon2idParams params)
{
    std::array<std::byte, strongbox::crypto::g_argon2SaltBytes> salt{};
    std::transform(g_kSnapshotSalt.begin(), g_kSnapshotSalt.end(), salt.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return strongbox::crypto::deriveKeyArgon2id(password, salt, params);
}

} // namespace strongbox::core

#ifndef INCLUDE_STRONGBOX_CORE_KDFPOLICY_HPP
#define INCLUDE_STRONGBOX_CORE_KDFPOLICY_HPP

#include "strongbox/crypto/KeyDerivation.hpp"
#include "strongbox/security/SecureBuffer.hpp"
#include <cstddef>
#include <span>

namespace strongbox::core
{

[[nodiscard]] strongbox::crypto::Argon2idParams defaultArgon2idParams() noexcept;

// Snapshot key from a password. The salt is a fixed application constant so the same password
// opens the same snapshot on any machine.
// Throws std::invalid_argument on an empty password or unsafe parameters.
[[nodiscard]] strongbox::security::SecureBuffer deriveSnapshotKey(std::span<const std::byte> password,
                                                                  strongbox::crypto::Argon2idParams params);

} // namespace strongbox::core

#endif // INCLUDE_STRONGBOX_CORE_KDFPOLICY_HPP

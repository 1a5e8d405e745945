#ifndef INCLUDE_STRONGBOX_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_STRONGBOX_SECURITY_SECUREEQUALS_HPP

#include "strongbox/security/SecureBuffer.hpp"
#include "strongbox/security/SecureString.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace strongbox::security
{

// Runs in time dependent only on the length. Inputs of different length compare unequal at once.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> lhs, std::span<const std::byte> rhs) noexcept
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }

    volatile unsigned acc{ 0U };
    for (std::size_t i{}; i < lhs.size(); ++i)
    {
        acc = acc | std::to_integer<unsigned>(lhs[i] ^ rhs[i]);
    }
    return acc == 0U;
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> lhs, std::span<const std::uint8_t> rhs) noexcept
{
    return secureEquals(std::as_bytes(lhs), std::as_bytes(rhs));
}

[[nodiscard]] inline bool secureEquals(const SecureBuffer& lhs, const SecureBuffer& rhs) noexcept
{
    return secureEquals(asBytes(lhs), asBytes(rhs));
}

// Password confirmation at the shell.
[[nodiscard]] inline bool secureEquals(const SecureString& lhs, const SecureString& rhs) noexcept
{
    return secureEquals(asBytes(lhs), asBytes(rhs));
}

} // namespace strongbox::security

#endif // INCLUDE_STRONGBOX_SECURITY_SECUREEQUALS_HPP

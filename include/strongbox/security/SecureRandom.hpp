#ifndef INCLUDE_STRONGBOX_SECURITY_SECURERANDOM_HPP
#define INCLUDE_STRONGBOX_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace strongbox::security
{

// Fills `out` from the OS CSPRNG. Returns false if the kernel source fails.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace strongbox::security

#endif // INCLUDE_STRONGBOX_SECURITY_SECURERANDOM_HPP

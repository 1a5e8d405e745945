#ifndef INCLUDE_STRONGBOX_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_STRONGBOX_SECURITY_SECUREBUFFER_HPP

#include "strongbox/security/ZeroAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace strongbox::security
{

// Holds key material and decrypted secrets; the backing store is wiped on every reallocation and release.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::uint8_t> bytes)
{
    return SecureBuffer(bytes.begin(), bytes.end());
}

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::string_view s)
{
    SecureBuffer out{};
    out.reserve(s.size());
    for (const char c : s)
    {
        out.push_back(static_cast<std::uint8_t>(static_cast<unsigned char>(c)));
    }
    return out;
}

inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
    SecureBuffer temp{};
    b.swap(temp);
}

} // namespace strongbox::security

#endif // INCLUDE_STRONGBOX_SECURITY_SECUREBUFFER_HPP

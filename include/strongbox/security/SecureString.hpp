#ifndef INCLUDE_STRONGBOX_SECURITY_SECURESTRING_HPP
#define INCLUDE_STRONGBOX_SECURITY_SECURESTRING_HPP

#include "strongbox/security/SecureBuffer.hpp"
#include "strongbox/security/ZeroAllocator.hpp"
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace strongbox::security
{

// Passwords and secret values typed at the shell.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    SecureString out(s.size());
    for (std::size_t i{}; i < s.size(); ++i)
    {
        out[i] = s[i];
    }
    return out;
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    return s.empty() ? std::string_view{} : std::string_view{ s.data(), s.size() };
}

// Secret values leave the client state as bytes; the shell prints them as text.
[[nodiscard]] inline std::string_view asStringView(const SecureBuffer& b) noexcept
{
    return b.empty() ? std::string_view{} : std::string_view{ reinterpret_cast<const char*>(b.data()), b.size() };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(asWritableBytes(s));
    SecureString temp{};
    s.swap(temp);
}

} // namespace strongbox::security

#endif // INCLUDE_STRONGBOX_SECURITY_SECURESTRING_HPP

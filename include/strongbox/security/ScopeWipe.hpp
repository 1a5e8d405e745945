#ifndef INCLUDE_STRONGBOX_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_STRONGBOX_SECURITY_SCOPEWIPE_HPP

#include "strongbox/security/MemoryWiper.hpp"
#include "strongbox/security/SecureBuffer.hpp"
#include "strongbox/security/SecureString.hpp"
#include <span>
#include <utility>

namespace strongbox::security
{

// Zeroes a password or secret the shell holds on the stack once the handler returns.
// The guarded storage must outlive the guard and must not reallocate while guarded.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> region) noexcept : m_region{ region }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe(ScopeWipe&& other) noexcept : m_region{ std::exchange(other.m_region, {}) }
    {
    }
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    ~ScopeWipe() noexcept
    {
        secureWipe(m_region);
    }

    // Leaves the region intact.
    void release() noexcept
    {
        m_region = {};
    }

private:
    std::span<std::byte> m_region;
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::byte> region) noexcept
{
    return ScopeWipe{ region };
}

template <typename Container>
    requires requires(Container& c) { asWritableBytes(c); }
[[nodiscard]] ScopeWipe scopeWipe(Container& secret) noexcept
{
    return ScopeWipe{ asWritableBytes(secret) };
}

} // namespace strongbox::security

#endif // INCLUDE_STRONGBOX_SECURITY_SCOPEWIPE_HPP

#include "strongbox/security/MemoryWiper.hpp"

#include <string.h>

namespace strongbox::security
{

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (!bytes.empty())
    {
#if defined(__GLIBC__) || defined(__OpenBSD__) || defined(__FreeBSD__)
        ::explicit_bzero(bytes.data(), bytes.size());
#else
        volatile std::byte* p{ bytes.data() };
        for (std::size_t i{}; i < bytes.size(); ++i)
        {
            p[i] = std::byte{ 0 };
        }
#endif
    }
}

} // namespace strongbox::security

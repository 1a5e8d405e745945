#include "strongbox/security/SecureRandom.hpp"
#include <cerrno>
#include <cstddef>
#include <sys/random.h>

namespace strongbox::security
{

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::size_t filled{ 0 };
    while (filled < out.size())
    {
        const ssize_t got{ ::getrandom(out.data() + filled, out.size() - filled, 0) };
        if (got < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        if (got == 0 || static_cast<std::size_t>(got) > out.size() - filled)
        {
            return false;
        }
        filled += static_cast<std::size_t>(got);
    }
    return true;
}

} // namespace strongbox::security

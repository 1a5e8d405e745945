#include "ConsoleUtils.hpp"

#include "strongbox/security/MemoryWiper.hpp"
#include <iostream>
#include <span>
#include <string>

#if defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace strongbox::ui::cli
{

namespace
{

// Restores the terminal mode it changed.
class EchoGuard final
{
public:
    EchoGuard() noexcept
    {
        if (isatty(STDIN_FILENO) == 0 || tcgetattr(STDIN_FILENO, &m_saved) != 0)
        {
            return;
        }
        termios quiet{ m_saved };
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        m_active = tcsetattr(STDIN_FILENO, TCSANOW, &quiet) == 0;
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    ~EchoGuard() noexcept
    {
        if (m_active)
        {
            (void)tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
        }
    }

private:
    termios m_saved{};
    bool m_active{ false };
};

} // namespace

[[nodiscard]] bool lockProcessMemory() noexcept
{
    const bool locked{ mlockall(MCL_CURRENT | MCL_FUTURE) == 0 };
    const rlimit noCore{ 0, 0 };
    const bool noDumps{ setrlimit(RLIMIT_CORE, &noCore) == 0 };
    return locked && noDumps;
}

[[nodiscard]] strongbox::security::SecureString readSecretLine(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    std::string line{};
    {
        const EchoGuard echoOff{};
        std::getline(std::cin, line);
    }
    std::cout << "\n";

    auto secret{ strongbox::security::secureStringFrom(line) };
    strongbox::security::secureWipe(std::as_writable_bytes(std::span{ line.data(), line.size() }));
    return secret;
}

} // namespace strongbox::ui::cli
